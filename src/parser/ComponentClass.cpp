/*
 * Copyright (c) 2015-2018, Intel Corporation
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  * Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *  * Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *  * Neither the name of Intel Corporation nor the names of its contributors
 *    may be used to endorse or promote products derived from this software
 *    without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

/** \file
 * \brief Character classes: sets of code points, matched as UTF-8.
 */
#include "ComponentClass.h"

#include "util/compile_error.h"

#include <sstream>

using namespace std;

namespace dfascan {

ComponentClass::ComponentClass() : negated(false) {}

ComponentClass::ComponentClass(const vector<CodePointRange> &ranges_in)
    : ranges(ranges_in), negated(false) {}

ComponentClass::ComponentClass(const ComponentClass &other)
    : Component(other), ranges(other.ranges), negated(other.negated) {}

ComponentClass::~ComponentClass() {}

ComponentClass *ComponentClass::clone() const {
    return new ComponentClass(*this);
}

CodePointSet ComponentClass::codePoints() const {
    CodePointSet cps;
    for (const auto &r : ranges) {
        if (r.lo > r.hi || r.hi > MAX_UNICODE) {
            ostringstream oss;
            oss << hex << uppercase << "Invalid code point range U+" << r.lo
                << "-U+" << r.hi << ".";
            throw InvalidRangeBoundary(loc, oss.str());
        }
        cps.setRange(r.lo, r.hi);
    }

    if (negated) {
        cps.flip();
    }

    return cps;
}

} // namespace dfascan
