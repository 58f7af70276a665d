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
 * \brief Raw byte classes, matched without regard to UTF-8.
 */

#include "ComponentByte.h"

#include "util/compile_error.h"

#include <cstdio>

using namespace std;

namespace dfascan {

ComponentByte::ComponentByte() {}

ComponentByte::ComponentByte(const ComponentByte &other)
    : Component(other), ranges(other.ranges) {}

ComponentByte::~ComponentByte() {}

ComponentByte *ComponentByte::clone() const {
    return new ComponentByte(*this);
}

CharReach ComponentByte::reach() const {
    CharReach cr;
    for (const auto &r : ranges) {
        if (r.first > r.second) {
            char buf[64];
            snprintf(buf, sizeof(buf), "Invalid byte range \\x%02x-\\x%02x.",
                     r.first, r.second);
            throw InvalidRangeBoundary(loc, buf);
        }
        cr.setRange(r.first, r.second);
    }
    return cr;
}

} // namespace dfascan
