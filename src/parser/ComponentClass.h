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

#ifndef PARSER_COMPONENTCLASS_H
#define PARSER_COMPONENTCLASS_H

#include "Component.h"
#include "util/unicode_set.h"
#include "dfascan_common.h"

#include <vector>

namespace dfascan {

/** \brief Inclusive range of code points, as supplied by the parser. Not
 * validated until compile time. */
struct CodePointRange {
    CodePointRange(unichar lo_in, unichar hi_in) : lo(lo_in), hi(hi_in) {}
    unichar lo;
    unichar hi;
};

/** \brief A single literal character or character class. Matches exactly one
 * code point from its set, encoded as UTF-8. */
class ComponentClass : public Component {
public:
    ComponentClass();
    explicit ComponentClass(const std::vector<CodePointRange> &ranges_in);
    ~ComponentClass() override;
    ComponentClass *clone() const override;

    void accept(ConstComponentVisitor &v) const override {
        v.pre(*this);
        v.during(*this);
        v.post(*this);
    }

    bool empty() const override { return false; }

    void add(unichar c) { ranges.push_back(CodePointRange(c, c)); }
    void addRange(unichar lo, unichar hi) {
        ranges.push_back(CodePointRange(lo, hi));
    }

    /** \brief Complement the class, as in [^...]. */
    void negate() { negated = !negated; }
    bool isNegated() const { return negated; }

    const std::vector<CodePointRange> &getRanges() const { return ranges; }

    /** \brief The normalised set of code points this class matches.
     *
     * \throw InvalidRangeBoundary if a range is inverted or extends past
     * U+10FFFF. */
    CodePointSet codePoints() const;

private:
    ComponentClass(const ComponentClass &other);

    std::vector<CodePointRange> ranges;
    bool negated;
};

} // namespace dfascan

#endif
