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
 * \brief Raw byte classes, matched without regard to UTF-8 (\\C and friends).
 */

#ifndef PARSER_COMPONENTBYTE_H
#define PARSER_COMPONENTBYTE_H

#include "Component.h"
#include "util/charreach.h"
#include "dfascan_common.h"

#include <utility>
#include <vector>

namespace dfascan {

/** \brief Matches exactly one byte from a set of byte ranges. */
class ComponentByte : public Component {
public:
    /** \brief Default construction gives an empty set; see \ref addRange. */
    ComponentByte();
    ~ComponentByte() override;
    ComponentByte *clone() const override;

    void accept(ConstComponentVisitor &v) const override {
        v.pre(*this);
        v.during(*this);
        v.post(*this);
    }

    bool empty() const override { return false; }

    /** \brief Add an inclusive range of bytes. The range is not checked until
     * compile time. */
    void addRange(u8 lo, u8 hi) { ranges.push_back(std::make_pair(lo, hi)); }

    const std::vector<std::pair<u8, u8>> &getRanges() const { return ranges; }

    /** \brief The bytes matched.
     *
     * \throw InvalidRangeBoundary if a range is inverted. */
    CharReach reach() const;

private:
    ComponentByte(const ComponentByte &other);

    std::vector<std::pair<u8, u8>> ranges;
};

} // namespace dfascan

#endif
