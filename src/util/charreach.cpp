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
 * \brief Class for representing byte reachability.
 */
#include "charreach.h"

#include <cassert>
#include <string>

namespace dfascan {

constexpr size_t CharReach::npos;

bool CharReach::operator==(const CharReach &a) const {
    for (size_t i = 0; i < num_words; i++) {
        if (bits[i] != a.bits[i]) {
            return false;
        }
    }
    return true;
}

bool CharReach::operator<(const CharReach &a) const {
    for (size_t c = 0; c < N_CHARS; c++) {
        bool mine = test(c);
        bool theirs = a.test(c);
        if (mine != theirs) {
            return theirs;
        }
    }
    return false;
}

void CharReach::setRange(unsigned char from, unsigned char to) {
    assert(from <= to);
    for (size_t c = from; c <= to; c++) {
        set(c);
    }
}

/// Switch on the bits corresponding to the characters in \a s.
void CharReach::set(const std::string &s) {
    for (const auto &c : s) {
        set(c);
    }
}

size_t CharReach::count() const {
    size_t rv = 0;
    for (size_t i = 0; i < num_words; i++) {
        rv += __builtin_popcountll(bits[i]);
    }
    return rv;
}

bool CharReach::none() const {
    for (size_t i = 0; i < num_words; i++) {
        if (bits[i]) {
            return false;
        }
    }
    return true;
}

size_t CharReach::find_first() const {
    for (size_t i = 0; i < num_words; i++) {
        if (bits[i]) {
            return i * 64 + __builtin_ctzll(bits[i]);
        }
    }
    return npos;
}

size_t CharReach::find_next(size_t last) const {
    if (last >= npos - 1) {
        return npos;
    }

    size_t n = last + 1;
    size_t i = word(n);
    u64a w = bits[i] & ~(mask(n) - 1);
    for (;;) {
        if (w) {
            return i * 64 + __builtin_ctzll(w);
        }
        if (++i == num_words) {
            return npos;
        }
        w = bits[i];
    }
}

/// Return a string containing the characters that are switched on.
std::string CharReach::to_string() const {
    std::string s;
    for (size_t i = find_first(); i != npos; i = find_next(i)) {
        s += (char)i;
    }
    return s;
}

bool overlaps(const CharReach &a, const CharReach &b) {
    return (a & b).any();
}

const CharReach &wordBytes() {
    static const CharReach cr = []() {
        CharReach w;
        for (size_t c = 0; c < N_CHARS; c++) {
            if (isWordByte(c)) {
                w.set(c);
            }
        }
        return w;
    }();
    return cr;
}

} // namespace dfascan
