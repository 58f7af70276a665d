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
 *
 * This is a simple (but hopefully fast) class for representing 8-bit character
 * reachability, along with the operations the byte alphabet needs.
 */

#ifndef UTIL_CHARREACH_H
#define UTIL_CHARREACH_H

#include "dfascan_common.h"

#include <string>

namespace dfascan {

class CharReach {
private:
    static constexpr size_t num_words = 4;

    /// Underlying storage, 64 bytes per word.
    u64a bits[num_words];

    static size_t word(size_t n) { return n / 64; }
    static u64a mask(size_t n) { return 1ULL << (n % 64); }

public:
    static constexpr size_t npos = N_CHARS; //!< One past the max value.

    /// Empty constructor.
    CharReach() { clear(); }

    /// Constructor for a character class containing a single char.
    explicit CharReach(unsigned char c) {
        clear();
        set(c);
    }

    /// Constructor for a character class representing a contiguous range of
    /// chars, inclusive.
    CharReach(unsigned char from, unsigned char to) {
        clear();
        setRange(from, to);
    }

    /// Constructor for a character class based on the set of chars in a
    /// string.
    explicit CharReach(const std::string &str) {
        clear();
        set(str);
    }

    /// Returns a CharReach with complete reachability (a "dot").
    static CharReach dot() { return CharReach(0, 255); }

    bool operator==(const CharReach &a) const;
    bool operator!=(const CharReach &a) const { return !(*this == a); }

    /// Ordering, lexicographic on the first differing byte.
    bool operator<(const CharReach &a) const;

    void clear() {
        for (size_t i = 0; i < num_words; i++) {
            bits[i] = 0;
        }
    }

    void set(unsigned char n) { bits[word(n)] |= mask(n); }
    void clear(unsigned char n) { bits[word(n)] &= ~mask(n); }
    bool test(unsigned char n) const { return bits[word(n)] & mask(n); }

    /// Flip all bits.
    void flip() {
        for (size_t i = 0; i < num_words; i++) {
            bits[i] = ~bits[i];
        }
    }

    // Switch on the bit in the range (from, to), inclusive.
    void setRange(unsigned char from, unsigned char to);

    // Switch on the bits corresponding to the characters in \a s.
    void set(const std::string &s);

    /// Returns number of bits set on.
    size_t count() const;

    /// Are no bits set?
    bool none() const;

    /// Is any bit set?
    bool any() const { return !none(); }

    /// Are all bits set?
    bool all() const { return count() == N_CHARS; }

    /// Returns first bit set, or CharReach::npos if none set.
    size_t find_first() const;

    /// Returns next bit set, or CharReach::npos if none set after n.
    size_t find_next(size_t last) const;

    CharReach operator|(const CharReach &a) const {
        CharReach cr(*this);
        cr |= a;
        return cr;
    }

    void operator|=(const CharReach &a) {
        for (size_t i = 0; i < num_words; i++) {
            bits[i] |= a.bits[i];
        }
    }

    CharReach operator&(const CharReach &a) const {
        CharReach cr(*this);
        cr &= a;
        return cr;
    }

    void operator&=(const CharReach &a) {
        for (size_t i = 0; i < num_words; i++) {
            bits[i] &= a.bits[i];
        }
    }

    CharReach operator~(void) const {
        CharReach cr(*this);
        cr.flip();
        return cr;
    }

    /// True if this character class is a subset of \a other.
    bool isSubsetOf(const CharReach &other) const {
        return (*this & other) == *this;
    }

    /// Return a string containing the characters that are switched on.
    std::string to_string() const;
};

/** \brief True iff there is a non-empty intersection between \a and \a b */
bool overlaps(const CharReach &a, const CharReach &b);

/** \brief The bytes that count as word characters for \\b and \\B:
 * [0-9A-Za-z_]. Bytes outside ASCII are never word bytes. */
const CharReach &wordBytes();

static really_inline
bool isWordByte(u8 c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') || c == '_';
}

} // namespace dfascan

#endif // UTIL_CHARREACH_H
