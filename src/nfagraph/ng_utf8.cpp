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
 * \brief UTF-8 projection of code point ranges.
 *
 * A code point range is cut until each piece has a single encoding length and
 * its bounds differ only in positions that can take every continuation byte.
 * The bytes of the two bounds then give the range for each position.
 */
#include "ng_utf8.h"

#include <cassert>

using namespace std;

namespace dfascan {

u32 encodeUtf8(unichar c, u8 *buf) {
    assert(c <= MAX_UNICODE);
    assert(c < UNICODE_SURROGATE_MIN || c > UNICODE_SURROGATE_MAX);

    if (c < UTF_2CHAR_MIN) {
        buf[0] = (u8)c;
        return 1;
    }
    if (c < UTF_3CHAR_MIN) {
        buf[0] = UTF_TWO_BYTE_HEADER | (u8)(c >> UTF_CONT_SHIFT);
        buf[1] = makeContByte(c);
        return 2;
    }
    if (c < UTF_4CHAR_MIN) {
        buf[0] = UTF_THREE_BYTE_HEADER | (u8)(c >> (2 * UTF_CONT_SHIFT));
        buf[1] = makeContByte(c >> UTF_CONT_SHIFT);
        buf[2] = makeContByte(c);
        return 3;
    }
    buf[0] = UTF_FOUR_BYTE_HEADER | (u8)(c >> (3 * UTF_CONT_SHIFT));
    buf[1] = makeContByte(c >> (2 * UTF_CONT_SHIFT));
    buf[2] = makeContByte(c >> UTF_CONT_SHIFT);
    buf[3] = makeContByte(c);
    return 4;
}

static
void addSequence(unichar lo, unichar hi, vector<Utf8Sequence> *out) {
    u8 lo_bytes[4];
    u8 hi_bytes[4];
    u32 len = encodeUtf8(lo, lo_bytes);
    UNUSED u32 hi_len = encodeUtf8(hi, hi_bytes);
    assert(len == hi_len);

    Utf8Sequence seq;
    for (u32 i = 0; i < len; i++) {
        assert(lo_bytes[i] <= hi_bytes[i]);
        seq.push_back(Utf8Range(lo_bytes[i], hi_bytes[i]));
    }
    out->push_back(seq);
}

void utf8Sequences(unichar lo, unichar hi, vector<Utf8Sequence> *out) {
    assert(lo <= hi);
    assert(hi <= MAX_UNICODE);

    if (lo <= UNICODE_SURROGATE_MAX && hi >= UNICODE_SURROGATE_MIN) {
        if (lo < UNICODE_SURROGATE_MIN) {
            utf8Sequences(lo, UNICODE_SURROGATE_MIN - 1, out);
        }
        if (hi > UNICODE_SURROGATE_MAX) {
            utf8Sequences(UNICODE_SURROGATE_MAX + 1, hi, out);
        }
        return;
    }

    /* split where the encoding length changes */
    static const unichar length_max[] = {UTF_2CHAR_MIN - 1, UTF_3CHAR_MIN - 1,
                                         UTF_4CHAR_MIN - 1};
    for (unichar m : length_max) {
        if (lo <= m && hi > m) {
            utf8Sequences(lo, m, out);
            utf8Sequences(m + 1, hi, out);
            return;
        }
    }

    if (hi < UTF_2CHAR_MIN) {
        out->push_back(Utf8Sequence(1, Utf8Range(lo, hi)));
        return;
    }

    /* split until the low continuation positions span their full range */
    for (u32 i = 1; i < 4; i++) {
        unichar mask = (1U << (UTF_CONT_SHIFT * i)) - 1;
        if ((lo & ~mask) == (hi & ~mask)) {
            continue;
        }
        if ((lo & mask) != 0) {
            utf8Sequences(lo, lo | mask, out);
            utf8Sequences((lo | mask) + 1, hi, out);
            return;
        }
        if ((hi & mask) != mask) {
            utf8Sequences(lo, (hi & ~mask) - 1, out);
            utf8Sequences(hi & ~mask, hi, out);
            return;
        }
    }

    addSequence(lo, hi, out);
}

bool utf8SequenceMatches(const Utf8Sequence &seq, const u8 *bytes, u32 len) {
    if (seq.size() != len) {
        return false;
    }
    for (u32 i = 0; i < len; i++) {
        if (bytes[i] < seq[i].lo || bytes[i] > seq[i].hi) {
            return false;
        }
    }
    return true;
}

} // namespace dfascan
