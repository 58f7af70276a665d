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
 */

#ifndef NG_UTF8_H
#define NG_UTF8_H

#include "util/unicode_def.h"
#include "dfascan_common.h"

#include <vector>

#include <boost/container/static_vector.hpp>

namespace dfascan {

/** \brief Inclusive range of byte values at one position of a UTF-8 encoded
 * sequence. */
struct Utf8Range {
    Utf8Range(u8 lo_in, u8 hi_in) : lo(lo_in), hi(hi_in) {}
    u8 lo;
    u8 hi;

    bool operator==(const Utf8Range &b) const {
        return lo == b.lo && hi == b.hi;
    }
    bool operator<(const Utf8Range &b) const {
        return lo < b.lo || (lo == b.lo && hi < b.hi);
    }
};

/** \brief A run of code points whose encodings are exactly the cartesian
 * product of one byte range per position. 1 to 4 ranges long. */
typedef boost::container::static_vector<Utf8Range, 4> Utf8Sequence;

/**
 * \brief Appends to \a out the byte sequences that together encode exactly the
 * code points in [lo, hi], in ascending code point order.
 *
 * Surrogates (U+D800 to U+DFFF) have no UTF-8 encoding and are skipped. Every
 * produced sequence uses a single encoding length.
 */
void utf8Sequences(unichar lo, unichar hi, std::vector<Utf8Sequence> *out);

/** \brief Writes the UTF-8 encoding of \a c to \a buf (which must have room
 * for 4 bytes) and returns its length. \a c must not be a surrogate. */
u32 encodeUtf8(unichar c, u8 *buf);

/** \brief True if \a seq matches the given encoded bytes. */
bool utf8SequenceMatches(const Utf8Sequence &seq, const u8 *bytes, u32 len);

} // namespace dfascan

#endif
