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

#include "config.h"

#include "gtest/gtest.h"
#include "nfagraph/ng_utf8.h"

#include <vector>

using namespace std;
using namespace dfascan;

namespace {

struct EncodeCase {
    unichar cp;
    const char *bytes;
};

static const EncodeCase encodeCases[] = {
    {0x00, ""},             // NUL; length checked separately
    {'a', "a"},
    {0x7f, "\x7f"},
    {0x80, "\xc2\x80"},
    {0xe9, "\xc3\xa9"},
    {0x7ff, "\xdf\xbf"},
    {0x800, "\xe0\xa0\x80"},
    {0x20ac, "\xe2\x82\xac"},
    {0xd7ff, "\xed\x9f\xbf"},
    {0xe000, "\xee\x80\x80"},
    {0xffff, "\xef\xbf\xbf"},
    {0x10000, "\xf0\x90\x80\x80"},
    {0x1f600, "\xf0\x9f\x98\x80"},
    {0x10ffff, "\xf4\x8f\xbf\xbf"},
};

} // namespace

TEST(utf8, encode) {
    for (const auto &t : encodeCases) {
        u8 buf[4];
        u32 len = encodeUtf8(t.cp, buf);
        if (t.cp == 0) {
            ASSERT_EQ(1U, len);
            ASSERT_EQ(0, buf[0]);
            continue;
        }
        ASSERT_EQ(string(t.bytes), string((const char *)buf, len))
            << "code point " << hex << t.cp;
    }
}

TEST(utf8, ascii_range) {
    vector<Utf8Sequence> seqs;
    utf8Sequences('a', 'z', &seqs);
    ASSERT_EQ(1U, seqs.size());
    ASSERT_EQ(1U, seqs[0].size());
    ASSERT_EQ(Utf8Range('a', 'z'), seqs[0][0]);
}

TEST(utf8, two_byte_block) {
    vector<Utf8Sequence> seqs;
    utf8Sequences(0x80, 0x7ff, &seqs);
    ASSERT_EQ(1U, seqs.size());
    ASSERT_EQ(2U, seqs[0].size());
    ASSERT_EQ(Utf8Range(0xc2, 0xdf), seqs[0][0]);
    ASSERT_EQ(Utf8Range(0x80, 0xbf), seqs[0][1]);
}

TEST(utf8, unaligned_split) {
    // U+00E9 to U+0101 straddles a lead byte: c3 a9-bf, c4 80-81
    vector<Utf8Sequence> seqs;
    utf8Sequences(0xe9, 0x101, &seqs);
    ASSERT_EQ(2U, seqs.size());
    ASSERT_EQ(Utf8Range(0xc3, 0xc3), seqs[0][0]);
    ASSERT_EQ(Utf8Range(0xa9, 0xbf), seqs[0][1]);
    ASSERT_EQ(Utf8Range(0xc4, 0xc4), seqs[1][0]);
    ASSERT_EQ(Utf8Range(0x80, 0x81), seqs[1][1]);
}

TEST(utf8, length_boundaries) {
    vector<Utf8Sequence> seqs;
    utf8Sequences(0x7f, 0x80, &seqs);
    ASSERT_EQ(2U, seqs.size());
    EXPECT_EQ(1U, seqs[0].size());
    EXPECT_EQ(2U, seqs[1].size());

    seqs.clear();
    utf8Sequences(0xffff, 0x10000, &seqs);
    ASSERT_EQ(2U, seqs.size());
    EXPECT_EQ(3U, seqs[0].size());
    EXPECT_EQ(4U, seqs[1].size());
}

TEST(utf8, surrogates_dropped) {
    vector<Utf8Sequence> seqs;
    utf8Sequences(0xd800, 0xdfff, &seqs);
    ASSERT_TRUE(seqs.empty());

    u8 buf[4];
    seqs.clear();
    utf8Sequences(0xd7ff, 0xe000, &seqs);
    for (const auto &seq : seqs) {
        // no sequence may accept ed a0-bf xx
        buf[0] = 0xed;
        buf[1] = 0xa0;
        buf[2] = 0x80;
        ASSERT_FALSE(utf8SequenceMatches(seq, buf, 3));
    }

    encodeUtf8(0xd7ff, buf);
    bool found = false;
    for (const auto &seq : seqs) {
        found |= utf8SequenceMatches(seq, buf, 3);
    }
    ASSERT_TRUE(found);
}

TEST(utf8, full_space) {
    vector<Utf8Sequence> seqs;
    utf8Sequences(0, MAX_UNICODE, &seqs);

    // 00-7f, c2-df, e0, e1-ec, ed, ee-ef, f0, f1-f3, f4
    ASSERT_EQ(9U, seqs.size());
    EXPECT_EQ(Utf8Range(0xe0, 0xe0), seqs[2][0]);
    EXPECT_EQ(Utf8Range(0xa0, 0xbf), seqs[2][1]);
    EXPECT_EQ(Utf8Range(0xed, 0xed), seqs[4][0]);
    EXPECT_EQ(Utf8Range(0x80, 0x9f), seqs[4][1]);
    EXPECT_EQ(Utf8Range(0xf4, 0xf4), seqs[8][0]);
    EXPECT_EQ(Utf8Range(0x80, 0x8f), seqs[8][1]);

    // Every scalar value is covered by exactly one sequence.
    for (unichar c = 0; c <= MAX_UNICODE; c += 0x101) {
        if (c >= UNICODE_SURROGATE_MIN && c <= UNICODE_SURROGATE_MAX) {
            continue;
        }
        u8 buf[4];
        u32 len = encodeUtf8(c, buf);
        u32 hits = 0;
        for (const auto &seq : seqs) {
            hits += utf8SequenceMatches(seq, buf, len) ? 1 : 0;
        }
        ASSERT_EQ(1U, hits) << "code point " << hex << c;
    }
}

TEST(utf8, overlong_rejected) {
    vector<Utf8Sequence> seqs;
    utf8Sequences(0, MAX_UNICODE, &seqs);

    static const u8 overlong[][4] = {
        {0xc0, 0xaf},             // '/'
        {0xc1, 0xbf},
        {0xe0, 0x80, 0xaf},
        {0xf0, 0x80, 0x80, 0xaf},
        {0xf4, 0x90, 0x80, 0x80}, // above U+10FFFF
    };
    static const u32 lens[] = {2, 2, 3, 4, 4};

    for (size_t i = 0; i < 5; i++) {
        for (const auto &seq : seqs) {
            ASSERT_FALSE(utf8SequenceMatches(seq, overlong[i], lens[i]));
        }
    }
}
