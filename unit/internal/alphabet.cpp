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
#include "nfagraph/ng_alphabet.h"
#include "parser/Component.h"
#include "parser/ComponentClass.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <vector>

using namespace std;
using namespace dfascan;

static
RangeAlphabet alphabetFor(const string &re) {
    auto root = parsePattern(re);
    return buildRangeAlphabet(*root);
}

TEST(RangeAlphabet, EmptyPattern) {
    RangeAlphabet ra = alphabetFor("");
    EXPECT_EQ(1U, ra.classCount());
    EXPECT_EQ(3U, ra.alpha_size); // one byte class, SOT, EOT
    EXPECT_FALSE(ra.word_sensitive);
}

TEST(RangeAlphabet, SentinelsLast) {
    RangeAlphabet ra = alphabetFor("a|b");
    EXPECT_EQ(ra.alpha_size - 2, ra.alpha[SYM_SOT]);
    EXPECT_EQ(ra.alpha_size - 1, ra.alpha[SYM_EOT]);
    EXPECT_EQ(SYM_SOT, ra.unalpha[ra.alpha[SYM_SOT]]);
    EXPECT_EQ(SYM_EOT, ra.unalpha[ra.alpha[SYM_EOT]]);
}

TEST(RangeAlphabet, SingleLiteral) {
    RangeAlphabet ra = alphabetFor("a");

    // cuts at 0, 'a', 'b'
    ASSERT_EQ(3U, ra.classCount());
    EXPECT_EQ(1U, ra.classOf('a'));
    EXPECT_EQ(0U, ra.classOf('`'));
    EXPECT_EQ(2U, ra.classOf('b'));
    EXPECT_EQ(2U, ra.classOf(MAX_UNICODE));
    EXPECT_EQ((unichar)'b', ra.classLo(2));
    EXPECT_EQ((unichar)MAX_UNICODE, ra.classHi(2));

    EXPECT_EQ(4U, ra.alpha_size);
    EXPECT_NE(ra.alpha['a'], ra.alpha['b']);
    EXPECT_EQ(ra.alpha['b'], ra.alpha[0xff]);
    EXPECT_EQ('a', ra.unalpha[ra.alpha['a']]);
}

TEST(RangeAlphabet, Overlap) {
    RangeAlphabet ra = alphabetFor("[a-m][h-z]");

    // [a-g] [h-m] [n-z] plus the gaps either side
    ASSERT_EQ(5U, ra.classCount());
    EXPECT_EQ(ra.classOf('h'), ra.classOf('m'));
    EXPECT_NE(ra.classOf('g'), ra.classOf('h'));
    EXPECT_NE(ra.classOf('m'), ra.classOf('n'));

    EXPECT_EQ(ra.alpha['a'], ra.alpha['g']);
    EXPECT_EQ(ra.alpha['h'], ra.alpha['m']);
    EXPECT_EQ(ra.alpha['n'], ra.alpha['z']);
    EXPECT_NE(ra.alpha['g'], ra.alpha['h']);
    EXPECT_NE(ra.alpha['z'], ra.alpha['{']);
}

TEST(RangeAlphabet, ClassesIn) {
    RangeAlphabet ra = alphabetFor("[a-m][h-z]");

    CodePointSet cps;
    cps.setRange('a', 'm');
    vector<u32> members;
    ra.classesIn(cps, &members);
    ASSERT_EQ(2U, members.size());
    EXPECT_EQ(ra.classOf('a'), members[0]);
    EXPECT_EQ(ra.classOf('h'), members[1]);
}

TEST(RangeAlphabet, MultiByte) {
    // U+00E9 is c3 a9
    RangeAlphabet ra = alphabetFor("\xc3\xa9");

    EXPECT_EQ(5U, ra.alpha_size);
    EXPECT_NE(ra.alpha[0xc3], ra.alpha[0xa9]);
    EXPECT_NE(ra.alpha[0xc3], ra.alpha[0xc4]);
    EXPECT_NE(ra.alpha[0xa9], ra.alpha[0xaa]);
    EXPECT_EQ(ra.alpha['a'], ra.alpha[0xc4]);

    u32 cls = ra.classOf(0xe9);
    ASSERT_EQ(1U, ra.sequences(cls).size());
    EXPECT_EQ(2U, ra.sequences(cls)[0].size());
}

TEST(RangeAlphabet, Surrogates) {
    // A class made only of surrogates has no encodings.
    RangeAlphabet ra = alphabetFor("\\x{d800}");
    u32 cls = ra.classOf(0xd800);
    EXPECT_TRUE(ra.sequences(cls).empty());
    EXPECT_EQ(3U, ra.alpha_size);
}

TEST(RangeAlphabet, RawBytes) {
    RangeAlphabet ra = alphabetFor("\\xff");
    EXPECT_EQ(1U, ra.classCount());
    EXPECT_EQ(4U, ra.alpha_size);
    EXPECT_NE(ra.alpha[0xfe], ra.alpha[0xff]);
}

TEST(RangeAlphabet, WordBoundary) {
    RangeAlphabet ra = alphabetFor("\\b");
    EXPECT_TRUE(ra.word_sensitive);
    EXPECT_EQ(4U, ra.alpha_size);
    EXPECT_EQ(ra.alpha['a'], ra.alpha['_']);
    EXPECT_EQ(ra.alpha['a'], ra.alpha['0']);
    EXPECT_NE(ra.alpha['a'], ra.alpha[' ']);
    EXPECT_EQ(ra.alpha[' '], ra.alpha[0xc3]);
}

TEST(RangeAlphabet, Deterministic) {
    RangeAlphabet a = alphabetFor("(foo|\\d+|\xe2\x82\xac)\\b");
    RangeAlphabet b = alphabetFor("(foo|\\d+|\xe2\x82\xac)\\b");
    EXPECT_EQ(a.alpha_size, b.alpha_size);
    EXPECT_TRUE(a.alpha == b.alpha);
    EXPECT_TRUE(a.unalpha == b.unalpha);
}

TEST(RangeAlphabet, InvertedClassRange) {
    auto root = parsePattern("x[z-a]");
    try {
        buildRangeAlphabet(*root);
        FAIL() << "inverted range accepted";
    } catch (const InvalidRangeBoundary &e) {
        EXPECT_TRUE(e.hasIndex);
        EXPECT_EQ(1U, e.index);
    }
}

TEST(RangeAlphabet, MaxCodePoint) {
    auto root = parsePattern("[\\x{10fffe}-\\x{10ffff}]");
    RangeAlphabet ra = buildRangeAlphabet(*root);
    EXPECT_EQ(2U, ra.classCount());
    EXPECT_EQ(1U, ra.classOf(MAX_UNICODE));
}

TEST(RangeAlphabet, OutOfRangeCodePoint) {
    ComponentClass cc;
    cc.addRange('a', MAX_UNICODE + 1);
    cc.setLoc(7);
    try {
        buildRangeAlphabet(cc);
        FAIL() << "code point above U+10FFFF accepted";
    } catch (const InvalidRangeBoundary &e) {
        EXPECT_EQ(7U, e.index);
    }
}

TEST(RangeAlphabet, InvertedRepeat) {
    auto root = parsePattern("ab{3,2}");
    EXPECT_THROW(buildRangeAlphabet(*root), InvalidRangeBoundary);
}
