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
#include "grey.h"
#include "nfa/dfa_compile.h"
#include "nfa/dfa_internal.h"
#include "nfa/dfa_min.h"
#include "nfa/dfa_runtime.h"
#include "nfa/rdfa.h"
#include "nfagraph/ng_alphabet.h"
#include "nfagraph/ng_builder.h"
#include "nfagraph/ng_dfa.h"
#include "nfagraph/ng_nfa.h"
#include "parser/Component.h"
#include "util/pattern_parser.h"

#include <string>

using namespace std;
using namespace dfascan;

namespace {

struct Tables {
    bytecode_ptr<dfa> fwd;
    bytecode_ptr<dfa> rev;
};

static
Tables tablesFor(const string &re, const Grey &grey = Grey()) {
    auto root = parsePattern(re);
    RangeAlphabet alpha = buildRangeAlphabet(*root);
    Nfa nfa = buildNfa(*root, alpha, grey);

    auto fwd_raw = buildDfa(nfa, alpha, DFA_FORWARD, MATCH_LEFTMOST_FIRST,
                            MAX_DFA_STATES);
    minimize_hopcroft(*fwd_raw, grey);
    auto rev_raw = buildDfa(reverseNfa(nfa), alpha, DFA_REVERSE, MATCH_ALL,
                            MAX_DFA_STATES);
    minimize_hopcroft(*rev_raw, grey);

    Tables t;
    t.fwd = dfaCompile(*fwd_raw, grey);
    t.rev = dfaCompile(*rev_raw, grey);
    return t;
}

static
bool scanEnd(const dfa *d, const string &s, size_t start, bool shortest,
             size_t *end) {
    return dfaScanForward(d, (const u8 *)s.data(), s.size(), start, shortest,
                          end);
}

} // namespace

TEST(DfaTable, AlphaShift) {
    EXPECT_EQ(1, dfaAlphaShift(2));
    EXPECT_EQ(2, dfaAlphaShift(3));
    EXPECT_EQ(2, dfaAlphaShift(4));
    EXPECT_EQ(3, dfaAlphaShift(5));
    EXPECT_EQ(8, dfaAlphaShift(256));
    EXPECT_EQ(9, dfaAlphaShift(258));
}

TEST(DfaTable, BlockSize) {
    size_t narrow = dfaBlockSize(10, 3, 1);
    size_t wide = dfaBlockSize(10, 3, 2);
    EXPECT_EQ(80U, wide - narrow);
    EXPECT_EQ(0U, (narrow - 80) % 16);
}

TEST(DfaTable, Header) {
    Tables t = tablesFor("ab+c");
    const dfa *d = t.fwd.get();

    EXPECT_EQ((u32)DFA_MAGIC, d->magic);
    EXPECT_EQ(DFA_FORWARD, d->direction);
    EXPECT_EQ(DFA_REVERSE, t.rev->direction);
    EXPECT_EQ(0, d->dead);
    EXPECT_EQ(d->alpha_size - 2, d->sot);
    EXPECT_EQ(d->alpha_size - 1, d->eot);
    EXPECT_EQ(dfaAlphaShift(d->alpha_size), d->alphaShift);
    EXPECT_EQ(1, d->width);
    EXPECT_EQ(0, d->flags);
    EXPECT_LT(d->start_nonword, d->state_count);
    EXPECT_EQ(0U, d->aux_offset % 16);
    EXPECT_EQ(0U, d->table_offset % 16);
    EXPECT_LE(d->aux_offset + d->state_count * sizeof(dfa_state_aux),
              d->table_offset);
    EXPECT_EQ(dfaBlockSize(d->state_count, d->alphaShift, d->width),
              d->length);
    EXPECT_TRUE(ISALIGNED_N(d, 64));

    EXPECT_EQ(d->remap['b'], d->remap['b']);
    EXPECT_NE(d->remap['a'], d->remap['b']);
    EXPECT_EQ(d->remap['x'], d->remap[0xff]);
}

TEST(DfaTable, WordFlag) {
    Tables t = tablesFor("\\bx");
    EXPECT_EQ(DFA_FLAG_WORD_SENSITIVE, t.fwd->flags & DFA_FLAG_WORD_SENSITIVE);
}

TEST(DfaTable, DeadRow) {
    Tables t = tablesFor("abc");
    const dfa *d = t.fwd.get();
    const u8 *table = (const u8 *)getDfaTable(d);
    for (u32 k = 0; k < d->alpha_size; k++) {
        EXPECT_EQ(0, table[k]);
    }
    EXPECT_EQ(0, getDfaAux(d)[0].accept);
}

TEST(DfaTable, WideEntries) {
    Grey grey;
    grey.allowNarrowTable = false;
    Tables wide = tablesFor("a[bc]{2}d", grey);
    Tables narrow = tablesFor("a[bc]{2}d");
    EXPECT_EQ(2, wide.fwd->width);
    EXPECT_EQ(1, narrow.fwd->width);
    EXPECT_EQ(wide.fwd->state_count, narrow.fwd->state_count);

    const string inputs[] = {"abcd", "xxaccd", "abd", "abbbd"};
    for (const auto &in : inputs) {
        size_t e1 = 0, e2 = 0;
        bool m1 = scanEnd(wide.fwd.get(), in, 0, false, &e1);
        bool m2 = scanEnd(narrow.fwd.get(), in, 0, false, &e2);
        EXPECT_EQ(m1, m2) << in;
        EXPECT_EQ(e1, e2) << in;
    }
}

TEST(DfaTable, ManyStatesGoWide) {
    // More than 256 states forces 16-bit entries.
    Tables t = tablesFor("[ab]*a[ab]{8}");
    EXPECT_LT(256, t.fwd->state_count);
    EXPECT_EQ(2, t.fwd->width);

    size_t end = 0;
    ASSERT_TRUE(scanEnd(t.fwd.get(), "bbabbbbbbbb", 0, true, &end));
    EXPECT_EQ(11U, end);
}

TEST(DfaRuntime, ShortestAndLongest) {
    Tables t = tablesFor("a+");
    size_t end = 0;

    ASSERT_TRUE(scanEnd(t.fwd.get(), "baaab", 0, true, &end));
    EXPECT_EQ(2U, end);
    ASSERT_TRUE(scanEnd(t.fwd.get(), "baaab", 0, false, &end));
    EXPECT_EQ(4U, end);

    EXPECT_FALSE(scanEnd(t.fwd.get(), "bbb", 0, false, &end));
}

TEST(DfaRuntime, StartOffset) {
    Tables t = tablesFor("^a");
    size_t end = 0;
    EXPECT_TRUE(scanEnd(t.fwd.get(), "aa", 0, true, &end));
    EXPECT_EQ(1U, end);

    // Only offset 0 is the start of the text.
    EXPECT_FALSE(scanEnd(t.fwd.get(), "aa", 1, true, &end));
}

TEST(DfaRuntime, WordContextAtStart) {
    Tables t = tablesFor("\\bb");
    size_t end = 0;

    // Starting inside "ab": the byte before is a word byte.
    EXPECT_FALSE(scanEnd(t.fwd.get(), "ab", 1, true, &end));
    EXPECT_TRUE(scanEnd(t.fwd.get(), " b", 1, true, &end));
    EXPECT_EQ(2U, end);
}

TEST(DfaRuntime, EndOfText) {
    Tables t = tablesFor("b$");
    size_t end = 0;
    EXPECT_FALSE(scanEnd(t.fwd.get(), "bx", 0, false, &end));
    ASSERT_TRUE(scanEnd(t.fwd.get(), "xbb", 0, false, &end));
    EXPECT_EQ(3U, end);
}

TEST(DfaRuntime, EmptyInput) {
    Tables t = tablesFor("a*");
    size_t end = 99;
    ASSERT_TRUE(scanEnd(t.fwd.get(), "", 0, true, &end));
    EXPECT_EQ(0U, end);

    Tables u = tablesFor("a");
    EXPECT_FALSE(scanEnd(u.fwd.get(), "", 0, true, &end));
}

TEST(DfaRuntime, ReverseStart) {
    Tables t = tablesFor("a+b");
    const string s = "xaaab";
    const u8 *buf = (const u8 *)s.data();
    size_t start = 99;

    ASSERT_TRUE(dfaScanReverse(t.rev.get(), buf, s.size(), 0, 5, &start));
    EXPECT_EQ(1U, start);

    // Bounded below: the match may not start before lo.
    ASSERT_TRUE(dfaScanReverse(t.rev.get(), buf, s.size(), 3, 5, &start));
    EXPECT_EQ(3U, start);
    EXPECT_FALSE(dfaScanReverse(t.rev.get(), buf, s.size(), 4, 5, &start));
}

TEST(DfaRuntime, ReverseBoundaryContext) {
    Tables t = tablesFor("\\ba");
    const string s = "ba a";
    const u8 *buf = (const u8 *)s.data();
    size_t start = 99;

    // "a" at offset 1 follows a word byte; the one at 3 follows a space.
    EXPECT_FALSE(dfaScanReverse(t.rev.get(), buf, s.size(), 1, 2, &start));
    ASSERT_TRUE(dfaScanReverse(t.rev.get(), buf, s.size(), 3, 4, &start));
    EXPECT_EQ(3U, start);
}
