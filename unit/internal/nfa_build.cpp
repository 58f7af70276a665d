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
#include "nfagraph/ng_alphabet.h"
#include "nfagraph/ng_builder.h"
#include "nfagraph/ng_nfa.h"
#include "parser/Component.h"
#include "util/charreach.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace std;
using namespace dfascan;

namespace {

static
bool lookHolds(LookKind k, const string &s, size_t i) {
    bool prev = i > 0 && isWordByte(s[i - 1]);
    bool next = i < s.size() && isWordByte(s[i]);
    switch (k) {
    case LOOK_START_TEXT:
        return i == 0;
    case LOOK_END_TEXT:
        return i == s.size();
    case LOOK_WORD_BOUNDARY:
        return prev != next;
    case LOOK_NOT_WORD_BOUNDARY:
        return prev == next;
    }
    return false;
}

static
void closeOver(const Nfa &nfa, const string &s, size_t i,
               vector<bool> &on) {
    vector<u32> stack;
    for (u32 v = 0; v < on.size(); v++) {
        if (on[v]) {
            stack.push_back(v);
        }
    }
    while (!stack.empty()) {
        u32 v = stack.back();
        stack.pop_back();
        for (const auto &e : nfa[v].edges) {
            bool follow = e.type == NfaEdge::EPSILON ||
                          (e.type == NfaEdge::LOOK && lookHolds(e.look, s, i));
            if (follow && !on[e.target]) {
                on[e.target] = true;
                stack.push_back(e.target);
            }
        }
    }
}

/** Whole-string acceptance from \a start, by direct set simulation. */
static
bool accepts(const Nfa &nfa, u32 start, const string &s) {
    vector<bool> on(nfa.size(), false);
    on[start] = true;
    closeOver(nfa, s, 0, on);

    for (size_t i = 0; i < s.size(); i++) {
        const u8 c = s[i];
        vector<bool> next(nfa.size(), false);
        for (u32 v = 0; v < nfa.size(); v++) {
            if (!on[v]) {
                continue;
            }
            for (const auto &e : nfa[v].edges) {
                if (e.type == NfaEdge::BYTES && e.lo <= c && c <= e.hi) {
                    next[e.target] = true;
                }
            }
        }
        on.swap(next);
        closeOver(nfa, s, i + 1, on);
    }

    for (u32 v = 0; v < nfa.size(); v++) {
        if (on[v] && nfa[v].accept) {
            return true;
        }
    }
    return false;
}

static
Nfa nfaFor(const string &re, const Grey &grey = Grey()) {
    auto root = parsePattern(re);
    RangeAlphabet alpha = buildRangeAlphabet(*root);
    return buildNfa(*root, alpha, grey);
}

struct NfaCase {
    const char *pattern;
    const char *input;
    bool anchored;  //!< whole-input match from the pattern start
};

static const NfaCase nfaCases[] = {
    {"abc", "abc", true},
    {"abc", "ab", false},
    {"abc", "abcd", false},
    {"a|bc", "bc", true},
    {"a|bc", "ac", false},
    {"a*", "", true},
    {"a*", "aaaa", true},
    {"a+", "", false},
    {"a+?", "aaa", true},
    {"(ab)*", "abab", true},
    {"(ab)*", "aba", false},
    {"a{2,3}", "a", false},
    {"a{2,3}", "aa", true},
    {"a{2,3}", "aaa", true},
    {"a{2,3}", "aaaa", false},
    {"a{2,}", "aaaaaa", true},
    {"a{0,0}", "", true},
    {"a{0,0}", "a", false},
    {"x(?:y|)z", "xz", true},
    {"[a-c]+", "cab", true},
    {"[^a]", "b", true},
    {"[^a]", "a", false},
    {".", "\xc3\xa9", true},
    {".", "\xc3", false},
    {".", "\xed\xa0\x80", false},       // surrogate
    {".", "\xc0\xaf", false},           // overlong
    {"\\C", "\xc3", true},
    {"\\xff", "\xff", true},
    {"\xe2\x82\xac", "\xe2\x82\xac", true},
    {"[\\x{e9}\\x{eb}]", "\xc3\xa9", true},
    {"[\\x{e9}\\x{eb}]", "\xc3\xaa", false},
    {"^a$", "a", true},
    {"a^", "a", false},
    {"\\ba\\b", "a", true},
    {"a\\Bb", "ab", true},
    {"a\\bb", "ab", false},
    {"a\\b ", "a ", true},
};

class NfaBuildTest : public testing::TestWithParam<NfaCase> {};

} // namespace

TEST_P(NfaBuildTest, Language) {
    const NfaCase &t = GetParam();
    Nfa nfa = nfaFor(t.pattern);
    string input(t.input);

    EXPECT_EQ(t.anchored, accepts(nfa, nfa.start_anchored, input))
        << "pattern '" << t.pattern << "'";

    // Reversal accepts exactly the reversed strings.
    Nfa rev = reverseNfa(nfa);
    string backwards(input.rbegin(), input.rend());
    EXPECT_EQ(t.anchored, accepts(rev, rev.start_anchored, backwards))
        << "reversed pattern '" << t.pattern << "'";
}

INSTANTIATE_TEST_CASE_P(Nfa, NfaBuildTest, testing::ValuesIn(nfaCases));

TEST(Nfa, FloatingStart) {
    Nfa nfa = nfaFor("ab");
    EXPECT_TRUE(accepts(nfa, nfa.start_floating, "ab"));
    EXPECT_TRUE(accepts(nfa, nfa.start_floating, "xx\xff" "ab"));
    EXPECT_FALSE(accepts(nfa, nfa.start_floating, "abx"));
    EXPECT_FALSE(accepts(nfa, nfa.start_anchored, "xab"));

    // The pattern start is preferred over skipping a byte.
    const NfaState &fl = nfa[nfa.start_floating];
    ASSERT_EQ(2U, fl.edges.size());
    EXPECT_EQ(nfa.start_anchored, fl.edges[0].target);
}

TEST(Nfa, SingleAccept) {
    Nfa nfa = nfaFor("a|b|c");
    u32 accepts_seen = 0;
    for (u32 v = 0; v < nfa.size(); v++) {
        if (nfa[v].accept) {
            accepts_seen++;
            EXPECT_EQ(0U, nfa[v].priority);
            EXPECT_TRUE(nfa[v].important());
        }
    }
    EXPECT_EQ(1U, accepts_seen);
}

TEST(Nfa, GreedyOrder) {
    // For a greedy star the loop edge comes first; for a lazy one, the exit.
    Nfa greedy = nfaFor("a*");
    Nfa lazy = nfaFor("a*?");

    auto first_target_consumes = [](const Nfa &nfa) {
        for (u32 v = 0; v < nfa.size(); v++) {
            const auto &edges = nfa[v].edges;
            if (edges.size() == 2 && edges[0].type == NfaEdge::EPSILON &&
                edges[1].type == NfaEdge::EPSILON &&
                v != nfa.start_floating) {
                const NfaState &t = nfa[edges[0].target];
                return !t.edges.empty() && t.edges[0].type == NfaEdge::BYTES;
            }
        }
        return false;
    };

    EXPECT_TRUE(first_target_consumes(greedy));
    EXPECT_FALSE(first_target_consumes(lazy));
}

TEST(Nfa, LookFlags) {
    Nfa plain = nfaFor("abc");
    EXPECT_EQ(0U, plain.lookFlags());
    EXPECT_FALSE(plain.hasWordLooks());

    Nfa nfa = nfaFor("^a\\b");
    EXPECT_TRUE(nfa.lookFlags() & LOOK_BIT(LOOK_START_TEXT));
    EXPECT_FALSE(nfa.lookFlags() & LOOK_BIT(LOOK_END_TEXT));
    EXPECT_TRUE(nfa.hasWordLooks());

    Nfa rev = reverseNfa(nfa);
    EXPECT_FALSE(rev.lookFlags() & LOOK_BIT(LOOK_START_TEXT));
    EXPECT_TRUE(rev.lookFlags() & LOOK_BIT(LOOK_END_TEXT));
    EXPECT_TRUE(rev.hasWordLooks());
}

TEST(Nfa, ReverseStarts) {
    Nfa nfa = nfaFor("ab|cd");
    Nfa rev = reverseNfa(nfa);
    EXPECT_EQ(rev.start_anchored, rev.start_floating);
    EXPECT_TRUE(rev[nfa.start_anchored].accept);
    EXPECT_FALSE(accepts(rev, rev.start_anchored, "xba"));
}

TEST(Nfa, StateLimit) {
    Grey grey;
    grey.limitNFAStates = 16;
    EXPECT_THROW(nfaFor("a{20}", grey), StateLimitExceeded);
    EXPECT_NO_THROW(nfaFor("a", grey));

    try {
        nfaFor("(abc){10}", grey);
        FAIL() << "state limit not enforced";
    } catch (const StateLimitExceeded &e) {
        EXPECT_EQ(16U, e.limit);
    }
}

TEST(Nfa, LookNames) {
    EXPECT_STREQ("^", lookName(LOOK_START_TEXT));
    EXPECT_STREQ("$", lookName(LOOK_END_TEXT));
    EXPECT_STREQ("\\b", lookName(LOOK_WORD_BOUNDARY));
    EXPECT_STREQ("\\B", lookName(LOOK_NOT_WORD_BOUNDARY));
}
