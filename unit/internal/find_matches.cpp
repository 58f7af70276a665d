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
#include "parser/Component.h"
#include "util/compile_error.h"
#include "util/ng_find_matches.h"
#include "util/pattern_parser.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace testing;
using namespace dfascan;

namespace {

typedef pair<size_t, size_t> P;

struct MatchesTestParams {
    string pattern;
    string input;
    vector<P> matches;
};

// teach google-test how to print a param
void PrintTo(const MatchesTestParams &p, ::std::ostream *os) {
    *os << "( \"" << p.pattern << "\", \"" << p.input << "\", {";
    for (const auto &m : p.matches) {
        *os << " (" << m.first << "," << m.second << ")";
    }
    *os << " } )";
}

class MatchesTest : public TestWithParam<MatchesTestParams> {};

static const MatchesTestParams matchesTests[] = {
    {"a", "aba", {P(0, 1), P(2, 3)}},
    {"a|ab", "ab", {P(0, 1), P(0, 2)}},
    {"a*", "b", {P(0, 0), P(1, 1)}},
    {"a+", "aa", {P(0, 1), P(0, 2), P(1, 2)}},
    {"a{2}", "aaa", {P(0, 2), P(1, 3)}},
    {"^a", "aa", {P(0, 1)}},
    {"a$", "aa", {P(1, 2)}},
    {"\\bfoo\\b", "a foo", {P(2, 5)}},
    {"\\Bo", "foo o", {P(1, 2), P(2, 3)}},
    {".", "\xc3\xa9", {P(0, 2)}},
    {".", "\xc3", {}},
    {".", "\xed\xa0\x80", {}},
    {"\\C", "\xc3\xa9", {P(0, 1), P(1, 2)}},
    {"[^a]", "a\xe2\x82\xac", {P(1, 4)}},
    {"\\xff", "a\xff", {P(1, 2)}},
    {"", "ab", {P(0, 0), P(1, 1), P(2, 2)}},
};

} // namespace

TEST_P(MatchesTest, Check) {
    const MatchesTestParams &t = GetParam();
    auto root = parsePattern(t.pattern);

    set<P> matches;
    ASSERT_TRUE(findMatches(*root, t.input, matches));

    set<P> expected(begin(t.matches), end(t.matches));
    ASSERT_EQ(expected, matches) << "Pattern '" << t.pattern
                                 << "' against input '" << t.input << "'";
}

INSTANTIATE_TEST_CASE_P(ng_find_matches, MatchesTest, ValuesIn(matchesTests));

static
P leftmostFirst(const string &re, const string &input, size_t start = 0) {
    auto root = parsePattern(re);
    bool found = false;
    P m(0, 0);
    EXPECT_TRUE(findLeftmostFirst(*root, input, start, &found, &m));
    EXPECT_TRUE(found) << re;
    return m;
}

TEST(LeftmostFirst, Preference) {
    EXPECT_EQ(P(0, 1), leftmostFirst("a|ab", "ab"));
    EXPECT_EQ(P(0, 2), leftmostFirst("ab|a", "ab"));
    EXPECT_EQ(P(0, 3), leftmostFirst("a+", "aaa"));
    EXPECT_EQ(P(0, 1), leftmostFirst("a+?", "aaa"));
    EXPECT_EQ(P(0, 4), leftmostFirst("(a|ab)(c|bcd)", "abcd"));
    EXPECT_EQ(P(1, 4), leftmostFirst("b.*?d|bc", "abcd"));
    EXPECT_EQ(P(0, 0), leftmostFirst("a*", "baa"));
}

TEST(LeftmostFirst, StartOffset) {
    EXPECT_EQ(P(2, 3), leftmostFirst("a", "aba", 1));
    EXPECT_EQ(P(3, 3), leftmostFirst("$", "aba", 1));
}

TEST(LeftmostFirst, NoMatch) {
    auto root = parsePattern("x");
    bool found = true;
    P m;
    ASSERT_TRUE(findLeftmostFirst(*root, "abc", 0, &found, &m));
    EXPECT_FALSE(found);
}

TEST(LeftmostFirst, EmptyIteration) {
    // A loop never takes a second pass at the offset where its last one
    // began.
    EXPECT_EQ(P(0, 0), leftmostFirst("(\\b)*", "a"));
    EXPECT_EQ(P(0, 2), leftmostFirst("(|a)*", "aa"));
    EXPECT_EQ(P(0, 0), leftmostFirst("(|a)+", "aaaa"));
    EXPECT_EQ(P(0, 3), leftmostFirst("(a|)+?b", "aab"));
    EXPECT_EQ(P(0, 2), leftmostFirst("(a||b)+", "ab"));
}

TEST(LeftmostFirst, EmptyIterationBounded) {
    // Bounded copies are distinct, so empty iterations count towards them.
    EXPECT_EQ(P(0, 0), leftmostFirst("(|a){1,3}", "aaa"));
    EXPECT_EQ(P(0, 1), leftmostFirst("(a|){3}", "a"));
}

TEST(FindMatches, Budget) {
    auto root = parsePattern("(a|a)*(a|a)*c");
    set<P> matches;
    EXPECT_FALSE(findMatches(*root, string(40, 'a'), matches));
}

TEST(FindMatches, Unsupported) {
    auto root = parsePattern("(a)\\1");
    set<P> matches;
    EXPECT_THROW(findMatches(*root, "aa", matches), UnsupportedConstruct);
}
