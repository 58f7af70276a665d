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
#include "test_util.h"

#include <ostream>
#include <string>

using namespace std;
using namespace testing;
using namespace dfascan;

namespace {

static const size_t NONE = ~(size_t)0;

struct SingleCase {
    const char *pattern;
    string input;
    size_t from;      // leftmost-first match, or NONE
    size_t to;
    size_t short_to;  // earliest end
    size_t short_from;
};

void PrintTo(const SingleCase &c, ostream *os) {
    *os << "pattern '" << c.pattern << "', input of " << c.input.size()
        << " bytes";
}

static const SingleCase singleCases[] = {
    {"abc", "xxabcxx", 2, 5, 5, 2},
    {"^abc", "xabc", NONE, NONE, NONE, NONE},
    {"abc$", "abcx", NONE, NONE, NONE, NONE},
    {"abc$", "xabc", 1, 4, 4, 1},
    {"^abc$", "abc", 0, 3, 3, 0},
    {"^abc$", "xabc", NONE, NONE, NONE, NONE},
    {"^abc$", "abcx", NONE, NONE, NONE, NONE},
    {"^abc$", "", NONE, NONE, NONE, NONE},
    {"a+", "aaa", 0, 3, 1, 0},
    {"b+", "aabbbcc", 2, 5, 3, 2},
    {"a+", "baaa", 1, 4, 2, 1},
    {"a+?", "baaa", 1, 2, 2, 1},
    {"a|ab", "ab", 0, 1, 1, 0},
    {"ab|a", "ab", 0, 2, 1, 0},
    {"x*", "abc", 0, 0, 0, 0},
    {"b*", "abbb", 0, 0, 0, 0},
    {"", "abc", 0, 0, 0, 0},
    {"\\bfoo\\b", "afoo foo", 5, 8, 8, 5},
    {"\\Bfoo", "afoo foo", 1, 4, 4, 1},
    {"\\d+\\b", "ab12 34x", 2, 4, 4, 2},
    {"\\w+$", "hello world", 6, 11, 11, 6},
    {"$", "ab", 2, 2, 2, 2},
    {"^", "ab", 0, 0, 0, 0},
    {"(ab)*c", "ababc", 0, 5, 5, 0},
    {"a{2,3}", "aaaa", 0, 3, 2, 0},
    // empty repeat iterations
    {"(|a)+", "aaaa", 0, 0, 0, 0},
    {"(|a){1,3}", "aaa", 0, 0, 0, 0},
    {"(a|)+?b", "aab", 0, 3, 3, 0},
    {"a.*?c|x", "zabcxc", 1, 4, 4, 1},
    {"[a-z]+@[a-z]+", "mail: bob@host.", 6, 14, 11, 6},
    // UTF-8
    {"\xc3\xa9", "caf\xc3\xa9", 3, 5, 5, 3},
    {".", "\xe2\x82\xac", 0, 3, 3, 0},
    {"a.c", "a\xc3\xa9" "c", 0, 4, 4, 0},
    {"[^a]+", "aa\xe2\x82\xac" "a", 2, 5, 5, 2},
    // invalid UTF-8 never matches a code point class
    {".", "\xff", NONE, NONE, NONE, NONE},
    {"a.c", "a\xc3" "c", NONE, NONE, NONE, NONE},
    {".", "\xed\xa0\x80", NONE, NONE, NONE, NONE},
    {".", "\xc0\xaf", NONE, NONE, NONE, NONE},
    // raw bytes
    {"\\C", "\xff", 0, 1, 1, 0},
    {"\\xff+", "a\xff\xff", 1, 3, 2, 1},
};

class Single : public TestWithParam<SingleCase> {};

TEST_P(Single, Find) {
    const SingleCase &c = GetParam();
    auto db = buildDB(c.pattern);
    ASSERT_TRUE(db != nullptr);

    MatchSpan m;
    bool found = db->find(c.input, 0, &m);
    ASSERT_EQ(c.from != NONE, found);
    if (found) {
        EXPECT_EQ(c.from, m.start);
        EXPECT_EQ(c.to, m.end);
    }
    EXPECT_EQ(found, db->isMatch(c.input));
}

TEST_P(Single, Shortest) {
    const SingleCase &c = GetParam();
    auto db = buildDB(c.pattern, false);
    ASSERT_TRUE(db != nullptr);
    EXPECT_FALSE(db->longestMatch());

    size_t end = NONE;
    bool found = db->shortestMatch(c.input, 0, &end);
    ASSERT_EQ(c.short_to != NONE, found);
    if (found) {
        EXPECT_EQ(c.short_to, end);
    }

    MatchSpan m;
    ASSERT_EQ(found, db->find(c.input, 0, &m));
    if (found) {
        EXPECT_EQ(c.short_from, m.start);
        EXPECT_EQ(c.short_to, m.end);
    }
}

INSTANTIATE_TEST_CASE_P(Single, Single, ValuesIn(singleCases));

} // namespace

TEST(Single, StartOffset) {
    auto db = buildDB("ab");
    ASSERT_TRUE(db != nullptr);
    const string data("abxab");

    MatchSpan m;
    ASSERT_TRUE(db->find(data, 1, &m));
    EXPECT_EQ(3U, m.start);
    EXPECT_EQ(5U, m.end);

    // A match may not start before the offset, even if it ends after it.
    EXPECT_FALSE(db->find(data, 4, &m));
    EXPECT_FALSE(db->find(data, 6, &m));

    size_t end;
    ASSERT_TRUE(db->shortestMatch(data, 0, &end));
    EXPECT_EQ(2U, end);
    ASSERT_TRUE(db->shortestMatch(data, 2, &end));
    EXPECT_EQ(5U, end);
}

TEST(Single, AnchorsAtOffset) {
    auto db = buildDB("^a");
    ASSERT_TRUE(db != nullptr);

    MatchSpan m;
    // '^' means the start of the data, not the start of the search.
    EXPECT_FALSE(db->find("aa", 1, &m));
    ASSERT_TRUE(db->find("aa", 0, &m));
    EXPECT_EQ(0U, m.start);

    db = buildDB("a$");
    ASSERT_TRUE(db != nullptr);
    ASSERT_TRUE(db->find("aa", 1, &m));
    EXPECT_EQ(1U, m.start);
    EXPECT_EQ(2U, m.end);
}

TEST(Single, WordContextAtOffset) {
    auto db = buildDB("\\bb");
    ASSERT_TRUE(db != nullptr);

    MatchSpan m;
    // The byte before the offset decides the word boundary.
    EXPECT_FALSE(db->find("ab", 1, &m));
    ASSERT_TRUE(db->find(" b", 1, &m));
    EXPECT_EQ(1U, m.start);

    db = buildDB("a\\B");
    ASSERT_TRUE(db != nullptr);
    EXPECT_FALSE(db->isMatch("a"));
    EXPECT_FALSE(db->isMatch("a b"));
    EXPECT_TRUE(db->isMatch("ab"));
}

TEST(Single, EmptyData) {
    auto db = buildDB("a*");
    ASSERT_TRUE(db != nullptr);
    EXPECT_TRUE(db->isMatch(""));
    EXPECT_TRUE(db->isMatch(nullptr, 0));

    MatchSpan m;
    ASSERT_TRUE(db->find("", 0, &m));
    EXPECT_EQ(0U, m.start);
    EXPECT_EQ(0U, m.end);

    db = buildDB("\\b");
    ASSERT_TRUE(db != nullptr);
    EXPECT_FALSE(db->isMatch(""));

    db = buildDB("^$");
    ASSERT_TRUE(db != nullptr);
    EXPECT_TRUE(db->isMatch(""));
    EXPECT_FALSE(db->isMatch("a"));
}

TEST(Single, StartRecovery) {
    // The start is the leftmost one, far behind the end the forward scan saw.
    auto db = buildDB("x[a-z]*y");
    ASSERT_TRUE(db != nullptr);
    const string data = "..x" + string(200, 'q') + "y..";

    MatchSpan m;
    ASSERT_TRUE(db->find(data, 0, &m));
    EXPECT_EQ(2U, m.start);
    EXPECT_EQ(204U, m.end);

    EXPECT_FALSE(db->find(data, 3, &m));
}

TEST(Single, NullBytes) {
    auto db = buildDB("a\\x00b");
    ASSERT_TRUE(db != nullptr);
    const string data("xa\0b", 4);

    MatchSpan m;
    ASSERT_TRUE(db->find(data, 0, &m));
    EXPECT_EQ(1U, m.start);
    EXPECT_EQ(4U, m.end);
}
