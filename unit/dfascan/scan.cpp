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

#include <string>
#include <vector>

using namespace std;
using namespace dfascan;

namespace {

struct ScanCase {
    const char *pattern;
    const char *input;
    bool longest;
    vector<MatchRecord> expected;
};

} // namespace

TEST(Scan, NonOverlapping) {
    const ScanCase cases[] = {
        {"ab", "abab ab", true, {{0, 2}, {2, 4}, {5, 7}}},
        {"a+", "aaa", true, {{0, 3}}},
        {"a+", "aaa", false, {{0, 1}, {1, 2}, {2, 3}}},
        {"aa|a", "aaa", true, {{0, 2}, {2, 3}}},
        {"x", "abc", true, {}},
        {"x", "", true, {}},
    };

    for (const auto &c : cases) {
        SCOPED_TRACE(c.pattern);
        auto db = buildDB(c.pattern, c.longest);
        ASSERT_TRUE(db != nullptr);
        EXPECT_EQ(c.expected, scanAll(*db, c.input));
    }
}

TEST(Scan, EmptyMatches) {
    const ScanCase cases[] = {
        {"", "ab", true, {{0, 0}, {1, 1}, {2, 2}}},
        {"a*", "baab", true, {{0, 0}, {1, 3}, {4, 4}}},
        // no empty match where the previous one ended
        {"a*", "aab", true, {{0, 2}, {3, 3}}},
        {"\\b", "ab cd", true, {{0, 0}, {2, 2}, {3, 3}, {5, 5}}},
        {"$", "abc", true, {{3, 3}}},
        {"", "", true, {{0, 0}}},
    };

    for (const auto &c : cases) {
        SCOPED_TRACE(c.pattern);
        auto db = buildDB(c.pattern, c.longest);
        ASSERT_TRUE(db != nullptr);
        EXPECT_EQ(c.expected, scanAll(*db, c.input));
    }
}

TEST(Scan, MultiByte) {
    auto db = buildDB(".");
    ASSERT_TRUE(db != nullptr);

    // never splits a code point; skips bytes that start none
    const string data("a\xc3\xa9\xff\xe2\x82\xac");
    vector<MatchRecord> expected = {{0, 1}, {1, 3}, {4, 7}};
    EXPECT_EQ(expected, scanAll(*db, data));
}

TEST(Scan, CallbackHalts) {
    auto db = buildDB("ab");
    ASSERT_TRUE(db != nullptr);

    CallBackContext c;
    c.halt_after = 2;
    const string data("ababab");
    bool complete = db->scan(data.data(), data.size(), record_cb, &c);
    EXPECT_FALSE(complete);
    ASSERT_EQ(2U, c.matches.size());
    EXPECT_EQ(MatchRecord(2, 4), c.matches[1]);

    c.clear();
    complete = db->scan(data.data(), data.size(), record_cb, &c);
    EXPECT_TRUE(complete);
    EXPECT_EQ(3U, c.matches.size());
}
