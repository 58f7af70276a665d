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
#include "dfascan.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <string>

using namespace std;
using namespace dfascan;

namespace {

struct UnsupportedCase {
    const char *pattern;
    const char *construct;
    u32 index;
};

static const UnsupportedCase unsupportedCases[] = {
    {"(a)\\1", "Back-reference \\1", 3},
    {"x(?=y)", "Lookahead assertion (?=...)", 1},
    {"x(?!y)", "Negative lookahead assertion (?!...)", 1},
    {"(?<=a)b", "Lookbehind assertion (?<=...)", 0},
    {"ab(?<!a)", "Negative lookbehind assertion (?<!...)", 2},
};

} // namespace

TEST(BadPattern, Unsupported) {
    for (const auto &c : unsupportedCases) {
        SCOPED_TRACE(c.pattern);
        auto root = parsePattern(c.pattern);
        try {
            compile(*root, CompileOptions());
            ADD_FAILURE() << "compiled";
        } catch (const UnsupportedConstruct &e) {
            EXPECT_EQ(c.construct, e.construct);
            EXPECT_TRUE(e.hasIndex);
            EXPECT_EQ(c.index, e.index);
        }
    }
}

TEST(BadPattern, UnsupportedInsideAlternative) {
    // rejected even where the construct could never be reached
    auto root = parsePattern("a|b(?=c)");
    EXPECT_THROW(compile(*root, CompileOptions()), UnsupportedConstruct);
}

TEST(BadPattern, InvertedClassRange) {
    auto root = parsePattern("ab[z-a]");
    try {
        compile(*root, CompileOptions());
        FAIL() << "compiled";
    } catch (const InvalidRangeBoundary &e) {
        EXPECT_TRUE(e.hasIndex);
        EXPECT_EQ(2U, e.index);
        EXPECT_FALSE(e.reason.empty());
    }
}

TEST(BadPattern, InvertedRepeat) {
    auto root = parsePattern("a{5,2}");
    EXPECT_THROW(compile(*root, CompileOptions()), InvalidRangeBoundary);
}

TEST(BadPattern, StateLimit) {
    // needs to remember the last seven bytes
    auto root = parsePattern("[ab]*a[ab]{6}");

    CompileOptions opts;
    opts.max_states = 8;
    try {
        compile(*root, opts);
        FAIL() << "compiled";
    } catch (const StateLimitExceeded &e) {
        EXPECT_EQ(8U, e.limit);
        EXPECT_FALSE(e.hasIndex);
    }

    // Recoverable: a bigger limit succeeds.
    opts.max_states = 1000;
    auto db = compile(*root, opts);
    ASSERT_TRUE(db != nullptr);
    EXPECT_TRUE(db->isMatch("bbabbbbbb"));
    EXPECT_FALSE(db->isMatch("bbbbbbbbb"));
}

TEST(BadPattern, StateLimitIsResourceLimit) {
    auto root = parsePattern("[ab]*a[ab]{6}");
    CompileOptions opts;
    opts.max_states = 2;
    EXPECT_THROW(compile(*root, opts), ResourceLimitError);
    EXPECT_THROW(compile(*root, opts), CompileError);
}
