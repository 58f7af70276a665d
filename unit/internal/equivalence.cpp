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

/**
 * Differential tests: random patterns, compiled and run through the DFA
 * engine, must agree with the reference backtracker on every corpus string.
 */

#include "config.h"

#include "gtest/gtest.h"
#include "dfascan.h"
#include "parser/Component.h"
#include "util/compile_error.h"
#include "util/ng_corpus_generator.h"
#include "util/ng_corpus_properties.h"
#include "util/ng_find_matches.h"
#include "util/pattern_generator.h"
#include "util/pattern_parser.h"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace testing;
using namespace dfascan;

namespace {

typedef pair<size_t, size_t> Span;

static const unsigned PATTERNS_PER_SEED = 8;

class Equivalence : public TestWithParam<unsigned> {
protected:
    void SetUp() override {
        props.seed(GetParam());
        props.setPercentages(70, 10, 20);
        props.prefixRange = min_max(0, 3);
        props.suffixRange = min_max(0, 3);
        props.corpusLimit = 24;
    }

    /** Checks every query against the reference for one input and start. */
    void checkOne(const string &re, const Component &root, const Database &lf,
                  const Database &sh, const string &input, size_t start);

    CorpusProperties props;
};

static
string printable(const string &s) {
    string out;
    for (unsigned char c : s) {
        if (c >= 0x20 && c < 0x7f) {
            out += (char)c;
        } else {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        }
    }
    return out;
}

void Equivalence::checkOne(const string &re, const Component &root,
                           const Database &lf, const Database &sh,
                           const string &input, size_t start) {
    set<Span> all;
    if (!findMatches(root, input, all)) {
        return; // too slow to check
    }
    bool found = false;
    Span leftmost;
    if (!findLeftmostFirst(root, input, start, &found, &leftmost)) {
        return;
    }

    SCOPED_TRACE("pattern '" + printable(re) + "' input '" +
                 printable(input) + "' start " + to_string(start));

    // Earliest end over matches starting at or after start, then the
    // leftmost start of a match with that end.
    bool any = false;
    Span earliest(0, 0);
    for (const auto &m : all) {
        if (m.first < start) {
            continue;
        }
        if (!any || m.second < earliest.second ||
            (m.second == earliest.second && m.first < earliest.first)) {
            earliest = m;
            any = true;
        }
    }
    ASSERT_EQ(found, any);

    if (start == 0) {
        EXPECT_EQ(any, lf.isMatch(input));
        EXPECT_EQ(any, sh.isMatch(input));
    }

    size_t end = 0;
    ASSERT_EQ(any, sh.shortestMatch(input, start, &end));
    if (any) {
        EXPECT_EQ(earliest.second, end);
    }

    MatchSpan m;
    ASSERT_EQ(found, lf.find(input, start, &m));
    if (found) {
        EXPECT_EQ(leftmost.first, m.start);
        EXPECT_EQ(leftmost.second, m.end);
    }

    ASSERT_EQ(any, sh.find(input, start, &m));
    if (any) {
        EXPECT_EQ(earliest.first, m.start);
        EXPECT_EQ(earliest.second, m.end);
    }
}

} // namespace

TEST_P(Equivalence, RandomPatterns) {
    unsigned compiled = 0;

    for (unsigned i = 0; i < PATTERNS_PER_SEED; i++) {
        string re = generatePattern(props);
        auto root = parsePattern(re);

        CompileOptions lf_opts;
        CompileOptions sh_opts;
        sh_opts.longest_match = false;

        unique_ptr<Database> lf, sh;
        try {
            lf = compile(*root, lf_opts);
            sh = compile(*root, sh_opts);
        } catch (const StateLimitExceeded &) {
            continue;
        }
        compiled++;

        vector<string> corpus;
        auto gen = makeCorpusGenerator(*root, props);
        gen->generateCorpus(corpus);
        corpus.push_back("");

        for (const auto &input : corpus) {
            checkOne(re, *root, *lf, *sh, input, 0);
            if (!input.empty()) {
                size_t start = props.rand(1, input.size());
                checkOne(re, *root, *lf, *sh, input, start);
            }
            if (HasFatalFailure()) {
                return;
            }
        }
    }

    EXPECT_LT(0U, compiled);
}

INSTANTIATE_TEST_CASE_P(Dfa, Equivalence, Range(0U, 40U));

TEST(Equivalence, FixedPatterns) {
    static const char *patterns[] = {
        "a|ab", "ab|a", "(a|ab)(c|bcd)", "a*?b", "x*", "\\bfoo\\b",
        "\\B..\\B", "^a|b$", "(\xc3\xa9|e)+", "[^a-z]+", "\\C\\xff",
        "a{2,4}?", "(ab){1,3}c", "$", "^", "(?:a|\\b)c",
        "(|a)+", "(a|)+?b", "(|a)*", "(|a){1,3}", "(a||b)+", "(a|)*b",
    };
    static const char *inputs[] = {
        "", "a", "ab", "abcd", "aab", "foo", "a foo bar", "foofoo",
        "\xc3\xa9\xc3\xa9" "e", "\xc3", "ABC-12", "\xe2\x82\xff",
        "aaaaa", "ababc", "xyz b", " c c",
    };

    for (const char *re : patterns) {
        auto root = parsePattern(re);
        CompileOptions sh_opts;
        sh_opts.longest_match = false;
        auto lf = compile(*root, CompileOptions());
        auto sh = compile(*root, sh_opts);

        for (const char *in : inputs) {
            string input(in);
            for (size_t start = 0; start <= input.size(); start++) {
                set<Span> all;
                ASSERT_TRUE(findMatches(*root, input, all));
                bool found = false;
                Span leftmost;
                ASSERT_TRUE(
                    findLeftmostFirst(*root, input, start, &found, &leftmost));

                MatchSpan m;
                ASSERT_EQ(found, lf->find(input, start, &m))
                    << re << " on '" << printable(input) << "' from "
                    << start;
                if (found) {
                    EXPECT_EQ(leftmost.first, m.start) << re;
                    EXPECT_EQ(leftmost.second, m.end) << re;
                }

                size_t end = 0;
                bool have_end = false;
                size_t best = 0;
                for (const auto &s : all) {
                    if (s.first >= start && (!have_end || s.second < best)) {
                        best = s.second;
                        have_end = true;
                    }
                }
                ASSERT_EQ(have_end, sh->shortestMatch(input, start, &end))
                    << re << " on '" << printable(input) << "'";
                if (have_end) {
                    EXPECT_EQ(best, end) << re;
                }
            }
        }
    }
}
