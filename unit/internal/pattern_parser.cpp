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
#include "parser/ComponentAlternation.h"
#include "parser/ComponentAssertion.h"
#include "parser/ComponentBackReference.h"
#include "parser/ComponentBoundary.h"
#include "parser/ComponentByte.h"
#include "parser/ComponentClass.h"
#include "parser/ComponentRepeat.h"
#include "parser/ComponentSequence.h"
#include "parser/ComponentWordBoundary.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <memory>
#include <string>

using namespace std;
using namespace dfascan;

namespace {

static
const Component &onlyChild(const Component &c) {
    const auto *seq = dynamic_cast<const ComponentSequence *>(&c);
    EXPECT_TRUE(seq != nullptr);
    EXPECT_EQ(1U, seq->getChildren().size());
    return *seq->getChildren().front();
}

class ParserErrorTest : public testing::TestWithParam<const char *> {};

static const char *badPatterns[] = {
    "(",
    "(a",
    "a)",
    "*a",
    "a|+",
    "[a",
    "\\",
    "a{2",
    "a{2,3",
    "\\x4",
    "\\x{}",
    "\\x{110000}",
    "(?<a)",
    "\xc3",            // truncated UTF-8 literal
    "a{99999999999}",
};

} // namespace

TEST_P(ParserErrorTest, Rejected) {
    EXPECT_THROW(parsePattern(GetParam()), CompileError) << GetParam();
}

INSTANTIATE_TEST_CASE_P(PatternParser, ParserErrorTest,
                        testing::ValuesIn(badPatterns));

TEST(PatternParser, Literal) {
    auto root = parsePattern("\xe2\x82\xac");
    const auto *cc = dynamic_cast<const ComponentClass *>(&onlyChild(*root));
    ASSERT_TRUE(cc != nullptr);
    ASSERT_EQ(1U, cc->getRanges().size());
    EXPECT_EQ(0x20acU, cc->getRanges()[0].lo);
    EXPECT_EQ(0x20acU, cc->getRanges()[0].hi);
    EXPECT_FALSE(cc->isNegated());
}

TEST(PatternParser, Bracket) {
    auto root = parsePattern("[^a-c\\d]");
    const auto *cc = dynamic_cast<const ComponentClass *>(&onlyChild(*root));
    ASSERT_TRUE(cc != nullptr);
    EXPECT_TRUE(cc->isNegated());

    CodePointSet cps = cc->codePoints();
    EXPECT_FALSE(cps.test('a'));
    EXPECT_FALSE(cps.test('5'));
    EXPECT_TRUE(cps.test('d'));
    EXPECT_TRUE(cps.test(0x20ac));
}

TEST(PatternParser, Alternation) {
    auto root = parsePattern("ab|c|");
    const auto *alt = dynamic_cast<const ComponentAlternation *>(root.get());
    ASSERT_TRUE(alt != nullptr);
    ASSERT_EQ(3U, alt->getChildren().size());
    EXPECT_TRUE(alt->getChildren()[2]->empty());
    EXPECT_FALSE(alt->getChildren()[0]->empty());
}

TEST(PatternParser, Quantifiers) {
    struct {
        const char *re;
        u32 min;
        u32 max;
        bool greedy;
    } cases[] = {
        {"a*", 0, ComponentRepeat::NoLimit, true},
        {"a+?", 1, ComponentRepeat::NoLimit, false},
        {"a?", 0, 1, true},
        {"a{3}", 3, 3, true},
        {"a{2,}?", 2, ComponentRepeat::NoLimit, false},
        {"a{2,5}", 2, 5, true},
        {"a{5,2}", 5, 2, true}, // checked at compile time, not here
    };

    for (const auto &t : cases) {
        auto root = parsePattern(t.re);
        const auto *rep =
            dynamic_cast<const ComponentRepeat *>(&onlyChild(*root));
        ASSERT_TRUE(rep != nullptr) << t.re;
        EXPECT_EQ(t.min, rep->getBounds().first) << t.re;
        EXPECT_EQ(t.max, rep->getBounds().second) << t.re;
        EXPECT_EQ(t.greedy, rep->type == ComponentRepeat::REPEAT_GREEDY)
            << t.re;
    }
}

TEST(PatternParser, BraceLiteral) {
    // '{' not followed by a bound is an ordinary character.
    auto root = parsePattern("a{x");
    const auto *seq = dynamic_cast<const ComponentSequence *>(root.get());
    ASSERT_TRUE(seq != nullptr);
    EXPECT_EQ(3U, seq->getChildren().size());
}

TEST(PatternParser, Escapes) {
    auto root = parsePattern("\\xff\\C\\b\\B^$\\x{1F600}");
    const auto *seq = dynamic_cast<const ComponentSequence *>(root.get());
    ASSERT_TRUE(seq != nullptr);
    const auto &kids = seq->getChildren();
    ASSERT_EQ(7U, kids.size());

    const auto *b0 = dynamic_cast<const ComponentByte *>(kids[0].get());
    ASSERT_TRUE(b0 != nullptr);
    EXPECT_EQ(1U, b0->reach().count());
    EXPECT_TRUE(b0->reach().test(0xff));

    const auto *b1 = dynamic_cast<const ComponentByte *>(kids[1].get());
    ASSERT_TRUE(b1 != nullptr);
    EXPECT_TRUE(b1->reach().all());

    const auto *wb = dynamic_cast<const ComponentWordBoundary *>(kids[2].get());
    ASSERT_TRUE(wb != nullptr);
    EXPECT_FALSE(wb->isNegated());
    const auto *nwb =
        dynamic_cast<const ComponentWordBoundary *>(kids[3].get());
    ASSERT_TRUE(nwb != nullptr);
    EXPECT_TRUE(nwb->isNegated());

    const auto *caret = dynamic_cast<const ComponentBoundary *>(kids[4].get());
    ASSERT_TRUE(caret != nullptr);
    EXPECT_EQ(ComponentBoundary::BEGIN_STRING, caret->getBound());
    const auto *dollar =
        dynamic_cast<const ComponentBoundary *>(kids[5].get());
    ASSERT_TRUE(dollar != nullptr);
    EXPECT_EQ(ComponentBoundary::END_STRING, dollar->getBound());

    const auto *cc = dynamic_cast<const ComponentClass *>(kids[6].get());
    ASSERT_TRUE(cc != nullptr);
    EXPECT_EQ(0x1f600U, cc->getRanges()[0].lo);
}

TEST(PatternParser, NonRegular) {
    auto root = parsePattern("(a)\\1");
    const auto *seq = dynamic_cast<const ComponentSequence *>(root.get());
    ASSERT_TRUE(seq != nullptr);
    ASSERT_EQ(2U, seq->getChildren().size());
    const auto *br =
        dynamic_cast<const ComponentBackReference *>(seq->getChildren()[1].get());
    ASSERT_TRUE(br != nullptr);
    EXPECT_EQ(1U, br->getRefID());
    EXPECT_EQ(3U, br->getLoc());

    root = parsePattern("x(?<!y)");
    seq = dynamic_cast<const ComponentSequence *>(root.get());
    ASSERT_TRUE(seq != nullptr);
    const auto *la =
        dynamic_cast<const ComponentAssertion *>(seq->getChildren()[1].get());
    ASSERT_TRUE(la != nullptr);
    EXPECT_EQ(ComponentAssertion::LOOKBEHIND, la->getDirection());
    EXPECT_EQ(ComponentAssertion::NEG, la->getSense());
    EXPECT_EQ(1U, la->getLoc());
}

TEST(PatternParser, Locations) {
    auto root = parsePattern("ab[cd]");
    const auto *seq = dynamic_cast<const ComponentSequence *>(root.get());
    ASSERT_TRUE(seq != nullptr);
    EXPECT_EQ(0U, seq->getChildren()[0]->getLoc());
    EXPECT_EQ(1U, seq->getChildren()[1]->getLoc());
    EXPECT_EQ(2U, seq->getChildren()[2]->getLoc());
}

TEST(PatternParser, Clone) {
    auto root = parsePattern("(a|b\\b)*?c{2,3}");
    unique_ptr<Component> copy(root->clone());
    ASSERT_TRUE(copy != nullptr);
    EXPECT_NE(root.get(), copy.get());
    EXPECT_EQ(root->empty(), copy->empty());
    EXPECT_EQ(root->getLoc(), copy->getLoc());
}
