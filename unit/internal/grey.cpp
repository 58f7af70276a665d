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
#include "util/compile_error.h"

using namespace dfascan;

TEST(Grey, Defaults) {
    Grey g;
    EXPECT_TRUE(g.minimizeDFA);
    EXPECT_TRUE(g.allowNarrowTable);
    EXPECT_EQ(0U, g.dumpFlags);
    EXPECT_EQ(10000U, g.limitDFAStates);
    EXPECT_LT(0U, g.limitNFAStates);
    EXPECT_LT(0U, g.limitDFATransitions);
}

#ifndef RELEASE_BUILD

TEST(Grey, Overrides) {
    Grey g;
    applyGreyOverrides(&g, "limitDFAStates:50,minimizeDFA:0;allowNarrowTable:0");
    EXPECT_EQ(50U, g.limitDFAStates);
    EXPECT_FALSE(g.minimizeDFA);
    EXPECT_FALSE(g.allowNarrowTable);
    EXPECT_EQ(Grey().limitNFAStates, g.limitNFAStates);
}

TEST(Grey, EmptyOverride) {
    Grey g;
    applyGreyOverrides(&g, "");
    EXPECT_EQ(Grey().limitDFAStates, g.limitDFAStates);
}

TEST(Grey, BadKey) {
    Grey g;
    EXPECT_THROW(applyGreyOverrides(&g, "noSuchKnob:1"), CompileError);
}

TEST(Grey, BadValue) {
    Grey g;
    EXPECT_THROW(applyGreyOverrides(&g, "limitDFAStates:many"), CompileError);
    EXPECT_THROW(applyGreyOverrides(&g, "limitDFAStates"), CompileError);
}

#endif // RELEASE_BUILD
