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
#include "util/unicode_set.h"

using namespace dfascan;

TEST(unicode_set, empty) {
    CodePointSet cps;
    EXPECT_TRUE(cps.none());
    EXPECT_EQ(0U, cps.count());
    EXPECT_EQ(0U, cps.intervals());
    EXPECT_EQ(INVALID_UNICODE, cps.at(0));
}

TEST(unicode_set, single) {
    CodePointSet cps;
    cps.set(0x20ac);

    EXPECT_FALSE(cps.none());
    EXPECT_EQ(1U, cps.count());
    EXPECT_TRUE(cps.test(0x20ac));
    EXPECT_FALSE(cps.test(0x20ab));
    EXPECT_EQ(0x20acU, cps.at(0));

    cps.unset(0x20ac);
    EXPECT_TRUE(cps.none());
}

TEST(unicode_set, ranges_coalesce) {
    CodePointSet cps;
    cps.setRange('a', 'm');
    cps.setRange('n', 'z');
    EXPECT_EQ(1U, cps.intervals());
    EXPECT_EQ(26U, cps.count());

    cps.setRange(0x1f600, 0x1f64f);
    EXPECT_EQ(2U, cps.intervals());
    EXPECT_EQ(26U + 0x50U, cps.count());
    EXPECT_EQ('z', cps.at(25));
    EXPECT_EQ(0x1f600U, cps.at(26));
    EXPECT_EQ(INVALID_UNICODE, cps.at(26 + 0x50));
}

TEST(unicode_set, unset_splits) {
    CodePointSet cps;
    cps.setRange(0, MAX_UNICODE);
    cps.unsetRange(UNICODE_SURROGATE_MIN, UNICODE_SURROGATE_MAX);

    EXPECT_EQ(2U, cps.intervals());
    EXPECT_EQ((size_t)MAX_UNICODE + 1 - 0x800, cps.count());
    EXPECT_FALSE(cps.test(0xd800));
    EXPECT_FALSE(cps.test(0xdfff));
    EXPECT_TRUE(cps.test(0xd7ff));
    EXPECT_TRUE(cps.test(0xe000));
}

TEST(unicode_set, flip) {
    CodePointSet cps;
    cps.set('a');

    CodePointSet neg = ~cps;
    EXPECT_EQ((size_t)MAX_UNICODE, neg.count());
    EXPECT_FALSE(neg.test('a'));
    EXPECT_TRUE(neg.test(0));
    EXPECT_TRUE(neg.test(MAX_UNICODE));

    neg.flip();
    EXPECT_TRUE(neg == cps);
}

TEST(unicode_set, set_ops) {
    CodePointSet a;
    a.setRange('a', 'f');
    CodePointSet b;
    b.setRange('d', 'k');

    CodePointSet u = a | b;
    EXPECT_EQ(11U, u.count());
    EXPECT_EQ(1U, u.intervals());

    CodePointSet i = a & b;
    EXPECT_EQ(3U, i.count());
    EXPECT_EQ('d', i.at(0));

    CodePointSet d = a;
    d -= b;
    EXPECT_EQ(3U, d.count());
    EXPECT_EQ('c', d.at(2));

    EXPECT_TRUE(a.overlaps(b));
    EXPECT_FALSE(d.overlaps(b));
    EXPECT_TRUE(u.isSubset(a));
    EXPECT_FALSE(a.isSubset(b));
    EXPECT_TRUE(a != b);
}

TEST(unicode_set, iterate) {
    CodePointSet cps;
    cps.setRange(0x80, 0x7ff);
    cps.set(0x10ffff);

    size_t n = 0;
    for (const auto &ival : cps) {
        if (n == 0) {
            EXPECT_EQ(0x80U, boost::icl::lower(ival));
            EXPECT_EQ(0x7ffU, boost::icl::upper(ival));
        } else {
            EXPECT_EQ(0x10ffffU, boost::icl::lower(ival));
            EXPECT_EQ(0x10ffffU, boost::icl::upper(ival));
        }
        n++;
    }
    EXPECT_EQ(2U, n);
}
