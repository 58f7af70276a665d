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
#include "util/charreach.h"

using namespace dfascan;

TEST(ng_charreach, init) {
    CharReach cr;

    ASSERT_EQ(0U, cr.count());
    ASSERT_TRUE(cr.none());
    ASSERT_FALSE(cr.all());
}

TEST(ng_charreach, set) {
    CharReach cr;

    cr.set('q');
    ASSERT_EQ(1U, cr.count());
    ASSERT_TRUE(cr.test('q'));
    ASSERT_FALSE(cr.test('r'));

    cr.set(0);
    cr.set(255);
    ASSERT_EQ(3U, cr.count());
    ASSERT_TRUE(cr.test(0));
    ASSERT_TRUE(cr.test(255));
}

TEST(ng_charreach, clear) {
    CharReach cr(0, 255);
    ASSERT_TRUE(cr.all());

    cr.clear('a');
    ASSERT_EQ(255U, cr.count());
    ASSERT_FALSE(cr.test('a'));

    cr.clear();
    ASSERT_TRUE(cr.none());
}

TEST(ng_charreach, flip) {
    CharReach cr("abc");
    cr.flip();

    ASSERT_EQ(253U, cr.count());
    ASSERT_FALSE(cr.test('a'));
    ASSERT_TRUE(cr.test('d'));
    ASSERT_EQ(~CharReach("abc"), cr);
}

TEST(ng_charreach, setRange) {
    CharReach cr;
    cr.setRange('a', 'z');
    ASSERT_EQ(26U, cr.count());
    ASSERT_TRUE(cr.test('a'));
    ASSERT_TRUE(cr.test('z'));
    ASSERT_FALSE(cr.test('a' - 1));
    ASSERT_FALSE(cr.test('z' + 1));

    // across the 64-bit word boundaries
    CharReach hi(60, 200);
    ASSERT_EQ(141U, hi.count());
    ASSERT_EQ(60U, hi.find_first());
}

TEST(ng_charreach, find) {
    CharReach cr;
    ASSERT_EQ(CharReach::npos, cr.find_first());

    cr.set(3);
    cr.set(63);
    cr.set(64);
    cr.set(255);

    size_t i = cr.find_first();
    ASSERT_EQ(3U, i);
    i = cr.find_next(i);
    ASSERT_EQ(63U, i);
    i = cr.find_next(i);
    ASSERT_EQ(64U, i);
    i = cr.find_next(i);
    ASSERT_EQ(255U, i);
    ASSERT_EQ(CharReach::npos, cr.find_next(i));
}

TEST(ng_charreach, string) {
    CharReach cr("hello");
    ASSERT_EQ(4U, cr.count());
    ASSERT_EQ("ehlo", cr.to_string());
}

TEST(ng_charreach, bitwise) {
    CharReach a("abcd");
    CharReach b("cdef");

    ASSERT_EQ(CharReach("abcdef"), a | b);
    ASSERT_EQ(CharReach("cd"), a & b);
    ASSERT_TRUE(overlaps(a, b));
    ASSERT_FALSE(overlaps(a, CharReach("xyz")));

    ASSERT_TRUE(CharReach("cd").isSubsetOf(a));
    ASSERT_FALSE(b.isSubsetOf(a));

    a |= b;
    ASSERT_EQ(6U, a.count());
    a &= CharReach("aef");
    ASSERT_EQ(CharReach("aef"), a);
}

TEST(ng_charreach, order) {
    CharReach a("a");
    CharReach b("b");
    ASSERT_TRUE(b < a || a < b);
    ASSERT_FALSE(a < a);
}

TEST(ng_charreach, dot) {
    CharReach dot = CharReach::dot();
    ASSERT_TRUE(dot.all());
    ASSERT_EQ(256U, dot.count());
}

TEST(ng_charreach, word_bytes) {
    const CharReach &w = wordBytes();
    ASSERT_EQ(63U, w.count());

    for (size_t c = 0; c < 256; c++) {
        ASSERT_EQ(w.test(c), isWordByte(c)) << "byte " << c;
    }

    ASSERT_TRUE(isWordByte('_'));
    ASSERT_TRUE(isWordByte('7'));
    ASSERT_FALSE(isWordByte('-'));
    ASSERT_FALSE(isWordByte(0xc3)); // UTF-8 lead bytes are never word bytes
    ASSERT_FALSE(isWordByte(0xa9));
}
