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
#include "database.h"
#include "nfa/dfa_internal.h"
#include "util/compile_error.h"

#include <cstddef>
#include <cstring>
#include <string>

using namespace std;
using namespace dfascan;

namespace {

static const char *serializePatterns[] = {
    "abc", "[a-z]+@[a-z]+\\.com", "\\bfoo\\b", "(a|ab)(c|bcd)", "^$",
    "\xc3\xa9+", "[^\\x{80}-\\x{10ffff}]*x", "\\C\\xff",
};

// Offset of the forward DFA's first table entry for state 1.
size_t forwardEntryOffset(const string &bytes) {
    db_header hdr;
    memcpy(&hdr, bytes.data(), sizeof(hdr));
    dfa d;
    memcpy(&d, bytes.data() + hdr.forward_offset, sizeof(d));
    return hdr.forward_offset + d.table_offset +
           ((size_t)d.width << d.alphaShift);
}

} // namespace

TEST(Serialize, RoundTrip) {
    const string data = "xx abc bob@mail.com foo caf\xc3\xa9\xc3\xa9 \xff";

    for (const char *pattern : serializePatterns) {
        for (bool longest : {true, false}) {
            SCOPED_TRACE(pattern);
            auto db = buildDB(pattern, longest);
            ASSERT_TRUE(db != nullptr);

            string bytes = db->serialize();
            ASSERT_FALSE(bytes.empty());

            auto db2 = Database::deserialize(bytes.data(), bytes.size());
            ASSERT_TRUE(db2 != nullptr);
            EXPECT_EQ(longest, db2->longestMatch());
            EXPECT_EQ(db->size(), db2->size());
            EXPECT_EQ(db->info(), db2->info());
            EXPECT_EQ(bytes, db2->serialize());
            EXPECT_EQ(scanAll(*db, data), scanAll(*db2, data));
        }
    }
}

TEST(Serialize, Header) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();
    ASSERT_LE(sizeof(db_header), bytes.size());

    db_header hdr;
    memcpy(&hdr, bytes.data(), sizeof(hdr));
    EXPECT_EQ((u32)DFASCAN_DB_MAGIC, hdr.magic);
    EXPECT_EQ((u32)DFASCAN_DB_VERSION, hdr.version);
    EXPECT_EQ(bytes.size(), hdr.length);
    EXPECT_EQ((u32)DFASCAN_DB_FLAG_LONGEST, hdr.flags);
    EXPECT_EQ(db->forward()->length, hdr.forward_length);
    EXPECT_EQ(db->reverse()->length, hdr.reverse_length);
    EXPECT_EQ(hdr.forward_offset + hdr.forward_length, hdr.reverse_offset);
}

TEST(Serialize, BadMagic) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();
    bytes[0] ^= 0xff;
    EXPECT_THROW(Database::deserialize(bytes.data(), bytes.size()),
                 CompileError);
}

TEST(Serialize, BadVersion) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();
    u32 version = DFASCAN_DB_VERSION + 1;
    memcpy(&bytes[offsetof(db_header, version)], &version, sizeof(version));
    EXPECT_THROW(Database::deserialize(bytes.data(), bytes.size()),
                 CompileError);
}

TEST(Serialize, Truncated) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();

    EXPECT_THROW(Database::deserialize(bytes.data(), bytes.size() - 1),
                 CompileError);
    EXPECT_THROW(Database::deserialize(bytes.data(), sizeof(db_header) - 1),
                 CompileError);
    EXPECT_THROW(Database::deserialize(bytes.data(), 0), CompileError);
    EXPECT_THROW(Database::deserialize(nullptr, 0), CompileError);
}

TEST(Serialize, TransitionOutOfRange) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();
    ASSERT_EQ(1U, db->forward()->width);

    bytes[forwardEntryOffset(bytes)] = (char)0xff;
    try {
        Database::deserialize(bytes.data(), bytes.size());
        FAIL() << "corrupt table accepted";
    } catch (const CompileError &e) {
        EXPECT_EQ("Invalid DFA transition.", e.reason);
    }
}

TEST(Serialize, SwappedDirections) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    string bytes = db->serialize();

    db_header hdr;
    memcpy(&hdr, bytes.data(), sizeof(hdr));
    swap(hdr.forward_offset, hdr.reverse_offset);
    swap(hdr.forward_length, hdr.reverse_length);
    memcpy(&bytes[0], &hdr, sizeof(hdr));
    EXPECT_THROW(Database::deserialize(bytes.data(), bytes.size()),
                 CompileError);
}

// A reverse DFA from another pattern passes validation but cannot recover
// the start; find() reports no match rather than failing.
TEST(Serialize, ForeignReverseDfa) {
    auto db = buildDB("abc");
    auto other = buildDB("xyz");
    ASSERT_TRUE(db != nullptr);
    ASSERT_TRUE(other != nullptr);
    string bytes = db->serialize();
    const string other_bytes = other->serialize();

    db_header hdr, other_hdr;
    memcpy(&hdr, bytes.data(), sizeof(hdr));
    memcpy(&other_hdr, other_bytes.data(), sizeof(other_hdr));
    ASSERT_EQ(hdr.reverse_length, other_hdr.reverse_length);
    memcpy(&bytes[hdr.reverse_offset],
           other_bytes.data() + other_hdr.reverse_offset,
           hdr.reverse_length);

    auto spliced = Database::deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(spliced != nullptr);
    EXPECT_TRUE(spliced->isMatch("abc", 3));

    MatchSpan m;
    bool found = true;
    EXPECT_NO_THROW(found = spliced->find("abc", 3, 0, &m));
    EXPECT_FALSE(found);
}

TEST(Database, Info) {
    auto db = buildDB("abc");
    ASSERT_TRUE(db != nullptr);
    EXPECT_EQ(db->forward()->length + db->reverse()->length, db->size());

    const string info = db->info();
    EXPECT_NE(string::npos, info.find("forward"));
    EXPECT_NE(string::npos, info.find("reverse"));
    EXPECT_NE(string::npos, info.find("longest"));

    db = buildDB("abc", false);
    ASSERT_TRUE(db != nullptr);
    EXPECT_NE(string::npos, db->info().find("shortest"));
}

TEST(Database, Version) {
    EXPECT_STREQ(DFASCAN_VERSION, version());
}
