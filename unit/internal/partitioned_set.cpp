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
#include "util/partitioned_set.h"

#include <vector>

using namespace std;
using namespace dfascan;

typedef partitioned_set<u32> pset;

static
vector<u32> members(const pset &ps, size_t idx) {
    return vector<u32>(ps[idx].begin(), ps[idx].end());
}

TEST(partitioned_set, initial_blocks) {
    pset ps(vector<size_t>({0, 1, 0, 1, 2}));
    ASSERT_EQ(3U, ps.size());
    EXPECT_EQ(vector<u32>({0, 2}), members(ps, 0));
    EXPECT_EQ(vector<u32>({1, 3}), members(ps, 1));
    EXPECT_EQ(vector<u32>({4}), members(ps, 2));
    EXPECT_EQ(1U, ps.block_of(3));
}

TEST(partitioned_set, split) {
    pset ps(vector<size_t>(6, 0));

    pset::key_set splitter;
    splitter.insert(1);
    splitter.insert(4);

    size_t n = ps.split(0, splitter);
    ASSERT_NE(INVALID_SUBSET, n);
    ASSERT_EQ(2U, ps.size());

    // The larger half keeps the old index.
    EXPECT_EQ(vector<u32>({0, 2, 3, 5}), members(ps, 0));
    EXPECT_EQ(vector<u32>({1, 4}), members(ps, n));
    EXPECT_EQ(n, ps.block_of(4));
    EXPECT_EQ(0U, ps.block_of(5));
}

TEST(partitioned_set, split_noop) {
    pset ps(vector<size_t>({0, 0, 1, 1}));

    pset::key_set all;
    all.insert(0);
    all.insert(1);
    EXPECT_EQ(INVALID_SUBSET, ps.split(0, all));

    pset::key_set outside;
    outside.insert(3);
    EXPECT_EQ(INVALID_SUBSET, ps.split(0, outside));

    EXPECT_EQ(INVALID_SUBSET, ps.split(0, pset::key_set()));
    EXPECT_EQ(2U, ps.size());
}

TEST(partitioned_set, find_overlapping) {
    pset ps(vector<size_t>({0, 1, 2, 0, 1, 2}));

    pset::key_set keys;
    keys.insert(2);
    keys.insert(3);
    keys.insert(5);

    vector<size_t> blocks;
    ps.find_overlapping(keys, &blocks);
    EXPECT_EQ(vector<size_t>({0, 2}), blocks);
}
