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

#ifndef UTIL_PARTITIONED_SET_H
#define UTIL_PARTITIONED_SET_H

#include "noncopyable.h"
#include "dfascan_common.h"

#include <algorithm>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <boost/dynamic_bitset.hpp>

namespace dfascan {

static constexpr size_t INVALID_SUBSET = ~(size_t)0;

/**
 * partitioned_set represents a partitioning of the integers [0, n) into
 * disjoint non-empty blocks, each identified by a dense index.
 *
 * Blocks keep their members sorted; refinement only ever splits a block in
 * two.
 */
template<typename T>
class partitioned_set : noncopyable {
public:
    typedef boost::container::flat_set<T> key_set;

    class subset {
    public:
        typedef typename std::vector<T>::const_iterator const_iterator;

        size_t size() const {
            assert(members.size());
            return members.size();
        }

        const_iterator begin() const { return members.begin(); }
        const_iterator end() const { return members.end(); }

    private:
        std::vector<T> members; /**< sorted members of the block */

        friend class partitioned_set;
    };

    /**
     * Creates a partitioned set containing [0, member_block.size()), where
     * member_block[i] names the initial block of member i. Block indices must
     * be dense, starting from 0.
     */
    explicit partitioned_set(const std::vector<size_t> &member_block) {
        assert(!member_block.empty());

        size_t block_count = 0;
        for (const auto &b : member_block) {
            assert(b != INVALID_SUBSET);
            ENSURE_AT_LEAST(&block_count, b + 1);
        }
        assert(block_count <= member_block.size());

        subsets.resize(block_count);
        member_to_subset = member_block;
        for (size_t i = 0; i < member_block.size(); i++) {
            assert(i == (size_t)(T)i);
            subsets[member_block[i]].members.push_back(i);
        }

        scratch_in.reserve(member_block.size());
        scratch_out.reserve(member_block.size());
    }

    /** \brief Number of blocks in the partition. */
    size_t size() const { return subsets.size(); }

    const subset &operator[](size_t idx) const {
        assert(idx < size());
        return subsets[idx];
    }

    /** \brief Index of the block holding \a member. */
    size_t block_of(T member) const {
        assert(member < member_to_subset.size());
        return member_to_subset[member];
    }

    /**
     * Splits block \a idx into the members that are in \a splitter and those
     * that are not.
     *
     * The larger half keeps index \a idx; the smaller half moves to a new
     * block, whose index is returned. Returns INVALID_SUBSET if the splitter
     * doesn't separate the block.
     */
    size_t split(size_t idx, const key_set &splitter) {
        if (splitter.empty()) {
            return INVALID_SUBSET;
        }

        subset &orig = subsets[idx];
        assert(std::is_sorted(orig.members.begin(), orig.members.end()));

        if (orig.members.back() < *splitter.begin() ||
            orig.members.front() > *splitter.rbegin()) {
            return INVALID_SUBSET;
        }

        scratch_in.clear();
        scratch_out.clear();

        auto sp_it = splitter.begin();
        for (auto it = orig.members.begin(); it != orig.members.end(); ++it) {
            sp_it = std::lower_bound(sp_it, splitter.end(), *it);
            if (sp_it == splitter.end()) {
                scratch_out.insert(scratch_out.end(), it, orig.members.end());
                break;
            }
            if (*sp_it == *it) {
                scratch_in.push_back(*it);
            } else {
                scratch_out.push_back(*it);
            }
        }

        if (scratch_in.empty() || scratch_out.empty()) {
            return INVALID_SUBSET;
        }

        std::vector<T> *big = &scratch_in;
        std::vector<T> *small = &scratch_out;
        if (scratch_out.size() > scratch_in.size()) {
            std::swap(big, small);
        }

        orig.members.assign(big->begin(), big->end());

        size_t new_idx = subsets.size();
        subsets.push_back(subset());
        subsets.back().members.assign(small->begin(), small->end());
        for (const auto &m : *small) {
            member_to_subset[m] = new_idx;
        }

        return new_idx;
    }

    /** \brief Appends the indices of all blocks with a member in \a keys, in
     * ascending order. */
    void find_overlapping(const key_set &keys,
                          std::vector<size_t> *containing) const {
        boost::dynamic_bitset<> seen(subsets.size());

        for (const auto &key : keys) {
            seen.set(block_of(key));
        }

        for (size_t i = seen.find_first(); i != seen.npos;
             i = seen.find_next(i)) {
            containing->push_back(i);
        }
    }

private:
    std::vector<size_t> member_to_subset;
    std::vector<subset> subsets;

    std::vector<T> scratch_in;  //!< used by split() for the intersection.
    std::vector<T> scratch_out; //!< used by split() for the difference.
};

} // namespace dfascan

#endif
