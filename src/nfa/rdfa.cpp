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

#include "rdfa.h"

#include <boost/dynamic_bitset.hpp>

#include <algorithm>
#include <initializer_list>
#include <vector>

using namespace std;

namespace dfascan {

bool is_dead(const raw_dfa &rdfa) {
    return none_of(rdfa.states.begin(), rdfa.states.end(),
                   [](const dstate &ds) { return ds.accept != 0; });
}

void prune_unreachable(raw_dfa &rdfa) {
    const size_t num_states = rdfa.states.size();
    boost::dynamic_bitset<> reached(num_states);
    vector<dstate_id_t> stack;

    reached.set(DEAD_STATE);
    for (dstate_id_t s : {rdfa.start_nonword, rdfa.start_word}) {
        if (!reached.test(s)) {
            reached.set(s);
            stack.push_back(s);
        }
    }

    while (!stack.empty()) {
        dstate_id_t s = stack.back();
        stack.pop_back();
        for (dstate_id_t t : rdfa.states[s].next) {
            if (!reached.test(t)) {
                reached.set(t);
                stack.push_back(t);
            }
        }
    }

    if (reached.all()) {
        return;
    }

    DEBUG_PRINTF("pruning %zu unreachable states\n",
                 num_states - reached.count());

    vector<dstate_id_t> old_to_new(num_states, DEAD_STATE);
    vector<dstate> kept;
    kept.reserve(reached.count());
    for (size_t i = 0; i < num_states; i++) {
        if (reached.test(i)) {
            old_to_new[i] = kept.size();
            kept.push_back(std::move(rdfa.states[i]));
        }
    }

    for (auto &ds : kept) {
        for (auto &t : ds.next) {
            t = old_to_new[t];
        }
    }

    rdfa.states = std::move(kept);
    rdfa.start_nonword = old_to_new[rdfa.start_nonword];
    rdfa.start_word = old_to_new[rdfa.start_word];
}

} // namespace dfascan
