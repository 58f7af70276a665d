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

/** \file
 * \brief Thompson NFA: an arena of states with ordered edges.
 */
#include "ng_nfa.h"

#include <boost/dynamic_bitset.hpp>

using namespace std;

namespace dfascan {

const char *lookName(LookKind k) {
    switch (k) {
    case LOOK_START_TEXT:
        return "^";
    case LOOK_END_TEXT:
        return "$";
    case LOOK_WORD_BOUNDARY:
        return "\\b";
    case LOOK_NOT_WORD_BOUNDARY:
        return "\\B";
    }
    return "?";
}

bool NfaState::important() const {
    if (accept) {
        return true;
    }
    for (const auto &e : edges) {
        if (e.type != NfaEdge::EPSILON) {
            return true;
        }
    }
    return false;
}

u32 Nfa::addState() {
    states.push_back(NfaState());
    return states.size() - 1;
}

void Nfa::addEpsilon(u32 from, u32 to) {
    assert(from < states.size() && to < states.size());
    states[from].edges.push_back(NfaEdge::epsilon(to));
}

void Nfa::addBytes(u32 from, u8 lo, u8 hi, u32 to) {
    assert(from < states.size() && to < states.size());
    assert(lo <= hi);
    states[from].edges.push_back(NfaEdge::bytes(lo, hi, to));
}

void Nfa::addLook(u32 from, LookKind k, u32 to) {
    assert(from < states.size() && to < states.size());
    states[from].edges.push_back(NfaEdge::lookaround(k, to));
    look_flags |= LOOK_BIT(k);
}

void Nfa::setAccept(u32 s, u32 priority) {
    assert(s < states.size());
    states[s].accept = true;
    states[s].priority = priority;
}

static
LookKind reverseLook(LookKind k) {
    switch (k) {
    case LOOK_START_TEXT:
        return LOOK_END_TEXT;
    case LOOK_END_TEXT:
        return LOOK_START_TEXT;
    default:
        return k;
    }
}

Nfa reverseNfa(const Nfa &fwd) {
    const size_t n = fwd.size();

    boost::dynamic_bitset<> reach(n);
    vector<u32> stack(1, fwd.start_anchored);
    reach.set(fwd.start_anchored);
    while (!stack.empty()) {
        u32 u = stack.back();
        stack.pop_back();
        for (const auto &e : fwd[u].edges) {
            if (!reach.test(e.target)) {
                reach.set(e.target);
                stack.push_back(e.target);
            }
        }
    }

    Nfa rev;
    for (size_t i = 0; i < n; i++) {
        rev.addState();
    }
    u32 start = rev.addState();

    for (u32 u = 0; u < n; u++) {
        if (!reach.test(u)) {
            continue;
        }
        const NfaState &st = fwd[u];
        if (st.accept) {
            rev.addEpsilon(start, u);
        }
        for (const auto &e : st.edges) {
            switch (e.type) {
            case NfaEdge::EPSILON:
                rev.addEpsilon(e.target, u);
                break;
            case NfaEdge::BYTES:
                rev.addBytes(e.target, e.lo, e.hi, u);
                break;
            case NfaEdge::LOOK:
                rev.addLook(e.target, reverseLook(e.look), u);
                break;
            }
        }
    }

    rev.setAccept(fwd.start_anchored, 0);
    rev.start_anchored = start;
    rev.start_floating = start;

    DEBUG_PRINTF("reversed nfa: %zu states\n", rev.size());
    return rev;
}

} // namespace dfascan
