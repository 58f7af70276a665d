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
 * \brief Subset construction from a Thompson NFA to a raw_dfa.
 *
 * A DFA state is keyed on the epsilon closure of its NFA threads, in
 * preference order, holding only states that consume bytes, carry look edges
 * or accept. Look edges are left unresolved in the key: whether they hold
 * depends on the byte about to be consumed, so they are resolved during each
 * transition from the context flags kept beside the key.
 */

#include "ng_dfa.h"

#include "ng_alphabet.h"
#include "ng_nfa.h"
#include "util/charreach.h"
#include "util/compile_error.h"
#include "util/determinise.h"
#include "util/make_unique.h"

#include <algorithm>
#include <unordered_map>
#include <vector>

#include <boost/functional/hash/hash.hpp>

using namespace std;

namespace dfascan {

namespace {

/* context flags held in a key */
#define CTX_AT_START  0x1 //!< nothing consumed yet, SOT fed
#define CTX_PREV_WORD 0x2 //!< last byte consumed was a word byte
#define CTX_FINAL     0x4 //!< EOT consumed with an accept reached

struct NfaStateSet {
    vector<u32> states;
    u8 flags = 0;

    bool operator==(const NfaStateSet &b) const {
        return flags == b.flags && states == b.states;
    }
};

struct NfaStateSetHash {
    size_t operator()(const NfaStateSet &s) const {
        size_t v = boost::hash_range(s.states.begin(), s.states.end());
        boost::hash_combine(v, s.flags);
        return v;
    }
};

/** \brief Where the automaton is when resolving look edges. */
struct LookContext {
    bool at_start;
    bool at_end;
    bool prev_word;
    bool next_word;

    bool holds(LookKind k) const {
        switch (k) {
        case LOOK_START_TEXT:
            return at_start;
        case LOOK_END_TEXT:
            return at_end;
        case LOOK_WORD_BOUNDARY:
            return prev_word != next_word;
        case LOOK_NOT_WORD_BOUNDARY:
            return prev_word == next_word;
        }
        return false;
    }
};

class Automaton_Nfa {
public:
    using StateSet = NfaStateSet;
    using StateMap = unordered_map<StateSet, dstate_id_t, NfaStateSetHash>;

    Automaton_Nfa(const Nfa &nfa_in, const RangeAlphabet &alpha_in,
                  MatchKind kind_in)
        : nfa(nfa_in), alpha(alpha_in), kind(kind_in),
          alphasize(alpha_in.alpha_size), dead(),
          word_looks(nfa_in.hasWordLooks()),
          start_looks(nfa_in.lookFlags() & LOOK_BIT(LOOK_START_TEXT)),
          stamp(nfa_in.size(), 0) {
        vector<u32> seed(1, nfa.start_floating);
        closure(seed, nullptr, &start.states);
        canonicalise(&start.states);
        init.push_back(start);
        if (word_looks) {
            StateSet start_word = start;
            start_word.flags |= CTX_PREV_WORD;
            init.push_back(start_word);
        }
    }

    /** \brief Start after a non-word byte, then after a word byte. */
    const vector<StateSet> &initial() const { return init; }

    void reports(const StateSet &in, dstate &ds) const;
    void transition(const StateSet &in, StateSet *next);

private:
    /** \brief Walks the closure of \a seeds in preference order, appending
     * the states that matter to \a out. Look edges are followed only if
     * \a ctx is given and says they hold. */
    void closure(const vector<u32> &seeds, const LookContext *ctx,
                 vector<u32> *out) const;

    void canonicalise(vector<u32> *states) const {
        if (kind == MATCH_ALL) {
            sort_and_unique(*states);
        }
    }

    LookContext context(const StateSet &in, bool at_end,
                        bool next_word) const {
        LookContext ctx;
        ctx.at_start = in.flags & CTX_AT_START;
        ctx.at_end = at_end;
        ctx.prev_word = in.flags & CTX_PREV_WORD;
        ctx.next_word = next_word;
        return ctx;
    }

    /** \brief The preferred accept among \a states, or none. */
    bool bestAccept(const vector<u32> &states, u32 *acc) const;

    StateSet successor(const vector<u32> &resolved, u8 c) const;

    const Nfa &nfa;
    const RangeAlphabet &alpha;
    const MatchKind kind;

public:
    const u16 alphasize;
    const StateSet dead;

private:
    const bool word_looks;
    const bool start_looks;
    StateSet start;
    vector<StateSet> init;

    /* visited marks for closure(), by generation */
    mutable vector<u32> stamp;
    mutable u32 generation = 0;
};

void Automaton_Nfa::closure(const vector<u32> &seeds, const LookContext *ctx,
                            vector<u32> *out) const {
    if (++generation == 0) {
        fill(stamp.begin(), stamp.end(), 0);
        generation = 1;
    }

    vector<u32> stack;
    for (auto it = seeds.rbegin(); it != seeds.rend(); ++it) {
        stack.push_back(*it);
    }

    while (!stack.empty()) {
        u32 s = stack.back();
        stack.pop_back();
        if (stamp[s] == generation) {
            continue;
        }
        stamp[s] = generation;

        const NfaState &st = nfa[s];
        if (st.important()) {
            out->push_back(s);
        }
        if (st.accept && kind == MATCH_LEFTMOST_FIRST) {
            // Nothing behind the first accepting thread can win.
            return;
        }

        const auto &edges = st.edges;
        for (auto it = edges.rbegin(); it != edges.rend(); ++it) {
            if (it->type == NfaEdge::EPSILON) {
                stack.push_back(it->target);
            } else if (it->type == NfaEdge::LOOK && ctx &&
                       ctx->holds(it->look)) {
                stack.push_back(it->target);
            }
        }
    }
}

bool Automaton_Nfa::bestAccept(const vector<u32> &states, u32 *acc) const {
    bool found = false;
    for (u32 s : states) {
        if (!nfa[s].accept) {
            continue;
        }
        if (kind == MATCH_LEFTMOST_FIRST) {
            *acc = s;
            return true;
        }
        if (!found || nfa[s].priority < nfa[*acc].priority) {
            *acc = s;
            found = true;
        }
    }
    return found;
}

void Automaton_Nfa::reports(const StateSet &in, dstate &ds) const {
    ds.accept = 0;
    ds.priority = 0;

    if (in.flags & CTX_FINAL) {
        assert(in.states.size() == 1);
        ds.accept = ACCEPT_ANY;
        ds.priority = nfa[in.states.front()].priority;
        return;
    }

    if (in.states.empty()) {
        return;
    }

    bool have_priority = false;
    for (u32 i = 0; i < 2; i++) {
        bool next_word = i == 0;
        if (next_word && !word_looks) {
            continue;
        }
        LookContext ctx = context(in, false, next_word);
        vector<u32> resolved;
        closure(in.states, &ctx, &resolved);
        u32 acc;
        if (!bestAccept(resolved, &acc)) {
            continue;
        }
        if (!word_looks) {
            ds.accept = ACCEPT_ANY;
        } else {
            ds.accept |= next_word ? ACCEPT_BEFORE_WORD
                                   : ACCEPT_BEFORE_NONWORD;
        }
        if (!have_priority || nfa[acc].priority < ds.priority) {
            ds.priority = nfa[acc].priority;
            have_priority = true;
        }
    }
}

Automaton_Nfa::StateSet
Automaton_Nfa::successor(const vector<u32> &resolved, u8 c) const {
    vector<u32> targets;
    for (u32 s : resolved) {
        const NfaState &st = nfa[s];
        if (st.accept && kind == MATCH_LEFTMOST_FIRST) {
            break;
        }
        for (const auto &e : st.edges) {
            if (e.type == NfaEdge::BYTES && e.lo <= c && c <= e.hi) {
                targets.push_back(e.target);
            }
        }
    }

    StateSet next;
    if (targets.empty()) {
        return next;
    }
    closure(targets, nullptr, &next.states);
    canonicalise(&next.states);
    if (next.states.empty()) {
        return next;
    }
    if (word_looks && isWordByte(c)) {
        next.flags |= CTX_PREV_WORD;
    }
    return next;
}

void Automaton_Nfa::transition(const StateSet &in, StateSet *next) {
    fill(next, next + alphasize, dead);

    if (in.flags & CTX_FINAL) {
        return;
    }

    // SOT: only the non-word start takes it.
    const u16 sot = alpha.alpha[SYM_SOT];
    if (in == start) {
        if (start_looks) {
            StateSet s = in;
            s.flags |= CTX_AT_START;
            next[sot] = s;
        } else {
            next[sot] = in;
        }
    }

    // EOT: resolve at the end of the text and keep only the accept.
    const u16 eot = alpha.alpha[SYM_EOT];
    {
        LookContext ctx = context(in, true, false);
        vector<u32> resolved;
        closure(in.states, &ctx, &resolved);
        u32 acc;
        if (bestAccept(resolved, &acc)) {
            next[eot].states.push_back(acc);
            next[eot].flags = CTX_FINAL;
        }
    }

    // Bytes: the threads alive depend only on the word kind of the byte.
    vector<u32> resolved[2];
    bool done[2] = {false, false};
    const u16 byte_classes = alphasize - N_SPECIAL_SYMBOL;
    for (u16 k = 0; k < byte_classes; k++) {
        u8 c = (u8)alpha.unalpha[k];
        u32 w = word_looks && isWordByte(c) ? 1 : 0;
        if (!done[w]) {
            LookContext ctx = context(in, false, w);
            closure(in.states, &ctx, &resolved[w]);
            done[w] = true;
        }
        next[k] = successor(resolved[w], c);
    }
}

} // namespace

unique_ptr<raw_dfa> buildDfa(const Nfa &nfa, const RangeAlphabet &alpha,
                             dfa_direction direction, MatchKind kind,
                             size_t state_limit) {
    assert(alpha.alpha_size > N_SPECIAL_SYMBOL);
    assert(alpha.alpha[SYM_SOT] == alpha.alpha_size - 2);
    assert(alpha.alpha[SYM_EOT] == alpha.alpha_size - 1);

    Automaton_Nfa n(nfa, alpha, kind);

    auto rdfa = make_unique<raw_dfa>(direction);
    rdfa->alpha_size = alpha.alpha_size;
    rdfa->alpha_remap = alpha.alpha;
    rdfa->word_sensitive = nfa.hasWordLooks();

    DEBUG_PRINTF("determinising %zu nfa states, alpha size %hu, limit %zu\n",
                 nfa.size(), alpha.alpha_size, state_limit);

    vector<NfaStateSet> statesets;
    if (!determinise(n, rdfa->states, state_limit, &statesets)) {
        DEBUG_PRINTF("state limit %zu exceeded\n", state_limit);
        throw StateLimitExceeded("DFA state", state_limit);
    }

    // The starts may coincide with each other, or with the dead state.
    const auto &init = n.initial();
    for (size_t i = 0; i < statesets.size(); i++) {
        if (statesets[i] == init.front()) {
            rdfa->start_nonword = (dstate_id_t)i;
        }
        if (statesets[i] == init.back()) {
            rdfa->start_word = (dstate_id_t)i;
        }
    }

    DEBUG_PRINTF("%s dfa: %zu states, starts %hu/%hu\n",
                 direction == DFA_FORWARD ? "forward" : "reverse",
                 rdfa->states.size(), rdfa->start_nonword, rdfa->start_word);
    return rdfa;
}

} // namespace dfascan
