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
#include "nfa/dfa_min.h"
#include "nfa/rdfa.h"
#include "nfagraph/ng_alphabet.h"
#include "nfagraph/ng_builder.h"
#include "nfagraph/ng_dfa.h"
#include "nfagraph/ng_nfa.h"
#include "parser/Component.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <memory>
#include <string>
#include <vector>

using namespace std;
using namespace dfascan;

namespace {

static const size_t BIG_LIMIT = MAX_DFA_STATES;

struct Built {
    RangeAlphabet alpha;
    Nfa nfa;
};

static
Built prepare(const string &re) {
    auto root = parsePattern(re);
    Built b;
    b.alpha = buildRangeAlphabet(*root);
    b.nfa = buildNfa(*root, b.alpha, Grey());
    return b;
}

static
unique_ptr<raw_dfa> forwardDfa(const string &re, size_t limit = BIG_LIMIT) {
    Built b = prepare(re);
    return buildDfa(b.nfa, b.alpha, DFA_FORWARD, MATCH_LEFTMOST_FIRST, limit);
}

static
unique_ptr<raw_dfa> reverseDfa(const string &re) {
    Built b = prepare(re);
    Nfa rev = reverseNfa(b.nfa);
    return buildDfa(rev, b.alpha, DFA_REVERSE, MATCH_ALL, BIG_LIMIT);
}

static
bool sameDfa(const raw_dfa &a, const raw_dfa &b) {
    if (a.states.size() != b.states.size() || a.alpha_size != b.alpha_size ||
        a.start_nonword != b.start_nonword || a.start_word != b.start_word) {
        return false;
    }
    for (size_t i = 0; i < a.states.size(); i++) {
        if (a.states[i].next != b.states[i].next ||
            a.states[i].accept != b.states[i].accept ||
            a.states[i].priority != b.states[i].priority) {
            return false;
        }
    }
    return true;
}

/** Runs \a rdfa over \a s the way the engine does, from offset 0, and
 * returns the offsets where a match ends. */
static
vector<size_t> matchEnds(const raw_dfa &rdfa, const string &s) {
    vector<size_t> ends;
    dstate_id_t cur = rdfa.states[rdfa.start_nonword].next[rdfa.sotClass()];
    for (size_t i = 0; i < s.size() && cur != DEAD_STATE; i++) {
        u8 c = s[i];
        u8 kind = isWordByte(c) ? ACCEPT_BEFORE_WORD : ACCEPT_BEFORE_NONWORD;
        if (rdfa.states[cur].accept & kind) {
            ends.push_back(i);
        }
        cur = rdfa.states[cur].next[rdfa.alpha_remap[c]];
    }
    if (cur != DEAD_STATE &&
        rdfa.states[rdfa.states[cur].next[rdfa.eotClass()]].accept) {
        ends.push_back(s.size());
    }
    return ends;
}

} // namespace

TEST(Determinise, DeadState) {
    auto rdfa = forwardDfa("abc");
    ASSERT_LT(1U, rdfa->states.size());
    const dstate &dead = rdfa->states[DEAD_STATE];
    EXPECT_EQ(0, dead.accept);
    for (auto n : dead.next) {
        EXPECT_EQ(DEAD_STATE, n);
    }
    EXPECT_NE(DEAD_STATE, rdfa->start_nonword);
}

TEST(Determinise, Deterministic) {
    const string re = "(foo|ba[rz])+\\b|\\d{2,4}";
    auto a = forwardDfa(re);
    auto b = forwardDfa(re);
    EXPECT_TRUE(sameDfa(*a, *b));
}

TEST(Determinise, TotalTransitions) {
    auto rdfa = forwardDfa("a[bc]*d");
    for (const auto &ds : rdfa->states) {
        ASSERT_EQ(rdfa->alpha_size, ds.next.size());
        for (auto n : ds.next) {
            ASSERT_LT(n, rdfa->states.size());
        }
    }
}

TEST(Determinise, WordStarts) {
    auto plain = forwardDfa("foo");
    EXPECT_FALSE(plain->word_sensitive);
    EXPECT_EQ(plain->start_nonword, plain->start_word);

    auto word = forwardDfa("\\bfoo");
    EXPECT_TRUE(word->word_sensitive);
    EXPECT_NE(word->start_nonword, word->start_word);
}

TEST(Determinise, SotOnlyFromStart) {
    auto rdfa = forwardDfa("^ab");
    const u16 sot = rdfa->sotClass();
    for (size_t i = 0; i < rdfa->states.size(); i++) {
        if (i != rdfa->start_nonword) {
            EXPECT_EQ(DEAD_STATE, rdfa->states[i].next[sot]) << "state " << i;
        }
    }
    EXPECT_NE(DEAD_STATE, rdfa->states[rdfa->start_nonword].next[sot]);
}

TEST(Determinise, FinalState) {
    auto rdfa = forwardDfa("a$");
    vector<size_t> ends = matchEnds(*rdfa, "aa");
    ASSERT_EQ(1U, ends.size());
    EXPECT_EQ(2U, ends[0]);

    // Everything after the final state is dead.
    dstate_id_t s = rdfa->states[rdfa->start_nonword].next[rdfa->sotClass()];
    s = rdfa->states[s].next[rdfa->alpha_remap['a']];
    dstate_id_t fin = rdfa->states[s].next[rdfa->eotClass()];
    ASSERT_NE(DEAD_STATE, fin);
    EXPECT_EQ(ACCEPT_ANY, rdfa->states[fin].accept);
    for (auto n : rdfa->states[fin].next) {
        EXPECT_EQ(DEAD_STATE, n);
    }
}

TEST(Determinise, LeftmostFirstEnds) {
    // Greedy keeps going; lazy stops at the first end.
    auto greedy = forwardDfa("ab*");
    EXPECT_EQ(vector<size_t>({1, 2, 3}), matchEnds(*greedy, "abbx"));

    auto lazy = forwardDfa("ab*?");
    EXPECT_EQ(vector<size_t>({1}), matchEnds(*lazy, "abbx"));

    // The earlier alternative wins even though the later one is longer.
    auto alt = forwardDfa("a|ab");
    EXPECT_EQ(vector<size_t>({1}), matchEnds(*alt, "ab"));
}

TEST(Determinise, WordBoundaryAccept) {
    auto rdfa = forwardDfa("a\\b");
    dstate_id_t s = rdfa->states[rdfa->start_nonword].next[rdfa->sotClass()];
    s = rdfa->states[s].next[rdfa->alpha_remap['a']];
    EXPECT_EQ(ACCEPT_BEFORE_NONWORD, rdfa->states[s].accept);

    EXPECT_EQ(vector<size_t>({1}), matchEnds(*rdfa, "a b"));
    EXPECT_EQ(vector<size_t>({2}), matchEnds(*rdfa, "ba"));
    EXPECT_TRUE(matchEnds(*rdfa, "ab").empty());
}

TEST(Determinise, ReverseAllMode) {
    auto rdfa = reverseDfa("a+b");
    EXPECT_EQ(DFA_REVERSE, rdfa->direction);

    // Walk "aab" backwards: every start of a match ending here accepts.
    string back = "baa";
    vector<size_t> ends = matchEnds(*rdfa, back);
    EXPECT_EQ(vector<size_t>({2, 3}), ends);
}

TEST(Determinise, StateLimit) {
    const string re = "[ab]*a[ab]{6}";
    EXPECT_THROW(forwardDfa(re, 8), StateLimitExceeded);

    auto rdfa = forwardDfa(re);
    EXPECT_LE(64U, rdfa->states.size());

    try {
        forwardDfa(re, 20);
        FAIL() << "limit not enforced";
    } catch (const StateLimitExceeded &e) {
        EXPECT_EQ(20U, e.limit);
        EXPECT_FALSE(e.reason.empty());
    }
}

TEST(Minimize, MergesEquivalentStates) {
    auto rdfa = forwardDfa("ab|cb");
    size_t before = rdfa->states.size();
    minimize_hopcroft(*rdfa, Grey());
    EXPECT_GT(before, rdfa->states.size());

    // Dead stays at 0 and stays dead.
    for (auto n : rdfa->states[DEAD_STATE].next) {
        EXPECT_EQ(DEAD_STATE, n);
    }
    EXPECT_EQ(vector<size_t>({2}), matchEnds(*rdfa, "ab"));
    EXPECT_EQ(vector<size_t>({3}), matchEnds(*rdfa, "xcb"));
}

TEST(Minimize, Idempotent) {
    auto rdfa = forwardDfa("(a|bc)*d\\b");
    minimize_hopcroft(*rdfa, Grey());
    raw_dfa once = *rdfa;
    minimize_hopcroft(*rdfa, Grey());
    EXPECT_TRUE(sameDfa(once, *rdfa));
}

TEST(Minimize, PreservesMatches) {
    const string re = "x(ab|a)*?y|\\d+";
    const string inputs[] = {"xy", "xaby", "xaay", "zz12", "xab", ""};
    auto raw = forwardDfa(re);
    auto min = forwardDfa(re);
    minimize_hopcroft(*min, Grey());
    for (const auto &in : inputs) {
        EXPECT_EQ(matchEnds(*raw, in), matchEnds(*min, in)) << in;
    }
}

TEST(Minimize, NoEquivalentPairSurvives) {
    const string patterns[] = {"ab|cb", "(a|bc)*d\\b", "x(ab|a)*?y|\\d+",
                               "^abc$", "[ab]*a[ab]{3}", "\\bfoo\\b|o+"};
    for (const auto &re : patterns) {
        auto fwd = forwardDfa(re);
        auto rev = reverseDfa(re);
        for (raw_dfa *rdfa : {fwd.get(), rev.get()}) {
            minimize_hopcroft(*rdfa, Grey());
            const auto &states = rdfa->states;
            for (size_t i = 0; i < states.size(); i++) {
                for (size_t j = i + 1; j < states.size(); j++) {
                    const dstate &a = states[i];
                    const dstate &b = states[j];
                    bool same = a.accept == b.accept &&
                                (!a.accept || a.priority == b.priority) &&
                                a.next == b.next;
                    EXPECT_FALSE(same) << re << ": states " << i << " and "
                                       << j << " are equivalent";
                }
            }
        }
    }
}

TEST(Minimize, Disabled) {
    Grey grey;
    grey.minimizeDFA = false;
    auto rdfa = forwardDfa("ab|cb");
    size_t before = rdfa->states.size();
    minimize_hopcroft(*rdfa, grey);
    EXPECT_EQ(before, rdfa->states.size());
}

TEST(Minimize, PruneUnreachable) {
    auto rdfa = forwardDfa("abc");
    size_t before = rdfa->states.size();

    // An orphan state with no way in.
    dstate orphan(rdfa->alpha_size);
    orphan.accept = ACCEPT_ANY;
    rdfa->states.push_back(orphan);

    prune_unreachable(*rdfa);
    EXPECT_EQ(before, rdfa->states.size());
    EXPECT_FALSE(is_dead(*rdfa));
}
