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
 * \brief NFA builder: Thompson construction from a parsed syntax tree.
 *
 * Each node becomes a fragment with one entry and one exit state; the exit has
 * no out-edges until the enclosing node wires it up. Alternatives and repeats
 * are split states whose edge order encodes preference.
 */

#include "ng_builder.h"

#include "grey.h"
#include "ng_alphabet.h"
#include "parser/ComponentAlternation.h"
#include "parser/ComponentAssertion.h"
#include "parser/ComponentBackReference.h"
#include "parser/ComponentBoundary.h"
#include "parser/ComponentByte.h"
#include "parser/ComponentClass.h"
#include "parser/ComponentEmpty.h"
#include "parser/ComponentRepeat.h"
#include "parser/ComponentSequence.h"
#include "parser/ComponentWordBoundary.h"
#include "parser/ConstComponentVisitor.h"
#include "util/charreach.h"
#include "util/compile_error.h"
#include "util/make_unique.h"

#include <map>
#include <tuple>
#include <vector>

using namespace std;

namespace dfascan {

namespace {

/** Concrete implementation of NFABuilder interface. */
class NFABuilderImpl : public NFABuilder {
public:
    explicit NFABuilderImpl(const Grey &grey);
    ~NFABuilderImpl() override;

    u32 makeState() override;
    void addEpsilon(u32 from, u32 to) override;
    void addCharReach(u32 from, const CharReach &cr, u32 to) override;
    void addByteRange(u32 from, u8 lo, u8 hi, u32 to) override;
    void addLook(u32 from, LookKind k, u32 to) override;

    u32 numStates() const override { return nfa.size(); }

    Nfa getNfa(u32 start, u32 end) override;

private:
    /** \brief Greybox: used for resource limits. */
    const Grey &grey;

    /** \brief Underlying NFA. */
    Nfa nfa;
}; // class NFABuilderImpl

} // namespace

NFABuilderImpl::NFABuilderImpl(const Grey &grey_in) : grey(grey_in) {}

NFABuilderImpl::~NFABuilderImpl() {
    // empty
}

u32 NFABuilderImpl::makeState() {
    if (nfa.size() >= grey.limitNFAStates) {
        DEBUG_PRINTF("nfa has %zu states, limit is %u\n", nfa.size(),
                     grey.limitNFAStates);
        throw StateLimitExceeded("NFA state", grey.limitNFAStates);
    }
    return nfa.addState();
}

void NFABuilderImpl::addEpsilon(u32 from, u32 to) {
    nfa.addEpsilon(from, to);
}

void NFABuilderImpl::addCharReach(u32 from, const CharReach &cr, u32 to) {
    size_t i = cr.find_first();
    while (i != CharReach::npos) {
        size_t j = i;
        while (j + 1 < N_CHARS && cr.test(j + 1)) {
            j++;
        }
        nfa.addBytes(from, (u8)i, (u8)j, to);
        i = cr.find_next(j);
    }
}

void NFABuilderImpl::addByteRange(u32 from, u8 lo, u8 hi, u32 to) {
    nfa.addBytes(from, lo, hi, to);
}

void NFABuilderImpl::addLook(u32 from, LookKind k, u32 to) {
    nfa.addLook(from, k, to);
}

Nfa NFABuilderImpl::getNfa(u32 start, u32 end) {
    u32 accept = makeState();
    nfa.addEpsilon(end, accept);
    nfa.setAccept(accept, 0);
    nfa.start_anchored = start;

    // Unanchored search: prefer starting here over skipping another byte.
    u32 floating = makeState();
    u32 skip = makeState();
    nfa.addEpsilon(floating, start);
    nfa.addEpsilon(floating, skip);
    nfa.addBytes(skip, 0, 0xff, floating);
    nfa.start_floating = floating;

    DEBUG_PRINTF("built nfa: %zu states, look flags 0x%x\n", nfa.size(),
                 nfa.lookFlags());
    return move(nfa);
}

NFABuilder::~NFABuilder() {
    // empty
}

unique_ptr<NFABuilder> makeNFABuilder(const Grey &grey) {
    return make_unique<NFABuilderImpl>(grey);
}

namespace {

struct Fragment {
    Fragment(u32 s, u32 e) : start(s), end(e) {}
    u32 start;
    u32 end;
};

/**
 * \brief Post-order walk of the tree, keeping a stack of built fragments.
 *
 * Every subtree walk pushes exactly one fragment, so a repeat can build more
 * copies of its operand by walking it again.
 */
class ThompsonVisitor : public DefaultConstComponentVisitor {
public:
    ThompsonVisitor(NFABuilder &b, const RangeAlphabet &a)
        : builder(b), alpha(a) {}
    ~ThompsonVisitor() override;

    using DefaultConstComponentVisitor::pre;
    using DefaultConstComponentVisitor::post;

    void pre(const ComponentAssertion &c) override {
        throw UnsupportedConstruct("Look-around assertion", c.getLoc());
    }

    void pre(const ComponentBackReference &c) override {
        throw UnsupportedConstruct("Back-reference", c.getLoc());
    }

    void post(const ComponentEmpty &) override {
        u32 s = builder.makeState();
        push(s, s);
    }

    void post(const ComponentByte &c) override {
        u32 s = builder.makeState();
        u32 e = builder.makeState();
        builder.addCharReach(s, c.reach(), e);
        push(s, e);
    }

    void post(const ComponentClass &c) override;

    void post(const ComponentBoundary &c) override {
        u32 s = builder.makeState();
        u32 e = builder.makeState();
        builder.addLook(s, c.getBound() == ComponentBoundary::BEGIN_STRING
                               ? LOOK_START_TEXT
                               : LOOK_END_TEXT,
                        e);
        push(s, e);
    }

    void post(const ComponentWordBoundary &c) override {
        u32 s = builder.makeState();
        u32 e = builder.makeState();
        builder.addLook(s, c.isNegated() ? LOOK_NOT_WORD_BOUNDARY
                                         : LOOK_WORD_BOUNDARY,
                        e);
        push(s, e);
    }

    void post(const ComponentSequence &c) override;
    void post(const ComponentAlternation &c) override;
    void post(const ComponentRepeat &c) override;

    Fragment result() {
        assert(frags.size() == 1);
        return pop();
    }

private:
    void push(u32 s, u32 e) { frags.push_back(Fragment(s, e)); }

    Fragment pop() {
        assert(!frags.empty());
        Fragment f = frags.back();
        frags.pop_back();
        return f;
    }

    /** \brief Pops the last \a n fragments, oldest first. */
    vector<Fragment> popN(size_t n) {
        assert(frags.size() >= n);
        vector<Fragment> out(frags.end() - n, frags.end());
        frags.erase(frags.end() - n, frags.end());
        return out;
    }

    NFABuilder &builder;
    const RangeAlphabet &alpha;
    vector<Fragment> frags;
};

ThompsonVisitor::~ThompsonVisitor() {}

void ThompsonVisitor::post(const ComponentClass &c) {
    u32 s = builder.makeState();
    u32 e = builder.makeState();

    vector<u32> classes;
    alpha.classesIn(c.codePoints(), &classes);

    // Byte-range trie: sequences sharing a leading range share the state
    // after it.
    map<tuple<u32, u8, u8>, u32> trie;
    for (u32 i : classes) {
        for (const auto &seq : alpha.sequences(i)) {
            u32 cur = s;
            for (size_t j = 0; j + 1 < seq.size(); j++) {
                auto key = make_tuple(cur, seq[j].lo, seq[j].hi);
                auto it = trie.find(key);
                if (it == trie.end()) {
                    u32 next = builder.makeState();
                    builder.addByteRange(cur, seq[j].lo, seq[j].hi, next);
                    it = trie.emplace(key, next).first;
                }
                cur = it->second;
            }
            builder.addByteRange(cur, seq.back().lo, seq.back().hi, e);
        }
    }
    DEBUG_PRINTF("class of %zu alphabet classes -> %zu interior states\n",
                 classes.size(), trie.size());
    push(s, e);
}

void ThompsonVisitor::post(const ComponentSequence &c) {
    const size_t n = c.getChildren().size();
    if (!n) {
        u32 s = builder.makeState();
        push(s, s);
        return;
    }
    vector<Fragment> parts = popN(n);
    for (size_t i = 0; i + 1 < n; i++) {
        builder.addEpsilon(parts[i].end, parts[i + 1].start);
    }
    push(parts.front().start, parts.back().end);
}

void ThompsonVisitor::post(const ComponentAlternation &c) {
    const size_t n = c.getChildren().size();
    vector<Fragment> parts = popN(n);
    u32 s = builder.makeState();
    u32 e = builder.makeState();
    for (const auto &f : parts) {
        builder.addEpsilon(s, f.start);
        builder.addEpsilon(f.end, e);
    }
    push(s, e);
}

void ThompsonVisitor::post(const ComponentRepeat &c) {
    u32 min, max;
    tie(min, max) = c.getBounds();
    const bool greedy = c.type == ComponentRepeat::REPEAT_GREEDY;
    DEBUG_PRINTF("repeat {%u,%u} %s\n", min, max,
                 greedy ? "greedy" : "lazy");

    // The operand has been walked once already; further copies come from
    // walking it again.
    Fragment first = pop();
    bool first_used = false;
    auto copy = [&]() -> Fragment {
        if (!first_used) {
            first_used = true;
            return first;
        }
        c.getSub().accept(*this);
        return pop();
    };

    // Adds the two ways out of a split state, preferred one first.
    auto split = [&](u32 from, u32 take, u32 skip) {
        if (greedy) {
            builder.addEpsilon(from, take);
            builder.addEpsilon(from, skip);
        } else {
            builder.addEpsilon(from, skip);
            builder.addEpsilon(from, take);
        }
    };

    u32 s = builder.makeState();
    u32 cur = s;

    if (max == ComponentRepeat::NoLimit) {
        if (min == 0) {
            Fragment f = copy();
            u32 out = builder.makeState();
            split(cur, f.start, out);
            builder.addEpsilon(f.end, cur);
            cur = out;
        } else {
            for (u32 i = 0; i + 1 < min; i++) {
                Fragment f = copy();
                builder.addEpsilon(cur, f.start);
                cur = f.end;
            }
            Fragment f = copy();
            u32 out = builder.makeState();
            builder.addEpsilon(cur, f.start);
            split(f.end, f.start, out);
            cur = out;
        }
    } else {
        assert(min <= max);
        for (u32 i = 0; i < min; i++) {
            Fragment f = copy();
            builder.addEpsilon(cur, f.start);
            cur = f.end;
        }
        if (max > min) {
            u32 out = builder.makeState();
            for (u32 i = min; i < max; i++) {
                Fragment f = copy();
                split(cur, f.start, out);
                cur = f.end;
            }
            builder.addEpsilon(cur, out);
            cur = out;
        }
    }

    push(s, cur);
}

} // namespace

Nfa buildNfa(const Component &root, const RangeAlphabet &alpha,
             const Grey &grey) {
    auto builder = makeNFABuilder(grey);
    ThompsonVisitor vis(*builder, alpha);
    root.accept(vis);
    Fragment f = vis.result();
    return builder->getNfa(f.start, f.end);
}

} // namespace dfascan
