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
 * \brief Pattern matching based on direct backtracking over the syntax tree.
 */

#include "ng_find_matches.h"

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
#include "util/unicode_def.h"
#include "util/unicode_set.h"

#include <functional>
#include <memory>
#include <vector>

using namespace std;
using namespace dfascan;

#define MAX_STEPS 2000000

namespace {

struct RNode {
    enum Kind { CLASS, BYTE, SEQ, ALT, REPEAT, BEGIN, END, WORDB, NOT_WORDB,
                EMPTY };

    explicit RNode(Kind k) : kind(k) {}

    Kind kind;
    CodePointSet cps;
    CharReach cr;
    vector<unique_ptr<RNode>> kids;
    u32 min = 0;
    u32 max = 0;
    bool greedy = true;
};

/** Converts a Component tree into RNodes, post-order with a stack. */
class TreeBuilder : public DefaultConstComponentVisitor {
public:
    ~TreeBuilder() override;
    using DefaultConstComponentVisitor::pre;
    using DefaultConstComponentVisitor::post;

    void pre(const ComponentAssertion &c) override {
        throw UnsupportedConstruct("Look-around assertion", c.getLoc());
    }
    void pre(const ComponentBackReference &c) override {
        throw UnsupportedConstruct("Back-reference", c.getLoc());
    }

    void post(const ComponentClass &c) override {
        auto n = make_unique<RNode>(RNode::CLASS);
        n->cps = c.codePoints();
        out.push_back(move(n));
    }
    void post(const ComponentByte &c) override {
        auto n = make_unique<RNode>(RNode::BYTE);
        n->cr = c.reach();
        out.push_back(move(n));
    }
    void post(const ComponentEmpty &) override {
        out.push_back(make_unique<RNode>(RNode::EMPTY));
    }
    void post(const ComponentBoundary &c) override {
        out.push_back(make_unique<RNode>(
            c.getBound() == ComponentBoundary::BEGIN_STRING ? RNode::BEGIN
                                                            : RNode::END));
    }
    void post(const ComponentWordBoundary &c) override {
        out.push_back(make_unique<RNode>(c.isNegated() ? RNode::NOT_WORDB
                                                       : RNode::WORDB));
    }
    void post(const ComponentSequence &c) override {
        gather(RNode::SEQ, c.getChildren().size());
    }
    void post(const ComponentAlternation &c) override {
        gather(RNode::ALT, c.getChildren().size());
    }
    void post(const ComponentRepeat &c) override {
        gather(RNode::REPEAT, 1);
        RNode &n = *out.back();
        n.min = c.getBounds().first;
        n.max = c.getBounds().second;
        n.greedy = c.type == ComponentRepeat::REPEAT_GREEDY;
    }

    vector<unique_ptr<RNode>> out;

private:
    void gather(RNode::Kind k, size_t count) {
        auto n = make_unique<RNode>(k);
        for (size_t i = out.size() - count; i < out.size(); i++) {
            n->kids.push_back(move(out[i]));
        }
        out.resize(out.size() - count);
        out.push_back(move(n));
    }
};

TreeBuilder::~TreeBuilder() {}

unique_ptr<RNode> convert(const Component &root) {
    TreeBuilder tb;
    root.accept(tb);
    assert(tb.out.size() == 1);
    return move(tb.out.back());
}

/** Decodes one shortest-form UTF-8 scalar value at \a i. */
bool decodeUtf8(const string &s, size_t i, unichar *cp, size_t *len) {
    u8 lead = s[i];
    size_t n;
    unichar v, min;
    if (lead < 0x80) {
        *cp = lead;
        *len = 1;
        return true;
    } else if ((lead & 0xe0) == UTF_TWO_BYTE_HEADER) {
        n = 2;
        v = lead & 0x1f;
        min = UTF_2CHAR_MIN;
    } else if ((lead & 0xf0) == UTF_THREE_BYTE_HEADER) {
        n = 3;
        v = lead & 0x0f;
        min = UTF_3CHAR_MIN;
    } else if ((lead & 0xf8) == UTF_FOUR_BYTE_HEADER) {
        n = 4;
        v = lead & 0x07;
        min = UTF_4CHAR_MIN;
    } else {
        return false;
    }
    if (i + n > s.size()) {
        return false;
    }
    for (size_t j = 1; j < n; j++) {
        u8 b = s[i + j];
        if ((b & 0xc0) != UTF_CONT_BYTE_HEADER) {
            return false;
        }
        v = (v << UTF_CONT_SHIFT) | (b & UTF_CONT_BYTE_VALUE_MASK);
    }
    if (v < min || v > MAX_UNICODE ||
        (v >= UNICODE_SURROGATE_MIN && v <= UNICODE_SURROGATE_MAX)) {
        return false;
    }
    *cp = v;
    *len = n;
    return true;
}

struct OutOfBudget {};

typedef function<bool(size_t)> Cont;

class Backtracker {
public:
    Backtracker(const RNode &root_in, const string &input_in)
        : root(root_in), input(input_in) {}

    /** Calls \a k with each end reachable from \a i, in preference order,
     * until it returns true. */
    bool run(size_t i, const Cont &k) { return match(root, i, k); }

private:
    bool isWordAt(size_t i) const {
        return i < input.size() && isWordByte(input[i]);
    }

    bool match(const RNode &n, size_t i, const Cont &k);
    bool matchSeq(const RNode &n, size_t idx, size_t i, const Cont &k);
    bool matchRepeat(const RNode &n, u32 count, size_t i, bool last_empty,
                     const Cont &k);

    const RNode &root;
    const string &input;
    size_t steps = 0;
};

bool Backtracker::match(const RNode &n, size_t i, const Cont &k) {
    if (++steps > MAX_STEPS) {
        throw OutOfBudget();
    }

    switch (n.kind) {
    case RNode::CLASS: {
        unichar cp;
        size_t len;
        if (i < input.size() && decodeUtf8(input, i, &cp, &len) &&
            n.cps.test(cp)) {
            return k(i + len);
        }
        return false;
    }
    case RNode::BYTE:
        return i < input.size() && n.cr.test(input[i]) && k(i + 1);
    case RNode::SEQ:
        return matchSeq(n, 0, i, k);
    case RNode::ALT:
        for (const auto &kid : n.kids) {
            if (match(*kid, i, k)) {
                return true;
            }
        }
        return false;
    case RNode::REPEAT:
        return matchRepeat(n, 0, i, false, k);
    case RNode::BEGIN:
        return i == 0 && k(i);
    case RNode::END:
        return i == input.size() && k(i);
    case RNode::WORDB:
        return (i && isWordAt(i - 1)) != isWordAt(i) && k(i);
    case RNode::NOT_WORDB:
        return (i && isWordAt(i - 1)) == isWordAt(i) && k(i);
    case RNode::EMPTY:
        return k(i);
    }
    return false;
}

bool Backtracker::matchSeq(const RNode &n, size_t idx, size_t i,
                           const Cont &k) {
    if (idx == n.kids.size()) {
        return k(i);
    }
    return match(*n.kids[idx], i,
                 [&](size_t j) { return matchSeq(n, idx + 1, j, k); });
}

/*
 * Iteration rules follow the automaton: bounded copies are distinct, so an
 * empty iteration is just another iteration. An unbounded repeat loops on its
 * last copy and can never re-enter it at an offset where that copy already
 * began: an empty pass through the loop dies, and once the first pass was
 * empty the repeat can only exit.
 */
bool Backtracker::matchRepeat(const RNode &n, u32 count, size_t i,
                              bool last_empty, const Cont &k) {
    const RNode &sub = *n.kids.front();
    if (count < n.min) {
        return match(sub, i, [&](size_t j) {
            return matchRepeat(n, count + 1, j, j == i, k);
        });
    }

    const bool bounded = n.max != ComponentRepeat::NoLimit;
    if (bounded && count >= n.max) {
        return k(i);
    }
    if (!bounded && count && last_empty) {
        return k(i);
    }

    auto more = [&]() {
        return match(sub, i, [&](size_t j) {
            return (bounded || j != i) &&
                   matchRepeat(n, count + 1, j, j == i, k);
        });
    };
    if (n.greedy) {
        return more() || k(i);
    }
    return k(i) || more();
}

} // namespace

bool findMatches(const Component &root, const string &input,
                 set<pair<size_t, size_t>> &matches) {
    auto tree = convert(root);
    Backtracker bt(*tree, input);
    try {
        for (size_t s = 0; s <= input.size(); s++) {
            bt.run(s, [&](size_t e) {
                matches.emplace(s, e);
                return false;
            });
        }
    } catch (const OutOfBudget &) {
        return false;
    }
    return true;
}

bool findLeftmostFirst(const Component &root, const string &input,
                       size_t start, bool *found,
                       pair<size_t, size_t> *match) {
    auto tree = convert(root);
    Backtracker bt(*tree, input);
    *found = false;
    try {
        for (size_t s = start; s <= input.size() && !*found; s++) {
            bt.run(s, [&](size_t e) {
                *found = true;
                *match = make_pair(s, e);
                return true;
            });
        }
    } catch (const OutOfBudget &) {
        return false;
    }
    return true;
}
