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
 * \brief Range alphabet: code point partition, UTF-8 projection and byte
 * equivalence classes for one pattern.
 */
#include "ng_alphabet.h"

#include "parser/ComponentByte.h"
#include "parser/ComponentClass.h"
#include "parser/ComponentRepeat.h"
#include "parser/ComponentWordBoundary.h"
#include "parser/ConstComponentVisitor.h"
#include "util/compile_error.h"
#include "util/container.h"

#include <algorithm>
#include <sstream>
#include <tuple>
#include <vector>

using namespace std;

namespace dfascan {

namespace {

/** \brief Collects the code point sets, byte sets and word boundaries used by
 * a pattern. */
class AlphabetVisitor : public DefaultConstComponentVisitor {
public:
    ~AlphabetVisitor() override;
    using DefaultConstComponentVisitor::pre;

    void pre(const ComponentClass &c) override {
        class_sets.push_back(c.codePoints());
    }

    void pre(const ComponentByte &c) override {
        byte_sets.push_back(c.reach());
    }

    void pre(const ComponentRepeat &c) override {
        u32 min, max;
        tie(min, max) = c.getBounds();
        if (max != ComponentRepeat::NoLimit && min > max) {
            ostringstream oss;
            oss << "Invalid repeat bounds {" << min << "," << max << "}.";
            throw InvalidRangeBoundary(c.getLoc(), oss.str());
        }
    }

    void pre(const ComponentWordBoundary &) override {
        has_word_boundary = true;
    }

    vector<CodePointSet> class_sets;
    vector<CharReach> byte_sets;
    bool has_word_boundary = false;
};

AlphabetVisitor::~AlphabetVisitor() {}

} // namespace

u32 RangeAlphabet::classOf(unichar c) const {
    assert(!starts.empty());
    assert(c <= MAX_UNICODE);
    auto it = upper_bound(starts.begin(), starts.end(), c);
    assert(it != starts.begin());
    return (u32)(distance(starts.begin(), it) - 1);
}

void RangeAlphabet::classesIn(const CodePointSet &cps,
                              vector<u32> *out) const {
    for (const auto &ival : cps) {
        unichar lo = boost::icl::lower(ival);
        unichar hi = boost::icl::upper(ival);
        u32 i = classOf(lo);
        assert(classLo(i) == lo);
        for (; i < starts.size() && starts[i] <= hi; i++) {
            assert(classHi(i) <= hi);
            out->push_back(i);
        }
    }
}

u16 buildAlphabetFromEquivSets(const vector<CharReach> &esets,
                               array<u16, ALPHABET_SIZE> &alpha,
                               array<u16, ALPHABET_SIZE> &unalpha) {
    u16 i = 0;
    for (; i < esets.size(); i++) {
        const CharReach &cr = esets[i];

#ifdef DEBUG
        DEBUG_PRINTF("eq set: ");
        for (size_t s = cr.find_first(); s != CharReach::npos;
             s = cr.find_next(s)) {
            printf("%02hhx ", (u8)s);
        }
        printf("-> %u\n", i);
#endif
        u16 leader = cr.find_first();
        for (size_t s = cr.find_first(); s != CharReach::npos;
             s = cr.find_next(s)) {
            alpha[s] = i;
        }
        unalpha[i] = leader;
    }

    for (u16 j = N_CHARS; j < ALPHABET_SIZE; j++, i++) {
        alpha[j] = i;
        unalpha[i] = j;
    }

    return i; // alphabet size
}

/** \brief Splits every equivalence set that \a cr only partly covers. */
static
void refine(vector<CharReach> &esets, const CharReach &cr) {
    const size_t n = esets.size();
    for (size_t i = 0; i < n; i++) {
        if (esets[i].count() == 1) {
            continue;
        }

        CharReach t = cr & esets[i];
        if (t.any() && t != esets[i]) {
            esets[i] &= ~t;
            esets.push_back(t);
        }
    }
}

RangeAlphabet buildRangeAlphabet(const Component &root) {
    AlphabetVisitor vis;
    root.accept(vis);

    RangeAlphabet ra;

    /* Cut the code point space at the bounds of every class node's set. */
    vector<unichar> cuts(1, 0);
    for (const auto &cps : vis.class_sets) {
        for (const auto &ival : cps) {
            cuts.push_back(boost::icl::lower(ival));
            unichar hi = boost::icl::upper(ival);
            if (hi < MAX_UNICODE) {
                cuts.push_back(hi + 1);
            }
        }
    }
    sort_and_unique(cuts);
    ra.starts = move(cuts);
    ra.utf8.resize(ra.starts.size());

    /* Only classes that some class node uses end up as NFA edges, so only
     * they take part in the byte partition. */
    vector<bool> used(ra.starts.size(), false);
    vector<u32> members;
    for (const auto &cps : vis.class_sets) {
        members.clear();
        ra.classesIn(cps, &members);
        for (u32 i : members) {
            used[i] = true;
        }
    }

    vector<CharReach> esets(1, CharReach::dot());

    for (u32 i = 0; i < ra.starts.size(); i++) {
        utf8Sequences(ra.classLo(i), ra.classHi(i), &ra.utf8[i]);
        if (!used[i]) {
            continue;
        }
        for (const auto &seq : ra.utf8[i]) {
            for (const auto &r : seq) {
                refine(esets, CharReach(r.lo, r.hi));
            }
        }
    }

    for (const auto &cr : vis.byte_sets) {
        refine(esets, cr);
    }

    if (vis.has_word_boundary) {
        refine(esets, wordBytes());
        ra.word_sensitive = true;
    }

    // for deterministic compiles
    sort(esets.begin(), esets.end());

    ra.alpha.fill(0);
    ra.unalpha.fill(0);
    ra.alpha_size = buildAlphabetFromEquivSets(esets, ra.alpha, ra.unalpha);

    DEBUG_PRINTF("%zu code point classes, %hu byte classes\n",
                 ra.classCount(), ra.alpha_size);
    return ra;
}

} // namespace dfascan
