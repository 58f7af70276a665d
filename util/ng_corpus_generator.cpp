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
 * \brief Corpus Generation tool.
 */

#include "config.h"

#include "ng_corpus_generator.h"

#include "nfagraph/ng_utf8.h"
#include "parser/Component.h"
#include "parser/ComponentAlternation.h"
#include "parser/ComponentByte.h"
#include "parser/ComponentClass.h"
#include "parser/ComponentRepeat.h"
#include "parser/ComponentSequence.h"
#include "util/charreach.h"
#include "util/unicode_set.h"
#include "util/make_unique.h"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

using namespace std;
using namespace dfascan;

namespace {

/** Once a generated string is this long, unbounded repeats
 * are taken the minimum number of times. */
static const size_t MAX_CORPUS_BYTES = 4096;

class CorpusGeneratorImpl : public CorpusGenerator {
public:
    CorpusGeneratorImpl(const Component &root_in, CorpusProperties &props);
    ~CorpusGeneratorImpl() override = default;

    void generateCorpus(vector<string> &data) override;

private:
    void walk(const Component &c, string &out);
    void walkRepeat(const ComponentRepeat &c, string &out);
    void addCodePoint(const ComponentClass &c, string &out);
    void addByte(const ComponentByte &c, string &out);
    void addNoise(u32 len, string &out);

    /** \brief Emit a byte for a position that consumes input, honouring the
     * dice roll. Returns false if the caller should emit its match byte. */
    bool rollMismatch(string &out);

    const Component &root;
    CorpusProperties &cProps;
};

CorpusGeneratorImpl::CorpusGeneratorImpl(const Component &root_in,
                                         CorpusProperties &props)
    : root(root_in), cProps(props) {}

void CorpusGeneratorImpl::addNoise(u32 len, string &out) {
    for (u32 i = 0; i < len; i++) {
        out.push_back((char)cProps.randomByte());
    }
}

bool CorpusGeneratorImpl::rollMismatch(string &out) {
    switch (cProps.throwDice()) {
    case CorpusProperties::ROLLED_MATCH:
        return false;
    case CorpusProperties::ROLLED_UNMATCH:
        // Bytes that can never start a well-formed code point.
        out.push_back((char)(cProps.rand(0, 1) ? 0xff : 0x80));
        return true;
    case CorpusProperties::ROLLED_RANDOM:
        out.push_back((char)cProps.randomByte());
        return true;
    }
    return false;
}

void CorpusGeneratorImpl::addCodePoint(const ComponentClass &c, string &out) {
    if (rollMismatch(out)) {
        return;
    }

    CodePointSet cps = c.codePoints();
    cps.unsetRange(UNICODE_SURROGATE_MIN, UNICODE_SURROGATE_MAX);
    if (cps.none()) {
        throw CorpusGenerationFailure("class matches no code point");
    }

    unichar cp = cps.at(cProps.rand(0, cps.count() - 1));
    u8 buf[4];
    u32 len = encodeUtf8(cp, buf);
    out.append((const char *)buf, len);
}

void CorpusGeneratorImpl::addByte(const ComponentByte &c, string &out) {
    if (rollMismatch(out)) {
        return;
    }

    CharReach cr = c.reach();
    if (cr.none()) {
        throw CorpusGenerationFailure("byte class is empty");
    }

    size_t n = cProps.rand(0, cr.count() - 1);
    size_t i = cr.find_first();
    while (n--) {
        i = cr.find_next(i);
    }
    out.push_back((char)i);
}

void CorpusGeneratorImpl::walkRepeat(const ComponentRepeat &c, string &out) {
    u32 min, max;
    tie(min, max) = c.getBounds();

    u32 count;
    if (max == ComponentRepeat::NoLimit) {
        auto cycles = cProps.getCycleLimit();
        count = min;
        if (out.size() < MAX_CORPUS_BYTES) {
            count += cProps.rand(cycles.first, cycles.second);
        }
    } else if (min <= max) {
        count = cProps.rand(min, max);
    } else {
        throw CorpusGenerationFailure("inverted repeat bounds");
    }

    for (u32 i = 0; i < count; i++) {
        walk(c.getSub(), out);
    }
}

void CorpusGeneratorImpl::walk(const Component &c, string &out) {
    if (const auto *seq = dynamic_cast<const ComponentSequence *>(&c)) {
        for (const auto &sub : seq->getChildren()) {
            walk(*sub, out);
        }
    } else if (const auto *alt =
                   dynamic_cast<const ComponentAlternation *>(&c)) {
        const auto &kids = alt->getChildren();
        if (!kids.empty()) {
            walk(*kids[cProps.rand(0, kids.size() - 1)], out);
        }
    } else if (const auto *rep = dynamic_cast<const ComponentRepeat *>(&c)) {
        walkRepeat(*rep, out);
    } else if (const auto *cls = dynamic_cast<const ComponentClass *>(&c)) {
        addCodePoint(*cls, out);
    } else if (const auto *byte = dynamic_cast<const ComponentByte *>(&c)) {
        addByte(*byte, out);
    }
    // Anchors, word boundaries and empty nodes consume nothing.
}

void CorpusGeneratorImpl::generateCorpus(vector<string> &data) {
    set<string> seen;
    // Give up after a fixed number of duplicate draws; small patterns may
    // not have corpusLimit distinct strings.
    u32 attempts = cProps.corpusLimit * 4 + 16;

    while (seen.size() < cProps.corpusLimit && attempts--) {
        string s;
        addNoise(cProps.rand(cProps.prefixRange.min, cProps.prefixRange.max),
                 s);
        walk(root, s);
        addNoise(cProps.rand(cProps.suffixRange.min, cProps.suffixRange.max),
                 s);
        if (seen.insert(s).second) {
            data.push_back(move(s));
        }
    }
}

} // namespace

CorpusGenerator::~CorpusGenerator() { }

unique_ptr<CorpusGenerator> makeCorpusGenerator(const Component &root,
                                                CorpusProperties &props) {
    return dfascan::make_unique<CorpusGeneratorImpl>(root, props);
}
