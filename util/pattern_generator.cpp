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
 * \brief Random pattern text for differential testing.
 */

#include "config.h"

#include "pattern_generator.h"
#include "ng_corpus_properties.h"

#include <utility>

using namespace std;

namespace {

struct Fragment {
    Fragment(string text_in, bool nullable_in)
        : text(move(text_in)), nullable(nullable_in) {}
    string text;
    bool nullable; //!< can match without consuming a byte
};

static const char *const consumingAtoms[] = {
    "a", "b", "c", "ab", "\xc3\xa9", "\xe2\x82\xac", "\xf0\x9f\x98\x80",
    "[a-c]", "[^a]", "\\w", "\\d", ".", "\\C", "\\xff", " ",
};

static const char *const emptyAtoms[] = {
    "^", "$", "\\b", "\\B",
};

class PatternGenerator {
public:
    explicit PatternGenerator(CorpusProperties &p) : props(p) {}

    Fragment alternation(unsigned depth);

private:
    Fragment sequence(unsigned depth);
    Fragment atom(unsigned depth);
    Fragment quantify(Fragment f);

    template<size_t N>
    const char *pick(const char *const (&arr)[N]) {
        return arr[props.rand(0, N - 1)];
    }

    CorpusProperties &props;
};

Fragment PatternGenerator::atom(unsigned depth) {
    unsigned roll = props.rand(0, 9);
    if (roll == 0) {
        return Fragment(pick(emptyAtoms), true);
    }
    if (roll == 1 && depth) {
        Fragment inner = alternation(depth - 1);
        const char *open = props.rand(0, 1) ? "(" : "(?:";
        return Fragment(open + inner.text + ")", inner.nullable);
    }
    return Fragment(pick(consumingAtoms), false);
}

Fragment PatternGenerator::quantify(Fragment f) {
    if (f.nullable || props.rand(0, 2)) {
        return f;
    }

    static const char *const quants[] = {
        "*", "+", "?", "{2}", "{0,2}", "{1,3}", "{2,}",
    };
    const char *q = pick(quants);
    bool nullable = q[0] == '*' || q[0] == '?' ||
                    (q[0] == '{' && q[1] == '0');
    string text = f.text + q;
    if (props.rand(0, 3) == 0) {
        text += "?"; // lazy
    }
    return Fragment(move(text), nullable);
}

Fragment PatternGenerator::sequence(unsigned depth) {
    unsigned len = props.rand(1, 4);
    string text;
    bool nullable = true;
    for (unsigned i = 0; i < len; i++) {
        Fragment f = quantify(atom(depth));
        text += f.text;
        nullable = nullable && f.nullable;
    }
    return Fragment(move(text), nullable);
}

Fragment PatternGenerator::alternation(unsigned depth) {
    Fragment rv = sequence(depth);
    while (props.rand(0, 3) == 0) {
        Fragment f = sequence(depth);
        rv.text += "|" + f.text;
        rv.nullable = rv.nullable || f.nullable;
    }
    return rv;
}

} // namespace

string generatePattern(CorpusProperties &props, unsigned depth) {
    PatternGenerator gen(props);
    return gen.alternation(depth).text;
}
