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
 * \brief Dump code for raw and compiled DFAs.
 */

#include "config.h"

#include "dfa_dump.h"

#include "dfa_internal.h"
#include "rdfa.h"
#include "grey.h"
#include "util/charreach.h"
#include "util/dump_charclass.h"
#include "util/dump_util.h"

#include <map>
#include <string>
#include <vector>

#ifndef DUMP_SUPPORT
#error No dump support!
#endif

using namespace std;

namespace dfascan {

static
const char *acceptName(u8 accept) {
    switch (accept) {
    case 0:
        return "";
    case ACCEPT_BEFORE_WORD:
        return " ACCEPT(w)";
    case ACCEPT_BEFORE_NONWORD:
        return " ACCEPT(W)";
    default:
        return " ACCEPT";
    }
}

/** Writes one dot edge per distinct live successor, labelled with the bytes
 * leading there. \a next holds a successor per byte, then SOT, then EOT. */
static
void describeEdges(FILE *f, u32 from, const vector<u32> &next) {
    map<u32, CharReach> by_target;
    for (u32 c = 0; c < N_CHARS; c++) {
        if (next[c]) {
            by_target[next[c]].set(c);
        }
    }
    for (const auto &m : by_target) {
        fprintf(f, "%u -> %u [ label = \"", from, m.first);
        describeClass(f, m.second, 5, CC_OUT_DOT);
        fprintf(f, "\" ];\n");
    }
    if (next[N_CHARS]) {
        fprintf(f, "%u -> %u [ label = \"SOT\", color = blue ];\n", from,
                next[N_CHARS]);
    }
    if (next[N_CHARS + 1]) {
        fprintf(f, "%u -> %u [ label = \"EOT\", color = darkorchid ];\n",
                from, next[N_CHARS + 1]);
    }
}

static
vector<u32> rawSuccessors(const raw_dfa &rdfa, u32 s) {
    vector<u32> next(N_CHARS + 2);
    for (u32 c = 0; c < N_CHARS; c++) {
        next[c] = rdfa.states[s].next[rdfa.alpha_remap[c]];
    }
    next[N_CHARS] = rdfa.states[s].next[rdfa.sotClass()];
    next[N_CHARS + 1] = rdfa.states[s].next[rdfa.eotClass()];
    return next;
}

void dumpRawDfaImpl(const raw_dfa &rdfa, const char *name, const Grey &grey) {
    if (!(grey.dumpFlags & Grey::DUMP_IMPL)) {
        return;
    }

    const string base = grey.dumpPath + name;
    {
        StdioFile f(base + ".txt", "w");
        fprintf(f, "%s raw dfa: %zu states, alpha size %hu, starts %hu/%hu\n",
                rdfa.direction == DFA_FORWARD ? "forward" : "reverse",
                rdfa.states.size(), rdfa.alpha_size, rdfa.start_nonword,
                rdfa.start_word);
        for (u32 i = 0; i < rdfa.states.size(); i++) {
            const dstate &ds = rdfa.states[i];
            fprintf(f, "%u%s:", i, acceptName(ds.accept));
            for (auto n : ds.next) {
                fprintf(f, " %hu", n);
            }
            fprintf(f, "\n");
        }
    }
    {
        StdioFile f(base + ".dot", "w");
        fprintf(f, "digraph G {\nrankdir=LR;\n");
        fprintf(f, "START -> %hu [color = blue]\n", rdfa.start_nonword);
        if (rdfa.start_word != rdfa.start_nonword) {
            fprintf(f, "STARTW -> %hu [color = red]\n", rdfa.start_word);
        }
        for (u32 i = 1; i < rdfa.states.size(); i++) {
            fprintf(f, "%u [ label = \"%u\"%s ];\n", i, i,
                    rdfa.states[i].accept ? ", shape = doublecircle" : "");
            describeEdges(f, i, rawSuccessors(rdfa, i));
        }
        fprintf(f, "}\n");
    }
}

static
u32 tableEntry(const dfa *d, u32 s, u32 cls) {
    size_t idx = ((size_t)s << d->alphaShift) + cls;
    if (d->width == 1) {
        return ((const u8 *)getDfaTable(d))[idx];
    }
    return ((const u16 *)getDfaTable(d))[idx];
}

static
vector<u32> successors(const dfa *d, u32 s) {
    vector<u32> next(N_CHARS + 2);
    for (u32 c = 0; c < N_CHARS; c++) {
        next[c] = tableEntry(d, s, d->remap[c]);
    }
    next[N_CHARS] = tableEntry(d, s, d->sot);
    next[N_CHARS + 1] = tableEntry(d, s, d->eot);
    return next;
}

void dfaDumpText(const dfa *d, FILE *f) {
    const dfa_state_aux *aux = getDfaAux(d);

    fprintf(f, "%s dfa\n", d->direction == DFA_FORWARD ? "forward"
                                                       : "reverse");
    fprintf(f, "length %u, states %hu, alpha size %hu (shift %hhu), "
            "%hhu-byte entries\n", d->length, d->state_count, d->alpha_size,
            d->alphaShift, d->width);
    fprintf(f, "start nonword %hu, start word %hu, sot %hu, eot %hu%s\n",
            d->start_nonword, d->start_word, d->sot, d->eot,
            d->flags & DFA_FLAG_WORD_SENSITIVE ? ", word sensitive" : "");
    fprintf(f, "remap:");
    for (u32 c = 0; c < N_CHARS; c++) {
        fprintf(f, "%s%hhu", c % 32 ? " " : "\n  ", d->remap[c]);
    }
    fprintf(f, "\n");

    for (u32 i = 0; i < d->state_count; i++) {
        fprintf(f, "%u%s:", i, acceptName(aux[i].accept));
        for (u32 cls = 0; cls < d->alpha_size; cls++) {
            fprintf(f, " %u", tableEntry(d, i, cls));
        }
        fprintf(f, "\n");
    }
}

void dfaDumpDot(const dfa *d, FILE *f) {
    const dfa_state_aux *aux = getDfaAux(d);

    fprintf(f, "digraph G {\nrankdir=LR;\n");
    fprintf(f, "START -> %hu [color = blue]\n", d->start_nonword);
    if (d->start_word != d->start_nonword) {
        fprintf(f, "STARTW -> %hu [color = red]\n", d->start_word);
    }
    for (u32 i = 1; i < d->state_count; i++) {
        fprintf(f, "%u [ width = 1, fixedsize = true, fontsize = 12, "
                "label = \"%u\" ];\n", i, i);
        if (aux[i].accept) {
            fprintf(f, "%u [ shape = doublecircle ];\n", i);
        }
        describeEdges(f, i, successors(d, i));
    }
    fprintf(f, "}\n");
}

} // namespace dfascan
