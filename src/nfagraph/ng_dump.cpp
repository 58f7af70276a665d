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
 * \brief Dump code for Thompson NFAs.
 */

#include "config.h"

#include "ng_dump.h"

#include "ng_nfa.h"
#include "util/charreach.h"
#include "util/dump_charclass.h"
#include "util/dump_util.h"

#include <string>

#ifndef DUMP_SUPPORT
#error No dump support!
#endif

using namespace std;

namespace dfascan {

static
void dumpNfaText(const Nfa &nfa, FILE *f) {
    fprintf(f, "nfa: %zu states, anchored start %u, floating start %u\n",
            nfa.size(), nfa.start_anchored, nfa.start_floating);
    for (u32 i = 0; i < nfa.size(); i++) {
        const NfaState &st = nfa[i];
        fprintf(f, "%u", i);
        if (st.accept) {
            fprintf(f, " ACCEPT(%u)", st.priority);
        }
        fprintf(f, ":");
        for (const auto &e : st.edges) {
            switch (e.type) {
            case NfaEdge::EPSILON:
                fprintf(f, " eps->%u", e.target);
                break;
            case NfaEdge::BYTES: {
                CharReach cr;
                cr.setRange(e.lo, e.hi);
                fprintf(f, " ");
                describeClass(f, cr, 4, CC_OUT_TEXT);
                fprintf(f, "->%u", e.target);
                break;
            }
            case NfaEdge::LOOK:
                fprintf(f, " %s->%u", lookName(e.look), e.target);
                break;
            }
        }
        fprintf(f, "\n");
    }
}

static
void dumpNfaDot(const Nfa &nfa, FILE *f) {
    fprintf(f, "digraph G {\nrankdir=LR;\n");
    fprintf(f, "STARTA -> %u [color = blue]\n", nfa.start_anchored);
    fprintf(f, "STARTF -> %u [color = red]\n", nfa.start_floating);
    for (u32 i = 0; i < nfa.size(); i++) {
        const NfaState &st = nfa[i];
        fprintf(f, "%u [ label = \"%u\"%s ];\n", i, i,
                st.accept ? ", shape = doublecircle" : "");
        u32 rank = 0;
        for (const auto &e : st.edges) {
            switch (e.type) {
            case NfaEdge::EPSILON:
                fprintf(f, "%u -> %u [ label = \"%u\", style = dashed ];\n",
                        i, e.target, rank);
                break;
            case NfaEdge::BYTES: {
                CharReach cr;
                cr.setRange(e.lo, e.hi);
                fprintf(f, "%u -> %u [ label = \"", i, e.target);
                describeClass(f, cr, 4, CC_OUT_DOT);
                fprintf(f, "\" ];\n");
                break;
            }
            case NfaEdge::LOOK:
                fprintf(f, "%u -> %u [ label = \"%u:%s\", color = purple ];\n",
                        i, e.target, rank,
                        e.look == LOOK_WORD_BOUNDARY
                            ? "\\\\b"
                            : e.look == LOOK_NOT_WORD_BOUNDARY
                                  ? "\\\\B"
                                  : lookName(e.look));
                break;
            }
            rank++;
        }
    }
    fprintf(f, "}\n");
}

void dumpNfaImpl(const Nfa &nfa, const char *name, const Grey &grey) {
    if (!(grey.dumpFlags & Grey::DUMP_INT_GRAPH)) {
        return;
    }

    const string base = grey.dumpPath + name;
    {
        StdioFile f(base + ".txt", "w");
        dumpNfaText(nfa, f);
    }
    {
        StdioFile f(base + ".dot", "w");
        dumpNfaDot(nfa, f);
    }
}

} // namespace dfascan
