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
 * \brief Compiler front-end: syntax tree to Database.
 */

#include "compiler.h"

#include "database.h"
#include "grey.h"
#include "nfa/dfa_compile.h"
#include "nfa/dfa_dump.h"
#include "nfa/dfa_min.h"
#include "nfa/rdfa.h"
#include "nfagraph/ng_alphabet.h"
#include "nfagraph/ng_builder.h"
#include "nfagraph/ng_dfa.h"
#include "nfagraph/ng_dump.h"
#include "nfagraph/ng_nfa.h"
#include "parser/unsupported.h"
#include "util/compile_error.h"
#include "util/make_unique.h"

#include <algorithm>

#ifdef DUMP_SUPPORT
#include "nfa/dfa_internal.h"
#include "util/dump_util.h"
#endif

using namespace std;

namespace dfascan {

size_t dfaStateLimit(const Grey &grey, u16 alpha_size) {
    assert(alpha_size);
    size_t limit = min((size_t)grey.limitDFAStates, MAX_DFA_STATES);
    return min(limit, (size_t)grey.limitDFATransitions / alpha_size);
}

static
bytecode_ptr<dfa> buildTable(const Nfa &nfa, const RangeAlphabet &alpha,
                             dfa_direction direction, const Grey &grey) {
    const bool fwd = direction == DFA_FORWARD;
    auto rdfa = buildDfa(nfa, alpha, direction,
                         fwd ? MATCH_LEFTMOST_FIRST : MATCH_ALL,
                         dfaStateLimit(grey, alpha.alpha_size));
    dumpRawDfa(*rdfa, fwd ? "dfa_fwd_raw" : "dfa_rev_raw", grey);

    UNUSED size_t raw_states = rdfa->states.size();
    minimize_hopcroft(*rdfa, grey);
    DEBUG_PRINTF("%s dfa minimised: %zu -> %zu states\n",
                 fwd ? "forward" : "reverse", raw_states,
                 rdfa->states.size());
    dumpRawDfa(*rdfa, fwd ? "dfa_fwd_min" : "dfa_rev_min", grey);

    return dfaCompile(*rdfa, grey);
}

#ifdef DUMP_SUPPORT
static
void dumpDatabase(const Database &db, const Grey &grey) {
    if (!(grey.dumpFlags & Grey::DUMP_BASICS)) {
        return;
    }
    StdioFile f(grey.dumpPath + "database.txt", "w");
    fprintf(f, "%s\n\n", db.info().c_str());
    dfaDumpText(db.forward(), f);
    fprintf(f, "\n");
    dfaDumpText(db.reverse(), f);

    if (grey.dumpFlags & Grey::DUMP_IMPL) {
        StdioFile fwd_dot(grey.dumpPath + "dfa_fwd.dot", "w");
        dfaDumpDot(db.forward(), fwd_dot);
        StdioFile rev_dot(grey.dumpPath + "dfa_rev.dot", "w");
        dfaDumpDot(db.reverse(), rev_dot);
    }
}
#endif

unique_ptr<Database> compileDatabase(const Component &root, bool longest,
                                     const Grey &grey) {
    checkUnsupported(root);

    RangeAlphabet alpha = buildRangeAlphabet(root);
    DEBUG_PRINTF("alphabet: %zu code point classes, %hu byte classes\n",
                 alpha.classCount(), alpha.alpha_size);

    Nfa nfa = buildNfa(root, alpha, grey);
    dumpNfa(nfa, "nfa_fwd", grey);

    Nfa rnfa = reverseNfa(nfa);
    dumpNfa(rnfa, "nfa_rev", grey);

    auto fwd = buildTable(nfa, alpha, DFA_FORWARD, grey);
    auto rev = buildTable(rnfa, alpha, DFA_REVERSE, grey);

    auto db = make_unique<Database>(move(fwd), move(rev), longest);
    DEBUG_PRINTF("compiled: %s\n", db->info().c_str());
#ifdef DUMP_SUPPORT
    dumpDatabase(*db, grey);
#endif
    return db;
}

} // namespace dfascan
