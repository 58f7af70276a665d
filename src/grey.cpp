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

#include "grey.h"
#include "dfascan_common.h"
#include "util/compile_error.h"

#include <algorithm>
#include <cstdio>
#include <string>

#define DEFAULT_DFA_STATE_LIMIT 10000

using namespace std;

namespace dfascan {

Grey::Grey(void) :
                   minimizeDFA(true),
                   allowNarrowTable(true),
                   dumpFlags(0),
                   limitNFAStates(500000),
                   limitDFAStates(DEFAULT_DFA_STATE_LIMIT),
                   limitDFATransitions(16 * 1024 * 1024) {
}

} // namespace dfascan

#ifndef RELEASE_BUILD

#include <boost/lexical_cast.hpp>
using boost::lexical_cast;

namespace dfascan {

void applyGreyOverrides(Grey *g, const string &s) {
    string::const_iterator p = s.begin();
    string::const_iterator pe = s.end();
    string help = "help:0";
    Grey defaultg;

    if (s == "help" || s == "help:") {
        printf("Valid grey overrides:\n");
        p = help.begin();
        pe = help.end();
    }

    while (p != pe) {
        string::const_iterator ke = find(p, pe, ':');

        if (ke == pe) {
            throw CompileError("Grey override missing a value: " +
                               string(p, pe) + ".");
        }

        string key(p, ke);

        string::const_iterator ve = ke;
        while (ve != pe && *ve != ';' && *ve != ',') {
            ++ve;
        }

        unsigned int value = 0;
        try {
            value = lexical_cast<unsigned int>(string(ke + 1, ve));
        } catch (boost::bad_lexical_cast &) {
            throw CompileError("Invalid grey override value " + key + ":" +
                               string(ke + 1, ve) + ".");
        }
        bool done = false;

#define G_UPDATE(k) do {                                                \
            if (key == ""#k) { g->k = value; done = 1;}                 \
            if (key == "help") {                                        \
                printf("\t%-30s\tdefault: %s\n", #k,                    \
                       lexical_cast<string>(defaultg.k).c_str());       \
            }                                                           \
        } while (0)

        G_UPDATE(minimizeDFA);
        G_UPDATE(allowNarrowTable);
        G_UPDATE(dumpFlags);
        G_UPDATE(limitNFAStates);
        G_UPDATE(limitDFAStates);
        G_UPDATE(limitDFATransitions);

#undef G_UPDATE

        if (!done && key != "help") {
            throw CompileError("Invalid grey override key " + key + ".");
        }

        p = ve;

        if (p != pe) {
            ++p;
        }
    }
}

} // namespace dfascan

#endif
