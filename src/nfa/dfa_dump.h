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

#ifndef DFA_DUMP_H
#define DFA_DUMP_H

#include "dfascan_common.h"

#include <cstdio>

struct dfa;

namespace dfascan {
struct raw_dfa;
struct Grey;

#ifdef DUMP_SUPPORT

void dumpRawDfaImpl(const raw_dfa &rdfa, const char *name, const Grey &grey);

/** \brief Writes the header, the aux records and one line of transitions per
 * state. */
void dfaDumpText(const dfa *d, FILE *f);

void dfaDumpDot(const dfa *d, FILE *f);

#endif // DUMP_SUPPORT

/** \brief Writes \a rdfa as text and dot under Grey::dumpPath if
 * Grey::DUMP_IMPL is set. */
UNUSED static inline
void dumpRawDfa(UNUSED const raw_dfa &rdfa, UNUSED const char *name,
                UNUSED const Grey &grey) {
#ifdef DUMP_SUPPORT
    dumpRawDfaImpl(rdfa, name, grey);
#endif
}

} // namespace dfascan

#endif
