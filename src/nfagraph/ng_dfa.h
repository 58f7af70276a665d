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
 * \brief Subset construction from a Thompson NFA to a raw_dfa.
 */

#ifndef NG_DFA_H
#define NG_DFA_H

#include "dfascan_common.h"
#include "nfa/rdfa.h"

#include <memory>

namespace dfascan {

class Nfa;
class RangeAlphabet;

/** \brief How competing NFA threads are treated during determinisation. */
enum MatchKind {
    /** Threads are ordered by preference and everything behind the first
     * accepting thread is discarded: Perl-style leftmost-first. */
    MATCH_LEFTMOST_FIRST,

    /** Every thread survives; any accepting thread makes the state accept. */
    MATCH_ALL
};

/**
 * \brief Determinises \a nfa from its floating start.
 *
 * The DFA has one class per byte class of \a alpha plus SOT and EOT. Its
 * state limit counts the dead state.
 *
 * \throw StateLimitExceeded if more than \a state_limit states are needed.
 */
std::unique_ptr<raw_dfa> buildDfa(const Nfa &nfa, const RangeAlphabet &alpha,
                                  dfa_direction direction, MatchKind kind,
                                  size_t state_limit);

} // namespace dfascan

#endif
