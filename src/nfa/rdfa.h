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

#ifndef NFA_RDFA_H
#define NFA_RDFA_H

#include "dfascan_common.h"

#include <array>
#include <vector>

namespace dfascan {

typedef u16 dstate_id_t;
typedef u16 symbol_t;

/** \brief Virtual symbol fed once at the true start of the text. */
static constexpr symbol_t SYM_SOT = 256;

/** \brief Virtual symbol fed once at the true end of the text. */
static constexpr symbol_t SYM_EOT = 257;

static constexpr symbol_t ALPHABET_SIZE = 258;
static constexpr symbol_t N_SPECIAL_SYMBOL = 2;
static constexpr dstate_id_t DEAD_STATE = 0;

/** \brief Largest number of states a raw_dfa may hold. */
static constexpr size_t MAX_DFA_STATES = 65535;

/* accept flags: which kind of byte may follow the match end. A match ending
 * at the end of the text is represented by the transition on SYM_EOT landing
 * on a state with both flags. */
#define ACCEPT_BEFORE_WORD    0x1
#define ACCEPT_BEFORE_NONWORD 0x2
#define ACCEPT_ANY            (ACCEPT_BEFORE_WORD | ACCEPT_BEFORE_NONWORD)

enum dfa_direction {
    DFA_FORWARD = 0, //!< scans left to right, unanchored
    DFA_REVERSE = 1  //!< scans right to left, anchored at the match end
};

/** Structure representing a dfa state during construction. */
struct dstate {
    /** Next state; indexed by remapped sym */
    std::vector<dstate_id_t> next;

    /** ACCEPT_* flags. */
    u8 accept = 0;

    /** Priority of the winning accept; lower wins. Meaningless if
     * accept == 0. */
    u32 priority = 0;

    explicit dstate(size_t alphabet_size) : next(alphabet_size, 0) {}
};

struct raw_dfa {
    dfa_direction direction;
    std::vector<dstate> states;
    dstate_id_t start_nonword = DEAD_STATE; //!< start after a non-word byte
    dstate_id_t start_word = DEAD_STATE;    //!< start after a word byte
    u16 alpha_size = 0; /* including special symbols */

    /** Whether any state's behaviour depends on the word kind of the byte
     * before it; set when the pattern uses \\b or \\B. */
    bool word_sensitive = false;

    /* mapping from input symbol --> equiv class id */
    std::array<u16, ALPHABET_SIZE> alpha_remap;

    explicit raw_dfa(dfa_direction d) : direction(d) {
        alpha_remap.fill(0);
    }

    u16 getImplAlphaSize() const { return alpha_size - N_SPECIAL_SYMBOL; }
    u16 sotClass() const { return alpha_remap[SYM_SOT]; }
    u16 eotClass() const { return alpha_remap[SYM_EOT]; }
};

/** \brief True if the DFA can never accept. */
bool is_dead(const raw_dfa &rdfa);

/** \brief Removes states unreachable from the start states, renumbering the
 * survivors in their original order. The dead state is always kept as
 * state 0. */
void prune_unreachable(raw_dfa &rdfa);

} // namespace dfascan

#endif
