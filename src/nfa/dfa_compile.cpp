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
 * \brief Compiled DFA: construction from a raw_dfa.
 */

#include "dfa_compile.h"

#include "dfa_internal.h"
#include "rdfa.h"
#include "grey.h"
#include "util/verify_types.h"

using namespace std;

namespace dfascan {

u8 dfaAlphaShift(u16 alpha_size) {
    /* log2 round up */
    u8 shift = 1;
    while ((1U << shift) < alpha_size) {
        shift++;
    }
    return shift;
}

static
size_t auxOffset() {
    return ROUNDUP_N(sizeof(dfa), 16);
}

static
size_t tableOffset(u16 state_count) {
    return ROUNDUP_N(auxOffset() + sizeof(dfa_state_aux) * state_count, 16);
}

size_t dfaBlockSize(u16 state_count, u8 alpha_shift, u8 width) {
    size_t tran_size = (size_t)width * state_count << alpha_shift;
    return tableOffset(state_count) + tran_size;
}

template<typename T>
static
void fillTable(const raw_dfa &raw, u8 alpha_shift, T *table) {
    for (size_t i = 0; i < raw.states.size(); i++) {
        const dstate &ds = raw.states[i];
        for (symbol_t s = 0; s < raw.alpha_size; s++) {
            table[(i << alpha_shift) + s] = (T)ds.next[s];
        }
    }
}

bytecode_ptr<dfa> dfaCompile(const raw_dfa &raw, const Grey &grey) {
    assert(!raw.states.empty());
    assert(raw.alpha_size > N_SPECIAL_SYMBOL);

    const u16 state_count = verify_u16(raw.states.size());
    const u8 width = state_count <= 256 && grey.allowNarrowTable ? 1 : 2;
    const u8 alpha_shift = dfaAlphaShift(raw.alpha_size);
    const size_t total_size = dfaBlockSize(state_count, alpha_shift, width);

    DEBUG_PRINTF("building %s dfa: %hu states, alpha %hu (shift %hhu), "
                 "%hhu-byte entries, %zu bytes\n",
                 raw.direction == DFA_FORWARD ? "forward" : "reverse",
                 state_count, raw.alpha_size, alpha_shift, width, total_size);

    auto d = make_zeroed_bytecode_ptr<dfa>(total_size, 64);
    d->magic = DFA_MAGIC;
    d->length = verify_u32(total_size);
    d->state_count = state_count;
    d->alpha_size = raw.alpha_size;
    d->start_nonword = raw.start_nonword;
    d->start_word = raw.start_word;
    d->dead = DEAD_STATE;
    d->sot = raw.sotClass();
    d->eot = raw.eotClass();
    d->width = width;
    d->alphaShift = alpha_shift;
    d->direction = verify_u8(raw.direction);
    d->flags = raw.word_sensitive ? DFA_FLAG_WORD_SENSITIVE : 0;
    d->aux_offset = verify_u32(auxOffset());
    d->table_offset = verify_u32(tableOffset(state_count));

    for (u32 i = 0; i < N_CHARS; i++) {
        d->remap[i] = verify_u8(raw.alpha_remap[i]);
    }

    dfa_state_aux *aux =
        (dfa_state_aux *)((char *)d.get() + d->aux_offset);
    for (size_t i = 0; i < raw.states.size(); i++) {
        aux[i].accept = raw.states[i].accept;
        aux[i].priority = raw.states[i].priority;
    }

    char *table = (char *)d.get() + d->table_offset;
    if (width == 1) {
        fillTable(raw, alpha_shift, (u8 *)table);
    } else {
        fillTable(raw, alpha_shift, (u16 *)table);
    }

    return d;
}

} // namespace dfascan
