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
 * \brief Compiled DFA: flat table layout shared by the encoder and the
 * runtime.
 *
 * A compiled DFA is one aligned block:
 *
 *     struct dfa | aux[state_count] | table[state_count << alphaShift]
 *
 * Table entries are u8 or u16 state ids (see \ref dfa::width), indexed by
 * (state << alphaShift) + class. Byte classes come first, followed by the
 * SOT and EOT classes. State 0 is dead.
 */

#ifndef DFA_INTERNAL_H
#define DFA_INTERNAL_H

#include "dfascan_common.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define DFA_MAGIC 0x41464444 /* "DDFA" */

#define DFA_FLAG_WORD_SENSITIVE 1 /**< starts differ by preceding byte */

struct dfa_state_aux {
    u8 accept;      /**< ACCEPT_* flags */
    u8 pad[3];
    u32 priority;   /**< lower wins; meaningless if accept == 0 */
};

struct dfa {
    u32 magic;
    u32 length;         /**< length of the whole block in bytes */
    u16 state_count;    /**< total number of states, dead included */
    u16 alpha_size;     /**< byte classes + SOT + EOT */
    u16 start_nonword;  /**< start after a non-word byte or at text start */
    u16 start_word;     /**< start after a word byte */
    u16 dead;           /**< always 0 */
    u16 sot;            /**< class id of the start of text symbol */
    u16 eot;            /**< class id of the end of text symbol */
    u8  width;          /**< bytes per table entry: 1 or 2 */
    u8  alphaShift;
    u8  direction;      /**< dfa_direction */
    u8  flags;
    u8  pad[2];
    u32 aux_offset;     /**< offset of aux[] from the start of the block */
    u32 table_offset;   /**< offset of the table from the start of the block */
    u8  remap[256];     /**< byte to class id */
};

static really_inline
const struct dfa_state_aux *getDfaAux(const struct dfa *d) {
    return (const struct dfa_state_aux *)((const char *)d + d->aux_offset);
}

static really_inline
const void *getDfaTable(const struct dfa *d) {
    return (const char *)d + d->table_offset;
}

#ifdef __cplusplus
}
#endif

#endif
