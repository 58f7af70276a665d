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

#ifndef DFA_COMPILE_H
#define DFA_COMPILE_H

#include "dfascan_common.h"
#include "util/bytecode_ptr.h"

struct dfa;

namespace dfascan {
struct raw_dfa;
struct Grey;

/** \brief log2 of the table row length for \a alpha_size classes. */
u8 dfaAlphaShift(u16 alpha_size);

/** \brief Total size in bytes of the block for the given shape. */
size_t dfaBlockSize(u16 state_count, u8 alpha_shift, u8 width);

/**
 * \brief Encodes \a raw as a flat table.
 *
 * Entries are 8-bit if there are at most 256 states and
 * Grey::allowNarrowTable is set, 16-bit otherwise.
 */
bytecode_ptr<dfa> dfaCompile(const raw_dfa &raw, const Grey &grey);

} // namespace dfascan

#endif
