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
 * \brief Compiled DFA: scanning.
 */

#ifndef DFA_RUNTIME_H
#define DFA_RUNTIME_H

#include "dfascan_common.h"

struct dfa;

namespace dfascan {

/**
 * \brief Runs a forward DFA over buf[start, len).
 *
 * The byte before \a start, if any, gives the starting context; at offset 0
 * the start of text symbol is fed first. The end of text symbol is fed after
 * the last byte.
 *
 * With \a shortest set, stops at the first match end; otherwise reports the
 * last match end seen before the DFA dies.
 *
 * \return true and sets \a end if a match ends in [start, len].
 */
bool dfaScanForward(const dfa *d, const u8 *buf, size_t len, size_t start,
                    bool shortest, size_t *end);

/**
 * \brief Runs a reverse DFA backwards from \a hi down to \a lo.
 *
 * The byte at \a hi, if any, gives the starting context; at \a hi == len the
 * start of text symbol is fed first. At \a lo the DFA is asked whether it
 * accepts before the byte at lo - 1, or before the end of text if \a lo is 0.
 *
 * \return true and sets \a start to the smallest accepting position.
 */
bool dfaScanReverse(const dfa *d, const u8 *buf, size_t len, size_t lo,
                    size_t hi, size_t *start);

} // namespace dfascan

#endif
