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

#include "dfa_runtime.h"

#include "dfa_internal.h"
#include "rdfa.h"
#include "util/charreach.h"

namespace dfascan {

static really_inline
u8 acceptBefore(u8 c) {
    return isWordByte(c) ? ACCEPT_BEFORE_WORD : ACCEPT_BEFORE_NONWORD;
}

template<typename T>
static really_inline
u32 step(const T *table, u8 shift, u32 s, u32 cls) {
    return table[(s << shift) + cls];
}

template<typename T>
static
bool scanForward(const dfa *d, const u8 *buf, size_t len, size_t start,
                 bool shortest, size_t *end) {
    const T *table = (const T *)getDfaTable(d);
    const dfa_state_aux *aux = getDfaAux(d);
    const u8 shift = d->alphaShift;

    u32 s;
    if (start == 0) {
        s = step(table, shift, d->start_nonword, d->sot);
    } else {
        s = isWordByte(buf[start - 1]) ? d->start_word : d->start_nonword;
    }

    bool found = false;
    for (size_t i = start; i < len; i++) {
        if (s == DEAD_STATE) {
            return found;
        }
        const u8 c = buf[i];
        if (aux[s].accept & acceptBefore(c)) {
            DEBUG_PRINTF("match end at %zu (state %u)\n", i, s);
            *end = i;
            found = true;
            if (shortest) {
                return true;
            }
        }
        s = step(table, shift, s, d->remap[c]);
    }

    if (s == DEAD_STATE) {
        return found;
    }

    s = step(table, shift, s, d->eot);
    if (aux[s].accept) {
        DEBUG_PRINTF("match end at eod %zu\n", len);
        *end = len;
        found = true;
    }
    return found;
}

template<typename T>
static
bool scanReverse(const dfa *d, const u8 *buf, size_t len, size_t lo,
                 size_t hi, size_t *start) {
    const T *table = (const T *)getDfaTable(d);
    const dfa_state_aux *aux = getDfaAux(d);
    const u8 shift = d->alphaShift;

    u32 s;
    if (hi == len) {
        s = step(table, shift, d->start_nonword, d->sot);
    } else {
        s = isWordByte(buf[hi]) ? d->start_word : d->start_nonword;
    }

    bool found = false;
    for (size_t i = hi; i > lo; i--) {
        if (s == DEAD_STATE) {
            return found;
        }
        const u8 c = buf[i - 1];
        if (aux[s].accept & acceptBefore(c)) {
            *start = i;
            found = true;
        }
        s = step(table, shift, s, d->remap[c]);
    }

    if (s == DEAD_STATE) {
        return found;
    }

    if (lo == 0) {
        s = step(table, shift, s, d->eot);
        if (aux[s].accept) {
            *start = 0;
            found = true;
        }
    } else if (aux[s].accept & acceptBefore(buf[lo - 1])) {
        *start = lo;
        found = true;
    }

    DEBUG_PRINTF("reverse scan [%zu, %zu): %s\n", lo, hi,
                 found ? "match" : "no match");
    return found;
}

bool dfaScanForward(const dfa *d, const u8 *buf, size_t len, size_t start,
                    bool shortest, size_t *end) {
    assert(d && d->magic == DFA_MAGIC);
    assert(start <= len);
    if (d->width == 1) {
        return scanForward<u8>(d, buf, len, start, shortest, end);
    }
    return scanForward<u16>(d, buf, len, start, shortest, end);
}

bool dfaScanReverse(const dfa *d, const u8 *buf, size_t len, size_t lo,
                    size_t hi, size_t *start) {
    assert(d && d->magic == DFA_MAGIC);
    assert(lo <= hi && hi <= len);
    if (d->width == 1) {
        return scanReverse<u8>(d, buf, len, lo, hi, start);
    }
    return scanReverse<u16>(d, buf, len, lo, hi, start);
}

} // namespace dfascan
