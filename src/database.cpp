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
 * \brief Compiled pattern: forward and reverse DFAs plus the match driver.
 */

#include "database.h"

#include "nfa/dfa_compile.h"
#include "nfa/dfa_internal.h"
#include "nfa/dfa_runtime.h"
#include "nfa/rdfa.h"
#include "util/compile_error.h"
#include "util/make_unique.h"

#include <cstring>
#include <sstream>

using namespace std;

namespace dfascan {

Database::Database(bytecode_ptr<dfa> fwd_in, bytecode_ptr<dfa> rev_in,
                   bool longest_in)
    : fwd(move(fwd_in)), rev(move(rev_in)), longest(longest_in) {
    assert(fwd && fwd->direction == DFA_FORWARD);
    assert(rev && rev->direction == DFA_REVERSE);
}

Database::~Database() {}

bool Database::isMatch(const char *data, size_t len) const {
    size_t end;
    return dfaScanForward(fwd.get(), (const u8 *)data, len, 0, true, &end);
}

bool Database::isMatch(const string &data) const {
    return isMatch(data.data(), data.size());
}

bool Database::shortestMatch(const char *data, size_t len, size_t start,
                             size_t *end) const {
    if (start > len) {
        return false;
    }
    return dfaScanForward(fwd.get(), (const u8 *)data, len, start, true, end);
}

bool Database::shortestMatch(const string &data, size_t start,
                             size_t *end) const {
    return shortestMatch(data.data(), data.size(), start, end);
}

bool Database::find(const char *data, size_t len, size_t start,
                    MatchSpan *out) const {
    if (start > len) {
        return false;
    }

    const u8 *buf = (const u8 *)data;
    size_t end;
    if (!dfaScanForward(fwd.get(), buf, len, start, !longest, &end)) {
        return false;
    }

    size_t from;
    if (!dfaScanReverse(rev.get(), buf, len, start, end, &from)) {
        // Only a reverse DFA built for another pattern gets here.
        DEBUG_PRINTF("no start for match ending at %zu\n", end);
        return false;
    }

    DEBUG_PRINTF("match [%zu, %zu)\n", from, end);
    out->start = from;
    out->end = end;
    return true;
}

bool Database::find(const string &data, size_t start, MatchSpan *out) const {
    return find(data.data(), data.size(), start, out);
}

bool Database::scan(const char *data, size_t len, MatchHandler onEvent,
                    void *ctx) const {
    size_t pos = 0;
    bool have_last = false;
    size_t last_end = 0;

    while (pos <= len) {
        MatchSpan m;
        if (!find(data, len, pos, &m)) {
            break;
        }

        const bool empty = m.start == m.end;
        if (empty && have_last && m.start == last_end) {
            pos = m.end + 1;
            continue;
        }

        if (onEvent(m.start, m.end, ctx)) {
            DEBUG_PRINTF("scan terminated by callback\n");
            return false;
        }

        have_last = true;
        last_end = m.end;
        pos = empty ? m.end + 1 : m.end;
    }

    return true;
}

size_t Database::size() const {
    return fwd->length + rev->length;
}

static
void describe(ostringstream &oss, const dfa *d) {
    oss << d->state_count << " states, alpha " << d->alpha_size << ", "
        << 8 * d->width << "-bit table";
}

string Database::info() const {
    ostringstream oss;
    oss << "forward: ";
    describe(oss, fwd.get());
    oss << "; reverse: ";
    describe(oss, rev.get());
    oss << "; " << (longest ? "longest" : "shortest") << " match; "
        << size() << " bytes";
    return oss.str();
}

string Database::serialize() const {
    db_header hdr;
    memset(&hdr, 0, sizeof(hdr));
    hdr.magic = DFASCAN_DB_MAGIC;
    hdr.version = DFASCAN_DB_VERSION;
    hdr.flags = longest ? DFASCAN_DB_FLAG_LONGEST : 0;
    hdr.forward_offset = sizeof(db_header);
    hdr.forward_length = fwd->length;
    hdr.reverse_offset = hdr.forward_offset + hdr.forward_length;
    hdr.reverse_length = rev->length;
    hdr.length = hdr.reverse_offset + hdr.reverse_length;

    string out(hdr.length, '\0');
    memcpy(&out[0], &hdr, sizeof(hdr));
    memcpy(&out[hdr.forward_offset], fwd.get(), fwd->length);
    memcpy(&out[hdr.reverse_offset], rev.get(), rev->length);
    return out;
}

static
u32 loadEntry(const dfa *d, size_t idx) {
    if (d->width == 1) {
        return ((const u8 *)getDfaTable(d))[idx];
    }
    return ((const u16 *)getDfaTable(d))[idx];
}

/** \brief Checks that \a d can be scanned without leaving its block. */
static
void validateDfa(const dfa *d, size_t len, dfa_direction direction) {
    if (len < sizeof(dfa) || d->magic != DFA_MAGIC || d->length != len) {
        throw CompileError("Invalid DFA header.");
    }
    if (d->direction != direction) {
        throw CompileError("DFA direction mismatch.");
    }
    if (d->alpha_size <= N_SPECIAL_SYMBOL || d->alpha_size > ALPHABET_SIZE ||
        d->sot != d->alpha_size - 2 || d->eot != d->alpha_size - 1) {
        throw CompileError("Invalid DFA alphabet.");
    }
    if (d->width != 1 && d->width != 2) {
        throw CompileError("Invalid DFA table width.");
    }
    if (!d->state_count || (d->width == 1 && d->state_count > 256) ||
        d->dead != DEAD_STATE) {
        throw CompileError("Invalid DFA state count.");
    }
    if (d->alphaShift != dfaAlphaShift(d->alpha_size) ||
        d->length != dfaBlockSize(d->state_count, d->alphaShift, d->width)) {
        throw CompileError("Invalid DFA table size.");
    }
    const size_t aux_end =
        (size_t)d->aux_offset + sizeof(dfa_state_aux) * d->state_count;
    if (d->aux_offset < sizeof(dfa) ||
        !ISALIGNED_N(d->aux_offset, alignof(dfa_state_aux)) ||
        d->table_offset < aux_end || !ISALIGNED_N(d->table_offset, 2) ||
        d->table_offset + ((size_t)d->width * d->state_count
                           << d->alphaShift) != d->length) {
        throw CompileError("Invalid DFA layout.");
    }
    if (d->start_nonword >= d->state_count ||
        d->start_word >= d->state_count) {
        throw CompileError("Invalid DFA start state.");
    }
    for (u32 c = 0; c < N_CHARS; c++) {
        if (d->remap[c] >= d->alpha_size - N_SPECIAL_SYMBOL) {
            throw CompileError("Invalid DFA byte remap.");
        }
    }
    for (u32 s = 0; s < d->state_count; s++) {
        for (u32 cls = 0; cls < d->alpha_size; cls++) {
            u32 next = loadEntry(d, ((size_t)s << d->alphaShift) + cls);
            if (next >= d->state_count || (s == DEAD_STATE && next)) {
                throw CompileError("Invalid DFA transition.");
            }
        }
    }
    if (getDfaAux(d)[DEAD_STATE].accept) {
        throw CompileError("Invalid DFA dead state.");
    }
}

static
bytecode_ptr<dfa> loadDfa(const char *bytes, size_t len,
                          dfa_direction direction) {
    if (len < sizeof(dfa)) {
        throw CompileError("Truncated DFA.");
    }
    auto d = make_zeroed_bytecode_ptr<dfa>(len, 64);
    memcpy(d.get(), bytes, len);
    validateDfa(d.get(), len, direction);
    return d;
}

unique_ptr<Database> Database::deserialize(const char *bytes, size_t len) {
    db_header hdr;
    if (!bytes || len < sizeof(hdr)) {
        throw CompileError("Truncated database.");
    }
    memcpy(&hdr, bytes, sizeof(hdr));

    if (hdr.magic != DFASCAN_DB_MAGIC) {
        throw CompileError("Not a compiled database.");
    }
    if (hdr.version != DFASCAN_DB_VERSION) {
        throw CompileError("Database version mismatch.");
    }
    if (hdr.length != len || hdr.forward_offset < sizeof(hdr) ||
        (size_t)hdr.forward_offset + hdr.forward_length > len ||
        hdr.reverse_offset < sizeof(hdr) ||
        (size_t)hdr.reverse_offset + hdr.reverse_length > len ||
        (hdr.flags & ~DFASCAN_DB_FLAG_LONGEST)) {
        throw CompileError("Invalid database header.");
    }

    auto fwd = loadDfa(bytes + hdr.forward_offset, hdr.forward_length,
                       DFA_FORWARD);
    auto rev = loadDfa(bytes + hdr.reverse_offset, hdr.reverse_length,
                       DFA_REVERSE);
    DEBUG_PRINTF("loaded database of %u bytes\n", hdr.length);
    return make_unique<Database>(move(fwd), move(rev),
                                 hdr.flags & DFASCAN_DB_FLAG_LONGEST);
}

} // namespace dfascan
