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

#ifndef TEST_UTIL_H
#define TEST_UTIL_H

#include "dfascan.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

struct MatchRecord {
    MatchRecord(size_t f, size_t t) : from(f), to(t) {}
    bool operator==(const MatchRecord &o) const {
        return from == o.from && to == o.to;
    }
    size_t from;
    size_t to;
};

std::ostream &operator<<(std::ostream &o, const MatchRecord &m);

struct CallBackContext {
    size_t halt_after = 0; // stop after this many matches; 0 never stops
    std::vector<MatchRecord> matches;

    void clear() {
        halt_after = 0;
        matches.clear();
    }
};

int record_cb(size_t from, size_t to, void *ctxt);

// Parses and compiles a single expression; aborts the test on failure.
std::unique_ptr<dfascan::Database> buildDB(const std::string &expression,
                                           bool longest = true);
std::unique_ptr<dfascan::Database>
buildDB(const std::string &expression, const dfascan::CompileOptions &opts);

// Runs Database::scan and returns every reported match.
std::vector<MatchRecord> scanAll(const dfascan::Database &db,
                                 const std::string &data);

#endif
