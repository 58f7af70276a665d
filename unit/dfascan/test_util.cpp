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

#include "config.h"

#include "test_util.h"
#include "gtest/gtest.h"
#include "util/compile_error.h"
#include "util/pattern_parser.h"

#include <ostream>

using namespace std;
using namespace dfascan;

ostream &operator<<(ostream &o, const MatchRecord &m) {
    return o << "MatchRecord(" << m.from << ", " << m.to << ")";
}

int record_cb(size_t from, size_t to, void *ctxt) {
    CallBackContext *c = static_cast<CallBackContext *>(ctxt);

    c->matches.push_back(MatchRecord(from, to));

    return c->halt_after && c->matches.size() >= c->halt_after ? 1 : 0;
}

unique_ptr<Database> buildDB(const string &expression,
                             const CompileOptions &opts) {
    unique_ptr<Database> db;
    try {
        auto root = parsePattern(expression);
        db = compile(*root, opts);
    } catch (const CompileError &e) {
        ADD_FAILURE() << "Compile failed for '" << expression
                      << "': " << e.reason;
        return nullptr;
    }
    return db;
}

unique_ptr<Database> buildDB(const string &expression, bool longest) {
    CompileOptions opts;
    opts.longest_match = longest;
    return buildDB(expression, opts);
}

vector<MatchRecord> scanAll(const Database &db, const string &data) {
    CallBackContext c;
    bool complete = db.scan(data.data(), data.size(), record_cb, &c);
    EXPECT_TRUE(complete);
    return c.matches;
}
