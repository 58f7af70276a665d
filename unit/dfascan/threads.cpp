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

#include "gtest/gtest.h"
#include "test_util.h"

#include <string>
#include <thread>
#include <vector>

using namespace std;
using namespace dfascan;

static const unsigned NUM_THREADS = 8;
static const unsigned ITERATIONS = 200;

static
void scanWorker(const Database *db, const string *data,
                const vector<MatchRecord> *expected, bool *ok) {
    *ok = true;
    for (unsigned i = 0; i < ITERATIONS; i++) {
        CallBackContext c;
        db->scan(data->data(), data->size(), record_cb, &c);
        if (c.matches != *expected) {
            *ok = false;
            return;
        }
        MatchSpan m;
        if (!db->find(*data, 0, &m) || m.start != (*expected)[0].from) {
            *ok = false;
            return;
        }
    }
}

// A compiled database is shared between threads without locking.
TEST(Threads, SharedDatabase) {
    auto db = buildDB("\\b[a-z]+[0-9]*\\b");
    ASSERT_TRUE(db != nullptr);

    string data;
    for (unsigned i = 0; i < 50; i++) {
        data += "word" + to_string(i) + " -- ";
    }
    const vector<MatchRecord> expected = scanAll(*db, data);
    ASSERT_EQ(50U, expected.size());

    vector<thread> threads;
    bool ok[NUM_THREADS];
    for (unsigned i = 0; i < NUM_THREADS; i++) {
        threads.push_back(thread(scanWorker, db.get(), &data, &expected,
                                 &ok[i]));
    }
    for (auto &t : threads) {
        t.join();
    }
    for (unsigned i = 0; i < NUM_THREADS; i++) {
        EXPECT_TRUE(ok[i]) << "thread " << i;
    }
}
