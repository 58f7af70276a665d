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
 * \brief The dfascan public API: compile a parsed pattern into a Database.
 */

#ifndef DFASCAN_H
#define DFASCAN_H

#include "database.h"
#include "dfascan_common.h"

#include <memory>

namespace dfascan {

class Component;
struct Grey;

/** \brief User-facing compile settings. */
struct CompileOptions {
    CompileOptions();

    /** \brief Ceiling on the states of each DFA, dead state included.
     * Compilation fails with StateLimitExceeded above it. */
    u32 max_states;

    /** \brief If set, Database::find() reports the leftmost-first end;
     * otherwise the earliest end. */
    bool longest_match;
};

/**
 * \brief Compiles a parsed pattern.
 *
 * Matching is unanchored, over bytes, with code point classes matched as
 * UTF-8.
 *
 * \throw UnsupportedConstruct for back-references and look-around.
 * \throw StateLimitExceeded if a state ceiling is crossed.
 * \throw InvalidRangeBoundary for malformed class ranges or repeat bounds.
 */
std::unique_ptr<Database> compile(const Component &root,
                                  const CompileOptions &opts);

/** \brief As above, with internal tunables. */
std::unique_ptr<Database> compile(const Component &root,
                                  const CompileOptions &opts,
                                  const Grey &grey);

/** \brief Release version string. */
const char *version(void);

} // namespace dfascan

#endif
