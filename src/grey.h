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

#ifndef GREY_H
#define GREY_H

#include <string>

#include "dfascan_common.h"

namespace dfascan {

/** \brief Internal compile-time tunables.
 *
 * Users see only \ref CompileOptions; these knobs exist for debugging and
 * testing the pipeline. */
struct Grey {
    Grey(void);

    bool minimizeDFA; //!< run Hopcroft minimisation on both DFAs
    bool allowNarrowTable; //!< allow 8-bit transition tables

    u32 dumpFlags;
    std::string dumpPath;

    /* Dump flags */
    static const u32 DUMP_NONE = 0;
    static const u32 DUMP_BASICS = 1 << 0; // Dump basic textual info
    static const u32 DUMP_INT_GRAPH = 1 << 1; // Dump NFA construction
    static const u32 DUMP_IMPL = 1 << 2; // Dump DFA states and tables

    /* Resource limits. These are somewhat arbitrary, but are intended to bound
     * the time and memory a single pattern can consume. */
    u32 limitNFAStates; //!< max NFA arena size
    u32 limitDFAStates; //!< default DFA state ceiling
    u32 limitDFATransitions; //!< max states * alphabet size per DFA
};

#ifndef RELEASE_BUILD
/** \brief Applies "key:value" overrides, separated by ';' or ','.
 *
 * Throws CompileError on an unknown key or unparseable value. "help" prints
 * the known keys and their defaults. */
void applyGreyOverrides(Grey *g, const std::string &overrides);
#endif

} // namespace dfascan

#endif
