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
 * \brief Compiler front-end: syntax tree to Database.
 */

#ifndef COMPILER_H
#define COMPILER_H

#include "dfascan_common.h"

#include <memory>

namespace dfascan {

class Component;
class Database;
struct Grey;

/** \brief Upper bound on the states of one DFA under \a grey for an
 * alphabet of \a alpha_size classes. */
size_t dfaStateLimit(const Grey &grey, u16 alpha_size);

/**
 * Runs the whole pipeline over \a root:
 *
 *  -# reject constructs that are not regular;
 *  -# build the range alphabet;
 *  -# build the Thompson NFA and its reverse;
 *  -# determinise the forward NFA leftmost-first from its floating start, and
 *     the reverse NFA exhaustively from its anchored start;
 *  -# minimise both DFAs and encode them as tables.
 *
 * Any error throws and nothing is returned.
 */
std::unique_ptr<Database> compileDatabase(const Component &root, bool longest,
                                          const Grey &grey);

} // namespace dfascan

#endif // COMPILER_H
