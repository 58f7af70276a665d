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
 * \brief Pattern matching based on direct backtracking over the syntax tree.
 *
 * A slow but obviously correct matcher, used as the reference in tests.
 */

#ifndef NG_FIND_MATCHES_H
#define NG_FIND_MATCHES_H

#include <set>
#include <string>
#include <utility>

namespace dfascan {
class Component;
}

/**
 * \brief Find all matches of \a root in \a input.
 *
 * Fills \a matches with every [start, end) span the pattern matches, over
 * every path. A repeat iteration that consumes nothing ends the repeat.
 *
 * Returns false if this pattern is too large to find its matches in
 * reasonable time.
 *
 * \throw dfascan::UnsupportedConstruct for look-around and back-references.
 */
bool findMatches(const dfascan::Component &root, const std::string &input,
                 std::set<std::pair<size_t, size_t>> &matches);

/**
 * \brief Find the leftmost-first match starting at or after \a start: the
 * first start offset with any match, and there the end reached by the most
 * preferred path.
 *
 * Sets \a found, and \a match if a match exists. Returns false if the search
 * ran out of budget.
 */
bool findLeftmostFirst(const dfascan::Component &root,
                       const std::string &input, size_t start, bool *found,
                       std::pair<size_t, size_t> *match);

#endif // NG_FIND_MATCHES_H
