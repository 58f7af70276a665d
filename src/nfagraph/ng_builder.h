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
 * \brief NFA builder: Thompson construction from a parsed syntax tree.
 */

#ifndef NG_BUILDER_H
#define NG_BUILDER_H

#include "dfascan_common.h"

#include "ng_nfa.h"
#include "util/noncopyable.h"

#include <memory>

namespace dfascan {

class CharReach;
class Component;
class RangeAlphabet;
struct Grey;

/** \brief Abstract builder interface. Use \ref makeNFABuilder to construct
 * one. Used by the Thompson construction in \ref buildNfa.
 */
class NFABuilder : noncopyable {
public:
    virtual ~NFABuilder();

    /** \brief Adds a fresh state.
     *
     * \throw StateLimitExceeded if the arena is already at Grey::limitNFAStates.
     */
    virtual u32 makeState() = 0;

    virtual void addEpsilon(u32 from, u32 to) = 0;

    /** \brief Adds one byte edge per contiguous run of \a cr. */
    virtual void addCharReach(u32 from, const CharReach &cr, u32 to) = 0;

    virtual void addByteRange(u32 from, u8 lo, u8 hi, u32 to) = 0;

    virtual void addLook(u32 from, LookKind k, u32 to) = 0;

    virtual u32 numStates() const = 0;

    /**
     * \brief Finishes the NFA for a pattern running from \a start to \a end:
     * adds the accept state and the floating start. Note that this builder
     * cannot be used after this call.
     */
    virtual Nfa getNfa(u32 start, u32 end) = 0;
};

/** Construct a usable NFABuilder. */
std::unique_ptr<NFABuilder> makeNFABuilder(const Grey &grey);

/**
 * \brief Thompson construction of \a root over \a alpha.
 *
 * Class nodes are expanded into byte paths through their UTF-8 projection.
 *
 * \throw StateLimitExceeded if the NFA grows past Grey::limitNFAStates.
 * \throw UnsupportedConstruct for look-around and back-references.
 */
Nfa buildNfa(const Component &root, const RangeAlphabet &alpha,
             const Grey &grey);

} // namespace dfascan

#endif
