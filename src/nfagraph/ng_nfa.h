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
 * \brief Thompson NFA: an arena of states with ordered edges.
 *
 * Edge order carries priority: when a state has several edges, threads taking
 * earlier edges are preferred. Greedy and lazy repeats differ only in the
 * order of their edges.
 */

#ifndef NG_NFA_H
#define NG_NFA_H

#include "dfascan_common.h"

#include <vector>

namespace dfascan {

/** \brief Zero-width assertions carried on NFA edges. */
enum LookKind : u8 {
    LOOK_START_TEXT = 0,       //!< at offset 0
    LOOK_END_TEXT = 1,         //!< at the end of the data
    LOOK_WORD_BOUNDARY = 2,    //!< word-ness of the bytes either side differs
    LOOK_NOT_WORD_BOUNDARY = 3 //!< word-ness of the bytes either side agrees
};

#define LOOK_BIT(k) (1U << (k))

const char *lookName(LookKind k);

struct NfaEdge {
    enum Type : u8 {
        EPSILON, //!< free transition
        BYTES,   //!< consumes one byte in [lo, hi]
        LOOK     //!< free transition, taken only if the assertion holds
    };

    Type type;
    u8 lo = 0;
    u8 hi = 0;
    LookKind look = LOOK_START_TEXT;
    u32 target;

    static NfaEdge epsilon(u32 to) {
        NfaEdge e;
        e.type = EPSILON;
        e.target = to;
        return e;
    }

    static NfaEdge bytes(u8 lo_in, u8 hi_in, u32 to) {
        NfaEdge e;
        e.type = BYTES;
        e.lo = lo_in;
        e.hi = hi_in;
        e.target = to;
        return e;
    }

    static NfaEdge lookaround(LookKind k, u32 to) {
        NfaEdge e;
        e.type = LOOK;
        e.look = k;
        e.target = to;
        return e;
    }
};

struct NfaState {
    std::vector<NfaEdge> edges; //!< in priority order
    bool accept = false;
    u32 priority = 0; //!< accept priority, lower wins

    /** \brief True if the state matters to a DFA state's behaviour: it
     * consumes bytes, asserts something, or accepts. States with only
     * epsilon edges are fully described by their closure. */
    bool important() const;
};

/** \brief NFA arena. States are addressed by index. */
class Nfa {
public:
    u32 addState();
    void addEpsilon(u32 from, u32 to);
    void addBytes(u32 from, u8 lo, u8 hi, u32 to);
    void addLook(u32 from, LookKind k, u32 to);
    void setAccept(u32 s, u32 priority);

    size_t size() const { return states.size(); }
    const NfaState &operator[](u32 s) const { return states[s]; }

    /** \brief Bitmask of LOOK_BIT()s of the assertions used anywhere. */
    u32 lookFlags() const { return look_flags; }

    bool hasWordLooks() const {
        return look_flags & (LOOK_BIT(LOOK_WORD_BOUNDARY) |
                             LOOK_BIT(LOOK_NOT_WORD_BOUNDARY));
    }

    /** The pattern itself: a match must begin here. */
    u32 start_anchored = 0;

    /** The pattern behind a lazy any-byte loop, for unanchored search. */
    u32 start_floating = 0;

private:
    std::vector<NfaState> states;
    u32 look_flags = 0;
};

/**
 * \brief Builds the reverse of \a fwd: it accepts the reversal of every string
 * \a fwd accepts from its anchored start.
 *
 * Only states reachable from the anchored start take part. Start and end of
 * text assertions swap roles; word boundary assertions are symmetric. Both
 * starts of the result are the same anchored start.
 */
Nfa reverseNfa(const Nfa &fwd);

} // namespace dfascan

#endif
