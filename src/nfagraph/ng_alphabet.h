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
 * \brief Range alphabet: code point partition, UTF-8 projection and byte
 * equivalence classes for one pattern.
 */

#ifndef NG_ALPHABET_H
#define NG_ALPHABET_H

#include "ng_utf8.h"
#include "nfa/rdfa.h"
#include "util/charreach.h"
#include "util/unicode_set.h"
#include "dfascan_common.h"

#include <array>
#include <vector>

namespace dfascan {

class Component;

/**
 * \brief The alphabet for one pattern.
 *
 * Code points are partitioned into classes that no class node of the pattern
 * ever splits. Each class carries its UTF-8 projection. Bytes are grouped into
 * equivalence classes that no byte edge of the NFA ever splits, with SOT and
 * EOT given their own classes after the byte classes.
 *
 * Built once per pattern and passed explicitly to NFA construction and
 * determinisation.
 */
class RangeAlphabet {
public:
    /** \brief Number of code point classes. */
    size_t classCount() const { return starts.size(); }

    /** \brief Index of the code point class containing \a c. */
    u32 classOf(unichar c) const;

    /** \brief Lowest code point of class \a i. */
    unichar classLo(u32 i) const { return starts[i]; }

    /** \brief Highest code point of class \a i. */
    unichar classHi(u32 i) const {
        return i + 1 < starts.size() ? starts[i + 1] - 1 : MAX_UNICODE;
    }

    /** \brief UTF-8 projection of code point class \a i. */
    const std::vector<Utf8Sequence> &sequences(u32 i) const {
        return utf8[i];
    }

    /** \brief Appends the indices of the code point classes making up \a cps,
     * which must be a union of whole classes. */
    void classesIn(const CodePointSet &cps, std::vector<u32> *out) const;

    /** \brief Byte class ids, indexed by symbol (0-255, SYM_SOT, SYM_EOT). */
    std::array<u16, ALPHABET_SIZE> alpha;

    /** \brief Leader symbol of each class, indexed by class id. */
    std::array<u16, ALPHABET_SIZE> unalpha;

    /** \brief Number of byte classes, including the SOT and EOT classes. */
    u16 alpha_size = 0;

    /** \brief The pattern uses \\b or \\B, so word and non-word bytes never
     * share a class. */
    bool word_sensitive = false;

private:
    friend RangeAlphabet buildRangeAlphabet(const Component &root);

    std::vector<unichar> starts; //!< sorted; starts[0] == 0
    std::vector<std::vector<Utf8Sequence>> utf8;
};

/**
 * \brief Computes the alphabet for the given tree.
 *
 * \throw InvalidRangeBoundary if a class or byte node holds an invalid range.
 */
RangeAlphabet buildRangeAlphabet(const Component &root);

/** \brief Assigns byte class ids from a list of disjoint byte sets covering
 * 0-255, then appends the SOT and EOT classes. Returns the alphabet size. */
u16 buildAlphabetFromEquivSets(const std::vector<CharReach> &esets,
                               std::array<u16, ALPHABET_SIZE> &alpha,
                               std::array<u16, ALPHABET_SIZE> &unalpha);

} // namespace dfascan

#endif
