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
 * \brief Compiled pattern: forward and reverse DFAs plus the match driver.
 */

#ifndef DFASCAN_DATABASE_H
#define DFASCAN_DATABASE_H

#include "dfascan_common.h"
#include "util/bytecode_ptr.h"
#include "util/noncopyable.h"

#include <memory>
#include <string>

#define DFASCAN_DB_VERSION 1
#define DFASCAN_DB_MAGIC   (0xdbdfa5caU)

#define DFASCAN_DB_FLAG_LONGEST 1 /**< find() reports the longest end */

struct dfa;

namespace dfascan {

/*
 * a header to enclose the serialized DFAs. Values in here cannot (easily)
 * change - add new ones!
 */
struct db_header {
    u32 magic;
    u32 version;
    u32 length;         //!< header and both blobs, in bytes
    u32 flags;
    u32 forward_offset; //!< relative to the header
    u32 forward_length;
    u32 reverse_offset; //!< relative to the header
    u32 reverse_length;
};

/** \brief A match, as half-open byte offsets [start, end). */
struct MatchSpan {
    size_t start;
    size_t end;
};

/** \brief Callback for \ref Database::scan. Return non-zero to stop. */
typedef int (*MatchHandler)(size_t start, size_t end, void *ctx);

/**
 * \brief A compiled pattern.
 *
 * Immutable once built: all query methods are const, keep their state on the
 * stack and may be called from several threads at once.
 */
class Database : noncopyable {
public:
    Database(bytecode_ptr<dfa> fwd, bytecode_ptr<dfa> rev, bool longest);
    ~Database();

    /** \brief True if the pattern matches anywhere in the data. */
    bool isMatch(const char *data, size_t len) const;
    bool isMatch(const std::string &data) const;

    /** \brief Finds the earliest match end over matches starting at or after
     * \a start. */
    bool shortestMatch(const char *data, size_t len, size_t start,
                       size_t *end) const;
    bool shortestMatch(const std::string &data, size_t start,
                       size_t *end) const;

    /**
     * \brief Finds the leftmost match starting at or after \a start.
     *
     * The match end is the leftmost-first end if the database was compiled
     * for longest matches, otherwise the earliest end.
     */
    bool find(const char *data, size_t len, size_t start,
              MatchSpan *out) const;
    bool find(const std::string &data, size_t start, MatchSpan *out) const;

    /**
     * \brief Reports non-overlapping matches from left to right.
     *
     * After an empty match the search resumes one byte on; an empty match
     * starting where the previous match ended is not reported.
     *
     * \return false if the callback stopped the scan.
     */
    bool scan(const char *data, size_t len, MatchHandler onEvent,
              void *ctx) const;

    const dfa *forward() const { return fwd.get(); }
    const dfa *reverse() const { return rev.get(); }

    bool longestMatch() const { return longest; }

    /** \brief Bytes held by both DFAs. */
    size_t size() const;

    /** \brief One-line summary of both DFAs. */
    std::string info() const;

    /** \brief Flattens the database into a byte string. */
    std::string serialize() const;

    /**
     * \brief Rebuilds a database from \ref serialize output.
     *
     * \throw CompileError if the bytes are not a well-formed database.
     */
    static std::unique_ptr<Database> deserialize(const char *bytes,
                                                 size_t len);

private:
    bytecode_ptr<dfa> fwd;
    bytecode_ptr<dfa> rev;
    bool longest;
};

} // namespace dfascan

#endif
