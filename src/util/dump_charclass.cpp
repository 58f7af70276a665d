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
 * \brief Dump code for byte classes (expressed as CharReach objects).
 */

#include "config.h"

// Everything in this file is dump code
#if defined(DUMP_SUPPORT)

#include "charreach.h"
#include "dump_charclass.h"

#include <cctype>
#include <iomanip>
#include <sstream>

using std::string;
using std::ostream;

namespace dfascan {

static
void describeByte(ostream &os, u8 c, enum cc_output_t out_type) {
    // these characters must always be escaped
    static const string escaped("^-[]\\");
    const string backslash((out_type == CC_OUT_DOT ? 2 : 1), '\\');

    if (c < 0x80 && isgraph(c)) {
        if (escaped.find((char)c) != string::npos) {
            os << backslash << (char)c;
        } else if (out_type == CC_OUT_DOT && c == '"') {
            os << "\\\"";
        } else {
            os << (char)c;
        }
    } else if (c == '\t') {
        os << backslash << 't';
    } else if (c == '\n') {
        os << backslash << 'n';
    } else if (c == '\r') {
        os << backslash << 'r';
    } else {
        auto fmt(os.flags());
        os << backslash << 'x' << std::hex << std::setw(2)
           << std::setfill('0') << (unsigned)c;
        os.flags(fmt);
    }
}

/** Renders \a cr as runs, returning the number of runs written. */
static
size_t describeRuns(ostream &os, const CharReach &cr, size_t maxLength,
                    enum cc_output_t out_type) {
    size_t runs = 0;
    size_t c = cr.find_first();
    while (c != CharReach::npos) {
        size_t last = c;
        while (last + 1 < N_CHARS && cr.test(last + 1)) {
            last++;
        }
        if (runs++ == maxLength) {
            os << "...";
            return runs;
        }
        describeByte(os, (u8)c, out_type);
        if (last > c) {
            if (last > c + 1) {
                os << '-';
            }
            describeByte(os, (u8)last, out_type);
        }
        c = cr.find_next(last);
    }
    return runs;
}

void describeClass(ostream &os, const CharReach &cr, size_t maxLength,
                   enum cc_output_t out_type) {
    if (cr.all()) {
        os << "<any>";
        return;
    }

    if (cr.none()) {
        os << "<empty>";
        return;
    }

    if (cr.count() == 1) {
        describeByte(os, (u8)cr.find_first(), out_type);
        return;
    }

    // build up a normal string and a negated one, and see which is shorter
    std::ostringstream out;
    describeRuns(out, cr, maxLength, out_type);
    std::ostringstream neg;
    describeRuns(neg, ~cr, maxLength, out_type);

    if (out.tellp() <= neg.tellp()) {
        os << '[' << out.str() << ']';
    } else {
        os << "[^" << neg.str() << ']';
    }
}

string describeClass(const CharReach &cr, size_t maxLength,
                     enum cc_output_t out_type) {
    std::ostringstream oss;
    describeClass(oss, cr, maxLength, out_type);
    return oss.str();
}

void describeClass(FILE *f, const CharReach &cr, size_t maxLength,
                   enum cc_output_t out_type) {
    fprintf(f, "%s", describeClass(cr, maxLength, out_type).c_str());
}

} // namespace dfascan

#endif // DUMP_SUPPORT
