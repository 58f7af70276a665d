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

#include "util/compile_error.h"

#include <sstream>

using namespace std;

namespace dfascan {

CompileError::CompileError(const string &why)
    : reason(why), hasIndex(false), index(0) {
    assert(!why.empty());
    assert(*why.rbegin() == '.');
}

CompileError::CompileError(u32 idx, const string &why)
    : reason(why), hasIndex(true), index(idx) {
    assert(!why.empty());
    assert(*why.rbegin() == '.');
}

void CompileError::setIndex(u32 idx) {
    hasIndex = true;
    index = idx;
}

CompileError::~CompileError() {}

ResourceLimitError::ResourceLimitError()
    : CompileError("Resource limit exceeded.") {}

ResourceLimitError::ResourceLimitError(const string &why)
    : CompileError(why) {}

ResourceLimitError::~ResourceLimitError() {}

static
string describeLimit(const string &what, size_t limit) {
    ostringstream oss;
    oss << what << " limit of " << limit << " exceeded.";
    return oss.str();
}

StateLimitExceeded::StateLimitExceeded(const string &what, size_t lim)
    : ResourceLimitError(describeLimit(what, lim)), limit(lim) {}

StateLimitExceeded::~StateLimitExceeded() {}

static
string describeConstruct(const string &construct, u32 loc) {
    ostringstream oss;
    oss << construct << " unsupported";
    if (loc != NO_LOCATION) {
        oss << " at index " << loc;
    }
    oss << ".";
    return oss.str();
}

UnsupportedConstruct::UnsupportedConstruct(const string &what, u32 loc)
    : CompileError(describeConstruct(what, loc)), construct(what) {
    if (loc != NO_LOCATION) {
        setIndex(loc);
    }
}

UnsupportedConstruct::~UnsupportedConstruct() {}

InvalidRangeBoundary::InvalidRangeBoundary(const string &why)
    : CompileError(why) {}

InvalidRangeBoundary::InvalidRangeBoundary(u32 loc, const string &why)
    : CompileError(why) {
    if (loc != NO_LOCATION) {
        setIndex(loc);
    }
}

InvalidRangeBoundary::~InvalidRangeBoundary() {}

} // namespace dfascan
