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
 * \brief Small regex text parser producing Component trees, for tests and
 * tools.
 */

#ifndef PATTERN_PARSER_H
#define PATTERN_PARSER_H

#include "parser/Component.h"

#include <memory>
#include <string>

/**
 * \brief Parses \a re into a Component tree.
 *
 * Supported syntax:
 *  - literals, UTF-8 encoded in the pattern text, and '.' (any code point);
 *  - bracket classes with ranges and negation, and the escapes \\d \\w \\s
 *    \\D \\W \\S (ASCII definitions);
 *  - \\xHH (a single raw byte), \\x{H...} (a code point) and \\C (any byte);
 *  - groups (...) and (?:...), alternation, and the quantifiers * + ? {m}
 *    {m,} {m,n}, each optionally followed by '?' for a lazy repeat;
 *  - ^ $ \\b \\B;
 *  - look-around (?= (?! (?<= (?<! and back-references \\1 to \\9, which the
 *    compiler rejects.
 *
 * Class ranges and repeat bounds are passed through unchecked. Every node
 * records the offset of its first character as its location.
 *
 * \throw dfascan::CompileError on malformed syntax.
 */
std::unique_ptr<dfascan::Component> parsePattern(const std::string &re);

#endif
