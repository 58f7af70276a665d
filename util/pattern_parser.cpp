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

#include "pattern_parser.h"

#include "parser/ComponentAlternation.h"
#include "parser/ComponentAssertion.h"
#include "parser/ComponentBackReference.h"
#include "parser/ComponentBoundary.h"
#include "parser/ComponentByte.h"
#include "parser/ComponentClass.h"
#include "parser/ComponentEmpty.h"
#include "parser/ComponentRepeat.h"
#include "parser/ComponentSequence.h"
#include "parser/ComponentWordBoundary.h"
#include "util/compile_error.h"
#include "util/make_unique.h"
#include "util/unicode_def.h"

#include <cctype>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace dfascan;

namespace {

typedef vector<pair<unichar, unichar>> RangeList;

static const RangeList digitRanges = {{'0', '9'}};
static const RangeList wordRanges = {{'0', '9'}, {'A', 'Z'}, {'_', '_'},
                                     {'a', 'z'}};
static const RangeList spaceRanges = {{'\t', '\r'}, {' ', ' '}};

/** Complement of sorted, disjoint ranges over [0, MAX_UNICODE]. */
RangeList complement(const RangeList &in) {
    RangeList out;
    unichar next = 0;
    for (const auto &r : in) {
        if (r.first > next) {
            out.emplace_back(next, r.first - 1);
        }
        next = r.second + 1;
    }
    if (next <= MAX_UNICODE) {
        out.emplace_back(next, MAX_UNICODE);
    }
    return out;
}

class PatternParser {
public:
    explicit PatternParser(const string &re_in) : re(re_in) {}

    unique_ptr<Component> parse() {
        auto root = parseAlternation();
        if (pos != re.size()) {
            fail("Unmatched parenthesis.");
        }
        return root;
    }

private:
    [[noreturn]] void fail(const string &why) const {
        throw CompileError(pos, why);
    }

    bool atEnd() const { return pos >= re.size(); }
    u8 peek() const { return (u8)re[pos]; }

    bool consume(char c) {
        if (!atEnd() && re[pos] == c) {
            pos++;
            return true;
        }
        return false;
    }

    bool consume(const char *s) {
        size_t n = strlen(s);
        if (re.compare(pos, n, s) == 0) {
            pos += n;
            return true;
        }
        return false;
    }

    template<class T>
    unique_ptr<T> located(unique_ptr<T> c, size_t loc) {
        c->setLoc(loc);
        return c;
    }

    unique_ptr<Component> parseAlternation();
    unique_ptr<Component> parseSequence();
    unique_ptr<Component> parseAtom();
    unique_ptr<Component> parseQuantifier(unique_ptr<Component> atom,
                                          size_t loc);
    unique_ptr<Component> parseGroup(size_t loc);
    unique_ptr<Component> parseEscape(size_t loc);
    unique_ptr<Component> parseBracket(size_t loc);

    unichar parseLiteralChar();
    unichar parseHexCodePoint();
    u32 parseNumber();

    unique_ptr<Component> classOf(const RangeList &ranges, bool negated,
                                  size_t loc) {
        auto cc = make_unique<ComponentClass>();
        for (const auto &r : ranges) {
            cc->addRange(r.first, r.second);
        }
        if (negated) {
            cc->negate();
        }
        return located(move(cc), loc);
    }

    const string &re;
    size_t pos = 0;
};

unique_ptr<Component> PatternParser::parseAlternation() {
    size_t loc = pos;
    auto first = parseSequence();
    if (atEnd() || peek() != '|') {
        return first;
    }

    auto alt = make_unique<ComponentAlternation>();
    alt->append(move(first));
    while (consume('|')) {
        alt->append(parseSequence());
    }
    return located(move(alt), loc);
}

unique_ptr<Component> PatternParser::parseSequence() {
    auto seq = located(make_unique<ComponentSequence>(), pos);
    while (!atEnd() && peek() != '|' && peek() != ')') {
        size_t loc = pos;
        auto atom = parseAtom();
        seq->addComponent(parseQuantifier(move(atom), loc));
    }
    return move(seq);
}

u32 PatternParser::parseNumber() {
    if (atEnd() || peek() < '0' || peek() > '9') {
        fail("Expected a number.");
    }
    u64a n = 0;
    while (!atEnd() && peek() >= '0' && peek() <= '9') {
        n = n * 10 + (peek() - '0');
        if (n >= ComponentRepeat::NoLimit) {
            fail("Number too large.");
        }
        pos++;
    }
    return (u32)n;
}

unique_ptr<Component>
PatternParser::parseQuantifier(unique_ptr<Component> atom, size_t loc) {
    while (!atEnd()) {
        u32 min, max;
        size_t save = pos;
        if (consume('*')) {
            min = 0;
            max = ComponentRepeat::NoLimit;
        } else if (consume('+')) {
            min = 1;
            max = ComponentRepeat::NoLimit;
        } else if (consume('?')) {
            min = 0;
            max = 1;
        } else if (consume('{')) {
            if (atEnd() || peek() < '0' || peek() > '9') {
                // Not a bound: treat '{' as a literal.
                pos = save;
                return atom;
            }
            min = parseNumber();
            max = min;
            if (consume(',')) {
                max = consume('}') ? ComponentRepeat::NoLimit : parseNumber();
                if (max != ComponentRepeat::NoLimit && !consume('}')) {
                    fail("Unterminated repeat.");
                }
            } else if (!consume('}')) {
                fail("Unterminated repeat.");
            }
        } else {
            return atom;
        }

        auto type = consume('?') ? ComponentRepeat::REPEAT_NONGREEDY
                                 : ComponentRepeat::REPEAT_GREEDY;
        atom = located(makeComponentRepeat(move(atom), min, max, type), loc);
    }
    return atom;
}

unique_ptr<Component> PatternParser::parseAtom() {
    size_t loc = pos;
    u8 c = peek();
    switch (c) {
    case '(':
        pos++;
        return parseGroup(loc);
    case '[':
        pos++;
        return parseBracket(loc);
    case '.':
        pos++;
        return classOf({{0, MAX_UNICODE}}, false, loc);
    case '^':
        pos++;
        return located(make_unique<ComponentBoundary>(
                           ComponentBoundary::BEGIN_STRING), loc);
    case '$':
        pos++;
        return located(make_unique<ComponentBoundary>(
                           ComponentBoundary::END_STRING), loc);
    case '\\':
        pos++;
        return parseEscape(loc);
    case '*':
    case '+':
    case '?':
        fail("Quantifier does not follow a repeatable item.");
    default: {
        unichar cp = parseLiteralChar();
        return classOf({{cp, cp}}, false, loc);
    }
    }
}

unique_ptr<Component> PatternParser::parseGroup(size_t loc) {
    unique_ptr<Component> sub;
    if (consume("?:")) {
        sub = parseAlternation();
    } else if (consume("?=") || consume("?!") || consume("?<=") ||
               consume("?<!")) {
        bool behind = re[pos - 2] == '<';
        bool neg = re[pos - 1] == '!';
        auto body = parseAlternation();
        sub = make_unique<ComponentAssertion>(
            behind ? ComponentAssertion::LOOKBEHIND
                   : ComponentAssertion::LOOKAHEAD,
            neg ? ComponentAssertion::NEG : ComponentAssertion::POS,
            move(body));
        sub->setLoc(loc);
    } else if (!atEnd() && peek() == '?') {
        fail("Unknown group type.");
    } else {
        sub = parseAlternation();
    }
    if (!consume(')')) {
        fail("Missing close parenthesis.");
    }
    return sub;
}

unichar PatternParser::parseHexCodePoint() {
    u32 v = 0;
    size_t digits = 0;
    while (!atEnd() && isxdigit(peek())) {
        u8 d = peek();
        v = v * 16 + (d <= '9' ? d - '0' : (d | 0x20) - 'a' + 10);
        if (v > MAX_UNICODE) {
            fail("Code point out of range.");
        }
        digits++;
        pos++;
    }
    if (!digits || !consume('}')) {
        fail("Malformed \\x{...} escape.");
    }
    return v;
}

unique_ptr<Component> PatternParser::parseEscape(size_t loc) {
    if (atEnd()) {
        fail("Trailing backslash.");
    }
    u8 c = peek();
    pos++;
    switch (c) {
    case 'd':
    case 'D':
        return classOf(digitRanges, c == 'D', loc);
    case 'w':
    case 'W':
        return classOf(wordRanges, c == 'W', loc);
    case 's':
    case 'S':
        return classOf(spaceRanges, c == 'S', loc);
    case 'b':
    case 'B':
        return located(make_unique<ComponentWordBoundary>(c == 'B'), loc);
    case 'C': {
        auto cb = make_unique<ComponentByte>();
        cb->addRange(0, 0xff);
        return located(move(cb), loc);
    }
    case 'x': {
        if (consume('{')) {
            unichar cp = parseHexCodePoint();
            return classOf({{cp, cp}}, false, loc);
        }
        if (pos + 2 > re.size() || !isxdigit((u8)re[pos]) ||
            !isxdigit((u8)re[pos + 1])) {
            fail("Malformed \\xHH escape.");
        }
        u8 b = (u8)stoul(re.substr(pos, 2), nullptr, 16);
        pos += 2;
        auto cb = make_unique<ComponentByte>();
        cb->addRange(b, b);
        return located(move(cb), loc);
    }
    default:
        break;
    }

    if (c >= '1' && c <= '9') {
        return located(make_unique<ComponentBackReference>(c - '0'), loc);
    }

    pos--;
    pos--;
    unichar cp = parseLiteralChar();
    return classOf({{cp, cp}}, false, loc);
}

/** Reads one literal, possibly escaped, possibly multi-byte UTF-8. */
unichar PatternParser::parseLiteralChar() {
    if (consume('\\')) {
        if (atEnd()) {
            fail("Trailing backslash.");
        }
        u8 e = peek();
        pos++;
        switch (e) {
        case 'n':
            return '\n';
        case 't':
            return '\t';
        case 'r':
            return '\r';
        case 'f':
            return '\f';
        case 'v':
            return '\v';
        case 'x':
            if (consume('{')) {
                return parseHexCodePoint();
            }
            if (pos + 2 > re.size() || !isxdigit((u8)re[pos]) ||
                !isxdigit((u8)re[pos + 1])) {
                fail("Malformed \\xHH escape.");
            }
            pos += 2;
            return (unichar)stoul(re.substr(pos - 2, 2), nullptr, 16);
        default:
            if (e >= 0x80) {
                pos--;
                break; // escaped multi-byte literal
            }
            return e;
        }
    }

    u8 lead = peek();
    size_t len;
    unichar cp;
    if (lead < 0x80) {
        pos++;
        return lead;
    } else if ((lead & 0xe0) == UTF_TWO_BYTE_HEADER) {
        len = 2;
        cp = lead & 0x1f;
    } else if ((lead & 0xf0) == UTF_THREE_BYTE_HEADER) {
        len = 3;
        cp = lead & 0x0f;
    } else if ((lead & 0xf8) == UTF_FOUR_BYTE_HEADER) {
        len = 4;
        cp = lead & 0x07;
    } else {
        fail("Invalid UTF-8 in pattern.");
    }
    if (pos + len > re.size()) {
        fail("Truncated UTF-8 in pattern.");
    }
    for (size_t i = 1; i < len; i++) {
        u8 b = (u8)re[pos + i];
        if ((b & 0xc0) != UTF_CONT_BYTE_HEADER) {
            fail("Invalid UTF-8 in pattern.");
        }
        cp = (cp << UTF_CONT_SHIFT) | (b & UTF_CONT_BYTE_VALUE_MASK);
    }
    pos += len;
    return cp;
}

unique_ptr<Component> PatternParser::parseBracket(size_t loc) {
    auto cc = make_unique<ComponentClass>();
    cc->setLoc(loc);
    bool negated = consume('^');
    bool first = true;

    while (true) {
        if (atEnd()) {
            fail("Unterminated character class.");
        }
        if (peek() == ']' && !first) {
            pos++;
            break;
        }
        first = false;

        if (peek() == '\\' && pos + 1 < re.size()) {
            u8 e = (u8)re[pos + 1];
            const RangeList *shorthand = nullptr;
            switch (e | 0x20) {
            case 'd':
                shorthand = &digitRanges;
                break;
            case 'w':
                shorthand = &wordRanges;
                break;
            case 's':
                shorthand = &spaceRanges;
                break;
            default:
                break;
            }
            if (shorthand) {
                pos += 2;
                RangeList ranges = e & 0x20 ? *shorthand
                                            : complement(*shorthand);
                for (const auto &r : ranges) {
                    cc->addRange(r.first, r.second);
                }
                continue;
            }
        }

        unichar lo = parseLiteralChar();
        unichar hi = lo;
        if (pos + 1 < re.size() && peek() == '-' && re[pos + 1] != ']') {
            pos++;
            hi = parseLiteralChar();
        }
        cc->addRange(lo, hi);
    }

    if (negated) {
        cc->negate();
    }
    return move(cc);
}

} // namespace

unique_ptr<Component> parsePattern(const string &re) {
    PatternParser p(re);
    return p.parse();
}
