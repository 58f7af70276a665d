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
 * \brief Lookahead/lookbehind zero-width assertions.
 */

#ifndef PARSER_COMPONENTASSERTION_H
#define PARSER_COMPONENTASSERTION_H

#include "Component.h"

#include <memory>

namespace dfascan {

/** \brief Lookaround assertion, (?=...), (?!...), (?<=...) or (?<!...). Not
 * supported by the compiler. */
class ComponentAssertion : public Component {
public:
    enum Direction {
        LOOKAHEAD,  //!< lookahead (forward) assertion
        LOOKBEHIND  //!< lookbehind (backward) assertion
    };

    enum Sense {
        POS, //!< positive assertion, (?=...) or (?<=...)
        NEG  //!< negative assertion, (?!...) or (?<!...)
    };

    ComponentAssertion(enum Direction dir, enum Sense sense,
                       std::unique_ptr<Component> sub);
    ~ComponentAssertion() override;
    ComponentAssertion *clone() const override;

    void accept(ConstComponentVisitor &v) const override;

    bool empty() const override { return true; }

    enum Direction getDirection() const { return m_dir; }
    enum Sense getSense() const { return m_sense; }

private:
    ComponentAssertion(const ComponentAssertion &other);

    enum Direction m_dir;
    enum Sense m_sense;
    std::unique_ptr<Component> sub_comp;
};

} // namespace dfascan

#endif
