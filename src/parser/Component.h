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
 * \brief Base class for all components.
 */

#ifndef PARSER_COMPONENT_H
#define PARSER_COMPONENT_H

#include "ConstComponentVisitor.h"

#include "dfascan_common.h"

namespace dfascan {

/** \brief Base class for regular expression syntax tree components.
 *
 * The tree is produced by an external parser and handed to \ref compile;
 * nothing in the compiler modifies it. */
class Component {
public:
    /** \brief Constructor. */
    Component();

    /** \brief Destructor. */
    virtual ~Component();

    /** \brief Returns a newly-allocated deep copy of this component. */
    virtual Component *clone() const = 0;

    /** \brief Apply the given const visitor functor. */
    virtual void accept(ConstComponentVisitor &v) const = 0;

    /** \brief True iff the component can match without consuming input.
     *
     * Note: ^, $, \\b etc are considered empty. */
    virtual bool empty() const = 0;

    /** \brief Location of this component in the pattern text, or
     * NO_LOCATION. Used only for error reporting. */
    u32 getLoc() const { return loc; }
    void setLoc(u32 l) { loc = l; }

protected:
    // Protected copy ctor. Use clone instead.
    Component(const Component &other) : loc(other.loc) {}

    u32 loc;
};

} // namespace dfascan

#endif
