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
 * \brief Base class for all components, and the simple leaf components.
 */

#include "Component.h"

#include "ComponentAssertion.h"
#include "ComponentBackReference.h"
#include "ComponentBoundary.h"
#include "ComponentEmpty.h"
#include "ComponentWordBoundary.h"
#include "util/compile_error.h"

using namespace std;

namespace dfascan {

Component::Component() : loc(NO_LOCATION) {}

Component::~Component() {}

ComponentBoundary::ComponentBoundary(enum Boundary bound) : m_bound(bound) {}

ComponentBoundary::~ComponentBoundary() {}

ComponentBoundary *ComponentBoundary::clone() const {
    return new ComponentBoundary(*this);
}

ComponentWordBoundary::ComponentWordBoundary(bool negated_in)
    : negated(negated_in) {}

ComponentWordBoundary::~ComponentWordBoundary() {}

ComponentWordBoundary *ComponentWordBoundary::clone() const {
    return new ComponentWordBoundary(*this);
}

ComponentEmpty::ComponentEmpty() {}

ComponentEmpty::~ComponentEmpty() {}

ComponentEmpty *ComponentEmpty::clone() const {
    return new ComponentEmpty(*this);
}

ComponentBackReference::ComponentBackReference(unsigned int id)
    : ref_id(id) {}

ComponentBackReference::~ComponentBackReference() {}

ComponentBackReference *ComponentBackReference::clone() const {
    return new ComponentBackReference(*this);
}

ComponentAssertion::ComponentAssertion(enum Direction dir, enum Sense sense,
                                       unique_ptr<Component> sub)
    : m_dir(dir), m_sense(sense), sub_comp(move(sub)) {}

ComponentAssertion::ComponentAssertion(const ComponentAssertion &other)
    : Component(other), m_dir(other.m_dir), m_sense(other.m_sense),
      sub_comp(other.sub_comp ? other.sub_comp->clone() : nullptr) {}

ComponentAssertion::~ComponentAssertion() {}

ComponentAssertion *ComponentAssertion::clone() const {
    return new ComponentAssertion(*this);
}

void ComponentAssertion::accept(ConstComponentVisitor &v) const {
    v.pre(*this);
    if (sub_comp) {
        sub_comp->accept(v);
    }
    v.post(*this);
}

} // namespace dfascan
