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
 * \brief Repeats ('*', '+', '?', '{M,N}', etc)
 */

#ifndef PARSER_COMPONENTREPEAT_H
#define PARSER_COMPONENTREPEAT_H

#include "Component.h"
#include "dfascan_common.h"

#include <memory>
#include <utility>

namespace dfascan {

/**
 * \brief Encapsulates a repeat of a subexpression ('*', '+', '?', '{M,N}',
 * etc).
 *
 * Bounds are only checked at compile time: min > max is rejected there with
 * InvalidRangeBoundary.
 */
class ComponentRepeat : public Component {
public:
    /** \brief Value representing no maximum bound. */
    static constexpr u32 NoLimit = 0xffffffff;

    /** \brief Type of this repeat, characterising its greediness. */
    enum RepeatType {
        /** Minimising repeat, like 'a*?'. */
        REPEAT_NONGREEDY,
        /** Maximising repeat, like 'a*'. This is the default in PCRE. */
        REPEAT_GREEDY,
    };

    ComponentRepeat(std::unique_ptr<Component> sub_comp, u32 min, u32 max,
                    RepeatType t);
    ~ComponentRepeat() override;
    ComponentRepeat *clone() const override;

    void accept(ConstComponentVisitor &v) const override;

    bool empty() const override;

    std::pair<u32, u32> getBounds() const {
        return std::make_pair(m_min, m_max);
    }

    const Component &getSub() const { return *sub_comp; }

    enum RepeatType type;

private:
    ComponentRepeat(const ComponentRepeat &other);

    std::unique_ptr<Component> sub_comp;
    u32 m_min;
    u32 m_max;
};

std::unique_ptr<ComponentRepeat>
makeComponentRepeat(std::unique_ptr<Component> sub_comp, u32 min, u32 max,
                    ComponentRepeat::RepeatType t);

} // namespace dfascan

#endif
