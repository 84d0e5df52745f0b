/*
 * Copyright (c) 2017-present Samsung Electronics Co., Ltd
 *
 *  This library is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public
 *  License as published by the Free Software Foundation; either
 *  version 2.1 of the License, or (at your option) any later version.
 *
 *  This library is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *  Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public
 *  License along with this library; if not, write to the Free Software
 *  Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301
 *  USA
 */

#ifndef __InteropAtomicCoordinator__
#define __InteropAtomicCoordinator__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;

// Settles a continuation from the outcome of child promises instead of from
// the value its handler returned.
class AtomicCoordinator : public gc {
public:
    struct AtomicState : public gc {
        AtomicState(const PromiseId& parentId, size_t totalChildren, bool adopt)
            : m_parentId(parentId)
            , m_totalChildren(totalChildren)
            , m_resolvedChildren(0)
            , m_adopt(adopt)
            , m_settled(false)
            , m_results(totalChildren)
        {
        }

        PromiseId m_parentId;
        size_t m_totalChildren;
        size_t m_resolvedChildren;
        // Await: the parent takes the only child's outcome verbatim
        bool m_adopt;
        bool m_settled;
        std::vector<Payload> m_results;
    };

    explicit AtomicCoordinator(Environment* environment)
        : m_environment(environment)
    {
    }

    // the caller must be the creator of parentId
    void track(ExecutionState& state, const PromiseId& parentId, const PromiseIdVector& children, bool adopt);

    void didSettlePromise(ExecutionState& state, PromiseObject* promise);

    Optional<AtomicState*> atomicState(const PromiseId& parentId) const
    {
        auto iter = m_states.find(parentId);
        if (iter == m_states.end()) {
            return nullptr;
        }
        return iter->second;
    }

private:
    struct Waiter {
        AtomicState* m_state;
        size_t m_index;
    };
    typedef std::vector<Waiter, gc_allocator<Waiter>> WaiterVector;

    void childSettled(ExecutionState& state, AtomicState* atomicState, size_t index, PromiseObject* child);
    void settleParent(ExecutionState& state, AtomicState* atomicState, PromiseObject::PromiseState newState, const Payload& value);

    Environment* m_environment;
    PromiseIdMap<AtomicState*> m_states;
    PromiseIdMap<WaiterVector> m_waiters;
};
} // namespace Interop

#endif
