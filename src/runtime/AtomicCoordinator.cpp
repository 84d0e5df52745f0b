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

#include "Interop.h"
#include "AtomicCoordinator.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/PromiseStore.h"

namespace Interop {

void AtomicCoordinator::track(ExecutionState& state, const PromiseId& parentId, const PromiseIdVector& children, bool adopt)
{
    ASSERT(!adopt || children.size() == 1);

    AtomicState* atomicState = new AtomicState(parentId, children.size(), adopt);
    m_states.insert(std::make_pair(parentId, atomicState));

    INTEROP_LOG_TRACE("[chain %llu] %s waits for %zu children\n", (unsigned long long)m_environment->chainId(), parentId.toShortString().data(), children.size());

    if (children.empty()) {
        settleParent(state, atomicState, PromiseObject::Resolved, PayloadEncoding::encodeList(OptionalPayloadVector()));
        return;
    }

    for (size_t i = 0; i < children.size() && !atomicState->m_settled; i++) {
        Optional<PromiseObject*> child = m_environment->promiseStore()->find(children[i]);
        if (!child) {
            char buffer[256];
            snprintf(buffer, sizeof(buffer), ErrorObject::Messages::UnknownPromise, "awaitChildren", children[i].toShortString().data());
            settleParent(state, atomicState, PromiseObject::Rejected, ErrorObject(ErrorObject::UnknownPromise, buffer).toPayload());
            return;
        }

        if (child->isTerminal()) {
            childSettled(state, atomicState, i, child.value());
        } else {
            Waiter waiter = { atomicState, i };
            m_waiters[children[i]].push_back(waiter);
        }
    }
}

void AtomicCoordinator::didSettlePromise(ExecutionState& state, PromiseObject* promise)
{
    auto iter = m_waiters.find(promise->id());
    if (iter == m_waiters.end()) {
        return;
    }

    WaiterVector waiters = iter->second;
    m_waiters.erase(iter);
    for (size_t i = 0; i < waiters.size(); i++) {
        childSettled(state, waiters[i].m_state, waiters[i].m_index, promise);
    }
}

void AtomicCoordinator::childSettled(ExecutionState& state, AtomicState* atomicState, size_t index, PromiseObject* child)
{
    if (atomicState->m_settled) {
        return;
    }

    if (child->state() == PromiseObject::Rejected) {
        // fail fast; later children are ignored
        settleParent(state, atomicState, PromiseObject::Rejected, child->value());
        return;
    }

    atomicState->m_results[index] = child->value();
    atomicState->m_resolvedChildren++;
    ASSERT(atomicState->m_resolvedChildren <= atomicState->m_totalChildren);
    if (atomicState->m_resolvedChildren < atomicState->m_totalChildren) {
        return;
    }

    if (atomicState->m_adopt) {
        settleParent(state, atomicState, PromiseObject::Resolved, atomicState->m_results[0]);
        return;
    }

    OptionalPayloadVector results;
    for (size_t i = 0; i < atomicState->m_results.size(); i++) {
        results.push_back(atomicState->m_results[i]);
    }
    settleParent(state, atomicState, PromiseObject::Resolved, PayloadEncoding::encodeList(results));
}

void AtomicCoordinator::settleParent(ExecutionState& state, AtomicState* atomicState, PromiseObject::PromiseState newState, const Payload& value)
{
    atomicState->m_settled = true;
    // children settle in whatever frame resolved them; the parent belongs to the engine
    ExecutionState engineState(&state, m_environment->engineAddress());
    PromiseObject* parent = m_environment->promiseStore()->get(engineState, atomicState->m_parentId, "awaitChildren");
    m_environment->promiseStore()->settle(engineState, parent, newState, value, "awaitChildren");
}
} // namespace Interop
