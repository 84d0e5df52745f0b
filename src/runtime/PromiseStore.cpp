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
#include "PromiseStore.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"

namespace Interop {

PromiseObject* PromiseStore::create(ExecutionState& state, const PromiseId& id, Address creator, PromiseObject::Origin origin, ChainId remoteChain)
{
    if (UNLIKELY(contains(id))) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyExists, ErrorObject::Messages::AlreadyExists, "create", id.toShortString().data());
    }

    PromiseObject* promise = new PromiseObject(id, creator, origin, remoteChain);
    m_promises.insert(std::make_pair(id, promise));
    m_environment->didCreatePromise(state, promise);
    return promise;
}

PromiseObject* PromiseStore::createSettled(ExecutionState& state, const PromiseId& id, Address creator, PromiseObject::Origin origin, ChainId remoteChain,
                                          PromiseObject::PromiseState settledState, const Payload& value)
{
    ASSERT(settledState != PromiseObject::Pending);
    PromiseObject* promise = create(state, id, creator, origin, remoteChain);
    promise->settle(settledState, value);
    m_environment->didSettlePromise(state, promise);
    return promise;
}

PromiseObject* PromiseStore::get(ExecutionState& state, const PromiseId& id, const char* entrypoint) const
{
    auto iter = m_promises.find(id);
    if (UNLIKELY(iter == m_promises.end())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::UnknownPromise, ErrorObject::Messages::UnknownPromise, entrypoint, id.toShortString().data());
    }
    return iter->second;
}

void PromiseStore::resolve(ExecutionState& state, const PromiseId& id, const Payload& value)
{
    settle(state, get(state, id, "resolve"), PromiseObject::Resolved, value, "resolve");
}

void PromiseStore::reject(ExecutionState& state, const PromiseId& id, const Payload& value)
{
    settle(state, get(state, id, "reject"), PromiseObject::Rejected, value, "reject");
}

void PromiseStore::settle(ExecutionState& state, PromiseObject* promise, PromiseObject::PromiseState newState, const Payload& value, const char* entrypoint)
{
    if (UNLIKELY(state.caller() != promise->creator())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_NotCreator, entrypoint, promise->id().toShortString().data());
    }
    if (UNLIKELY(promise->isTerminal())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyTerminal, ErrorObject::Messages::AlreadyTerminal, entrypoint, promise->id().toShortString().data());
    }

    promise->settle(newState, value);
    INTEROP_LOG_TRACE("[chain %llu] %s %s (%zu bytes)\n", (unsigned long long)m_environment->chainId(),
                      PromiseObject::stateName(newState), promise->id().toShortString().data(), value.size());
    m_environment->didSettlePromise(state, promise);
}
} // namespace Interop
