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
#include "TimeoutRegistry.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/Platform.h"
#include "runtime/PromiseStore.h"

namespace Interop {

PromiseId TimeoutRegistry::createTimeout(ExecutionState& state, uint64_t delay)
{
    uint64_t now = m_environment->platform()->currentTime(m_environment);
    uint64_t deadline = (delay > std::numeric_limits<uint64_t>::max() - now) ? std::numeric_limits<uint64_t>::max() : now + delay;

    PromiseId id = IdentifierHasher("timeout").add(m_environment->chainId()).add(m_createCount++).finish();
    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->create(engineState, id, m_environment->engineAddress());
    m_deadlines.insert(std::make_pair(id, deadline));

    INTEROP_LOG_TRACE("[chain %llu] timeout %s at %llu\n", (unsigned long long)m_environment->chainId(), id.toShortString().data(), (unsigned long long)deadline);
    return id;
}

void TimeoutRegistry::resolveTimeout(ExecutionState& state, const PromiseId& id)
{
    auto iter = m_deadlines.find(id);
    if (UNLIKELY(iter == m_deadlines.end())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::UnknownPromise, ErrorObject::Messages::UnknownPromise, "resolveTimeout", id.toShortString().data());
    }

    uint64_t deadline = iter->second;
    PromiseObject* promise = m_environment->promiseStore()->get(state, id, "resolveTimeout");
    if (UNLIKELY(promise->isTerminal())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyTerminal, ErrorObject::Messages::AlreadyTerminal, "resolveTimeout", id.toShortString().data());
    }
    if (m_environment->platform()->currentTime(m_environment) < deadline) {
        ErrorObject::throwBuiltinError(state, ErrorObject::NotReady, ErrorObject::Messages::NotReady_Deadline, "resolveTimeout", id.toShortString().data());
    }

    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->settle(engineState, promise, PromiseObject::Resolved, PayloadEncoding::fromUInt64(deadline), "resolveTimeout");
}
} // namespace Interop
