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
#include "PromiseAllAggregator.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/PromiseStore.h"

namespace Interop {

PromiseId PromiseAllAggregator::createAll(ExecutionState& state, const PromiseIdVector& memberIds)
{
    for (size_t i = 0; i < memberIds.size(); i++) {
        m_environment->promiseStore()->get(state, memberIds[i], "createAll");
    }

    PromiseId allId = IdentifierHasher("all").add(m_environment->chainId()).add(m_createCount++).finish();
    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->create(engineState, allId, m_environment->engineAddress());
    m_members.insert(std::make_pair(allId, memberIds));
    return allId;
}

PromiseAllStatus PromiseAllAggregator::checkAll(ExecutionState& state, const PromiseId& allId)
{
    auto iter = m_members.find(allId);
    if (UNLIKELY(iter == m_members.end())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::UnknownPromise, ErrorObject::Messages::UnknownPromise, "checkAll", allId.toShortString().data());
    }

    const PromiseIdVector& members = iter->second;
    PromiseAllStatus status;
    Optional<PromiseObject*> firstRejected;
    size_t resolvedCount = 0;
    for (size_t i = 0; i < members.size(); i++) {
        PromiseObject* member = m_environment->promiseStore()->get(state, members[i], "checkAll");
        if (member->state() == PromiseObject::Resolved) {
            status.results.push_back(member->value());
            resolvedCount++;
        } else {
            status.results.push_back(nullptr);
            if (member->state() == PromiseObject::Rejected && !firstRejected) {
                firstRejected = member;
            }
        }
    }

    status.failed = firstRejected.hasValue();
    status.ready = status.failed || resolvedCount == members.size();

    PromiseObject* backing = m_environment->promiseStore()->get(state, allId, "checkAll");
    if (status.ready && backing->isPending()) {
        ExecutionState engineState(&state, m_environment->engineAddress());
        if (status.failed) {
            m_environment->promiseStore()->settle(engineState, backing, PromiseObject::Rejected, firstRejected->value(), "checkAll");
        } else {
            m_environment->promiseStore()->settle(engineState, backing, PromiseObject::Resolved, PayloadEncoding::encodeList(status.results), "checkAll");
        }
    }
    return status;
}
} // namespace Interop
