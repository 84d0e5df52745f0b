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
#include "CrossChainForwarder.h"
#include "runtime/CallbackRegistry.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/PromiseStore.h"
#include "runtime/serialization/MessageSerializer.h"
#include "runtime/serialization/SerializedExecuteRemoteCallbackMessage.h"
#include "runtime/serialization/SerializedResolveProxyMessage.h"
#include "runtime/serialization/SerializedSetupRemotePromiseMessage.h"
#include "runtime/serialization/SerializedSharePromiseMessage.h"

namespace Interop {

PromiseId CrossChainForwarder::then(ExecutionState& state, const PromiseId& parentId, ChainId destinationChain, Address target,
                                    Selector successSelector, Optional<Selector> errorSelector)
{
    if (destinationChain == m_environment->chainId()) {
        return m_environment->callbackRegistry()->then(state, parentId, target, successSelector, errorSelector);
    }

    PromiseObject* parent = m_environment->promiseStore()->get(state, parentId, "then");
    PromiseId remoteId = IdentifierHasher("remote").add(parentId).add(destinationChain).add(parent->nextRegistrationNonce()).finish();

    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->create(engineState, remoteId, m_environment->engineAddress(), PromiseObject::Proxy, destinationChain);

    CallbackRecord* record = new CallbackRecord(CallbackRecord::Remote, parentId, remoteId, target, successSelector, errorSelector,
                                                state.caller(), m_environment->chainId(), destinationChain);
    m_forwardingRecords.insert(std::make_pair(remoteId, record));
    m_environment->callbackRegistry()->appendCallback(parent, record);

    INTEROP_LOG_TRACE("[chain %llu] forward %s to chain %llu as %s\n", (unsigned long long)m_environment->chainId(),
                      parentId.toShortString().data(), (unsigned long long)destinationChain, remoteId.toShortString().data());
    return remoteId;
}

void CrossChainForwarder::dispatch(ExecutionState& state, PromiseObject* parent, CallbackRecord* record)
{
    ASSERT(record->kind() == CallbackRecord::Remote);
    ASSERT(parent->isTerminal());

    if (parent->state() == PromiseObject::Rejected) {
        // nothing crosses the chain boundary for a rejected parent
        record->deactivate();
        ExecutionState engineState(&state, m_environment->engineAddress());
        PromiseObject* proxy = m_environment->promiseStore()->get(engineState, record->continuationId(), "executePromiseCallbacks");
        m_environment->promiseStore()->settle(engineState, proxy, PromiseObject::Rejected, parent->value(), "executePromiseCallbacks");
        return;
    }

    SerializedSetupRemotePromiseMessage setup(record->continuationId(), record->sourceChain(), record->registrant(),
                                              record->target(), record->successSelector(), record->errorSelector());
    m_environment->sendMessage(record->destinationChain(), MessageSerializer::serialize(setup));

    SerializedExecuteRemoteCallbackMessage execute(record->continuationId(), parent->value());
    m_environment->sendMessage(record->destinationChain(), MessageSerializer::serialize(execute));
}

void CrossChainForwarder::setupRemotePromise(ExecutionState& state, ChainId sourceChain, const SerializedSetupRemotePromiseMessage& message)
{
    const PromiseId& remoteId = message.promiseId();
    if (UNLIKELY(message.sourceChain() != sourceChain)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_SourceMismatch,
                                       "setupRemotePromise", remoteId.toShortString().data(), (unsigned long long)sourceChain);
    }
    if (UNLIKELY(m_bindings.find(remoteId) != m_bindings.end() || m_environment->promiseStore()->contains(remoteId))) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyExists, ErrorObject::Messages::AlreadyExists, "setupRemotePromise", remoteId.toShortString().data());
    }

    ExecutionState engineState(&state, m_environment->engineAddress());
    PromiseObject* mirror = m_environment->promiseStore()->create(engineState, remoteId, m_environment->engineAddress(), PromiseObject::Mirror, sourceChain);
    PromiseId returnId = returnPromiseId(remoteId);
    m_environment->promiseStore()->create(engineState, returnId, m_environment->engineAddress());

    // provenance comes from the message, never from the relay
    CallbackRecord* record = new CallbackRecord(CallbackRecord::Then, remoteId, returnId, message.target(), message.successSelector(),
                                                message.errorSelector(), message.registrant(), message.sourceChain(), m_environment->chainId());
    m_bindings.insert(std::make_pair(remoteId, RemoteBinding(sourceChain, remoteId)));
    m_returnRoutes.insert(std::make_pair(returnId, RemoteBinding(sourceChain, remoteId)));
    m_environment->callbackRegistry()->appendCallback(mirror, record);
}

void CrossChainForwarder::executeRemoteCallback(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, const Payload& value)
{
    auto iter = m_bindings.find(remoteId);
    if (UNLIKELY(iter == m_bindings.end())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unordered, ErrorObject::Messages::Unordered, "executeRemoteCallback", remoteId.toShortString().data());
    }
    if (UNLIKELY(iter->second.m_sourceChain != sourceChain)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_SourceMismatch,
                                       "executeRemoteCallback", remoteId.toShortString().data(), (unsigned long long)sourceChain);
    }

    PromiseObject* mirror = m_environment->promiseStore()->get(state, remoteId, "executeRemoteCallback");
    if (UNLIKELY(mirror->isTerminal())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyTerminal, ErrorObject::Messages::AlreadyTerminal, "executeRemoteCallback", remoteId.toShortString().data());
    }

    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->settle(engineState, mirror, PromiseObject::Resolved, value, "executeRemoteCallback");
    m_environment->callbackRegistry()->executePromiseCallbacks(engineState, remoteId);
}

void CrossChainForwarder::resolveRemoteProxy(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, PromiseObject::PromiseState newState, const Payload& value)
{
    ASSERT(newState != PromiseObject::Pending);

    auto iter = m_forwardingRecords.find(remoteId);
    if (UNLIKELY(iter == m_forwardingRecords.end())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::UnknownPromise, ErrorObject::Messages::UnknownPromise, "resolveRemoteProxy", remoteId.toShortString().data());
    }

    CallbackRecord* record = iter->second;
    if (UNLIKELY(!record->isActive())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::InvalidMessage, ErrorObject::Messages::InvalidMessage_Inactive, "resolveRemoteProxy", remoteId.toShortString().data());
    }
    if (UNLIKELY(record->destinationChain() != sourceChain)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_WrongSourceChain,
                                       "resolveRemoteProxy", remoteId.toShortString().data(), (unsigned long long)sourceChain);
    }

    record->deactivate();
    ExecutionState engineState(&state, m_environment->engineAddress());
    PromiseObject* proxy = m_environment->promiseStore()->get(engineState, remoteId, "resolveRemoteProxy");
    m_environment->promiseStore()->settle(engineState, proxy, newState, value, "resolveRemoteProxy");
}

void CrossChainForwarder::sharePromise(ExecutionState& state, ChainId destinationChain, const PromiseId& id)
{
    PromiseObject* promise = m_environment->promiseStore()->get(state, id, "sharePromise");
    if (UNLIKELY(promise->isPending())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::NotReady, ErrorObject::Messages::NotReady, "sharePromise", id.toShortString().data());
    }

    SerializedSharePromiseMessage message(id, promise->state(), promise->creator(), promise->value());
    m_environment->sendMessage(destinationChain, MessageSerializer::serialize(message));
}

void CrossChainForwarder::shareResolvedPromise(ExecutionState& state, ChainId sourceChain, const SerializedSharePromiseMessage& message)
{
    const PromiseId& id = message.promiseId();
    if (UNLIKELY(m_environment->promiseStore()->contains(id))) {
        ErrorObject::throwBuiltinError(state, ErrorObject::AlreadyExists, ErrorObject::Messages::AlreadyExists, "shareResolvedPromise", id.toShortString().data());
    }

    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->createSettled(engineState, id, message.creator(), PromiseObject::Shared, sourceChain, message.state(), message.value());
}

void CrossChainForwarder::didSettlePromise(ExecutionState& state, PromiseObject* promise)
{
    auto iter = m_returnRoutes.find(promise->id());
    if (iter == m_returnRoutes.end()) {
        return;
    }

    RemoteBinding route = iter->second;
    m_returnRoutes.erase(iter);

    SerializedResolveProxyMessage message(route.m_remoteId, promise->state(), promise->value());
    m_environment->sendMessage(route.m_sourceChain, MessageSerializer::serialize(message));
    UNUSED_PARAMETER(state);
}
} // namespace Interop
