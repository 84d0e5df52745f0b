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
#include "Environment.h"
#include "runtime/AtomicCoordinator.h"
#include "runtime/CallbackRegistry.h"
#include "runtime/CrossChainForwarder.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/JobQueue.h"
#include "runtime/Platform.h"
#include "runtime/PromiseStore.h"
#include "runtime/TimeoutRegistry.h"
#include "runtime/serialization/MessageSerializer.h"
#include "runtime/serialization/SerializedExecuteRemoteCallbackMessage.h"
#include "runtime/serialization/SerializedResolveProxyMessage.h"
#include "runtime/serialization/SerializedSetupRemotePromiseMessage.h"
#include "runtime/serialization/SerializedSharePromiseMessage.h"

namespace Interop {

Environment::Environment(Platform* platform, ChainId chainId, Address engineAddress)
    : m_platform(platform)
    , m_chainId(chainId)
    , m_engineAddress(engineAddress)
    , m_createCount(0)
    , m_promiseStore(new PromiseStore(this))
    , m_callbackRegistry(new CallbackRegistry(this))
    , m_forwarder(new CrossChainForwarder(this))
    , m_atomicCoordinator(new AtomicCoordinator(this))
    , m_promiseAllAggregator(new PromiseAllAggregator(this))
    , m_timeoutRegistry(new TimeoutRegistry(this))
    , m_jobQueue(new JobQueue())
    , m_activeCallback(nullptr)
    , m_currentSandBox(nullptr)
    , m_promiseHook(nullptr)
    , m_promiseHookPublic(nullptr)
{
    ASSERT(Heap::isInitialized());
}

void Environment::registerTarget(CallbackTarget* target)
{
    m_targets[target->address()] = target;
}

Optional<CallbackTarget*> Environment::target(Address address) const
{
    auto iter = m_targets.find(address);
    if (iter == m_targets.end()) {
        return nullptr;
    }
    return iter->second;
}

PromiseId Environment::create(ExecutionState& state)
{
    PromiseId id = IdentifierHasher("create").add(m_chainId).add(m_createCount++).finish();
    m_promiseStore->create(state, id, state.caller());
    return id;
}

void Environment::resolve(ExecutionState& state, const PromiseId& id, const Payload& value)
{
    m_promiseStore->resolve(state, id, value);
}

void Environment::reject(ExecutionState& state, const PromiseId& id, const Payload& value)
{
    m_promiseStore->reject(state, id, value);
}

PromiseObject::PromiseState Environment::status(ExecutionState& state, const PromiseId& id)
{
    return m_promiseStore->get(state, id, "status")->state();
}

Payload Environment::value(ExecutionState& state, const PromiseId& id)
{
    return m_promiseStore->get(state, id, "value")->value();
}

bool Environment::exists(const PromiseId& id) const
{
    return m_promiseStore->contains(id);
}

PromiseId Environment::then(ExecutionState& state, const PromiseId& parentId, Address target, Selector successSelector, Optional<Selector> errorSelector)
{
    return m_callbackRegistry->then(state, parentId, target, successSelector, errorSelector);
}

PromiseId Environment::thenOnChain(ExecutionState& state, const PromiseId& parentId, ChainId destinationChain, Address target,
                                   Selector successSelector, Optional<Selector> errorSelector)
{
    return m_forwarder->then(state, parentId, destinationChain, target, successSelector, errorSelector);
}

PromiseId Environment::onReject(ExecutionState& state, const PromiseId& parentId, Address target, Selector errorSelector)
{
    return m_callbackRegistry->onReject(state, parentId, target, errorSelector);
}

void Environment::executePromiseCallbacks(ExecutionState& state, const PromiseId& id)
{
    checkNotInCallback(state, "executePromiseCallbacks");
    m_callbackRegistry->executePromiseCallbacks(state, id);
}

size_t Environment::flushChain(ExecutionState& state, const PromiseId& startId, size_t maxSteps)
{
    checkNotInCallback(state, "flushChain");
    return m_callbackRegistry->flushChain(state, startId, maxSteps);
}

PromiseId Environment::createAll(ExecutionState& state, const PromiseIdVector& memberIds)
{
    return m_promiseAllAggregator->createAll(state, memberIds);
}

PromiseAllStatus Environment::checkAll(ExecutionState& state, const PromiseId& allId)
{
    return m_promiseAllAggregator->checkAll(state, allId);
}

CallbackContext* Environment::activeCallback(ExecutionState& state, const char* entrypoint)
{
    if (UNLIKELY(!m_activeCallback)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::NoActiveCallback, ErrorObject::Messages::NoActiveCallback, entrypoint);
    }
    return m_activeCallback;
}

Address Environment::callbackRegistrant(ExecutionState& state)
{
    return activeCallback(state, "callbackRegistrant")->registrant();
}

ChainId Environment::callbackSourceChain(ExecutionState& state)
{
    return activeCallback(state, "callbackSourceChain")->sourceChain();
}

CallbackContext Environment::callbackContext(ExecutionState& state)
{
    return *activeCallback(state, "callbackContext");
}

void Environment::checkNotInCallback(ExecutionState& state, const char* entrypoint)
{
    if (UNLIKELY(!!m_activeCallback)) {
        m_activeCallback->markReentered();
        ErrorObject::throwBuiltinError(state, ErrorObject::ReentrantCall, ErrorObject::Messages::ReentrantCall, entrypoint);
    }
}

void Environment::checkMessenger(ExecutionState& state, const char* entrypoint)
{
    if (UNLIKELY(state.caller() != m_platform->messengerAddress())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_NotMessenger, entrypoint);
    }
}

void Environment::receiveMessage(ExecutionState& state, ChainId sourceChain, Address sender, const Payload& message)
{
    checkMessenger(state, "receiveMessage");
    if (UNLIKELY(sender != m_engineAddress)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::Unauthorized, ErrorObject::Messages::Unauthorized_ForeignSender, "receiveMessage");
    }

    std::unique_ptr<SerializedMessage> decoded = MessageSerializer::deserialize(message);
    if (UNLIKELY(!decoded)) {
        ErrorObject::throwBuiltinError(state, ErrorObject::InvalidMessage, ErrorObject::Messages::InvalidMessage, "receiveMessage");
    }

    INTEROP_LOG_TRACE("[chain %llu] receive %s for %s from chain %llu\n", (unsigned long long)m_chainId,
                      SerializedMessage::typeName(decoded->type()), decoded->promiseId().toShortString().data(), (unsigned long long)sourceChain);

    switch (decoded->type()) {
    case SerializedMessage::SetupRemotePromise:
        setupRemotePromise(state, sourceChain, *static_cast<SerializedSetupRemotePromiseMessage*>(decoded.get()));
        break;
    case SerializedMessage::ExecuteRemoteCallback: {
        SerializedExecuteRemoteCallbackMessage* execute = static_cast<SerializedExecuteRemoteCallbackMessage*>(decoded.get());
        executeRemoteCallback(state, sourceChain, execute->promiseId(), execute->value());
        break;
    }
    case SerializedMessage::ResolveProxy: {
        SerializedResolveProxyMessage* resolveProxy = static_cast<SerializedResolveProxyMessage*>(decoded.get());
        resolveRemoteProxy(state, sourceChain, resolveProxy->promiseId(), resolveProxy->state(), resolveProxy->value());
        break;
    }
    case SerializedMessage::SharePromise:
        shareResolvedPromise(state, sourceChain, *static_cast<SerializedSharePromiseMessage*>(decoded.get()));
        break;
    default:
        RELEASE_ASSERT_NOT_REACHED();
    }
}

void Environment::setupRemotePromise(ExecutionState& state, ChainId sourceChain, const SerializedSetupRemotePromiseMessage& message)
{
    checkMessenger(state, "setupRemotePromise");
    m_forwarder->setupRemotePromise(state, sourceChain, message);
}

void Environment::executeRemoteCallback(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, const Payload& value)
{
    checkNotInCallback(state, "executeRemoteCallback");
    checkMessenger(state, "executeRemoteCallback");
    m_forwarder->executeRemoteCallback(state, sourceChain, remoteId, value);
}

void Environment::resolveRemoteProxy(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId,
                                     PromiseObject::PromiseState newState, const Payload& value)
{
    checkMessenger(state, "resolveRemoteProxy");
    m_forwarder->resolveRemoteProxy(state, sourceChain, remoteId, newState, value);
}

void Environment::shareResolvedPromise(ExecutionState& state, ChainId sourceChain, const SerializedSharePromiseMessage& message)
{
    checkMessenger(state, "shareResolvedPromise");
    m_forwarder->shareResolvedPromise(state, sourceChain, message);
}

void Environment::sharePromise(ExecutionState& state, ChainId destinationChain, const PromiseId& id)
{
    m_forwarder->sharePromise(state, destinationChain, id);
}

PromiseId Environment::createTimeout(ExecutionState& state, uint64_t delay)
{
    return m_timeoutRegistry->createTimeout(state, delay);
}

void Environment::resolveTimeout(ExecutionState& state, const PromiseId& id)
{
    m_timeoutRegistry->resolveTimeout(state, id);
}

bool Environment::hasPendingJob() const
{
    return m_jobQueue->hasNextJob();
}

bool Environment::executePendingJob(ExecutionState& state)
{
    checkNotInCallback(state, "executePendingJob");
    if (!m_jobQueue->hasNextJob()) {
        return false;
    }
    m_jobQueue->nextJob()->run(state);
    return true;
}

void Environment::enqueuePromiseCallbacks(PromiseObject* promise)
{
    ASSERT(promise->isTerminal());
    if (promise->isCallbacksJobQueued() || !promise->hasUnexecutedCallbacks()) {
        return;
    }
    promise->setCallbacksJobQueued(true);
    m_jobQueue->enqueueJob(new PromiseCallbacksJob(this, promise));
}

void Environment::didCreatePromise(ExecutionState& state, PromiseObject* promise)
{
    if (UNLIKELY(isPromiseHookRegistered())) {
        triggerPromiseHook(state, PromiseHookType::Init, promise);
    }
}

void Environment::didSettlePromise(ExecutionState& state, PromiseObject* promise)
{
    if (UNLIKELY(isPromiseHookRegistered())) {
        triggerPromiseHook(state, promise->state() == PromiseObject::Resolved ? PromiseHookType::Resolve : PromiseHookType::Reject, promise);
    }

    enqueuePromiseCallbacks(promise);
    m_atomicCoordinator->didSettlePromise(state, promise);
    m_forwarder->didSettlePromise(state, promise);
}

MessageId Environment::sendMessage(ChainId destinationChain, const Payload& message)
{
    MessageId messageId = m_platform->sendMessage(this, destinationChain, m_engineAddress, message);
    INTEROP_LOG_TRACE("[chain %llu] send message %llu to chain %llu (%zu bytes)\n", (unsigned long long)m_chainId,
                      (unsigned long long)messageId, (unsigned long long)destinationChain, message.size());
    return messageId;
}
} // namespace Interop
