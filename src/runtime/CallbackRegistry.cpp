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
#include "CallbackRegistry.h"
#include "runtime/AtomicCoordinator.h"
#include "runtime/CallbackContext.h"
#include "runtime/CrossChainForwarder.h"
#include "runtime/Environment.h"
#include "runtime/ExecutionState.h"
#include "runtime/JobQueue.h"
#include "runtime/PromiseStore.h"

namespace Interop {

PromiseId CallbackRegistry::then(ExecutionState& state, const PromiseId& parentId, Address target, Selector successSelector, Optional<Selector> errorSelector)
{
    return registerCallback(state, CallbackRecord::Then, parentId, target, successSelector, errorSelector, "then");
}

PromiseId CallbackRegistry::onReject(ExecutionState& state, const PromiseId& parentId, Address target, Selector errorSelector)
{
    return registerCallback(state, CallbackRecord::Catch, parentId, target, 0, errorSelector, "onReject");
}

PromiseId CallbackRegistry::registerCallback(ExecutionState& state, CallbackRecord::Kind kind, const PromiseId& parentId, Address target,
                                             Selector successSelector, Optional<Selector> errorSelector, const char* entrypoint)
{
    PromiseObject* parent = m_environment->promiseStore()->get(state, parentId, entrypoint);
    if (UNLIKELY(!m_environment->target(target))) {
        ErrorObject::throwBuiltinError(state, ErrorObject::UnknownTarget, ErrorObject::Messages::UnknownTarget, entrypoint, (unsigned long long)target);
    }

    PromiseId continuationId = IdentifierHasher("then").add(parentId).add(parent->nextRegistrationNonce()).finish();
    ExecutionState engineState(&state, m_environment->engineAddress());
    m_environment->promiseStore()->create(engineState, continuationId, m_environment->engineAddress());

    CallbackRecord* record = new CallbackRecord(kind, parentId, continuationId, target, successSelector, errorSelector,
                                                state.caller(), m_environment->chainId(), m_environment->chainId());
    appendCallback(parent, record);
    return continuationId;
}

void CallbackRegistry::appendCallback(PromiseObject* parent, CallbackRecord* record)
{
    parent->appendCallback(record);
    // late registration is queued, never run
    if (parent->isTerminal()) {
        m_environment->enqueuePromiseCallbacks(parent);
    }
}

size_t CallbackRegistry::executePromiseCallbacks(ExecutionState& state, const PromiseId& id)
{
    PromiseObject* promise = m_environment->promiseStore()->get(state, id, "executePromiseCallbacks");
    if (UNLIKELY(promise->isPending())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::NotReady, ErrorObject::Messages::NotReady, "executePromiseCallbacks", id.toShortString().data());
    }

    // a handler may register more callbacks on this promise; they run too
    size_t executed = 0;
    const CallbackRecordVector& callbacks = promise->callbacks();
    for (size_t i = 0; i < callbacks.size(); i++) {
        CallbackRecord* record = callbacks[i];
        if (record->isExecuted()) {
            continue;
        }
        record->markExecuted();
        executeCallback(state, promise, record);
        executed++;
    }

    // everything ran here, so a job queued by the settlement has nothing left
    if (promise->isCallbacksJobQueued()) {
        m_environment->jobQueue()->cancelPromiseCallbacksJob(promise);
        promise->setCallbacksJobQueued(false);
    }
    return executed;
}

size_t CallbackRegistry::flushChain(ExecutionState& state, const PromiseId& startId, size_t maxSteps)
{
    maxSteps = std::min<size_t>(maxSteps, INTEROP_FLUSH_STEP_LIMIT);

    PromiseObject* current = m_environment->promiseStore()->get(state, startId, "flushChain");
    if (UNLIKELY(current->isPending())) {
        ErrorObject::throwBuiltinError(state, ErrorObject::NotReady, ErrorObject::Messages::NotReady, "flushChain", startId.toShortString().data());
    }

    size_t steps = 0;
    while (steps < maxSteps && current->isTerminal()) {
        if (executePromiseCallbacks(state, current->id())) {
            steps++;
        }

        if (current->callbacks().empty()) {
            break;
        }
        current = m_environment->promiseStore()->get(state, current->callbacks()[0]->continuationId(), "flushChain");
    }

    INTEROP_LOG_TRACE("[chain %llu] flushChain %s ran %zu steps\n", (unsigned long long)m_environment->chainId(), startId.toShortString().data(), steps);
    return steps;
}

void CallbackRegistry::executeCallback(ExecutionState& state, PromiseObject* parent, CallbackRecord* record)
{
    if (record->kind() == CallbackRecord::Remote) {
        m_environment->forwarder()->dispatch(state, parent, record);
        return;
    }

    bool reentered = false;
    if (parent->state() == PromiseObject::Resolved) {
        if (record->kind() == CallbackRecord::Catch) {
            settleContinuation(state, record, PromiseObject::Resolved, parent->value());
            return;
        }

        SandBox::SandBoxResult result = invokeHandler(state, record, record->successSelector(), parent->value(), reentered);
        if (reentered) {
            rejectReentered(state, record);
            return;
        }
        if (result.failed && record->errorSelector()) {
            result = invokeHandler(state, record, record->errorSelector().value(), result.error, reentered);
            if (reentered) {
                rejectReentered(state, record);
                return;
            }
        }
        completeCallback(state, record, result);
        return;
    }

    ASSERT(parent->state() == PromiseObject::Rejected);
    if (!record->errorSelector()) {
        settleContinuation(state, record, PromiseObject::Rejected, parent->value());
        return;
    }

    SandBox::SandBoxResult result = invokeHandler(state, record, record->errorSelector().value(), parent->value(), reentered);
    if (reentered) {
        rejectReentered(state, record);
        return;
    }
    completeCallback(state, record, result);
}

struct HandlerInvocation {
    CallbackRecord* m_record;
    Selector m_selector;
    const Payload* m_argument;
};

SandBox::SandBoxResult CallbackRegistry::invokeHandler(ExecutionState& state, CallbackRecord* record, Selector selector, const Payload& argument, bool& reentered)
{
    Optional<PromiseObject*> continuation = m_environment->promiseStore()->find(record->continuationId());
    if (UNLIKELY(m_environment->isPromiseHookRegistered())) {
        m_environment->triggerPromiseHook(state, Environment::PromiseHookType::Before, continuation.value());
    }

    CallbackContext context(record->registrant(), record->sourceChain(), record->target(), record->continuationId());
    HandlerInvocation invocation = { record, selector, &argument };
    SandBox::SandBoxResult result;
    {
        ActiveCallbackScope scope(m_environment, &context);
        SandBox sandbox(m_environment);
        result = sandbox.run(state, record->target(), &context, [](ExecutionState& state, void* data) -> CallbackResult {
            HandlerInvocation* invocation = reinterpret_cast<HandlerInvocation*>(data);
            Address address = invocation->m_record->target();
            Optional<CallbackTarget*> target = state.environment()->target(address);
            if (!target) {
                ErrorObject::throwBuiltinError(state, ErrorObject::UnknownTarget, ErrorObject::Messages::UnknownTarget, "call", (unsigned long long)address);
            }
            return target->call(state, invocation->m_selector, *invocation->m_argument);
        },
                             &invocation);
    }
    reentered = context.wasReentered();

    if (UNLIKELY(m_environment->isPromiseHookRegistered())) {
        m_environment->triggerPromiseHook(state, Environment::PromiseHookType::After, continuation.value());
    }
    return result;
}

void CallbackRegistry::completeCallback(ExecutionState& state, CallbackRecord* record, const SandBox::SandBoxResult& result)
{
    if (result.failed) {
        settleContinuation(state, record, PromiseObject::Rejected, result.error);
        return;
    }

    const CallbackResult& callbackResult = result.result;
    switch (callbackResult.kind()) {
    case CallbackResult::Immediate:
        settleContinuation(state, record, PromiseObject::Resolved, callbackResult.value());
        break;
    case CallbackResult::Await:
    case CallbackResult::AwaitChildren: {
        ExecutionState engineState(&state, m_environment->engineAddress());
        m_environment->atomicCoordinator()->track(engineState, record->continuationId(), callbackResult.children(),
                                                  callbackResult.kind() == CallbackResult::Await);
        break;
    }
    default:
        RELEASE_ASSERT_NOT_REACHED();
    }
}

void CallbackRegistry::rejectReentered(ExecutionState& state, CallbackRecord* record)
{
    // the handler may have swallowed the ReentrantCall error; the
    // continuation is rejected with it regardless
    char buffer[256];
    snprintf(buffer, sizeof(buffer), ErrorObject::Messages::ReentrantCall, "callback");
    ErrorObject error(ErrorObject::ReentrantCall, buffer);
    settleContinuation(state, record, PromiseObject::Rejected, error.toPayload());
}

void CallbackRegistry::settleContinuation(ExecutionState& state, CallbackRecord* record, PromiseObject::PromiseState newState, const Payload& value)
{
    ExecutionState engineState(&state, m_environment->engineAddress());
    PromiseObject* continuation = m_environment->promiseStore()->get(engineState, record->continuationId(), "executePromiseCallbacks");
    m_environment->promiseStore()->settle(engineState, continuation, newState, value, "executePromiseCallbacks");
}
} // namespace Interop
