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

#ifndef __InteropEnvironment__
#define __InteropEnvironment__

#include "runtime/CallbackContext.h"
#include "runtime/CallbackTarget.h"
#include "runtime/PromiseAllAggregator.h"
#include "runtime/PromiseObject.h"

namespace Interop {

class AtomicCoordinator;
class CallbackRegistry;
class CrossChainForwarder;
class ExecutionState;
class JobQueue;
class Platform;
class PromiseStore;
class SandBox;
class SerializedSetupRemotePromiseMessage;
class SerializedSharePromiseMessage;
class TimeoutRegistry;

// The promise engine of one chain. Every operation is a synchronous call
// made on behalf of state.caller(); nothing runs unless a caller asks.
class Environment : public gc {
    friend class ActiveCallbackScope;
    friend class SandBox;

public:
    enum PromiseHookType {
        Init,
        Resolve,
        Reject,
        Before,
        After
    };

    typedef void (*PromiseHook)(ExecutionState& state, PromiseHookType type, PromiseObject* promise, void* hook);

    // platform is not owned and must outlive the environment
    Environment(Platform* platform, ChainId chainId, Address engineAddress);

    Platform* platform() const
    {
        return m_platform;
    }

    ChainId chainId() const
    {
        return m_chainId;
    }

    // same on every chain; the only sender receiveMessage trusts
    Address engineAddress() const
    {
        return m_engineAddress;
    }

    PromiseStore* promiseStore() const { return m_promiseStore; }
    CallbackRegistry* callbackRegistry() const { return m_callbackRegistry; }
    CrossChainForwarder* forwarder() const { return m_forwarder; }
    AtomicCoordinator* atomicCoordinator() const { return m_atomicCoordinator; }
    PromiseAllAggregator* promiseAllAggregator() const { return m_promiseAllAggregator; }
    TimeoutRegistry* timeoutRegistry() const { return m_timeoutRegistry; }
    JobQueue* jobQueue() const { return m_jobQueue; }

    // Callback targets
    void registerTarget(CallbackTarget* target);
    Optional<CallbackTarget*> target(Address address) const;

    // Promises
    PromiseId create(ExecutionState& state);
    void resolve(ExecutionState& state, const PromiseId& id, const Payload& value);
    void reject(ExecutionState& state, const PromiseId& id, const Payload& value);
    PromiseObject::PromiseState status(ExecutionState& state, const PromiseId& id);
    Payload value(ExecutionState& state, const PromiseId& id);
    bool exists(const PromiseId& id) const;

    // Callbacks
    PromiseId then(ExecutionState& state, const PromiseId& parentId, Address target, Selector successSelector,
                   Optional<Selector> errorSelector = Optional<Selector>());
    // then() on another chain; returns the id of the local proxy
    PromiseId thenOnChain(ExecutionState& state, const PromiseId& parentId, ChainId destinationChain, Address target,
                          Selector successSelector, Optional<Selector> errorSelector = Optional<Selector>());
    PromiseId onReject(ExecutionState& state, const PromiseId& parentId, Address target, Selector errorSelector);

    void executePromiseCallbacks(ExecutionState& state, const PromiseId& id);
    size_t flushChain(ExecutionState& state, const PromiseId& startId, size_t maxSteps);

    // Promise.all
    PromiseId createAll(ExecutionState& state, const PromiseIdVector& memberIds);
    PromiseAllStatus checkAll(ExecutionState& state, const PromiseId& allId);

    // Active callback, readable only while a handler runs
    Address callbackRegistrant(ExecutionState& state);
    ChainId callbackSourceChain(ExecutionState& state);
    CallbackContext callbackContext(ExecutionState& state);

    bool isInCallback() const
    {
        return !!m_activeCallback;
    }

    // Messenger entrypoints. Only the platform's messenger may call them.
    void receiveMessage(ExecutionState& state, ChainId sourceChain, Address sender, const Payload& message);
    void setupRemotePromise(ExecutionState& state, ChainId sourceChain, const SerializedSetupRemotePromiseMessage& message);
    void executeRemoteCallback(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, const Payload& value);
    void resolveRemoteProxy(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId,
                            PromiseObject::PromiseState newState, const Payload& value);
    void shareResolvedPromise(ExecutionState& state, ChainId sourceChain, const SerializedSharePromiseMessage& message);

    void sharePromise(ExecutionState& state, ChainId destinationChain, const PromiseId& id);

    // Timeouts
    PromiseId createTimeout(ExecutionState& state, uint64_t delay);
    void resolveTimeout(ExecutionState& state, const PromiseId& id);

    // Pending work
    bool hasPendingJob() const;
    // returns false when there was nothing to run
    bool executePendingJob(ExecutionState& state);
    void enqueuePromiseCallbacks(PromiseObject* promise);

    // PromiseHook is triggered for each promise event
    // Third party app registers PromiseHook when it is necessary
    bool isPromiseHookRegistered() const
    {
        return !!m_promiseHook;
    }

    void registerPromiseHook(PromiseHook promiseHook, void* promiseHookPublic)
    {
        m_promiseHook = promiseHook;
        m_promiseHookPublic = promiseHookPublic;
    }

    void unregisterPromiseHook()
    {
        m_promiseHook = nullptr;
        m_promiseHookPublic = nullptr;
    }

    void triggerPromiseHook(ExecutionState& state, PromiseHookType type, PromiseObject* promise)
    {
        ASSERT(!!m_promiseHook);
        m_promiseHook(state, type, promise, m_promiseHookPublic);
    }

    // notifications from the PromiseStore
    void didCreatePromise(ExecutionState& state, PromiseObject* promise);
    void didSettlePromise(ExecutionState& state, PromiseObject* promise);

    MessageId sendMessage(ChainId destinationChain, const Payload& message);

private:
    void checkNotInCallback(ExecutionState& state, const char* entrypoint);
    void checkMessenger(ExecutionState& state, const char* entrypoint);
    CallbackContext* activeCallback(ExecutionState& state, const char* entrypoint);

    Platform* m_platform;
    ChainId m_chainId;
    Address m_engineAddress;
    uint64_t m_createCount;

    PromiseStore* m_promiseStore;
    CallbackRegistry* m_callbackRegistry;
    CrossChainForwarder* m_forwarder;
    AtomicCoordinator* m_atomicCoordinator;
    PromiseAllAggregator* m_promiseAllAggregator;
    TimeoutRegistry* m_timeoutRegistry;
    JobQueue* m_jobQueue;

    HashMap<Address, CallbackTarget*, std::hash<Address>, std::equal_to<Address>, gc_allocator<std::pair<Address, CallbackTarget*>>> m_targets;

    // points into the stack of the executor while a handler runs
    CallbackContext* m_activeCallback;
    SandBox* m_currentSandBox;

    PromiseHook m_promiseHook;
    void* m_promiseHookPublic;
};
} // namespace Interop

#endif
