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

#ifndef __InteropCCTestSupport__
#define __InteropCCTestSupport__

#include "Interop.h"
#include "runtime/CallbackContext.h"
#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/ExecutionState.h"
#include "runtime/PromiseStore.h"
#include "shell/LocalRelay.h"

#include "gtest/gtest.h"

namespace Interop {
namespace CCTest {

static const ChainId ChainA = 901;
static const ChainId ChainB = 902;
static const ChainId ChainC = 903;

static const Address UserAddress = 0xa11ce;
static const Address OtherUserAddress = 0xb0b;
static const Address TargetAddress = 0x7a76e7;
static const Address UnknownTargetAddress = 0xdead;

enum TestSelector : Selector {
    Double = 0x1001,
    Fail = 0x1002,
    Recover = 0x1003,
    Record = 0x1004,
    Spawn = 0x1005,
    Reenter = 0x1006,
    Undefined = 0x1fff,
};

struct CallRecorder {
    CallRecorder()
        : calls(0)
        , registrant(0)
        , sourceChain(0)
        , executedOn(0)
        , caller(0)
        , sawContext(false)
    {
    }

    size_t calls;
    Address registrant;
    ChainId sourceChain;
    ChainId executedOn;
    Address caller;
    bool sawContext;
    std::vector<Payload> arguments;
};

struct ChildSpawner {
    ChildSpawner()
        : count(0)
        , adopt(false)
    {
    }

    size_t count;
    bool adopt;
    PromiseIdVector children;
};

struct ReentryAttempt {
    enum Entry {
        ExecuteCallbacks,
        FlushChain,
        PendingJob,
        RemoteCallback,
    };

    ReentryAttempt()
        : entry(ExecuteCallbacks)
        , observed(ErrorObject::None)
    {
    }

    Entry entry;
    PromiseId promise;
    ErrorObject::Code observed;
};

inline Payload word(uint64_t value)
{
    return PayloadEncoding::fromUInt64(value);
}

inline uint64_t wordOf(const Payload& payload)
{
    return PayloadEncoding::toUInt64(payload).valueOr(std::numeric_limits<uint64_t>::max());
}

inline Payload text(const char* value)
{
    return PayloadEncoding::fromString(value);
}

template <typename Function>
ErrorObject::Code errorCodeOf(Function function)
{
    try {
        function();
    } catch (const ErrorObject& error) {
        return error.code();
    }
    return ErrorObject::None;
}

inline ErrorObject::Code errorCodeOfPayload(const Payload& payload)
{
    Optional<ErrorObject> error = ErrorObject::fromPayload(payload);
    return error ? error.value().code() : ErrorObject::None;
}

inline CallbackResult doubleHandler(ExecutionState& state, const Payload& argument, void* data)
{
    Optional<uint64_t> value = PayloadEncoding::toUInt64(argument);
    if (!value) {
        throw text("not a word");
    }
    return CallbackResult::immediate(word(value.value() * 2));
}

inline CallbackResult failHandler(ExecutionState& state, const Payload& argument, void* data)
{
    throw text("boom");
}

inline CallbackResult recoverHandler(ExecutionState& state, const Payload& argument, void* data)
{
    return CallbackResult::immediate(text(("recovered:" + PayloadEncoding::toString(argument)).data()));
}

inline CallbackResult recordHandler(ExecutionState& state, const Payload& argument, void* data)
{
    CallRecorder* recorder = reinterpret_cast<CallRecorder*>(data);
    Environment* environment = state.environment();
    recorder->calls++;
    recorder->registrant = environment->callbackRegistrant(state);
    recorder->sourceChain = environment->callbackSourceChain(state);
    recorder->executedOn = environment->chainId();
    recorder->caller = state.caller();
    recorder->sawContext = state.callbackContext().hasValue() && state.callbackContext().value()->registrant() == recorder->registrant;
    recorder->arguments.push_back(argument);
    return CallbackResult::immediate(argument);
}

inline CallbackResult spawnHandler(ExecutionState& state, const Payload& argument, void* data)
{
    ChildSpawner* spawner = reinterpret_cast<ChildSpawner*>(data);
    spawner->children.clear();
    for (size_t i = 0; i < spawner->count; i++) {
        spawner->children.push_back(state.environment()->create(state));
    }
    if (spawner->adopt) {
        return CallbackResult::await(spawner->children[0]);
    }
    return CallbackResult::awaitChildren(spawner->children);
}

inline CallbackResult reenterHandler(ExecutionState& state, const Payload& argument, void* data)
{
    ReentryAttempt* reentry = reinterpret_cast<ReentryAttempt*>(data);
    Environment* environment = state.environment();
    try {
        switch (reentry->entry) {
        case ReentryAttempt::ExecuteCallbacks:
            environment->executePromiseCallbacks(state, reentry->promise);
            break;
        case ReentryAttempt::FlushChain:
            environment->flushChain(state, reentry->promise, 4);
            break;
        case ReentryAttempt::PendingJob:
            environment->executePendingJob(state);
            break;
        case ReentryAttempt::RemoteCallback:
            environment->executeRemoteCallback(state, environment->chainId(), reentry->promise, argument);
            break;
        }
    } catch (const ErrorObject& error) {
        // swallowed on purpose
        reentry->observed = error.code();
    }
    return CallbackResult::immediate(text("swallowed"));
}

// Three chains joined by a LocalRelay, each with the same callback target
// deployed at TargetAddress. Must live on the stack so the collector sees
// the relay.
class TestWorld {
public:
    TestWorld()
        : relay(new LocalRelay())
    {
        a = createChain(ChainA);
        b = createChain(ChainB);
        c = createChain(ChainC);
    }

    Environment* chain(ChainId chainId)
    {
        return relay->environment(chainId).value();
    }

    PromiseObject* promise(Environment* environment, const PromiseId& id)
    {
        return environment->promiseStore()->find(id).value();
    }

    LocalRelay* relay;
    Environment* a;
    Environment* b;
    Environment* c;

    CallRecorder recorder;
    ChildSpawner spawner;
    ReentryAttempt reentry;

private:
    Environment* createChain(ChainId chainId)
    {
        Environment* environment = relay->createEnvironment(chainId);
        NativeCallbackTarget* target = new NativeCallbackTarget(TargetAddress);
        target->defineHandler(Double, doubleHandler);
        target->defineHandler(Fail, failHandler);
        target->defineHandler(Recover, recoverHandler);
        target->defineHandler(Record, recordHandler, &recorder);
        target->defineHandler(Spawn, spawnHandler, &spawner);
        target->defineHandler(Reenter, reenterHandler, &reentry);
        environment->registerTarget(target);
        return environment;
    }
};

} // namespace CCTest
} // namespace Interop

#endif
