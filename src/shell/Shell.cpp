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
#include "runtime/ExecutionState.h"
#include "runtime/PromiseStore.h"
#include "shell/LocalRelay.h"

using namespace Interop;

static const Address s_doublerAddress = 0xd0b1e5ULL;
static const Address s_userAddress = 0xa11ce0ULL;
static const Selector s_doubleSelector = 0x6e6fd2a5;
static bool s_verbose = false;

static CallbackResult doubleHandler(ExecutionState& state, const Payload& argument, void* data)
{
    UNUSED_PARAMETER(data);
    Optional<uint64_t> value = PayloadEncoding::toUInt64(argument);
    if (!value) {
        throw PayloadEncoding::fromString("double: argument is not a uint256");
    }

    if (s_verbose) {
        Environment* environment = state.environment();
        INTEROP_LOG_INFO("[chain %llu] double(%llu) registered by %llx on chain %llu\n", (unsigned long long)environment->chainId(),
                         (unsigned long long)value.value(), (unsigned long long)environment->callbackRegistrant(state),
                         (unsigned long long)environment->callbackSourceChain(state));
    }
    return CallbackResult::immediate(PayloadEncoding::fromUInt64(value.value() * 2));
}

static bool parseChainIds(const char* text, std::vector<ChainId>& chainIds)
{
    chainIds.clear();
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        char* end = nullptr;
        unsigned long long chainId = strtoull(item.data(), &end, 10);
        if (item.empty() || *end != '\0') {
            return false;
        }
        if (std::find(chainIds.begin(), chainIds.end(), chainId) != chainIds.end()) {
            return false;
        }
        chainIds.push_back(chainId);
    }
    return chainIds.size() >= 2;
}

static bool readUInt64Option(const char* text, uint64_t& result)
{
    char* end = nullptr;
    result = strtoull(text, &end, 10);
    return *text && *end == '\0';
}

static void printPromise(Environment* environment, const char* label, const PromiseId& id)
{
    PromiseObject* promise = environment->promiseStore()->find(id).value();
    Optional<uint64_t> value = PayloadEncoding::toUInt64(promise->value());
    if (value) {
        INTEROP_LOG_INFO("[chain %llu] %s %s: %s %llu\n", (unsigned long long)environment->chainId(), label, id.toShortString().data(),
                         PromiseObject::stateName(promise->state()), (unsigned long long)value.value());
    } else {
        INTEROP_LOG_INFO("[chain %llu] %s %s: %s \"%s\"\n", (unsigned long long)environment->chainId(), label, id.toShortString().data(),
                         PromiseObject::stateName(promise->state()), PayloadEncoding::toString(promise->value()).data());
    }
}

// value -> chain B doubles it -> back on chain A
static bool runCrossChainDouble(LocalRelay* relay, Environment* source, Environment* destination, uint64_t value)
{
    ExecutionState state(source, s_userAddress);
    PromiseId promise = source->create(state);
    PromiseId proxy = source->thenOnChain(state, promise, destination->chainId(), s_doublerAddress, s_doubleSelector);
    source->resolve(state, promise, PayloadEncoding::fromUInt64(value));
    source->executePromiseCallbacks(state, promise);

    size_t delivered = relay->relayAll();
    if (s_verbose) {
        INTEROP_LOG_INFO("relay delivered %zu messages\n", delivered);
    }
    printPromise(source, "proxy", proxy);

    Optional<uint64_t> result = PayloadEncoding::toUInt64(source->value(state, proxy));
    return source->status(state, proxy) == PromiseObject::Resolved && result && result.value() == value * 2;
}

// value doubled along a local chain of then() registrations
static bool runLocalChain(Environment* environment, uint64_t value, size_t steps)
{
    ExecutionState state(environment, s_userAddress);
    PromiseId first = environment->create(state);
    PromiseId last = first;
    for (size_t i = 0; i < steps; i++) {
        last = environment->then(state, last, s_doublerAddress, s_doubleSelector);
    }

    environment->resolve(state, first, PayloadEncoding::fromUInt64(value));
    size_t executed = environment->flushChain(state, first, steps);
    INTEROP_LOG_INFO("[chain %llu] flushChain ran %zu of %zu steps\n", (unsigned long long)environment->chainId(), executed, steps);
    printPromise(environment, "last", last);
    return environment->status(state, last) != PromiseObject::Rejected;
}

int main(int argc, char* argv[])
{
#ifndef NDEBUG
    setbuf(stdout, NULL);
    setbuf(stderr, NULL);
#endif

    std::vector<ChainId> chainIds;
    chainIds.push_back(901);
    chainIds.push_back(902);
    uint64_t value = 100;
    uint64_t steps = 4;

    if (getenv("CHAIN_IDS") && strlen(getenv("CHAIN_IDS"))) {
        if (!parseChainIds(getenv("CHAIN_IDS"), chainIds)) {
            fprintf(stderr, "CHAIN_IDS must list at least two distinct comma separated chain ids\n");
            return 3;
        }
    }

    for (int i = 1; i < argc; i++) {
        if (strstr(argv[i], "--chains=") == argv[i]) {
            if (!parseChainIds(argv[i] + sizeof("--chains=") - 1, chainIds)) {
                fprintf(stderr, "--chains= must list at least two distinct comma separated chain ids\n");
                return 3;
            }
            continue;
        }
        if (strstr(argv[i], "--value=") == argv[i]) {
            if (!readUInt64Option(argv[i] + sizeof("--value=") - 1, value)) {
                fprintf(stderr, "Cannot parse `%s`\n", argv[i]);
                return 3;
            }
            continue;
        }
        if (strstr(argv[i], "--steps=") == argv[i]) {
            if (!readUInt64Option(argv[i] + sizeof("--steps=") - 1, steps)) {
                fprintf(stderr, "Cannot parse `%s`\n", argv[i]);
                return 3;
            }
            continue;
        }
        if (strcmp(argv[i], "--verbose") == 0) {
            s_verbose = true;
            continue;
        }
        fprintf(stderr, "Cannot recognize option `%s`\n", argv[i]);
        return 3;
    }

    Heap::initialize();

    LocalRelay* relay = new LocalRelay();
    std::vector<Environment*, gc_allocator<Environment*>> environments;
    for (size_t i = 0; i < chainIds.size(); i++) {
        Environment* environment = relay->createEnvironment(chainIds[i]);
        NativeCallbackTarget* doubler = new NativeCallbackTarget(s_doublerAddress);
        doubler->defineHandler(s_doubleSelector, doubleHandler);
        environment->registerTarget(doubler);
        environments.push_back(environment);
    }

    bool success = true;
    try {
        for (size_t i = 1; i < environments.size(); i++) {
            success = runCrossChainDouble(relay, environments[0], environments[i], value) && success;
        }
        success = runLocalChain(environments[0], value, steps) && success;
    } catch (const ErrorObject& error) {
        INTEROP_LOG_ERROR("Uncaught %s: %s\n", ErrorObject::codeName(error.code()), error.message().data());
        success = false;
    }

    if (relay->lastError()) {
        success = false;
    }

    if (s_verbose) {
        Heap::printGCHeapUsage();
    }
    Heap::finalize();

    return success ? 0 : 3;
}
