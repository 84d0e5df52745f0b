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

#include "CCTestSupport.h"
#include "runtime/CrossChainForwarder.h"
#include "runtime/serialization/MessageSerializer.h"
#include "runtime/serialization/SerializedSetupRemotePromiseMessage.h"

using namespace Interop;
using namespace Interop::CCTest;

TEST(CrossChain, DoubleOnAnotherChain)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);
    EXPECT_EQ(world.promise(world.a, proxy)->origin(), PromiseObject::Proxy);
    EXPECT_EQ(world.promise(world.a, proxy)->remoteChain(), ChainB);
    EXPECT_TRUE(world.promise(world.a, proxy)->isPendingProxy());

    world.a->resolve(user, p, word(100));
    // nothing crosses until the callbacks are executed
    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);

    world.a->executePromiseCallbacks(user, p);
    EXPECT_EQ(world.relay->pendingMessageCount(), 2u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);

    EXPECT_EQ(world.relay->relayAll(), 3u);
    EXPECT_FALSE(world.relay->lastError().hasValue());
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Resolved);
    EXPECT_EQ(wordOf(world.a->value(user, proxy)), 200u);
    EXPECT_FALSE(world.promise(world.a, proxy)->isPendingProxy());

    // the destination keeps a mirror under the same id
    ExecutionState userOnB(world.b, UserAddress);
    ASSERT_TRUE(world.b->exists(proxy));
    EXPECT_EQ(world.promise(world.b, proxy)->origin(), PromiseObject::Mirror);
    EXPECT_EQ(world.promise(world.b, proxy)->remoteChain(), ChainA);
    EXPECT_EQ(wordOf(world.b->value(userOnB, proxy)), 100u);
    EXPECT_EQ(wordOf(world.b->value(userOnB, CrossChainForwarder::returnPromiseId(proxy))), 200u);
    EXPECT_FALSE(world.c->exists(proxy));

    // every callback ran by hand; nothing is left queued on either side
    EXPECT_FALSE(world.a->hasPendingJob());
    EXPECT_FALSE(world.b->hasPendingJob());
}

TEST(CrossChain, ProxyIdIsDeterministic)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId first = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);
    PromiseId second = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);
    PromiseId toC = world.a->thenOnChain(user, p, ChainC, TargetAddress, Double);

    EXPECT_EQ(first, IdentifierHasher("remote").add(p).add(ChainB).add(uint64_t(0)).finish());
    EXPECT_EQ(second, IdentifierHasher("remote").add(p).add(ChainB).add(uint64_t(1)).finish());
    EXPECT_EQ(toC, IdentifierHasher("remote").add(p).add(ChainC).add(uint64_t(2)).finish());
    EXPECT_NE(first, second);
}

TEST(CrossChain, LocalDestinationIsPlainThen)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId next = world.a->thenOnChain(user, p, ChainA, TargetAddress, Double);
    EXPECT_EQ(world.promise(world.a, next)->origin(), PromiseObject::Local);

    world.a->resolve(user, p, word(4));
    world.a->executePromiseCallbacks(user, p);
    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);
    EXPECT_EQ(wordOf(world.a->value(user, next)), 8u);
}

TEST(CrossChain, RejectedParentStaysLocal)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double, Selector(Recover));
    world.a->reject(user, p, text("denied"));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Rejected);
    EXPECT_EQ(PayloadEncoding::toString(world.a->value(user, proxy)), "denied");
    EXPECT_FALSE(world.b->exists(proxy));

    // a late answer for the dead record is refused
    ExecutionState messenger(world.a, LocalRelay::DefaultMessengerAddress);
    EXPECT_EQ(errorCodeOf([&]() { world.a->resolveRemoteProxy(messenger, ChainB, proxy, PromiseObject::Resolved, word(1)); }),
              ErrorObject::InvalidMessage);
}

TEST(CrossChain, DestinationFailureRejectsProxy)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId failed = world.a->thenOnChain(user, p, ChainB, TargetAddress, Fail);
    PromiseId recovered = world.a->thenOnChain(user, p, ChainB, TargetAddress, Fail, Selector(Recover));
    world.a->resolve(user, p, word(1));
    world.a->executePromiseCallbacks(user, p);
    world.relay->relayAll();

    EXPECT_EQ(world.a->status(user, failed), PromiseObject::Rejected);
    EXPECT_EQ(PayloadEncoding::toString(world.a->value(user, failed)), "boom");
    EXPECT_EQ(world.a->status(user, recovered), PromiseObject::Resolved);
    EXPECT_EQ(PayloadEncoding::toString(world.a->value(user, recovered)), "recovered:boom");
}

TEST(CrossChain, ProvenanceTravelsWithTheCallback)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    world.a->thenOnChain(user, p, ChainB, TargetAddress, Record);
    world.a->resolve(user, p, word(11));
    world.a->executePromiseCallbacks(user, p);
    world.relay->relayAll();

    EXPECT_EQ(world.recorder.calls, 1u);
    EXPECT_EQ(world.recorder.registrant, UserAddress);
    EXPECT_EQ(world.recorder.sourceChain, ChainA);
    EXPECT_EQ(world.recorder.executedOn, ChainB);
    EXPECT_EQ(world.recorder.caller, TargetAddress);
    ASSERT_EQ(world.recorder.arguments.size(), 1u);
    EXPECT_EQ(wordOf(world.recorder.arguments[0]), 11u);
    EXPECT_FALSE(world.a->isInCallback());
    EXPECT_FALSE(world.b->isInCallback());
}

TEST(CrossChain, ExecuteWithoutSetupIsUnordered)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);
    world.a->resolve(user, p, word(1));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_TRUE(world.relay->dropNext());
    EXPECT_TRUE(world.relay->relayNext());
    ASSERT_TRUE(world.relay->lastError().hasValue());
    EXPECT_EQ(world.relay->lastError().value().code(), ErrorObject::Unordered);
    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);
    EXPECT_FALSE(world.b->exists(proxy));
}

TEST(CrossChain, DuplicateExecuteIsRefused)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Record);
    world.a->resolve(user, p, word(100));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_TRUE(world.relay->relayNext());
    EXPECT_TRUE(world.relay->duplicateNext());
    world.relay->relayAll();

    ASSERT_TRUE(world.relay->lastError().hasValue());
    EXPECT_EQ(world.relay->lastError().value().code(), ErrorObject::AlreadyTerminal);
    EXPECT_EQ(world.recorder.calls, 1u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Resolved);
    EXPECT_EQ(wordOf(world.a->value(user, proxy)), 100u);
}

TEST(CrossChain, DuplicateSetupIsRefused)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);
    world.a->resolve(user, p, word(100));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_TRUE(world.relay->duplicateNext());
    world.relay->relayAll();

    ASSERT_TRUE(world.relay->lastError().hasValue());
    EXPECT_EQ(world.relay->lastError().value().code(), ErrorObject::AlreadyExists);
    EXPECT_EQ(wordOf(world.a->value(user, proxy)), 200u);
}

TEST(CrossChain, MessengerOnlyEntrypoints)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);
    ExecutionState userOnB(world.b, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);

    SerializedSetupRemotePromiseMessage setup(proxy, ChainA, UserAddress, TargetAddress, Double, Optional<Selector>());
    Payload encoded = MessageSerializer::serialize(setup);

    EXPECT_EQ(errorCodeOf([&]() { world.b->receiveMessage(userOnB, ChainA, LocalRelay::DefaultEngineAddress, encoded); }), ErrorObject::Unauthorized);
    EXPECT_EQ(errorCodeOf([&]() { world.b->setupRemotePromise(userOnB, ChainA, setup); }), ErrorObject::Unauthorized);
    EXPECT_EQ(errorCodeOf([&]() { world.b->executeRemoteCallback(userOnB, ChainA, proxy, word(1)); }), ErrorObject::Unauthorized);
    EXPECT_EQ(errorCodeOf([&]() { world.a->resolveRemoteProxy(user, ChainB, proxy, PromiseObject::Resolved, word(1)); }), ErrorObject::Unauthorized);
    EXPECT_FALSE(world.b->exists(proxy));
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);

    // the messenger only vouches for the engine itself
    ExecutionState messenger(world.b, LocalRelay::DefaultMessengerAddress);
    EXPECT_EQ(errorCodeOf([&]() { world.b->receiveMessage(messenger, ChainA, UserAddress, encoded); }), ErrorObject::Unauthorized);
    EXPECT_FALSE(world.b->exists(proxy));

    // the claimed source must match the delivering chain
    EXPECT_EQ(errorCodeOf([&]() { world.b->setupRemotePromise(messenger, ChainC, setup); }), ErrorObject::Unauthorized);
    EXPECT_FALSE(world.b->exists(proxy));

    world.b->receiveMessage(messenger, ChainA, LocalRelay::DefaultEngineAddress, encoded);
    EXPECT_TRUE(world.b->exists(proxy));
    EXPECT_EQ(errorCodeOf([&]() { world.b->executeRemoteCallback(messenger, ChainC, proxy, word(1)); }), ErrorObject::Unauthorized);
}

TEST(CrossChain, ProxyAnswersOnlyFromDestination)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);
    ExecutionState messenger(world.a, LocalRelay::DefaultMessengerAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Double);

    EXPECT_EQ(errorCodeOf([&]() { world.a->resolveRemoteProxy(messenger, ChainC, proxy, PromiseObject::Resolved, word(1)); }), ErrorObject::Unauthorized);
    EXPECT_EQ(errorCodeOf([&]() { world.a->resolveRemoteProxy(messenger, ChainB, p, PromiseObject::Resolved, word(1)); }), ErrorObject::UnknownPromise);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);

    world.a->resolveRemoteProxy(messenger, ChainB, proxy, PromiseObject::Rejected, text("remote"));
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Rejected);
    EXPECT_FALSE(world.a->forwarder()->forwardingRecord(proxy)->isActive());
    EXPECT_EQ(errorCodeOf([&]() { world.a->resolveRemoteProxy(messenger, ChainB, proxy, PromiseObject::Resolved, word(1)); }), ErrorObject::InvalidMessage);
}

TEST(CrossChain, GarbageIsInvalidMessage)
{
    TestWorld world;
    ExecutionState messenger(world.b, LocalRelay::DefaultMessengerAddress);

    EXPECT_EQ(errorCodeOf([&]() { world.b->receiveMessage(messenger, ChainA, LocalRelay::DefaultEngineAddress, text("garbage")); }), ErrorObject::InvalidMessage);
    EXPECT_EQ(errorCodeOf([&]() { world.b->receiveMessage(messenger, ChainA, LocalRelay::DefaultEngineAddress, Payload()); }), ErrorObject::InvalidMessage);
}

TEST(CrossChain, AtomicFanOutOnDestination)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);
    world.spawner.count = 2;

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, ChainB, TargetAddress, Spawn);
    world.a->resolve(user, p, word(0));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_EQ(world.relay->relayAll(), 2u);
    ASSERT_EQ(world.spawner.children.size(), 2u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);

    ExecutionState target(world.b, TargetAddress);
    world.b->resolve(target, world.spawner.children[1], word(2));
    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);
    world.b->resolve(target, world.spawner.children[0], word(1));
    EXPECT_EQ(world.relay->relayAll(), 1u);

    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Resolved);
    Optional<OptionalPayloadVector> results = PayloadEncoding::decodeList(world.a->value(user, proxy));
    ASSERT_TRUE(results.hasValue());
    ASSERT_EQ(results.value().size(), 2u);
    EXPECT_EQ(wordOf(results.value()[0].value()), 1u);
    EXPECT_EQ(wordOf(results.value()[1].value()), 2u);
}

TEST(CrossChain, ShareCopiesSettledPromise)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);
    ExecutionState userOnB(world.b, UserAddress);

    PromiseId pending = world.a->create(user);
    EXPECT_EQ(errorCodeOf([&]() { world.a->sharePromise(user, ChainB, pending); }), ErrorObject::NotReady);
    EXPECT_EQ(world.relay->pendingMessageCount(), 0u);

    PromiseId p = world.a->create(user);
    world.a->resolve(user, p, word(5));
    world.a->sharePromise(user, ChainB, p);
    world.relay->relayAll();
    EXPECT_FALSE(world.relay->lastError().hasValue());

    ASSERT_TRUE(world.b->exists(p));
    PromiseObject* copy = world.promise(world.b, p);
    EXPECT_EQ(copy->origin(), PromiseObject::Shared);
    EXPECT_EQ(copy->remoteChain(), ChainA);
    EXPECT_EQ(copy->creator(), UserAddress);
    EXPECT_EQ(copy->state(), PromiseObject::Resolved);
    EXPECT_EQ(wordOf(copy->value()), 5u);
    EXPECT_EQ(errorCodeOf([&]() { world.b->resolve(userOnB, p, word(6)); }), ErrorObject::AlreadyTerminal);

    // the copy takes local callbacks like any other promise
    PromiseId next = world.b->then(userOnB, p, TargetAddress, Double);
    world.b->executePromiseCallbacks(userOnB, p);
    EXPECT_EQ(wordOf(world.b->value(userOnB, next)), 10u);

    world.a->sharePromise(user, ChainB, p);
    world.relay->relayAll();
    ASSERT_TRUE(world.relay->lastError().hasValue());
    EXPECT_EQ(world.relay->lastError().value().code(), ErrorObject::AlreadyExists);
}

TEST(CrossChain, ShareRejectedPromise)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);
    ExecutionState userOnC(world.c, UserAddress);

    PromiseId p = world.a->create(user);
    world.a->reject(user, p, text("gone"));
    world.a->sharePromise(user, ChainC, p);
    world.relay->relayAll();

    EXPECT_EQ(world.c->status(userOnC, p), PromiseObject::Rejected);
    EXPECT_EQ(PayloadEncoding::toString(world.c->value(userOnC, p)), "gone");
    EXPECT_FALSE(world.b->exists(p));
}

TEST(CrossChain, UnknownDestinationChainIsDropped)
{
    TestWorld world;
    ExecutionState user(world.a, UserAddress);

    PromiseId p = world.a->create(user);
    PromiseId proxy = world.a->thenOnChain(user, p, 999, TargetAddress, Double);
    world.a->resolve(user, p, word(1));
    world.a->executePromiseCallbacks(user, p);

    EXPECT_EQ(world.relay->relayAll(), 2u);
    EXPECT_EQ(world.relay->deliveredMessageCount(), 0u);
    EXPECT_EQ(world.a->status(user, proxy), PromiseObject::Pending);
}
