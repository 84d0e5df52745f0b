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
#include "runtime/serialization/MessageSerializer.h"
#include "runtime/serialization/SerializedExecuteRemoteCallbackMessage.h"
#include "runtime/serialization/SerializedResolveProxyMessage.h"
#include "runtime/serialization/SerializedSetupRemotePromiseMessage.h"
#include "runtime/serialization/SerializedSharePromiseMessage.h"

using namespace Interop;
using namespace Interop::CCTest;

static PromiseId sampleId()
{
    return IdentifierHasher("remote").add(IdentifierHasher("create").add(ChainA).add(uint64_t(0)).finish()).add(ChainB).add(uint64_t(0)).finish();
}

TEST(MessageSerializer, SetupRemotePromise)
{
    SerializedSetupRemotePromiseMessage message(sampleId(), ChainA, UserAddress, TargetAddress, Double, Selector(Recover));
    Payload encoded = MessageSerializer::serialize(message);
    EXPECT_EQ(encoded[0], SerializedMessage::SetupRemotePromise);

    std::unique_ptr<SerializedMessage> decoded = MessageSerializer::deserialize(encoded);
    ASSERT_TRUE(!!decoded);
    ASSERT_EQ(decoded->type(), SerializedMessage::SetupRemotePromise);

    SerializedSetupRemotePromiseMessage* setup = static_cast<SerializedSetupRemotePromiseMessage*>(decoded.get());
    EXPECT_EQ(setup->promiseId(), sampleId());
    EXPECT_EQ(setup->sourceChain(), ChainA);
    EXPECT_EQ(setup->registrant(), UserAddress);
    EXPECT_EQ(setup->target(), TargetAddress);
    EXPECT_EQ(setup->successSelector(), Selector(Double));
    ASSERT_TRUE(setup->errorSelector().hasValue());
    EXPECT_EQ(setup->errorSelector().value(), Selector(Recover));

    SerializedSetupRemotePromiseMessage withoutErrorSelector(sampleId(), ChainA, UserAddress, TargetAddress, Double, Optional<Selector>());
    decoded = MessageSerializer::deserialize(MessageSerializer::serialize(withoutErrorSelector));
    ASSERT_TRUE(!!decoded);
    EXPECT_FALSE(static_cast<SerializedSetupRemotePromiseMessage*>(decoded.get())->errorSelector().hasValue());
}

TEST(MessageSerializer, SharePromiseKeepsSnapshot)
{
    SerializedSharePromiseMessage message(sampleId(), PromiseObject::Rejected, UserAddress, text("why"));
    std::unique_ptr<SerializedMessage> decoded = MessageSerializer::deserialize(MessageSerializer::serialize(message));
    ASSERT_TRUE(!!decoded);
    ASSERT_EQ(decoded->type(), SerializedMessage::SharePromise);

    SerializedSharePromiseMessage* share = static_cast<SerializedSharePromiseMessage*>(decoded.get());
    EXPECT_EQ(share->promiseId(), sampleId());
    EXPECT_EQ(share->state(), PromiseObject::Rejected);
    EXPECT_EQ(share->creator(), UserAddress);
    EXPECT_EQ(PayloadEncoding::toString(share->value()), "why");
}

TEST(MessageSerializer, EmptyPayloadSurvives)
{
    SerializedExecuteRemoteCallbackMessage message(sampleId(), Payload());
    std::unique_ptr<SerializedMessage> decoded = MessageSerializer::deserialize(MessageSerializer::serialize(message));
    ASSERT_TRUE(!!decoded);
    EXPECT_TRUE(static_cast<SerializedExecuteRemoteCallbackMessage*>(decoded.get())->value().empty());
}

TEST(MessageSerializer, RejectsTruncatedInput)
{
    SerializedSetupRemotePromiseMessage message(sampleId(), ChainA, UserAddress, TargetAddress, Double, Selector(Recover));
    Payload encoded = MessageSerializer::serialize(message);

    for (size_t length = 0; length < encoded.size(); length++) {
        Payload prefix(encoded.begin(), encoded.begin() + length);
        EXPECT_FALSE(!!MessageSerializer::deserialize(prefix)) << "prefix of " << length << " bytes";
    }
}

TEST(MessageSerializer, RejectsMalformedInput)
{
    SerializedResolveProxyMessage message(sampleId(), PromiseObject::Resolved, word(3));
    Payload encoded = MessageSerializer::serialize(message);
    ASSERT_TRUE(!!MessageSerializer::deserialize(encoded));

    Payload trailing = encoded;
    trailing.push_back(0);
    EXPECT_FALSE(!!MessageSerializer::deserialize(trailing));

    Payload unknownType = encoded;
    unknownType[0] = 0x7f;
    EXPECT_FALSE(!!MessageSerializer::deserialize(unknownType));

    Payload invalidType = encoded;
    invalidType[0] = SerializedMessage::Invalid;
    EXPECT_FALSE(!!MessageSerializer::deserialize(invalidType));

    // type byte, then the id, then the state byte
    Payload pendingState = encoded;
    pendingState[1 + PromiseId::Size] = PromiseObject::Pending;
    EXPECT_FALSE(!!MessageSerializer::deserialize(pendingState));

    Payload oversizedLength = encoded;
    oversizedLength[2 + PromiseId::Size] = 0xff;
    EXPECT_FALSE(!!MessageSerializer::deserialize(oversizedLength));

    EXPECT_FALSE(!!MessageSerializer::deserialize(Payload()));
}
