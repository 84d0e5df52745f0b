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
#include "MessageSerializer.h"

#include "runtime/serialization/SerializedExecuteRemoteCallbackMessage.h"
#include "runtime/serialization/SerializedResolveProxyMessage.h"
#include "runtime/serialization/SerializedSetupRemotePromiseMessage.h"
#include "runtime/serialization/SerializedSharePromiseMessage.h"

namespace Interop {

bool MessageSerializer::serializeInto(const SerializedMessage& message, std::ostringstream& output)
{
    message.serializeInto(output);
    return !!output;
}

Payload MessageSerializer::serialize(const SerializedMessage& message)
{
    std::ostringstream output;
    bool success = serializeInto(message, output);
    RELEASE_ASSERT(success);

    std::string bytes = output.str();
    return Payload(bytes.begin(), bytes.end());
}

std::unique_ptr<SerializedMessage> MessageSerializer::deserialize(const Payload& input)
{
    if (input.empty() || input.size() > INTEROP_MESSAGE_SIZE_LIMIT) {
        return nullptr;
    }

    std::istringstream stream(std::string(input.begin(), input.end()));
    std::unique_ptr<SerializedMessage> message = deserializeFrom(stream);
    if (message && stream.peek() != std::istringstream::traits_type::eof()) {
        return nullptr;
    }
    return message;
}

std::unique_ptr<SerializedMessage> MessageSerializer::deserializeFrom(std::istringstream& input)
{
    uint8_t type;
    if (!SerializedMessage::readUInt8(input, type)) {
        return nullptr;
    }

    switch (type) {
#define DECLARE_SERIALIZABLE_MESSAGE(name) \
    case SerializedMessage::Type::name:    \
        return Serialized##name##Message::deserializeFrom(input);
        FOR_EACH_SERIALIZABLE_MESSAGE(DECLARE_SERIALIZABLE_MESSAGE)
#undef DECLARE_SERIALIZABLE_MESSAGE
    default:
        return nullptr;
    }
}

} // namespace Interop
