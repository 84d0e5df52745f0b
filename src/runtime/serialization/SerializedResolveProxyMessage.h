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

#ifndef __InteropSerializedResolveProxyMessage__
#define __InteropSerializedResolveProxyMessage__

#include "runtime/serialization/SerializedMessage.h"
#include "runtime/PromiseObject.h"

namespace Interop {

// Return trip of a cross-chain then: the outcome of the destination's
// continuation, applied to the proxy with the same id on the source.
class SerializedResolveProxyMessage : public SerializedMessage {
    friend class MessageSerializer;

public:
    SerializedResolveProxyMessage(const PromiseId& remoteId, PromiseObject::PromiseState state, const Payload& value)
        : m_remoteId(remoteId)
        , m_state(state)
        , m_value(value)
    {
        ASSERT(state != PromiseObject::Pending);
    }

    virtual Type type() const override
    {
        return SerializedMessage::ResolveProxy;
    }

    virtual const PromiseId& promiseId() const override
    {
        return m_remoteId;
    }

    PromiseObject::PromiseState state() const
    {
        return m_state;
    }

    const Payload& value() const
    {
        return m_value;
    }

protected:
    virtual void serializeMessageData(std::ostringstream& outputStream) const override
    {
        writePromiseId(outputStream, m_remoteId);
        writeUInt8(outputStream, m_state);
        writePayload(outputStream, m_value);
    }

    static std::unique_ptr<SerializedMessage> deserializeFrom(std::istringstream& inputStream)
    {
        PromiseId remoteId;
        uint8_t state;
        Payload value;
        if (!readPromiseId(inputStream, remoteId) || !readUInt8(inputStream, state)
            || (state != PromiseObject::Resolved && state != PromiseObject::Rejected)
            || !readPayload(inputStream, value)) {
            return nullptr;
        }
        return std::unique_ptr<SerializedMessage>(new SerializedResolveProxyMessage(remoteId, static_cast<PromiseObject::PromiseState>(state), value));
    }

    PromiseId m_remoteId;
    PromiseObject::PromiseState m_state;
    Payload m_value;
};

} // namespace Interop

#endif
