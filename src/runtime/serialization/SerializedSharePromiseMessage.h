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

#ifndef __InteropSerializedSharePromiseMessage__
#define __InteropSerializedSharePromiseMessage__

#include "runtime/serialization/SerializedMessage.h"
#include "runtime/PromiseObject.h"

namespace Interop {

// Snapshot of a settled promise
class SerializedSharePromiseMessage : public SerializedMessage {
    friend class MessageSerializer;

public:
    SerializedSharePromiseMessage(const PromiseId& id, PromiseObject::PromiseState state, Address creator, const Payload& value)
        : m_id(id)
        , m_state(state)
        , m_creator(creator)
        , m_value(value)
    {
        ASSERT(state != PromiseObject::Pending);
    }

    virtual Type type() const override
    {
        return SerializedMessage::SharePromise;
    }

    virtual const PromiseId& promiseId() const override
    {
        return m_id;
    }

    PromiseObject::PromiseState state() const
    {
        return m_state;
    }

    Address creator() const
    {
        return m_creator;
    }

    const Payload& value() const
    {
        return m_value;
    }

protected:
    virtual void serializeMessageData(std::ostringstream& outputStream) const override
    {
        writePromiseId(outputStream, m_id);
        writeUInt8(outputStream, m_state);
        writeUInt64(outputStream, m_creator);
        writePayload(outputStream, m_value);
    }

    static std::unique_ptr<SerializedMessage> deserializeFrom(std::istringstream& inputStream)
    {
        PromiseId id;
        uint8_t state;
        uint64_t creator;
        Payload value;
        if (!readPromiseId(inputStream, id) || !readUInt8(inputStream, state)
            || (state != PromiseObject::Resolved && state != PromiseObject::Rejected)
            || !readUInt64(inputStream, creator) || !readPayload(inputStream, value)) {
            return nullptr;
        }
        return std::unique_ptr<SerializedMessage>(new SerializedSharePromiseMessage(id, static_cast<PromiseObject::PromiseState>(state), creator, value));
    }

    PromiseId m_id;
    PromiseObject::PromiseState m_state;
    Address m_creator;
    Payload m_value;
};

} // namespace Interop

#endif
