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

#ifndef __InteropSerializedExecuteRemoteCallbackMessage__
#define __InteropSerializedExecuteRemoteCallbackMessage__

#include "runtime/serialization/SerializedMessage.h"

namespace Interop {

class SerializedExecuteRemoteCallbackMessage : public SerializedMessage {
    friend class MessageSerializer;

public:
    SerializedExecuteRemoteCallbackMessage(const PromiseId& remoteId, const Payload& value)
        : m_remoteId(remoteId)
        , m_value(value)
    {
    }

    virtual Type type() const override
    {
        return SerializedMessage::ExecuteRemoteCallback;
    }

    virtual const PromiseId& promiseId() const override
    {
        return m_remoteId;
    }

    const Payload& value() const
    {
        return m_value;
    }

protected:
    virtual void serializeMessageData(std::ostringstream& outputStream) const override
    {
        writePromiseId(outputStream, m_remoteId);
        writePayload(outputStream, m_value);
    }

    static std::unique_ptr<SerializedMessage> deserializeFrom(std::istringstream& inputStream)
    {
        PromiseId remoteId;
        Payload value;
        if (!readPromiseId(inputStream, remoteId) || !readPayload(inputStream, value)) {
            return nullptr;
        }
        return std::unique_ptr<SerializedMessage>(new SerializedExecuteRemoteCallbackMessage(remoteId, value));
    }

    PromiseId m_remoteId;
    Payload m_value;
};

} // namespace Interop

#endif
