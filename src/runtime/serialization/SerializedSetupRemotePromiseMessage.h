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

#ifndef __InteropSerializedSetupRemotePromiseMessage__
#define __InteropSerializedSetupRemotePromiseMessage__

#include "runtime/serialization/SerializedMessage.h"

namespace Interop {

// First half of a cross-chain then: binds the remote id to a target and
// handlers on the destination, with the registration's provenance.
class SerializedSetupRemotePromiseMessage : public SerializedMessage {
    friend class MessageSerializer;

public:
    SerializedSetupRemotePromiseMessage(const PromiseId& remoteId, ChainId sourceChain, Address registrant,
                                        Address target, Selector successSelector, Optional<Selector> errorSelector)
        : m_remoteId(remoteId)
        , m_sourceChain(sourceChain)
        , m_registrant(registrant)
        , m_target(target)
        , m_successSelector(successSelector)
        , m_errorSelector(errorSelector)
    {
    }

    virtual Type type() const override
    {
        return SerializedMessage::SetupRemotePromise;
    }

    virtual const PromiseId& promiseId() const override
    {
        return m_remoteId;
    }

    ChainId sourceChain() const { return m_sourceChain; }
    Address registrant() const { return m_registrant; }
    Address target() const { return m_target; }
    Selector successSelector() const { return m_successSelector; }
    const Optional<Selector>& errorSelector() const { return m_errorSelector; }

protected:
    virtual void serializeMessageData(std::ostringstream& outputStream) const override
    {
        writePromiseId(outputStream, m_remoteId);
        writeUInt64(outputStream, m_sourceChain);
        writeUInt64(outputStream, m_registrant);
        writeUInt64(outputStream, m_target);
        writeUInt32(outputStream, m_successSelector);
        writeUInt8(outputStream, m_errorSelector.hasValue() ? 1 : 0);
        if (m_errorSelector) {
            writeUInt32(outputStream, m_errorSelector.value());
        }
    }

    static std::unique_ptr<SerializedMessage> deserializeFrom(std::istringstream& inputStream)
    {
        PromiseId remoteId;
        uint64_t sourceChain, registrant, target;
        uint32_t successSelector;
        uint8_t hasErrorSelector;
        if (!readPromiseId(inputStream, remoteId) || !readUInt64(inputStream, sourceChain)
            || !readUInt64(inputStream, registrant) || !readUInt64(inputStream, target)
            || !readUInt32(inputStream, successSelector) || !readUInt8(inputStream, hasErrorSelector)
            || hasErrorSelector > 1) {
            return nullptr;
        }

        Optional<Selector> errorSelector;
        if (hasErrorSelector) {
            uint32_t selector;
            if (!readUInt32(inputStream, selector)) {
                return nullptr;
            }
            errorSelector = selector;
        }

        return std::unique_ptr<SerializedMessage>(new SerializedSetupRemotePromiseMessage(remoteId, sourceChain, registrant,
                                                                                          target, successSelector, errorSelector));
    }

    PromiseId m_remoteId;
    ChainId m_sourceChain;
    Address m_registrant;
    Address m_target;
    Selector m_successSelector;
    Optional<Selector> m_errorSelector;
};

} // namespace Interop

#endif
