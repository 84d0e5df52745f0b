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

#ifndef __InteropSerializedMessage__
#define __InteropSerializedMessage__

#include "runtime/PromiseId.h"
#include "runtime/Payload.h"

namespace Interop {

// Cross-chain message as it travels between two engines. Layout: one type
// byte followed by the message fields. Integers are big-endian, ids are raw
// 32 bytes, payloads are a u32 length followed by the bytes.
class SerializedMessage {
    friend class MessageSerializer;

public:
#define FOR_EACH_SERIALIZABLE_MESSAGE(F) \
    F(SetupRemotePromise)                \
    F(ExecuteRemoteCallback)             \
    F(ResolveProxy)                      \
    F(SharePromise)

    enum Type : uint8_t {
        Invalid = 0,
#define DECLARE_SERIALIZABLE_MESSAGE(name) name,
        FOR_EACH_SERIALIZABLE_MESSAGE(DECLARE_SERIALIZABLE_MESSAGE)
#undef DECLARE_SERIALIZABLE_MESSAGE
    };

    virtual ~SerializedMessage() {}
    virtual Type type() const = 0;

    // the promise the message is about
    virtual const PromiseId& promiseId() const = 0;

    void serializeInto(std::ostringstream& outputStream) const
    {
        serializeMessageType(outputStream);
        serializeMessageData(outputStream);
    }

    static const char* typeName(Type type)
    {
        switch (type) {
#define DECLARE_MESSAGE_NAME(name) \
    case name:                     \
        return #name;
            FOR_EACH_SERIALIZABLE_MESSAGE(DECLARE_MESSAGE_NAME)
#undef DECLARE_MESSAGE_NAME
        default:
            return "Invalid";
        }
    }

protected:
    virtual void serializeMessageData(std::ostringstream& outputStream) const = 0;

    void serializeMessageType(std::ostringstream& outputStream) const
    {
        outputStream.put(static_cast<char>(type()));
    }

    static void writeUInt8(std::ostringstream& outputStream, uint8_t value)
    {
        outputStream.put(static_cast<char>(value));
    }

    static void writeUInt32(std::ostringstream& outputStream, uint32_t value)
    {
        for (int shift = 24; shift >= 0; shift -= 8) {
            outputStream.put(static_cast<char>((value >> shift) & 0xff));
        }
    }

    static void writeUInt64(std::ostringstream& outputStream, uint64_t value)
    {
        for (int shift = 56; shift >= 0; shift -= 8) {
            outputStream.put(static_cast<char>((value >> shift) & 0xff));
        }
    }

    static void writePromiseId(std::ostringstream& outputStream, const PromiseId& id)
    {
        outputStream.write(reinterpret_cast<const char*>(id.data()), PromiseId::Size);
    }

    static void writePayload(std::ostringstream& outputStream, const Payload& payload)
    {
        writeUInt32(outputStream, static_cast<uint32_t>(payload.size()));
        if (payload.size()) {
            outputStream.write(reinterpret_cast<const char*>(payload.data()), payload.size());
        }
    }

    // readers return false on truncated input
    static bool readUInt8(std::istringstream& inputStream, uint8_t& value)
    {
        char ch;
        if (!inputStream.get(ch)) {
            return false;
        }
        value = static_cast<uint8_t>(ch);
        return true;
    }

    static bool readUInt32(std::istringstream& inputStream, uint32_t& value)
    {
        value = 0;
        for (size_t i = 0; i < 4; i++) {
            uint8_t byte;
            if (!readUInt8(inputStream, byte)) {
                return false;
            }
            value = (value << 8) | byte;
        }
        return true;
    }

    static bool readUInt64(std::istringstream& inputStream, uint64_t& value)
    {
        value = 0;
        for (size_t i = 0; i < 8; i++) {
            uint8_t byte;
            if (!readUInt8(inputStream, byte)) {
                return false;
            }
            value = (value << 8) | byte;
        }
        return true;
    }

    static bool readPromiseId(std::istringstream& inputStream, PromiseId& id)
    {
        uint8_t bytes[PromiseId::Size];
        inputStream.read(reinterpret_cast<char*>(bytes), PromiseId::Size);
        if (static_cast<size_t>(inputStream.gcount()) != PromiseId::Size) {
            return false;
        }
        id = PromiseId(bytes);
        return true;
    }

    static bool readPayload(std::istringstream& inputStream, Payload& payload)
    {
        uint32_t length;
        if (!readUInt32(inputStream, length) || length > INTEROP_MESSAGE_SIZE_LIMIT) {
            return false;
        }
        payload.resize(length);
        if (!length) {
            return true;
        }
        inputStream.read(reinterpret_cast<char*>(payload.data()), length);
        return static_cast<size_t>(inputStream.gcount()) == length;
    }
};

} // namespace Interop

#endif
