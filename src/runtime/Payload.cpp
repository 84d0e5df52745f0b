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
#include "Payload.h"

namespace Interop {

constexpr size_t PayloadEncoding::WordSize;

static void appendUInt32(Payload& output, uint32_t value)
{
    for (size_t i = 0; i < 4; i++) {
        output.push_back(static_cast<uint8_t>(value >> (24 - i * 8)));
    }
}

static bool readUInt32(const Payload& input, size_t& position, uint32_t& value)
{
    if (input.size() - position < 4) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < 4; i++) {
        value = (value << 8) | input[position++];
    }
    return true;
}

Payload PayloadEncoding::fromUInt64(uint64_t value)
{
    Payload result(WordSize, 0);
    for (size_t i = 0; i < 8; i++) {
        result[WordSize - 1 - i] = static_cast<uint8_t>(value >> (i * 8));
    }
    return result;
}

Optional<uint64_t> PayloadEncoding::toUInt64(const Payload& payload)
{
    if (payload.size() != WordSize) {
        return nullptr;
    }
    for (size_t i = 0; i < WordSize - 8; i++) {
        if (payload[i]) {
            return nullptr;
        }
    }
    uint64_t value = 0;
    for (size_t i = WordSize - 8; i < WordSize; i++) {
        value = (value << 8) | payload[i];
    }
    return value;
}

Payload PayloadEncoding::fromString(const std::string& value)
{
    return Payload(value.begin(), value.end());
}

std::string PayloadEncoding::toString(const Payload& payload)
{
    return std::string(payload.begin(), payload.end());
}

Payload PayloadEncoding::encodeList(const OptionalPayloadVector& items)
{
    Payload result;
    appendUInt32(result, static_cast<uint32_t>(items.size()));
    for (size_t i = 0; i < items.size(); i++) {
        if (!items[i].hasValue()) {
            result.push_back(0);
            continue;
        }
        const Payload& item = items[i].value();
        result.push_back(1);
        appendUInt32(result, static_cast<uint32_t>(item.size()));
        result.insert(result.end(), item.begin(), item.end());
    }
    return result;
}

Optional<OptionalPayloadVector> PayloadEncoding::decodeList(const Payload& payload)
{
    size_t position = 0;
    uint32_t count;
    if (!readUInt32(payload, position, count)) {
        return nullptr;
    }

    OptionalPayloadVector items;
    for (uint32_t i = 0; i < count; i++) {
        if (position >= payload.size()) {
            return nullptr;
        }
        uint8_t present = payload[position++];
        if (!present) {
            items.push_back(Optional<Payload>());
            continue;
        }
        uint32_t length;
        if (!readUInt32(payload, position, length) || payload.size() - position < length) {
            return nullptr;
        }
        items.push_back(Payload(payload.begin() + position, payload.begin() + position + length));
        position += length;
    }

    if (position != payload.size()) {
        return nullptr;
    }
    return items;
}
} // namespace Interop
