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

#ifndef __InteropPayload__
#define __InteropPayload__

namespace Interop {

// Opaque, self-describing binary blob. The engine never looks inside a
// payload except for the helpers below, which applications may use to agree
// on a common encoding.
typedef std::vector<uint8_t> Payload;
typedef std::vector<Optional<Payload>> OptionalPayloadVector;

class PayloadEncoding {
public:
    // 32-byte big-endian word, the layout of an unsigned 256-bit integer
    static constexpr size_t WordSize = 32;

    static Payload fromUInt64(uint64_t value);
    // fails when the payload is not a single word or does not fit in 64 bits
    static Optional<uint64_t> toUInt64(const Payload& payload);

    static Payload fromString(const std::string& value);
    static std::string toString(const Payload& payload);

    // u32 count, then per item: u8 present flag, u32 length, bytes
    static Payload encodeList(const OptionalPayloadVector& items);
    static Optional<OptionalPayloadVector> decodeList(const Payload& payload);
};

} // namespace Interop

#endif
