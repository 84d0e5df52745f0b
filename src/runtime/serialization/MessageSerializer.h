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

#ifndef __InteropMessageSerializer__
#define __InteropMessageSerializer__

#include "runtime/serialization/SerializedMessage.h"

namespace Interop {

class MessageSerializer {
public:
    static Payload serialize(const SerializedMessage& message);
    static bool serializeInto(const SerializedMessage& message, std::ostringstream& output);

    // this function returns nullptr when the input is truncated, oversized,
    // of an unknown type or followed by trailing bytes
    static std::unique_ptr<SerializedMessage> deserialize(const Payload& input);
    static std::unique_ptr<SerializedMessage> deserializeFrom(std::istringstream& input);
};

} // namespace Interop

#endif
