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

#ifndef __InteropPlatform__
#define __InteropPlatform__

#include "runtime/Payload.h"

namespace Interop {

class Environment;

// Host services an Environment depends on. The host owns delivery: the engine
// only hands payloads over and expects them to arrive at least once, in send
// order per (source, destination) pair.
class Platform {
public:
    virtual ~Platform() {}

    // Messaging
    // address every messenger-only entrypoint accepts as caller
    virtual Address messengerAddress() = 0;
    virtual MessageId sendMessage(Environment* source, ChainId destination, Address target, const Payload& message) = 0;

    // Clock
    // monotonic per chain, used by timeout promises
    virtual uint64_t currentTime(Environment* relatedEnvironment) = 0;
};
} // namespace Interop

#endif
