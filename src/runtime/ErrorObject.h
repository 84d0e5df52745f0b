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

#ifndef __InteropErrorObject__
#define __InteropErrorObject__

#include "runtime/Payload.h"

namespace Interop {

class ExecutionState;

// Engine errors are thrown by value. Inside a callback they are caught by the
// SandBox and turned into a rejection payload; everywhere else they reach the
// caller untouched.
class ErrorObject {
public:
    class Messages {
    public:
        static constexpr const char* Unauthorized_NotCreator = "%s: caller is not the creator of promise %s";
        static constexpr const char* Unauthorized_NotMessenger = "%s: caller is not the messenger";
        static constexpr const char* Unauthorized_ForeignSender = "%s: cross-domain sender is not this engine";
        static constexpr const char* Unauthorized_WrongSourceChain = "%s: promise %s was not forwarded to chain %llu";
        static constexpr const char* Unauthorized_SourceMismatch = "%s: message for promise %s did not come from chain %llu";
        static constexpr const char* AlreadyTerminal = "%s: promise %s is already settled";
        static constexpr const char* NotReady = "%s: promise %s is still pending";
        static constexpr const char* NotReady_Deadline = "%s: deadline of timeout %s has not passed";
        static constexpr const char* ReentrantCall = "%s: called from inside an active callback";
        static constexpr const char* NoActiveCallback = "%s: no callback is executing";
        static constexpr const char* Unordered = "%s: no setup was received for remote promise %s";
        static constexpr const char* UnknownPromise = "%s: unknown promise %s";
        static constexpr const char* UnknownTarget = "%s: no callback target at address %llu";
        static constexpr const char* UnknownSelector = "%s: target %llu has no handler for selector 0x%08x";
        static constexpr const char* AlreadyExists = "%s: promise %s already exists";
        static constexpr const char* InvalidMessage = "%s: malformed cross-chain message";
        static constexpr const char* InvalidMessage_Inactive = "%s: forwarding record for %s is not active";
    };

    enum Code {
        None,
        Unauthorized,
        AlreadyTerminal,
        NotReady,
        ReentrantCall,
        NoActiveCallback,
        Unordered,
        UnknownPromise,
        UnknownTarget,
        UnknownSelector,
        AlreadyExists,
        InvalidMessage,
    };

    ErrorObject()
        : m_code(None)
    {
    }

    ErrorObject(Code code, const std::string& message)
        : m_code(code)
        , m_message(message)
    {
    }

    Code code() const
    {
        return m_code;
    }

    const std::string& message() const
    {
        return m_message;
    }

    static const char* codeName(Code code);

    // "Error(<code name>): <message>" so a rejected continuation tells
    // which engine error produced it
    Payload toPayload() const;
    static Optional<ErrorObject> fromPayload(const Payload& payload);

    static void throwBuiltinError(ExecutionState& state, Code code, const char* templateString, ...) NO_RETURN;

private:
    Code m_code;
    std::string m_message;
};

} // namespace Interop

#endif
