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
#include "ErrorObject.h"
#include "runtime/Environment.h"
#include "runtime/ExecutionState.h"

namespace Interop {

static const char* g_errorPayloadPrefix = "Error(";

const char* ErrorObject::codeName(Code code)
{
    switch (code) {
    case None:
        return "None";
    case Unauthorized:
        return "Unauthorized";
    case AlreadyTerminal:
        return "AlreadyTerminal";
    case NotReady:
        return "NotReady";
    case ReentrantCall:
        return "ReentrantCall";
    case NoActiveCallback:
        return "NoActiveCallback";
    case Unordered:
        return "Unordered";
    case UnknownPromise:
        return "UnknownPromise";
    case UnknownTarget:
        return "UnknownTarget";
    case UnknownSelector:
        return "UnknownSelector";
    case AlreadyExists:
        return "AlreadyExists";
    case InvalidMessage:
        return "InvalidMessage";
    default:
        RELEASE_ASSERT_NOT_REACHED();
    }
}

Payload ErrorObject::toPayload() const
{
    std::string text(g_errorPayloadPrefix);
    text += codeName(m_code);
    text += "): ";
    text += m_message;
    return PayloadEncoding::fromString(text);
}

Optional<ErrorObject> ErrorObject::fromPayload(const Payload& payload)
{
    std::string text = PayloadEncoding::toString(payload);
    size_t prefixLength = strlen(g_errorPayloadPrefix);
    if (text.compare(0, prefixLength, g_errorPayloadPrefix) != 0) {
        return nullptr;
    }
    size_t end = text.find("): ", prefixLength);
    if (end == std::string::npos) {
        return nullptr;
    }

    std::string name = text.substr(prefixLength, end - prefixLength);
    for (int code = Unauthorized; code <= InvalidMessage; code++) {
        if (name == codeName(static_cast<Code>(code))) {
            return ErrorObject(static_cast<Code>(code), text.substr(end + 3));
        }
    }
    return nullptr;
}

void ErrorObject::throwBuiltinError(ExecutionState& state, Code code, const char* templateString, ...)
{
    char buffer[512];
    va_list args;
    va_start(args, templateString);
    vsnprintf(buffer, sizeof(buffer), templateString, args);
    va_end(args);

    INTEROP_LOG_TRACE("[chain %llu] throw %s: %s\n", (unsigned long long)state.environment()->chainId(), codeName(code), buffer);
    UNUSED_PARAMETER(state);

    throw ErrorObject(code, buffer);
}
} // namespace Interop
