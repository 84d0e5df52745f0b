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

#ifndef __InteropCallbackTarget__
#define __InteropCallbackTarget__

#include "runtime/PromiseId.h"
#include "runtime/Payload.h"

namespace Interop {

class ExecutionState;

// What a handler hands back to the executor. Immediate settles the
// continuation with the value. Await adopts the outcome of one promise.
// AwaitChildren waits for every listed promise and resolves with their
// ordered results.
class CallbackResult {
public:
    enum Kind {
        Immediate,
        Await,
        AwaitChildren,
    };

    CallbackResult()
        : m_kind(Immediate)
    {
    }

    static CallbackResult immediate(const Payload& value)
    {
        CallbackResult result(Immediate);
        result.m_value = value;
        return result;
    }

    static CallbackResult await(const PromiseId& child)
    {
        CallbackResult result(Await);
        result.m_children.push_back(child);
        return result;
    }

    static CallbackResult awaitChildren(const PromiseIdVector& children)
    {
        CallbackResult result(AwaitChildren);
        result.m_children = children;
        return result;
    }

    Kind kind() const
    {
        return m_kind;
    }

    const Payload& value() const
    {
        ASSERT(m_kind == Immediate);
        return m_value;
    }

    const PromiseIdVector& children() const
    {
        ASSERT(m_kind != Immediate);
        return m_children;
    }

private:
    explicit CallbackResult(Kind kind)
        : m_kind(kind)
    {
    }

    Kind m_kind;
    Payload m_value;
    PromiseIdVector m_children;
};

// A component that callbacks can be registered against. The same logical
// component is expected at the same address on every chain.
// A handler reports failure by throwing a Payload (delivered verbatim to the
// error handler or the rejected continuation) or an ErrorObject.
class CallbackTarget : public gc {
public:
    virtual ~CallbackTarget() {}

    Address address() const
    {
        return m_address;
    }

    virtual CallbackResult call(ExecutionState& state, Selector selector, const Payload& argument) = 0;

protected:
    explicit CallbackTarget(Address address)
        : m_address(address)
    {
    }

private:
    Address m_address;
};

struct NativeHandlerInfo {
    typedef CallbackResult (*NativeHandler)(ExecutionState& state, const Payload& argument, void* data);

    NativeHandlerInfo()
        : m_handler(nullptr)
        , m_data(nullptr)
    {
    }

    NativeHandlerInfo(NativeHandler handler, void* data)
        : m_handler(handler)
        , m_data(data)
    {
    }

    NativeHandler m_handler;
    void* m_data;
};

// Dispatches selectors to C++ functions
class NativeCallbackTarget : public CallbackTarget {
public:
    explicit NativeCallbackTarget(Address address)
        : CallbackTarget(address)
    {
    }

    void defineHandler(Selector selector, NativeHandlerInfo::NativeHandler handler, void* data = nullptr)
    {
        m_handlers[selector] = NativeHandlerInfo(handler, data);
    }

    bool hasHandler(Selector selector) const
    {
        return m_handlers.find(selector) != m_handlers.end();
    }

    virtual CallbackResult call(ExecutionState& state, Selector selector, const Payload& argument);

private:
    HashMap<Selector, NativeHandlerInfo, std::hash<Selector>, std::equal_to<Selector>, gc_allocator<std::pair<Selector, NativeHandlerInfo>>> m_handlers;
};

} // namespace Interop

#endif
