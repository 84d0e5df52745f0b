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

#ifndef __InteropExecutionState__
#define __InteropExecutionState__

namespace Interop {

class Environment;
class CallbackContext;

// One frame of a synchronous call into an Environment. caller() is the
// principal on whose behalf the call runs and is what every authorization
// check looks at. Frames created for a callback carry its CallbackContext.
class ExecutionState {
    MAKE_STACK_ALLOCATED();

public:
    ExecutionState(Environment* environment, Address caller)
        : m_environment(environment)
        , m_caller(caller)
        , m_parent(nullptr)
        , m_callbackContext(nullptr)
    {
    }

    ExecutionState(ExecutionState* parent, Address caller, CallbackContext* callbackContext = nullptr)
        : m_environment(parent->environment())
        , m_caller(caller)
        , m_parent(parent)
        , m_callbackContext(callbackContext)
    {
    }

    Environment* environment() const
    {
        return m_environment;
    }

    Address caller() const
    {
        return m_caller;
    }

    ExecutionState* parent() const
    {
        return m_parent;
    }

    Optional<CallbackContext*> callbackContext() const
    {
        return m_callbackContext;
    }

private:
    Environment* m_environment;
    Address m_caller;
    ExecutionState* m_parent;
    CallbackContext* m_callbackContext;
};
} // namespace Interop

#endif
