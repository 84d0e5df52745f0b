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

#ifndef __InteropSandBox__
#define __InteropSandBox__

#include "runtime/CallbackTarget.h"
#include "runtime/ErrorObject.h"

namespace Interop {

class Environment;
class CallbackContext;

// Runs one callback invocation and turns a failure into a payload instead of
// letting it unwind into the executor. Only the two failure shapes a handler
// may throw are caught; anything else is a bug and propagates.
class SandBox {
    MAKE_STACK_ALLOCATED();

public:
    explicit SandBox(Environment* environment);
    ~SandBox();

    struct SandBoxResult {
        CallbackResult result;
        Payload error;
        bool failed;

        SandBoxResult()
            : failed(false)
        {
        }
    };

    typedef CallbackResult (*Runner)(ExecutionState& state, void* data);

    // the runner executes in a child frame of parentState whose caller is
    // the callback target and which carries the callback context
    SandBoxResult run(ExecutionState& parentState, Address caller, CallbackContext* callbackContext, Runner runner, void* data);

    Environment* environment() const
    {
        return m_environment;
    }

private:
    void processCatch(const Payload& error, SandBoxResult& result);

    Environment* m_environment;
    SandBox* m_oldSandBox;
};
} // namespace Interop

#endif
