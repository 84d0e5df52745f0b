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

#ifndef __InteropCallbackRegistry__
#define __InteropCallbackRegistry__

#include "runtime/PromiseObject.h"
#include "runtime/SandBox.h"

namespace Interop {

class Environment;

// Registers callbacks against promises and runs them once their promise is
// terminal. Nothing here runs on its own: execution happens only when
// executePromiseCallbacks or flushChain is called.
class CallbackRegistry : public gc {
public:
    explicit CallbackRegistry(Environment* environment)
        : m_environment(environment)
    {
    }

    PromiseId then(ExecutionState& state, const PromiseId& parentId, Address target, Selector successSelector, Optional<Selector> errorSelector);
    PromiseId onReject(ExecutionState& state, const PromiseId& parentId, Address target, Selector errorSelector);

    // the record's continuation must already exist
    void appendCallback(PromiseObject* parent, CallbackRecord* record);

    // returns the number of callbacks run
    size_t executePromiseCallbacks(ExecutionState& state, const PromiseId& id);
    // Follows the first registration of each promise. Only promises that had
    // callbacks left to run count as steps.
    size_t flushChain(ExecutionState& state, const PromiseId& startId, size_t maxSteps);

private:
    PromiseId registerCallback(ExecutionState& state, CallbackRecord::Kind kind, const PromiseId& parentId, Address target,
                               Selector successSelector, Optional<Selector> errorSelector, const char* entrypoint);

    void executeCallback(ExecutionState& state, PromiseObject* parent, CallbackRecord* record);
    SandBox::SandBoxResult invokeHandler(ExecutionState& state, CallbackRecord* record, Selector selector, const Payload& argument, bool& reentered);
    void completeCallback(ExecutionState& state, CallbackRecord* record, const SandBox::SandBoxResult& result);
    void rejectReentered(ExecutionState& state, CallbackRecord* record);
    void settleContinuation(ExecutionState& state, CallbackRecord* record, PromiseObject::PromiseState newState, const Payload& value);

    Environment* m_environment;
};
} // namespace Interop

#endif
