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

#ifndef __InteropTimeoutRegistry__
#define __InteropTimeoutRegistry__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;

// Promises that may be resolved by anyone once the host clock has passed
// their deadline. Nothing fires them; they are polled.
class TimeoutRegistry : public gc {
public:
    explicit TimeoutRegistry(Environment* environment)
        : m_environment(environment)
        , m_createCount(0)
    {
    }

    PromiseId createTimeout(ExecutionState& state, uint64_t delay);
    void resolveTimeout(ExecutionState& state, const PromiseId& id);

    Optional<uint64_t> deadline(const PromiseId& id) const
    {
        auto iter = m_deadlines.find(id);
        if (iter == m_deadlines.end()) {
            return nullptr;
        }
        return iter->second;
    }

private:
    Environment* m_environment;
    uint64_t m_createCount;
    PromiseIdMap<uint64_t> m_deadlines;
};
} // namespace Interop

#endif
