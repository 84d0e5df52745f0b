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

#ifndef __InteropPromiseStore__
#define __InteropPromiseStore__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;

// Owns every promise record of one environment. Records are never removed.
class PromiseStore : public gc {
public:
    explicit PromiseStore(Environment* environment)
        : m_environment(environment)
    {
    }

    PromiseObject* create(ExecutionState& state, const PromiseId& id, Address creator,
                          PromiseObject::Origin origin = PromiseObject::Local, ChainId remoteChain = 0);

    // materializes a record that was settled elsewhere
    PromiseObject* createSettled(ExecutionState& state, const PromiseId& id, Address creator, PromiseObject::Origin origin, ChainId remoteChain,
                                 PromiseObject::PromiseState settledState, const Payload& value);

    Optional<PromiseObject*> find(const PromiseId& id) const
    {
        auto iter = m_promises.find(id);
        if (iter == m_promises.end()) {
            return nullptr;
        }
        return iter->second;
    }

    bool contains(const PromiseId& id) const
    {
        return m_promises.find(id) != m_promises.end();
    }

    // throws UnknownPromise when there is no record
    PromiseObject* get(ExecutionState& state, const PromiseId& id, const char* entrypoint) const;

    // only the creator of a promise may settle it, and only once
    void resolve(ExecutionState& state, const PromiseId& id, const Payload& value);
    void reject(ExecutionState& state, const PromiseId& id, const Payload& value);
    void settle(ExecutionState& state, PromiseObject* promise, PromiseObject::PromiseState newState, const Payload& value, const char* entrypoint);

    size_t size() const
    {
        return m_promises.size();
    }

private:
    Environment* m_environment;
    PromiseIdMap<PromiseObject*> m_promises;
};
} // namespace Interop

#endif
