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

#ifndef __InteropPromiseAllAggregator__
#define __InteropPromiseAllAggregator__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;

struct PromiseAllStatus {
    PromiseAllStatus()
        : ready(false)
        , failed(false)
    {
    }

    bool ready;
    bool failed;
    // payload of each resolved member, absent otherwise
    OptionalPayloadVector results;
};

// Promise.all over a fixed, ordered member set. Each set is backed by an
// engine owned promise that checkAll settles once the set is ready.
class PromiseAllAggregator : public gc {
public:
    explicit PromiseAllAggregator(Environment* environment)
        : m_environment(environment)
        , m_createCount(0)
    {
    }

    PromiseId createAll(ExecutionState& state, const PromiseIdVector& memberIds);
    PromiseAllStatus checkAll(ExecutionState& state, const PromiseId& allId);

    bool isPromiseAll(const PromiseId& id) const
    {
        return m_members.find(id) != m_members.end();
    }

private:
    Environment* m_environment;
    uint64_t m_createCount;
    PromiseIdMap<PromiseIdVector> m_members;
};
} // namespace Interop

#endif
