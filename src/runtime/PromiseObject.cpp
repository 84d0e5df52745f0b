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
#include "PromiseObject.h"

namespace Interop {

PromiseObject::PromiseObject(const PromiseId& id, Address creator, Origin origin, ChainId remoteChain)
    : m_id(id)
    , m_creator(creator)
    , m_state(Pending)
    , m_origin(origin)
    , m_callbacksJobQueued(false)
    , m_remoteChain(remoteChain)
    , m_registrationCount(0)
{
}

void PromiseObject::settle(PromiseState state, const Payload& value)
{
    ASSERT(m_state == Pending);
    ASSERT(state != Pending);
    m_state = state;
    m_value = value;
}

bool PromiseObject::hasUnexecutedCallbacks() const
{
    for (size_t i = 0; i < m_callbacks.size(); i++) {
        if (!m_callbacks[i]->isExecuted()) {
            return true;
        }
    }
    return false;
}

const char* PromiseObject::stateName(PromiseState state)
{
    switch (state) {
    case Pending:
        return "Pending";
    case Resolved:
        return "Resolved";
    case Rejected:
        return "Rejected";
    default:
        RELEASE_ASSERT_NOT_REACHED();
    }
}
} // namespace Interop
