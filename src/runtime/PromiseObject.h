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

#ifndef __InteropPromiseObject__
#define __InteropPromiseObject__

#include "runtime/PromiseId.h"
#include "runtime/Payload.h"

namespace Interop {

class PromiseObject;

// One registration against a promise. Then and Catch run on this chain;
// Remote forwards the parent's value to destinationChain, and its
// continuation is the local proxy that the return trip settles.
class CallbackRecord : public gc {
public:
    enum Kind {
        Then,
        Catch,
        Remote,
    };

    CallbackRecord(Kind kind, const PromiseId& parentId, const PromiseId& continuationId, Address target,
                   Selector successSelector, Optional<Selector> errorSelector,
                   Address registrant, ChainId sourceChain, ChainId destinationChain)
        : m_kind(kind)
        , m_parentId(parentId)
        , m_continuationId(continuationId)
        , m_target(target)
        , m_successSelector(successSelector)
        , m_errorSelector(errorSelector)
        , m_registrant(registrant)
        , m_sourceChain(sourceChain)
        , m_destinationChain(destinationChain)
        , m_executed(false)
        , m_active(kind == Remote)
    {
    }

    Kind kind() const { return m_kind; }
    const PromiseId& parentId() const { return m_parentId; }
    const PromiseId& continuationId() const { return m_continuationId; }
    Address target() const { return m_target; }
    Selector successSelector() const { return m_successSelector; }
    const Optional<Selector>& errorSelector() const { return m_errorSelector; }
    Address registrant() const { return m_registrant; }
    ChainId sourceChain() const { return m_sourceChain; }
    ChainId destinationChain() const { return m_destinationChain; }

    bool isExecuted() const
    {
        return m_executed;
    }

    void markExecuted()
    {
        ASSERT(!m_executed);
        m_executed = true;
    }

    // forwarding records stay active until the proxy they feed is settled
    bool isActive() const
    {
        return m_active;
    }

    void deactivate()
    {
        m_active = false;
    }

private:
    Kind m_kind;
    PromiseId m_parentId;
    PromiseId m_continuationId;
    Address m_target;
    Selector m_successSelector;
    Optional<Selector> m_errorSelector;
    Address m_registrant;
    ChainId m_sourceChain;
    ChainId m_destinationChain;
    bool m_executed;
    bool m_active;
};

typedef std::vector<CallbackRecord*, gc_allocator<CallbackRecord*>> CallbackRecordVector;

class PromiseObject : public gc {
public:
    enum PromiseState : uint8_t {
        Pending,
        Resolved,
        Rejected
    };

    // Where the record came from. Proxy stands in for a promise living on
    // remoteChain() under the same id; Mirror and Shared were materialized
    // here from a message sent by remoteChain().
    enum Origin : uint8_t {
        Local,
        Proxy,
        Mirror,
        Shared
    };

    PromiseObject(const PromiseId& id, Address creator, Origin origin = Local, ChainId remoteChain = 0);

    const PromiseId& id() const
    {
        return m_id;
    }

    Address creator() const
    {
        return m_creator;
    }

    PromiseState state() const
    {
        return m_state;
    }

    bool isPending() const
    {
        return m_state == Pending;
    }

    bool isTerminal() const
    {
        return m_state != Pending;
    }

    const Payload& value() const
    {
        return m_value;
    }

    Origin origin() const
    {
        return m_origin;
    }

    ChainId remoteChain() const
    {
        ASSERT(m_origin != Local);
        return m_remoteChain;
    }

    bool isPendingProxy() const
    {
        return m_origin == Proxy && m_state == Pending;
    }

    // only the PromiseStore moves a promise out of Pending
    void settle(PromiseState state, const Payload& value);

    // nonce for ids derived from this promise, one per registration
    uint64_t nextRegistrationNonce()
    {
        return m_registrationCount++;
    }

    void appendCallback(CallbackRecord* record)
    {
        ASSERT(record->parentId() == m_id);
        m_callbacks.push_back(record);
    }

    const CallbackRecordVector& callbacks() const
    {
        return m_callbacks;
    }

    bool hasUnexecutedCallbacks() const;

    bool isCallbacksJobQueued() const
    {
        return m_callbacksJobQueued;
    }

    void setCallbacksJobQueued(bool queued)
    {
        m_callbacksJobQueued = queued;
    }

    static const char* stateName(PromiseState state);

private:
    PromiseId m_id;
    Address m_creator;
    PromiseState m_state;
    Origin m_origin;
    bool m_callbacksJobQueued;
    ChainId m_remoteChain;
    uint64_t m_registrationCount;
    Payload m_value;
    CallbackRecordVector m_callbacks;
};
} // namespace Interop
#endif // __InteropPromiseObject__
