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

#ifndef __InteropCrossChainForwarder__
#define __InteropCrossChainForwarder__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;
class SerializedSetupRemotePromiseMessage;
class SerializedSharePromiseMessage;

// Both ends of cross-chain callbacks.
//
// Source side: then() on another chain creates a local proxy whose id is the
// remote promise id, and a Remote record on the parent. Executing the parent
// sends setup then execute; the destination answers with one ResolveProxy
// message that settles the proxy.
//
// Destination side: setup materializes the mirror promise under the same id
// with a Then record whose continuation is the return promise. execute
// resolves the mirror and runs that record; once the return promise settles
// its outcome is sent back.
class CrossChainForwarder : public gc {
public:
    explicit CrossChainForwarder(Environment* environment)
        : m_environment(environment)
    {
    }

    PromiseId then(ExecutionState& state, const PromiseId& parentId, ChainId destinationChain, Address target,
                   Selector successSelector, Optional<Selector> errorSelector);

    // runs a Remote record of a terminal parent
    void dispatch(ExecutionState& state, PromiseObject* parent, CallbackRecord* record);

    void setupRemotePromise(ExecutionState& state, ChainId sourceChain, const SerializedSetupRemotePromiseMessage& message);
    void executeRemoteCallback(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, const Payload& value);
    void resolveRemoteProxy(ExecutionState& state, ChainId sourceChain, const PromiseId& remoteId, PromiseObject::PromiseState newState, const Payload& value);

    void sharePromise(ExecutionState& state, ChainId destinationChain, const PromiseId& id);
    void shareResolvedPromise(ExecutionState& state, ChainId sourceChain, const SerializedSharePromiseMessage& message);

    // sends the return message when a destination continuation settles
    void didSettlePromise(ExecutionState& state, PromiseObject* promise);

    Optional<CallbackRecord*> forwardingRecord(const PromiseId& proxyId) const
    {
        auto iter = m_forwardingRecords.find(proxyId);
        if (iter == m_forwardingRecords.end()) {
            return nullptr;
        }
        return iter->second;
    }

    static PromiseId returnPromiseId(const PromiseId& remoteId)
    {
        return IdentifierHasher("return").add(remoteId).finish();
    }

private:
    struct RemoteBinding {
        RemoteBinding()
            : m_sourceChain(0)
        {
        }

        RemoteBinding(ChainId sourceChain, const PromiseId& remoteId)
            : m_sourceChain(sourceChain)
            , m_remoteId(remoteId)
        {
        }

        ChainId m_sourceChain;
        PromiseId m_remoteId;
    };

    Environment* m_environment;
    // source side, keyed by proxy id
    PromiseIdMap<CallbackRecord*> m_forwardingRecords;
    // destination side, keyed by remote id
    PromiseIdMap<RemoteBinding> m_bindings;
    // destination side, keyed by return promise id
    PromiseIdMap<RemoteBinding> m_returnRoutes;
};
} // namespace Interop

#endif
