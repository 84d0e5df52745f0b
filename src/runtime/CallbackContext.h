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

#ifndef __InteropCallbackContext__
#define __InteropCallbackContext__

#include "runtime/PromiseId.h"

namespace Interop {

class Environment;

// Provenance of the callback being executed. registrant and sourceChain are
// taken from the registration and carried verbatim across chains; they are
// never derived from whoever delivered the message.
class CallbackContext {
    MAKE_STACK_ALLOCATED();

public:
    CallbackContext(Address registrant, ChainId sourceChain, Address target, const PromiseId& continuationId)
        : m_registrant(registrant)
        , m_sourceChain(sourceChain)
        , m_target(target)
        , m_continuationId(continuationId)
        , m_reentered(false)
    {
    }

    Address registrant() const
    {
        return m_registrant;
    }

    ChainId sourceChain() const
    {
        return m_sourceChain;
    }

    Address target() const
    {
        return m_target;
    }

    const PromiseId& continuationId() const
    {
        return m_continuationId;
    }

    // set when the callback tried to re-enter an execution entrypoint
    bool wasReentered() const
    {
        return m_reentered;
    }

    void markReentered()
    {
        m_reentered = true;
    }

private:
    Address m_registrant;
    ChainId m_sourceChain;
    Address m_target;
    PromiseId m_continuationId;
    bool m_reentered;
};

// Publishes a CallbackContext as the environment's active callback for the
// lifetime of the scope. The destructor clears it whether the callback
// returned or threw.
class ActiveCallbackScope {
    MAKE_STACK_ALLOCATED();

public:
    ActiveCallbackScope(Environment* environment, CallbackContext* context);
    ~ActiveCallbackScope();

private:
    Environment* m_environment;
};

} // namespace Interop

#endif
