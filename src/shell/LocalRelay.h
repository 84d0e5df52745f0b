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

#ifndef __InteropLocalRelay__
#define __InteropLocalRelay__

#include "runtime/Environment.h"
#include "runtime/ErrorObject.h"
#include "runtime/Platform.h"

namespace Interop {

// Runs several chains in one process. Messages are queued in send order and
// delivered only when asked, so a test or the shell decides when (and
// whether) each message arrives. Every chain has its own clock.
class LocalRelay : public gc, public Platform {
public:
    static constexpr Address DefaultMessengerAddress = 0x4200000000000023ULL;
    static constexpr Address DefaultEngineAddress = 0x5e7b0000000000a1ULL;

    explicit LocalRelay(Address messengerAddress = DefaultMessengerAddress);
    virtual ~LocalRelay() {}

    Environment* createEnvironment(ChainId chainId, Address engineAddress = DefaultEngineAddress);
    Optional<Environment*> environment(ChainId chainId) const;

    // Platform
    virtual Address messengerAddress() override
    {
        return m_messengerAddress;
    }

    virtual MessageId sendMessage(Environment* source, ChainId destination, Address target, const Payload& message) override;
    virtual uint64_t currentTime(Environment* relatedEnvironment) override;

    void setTime(ChainId chainId, uint64_t time);
    void advanceTime(ChainId chainId, uint64_t amount);

    size_t pendingMessageCount() const
    {
        return m_messages.size();
    }

    // Delivers the oldest queued message and returns false when the queue is
    // empty. An engine error raised by the destination consumes the message;
    // it is logged and kept in lastError().
    bool relayNext();
    size_t relayAll(size_t maxMessages = SIZE_MAX);
    // loses the oldest queued message
    bool dropNext();
    // queues a second copy of the oldest message right behind it
    bool duplicateNext();

    const Optional<ErrorObject>& lastError() const
    {
        return m_lastError;
    }

    void clearLastError()
    {
        m_lastError.reset();
    }

    size_t deliveredMessageCount() const
    {
        return m_deliveredMessageCount;
    }

private:
    struct PendingMessage : public gc {
        PendingMessage(MessageId id, ChainId source, ChainId destination, Address sender, Address target, const Payload& payload)
            : m_id(id)
            , m_source(source)
            , m_destination(destination)
            , m_sender(sender)
            , m_target(target)
            , m_payload(payload)
        {
        }

        MessageId m_id;
        ChainId m_source;
        ChainId m_destination;
        Address m_sender;
        Address m_target;
        Payload m_payload;
    };

    Address m_messengerAddress;
    MessageId m_nextMessageId;
    size_t m_deliveredMessageCount;
    Optional<ErrorObject> m_lastError;

    HashMap<ChainId, Environment*, std::hash<ChainId>, std::equal_to<ChainId>, gc_allocator<std::pair<ChainId, Environment*>>> m_environments;
    HashMap<ChainId, uint64_t> m_clocks;
    std::deque<PendingMessage*, gc_allocator<PendingMessage*>> m_messages;
};
} // namespace Interop

#endif
