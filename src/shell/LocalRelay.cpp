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
#include "LocalRelay.h"
#include "runtime/ExecutionState.h"

namespace Interop {

constexpr Address LocalRelay::DefaultMessengerAddress;
constexpr Address LocalRelay::DefaultEngineAddress;

LocalRelay::LocalRelay(Address messengerAddress)
    : m_messengerAddress(messengerAddress)
    , m_nextMessageId(1)
    , m_deliveredMessageCount(0)
{
}

Environment* LocalRelay::createEnvironment(ChainId chainId, Address engineAddress)
{
    RELEASE_ASSERT(m_environments.find(chainId) == m_environments.end());
    Environment* environment = new Environment(this, chainId, engineAddress);
    m_environments[chainId] = environment;
    return environment;
}

Optional<Environment*> LocalRelay::environment(ChainId chainId) const
{
    auto iter = m_environments.find(chainId);
    if (iter == m_environments.end()) {
        return nullptr;
    }
    return iter->second;
}

MessageId LocalRelay::sendMessage(Environment* source, ChainId destination, Address target, const Payload& message)
{
    MessageId id = m_nextMessageId++;
    m_messages.push_back(new PendingMessage(id, source->chainId(), destination, source->engineAddress(), target, message));
    return id;
}

uint64_t LocalRelay::currentTime(Environment* relatedEnvironment)
{
    auto iter = m_clocks.find(relatedEnvironment->chainId());
    if (iter == m_clocks.end()) {
        return 0;
    }
    return iter->second;
}

void LocalRelay::setTime(ChainId chainId, uint64_t time)
{
    m_clocks[chainId] = time;
}

void LocalRelay::advanceTime(ChainId chainId, uint64_t amount)
{
    m_clocks[chainId] += amount;
}

bool LocalRelay::relayNext()
{
    if (m_messages.empty()) {
        return false;
    }

    PendingMessage* message = m_messages.front();
    m_messages.pop_front();

    Optional<Environment*> destination = environment(message->m_destination);
    if (!destination) {
        INTEROP_LOG_ERROR("relay: message %llu from chain %llu targets unknown chain %llu\n", (unsigned long long)message->m_id,
                          (unsigned long long)message->m_source, (unsigned long long)message->m_destination);
        return true;
    }
    if (destination->engineAddress() != message->m_target) {
        INTEROP_LOG_ERROR("relay: message %llu targets address %llu which is not the engine of chain %llu\n", (unsigned long long)message->m_id,
                          (unsigned long long)message->m_target, (unsigned long long)message->m_destination);
        return true;
    }

    m_deliveredMessageCount++;
    try {
        ExecutionState state(destination.value(), m_messengerAddress);
        destination->receiveMessage(state, message->m_source, message->m_sender, message->m_payload);
    } catch (const ErrorObject& error) {
        INTEROP_LOG_ERROR("relay: chain %llu refused message %llu: %s\n", (unsigned long long)message->m_destination,
                          (unsigned long long)message->m_id, error.message().data());
        m_lastError = error;
    }
    return true;
}

size_t LocalRelay::relayAll(size_t maxMessages)
{
    size_t count = 0;
    while (count < maxMessages && relayNext()) {
        count++;
    }
    return count;
}

bool LocalRelay::dropNext()
{
    if (m_messages.empty()) {
        return false;
    }
    m_messages.pop_front();
    return true;
}

bool LocalRelay::duplicateNext()
{
    if (m_messages.empty()) {
        return false;
    }
    PendingMessage* message = m_messages.front();
    m_messages.insert(m_messages.begin() + 1, new PendingMessage(*message));
    return true;
}
} // namespace Interop
