#pragma once

#include "core/Error.hpp"
#include "network/AgentProtocol.hpp"
#include "network/CorrelationId.hpp"

namespace AH::Network {

// Coordinator-side view of the transport: addressed, per-connection sends.
class AgentChannel {
public:
    virtual ~AgentChannel() = default;

    // Fails with ConnectionLost when the connection is unknown or already closed.
    virtual auto send(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> = 0;
};

} // namespace AH::Network
