#pragma once

#include "core/Error.hpp"
#include "network/AgentChannel.hpp"
#include "network/FrameIO.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace AH::Network {

class AgentSessionCoordinator;

struct AgentChannelServerConfig {
    std::string               bind_address{"127.0.0.1"};
    std::uint16_t             port{47800};
    std::size_t               max_frame_bytes{DefaultMaxFrameBytes};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds{1}};
};

/**
 * AgentChannelServer — TCP transport for agent connections.
 *
 * One accept thread, one reader thread per connection and one sweeper thread that calls
 * AgentSessionCoordinator::sweepExpired every sweep_interval. Each accepted socket gets a
 * connection id ("conn-<n>"); connect, frames and disconnect are forwarded to the attached
 * coordinator from that connection's reader thread.
 *
 * A frame that does not decode is answered with an ERROR frame and the connection stays
 * open. A frame longer than max_frame_bytes closes the connection.
 */
class AgentChannelServer final : public AgentChannel {
public:
    explicit AgentChannelServer(AgentChannelServerConfig config);
    AgentChannelServer(AgentChannelServer const&)            = delete;
    AgentChannelServer& operator=(AgentChannelServer const&) = delete;
    ~AgentChannelServer() override;

    auto attach(std::weak_ptr<AgentSessionCoordinator> coordinator) -> void;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;

    auto send(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> override;

    // Shuts the socket down; the reader thread then reports the disconnect.
    auto disconnect(ConnectionId const& connectionId) -> bool;

    [[nodiscard]] auto running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;
    [[nodiscard]] auto connectionCount() const -> std::size_t;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace AH::Network
