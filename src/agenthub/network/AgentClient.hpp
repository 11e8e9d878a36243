#pragma once

#include "core/Error.hpp"
#include "network/AgentResponder.hpp"
#include "network/FrameIO.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace AH::Network {

struct AgentClientConfig {
    std::string   host{"127.0.0.1"};
    std::uint16_t port{47800};
    std::size_t   max_frame_bytes{DefaultMaxFrameBytes};
};

/**
 * AgentClient — TCP connection from an agent to the coordinator.
 *
 * connect() opens the socket and starts a reader thread that feeds every inbound frame to
 * the AgentResponder and writes its answers back. The client itself keeps no protocol state.
 */
class AgentClient {
public:
    AgentClient(AgentClientConfig config, std::shared_ptr<AgentResponder> responder);
    AgentClient(AgentClient const&)            = delete;
    AgentClient& operator=(AgentClient const&) = delete;
    ~AgentClient();

    [[nodiscard]] auto connect() -> Expected<void>;

    // Waits for the coordinator's verdict: Unauthorized when rejected, Timeout when none arrives,
    // ConnectionLost when the connection drops first.
    [[nodiscard]] auto waitForAuthentication(std::chrono::milliseconds timeout) -> Expected<void>;

    // Blocks until the connection closes or stop() is called.
    auto waitUntilDisconnected() -> void;

    auto stop() -> void;

    [[nodiscard]] auto connected() const -> bool;
    [[nodiscard]] auto responder() const -> std::shared_ptr<AgentResponder> const&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace AH::Network
