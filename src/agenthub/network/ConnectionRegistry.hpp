#pragma once

#include "network/CorrelationId.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace AH::Network {

struct AgentRecord {
    ConnectionId connectionId;
    std::string  agentName;
    bool         authenticated{false};
};

/**
 * ConnectionRegistry — live connection id <-> authenticated agent name.
 *
 * Both directions sit behind one shared_mutex so a reader never sees one map updated
 * without the other. An agent name maps to at most one connection: registering it again
 * from another connection displaces the old binding entirely. The registry never closes
 * connections; it only reports who was displaced.
 */
class ConnectionRegistry {
public:
    // Returns the connection the agent was previously bound to, if it was a different one.
    auto registerAgent(ConnectionId const& connectionId, std::string const& agentName)
        -> std::optional<ConnectionId>;

    [[nodiscard]] auto tryGet(ConnectionId const& connectionId) const -> std::optional<std::string>;
    [[nodiscard]] auto connectionFor(std::string_view agentName) const -> std::optional<ConnectionId>;

    // Idempotent; returns the agent name that was bound to the connection.
    auto tryRemove(ConnectionId const& connectionId) -> std::optional<std::string>;

    [[nodiscard]] auto isRegistered(std::string_view agentName) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto snapshot() const -> std::vector<AgentRecord>;

private:
    mutable std::shared_mutex                         mutex_;
    std::unordered_map<ConnectionId, AgentRecord>     byConnection_;
    std::unordered_map<std::string, ConnectionId>     byAgent_;
};

} // namespace AH::Network
