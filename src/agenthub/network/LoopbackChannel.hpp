#pragma once

#include "network/AgentChannel.hpp"
#include "network/AgentResponder.hpp"
#include "network/AgentSessionCoordinator.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace AH::Network::Loopback {

/**
 * In-process channel: the coordinator and any number of agents exchange frames by direct
 * calls. Every frame goes through serializeFrame/deserializeFrame so the wire format is
 * exercised exactly as on TCP.
 */
class Channel final : public AgentChannel {
public:
    using Receiver = std::function<void(ConnectionId const&, AgentFrame const&)>;

    auto attach(std::weak_ptr<AgentSessionCoordinator> coordinator) -> void {
        std::lock_guard const lock{mutex_};
        coordinator_ = std::move(coordinator);
    }

    // Opens a connection; the coordinator's onConnect runs before this returns.
    auto connect(Receiver receiver) -> ConnectionId {
        auto id = "conn-" + std::to_string(nextId_.fetch_add(1));
        std::shared_ptr<AgentSessionCoordinator> coordinator;
        {
            std::lock_guard const lock{mutex_};
            receivers_.emplace(id, std::make_shared<Receiver>(std::move(receiver)));
            coordinator = coordinator_.lock();
        }
        if (coordinator) {
            coordinator->onConnect(id);
        }
        return id;
    }

    // Agent -> coordinator.
    auto deliver(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> {
        std::shared_ptr<AgentSessionCoordinator> coordinator;
        {
            std::lock_guard const lock{mutex_};
            if (!receivers_.contains(connectionId)) {
                return std::unexpected(Error{Error::Code::ConnectionLost, "connection " + connectionId + " is closed"});
            }
            coordinator = coordinator_.lock();
        }
        if (!coordinator) {
            return std::unexpected(Error{Error::Code::ConnectionLost, "coordinator unavailable"});
        }
        auto decoded = roundTrip(frame);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        coordinator->handleFrame(connectionId, *decoded);
        return {};
    }

    auto disconnect(ConnectionId const& connectionId) -> void {
        std::shared_ptr<AgentSessionCoordinator> coordinator;
        {
            std::lock_guard const lock{mutex_};
            if (receivers_.erase(connectionId) == 0) {
                return;
            }
            coordinator = coordinator_.lock();
        }
        if (coordinator) {
            coordinator->onDisconnect(connectionId);
        }
    }

    // Coordinator -> agent.
    auto send(ConnectionId const& connectionId, AgentFrame const& frame) -> Expected<void> override {
        std::shared_ptr<Receiver> receiver;
        {
            std::lock_guard const lock{mutex_};
            auto                  it = receivers_.find(connectionId);
            if (it == receivers_.end()) {
                return std::unexpected(Error{Error::Code::ConnectionLost, "connection " + connectionId + " is closed"});
            }
            receiver = it->second;
        }
        auto decoded = roundTrip(frame);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        (*receiver)(connectionId, *decoded);
        return {};
    }

    [[nodiscard]] auto connectionCount() const -> std::size_t {
        std::lock_guard const lock{mutex_};
        return receivers_.size();
    }

private:
    static auto roundTrip(AgentFrame const& frame) -> Expected<AgentFrame> {
        auto encoded = serializeFrame(frame);
        if (!encoded) {
            return std::unexpected(encoded.error());
        }
        return deserializeFrame(*encoded);
    }

    mutable std::mutex                                         mutex_;
    std::weak_ptr<AgentSessionCoordinator>                     coordinator_;
    std::unordered_map<ConnectionId, std::shared_ptr<Receiver>> receivers_;
    std::atomic<std::uint64_t>                                 nextId_{1};
};

// Connects a responder to the channel; its answers are delivered straight back.
inline auto connectResponder(std::shared_ptr<Channel> const& channel, std::shared_ptr<AgentResponder> responder)
    -> ConnectionId {
    std::weak_ptr<Channel> weakChannel = channel;
    return channel->connect([weakChannel, responder](ConnectionId const& connectionId, AgentFrame const& frame) {
        auto channel = weakChannel.lock();
        if (!channel) {
            return;
        }
        for (auto const& outbound : responder->handle(frame)) {
            auto delivered = channel->deliver(connectionId, outbound);
            if (!delivered) {
                return;
            }
        }
    });
}

} // namespace AH::Network::Loopback
