#pragma once

#include "core/Error.hpp"
#include "core/PendingResult.hpp"
#include "network/AgentChannel.hpp"
#include "network/AgentProtocol.hpp"
#include "network/AuthenticationChallengeManager.hpp"
#include "network/ConnectionRegistry.hpp"
#include "network/CorrelationId.hpp"
#include "network/FileTransfer.hpp"
#include "network/PendingRequestTable.hpp"
#include "network/ShareUploadTokenIssuer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace AH::Network {

using FileInfoTable = PendingRequestTable<FileInfo>;
using UploadTable   = PendingRequestTable<UploadHandle>;

// The pieces a coordinator drives. Shared so tests and tools can observe them.
struct CoordinatorComponents {
    std::shared_ptr<ConnectionRegistry>             registry;
    std::shared_ptr<AuthenticationChallengeManager> challenges;
    std::shared_ptr<ShareUploadTokenIssuer>         uploadTokens;
    std::shared_ptr<FileInfoTable>                  inquiries;
    std::shared_ptr<UploadTable>                    uploads;

    static auto create(CredentialTable           credentials,
                       std::chrono::milliseconds challengeTtl   = std::chrono::seconds{60},
                       std::chrono::milliseconds uploadTokenTtl = std::chrono::minutes{5}) -> CoordinatorComponents;
};

/**
 * AgentSessionCoordinator — turns channel events into handshake, registry and
 * correlation-table operations, and issues asynchronous requests to agents.
 *
 * Lifecycle per connection:
 * - onConnect issues a challenge and sends AUTH_CHALLENGE.
 * - onLogin validates it (single use) and registers the agent on success.
 * - onDisconnect drops the challenge and registration, revokes the agent's upload tokens
 *   and fails every pending request sent on that connection with ConnectionLost.
 *
 * Requests return a PendingFuture immediately. The matching reply, a timeout sweep or the
 * connection going away completes it exactly once.
 *
 * Notes:
 * - Entry points are safe to call concurrently from different connection threads.
 * - No lock is held while sending on the channel.
 * - handleFrame() is the transport-neutral dispatcher used by every channel implementation;
 *   it answers LOGIN and GET_UPLOAD_TOKEN itself and reports failures as ERROR frames.
 */
class AgentSessionCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    AgentSessionCoordinator(std::shared_ptr<AgentChannel> channel,
                            CoordinatorComponents         components,
                            std::chrono::milliseconds     pendingTimeout = std::chrono::seconds{30});

    AgentSessionCoordinator(AgentSessionCoordinator const&)            = delete;
    AgentSessionCoordinator& operator=(AgentSessionCoordinator const&) = delete;

    auto onConnect(ConnectionId const& connectionId) -> void;
    auto onDisconnect(ConnectionId const& connectionId) -> void;

    [[nodiscard]] auto onLogin(ConnectionId const& connectionId,
                               std::string const&  agentName,
                               std::string const&  challengeResponse) -> bool;

    [[nodiscard]] auto onUploadTokenRequest(ConnectionId const& connectionId) -> Expected<std::string>;

    auto onInquiryReply(CorrelationId const& id, bool exists, std::int64_t length) -> bool;
    auto onUploadFailed(CorrelationId const& id) -> bool;

    [[nodiscard]] auto onUpload(ConnectionId const&       connectionId,
                                CorrelationId const&      id,
                                std::string const&        token,
                                std::string const&        filename,
                                std::vector<std::uint8_t> bytes) -> Expected<void>;

    [[nodiscard]] auto requestFileInfo(std::string const& agentName, std::string const& filename)
        -> PendingFuture<FileInfo>;
    [[nodiscard]] auto requestFile(std::string const& agentName, std::string const& filename)
        -> PendingFuture<UploadHandle>;

    // Dispatches one inbound frame from a connection.
    auto handleFrame(ConnectionId const& connectionId, AgentFrame const& frame) -> void;

    // Times out stale pending entries and prunes expired upload tokens; returns entries failed.
    auto sweepExpired(Clock::time_point now) -> std::size_t;

    // Fails everything outstanding; later requests fail with AgentUnavailable.
    auto shutdown() -> void;

    [[nodiscard]] auto components() const -> CoordinatorComponents const&;
    [[nodiscard]] auto pendingTimeout() const -> std::chrono::milliseconds;

private:
    template <typename T>
    auto sendRequest(PendingRequestTable<T>& table,
                     std::string const&      agentName,
                     std::string const&      filename,
                     FrameKind               kind) -> PendingFuture<T>;

    auto reply(ConnectionId const& connectionId, AgentFrame const& frame) -> void;

    std::shared_ptr<AgentChannel> channel_;
    CoordinatorComponents         components_;
    std::chrono::milliseconds     pendingTimeout_;
    std::atomic<bool>             shutdown_{false};
};

} // namespace AH::Network
