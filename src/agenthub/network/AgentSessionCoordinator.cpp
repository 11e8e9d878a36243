#include "agenthub/network/AgentSessionCoordinator.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Encoding.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace AH::Network {

namespace {

[[nodiscard]] auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

} // namespace

auto CoordinatorComponents::create(CredentialTable           credentials,
                                   std::chrono::milliseconds challengeTtl,
                                   std::chrono::milliseconds uploadTokenTtl) -> CoordinatorComponents {
    CoordinatorComponents components;
    components.registry     = std::make_shared<ConnectionRegistry>();
    components.challenges   = std::make_shared<AuthenticationChallengeManager>(std::move(credentials), challengeTtl);
    components.uploadTokens = std::make_shared<ShareUploadTokenIssuer>(uploadTokenTtl);
    components.inquiries    = std::make_shared<FileInfoTable>("FileInfoRequests");
    components.uploads      = std::make_shared<UploadTable>("UploadRequests");
    return components;
}

AgentSessionCoordinator::AgentSessionCoordinator(std::shared_ptr<AgentChannel> channel,
                                                 CoordinatorComponents         components,
                                                 std::chrono::milliseconds     pendingTimeout)
    : channel_(std::move(channel))
    , components_(std::move(components))
    , pendingTimeout_(pendingTimeout) {}

auto AgentSessionCoordinator::onConnect(ConnectionId const& connectionId) -> void {
    auto token = components_.challenges->issue(connectionId);
    if (!token) {
        ah_log("Challenge generation failed for " + connectionId + ": " + describeError(token.error()),
               "AgentSessionCoordinator", "ERROR");
        reply(connectionId, makeErrorFrame(token.error()));
        return;
    }
    reply(connectionId, makeFrame(AuthChallengePayload{std::move(*token)}));
}

auto AgentSessionCoordinator::onDisconnect(ConnectionId const& connectionId) -> void {
    components_.challenges->discard(connectionId);
    if (auto agent = components_.registry->tryRemove(connectionId)) {
        auto revoked = components_.uploadTokens->revokeAgent(*agent);
        ah_log("Agent " + *agent + " left (" + connectionId + "), revoked " + std::to_string(revoked)
                   + " upload tokens",
               "AgentSessionCoordinator");
        (void)revoked;
    }
    Error lost = make_error(Error::Code::ConnectionLost, "connection " + connectionId + " closed");
    components_.inquiries->failConnection(connectionId, lost);
    components_.uploads->failConnection(connectionId, lost);
}

auto AgentSessionCoordinator::onLogin(ConnectionId const& connectionId,
                                      std::string const&  agentName,
                                      std::string const&  challengeResponse) -> bool {
    if (!components_.challenges->validate(connectionId, agentName, challengeResponse)) {
        components_.registry->tryRemove(connectionId);
        ah_log("Login rejected for " + agentName + " on " + connectionId, "AgentSessionCoordinator");
        return false;
    }
    if (auto displaced = components_.registry->registerAgent(connectionId, agentName)) {
        ah_log("Agent " + agentName + " re-authenticated on " + connectionId + ", " + *displaced
                   + " is no longer addressed",
               "AgentSessionCoordinator");
    }
    ah_log("Agent " + agentName + " authenticated on " + connectionId, "AgentSessionCoordinator");
    return true;
}

auto AgentSessionCoordinator::onUploadTokenRequest(ConnectionId const& connectionId) -> Expected<std::string> {
    auto agent = components_.registry->tryGet(connectionId);
    if (!agent) {
        return std::unexpected(make_error(Error::Code::Unauthorized, "connection is not authenticated"));
    }
    return components_.uploadTokens->issueFor(*agent);
}

auto AgentSessionCoordinator::onInquiryReply(CorrelationId const& id, bool exists, std::int64_t length) -> bool {
    return components_.inquiries->resolve(id, FileInfo{exists, length});
}

auto AgentSessionCoordinator::onUploadFailed(CorrelationId const& id) -> bool {
    return components_.uploads->fail(id, make_error(Error::Code::UploadFailed, "agent reported upload failure"));
}

auto AgentSessionCoordinator::onUpload(ConnectionId const&       connectionId,
                                       CorrelationId const&      id,
                                       std::string const&        token,
                                       std::string const&        filename,
                                       std::vector<std::uint8_t> bytes) -> Expected<void> {
    auto agent = components_.registry->tryGet(connectionId);
    if (!agent) {
        return std::unexpected(make_error(Error::Code::Unauthorized, "connection is not authenticated"));
    }
    if (!components_.uploadTokens->redeem(token, *agent)) {
        return std::unexpected(make_error(Error::Code::Unauthorized, "upload token rejected"));
    }
    auto owner = components_.uploads->connectionOf(id);
    if (!owner) {
        return std::unexpected(make_error(Error::Code::NotFound, "no pending upload " + id));
    }
    if (*owner != connectionId) {
        return std::unexpected(make_error(Error::Code::Unauthorized, "upload " + id + " was requested from another connection"));
    }
    auto size   = bytes.size();
    auto stream = std::make_shared<BufferedUploadStream>(filename, std::move(bytes));
    if (!components_.uploads->resolve(id, std::move(stream))) {
        return std::unexpected(make_error(Error::Code::NotFound, "no pending upload " + id));
    }
    ah_log("Upload " + id + " from " + *agent + " completed (" + std::to_string(size) + " bytes)",
           "AgentSessionCoordinator");
    (void)size;
    return {};
}

template <typename T>
auto AgentSessionCoordinator::sendRequest(PendingRequestTable<T>& table,
                                          std::string const&      agentName,
                                          std::string const&      filename,
                                          FrameKind               kind) -> PendingFuture<T> {
    if (shutdown_.load()) {
        return PendingFuture<T>::Failed(make_error(Error::Code::AgentUnavailable, "coordinator is shut down"));
    }
    auto connection = components_.registry->connectionFor(agentName);
    if (!connection) {
        return PendingFuture<T>::Failed(make_error(Error::Code::AgentUnavailable, "agent " + agentName + " is not connected"));
    }
    auto created = table.create(*connection);
    if (!created) {
        return PendingFuture<T>::Failed(created.error());
    }
    // shutdown() may have swept the table between the check above and create().
    if (shutdown_.load()) {
        table.fail(created->id, make_error(Error::Code::ConnectionLost, "coordinator shutting down"));
        return created->future;
    }
    AgentFrame frame = kind == FrameKind::RequestFile
                           ? makeFrame(FileRequestPayload{filename, created->id})
                           : makeFrame(FileInfoRequestPayload{filename, created->id});
    if (auto sent = channel_->send(*connection, frame); !sent) {
        table.fail(created->id, make_error(Error::Code::ConnectionLost, describeError(sent.error())));
    }
    return created->future;
}

auto AgentSessionCoordinator::requestFileInfo(std::string const& agentName, std::string const& filename)
    -> PendingFuture<FileInfo> {
    return sendRequest(*components_.inquiries, agentName, filename, FrameKind::RequestFileInfo);
}

auto AgentSessionCoordinator::requestFile(std::string const& agentName, std::string const& filename)
    -> PendingFuture<UploadHandle> {
    return sendRequest(*components_.uploads, agentName, filename, FrameKind::RequestFile);
}

auto AgentSessionCoordinator::handleFrame(ConnectionId const& connectionId, AgentFrame const& frame) -> void {
    ah_log("Frame " + std::string(frameKindToString(frame.kind)) + " from " + connectionId, "AgentSessionCoordinator", "Frame");
    std::visit(
        [&](auto const& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, LoginPayload>) {
                if (onLogin(connectionId, payload.agent, payload.challenge_response)) {
                    reply(connectionId, makeFrame(AuthAcceptedPayload{payload.agent}));
                } else {
                    reply(connectionId, makeFrame(AuthRejectedPayload{payload.agent}));
                }
            } else if constexpr (std::is_same_v<T, UploadTokenRequestPayload>) {
                auto token = onUploadTokenRequest(connectionId);
                if (token) {
                    reply(connectionId, makeFrame(UploadTokenPayload{std::move(*token)}));
                } else {
                    reply(connectionId, makeErrorFrame(token.error(), std::string{frameKindToString(FrameKind::GetUploadToken)}));
                }
            } else if constexpr (std::is_same_v<T, FileInfoReplyPayload>) {
                // Replies only count on the connection the request went out on.
                if (components_.inquiries->connectionOf(payload.id) == connectionId) {
                    onInquiryReply(payload.id, payload.exists, payload.length);
                }
            } else if constexpr (std::is_same_v<T, UploadFailedPayload>) {
                if (components_.uploads->connectionOf(payload.id) == connectionId) {
                    onUploadFailed(payload.id);
                }
            } else if constexpr (std::is_same_v<T, UploadPayload>) {
                auto bytes = decodeBase64(payload.data);
                if (!bytes) {
                    reply(connectionId, makeErrorFrame(bytes.error(), payload.id));
                    return;
                }
                auto result = onUpload(connectionId, payload.id, payload.token, payload.filename, std::move(*bytes));
                if (!result) {
                    reply(connectionId, makeErrorFrame(result.error(), payload.id));
                }
            } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                ah_log("Agent on " + connectionId + " reported " + payload.code + ": " + payload.message,
                       "AgentSessionCoordinator");
            } else {
                reply(connectionId,
                      makeErrorFrame(make_error(Error::Code::MalformedInput,
                                                std::string{frameKindToString(frame.kind)} + " is not accepted from agents"),
                                     std::string{frameKindToString(frame.kind)}));
            }
        },
        frame.payload);
}

auto AgentSessionCoordinator::sweepExpired(Clock::time_point now) -> std::size_t {
    auto failed = components_.inquiries->evictExpired(now, pendingTimeout_);
    failed += components_.uploads->evictExpired(now, pendingTimeout_);
    components_.uploadTokens->pruneExpired(now);
    return failed;
}

auto AgentSessionCoordinator::shutdown() -> void {
    if (shutdown_.exchange(true)) {
        return;
    }
    Error closing = make_error(Error::Code::ConnectionLost, "coordinator shutting down");
    components_.inquiries->failAll(closing);
    components_.uploads->failAll(closing);
}

auto AgentSessionCoordinator::components() const -> CoordinatorComponents const& {
    return components_;
}

auto AgentSessionCoordinator::pendingTimeout() const -> std::chrono::milliseconds {
    return pendingTimeout_;
}

auto AgentSessionCoordinator::reply(ConnectionId const& connectionId, AgentFrame const& frame) -> void {
    if (auto sent = channel_->send(connectionId, frame); !sent) {
        ah_log("Send of " + std::string(frameKindToString(frame.kind)) + " to " + connectionId
                   + " failed: " + describeError(sent.error()),
               "AgentSessionCoordinator");
    }
}

} // namespace AH::Network
