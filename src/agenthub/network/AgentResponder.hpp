#pragma once

#include "core/Error.hpp"
#include "network/AgentProtocol.hpp"
#include "network/FileTransfer.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AH::Network {

struct AgentResponderConfig {
    std::string           agentName;
    std::string           secret;
    std::filesystem::path shareRoot;
    std::size_t           maxUploadBytes{47U * 1024U * 1024U};
};

/**
 * AgentResponder — the agent's half of the protocol, independent of the transport.
 *
 * handle() takes one frame from the coordinator and returns the frames to send back:
 * - AUTH_CHALLENGE    -> LOGIN with the HMAC answer.
 * - REQUEST_FILE_INFO -> FILE_INFO_REPLY for the file below the share root.
 * - REQUEST_FILE      -> GET_UPLOAD_TOKEN, or UPLOAD_FAILED when the file cannot be served.
 * - UPLOAD_TOKEN      -> UPLOAD for the oldest queued request.
 * - ERROR             -> UPLOAD_FAILED for the request it refers to.
 *
 * File requests are queued in arrival order and matched to tokens first-in first-out.
 * Filenames are relative to the share root; anything resolving outside it is treated as
 * missing.
 */
class AgentResponder {
public:
    enum class State {
        AwaitingChallenge,
        AwaitingVerdict,
        Authenticated,
        Rejected,
    };

    explicit AgentResponder(AgentResponderConfig config);

    [[nodiscard]] auto handle(AgentFrame const& frame) -> std::vector<AgentFrame>;

    // Forgets the handshake and queued requests; called before reconnecting.
    auto reset() -> void;

    [[nodiscard]] auto state() const -> State;
    [[nodiscard]] auto queuedUploads() const -> std::size_t;
    [[nodiscard]] auto config() const -> AgentResponderConfig const&;

    // Resolves a requested filename below the share root; nullopt when it escapes the root.
    [[nodiscard]] auto resolve(std::string_view filename) const -> std::optional<std::filesystem::path>;
    [[nodiscard]] auto describe(std::string_view filename) const -> FileInfo;

private:
    struct QueuedUpload {
        std::string id;
        std::string filename;
    };

    auto answerUploadToken(std::string const& token) -> AgentFrame;
    auto readShareFile(std::string_view filename) const -> Expected<std::vector<std::uint8_t>>;

    AgentResponderConfig     config_;
    std::filesystem::path    canonicalRoot_;
    mutable std::mutex       mutex_;
    State                    state_{State::AwaitingChallenge};
    std::deque<QueuedUpload> queue_;
};

[[nodiscard]] auto agentStateToString(AgentResponder::State state) -> std::string_view;

} // namespace AH::Network
