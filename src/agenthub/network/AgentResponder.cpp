#include "agenthub/network/AgentResponder.hpp"

#include "log/TaggedLogger.hpp"
#include "network/AuthenticationChallengeManager.hpp"
#include "network/CorrelationId.hpp"
#include "util/Encoding.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <type_traits>
#include <variant>

namespace AH::Network {

namespace {

[[nodiscard]] auto is_within(std::filesystem::path const& candidate, std::filesystem::path const& root) -> bool {
    auto rootIt      = root.begin();
    auto candidateIt = candidate.begin();
    for (; rootIt != root.end(); ++rootIt, ++candidateIt) {
        // A trailing separator shows up as an empty final component.
        if (rootIt->empty()) {
            continue;
        }
        if (candidateIt == candidate.end() || *candidateIt != *rootIt) {
            return false;
        }
    }
    return true;
}

} // namespace

AgentResponder::AgentResponder(AgentResponderConfig config)
    : config_(std::move(config)) {
    std::error_code ec;
    canonicalRoot_ = std::filesystem::weakly_canonical(config_.shareRoot, ec);
    if (ec) {
        canonicalRoot_ = config_.shareRoot.lexically_normal();
    }
}

auto AgentResponder::handle(AgentFrame const& frame) -> std::vector<AgentFrame> {
    std::vector<AgentFrame> out;
    std::visit(
        [&](auto const& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, AuthChallengePayload>) {
                {
                    std::lock_guard const lock{mutex_};
                    state_ = State::AwaitingVerdict;
                }
                auto response = AuthenticationChallengeManager::computeResponse(payload.token, config_.agentName, config_.secret);
                out.push_back(makeFrame(LoginPayload{config_.agentName, std::move(response)}));
            } else if constexpr (std::is_same_v<T, AuthAcceptedPayload>) {
                std::lock_guard const lock{mutex_};
                state_ = State::Authenticated;
                ah_log("Authenticated as " + payload.agent, "AgentResponder");
            } else if constexpr (std::is_same_v<T, AuthRejectedPayload>) {
                std::lock_guard const lock{mutex_};
                state_ = State::Rejected;
                ah_log("Coordinator rejected " + payload.agent, "AgentResponder");
            } else if constexpr (std::is_same_v<T, FileInfoRequestPayload>) {
                auto info = describe(payload.filename);
                out.push_back(makeFrame(FileInfoReplyPayload{payload.id, info.exists, info.length}));
            } else if constexpr (std::is_same_v<T, FileRequestPayload>) {
                auto info = describe(payload.filename);
                if (!info.exists || static_cast<std::size_t>(info.length) > config_.maxUploadBytes) {
                    ah_log("Cannot serve " + payload.filename, "AgentResponder");
                    out.push_back(makeFrame(UploadFailedPayload{payload.id}));
                    return;
                }
                {
                    std::lock_guard const lock{mutex_};
                    queue_.push_back(QueuedUpload{payload.id, payload.filename});
                }
                out.push_back(makeFrame(UploadTokenRequestPayload{}));
            } else if constexpr (std::is_same_v<T, UploadTokenPayload>) {
                out.push_back(answerUploadToken(payload.token));
            } else if constexpr (std::is_same_v<T, ErrorPayload>) {
                ah_log("Coordinator error " + payload.code + ": " + payload.message, "AgentResponder");
                if (!payload.in_reply_to) {
                    return;
                }
                if (*payload.in_reply_to == frameKindToString(FrameKind::GetUploadToken)) {
                    std::optional<QueuedUpload> dropped;
                    {
                        std::lock_guard const lock{mutex_};
                        if (!queue_.empty()) {
                            dropped = std::move(queue_.front());
                            queue_.pop_front();
                        }
                    }
                    if (dropped) {
                        out.push_back(makeFrame(UploadFailedPayload{dropped->id}));
                    }
                } else if (looksLikeCorrelationId(*payload.in_reply_to)) {
                    // The coordinator refused an UPLOAD; release the waiting request.
                    out.push_back(makeFrame(UploadFailedPayload{*payload.in_reply_to}));
                }
            }
        },
        frame.payload);
    return out;
}

auto AgentResponder::reset() -> void {
    std::lock_guard const lock{mutex_};
    state_ = State::AwaitingChallenge;
    queue_.clear();
}

auto AgentResponder::answerUploadToken(std::string const& token) -> AgentFrame {
    std::optional<QueuedUpload> next;
    {
        std::lock_guard const lock{mutex_};
        if (!queue_.empty()) {
            next = std::move(queue_.front());
            queue_.pop_front();
        }
    }
    if (!next) {
        return makeErrorFrame(Error{Error::Code::NotFound, "no file request waiting for an upload token"},
                              std::string{frameKindToString(FrameKind::UploadToken)});
    }
    auto bytes = readShareFile(next->filename);
    if (!bytes) {
        ah_log("Upload of " + next->filename + " failed: " + describeError(bytes.error()), "AgentResponder");
        return makeFrame(UploadFailedPayload{next->id});
    }
    return makeFrame(UploadPayload{next->id, token, next->filename, encodeBase64(*bytes)});
}

auto AgentResponder::state() const -> State {
    std::lock_guard const lock{mutex_};
    return state_;
}

auto AgentResponder::queuedUploads() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return queue_.size();
}

auto AgentResponder::config() const -> AgentResponderConfig const& {
    return config_;
}

auto AgentResponder::resolve(std::string_view filename) const -> std::optional<std::filesystem::path> {
    if (filename.empty()) {
        return std::nullopt;
    }
    std::filesystem::path relative{std::string(filename)};
    if (relative.is_absolute() || relative.has_root_name()) {
        return std::nullopt;
    }
    std::error_code ec;
    auto            candidate = std::filesystem::weakly_canonical(canonicalRoot_ / relative, ec);
    if (ec) {
        return std::nullopt;
    }
    if (!is_within(candidate, canonicalRoot_)) {
        return std::nullopt;
    }
    return candidate;
}

auto AgentResponder::describe(std::string_view filename) const -> FileInfo {
    auto path = resolve(filename);
    if (!path) {
        return FileInfo{false, 0};
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec) || ec) {
        return FileInfo{false, 0};
    }
    auto size = std::filesystem::file_size(*path, ec);
    if (ec) {
        return FileInfo{false, 0};
    }
    return FileInfo{true, static_cast<std::int64_t>(size)};
}

auto AgentResponder::readShareFile(std::string_view filename) const -> Expected<std::vector<std::uint8_t>> {
    auto path = resolve(filename);
    if (!path) {
        return std::unexpected(Error{Error::Code::NotFound, std::string(filename) + " is outside the share"});
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + path->string()});
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(Error{Error::Code::TransportError, "read failed for " + path->string()});
    }
    if (bytes.size() > config_.maxUploadBytes) {
        return std::unexpected(Error{Error::Code::UploadFailed, path->string() + " exceeds the upload limit"});
    }
    return bytes;
}

auto agentStateToString(AgentResponder::State state) -> std::string_view {
    switch (state) {
    case AgentResponder::State::AwaitingChallenge:
        return "awaiting_challenge";
    case AgentResponder::State::AwaitingVerdict:
        return "awaiting_verdict";
    case AgentResponder::State::Authenticated:
        return "authenticated";
    case AgentResponder::State::Rejected:
        return "rejected";
    }
    return "unknown";
}

} // namespace AH::Network
