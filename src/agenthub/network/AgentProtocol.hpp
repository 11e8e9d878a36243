#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace AH::Network {

enum class FrameKind {
    AuthChallenge,
    Login,
    AuthChallengeAccepted,
    AuthChallengeRejected,
    RequestFileInfo,
    RequestFile,
    FileInfoReply,
    UploadFailed,
    GetUploadToken,
    UploadToken,
    Upload,
    Error,
};

struct AuthChallengePayload {
    std::string token;
};

struct LoginPayload {
    std::string agent;
    std::string challenge_response;
};

struct AuthAcceptedPayload {
    std::string agent;
};

struct AuthRejectedPayload {
    std::string agent;
};

struct FileInfoRequestPayload {
    std::string filename;
    std::string id;
};

struct FileRequestPayload {
    std::string filename;
    std::string id;
};

struct FileInfoReplyPayload {
    std::string  id;
    bool         exists{false};
    std::int64_t length{0};
};

struct UploadFailedPayload {
    std::string id;
};

struct UploadTokenRequestPayload {};

struct UploadTokenPayload {
    std::string token;
};

struct UploadPayload {
    std::string id;
    std::string token;
    std::string filename;
    std::string data; // base64
};

struct ErrorPayload {
    std::string                code;
    std::string                message;
    std::optional<std::string> in_reply_to;
};

struct AgentFrame {
    using Payload = std::variant<AuthChallengePayload,
                                 LoginPayload,
                                 AuthAcceptedPayload,
                                 AuthRejectedPayload,
                                 FileInfoRequestPayload,
                                 FileRequestPayload,
                                 FileInfoReplyPayload,
                                 UploadFailedPayload,
                                 UploadTokenRequestPayload,
                                 UploadTokenPayload,
                                 UploadPayload,
                                 ErrorPayload>;

    FrameKind                 kind{FrameKind::Error};
    std::chrono::milliseconds sent_at{std::chrono::milliseconds{0}};
    Payload                   payload{ErrorPayload{}};
};

[[nodiscard]] auto frameKindToString(FrameKind kind) -> std::string_view;
[[nodiscard]] auto parseFrameKind(std::string_view name) -> Expected<FrameKind>;
[[nodiscard]] auto frameKindOf(AgentFrame::Payload const& payload) -> FrameKind;

// Builds a frame whose kind follows the payload alternative, stamped with the current time.
[[nodiscard]] auto makeFrame(AgentFrame::Payload payload) -> AgentFrame;
[[nodiscard]] auto makeErrorFrame(Error const& error, std::optional<std::string> inReplyTo = std::nullopt) -> AgentFrame;

[[nodiscard]] auto serializeFrame(AgentFrame const& frame) -> Expected<std::string>;
[[nodiscard]] auto deserializeFrame(std::string_view payload) -> Expected<AgentFrame>;

} // namespace AH::Network
