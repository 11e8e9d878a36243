#include "agenthub/network/AgentProtocol.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <limits>
#include <type_traits>
#include <utility>

namespace AH::Network {
namespace {

using Json = nlohmann::json;

[[nodiscard]] auto make_error(Error::Code code,
                              std::string_view field,
                              std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto current_time() -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

[[nodiscard]] auto ensure_non_empty(std::string_view value, std::string_view field) -> Expected<void> {
    if (value.empty()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, field, "must not be empty"));
    }
    return {};
}

[[nodiscard]] auto validate_identifier(std::string_view value, std::string_view field) -> Expected<void> {
    if (value.empty()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, field, "must not be empty"));
    }
    for (unsigned char ch : value) {
        if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == ':' || ch == '.') {
            continue;
        }
        return std::unexpected(make_error(Error::Code::MalformedInput, field,
                                          "contains invalid characters"));
    }
    return {};
}

[[nodiscard]] auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context,
                                          "must be a JSON object"));
    }
    return {};
}

[[nodiscard]] auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, key, "is required"));
}

[[nodiscard]] auto read_optional_string(Json const& json, char const* key)
    -> Expected<std::optional<std::string>> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_null()) {
            return std::optional<std::string>{std::nullopt};
        }
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a string"));
        }
        return std::optional<std::string>{it->get<std::string>()};
    }
    return std::optional<std::string>{std::nullopt};
}

[[nodiscard]] auto read_boolean(Json const& json, char const* key) -> Expected<bool> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a bool"));
        }
        return it->get<bool>();
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, key, "is required"));
}

[[nodiscard]] auto read_int64(Json const& json, char const* key) -> Expected<std::int64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return std::unexpected(make_error(Error::Code::MalformedInput, key, "out of range"));
            }
            return static_cast<std::int64_t>(value);
        }
        if (it->is_number_integer()) {
            return it->get<std::int64_t>();
        }
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, key, "is required"));
}

[[nodiscard]] auto read_optional_uint64(Json const& json, char const* key)
    -> Expected<std::optional<std::uint64_t>> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_null()) {
            return std::optional<std::uint64_t>{std::nullopt};
        }
        if (it->is_number_unsigned()) {
            auto value = it->get<std::uint64_t>();
            // Must round-trip through a signed millisecond count.
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return std::unexpected(make_error(Error::Code::MalformedInput, key, "out of range"));
            }
            return std::optional<std::uint64_t>{value};
        }
        if (it->is_number_integer()) {
            auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(make_error(Error::Code::MalformedInput, key,
                                                  "must be non-negative"));
            }
            return std::optional<std::uint64_t>{static_cast<std::uint64_t>(value)};
        }
        return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return std::optional<std::uint64_t>{std::nullopt};
}

// ---- to_json -------------------------------------------------------------

[[nodiscard]] auto challenge_to_json(AuthChallengePayload const& payload) -> Expected<Json> {
    if (auto check = ensure_non_empty(payload.token, "token"); !check) {
        return std::unexpected(check.error());
    }
    return Json{{"token", payload.token}};
}

[[nodiscard]] auto login_to_json(LoginPayload const& payload) -> Expected<Json> {
    if (auto check = ensure_non_empty(payload.agent, "agent"); !check) {
        return std::unexpected(check.error());
    }
    return Json{{"agent", payload.agent}, {"challenge_response", payload.challenge_response}};
}

[[nodiscard]] auto file_request_to_json(std::string const& filename, std::string const& id) -> Expected<Json> {
    if (auto check = ensure_non_empty(filename, "filename"); !check) {
        return std::unexpected(check.error());
    }
    if (auto check = validate_identifier(id, "id"); !check) {
        return std::unexpected(check.error());
    }
    return Json{{"filename", filename}, {"id", id}};
}

[[nodiscard]] auto file_info_reply_to_json(FileInfoReplyPayload const& payload) -> Expected<Json> {
    if (auto check = validate_identifier(payload.id, "id"); !check) {
        return std::unexpected(check.error());
    }
    if (payload.length < 0) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "length", "must be non-negative"));
    }
    return Json{{"id", payload.id}, {"exists", payload.exists}, {"length", payload.length}};
}

[[nodiscard]] auto upload_to_json(UploadPayload const& payload) -> Expected<Json> {
    if (auto check = validate_identifier(payload.id, "id"); !check) {
        return std::unexpected(check.error());
    }
    if (auto check = ensure_non_empty(payload.token, "token"); !check) {
        return std::unexpected(check.error());
    }
    return Json{{"id", payload.id},
                {"token", payload.token},
                {"filename", payload.filename},
                {"data", payload.data}};
}

[[nodiscard]] auto error_to_json(ErrorPayload const& payload) -> Expected<Json> {
    if (auto check = ensure_non_empty(payload.code, "code"); !check) {
        return std::unexpected(check.error());
    }
    Json json{{"code", payload.code}, {"message", payload.message}};
    if (payload.in_reply_to && !payload.in_reply_to->empty()) {
        json["in_reply_to"] = *payload.in_reply_to;
    }
    return json;
}

[[nodiscard]] auto build_payload(AgentFrame::Payload const& payload) -> Expected<Json> {
    return std::visit(
        [](auto const& value) -> Expected<Json> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AuthChallengePayload>) {
                return challenge_to_json(value);
            } else if constexpr (std::is_same_v<T, LoginPayload>) {
                return login_to_json(value);
            } else if constexpr (std::is_same_v<T, AuthAcceptedPayload>
                                 || std::is_same_v<T, AuthRejectedPayload>) {
                return Json{{"agent", value.agent}};
            } else if constexpr (std::is_same_v<T, FileInfoRequestPayload>
                                 || std::is_same_v<T, FileRequestPayload>) {
                return file_request_to_json(value.filename, value.id);
            } else if constexpr (std::is_same_v<T, FileInfoReplyPayload>) {
                return file_info_reply_to_json(value);
            } else if constexpr (std::is_same_v<T, UploadFailedPayload>) {
                if (auto check = validate_identifier(value.id, "id"); !check) {
                    return std::unexpected(check.error());
                }
                return Json{{"id", value.id}};
            } else if constexpr (std::is_same_v<T, UploadTokenRequestPayload>) {
                return Json::object();
            } else if constexpr (std::is_same_v<T, UploadTokenPayload>) {
                if (auto check = ensure_non_empty(value.token, "token"); !check) {
                    return std::unexpected(check.error());
                }
                return Json{{"token", value.token}};
            } else if constexpr (std::is_same_v<T, UploadPayload>) {
                return upload_to_json(value);
            } else {
                return error_to_json(value);
            }
        },
        payload);
}

// ---- from_json -----------------------------------------------------------

[[nodiscard]] auto challenge_from_json(Json const& json) -> Expected<AuthChallengePayload> {
    auto token = read_string(json, "token");
    if (!token) {
        return std::unexpected(token.error());
    }
    if (auto check = ensure_non_empty(*token, "token"); !check) {
        return std::unexpected(check.error());
    }
    return AuthChallengePayload{std::move(*token)};
}

[[nodiscard]] auto login_from_json(Json const& json) -> Expected<LoginPayload> {
    LoginPayload payload;
    auto         agent = read_string(json, "agent");
    if (!agent) {
        return std::unexpected(agent.error());
    }
    if (auto check = ensure_non_empty(*agent, "agent"); !check) {
        return std::unexpected(check.error());
    }
    payload.agent = std::move(*agent);
    auto response = read_string(json, "challenge_response");
    if (!response) {
        return std::unexpected(response.error());
    }
    payload.challenge_response = std::move(*response);
    return payload;
}

[[nodiscard]] auto read_agent(Json const& json) -> Expected<std::string> {
    auto agent = read_string(json, "agent");
    if (!agent) {
        return std::unexpected(agent.error());
    }
    return std::move(*agent);
}

template <typename Payload>
[[nodiscard]] auto file_request_from_json(Json const& json) -> Expected<Payload> {
    Payload payload;
    auto    filename = read_string(json, "filename");
    if (!filename) {
        return std::unexpected(filename.error());
    }
    if (auto check = ensure_non_empty(*filename, "filename"); !check) {
        return std::unexpected(check.error());
    }
    payload.filename = std::move(*filename);
    auto id          = read_string(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    if (auto check = validate_identifier(*id, "id"); !check) {
        return std::unexpected(check.error());
    }
    payload.id = std::move(*id);
    return payload;
}

[[nodiscard]] auto read_id(Json const& json) -> Expected<std::string> {
    auto id = read_string(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    if (auto check = validate_identifier(*id, "id"); !check) {
        return std::unexpected(check.error());
    }
    return std::move(*id);
}

[[nodiscard]] auto file_info_reply_from_json(Json const& json) -> Expected<FileInfoReplyPayload> {
    FileInfoReplyPayload payload;
    auto                 id = read_id(json);
    if (!id) {
        return std::unexpected(id.error());
    }
    payload.id  = std::move(*id);
    auto exists = read_boolean(json, "exists");
    if (!exists) {
        return std::unexpected(exists.error());
    }
    payload.exists = *exists;
    auto length    = read_int64(json, "length");
    if (!length) {
        return std::unexpected(length.error());
    }
    if (*length < 0) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "length", "must be non-negative"));
    }
    payload.length = *length;
    return payload;
}

[[nodiscard]] auto upload_from_json(Json const& json) -> Expected<UploadPayload> {
    UploadPayload payload;
    auto          id = read_id(json);
    if (!id) {
        return std::unexpected(id.error());
    }
    payload.id = std::move(*id);
    auto token = read_string(json, "token");
    if (!token) {
        return std::unexpected(token.error());
    }
    if (auto check = ensure_non_empty(*token, "token"); !check) {
        return std::unexpected(check.error());
    }
    payload.token = std::move(*token);
    auto filename = read_string(json, "filename");
    if (!filename) {
        return std::unexpected(filename.error());
    }
    payload.filename = std::move(*filename);
    auto data        = read_string(json, "data");
    if (!data) {
        return std::unexpected(data.error());
    }
    payload.data = std::move(*data);
    return payload;
}

[[nodiscard]] auto error_from_json(Json const& json) -> Expected<ErrorPayload> {
    ErrorPayload payload;
    auto         code = read_string(json, "code");
    if (!code) {
        return std::unexpected(code.error());
    }
    payload.code    = std::move(*code);
    auto message = read_optional_string(json, "message");
    if (!message) {
        return std::unexpected(message.error());
    }
    payload.message = message->value_or(std::string{});
    auto in_reply   = read_optional_string(json, "in_reply_to");
    if (!in_reply) {
        return std::unexpected(in_reply.error());
    }
    payload.in_reply_to = std::move(*in_reply);
    return payload;
}

[[nodiscard]] auto parse_payload(FrameKind kind, Json const& json) -> Expected<AgentFrame::Payload> {
    if (auto ensure = ensure_object(json, "payload"); !ensure) {
        return std::unexpected(ensure.error());
    }
    switch (kind) {
    case FrameKind::AuthChallenge: {
        auto payload = challenge_from_json(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::Login: {
        auto payload = login_from_json(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::AuthChallengeAccepted: {
        auto agent = read_agent(json);
        if (!agent) {
            return std::unexpected(agent.error());
        }
        return AuthAcceptedPayload{std::move(*agent)};
    }
    case FrameKind::AuthChallengeRejected: {
        auto agent = read_agent(json);
        if (!agent) {
            return std::unexpected(agent.error());
        }
        return AuthRejectedPayload{std::move(*agent)};
    }
    case FrameKind::RequestFileInfo: {
        auto payload = file_request_from_json<FileInfoRequestPayload>(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::RequestFile: {
        auto payload = file_request_from_json<FileRequestPayload>(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::FileInfoReply: {
        auto payload = file_info_reply_from_json(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::UploadFailed: {
        auto id = read_id(json);
        if (!id) {
            return std::unexpected(id.error());
        }
        return UploadFailedPayload{std::move(*id)};
    }
    case FrameKind::GetUploadToken:
        return UploadTokenRequestPayload{};
    case FrameKind::UploadToken: {
        auto token = read_string(json, "token");
        if (!token) {
            return std::unexpected(token.error());
        }
        if (auto check = ensure_non_empty(*token, "token"); !check) {
            return std::unexpected(check.error());
        }
        return UploadTokenPayload{std::move(*token)};
    }
    case FrameKind::Upload: {
        auto payload = upload_from_json(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    case FrameKind::Error: {
        auto payload = error_from_json(json);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return *payload;
    }
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, "frame", "unsupported kind"));
}

} // namespace

auto frameKindToString(FrameKind kind) -> std::string_view {
    switch (kind) {
    case FrameKind::AuthChallenge:
        return "AUTH_CHALLENGE";
    case FrameKind::Login:
        return "LOGIN";
    case FrameKind::AuthChallengeAccepted:
        return "AUTH_CHALLENGE_ACCEPTED";
    case FrameKind::AuthChallengeRejected:
        return "AUTH_CHALLENGE_REJECTED";
    case FrameKind::RequestFileInfo:
        return "REQUEST_FILE_INFO";
    case FrameKind::RequestFile:
        return "REQUEST_FILE";
    case FrameKind::FileInfoReply:
        return "FILE_INFO_REPLY";
    case FrameKind::UploadFailed:
        return "UPLOAD_FAILED";
    case FrameKind::GetUploadToken:
        return "GET_UPLOAD_TOKEN";
    case FrameKind::UploadToken:
        return "UPLOAD_TOKEN";
    case FrameKind::Upload:
        return "UPLOAD";
    case FrameKind::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

auto parseFrameKind(std::string_view name) -> Expected<FrameKind> {
    static constexpr FrameKind kAll[] = {
        FrameKind::AuthChallenge,   FrameKind::Login,          FrameKind::AuthChallengeAccepted,
        FrameKind::AuthChallengeRejected, FrameKind::RequestFileInfo, FrameKind::RequestFile,
        FrameKind::FileInfoReply,   FrameKind::UploadFailed,   FrameKind::GetUploadToken,
        FrameKind::UploadToken,     FrameKind::Upload,         FrameKind::Error,
    };
    for (auto kind : kAll) {
        if (frameKindToString(kind) == name) {
            return kind;
        }
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, "type", "unknown frame type"));
}

auto frameKindOf(AgentFrame::Payload const& payload) -> FrameKind {
    return std::visit(
        [](auto const& value) -> FrameKind {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AuthChallengePayload>) {
                return FrameKind::AuthChallenge;
            } else if constexpr (std::is_same_v<T, LoginPayload>) {
                return FrameKind::Login;
            } else if constexpr (std::is_same_v<T, AuthAcceptedPayload>) {
                return FrameKind::AuthChallengeAccepted;
            } else if constexpr (std::is_same_v<T, AuthRejectedPayload>) {
                return FrameKind::AuthChallengeRejected;
            } else if constexpr (std::is_same_v<T, FileInfoRequestPayload>) {
                return FrameKind::RequestFileInfo;
            } else if constexpr (std::is_same_v<T, FileRequestPayload>) {
                return FrameKind::RequestFile;
            } else if constexpr (std::is_same_v<T, FileInfoReplyPayload>) {
                return FrameKind::FileInfoReply;
            } else if constexpr (std::is_same_v<T, UploadFailedPayload>) {
                return FrameKind::UploadFailed;
            } else if constexpr (std::is_same_v<T, UploadTokenRequestPayload>) {
                return FrameKind::GetUploadToken;
            } else if constexpr (std::is_same_v<T, UploadTokenPayload>) {
                return FrameKind::UploadToken;
            } else if constexpr (std::is_same_v<T, UploadPayload>) {
                return FrameKind::Upload;
            } else {
                return FrameKind::Error;
            }
        },
        payload);
}

auto makeFrame(AgentFrame::Payload payload) -> AgentFrame {
    AgentFrame frame;
    frame.kind    = frameKindOf(payload);
    frame.sent_at = current_time();
    frame.payload = std::move(payload);
    return frame;
}

auto makeErrorFrame(Error const& error, std::optional<std::string> inReplyTo) -> AgentFrame {
    ErrorPayload payload;
    payload.code        = std::string{errorCodeToString(error.code)};
    payload.message     = error.message.value_or(std::string{});
    payload.in_reply_to = std::move(inReplyTo);
    return makeFrame(std::move(payload));
}

auto serializeFrame(AgentFrame const& frame) -> Expected<std::string> {
    if (frameKindOf(frame.payload) != frame.kind) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "payload",
                                          "does not match frame type"));
    }
    auto payload = build_payload(frame.payload);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    auto sent_at = frame.sent_at.count();
    if (sent_at < 0) {
        return std::unexpected(
            make_error(Error::Code::MalformedInput, "sent_at_ms", "must be non-negative"));
    }
    Json json{{"type", frameKindToString(frame.kind)},
              {"sent_at_ms", static_cast<std::uint64_t>(sent_at)},
              {"payload", std::move(*payload)}};
    // Invalid UTF-8 in a filename or message is replaced rather than thrown.
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

auto deserializeFrame(std::string_view payload) -> Expected<AgentFrame> {
    auto json = Json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "frame",
                                          "invalid JSON payload"));
    }
    if (auto ensure = ensure_object(json, "frame"); !ensure) {
        return std::unexpected(ensure.error());
    }
    auto type = read_string(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    auto kind = parseFrameKind(*type);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    auto sent_at_ms = read_optional_uint64(json, "sent_at_ms");
    if (!sent_at_ms) {
        return std::unexpected(sent_at_ms.error());
    }
    auto payload_json_it = json.find("payload");
    if (payload_json_it == json.end()) {
        // GET_UPLOAD_TOKEN carries nothing; tolerate an omitted payload for it.
        if (*kind != FrameKind::GetUploadToken) {
            return std::unexpected(make_error(Error::Code::MalformedInput, "payload", "is required"));
        }
    }
    auto payload_variant = payload_json_it == json.end()
                               ? Expected<AgentFrame::Payload>{UploadTokenRequestPayload{}}
                               : parse_payload(*kind, *payload_json_it);
    if (!payload_variant) {
        return std::unexpected(payload_variant.error());
    }
    AgentFrame frame;
    frame.kind    = *kind;
    frame.sent_at = std::chrono::milliseconds{static_cast<std::int64_t>(sent_at_ms->value_or(0))};
    frame.payload = std::move(*payload_variant);
    return frame;
}

} // namespace AH::Network
