#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace AH {

struct Error {
    enum class Code {
        UnknownError = 0,
        Unauthorized,
        NotFound,
        Timeout,
        ConnectionLost,
        UploadFailed,
        AgentUnavailable,
        MalformedInput,
        TransportError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::Unauthorized:
        return "unauthorized";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::ConnectionLost:
        return "connection_lost";
    case Error::Code::UploadFailed:
        return "upload_failed";
    case Error::Code::AgentUnavailable:
        return "agent_unavailable";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::TransportError:
        return "transport_error";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCodeFromString(std::string_view label) -> Error::Code {
    if (label == "unauthorized") {
        return Error::Code::Unauthorized;
    }
    if (label == "not_found") {
        return Error::Code::NotFound;
    }
    if (label == "timeout") {
        return Error::Code::Timeout;
    }
    if (label == "connection_lost") {
        return Error::Code::ConnectionLost;
    }
    if (label == "upload_failed") {
        return Error::Code::UploadFailed;
    }
    if (label == "agent_unavailable") {
        return Error::Code::AgentUnavailable;
    }
    if (label == "malformed_input") {
        return Error::Code::MalformedInput;
    }
    if (label == "transport_error") {
        return Error::Code::TransportError;
    }
    return Error::Code::UnknownError;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace AH
