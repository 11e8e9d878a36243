#include "agenthub/config/AgentOptions.hpp"

#include "config/OptionParsing.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace AH {

namespace {

using detail::apply_env;
using detail::parse_bool;
using detail::parse_integer_in_range;

constexpr std::int64_t MinFrameBytes = 1024;
constexpr std::int64_t MaxFrameBytes = std::numeric_limits<std::uint32_t>::max();
constexpr std::int64_t MaxMillis     = 24LL * 60 * 60 * 1000;

// Base64 grows a file by 4/3; the rest of an UPLOAD frame is a few hundred bytes of JSON.
constexpr std::int64_t UploadFrameOverhead = 4096;

auto fits_in_frame(std::int64_t uploadBytes, std::int64_t frameBytes) -> bool {
    auto encoded = ((uploadBytes + 2) / 3) * 4;
    return encoded + UploadFrameOverhead <= frameBytes;
}

} // namespace

auto ValidateAgentOptions(AgentOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (options.port <= 0 || options.port > 65535) {
        return std::string{"--port must be between 1 and 65535"};
    }
    if (options.name.empty()) {
        return std::string{"--name is required"};
    }
    if (options.secret.empty()) {
        return std::string{"--secret is required (or set AGENTHUB_AGENT_SECRET)"};
    }
    if (options.share_root.empty()) {
        return std::string{"--share-root must not be empty"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(options.share_root, ec)) {
        return "--share-root " + options.share_root + " is not a directory";
    }
    if (options.max_frame_bytes < MinFrameBytes || options.max_frame_bytes > MaxFrameBytes) {
        return std::string{"--max-frame-bytes must be between 1024 and 4294967295"};
    }
    if (options.max_upload_bytes <= 0) {
        return std::string{"--max-upload-bytes must be positive"};
    }
    if (!fits_in_frame(options.max_upload_bytes, options.max_frame_bytes)) {
        return std::string{"--max-upload-bytes does not fit in --max-frame-bytes once base64 encoded"};
    }
    if (options.auth_timeout_ms <= 0) {
        return std::string{"--auth-timeout-ms must be positive"};
    }
    if (options.reconnect_delay_ms < 0) {
        return std::string{"--reconnect-delay-ms must not be negative"};
    }
    return std::nullopt;
}

bool ApplyAgentEnvOverrides(AgentOptions& options) {
    auto text = [](char const* key, std::string& out) {
        return apply_env(key, [&](std::string_view value) {
            out = std::string{value};
            return true;
        });
    };
    auto integer = [](char const* key, std::int64_t min, std::int64_t max, std::int64_t& out) {
        return apply_env(key, [&](std::string_view value) {
            if (!parse_integer_in_range<std::int64_t>(value, min, max, out)) {
                std::cerr << key << " must be an integer between " << min << " and " << max << "\n";
                return false;
            }
            return true;
        });
    };

    if (!text("AGENTHUB_HOST", options.host) || !text("AGENTHUB_AGENT_NAME", options.name)
        || !text("AGENTHUB_AGENT_SECRET", options.secret) || !text("AGENTHUB_SHARE_ROOT", options.share_root)) {
        return false;
    }
    if (!apply_env("AGENTHUB_PORT", [&](std::string_view value) {
            int port = 0;
            if (!parse_integer_in_range(value, 1, 65535, port)) {
                std::cerr << "AGENTHUB_PORT must be between 1 and 65535\n";
                return false;
            }
            options.port = port;
            return true;
        })) {
        return false;
    }
    if (!integer("AGENTHUB_MAX_FRAME_BYTES", MinFrameBytes, MaxFrameBytes, options.max_frame_bytes)
        || !integer("AGENTHUB_MAX_UPLOAD_BYTES", 1, MaxFrameBytes, options.max_upload_bytes)
        || !integer("AGENTHUB_AUTH_TIMEOUT_MS", 1, MaxMillis, options.auth_timeout_ms)
        || !integer("AGENTHUB_RECONNECT_DELAY_MS", 0, MaxMillis, options.reconnect_delay_ms)) {
        return false;
    }
    if (!apply_env("AGENTHUB_RECONNECT", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "AGENTHUB_RECONNECT must be a boolean\n";
                return false;
            }
            options.reconnect = *parsed;
            return true;
        })) {
        return false;
    }
    return true;
}

void PrintAgentUsage() {
    std::cout << "Usage: agenthub_agent --name <agent> --secret <secret> [options]\n"
              << "  --host <addr>               Coordinator address (default 127.0.0.1)\n"
              << "  --port <port>               Coordinator port (default 47800)\n"
              << "  --name <agent>              Agent name to log in as\n"
              << "  --secret <secret>           Shared secret registered with the coordinator\n"
              << "  --share-root <dir>          Directory served to the coordinator (default .)\n"
              << "  --max-upload-bytes <n>      Largest file served (default 49283072)\n"
              << "  --max-frame-bytes <n>       Largest frame sent or accepted (default 67108864)\n"
              << "  --auth-timeout-ms <n>       Wait this long for the login verdict (default 10000)\n"
              << "  --reconnect-delay-ms <n>    Pause between reconnect attempts (default 2000)\n"
              << "  --no-reconnect              Exit when the connection drops\n"
              << "  --help                      Show this message\n"
              << "Environment: AGENTHUB_HOST, AGENTHUB_PORT, AGENTHUB_AGENT_NAME, AGENTHUB_AGENT_SECRET,\n"
              << "  AGENTHUB_SHARE_ROOT, AGENTHUB_MAX_UPLOAD_BYTES, AGENTHUB_MAX_FRAME_BYTES,\n"
              << "  AGENTHUB_AUTH_TIMEOUT_MS, AGENTHUB_RECONNECT, AGENTHUB_RECONNECT_DELAY_MS,\n"
              << "  AGENTHUB_LOG, AGENTHUB_LOG_TAGS\n";
}

auto ParseAgentArguments(int argc, char** argv) -> std::optional<AgentOptions> {
    AgentOptions options;
    if (!ApplyAgentEnvOverrides(options)) {
        return std::nullopt;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto require_value = [&](std::string_view name) -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << name << " requires a value\n";
                return std::nullopt;
            }
            return std::string_view{argv[++i]};
        };
        auto read_text = [&](std::string_view name, std::string& out) {
            auto value = require_value(name);
            if (!value) {
                return false;
            }
            out = std::string{*value};
            return true;
        };
        auto read_integer = [&](std::string_view name, std::int64_t min, std::int64_t max, std::int64_t& out) {
            auto value = require_value(name);
            if (!value) {
                return false;
            }
            if (!parse_integer_in_range<std::int64_t>(*value, min, max, out)) {
                std::cerr << "Invalid " << name << " value: " << *value << "\n";
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        } else if (arg == "--host") {
            if (!read_text(arg, options.host)) {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            int port = 0;
            if (!parse_integer_in_range(*value, 1, 65535, port)) {
                std::cerr << "Invalid --port value: " << *value << "\n";
                return std::nullopt;
            }
            options.port = port;
        } else if (arg == "--name") {
            if (!read_text(arg, options.name)) {
                return std::nullopt;
            }
        } else if (arg == "--secret") {
            if (!read_text(arg, options.secret)) {
                return std::nullopt;
            }
        } else if (arg == "--share-root") {
            if (!read_text(arg, options.share_root)) {
                return std::nullopt;
            }
        } else if (arg == "--max-upload-bytes") {
            if (!read_integer(arg, 1, MaxFrameBytes, options.max_upload_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--max-frame-bytes") {
            if (!read_integer(arg, MinFrameBytes, MaxFrameBytes, options.max_frame_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--auth-timeout-ms") {
            if (!read_integer(arg, 1, MaxMillis, options.auth_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--reconnect-delay-ms") {
            if (!read_integer(arg, 0, MaxMillis, options.reconnect_delay_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--no-reconnect") {
            options.reconnect = false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateAgentOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto MakeResponderConfig(AgentOptions const& options) -> Network::AgentResponderConfig {
    Network::AgentResponderConfig config;
    config.agentName      = options.name;
    config.secret         = options.secret;
    config.shareRoot      = options.share_root;
    config.maxUploadBytes = static_cast<std::size_t>(options.max_upload_bytes);
    return config;
}

auto MakeClientConfig(AgentOptions const& options) -> Network::AgentClientConfig {
    Network::AgentClientConfig config;
    config.host            = options.host;
    config.port            = static_cast<std::uint16_t>(options.port);
    config.max_frame_bytes = static_cast<std::size_t>(options.max_frame_bytes);
    return config;
}

} // namespace AH
