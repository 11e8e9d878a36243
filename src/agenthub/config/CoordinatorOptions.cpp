#include "agenthub/config/CoordinatorOptions.hpp"

#include "config/OptionParsing.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>

namespace AH {

namespace {

using Json = nlohmann::json;
using detail::apply_env;
using detail::parse_integer_in_range;

constexpr std::int64_t MinFrameBytes = 1024;
constexpr std::int64_t MaxFrameBytes = std::numeric_limits<std::uint32_t>::max();
constexpr std::int64_t MaxMillis     = 24LL * 60 * 60 * 1000;

auto make_error(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto ParseAgentCredential(std::string_view text) -> std::optional<std::pair<std::string, std::string>> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    return std::make_pair(std::string{text.substr(0, colon)}, std::string{text.substr(colon + 1)});
}

auto ParseAgentCredentials(std::string_view json) -> Expected<Network::CredentialTable> {
    Json document = Json::parse(json, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(make_error("agents file is not valid JSON"));
    }
    if (!document.is_array()) {
        return std::unexpected(make_error("agents file must contain a JSON array"));
    }
    Network::CredentialTable table;
    std::size_t              index = 0;
    for (auto const& entry : document) {
        auto where = "agents[" + std::to_string(index++) + "]";
        if (!entry.is_object()) {
            return std::unexpected(make_error(where + " must be an object"));
        }
        auto name   = entry.find("name");
        auto secret = entry.find("secret");
        if (name == entry.end() || !name->is_string() || name->get<std::string>().empty()) {
            return std::unexpected(make_error(where + ".name must be a non-empty string"));
        }
        if (secret == entry.end() || !secret->is_string() || secret->get<std::string>().empty()) {
            return std::unexpected(make_error(where + ".secret must be a non-empty string"));
        }
        table.insert_or_assign(name->get<std::string>(), secret->get<std::string>());
    }
    return table;
}

auto LoadAgentCredentials(std::string const& path) -> Expected<Network::CredentialTable> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open agents file " + path});
    }
    std::string contents((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    auto        table = ParseAgentCredentials(contents);
    if (!table) {
        return std::unexpected(Error{table.error().code, path + ": " + table.error().message.value_or("")});
    }
    return table;
}

auto ValidateCoordinatorOptions(CoordinatorOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (options.port < 0 || options.port > 65535) {
        return std::string{"--port must be between 0 and 65535"};
    }
    if (options.pending_timeout_ms <= 0) {
        return std::string{"--pending-timeout-ms must be positive"};
    }
    if (options.challenge_ttl_ms < 0) {
        return std::string{"--challenge-ttl-ms must not be negative"};
    }
    if (options.upload_token_ttl_ms <= 0) {
        return std::string{"--upload-token-ttl-ms must be positive"};
    }
    if (options.sweep_interval_ms <= 0) {
        return std::string{"--sweep-interval-ms must be positive"};
    }
    if (options.max_frame_bytes < MinFrameBytes || options.max_frame_bytes > MaxFrameBytes) {
        return std::string{"--max-frame-bytes must be between 1024 and 4294967295"};
    }
    if (options.credentials.empty()) {
        return std::string{"at least one agent credential is required (--agent or --agents-file)"};
    }
    return std::nullopt;
}

bool ApplyCoordinatorEnvOverrides(CoordinatorOptions& options) {
    auto millis = [](char const* key, std::int64_t min, std::int64_t& out) {
        return apply_env(key, [&](std::string_view value) {
            if (!parse_integer_in_range<std::int64_t>(value, min, MaxMillis, out)) {
                std::cerr << key << " must be an integer between " << min << " and " << MaxMillis << "\n";
                return false;
            }
            return true;
        });
    };

    if (!apply_env("AGENTHUB_HOST", [&](std::string_view value) {
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!apply_env("AGENTHUB_PORT", [&](std::string_view value) {
            int port = 0;
            if (!parse_integer_in_range(value, 0, 65535, port)) {
                std::cerr << "AGENTHUB_PORT must be between 0 and 65535\n";
                return false;
            }
            options.port = port;
            return true;
        })) {
        return false;
    }
    if (!millis("AGENTHUB_PENDING_TIMEOUT_MS", 1, options.pending_timeout_ms)
        || !millis("AGENTHUB_CHALLENGE_TTL_MS", 0, options.challenge_ttl_ms)
        || !millis("AGENTHUB_UPLOAD_TOKEN_TTL_MS", 1, options.upload_token_ttl_ms)
        || !millis("AGENTHUB_SWEEP_INTERVAL_MS", 1, options.sweep_interval_ms)) {
        return false;
    }
    if (!apply_env("AGENTHUB_MAX_FRAME_BYTES", [&](std::string_view value) {
            if (!parse_integer_in_range<std::int64_t>(value, MinFrameBytes, MaxFrameBytes, options.max_frame_bytes)) {
                std::cerr << "AGENTHUB_MAX_FRAME_BYTES must be between 1024 and 4294967295\n";
                return false;
            }
            return true;
        })) {
        return false;
    }
    if (!apply_env("AGENTHUB_AGENTS_FILE", [&](std::string_view value) {
            options.agents_file = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!apply_env("AGENTHUB_DOWNLOAD_DIR", [&](std::string_view value) {
            options.download_dir = std::string{value};
            return true;
        })) {
        return false;
    }
    return true;
}

void PrintCoordinatorUsage() {
    std::cout << "Usage: agenthub_coordinator [options]\n"
              << "  --host <addr>               Bind address (default 127.0.0.1)\n"
              << "  --port <port>               Listen port (default 47800, 0 picks a free port)\n"
              << "  --agent <name:secret>       Accept an agent with this shared secret (repeatable)\n"
              << "  --agents-file <path>        JSON array of {\"name\", \"secret\"} credentials\n"
              << "  --download-dir <path>       Where 'get' stores uploaded files (default downloads)\n"
              << "  --pending-timeout-ms <n>    Fail requests without a reply after n ms (default 30000)\n"
              << "  --challenge-ttl-ms <n>      Login window after connect, 0 disables (default 60000)\n"
              << "  --upload-token-ttl-ms <n>   Lifetime of an upload token (default 300000)\n"
              << "  --sweep-interval-ms <n>     How often expired requests are failed (default 1000)\n"
              << "  --max-frame-bytes <n>       Largest accepted frame (default 67108864)\n"
              << "  --help                      Show this message\n"
              << "Environment: AGENTHUB_HOST, AGENTHUB_PORT, AGENTHUB_AGENTS_FILE, AGENTHUB_DOWNLOAD_DIR,\n"
              << "  AGENTHUB_PENDING_TIMEOUT_MS, AGENTHUB_CHALLENGE_TTL_MS, AGENTHUB_UPLOAD_TOKEN_TTL_MS,\n"
              << "  AGENTHUB_SWEEP_INTERVAL_MS, AGENTHUB_MAX_FRAME_BYTES, AGENTHUB_LOG, AGENTHUB_LOG_TAGS\n";
}

auto ParseCoordinatorArguments(int argc, char** argv) -> std::optional<CoordinatorOptions> {
    CoordinatorOptions options;
    if (!ApplyCoordinatorEnvOverrides(options)) {
        return std::nullopt;
    }
    Network::CredentialTable cli_credentials;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto require_value = [&](std::string_view name) -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << name << " requires a value\n";
                return std::nullopt;
            }
            return std::string_view{argv[++i]};
        };
        auto read_millis = [&](std::string_view name, std::int64_t min, std::int64_t& out) {
            auto value = require_value(name);
            if (!value) {
                return false;
            }
            if (!parse_integer_in_range<std::int64_t>(*value, min, MaxMillis, out)) {
                std::cerr << "Invalid " << name << " value: " << *value << "\n";
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        } else if (arg == "--host") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            options.host = std::string{*value};
        } else if (arg == "--port") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            int port = 0;
            if (!parse_integer_in_range(*value, 0, 65535, port)) {
                std::cerr << "Invalid --port value: " << *value << "\n";
                return std::nullopt;
            }
            options.port = port;
        } else if (arg == "--agent") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            auto credential = ParseAgentCredential(*value);
            if (!credential) {
                std::cerr << "--agent expects name:secret\n";
                return std::nullopt;
            }
            cli_credentials.insert_or_assign(std::move(credential->first), std::move(credential->second));
        } else if (arg == "--agents-file") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            options.agents_file = std::string{*value};
        } else if (arg == "--download-dir") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            options.download_dir = std::string{*value};
        } else if (arg == "--pending-timeout-ms") {
            if (!read_millis(arg, 1, options.pending_timeout_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--challenge-ttl-ms") {
            if (!read_millis(arg, 0, options.challenge_ttl_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--upload-token-ttl-ms") {
            if (!read_millis(arg, 1, options.upload_token_ttl_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--sweep-interval-ms") {
            if (!read_millis(arg, 1, options.sweep_interval_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--max-frame-bytes") {
            auto value = require_value(arg);
            if (!value) {
                return std::nullopt;
            }
            if (!parse_integer_in_range<std::int64_t>(*value, MinFrameBytes, MaxFrameBytes, options.max_frame_bytes)) {
                std::cerr << "Invalid --max-frame-bytes value: " << *value << "\n";
                return std::nullopt;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!options.agents_file.empty()) {
        auto loaded = LoadAgentCredentials(options.agents_file);
        if (!loaded) {
            std::cerr << describeError(loaded.error()) << "\n";
            return std::nullopt;
        }
        options.credentials = std::move(*loaded);
    }
    // Credentials given on the command line win over the file.
    for (auto& [name, secret] : cli_credentials) {
        options.credentials.insert_or_assign(name, std::move(secret));
    }

    if (auto error = ValidateCoordinatorOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto MakeChannelServerConfig(CoordinatorOptions const& options) -> Network::AgentChannelServerConfig {
    Network::AgentChannelServerConfig config;
    config.bind_address    = options.host;
    config.port            = static_cast<std::uint16_t>(options.port);
    config.max_frame_bytes = static_cast<std::size_t>(options.max_frame_bytes);
    config.sweep_interval  = std::chrono::milliseconds{options.sweep_interval_ms};
    return config;
}

} // namespace AH
