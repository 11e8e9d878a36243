#pragma once

#include "network/AgentClient.hpp"
#include "network/AgentResponder.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace AH {

struct AgentOptions {
    std::string  host{"127.0.0.1"};
    int          port{47800};
    std::string  name;
    std::string  secret;
    std::string  share_root{"."};
    std::int64_t max_upload_bytes{47 * 1024 * 1024};
    std::int64_t max_frame_bytes{64 * 1024 * 1024};
    std::int64_t auth_timeout_ms{10000};
    bool         reconnect{true};
    std::int64_t reconnect_delay_ms{2000};
    bool         show_help{false};
};

auto ParseAgentArguments(int argc, char** argv) -> std::optional<AgentOptions>;

void PrintAgentUsage();

bool ApplyAgentEnvOverrides(AgentOptions& options);

auto ValidateAgentOptions(AgentOptions const& options) -> std::optional<std::string>;

auto MakeResponderConfig(AgentOptions const& options) -> Network::AgentResponderConfig;
auto MakeClientConfig(AgentOptions const& options) -> Network::AgentClientConfig;

} // namespace AH
