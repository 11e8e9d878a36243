#pragma once

#include "core/Error.hpp"
#include "network/AgentChannelServer.hpp"
#include "network/AuthenticationChallengeManager.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace AH {

struct CoordinatorOptions {
    std::string                   host{"127.0.0.1"};
    int                           port{47800};
    std::int64_t                  pending_timeout_ms{30000};
    std::int64_t                  challenge_ttl_ms{60000};
    std::int64_t                  upload_token_ttl_ms{300000};
    std::int64_t                  sweep_interval_ms{1000};
    std::int64_t                  max_frame_bytes{64 * 1024 * 1024};
    std::string                   agents_file;
    std::string                   download_dir{"downloads"};
    Network::CredentialTable      credentials;
    bool                          show_help{false};
};

auto ParseCoordinatorArguments(int argc, char** argv) -> std::optional<CoordinatorOptions>;

void PrintCoordinatorUsage();

bool ApplyCoordinatorEnvOverrides(CoordinatorOptions& options);

auto ValidateCoordinatorOptions(CoordinatorOptions const& options) -> std::optional<std::string>;

// "name:secret" as given to --agent.
auto ParseAgentCredential(std::string_view text) -> std::optional<std::pair<std::string, std::string>>;

// JSON array of {"name": "...", "secret": "..."} objects.
auto LoadAgentCredentials(std::string const& path) -> Expected<Network::CredentialTable>;
auto ParseAgentCredentials(std::string_view json) -> Expected<Network::CredentialTable>;

auto MakeChannelServerConfig(CoordinatorOptions const& options) -> Network::AgentChannelServerConfig;

} // namespace AH
