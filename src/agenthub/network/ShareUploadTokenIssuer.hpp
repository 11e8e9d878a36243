#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace AH::Network {

/**
 * ShareUploadTokenIssuer — opaque single-use credentials that let one agent push one upload.
 *
 * Tokens are 32 random bytes, hex encoded, scoped to the agent they were issued for and
 * valid for `ttl` (zero keeps them until redeemed or revoked). Whether the caller is
 * allowed to obtain a token is decided by the coordinator, not here.
 */
class ShareUploadTokenIssuer {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t TokenBytes = 32;

    explicit ShareUploadTokenIssuer(std::chrono::milliseconds ttl = std::chrono::minutes{5});

    [[nodiscard]] auto issueFor(std::string const& agentName) -> Expected<std::string>;
    [[nodiscard]] auto issueFor(std::string const& agentName, Clock::time_point now) -> Expected<std::string>;

    [[nodiscard]] auto redeem(std::string_view token, std::string_view agentName) -> bool;
    [[nodiscard]] auto redeem(std::string_view token, std::string_view agentName, Clock::time_point now) -> bool;

    auto revokeAgent(std::string_view agentName) -> std::size_t;
    auto pruneExpired(Clock::time_point now) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct IssuedToken {
        std::string       agentName;
        Clock::time_point issuedAt;
    };

    [[nodiscard]] auto expired(IssuedToken const& token, Clock::time_point now) const -> bool;

    mutable std::mutex                           mutex_;
    std::unordered_map<std::string, IssuedToken> tokens_;
    std::chrono::milliseconds                    ttl_;
};

} // namespace AH::Network
