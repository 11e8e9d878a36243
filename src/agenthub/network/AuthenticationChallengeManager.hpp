#pragma once

#include "core/Error.hpp"
#include "network/CorrelationId.hpp"

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace AH::Network {

// agent name -> shared secret
using CredentialTable = std::map<std::string, std::string, std::less<>>;

/**
 * AuthenticationChallengeManager — single-use challenge tokens bound to a connection.
 *
 * issue() stores a fresh random token for the connection, replacing any unconsumed one.
 * validate() removes the stored token before checking anything, so every issued challenge
 * is checked at most once whatever the outcome. The expected answer is
 * hex(HMAC-SHA256(secret, token ":" agentName)) and is compared in constant time.
 */
class AuthenticationChallengeManager {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t TokenBytes = 32;

    explicit AuthenticationChallengeManager(CredentialTable credentials,
                                            std::chrono::milliseconds ttl = std::chrono::seconds{60});

    [[nodiscard]] auto issue(ConnectionId const& connectionId) -> Expected<std::string>;
    [[nodiscard]] auto issue(ConnectionId const& connectionId, Clock::time_point now) -> Expected<std::string>;

    [[nodiscard]] auto validate(ConnectionId const& connectionId,
                                std::string_view    agentName,
                                std::string_view    response) -> bool;
    [[nodiscard]] auto validate(ConnectionId const& connectionId,
                                std::string_view    agentName,
                                std::string_view    response,
                                Clock::time_point   now) -> bool;

    // Drops an unconsumed challenge; returns whether one existed.
    auto discard(ConnectionId const& connectionId) -> bool;

    [[nodiscard]] auto hasChallenge(ConnectionId const& connectionId) const -> bool;
    [[nodiscard]] auto outstanding() const -> std::size_t;

    auto setCredential(std::string agentName, std::string secret) -> void;
    [[nodiscard]] auto hasCredential(std::string_view agentName) const -> bool;

    [[nodiscard]] static auto computeResponse(std::string_view token,
                                              std::string_view agentName,
                                              std::string_view secret) -> std::string;

private:
    struct Challenge {
        std::string       token;
        Clock::time_point issuedAt;
    };

    using ChallengeMap = phmap::parallel_flat_hash_map<std::string,
                                                       Challenge,
                                                       std::hash<std::string>,
                                                       std::equal_to<std::string>,
                                                       std::allocator<std::pair<const std::string, Challenge>>,
                                                       4,
                                                       std::mutex>;

    [[nodiscard]] auto secretFor(std::string_view agentName) const -> std::optional<std::string>;

    ChallengeMap              challenges_;
    CredentialTable           credentials_;
    mutable std::shared_mutex credentialsMutex_;
    std::chrono::milliseconds ttl_;
};

} // namespace AH::Network
