#include "agenthub/network/AuthenticationChallengeManager.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Encoding.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <optional>
#include <span>

namespace AH::Network {

AuthenticationChallengeManager::AuthenticationChallengeManager(CredentialTable           credentials,
                                                               std::chrono::milliseconds ttl)
    : credentials_(std::move(credentials))
    , ttl_(ttl) {}

auto AuthenticationChallengeManager::issue(ConnectionId const& connectionId) -> Expected<std::string> {
    return issue(connectionId, Clock::now());
}

auto AuthenticationChallengeManager::issue(ConnectionId const& connectionId, Clock::time_point now)
    -> Expected<std::string> {
    auto token = secureRandomHex(TokenBytes);
    if (!token) {
        return std::unexpected(token.error());
    }
    challenges_.insert_or_assign(connectionId, Challenge{*token, now});
    ah_log("Challenge issued for " + connectionId, "AuthenticationChallengeManager");
    return token;
}

auto AuthenticationChallengeManager::validate(ConnectionId const& connectionId,
                                              std::string_view    agentName,
                                              std::string_view    response) -> bool {
    return validate(connectionId, agentName, response, Clock::now());
}

auto AuthenticationChallengeManager::validate(ConnectionId const& connectionId,
                                              std::string_view    agentName,
                                              std::string_view    response,
                                              Clock::time_point   now) -> bool {
    std::optional<Challenge> challenge;
    challenges_.erase_if(connectionId, [&challenge](auto& value) {
        challenge.emplace(std::move(value.second));
        return true;
    });
    if (!challenge) {
        ah_log("No outstanding challenge for " + connectionId, "AuthenticationChallengeManager");
        return false;
    }
    if (ttl_.count() > 0 && now - challenge->issuedAt > ttl_) {
        ah_log("Challenge for " + connectionId + " expired", "AuthenticationChallengeManager");
        return false;
    }
    if (agentName.empty()) {
        return false;
    }
    auto secret = secretFor(agentName);
    if (!secret) {
        ah_log("No credential for agent " + std::string(agentName), "AuthenticationChallengeManager");
        return false;
    }

    auto expected = computeResponse(challenge->token, agentName, *secret);
    if (expected.empty() || response.size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), response.data(), expected.size()) == 0;
}

auto AuthenticationChallengeManager::discard(ConnectionId const& connectionId) -> bool {
    return challenges_.erase(connectionId) > 0;
}

auto AuthenticationChallengeManager::hasChallenge(ConnectionId const& connectionId) const -> bool {
    return challenges_.count(connectionId) > 0;
}

auto AuthenticationChallengeManager::outstanding() const -> std::size_t {
    return challenges_.size();
}

auto AuthenticationChallengeManager::setCredential(std::string agentName, std::string secret) -> void {
    std::unique_lock lock(credentialsMutex_);
    credentials_.insert_or_assign(std::move(agentName), std::move(secret));
}

auto AuthenticationChallengeManager::hasCredential(std::string_view agentName) const -> bool {
    std::shared_lock lock(credentialsMutex_);
    return credentials_.find(agentName) != credentials_.end();
}

auto AuthenticationChallengeManager::secretFor(std::string_view agentName) const -> std::optional<std::string> {
    std::shared_lock lock(credentialsMutex_);
    if (auto it = credentials_.find(agentName); it != credentials_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto AuthenticationChallengeManager::computeResponse(std::string_view token,
                                                     std::string_view agentName,
                                                     std::string_view secret) -> std::string {
    std::string message;
    message.reserve(token.size() + 1 + agentName.size());
    message.append(token);
    message.push_back(':');
    message.append(agentName);

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int                               length = 0;
    auto const* result = HMAC(EVP_sha256(),
                              secret.data(),
                              static_cast<int>(secret.size()),
                              reinterpret_cast<unsigned char const*>(message.data()),
                              message.size(),
                              digest.data(),
                              &length);
    if (result == nullptr) {
        return {};
    }
    return encodeHex(std::span<std::uint8_t const>{digest.data(), length});
}

} // namespace AH::Network
