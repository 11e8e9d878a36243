#include "agenthub/network/ShareUploadTokenIssuer.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Encoding.hpp"

namespace AH::Network {

ShareUploadTokenIssuer::ShareUploadTokenIssuer(std::chrono::milliseconds ttl)
    : ttl_(ttl) {}

auto ShareUploadTokenIssuer::issueFor(std::string const& agentName) -> Expected<std::string> {
    return issueFor(agentName, Clock::now());
}

auto ShareUploadTokenIssuer::issueFor(std::string const& agentName, Clock::time_point now) -> Expected<std::string> {
    if (agentName.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "agent name must not be empty"});
    }
    auto token = secureRandomHex(TokenBytes);
    if (!token) {
        return std::unexpected(token.error());
    }
    std::lock_guard const lock{mutex_};
    tokens_.insert_or_assign(*token, IssuedToken{agentName, now});
    ah_log("Upload token issued for " + agentName, "ShareUploadTokenIssuer");
    return token;
}

auto ShareUploadTokenIssuer::redeem(std::string_view token, std::string_view agentName) -> bool {
    return redeem(token, agentName, Clock::now());
}

auto ShareUploadTokenIssuer::redeem(std::string_view token, std::string_view agentName, Clock::time_point now) -> bool {
    std::lock_guard const lock{mutex_};
    auto                  it = tokens_.find(std::string(token));
    if (it == tokens_.end()) {
        return false;
    }
    // A token presented by another agent stays valid for its owner.
    if (it->second.agentName != agentName) {
        ah_log("Upload token presented by wrong agent " + std::string(agentName), "ShareUploadTokenIssuer");
        return false;
    }
    bool const live = !expired(it->second, now);
    tokens_.erase(it);
    return live;
}

auto ShareUploadTokenIssuer::revokeAgent(std::string_view agentName) -> std::size_t {
    std::lock_guard const lock{mutex_};
    return std::erase_if(tokens_, [agentName](auto const& item) { return item.second.agentName == agentName; });
}

auto ShareUploadTokenIssuer::pruneExpired(Clock::time_point now) -> std::size_t {
    std::lock_guard const lock{mutex_};
    return std::erase_if(tokens_, [this, now](auto const& item) { return expired(item.second, now); });
}

auto ShareUploadTokenIssuer::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return tokens_.size();
}

auto ShareUploadTokenIssuer::expired(IssuedToken const& token, Clock::time_point now) const -> bool {
    return ttl_.count() > 0 && now - token.issuedAt > ttl_;
}

} // namespace AH::Network
