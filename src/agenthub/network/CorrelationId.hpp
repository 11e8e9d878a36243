#pragma once

#include "core/Error.hpp"

#include <string>
#include <string_view>

namespace AH::Network {

using CorrelationId = std::string;

// Assigned by the channel for each live connection ("conn-<n>").
using ConnectionId = std::string;

// 128 random bits rendered as a version 4 UUID (8-4-4-4-12 lower-case hex).
[[nodiscard]] auto newCorrelationId() -> Expected<CorrelationId>;

// True when the text has the 8-4-4-4-12 hex shape produced by newCorrelationId.
[[nodiscard]] auto looksLikeCorrelationId(std::string_view text) -> bool;

} // namespace AH::Network
