#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace AH {

[[nodiscard]] auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string;
[[nodiscard]] auto decodeBase64(std::string_view input) -> Expected<std::vector<std::uint8_t>>;

// Lower-case hex, two characters per byte.
[[nodiscard]] auto encodeHex(std::span<std::uint8_t const> bytes) -> std::string;

// Bytes from the OpenSSL CSPRNG. Fails with UnknownError when the generator is not seeded.
[[nodiscard]] auto secureRandomBytes(std::size_t count) -> Expected<std::vector<std::uint8_t>>;

// secureRandomBytes(count) rendered with encodeHex.
[[nodiscard]] auto secureRandomHex(std::size_t count) -> Expected<std::string>;

} // namespace AH
