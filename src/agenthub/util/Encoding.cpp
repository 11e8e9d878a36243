#include "agenthub/util/Encoding.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <limits>

namespace AH {

namespace {

constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kHexDigits[]      = "0123456789abcdef";

auto decode_char(char ch) -> int {
    if ('A' <= ch && ch <= 'Z') return ch - 'A';
    if ('a' <= ch && ch <= 'z') return ch - 'a' + 26;
    if ('0' <= ch && ch <= '9') return ch - '0' + 52;
    if (ch == '+') return 62;
    if (ch == '/') return 63;
    return -1;
}

} // namespace

auto encodeBase64(std::span<std::uint8_t const> bytes) -> std::string {
    std::string encoded;
    encoded.reserve(((bytes.size() + 2U) / 3U) * 4U);

    std::size_t index = 0;
    while (index + 2U < bytes.size()) {
        auto b0 = bytes[index];
        auto b1 = bytes[index + 1U];
        auto b2 = bytes[index + 2U];
        encoded.push_back(kBase64Alphabet[b0 >> 2U]);
        encoded.push_back(kBase64Alphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
        encoded.push_back(kBase64Alphabet[((b1 & 0x0FU) << 2U) | (b2 >> 6U)]);
        encoded.push_back(kBase64Alphabet[b2 & 0x3FU]);
        index += 3U;
    }

    if (index < bytes.size()) {
        auto b0 = bytes[index];
        encoded.push_back(kBase64Alphabet[b0 >> 2U]);
        if (index + 1U < bytes.size()) {
            auto b1 = bytes[index + 1U];
            encoded.push_back(kBase64Alphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
            encoded.push_back(kBase64Alphabet[(b1 & 0x0FU) << 2U]);
            encoded.push_back('=');
        } else {
            encoded.push_back(kBase64Alphabet[(b0 & 0x03U) << 4U]);
            encoded.push_back('=');
            encoded.push_back('=');
        }
    }

    return encoded;
}

auto decodeBase64(std::string_view input) -> Expected<std::vector<std::uint8_t>> {
    if (input.size() % 4U != 0U) {
        return std::unexpected(Error{Error::Code::MalformedInput, "base64 length must be a multiple of 4"});
    }

    std::vector<std::uint8_t> output;
    output.reserve((input.size() / 4U) * 3U);
    for (std::size_t idx = 0; idx < input.size(); idx += 4U) {
        std::array<int, 4> chunk{};
        std::size_t        padding = 0;
        for (std::size_t i = 0; i < 4U; ++i) {
            char ch = input[idx + i];
            if (ch == '=') {
                // Padding is only valid in the last two positions of the final quad.
                if (idx + 4U != input.size() || i < 2U) {
                    return std::unexpected(Error{Error::Code::MalformedInput, "base64 padding misplaced"});
                }
                chunk[i] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return std::unexpected(Error{Error::Code::MalformedInput, "base64 data after padding"});
            }
            chunk[i] = decode_char(ch);
            if (chunk[i] < 0) {
                return std::unexpected(Error{Error::Code::MalformedInput, "base64 invalid character"});
            }
        }
        output.push_back(static_cast<std::uint8_t>((chunk[0] << 2) | ((chunk[1] & 0x30) >> 4)));
        if (padding < 2U) {
            output.push_back(static_cast<std::uint8_t>(((chunk[1] & 0x0F) << 4) | ((chunk[2] & 0x3C) >> 2)));
        }
        if (padding < 1U) {
            output.push_back(static_cast<std::uint8_t>(((chunk[2] & 0x03) << 6) | chunk[3]));
        }
    }
    return output;
}

auto encodeHex(std::span<std::uint8_t const> bytes) -> std::string {
    std::string hex;
    hex.reserve(bytes.size() * 2U);
    for (auto byte : bytes) {
        hex.push_back(kHexDigits[byte >> 4U]);
        hex.push_back(kHexDigits[byte & 0x0FU]);
    }
    return hex;
}

auto secureRandomBytes(std::size_t count) -> Expected<std::vector<std::uint8_t>> {
    if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(Error{Error::Code::MalformedInput, "random byte count too large"});
    }
    std::vector<std::uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        auto code = ERR_get_error();
        std::array<char, 256> buffer{};
        ERR_error_string_n(code, buffer.data(), buffer.size());
        return std::unexpected(Error{Error::Code::UnknownError, std::string{"RAND_bytes failed: "} + buffer.data()});
    }
    return bytes;
}

auto secureRandomHex(std::size_t count) -> Expected<std::string> {
    auto bytes = secureRandomBytes(count);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return encodeHex(*bytes);
}

} // namespace AH
