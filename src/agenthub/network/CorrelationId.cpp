#include "agenthub/network/CorrelationId.hpp"

#include "util/Encoding.hpp"

#include <cctype>
#include <span>

namespace AH::Network {

auto newCorrelationId() -> Expected<CorrelationId> {
    auto bytes = secureRandomBytes(16);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    (*bytes)[6] = static_cast<std::uint8_t>(((*bytes)[6] & 0x0FU) | 0x40U);
    (*bytes)[8] = static_cast<std::uint8_t>(((*bytes)[8] & 0x3FU) | 0x80U);

    std::span<std::uint8_t const> view{*bytes};
    std::string                   id;
    id.reserve(36);
    id += encodeHex(view.subspan(0, 4));
    id.push_back('-');
    id += encodeHex(view.subspan(4, 2));
    id.push_back('-');
    id += encodeHex(view.subspan(6, 2));
    id.push_back('-');
    id += encodeHex(view.subspan(8, 2));
    id.push_back('-');
    id += encodeHex(view.subspan(10, 6));
    return id;
}

auto looksLikeCorrelationId(std::string_view text) -> bool {
    if (text.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return false;
            }
            continue;
        }
        if (std::isxdigit(static_cast<unsigned char>(text[i])) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace AH::Network
