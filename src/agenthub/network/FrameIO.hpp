#pragma once

#include "core/Error.hpp"
#include "network/AgentProtocol.hpp"

#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace AH::Network {

inline constexpr std::size_t DefaultMaxFrameBytes = 64U * 1024U * 1024U;

// Serialises the frame and writes it with a 4-byte big-endian length prefix.
[[nodiscard]] auto writeFrame(asio::ip::tcp::socket& socket, AgentFrame const& frame, std::size_t maxFrameBytes)
    -> Expected<void>;

/**
 * Reads one length-prefixed frame body without decoding it.
 *
 * Fails with TransportError on socket errors, an empty body, or a declared length above
 * maxFrameBytes. The body is returned raw so a decode failure can be told apart from a
 * broken stream.
 */
[[nodiscard]] auto readFrameBody(asio::ip::tcp::socket& socket, std::size_t maxFrameBytes) -> Expected<std::string>;

} // namespace AH::Network
