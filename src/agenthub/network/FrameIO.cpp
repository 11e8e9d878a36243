#include "agenthub/network/FrameIO.hpp"

#include <array>

namespace AH::Network {

namespace {

[[nodiscard]] auto make_transport_error(std::string message) -> Error {
    return Error{Error::Code::TransportError, std::move(message)};
}

} // namespace

auto writeFrame(asio::ip::tcp::socket& socket, AgentFrame const& frame, std::size_t maxFrameBytes)
    -> Expected<void> {
    auto payload = serializeFrame(frame);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (payload->size() > maxFrameBytes || payload->size() > UINT32_MAX) {
        return std::unexpected(make_transport_error("frame of " + std::to_string(payload->size())
                                                    + " bytes exceeds limit"));
    }
    std::uint32_t size = static_cast<std::uint32_t>(payload->size());
    std::array<std::uint8_t, 4> header{{static_cast<std::uint8_t>((size >> 24) & 0xFF),
                                        static_cast<std::uint8_t>((size >> 16) & 0xFF),
                                        static_cast<std::uint8_t>((size >> 8) & 0xFF),
                                        static_cast<std::uint8_t>(size & 0xFF)}};
    std::array<asio::const_buffer, 2> buffers{asio::buffer(header),
                                              asio::buffer(payload->data(), payload->size())};
    std::error_code ec;
    asio::write(socket, buffers, ec);
    if (ec) {
        return std::unexpected(make_transport_error(ec.message()));
    }
    return {};
}

auto readFrameBody(asio::ip::tcp::socket& socket, std::size_t maxFrameBytes) -> Expected<std::string> {
    std::array<std::uint8_t, 4> header{};
    std::error_code             ec;
    asio::read(socket, asio::buffer(header), ec);
    if (ec) {
        return std::unexpected(make_transport_error(ec.message()));
    }
    auto size = (static_cast<std::uint32_t>(header[0]) << 24)
              | (static_cast<std::uint32_t>(header[1]) << 16)
              | (static_cast<std::uint32_t>(header[2]) << 8)
              | static_cast<std::uint32_t>(header[3]);
    if (size == 0) {
        return std::unexpected(make_transport_error("frame payload empty"));
    }
    if (size > maxFrameBytes) {
        return std::unexpected(make_transport_error("frame of " + std::to_string(size) + " bytes exceeds limit"));
    }
    std::string payload(size, '\0');
    asio::read(socket, asio::buffer(payload.data(), payload.size()), ec);
    if (ec) {
        return std::unexpected(make_transport_error(ec.message()));
    }
    return payload;
}

} // namespace AH::Network
