#include "agenthub/network/FileTransfer.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <system_error>

namespace AH::Network {

BufferedUploadStream::BufferedUploadStream(std::string filename, std::vector<std::uint8_t> bytes)
    : filename_(std::move(filename))
    , bytes_(std::move(bytes)) {}

auto BufferedUploadStream::filename() const -> std::string const& {
    return filename_;
}

auto BufferedUploadStream::size() const -> std::uint64_t {
    return static_cast<std::uint64_t>(bytes_.size());
}

auto BufferedUploadStream::readAt(std::uint64_t offset, std::span<std::uint8_t> out) const -> std::size_t {
    if (offset >= bytes_.size() || out.empty()) {
        return 0;
    }
    auto const available = bytes_.size() - static_cast<std::size_t>(offset);
    auto const count     = std::min(available, out.size());
    std::memcpy(out.data(), bytes_.data() + offset, count);
    return count;
}

auto BufferedUploadStream::bytes() const -> std::span<std::uint8_t const> {
    return bytes_;
}

auto readAll(UploadStream const& stream) -> std::vector<std::uint8_t> {
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(stream.size()));
    std::size_t               offset = 0;
    while (offset < bytes.size()) {
        auto copied = stream.readAt(offset, std::span<std::uint8_t>{bytes}.subspan(offset));
        if (copied == 0) {
            bytes.resize(offset);
            break;
        }
        offset += copied;
    }
    return bytes;
}

auto saveUpload(UploadStream const& stream, std::filesystem::path const& directory)
    -> Expected<std::filesystem::path> {
    auto leaf = std::filesystem::path{stream.filename()}.filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        return std::unexpected(Error{Error::Code::MalformedInput, "upload has no usable filename"});
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::TransportError, "create " + directory.string() + ": " + ec.message()});
    }
    auto          target = directory / leaf;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error{Error::Code::TransportError, "cannot open " + target.string()});
    }
    auto bytes = readAll(stream);
    out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return std::unexpected(Error{Error::Code::TransportError, "write failed for " + target.string()});
    }
    return target;
}

} // namespace AH::Network
