#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace AH::Network {

// Answer to a file-info inquiry.
struct FileInfo {
    bool         exists{false};
    std::int64_t length{0};
};

/**
 * UploadStream — read access to the bytes of a completed upload.
 *
 * Consumers only see this interface; where the bytes live (memory today) is up to the
 * implementation.
 */
class UploadStream {
public:
    virtual ~UploadStream() = default;

    [[nodiscard]] virtual auto filename() const -> std::string const& = 0;
    [[nodiscard]] virtual auto size() const -> std::uint64_t          = 0;

    // Copies up to out.size() bytes starting at offset; returns the number copied.
    [[nodiscard]] virtual auto readAt(std::uint64_t offset, std::span<std::uint8_t> out) const -> std::size_t = 0;
};

using UploadHandle = std::shared_ptr<UploadStream>;

class BufferedUploadStream final : public UploadStream {
public:
    BufferedUploadStream(std::string filename, std::vector<std::uint8_t> bytes);

    [[nodiscard]] auto filename() const -> std::string const& override;
    [[nodiscard]] auto size() const -> std::uint64_t override;
    [[nodiscard]] auto readAt(std::uint64_t offset, std::span<std::uint8_t> out) const -> std::size_t override;

    [[nodiscard]] auto bytes() const -> std::span<std::uint8_t const>;

private:
    std::string               filename_;
    std::vector<std::uint8_t> bytes_;
};

[[nodiscard]] auto readAll(UploadStream const& stream) -> std::vector<std::uint8_t>;

// Writes the upload below `directory` using the final component of its filename.
[[nodiscard]] auto saveUpload(UploadStream const& stream, std::filesystem::path const& directory)
    -> Expected<std::filesystem::path>;

} // namespace AH::Network
