#include "AgentHubTestHelper.hpp"
#include "network/FileTransfer.hpp"

#include <doctest/doctest.h>

#include <array>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace AH;
using namespace AH::Network;

namespace {

auto bytes_of(std::string const& text) -> std::vector<std::uint8_t> {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST_SUITE("network.file_transfer") {
    TEST_CASE("Buffered stream reads at offsets") {
        BufferedUploadStream stream{"song.mp3", bytes_of("0123456789")};
        CHECK(stream.filename() == "song.mp3");
        CHECK(stream.size() == 10);

        std::array<std::uint8_t, 4> buffer{};
        CHECK(stream.readAt(0, buffer) == 4);
        CHECK(buffer[0] == '0');
        CHECK(stream.readAt(8, buffer) == 2);
        CHECK(buffer[1] == '9');
        CHECK(stream.readAt(10, buffer) == 0);
        CHECK(stream.readAt(99, buffer) == 0);

        CHECK(readAll(stream) == bytes_of("0123456789"));
    }

    TEST_CASE("saveUpload keeps only the file name") {
        Test::TempDirectory  dir;
        BufferedUploadStream stream{"../../etc/song.mp3", bytes_of("music")};
        auto                 saved = saveUpload(stream, dir.path() / "downloads");
        REQUIRE(saved.has_value());
        CHECK(*saved == dir.path() / "downloads" / "song.mp3");

        std::ifstream in(*saved, std::ios::binary);
        std::string   contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(contents == "music");
    }

    TEST_CASE("saveUpload refuses nameless uploads") {
        Test::TempDirectory  dir;
        BufferedUploadStream stream{"", bytes_of("x")};
        auto                 saved = saveUpload(stream, dir.path());
        REQUIRE_FALSE(saved.has_value());
        CHECK(saved.error().code == Error::Code::MalformedInput);
    }
}
