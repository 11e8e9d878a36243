#include "util/Encoding.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

using namespace AH;

namespace {

auto bytes_of(std::string_view text) -> std::vector<std::uint8_t> {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST_SUITE("util.encoding") {
    TEST_CASE("Base64 matches the RFC 4648 vectors") {
        CHECK(encodeBase64(bytes_of("")) == "");
        CHECK(encodeBase64(bytes_of("f")) == "Zg==");
        CHECK(encodeBase64(bytes_of("fo")) == "Zm8=");
        CHECK(encodeBase64(bytes_of("foo")) == "Zm9v");
        CHECK(encodeBase64(bytes_of("foob")) == "Zm9vYg==");
        CHECK(encodeBase64(bytes_of("fooba")) == "Zm9vYmE=");
        CHECK(encodeBase64(bytes_of("foobar")) == "Zm9vYmFy");

        auto decoded = decodeBase64("Zm9vYmE=");
        REQUIRE(decoded.has_value());
        CHECK(*decoded == bytes_of("fooba"));
    }

    TEST_CASE("Base64 survives every byte value") {
        std::vector<std::uint8_t> all;
        for (int i = 0; i < 256; ++i) {
            all.push_back(static_cast<std::uint8_t>(i));
        }
        auto decoded = decodeBase64(encodeBase64(all));
        REQUIRE(decoded.has_value());
        CHECK(*decoded == all);
    }

    TEST_CASE("Base64 decoding rejects malformed input") {
        auto expectMalformed = [](std::string_view text) {
            auto decoded = decodeBase64(text);
            REQUIRE_FALSE(decoded.has_value());
            CHECK(decoded.error().code == Error::Code::MalformedInput);
        };
        expectMalformed("Zm9");      // length not a multiple of 4
        expectMalformed("Zm9v!A==");  // invalid character
        expectMalformed("Z===");      // padding too early
        expectMalformed("Zg==Zm9v");  // padding before the last quad
        expectMalformed("Zm=v");      // data after padding

        auto empty = decodeBase64("");
        REQUIRE(empty.has_value());
        CHECK(empty->empty());
    }

    TEST_CASE("Hex is lower case, two digits per byte") {
        std::vector<std::uint8_t> bytes{0x00, 0x0f, 0xa0, 0xff};
        CHECK(encodeHex(bytes) == "000fa0ff");
        CHECK(encodeHex(std::vector<std::uint8_t>{}) == "");
    }

    TEST_CASE("Secure random output has the requested size and varies") {
        auto none = secureRandomBytes(0);
        REQUIRE(none.has_value());
        CHECK(none->empty());

        std::set<std::string> seen;
        for (int i = 0; i < 16; ++i) {
            auto hex = secureRandomHex(32);
            REQUIRE(hex.has_value());
            CHECK(hex->size() == 64);
            seen.insert(*hex);
        }
        CHECK(seen.size() == 16);
    }
}
