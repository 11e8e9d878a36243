#include "network/CorrelationId.hpp"

#include <doctest/doctest.h>

#include <set>
#include <string>

using namespace AH::Network;

TEST_SUITE("network.correlation_id") {
    TEST_CASE("Generated ids are version 4 UUIDs") {
        auto id = newCorrelationId();
        REQUIRE(id.has_value());
        CHECK(id->size() == 36);
        CHECK(looksLikeCorrelationId(*id));
        CHECK((*id)[14] == '4');
        auto variant = (*id)[19];
        CHECK((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
    }

    TEST_CASE("Generated ids do not repeat") {
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            auto id = newCorrelationId();
            REQUIRE(id.has_value());
            ids.insert(*id);
        }
        CHECK(ids.size() == 1000);
    }

    TEST_CASE("Shape check") {
        CHECK(looksLikeCorrelationId("123e4567-e89b-42d3-a456-426614174000"));
        CHECK_FALSE(looksLikeCorrelationId(""));
        CHECK_FALSE(looksLikeCorrelationId("GET_UPLOAD_TOKEN"));
        CHECK_FALSE(looksLikeCorrelationId("123e4567e89b42d3a456426614174000"));
        CHECK_FALSE(looksLikeCorrelationId("123e4567-e89b-42d3-a456-42661417400z"));
        CHECK_FALSE(looksLikeCorrelationId("123e4567-e89b-42d3-a456_426614174000"));
    }
}
