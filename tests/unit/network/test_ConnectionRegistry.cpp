#include "network/ConnectionRegistry.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace AH::Network;

TEST_SUITE("network.connection_registry") {
    TEST_CASE("Register and look up both directions") {
        ConnectionRegistry registry;
        CHECK_FALSE(registry.registerAgent("C1", "agentA").has_value());

        CHECK(registry.tryGet("C1") == std::string{"agentA"});
        CHECK(registry.connectionFor("agentA") == ConnectionId{"C1"});
        CHECK(registry.isRegistered("agentA"));
        CHECK(registry.size() == 1);

        auto records = registry.snapshot();
        REQUIRE(records.size() == 1);
        CHECK(records[0].connectionId == "C1");
        CHECK(records[0].agentName == "agentA");
        CHECK(records[0].authenticated);
    }

    TEST_CASE("Lookups of unknown keys are empty") {
        ConnectionRegistry registry;
        CHECK_FALSE(registry.tryGet("C1").has_value());
        CHECK_FALSE(registry.connectionFor("agentA").has_value());
        CHECK_FALSE(registry.isRegistered("agentA"));
    }

    TEST_CASE("tryRemove is idempotent") {
        ConnectionRegistry registry;
        registry.registerAgent("C1", "agentA");
        CHECK(registry.tryRemove("C1") == std::string{"agentA"});
        CHECK_FALSE(registry.tryRemove("C1").has_value());
        CHECK_FALSE(registry.tryRemove("never-seen").has_value());
        CHECK(registry.size() == 0);
        CHECK_FALSE(registry.isRegistered("agentA"));
    }

    TEST_CASE("Last authenticated connection wins the name") {
        ConnectionRegistry registry;
        registry.registerAgent("C1", "agentA");
        auto displaced = registry.registerAgent("C2", "agentA");

        CHECK(displaced == ConnectionId{"C1"});
        CHECK(registry.connectionFor("agentA") == ConnectionId{"C2"});
        CHECK_FALSE(registry.tryGet("C1").has_value());
        CHECK(registry.size() == 1);

        // The displaced connection closing later must not unbind the new one.
        CHECK_FALSE(registry.tryRemove("C1").has_value());
        CHECK(registry.connectionFor("agentA") == ConnectionId{"C2"});
    }

    TEST_CASE("Re-registering a connection under a new name drops the old name") {
        ConnectionRegistry registry;
        registry.registerAgent("C1", "agentA");
        CHECK_FALSE(registry.registerAgent("C1", "agentB").has_value());

        CHECK(registry.tryGet("C1") == std::string{"agentB"});
        CHECK_FALSE(registry.isRegistered("agentA"));
        CHECK(registry.connectionFor("agentB") == ConnectionId{"C1"});
        CHECK(registry.size() == 1);
    }

    TEST_CASE("Registering the same pair twice is harmless") {
        ConnectionRegistry registry;
        registry.registerAgent("C1", "agentA");
        CHECK_FALSE(registry.registerAgent("C1", "agentA").has_value());
        CHECK(registry.size() == 1);
    }

    TEST_CASE("Concurrent registration keeps both maps consistent") {
        ConnectionRegistry       registry;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&registry, t]() {
                for (int i = 0; i < 200; ++i) {
                    auto connection = "C" + std::to_string(t) + "-" + std::to_string(i);
                    auto agent      = "agent" + std::to_string(i % 10);
                    registry.registerAgent(connection, agent);
                    if (i % 3 == 0) {
                        registry.tryRemove(connection);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto records = registry.snapshot();
        CHECK(records.size() <= 10);
        for (auto const& record : records) {
            CHECK(registry.connectionFor(record.agentName) == record.connectionId);
        }
    }
}
