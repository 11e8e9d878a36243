#include "network/AuthenticationChallengeManager.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace AH::Network;
using namespace std::chrono_literals;

namespace {

auto makeManager(std::chrono::milliseconds ttl = 60s) -> AuthenticationChallengeManager {
    return AuthenticationChallengeManager{CredentialTable{{"agentA", "secret-a"}, {"agentB", "secret-b"}}, ttl};
}

} // namespace

TEST_SUITE("network.authentication_challenge_manager") {
    TEST_CASE("Response derivation is deterministic and keyed") {
        auto response = AuthenticationChallengeManager::computeResponse("token", "agentA", "secret-a");
        CHECK(response.size() == 64);
        CHECK(response == AuthenticationChallengeManager::computeResponse("token", "agentA", "secret-a"));
        CHECK(response != AuthenticationChallengeManager::computeResponse("token", "agentA", "secret-b"));
        CHECK(response != AuthenticationChallengeManager::computeResponse("token", "agentB", "secret-a"));
        CHECK(response != AuthenticationChallengeManager::computeResponse("other", "agentA", "secret-a"));
    }

    TEST_CASE("Correct response validates once") {
        auto manager = makeManager();
        auto token   = manager.issue("C1");
        REQUIRE(token.has_value());
        CHECK(token->size() == AuthenticationChallengeManager::TokenBytes * 2);
        CHECK(manager.hasChallenge("C1"));

        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");
        CHECK(manager.validate("C1", "agentA", response));
        CHECK_FALSE(manager.hasChallenge("C1"));

        // Replaying the same answer fails: the challenge was consumed.
        CHECK_FALSE(manager.validate("C1", "agentA", response));
    }

    TEST_CASE("A wrong answer also consumes the challenge") {
        auto manager = makeManager();
        auto token   = manager.issue("C1");
        REQUIRE(token.has_value());
        CHECK_FALSE(manager.validate("C1", "agentA", "not-the-answer"));

        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");
        CHECK_FALSE(manager.validate("C1", "agentA", response));
    }

    TEST_CASE("Validation without a challenge fails") {
        auto manager = makeManager();
        CHECK_FALSE(manager.validate("C9", "agentA", "anything"));
    }

    TEST_CASE("Answers are bound to the agent name and its secret") {
        auto manager = makeManager();

        SUBCASE("response for another agent") {
            auto token = manager.issue("C1");
            REQUIRE(token.has_value());
            auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");
            CHECK_FALSE(manager.validate("C1", "agentB", response));
        }
        SUBCASE("unknown agent") {
            auto token = manager.issue("C1");
            REQUIRE(token.has_value());
            auto response = AuthenticationChallengeManager::computeResponse(*token, "ghost", "secret-a");
            CHECK_FALSE(manager.validate("C1", "ghost", response));
        }
        SUBCASE("empty agent name") {
            auto token = manager.issue("C1");
            REQUIRE(token.has_value());
            auto response = AuthenticationChallengeManager::computeResponse(*token, "", "secret-a");
            CHECK_FALSE(manager.validate("C1", "", response));
        }
        SUBCASE("wrong secret") {
            auto token = manager.issue("C1");
            REQUIRE(token.has_value());
            auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "guess");
            CHECK_FALSE(manager.validate("C1", "agentA", response));
        }
    }

    TEST_CASE("Reissuing replaces the previous challenge") {
        auto manager = makeManager();
        auto first   = manager.issue("C1");
        auto second  = manager.issue("C1");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(*first != *second);
        CHECK(manager.outstanding() == 1);

        auto stale = AuthenticationChallengeManager::computeResponse(*first, "agentA", "secret-a");
        CHECK_FALSE(manager.validate("C1", "agentA", stale));
    }

    TEST_CASE("Challenges are per connection") {
        auto manager = makeManager();
        auto t1      = manager.issue("C1");
        auto t2      = manager.issue("C2");
        REQUIRE(t1.has_value());
        REQUIRE(t2.has_value());

        auto forC1 = AuthenticationChallengeManager::computeResponse(*t1, "agentA", "secret-a");
        CHECK_FALSE(manager.validate("C2", "agentA", forC1));
        CHECK(manager.validate("C1", "agentA", forC1));
    }

    TEST_CASE("Expired challenges are rejected") {
        auto manager = makeManager(1s);
        auto issued  = AuthenticationChallengeManager::Clock::now();
        auto token   = manager.issue("C1", issued);
        REQUIRE(token.has_value());
        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");
        CHECK_FALSE(manager.validate("C1", "agentA", response, issued + 2s));

        auto fresh = manager.issue("C1", issued);
        REQUIRE(fresh.has_value());
        auto answer = AuthenticationChallengeManager::computeResponse(*fresh, "agentA", "secret-a");
        CHECK(manager.validate("C1", "agentA", answer, issued + 1s));
    }

    TEST_CASE("Zero ttl never expires") {
        auto manager = makeManager(0ms);
        auto issued  = AuthenticationChallengeManager::Clock::now();
        auto token   = manager.issue("C1", issued);
        REQUIRE(token.has_value());
        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");
        CHECK(manager.validate("C1", "agentA", response, issued + 24h));
    }

    TEST_CASE("discard drops an unconsumed challenge") {
        auto manager = makeManager();
        REQUIRE(manager.issue("C1").has_value());
        CHECK(manager.discard("C1"));
        CHECK_FALSE(manager.discard("C1"));
        CHECK(manager.outstanding() == 0);
    }

    TEST_CASE("Credentials can be added at runtime") {
        auto manager = makeManager();
        CHECK_FALSE(manager.hasCredential("agentC"));
        manager.setCredential("agentC", "secret-c");
        CHECK(manager.hasCredential("agentC"));

        auto token = manager.issue("C3");
        REQUIRE(token.has_value());
        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentC", "secret-c");
        CHECK(manager.validate("C3", "agentC", response));
    }

    TEST_CASE("Concurrent validations of one challenge succeed at most once") {
        auto manager = makeManager();
        auto token   = manager.issue("C1");
        REQUIRE(token.has_value());
        auto response = AuthenticationChallengeManager::computeResponse(*token, "agentA", "secret-a");

        std::atomic<int>         accepted{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                if (manager.validate("C1", "agentA", response)) {
                    ++accepted;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK(accepted == 1);
    }
}
