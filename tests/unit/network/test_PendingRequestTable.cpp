#include "network/PendingRequestTable.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace AH;
using namespace AH::Network;
using namespace std::chrono_literals;

using Table = PendingRequestTable<int>;

TEST_SUITE("network.pending_request_table") {
    TEST_CASE("Resolve completes the future and removes the entry") {
        Table table{"Test"};
        auto  created = table.create("conn-1");
        REQUIRE(created.has_value());
        CHECK(looksLikeCorrelationId(created->id));
        CHECK(table.size() == 1);
        CHECK(table.contains(created->id));
        CHECK(table.connectionOf(created->id) == ConnectionId{"conn-1"});
        CHECK_FALSE(created->future.ready());

        CHECK(table.resolve(created->id, 17));
        CHECK(table.size() == 0);
        CHECK_FALSE(table.contains(created->id));
        CHECK_FALSE(table.connectionOf(created->id).has_value());

        auto result = created->future.get();
        REQUIRE(result.has_value());
        CHECK(*result == 17);
    }

    TEST_CASE("Late and duplicate replies are silent no-ops") {
        Table table;
        auto  created = table.create("conn-1");
        REQUIRE(created.has_value());

        CHECK(table.resolve(created->id, 1));
        CHECK_FALSE(table.resolve(created->id, 2));
        CHECK_FALSE(table.fail(created->id, Error{Error::Code::UploadFailed, "late"}));
        CHECK_FALSE(table.resolve("123e4567-e89b-42d3-a456-426614174000", 3));

        auto result = created->future.get();
        REQUIRE(result.has_value());
        CHECK(*result == 1);
    }

    TEST_CASE("Fail delivers the error") {
        Table table;
        auto  created = table.create("conn-1");
        REQUIRE(created.has_value());
        CHECK(table.fail(created->id, Error{Error::Code::UploadFailed, "agent could not read file"}));
        CHECK(table.size() == 0);

        auto result = created->future.get();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::UploadFailed);
    }

    TEST_CASE("Every create gets a distinct id") {
        Table table;
        std::vector<CorrelationId> ids;
        for (int i = 0; i < 100; ++i) {
            auto created = table.create("conn-1");
            REQUIRE(created.has_value());
            ids.push_back(created->id);
        }
        CHECK(table.size() == 100);
    }

    TEST_CASE("evictExpired fails only entries older than the timeout") {
        Table table;
        auto  start = Table::Clock::now();
        auto  old   = table.create("conn-1", start);
        auto  young = table.create("conn-1", start + 20s);
        REQUIRE(old.has_value());
        REQUIRE(young.has_value());

        CHECK(table.evictExpired(start + 29s, 30s) == 0);
        CHECK(table.evictExpired(start + 30s, 30s) == 1);
        CHECK(table.size() == 1);
        CHECK(table.contains(young->id));

        auto result = old->future.get();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Timeout);
        CHECK(result.error().message == "no reply within 30000ms");

        // The evicted id is gone; a reply for it now changes nothing.
        CHECK_FALSE(table.resolve(old->id, 5));
    }

    TEST_CASE("An entry resolved just before its deadline keeps its value") {
        Table table;
        auto  start   = Table::Clock::now();
        auto  created = table.create("conn-1", start);
        REQUIRE(created.has_value());

        CHECK(table.resolve(created->id, 42));
        CHECK(table.evictExpired(start + 30s, 30s) == 0);
        CHECK(table.evictExpired(start + 5min, 30s) == 0);

        auto result = created->future.get();
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    TEST_CASE("failConnection only touches that connection") {
        Table table;
        std::vector<PendingFuture<int>> lost;
        for (int i = 0; i < 3; ++i) {
            auto created = table.create("conn-1");
            REQUIRE(created.has_value());
            lost.push_back(created->future);
        }
        auto other = table.create("conn-2");
        REQUIRE(other.has_value());

        CHECK(table.failConnection("conn-1", Error{Error::Code::ConnectionLost, "disconnected"}) == 3);
        CHECK(table.size() == 1);
        for (auto const& future : lost) {
            auto result = future.get();
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::ConnectionLost);
        }
        CHECK_FALSE(other->future.ready());
        CHECK(table.failConnection("conn-1", Error{Error::Code::ConnectionLost, "again"}) == 0);
    }

    TEST_CASE("failAll empties the table") {
        Table table;
        auto  a = table.create("conn-1");
        auto  b = table.create("conn-2");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(table.failAll(Error{Error::Code::ConnectionLost, "shutdown"}) == 2);
        CHECK(table.size() == 0);
        CHECK(a->future.ready());
        CHECK(b->future.ready());
    }

    TEST_CASE("Racing resolve and eviction complete each entry once") {
        Table table;
        std::vector<Table::Created> created;
        auto start = Table::Clock::now() - 1h;
        for (int i = 0; i < 200; ++i) {
            auto entry = table.create("conn-1", start);
            REQUIRE(entry.has_value());
            created.push_back(*entry);
        }

        std::atomic<int> resolved{0};
        std::thread      resolver([&]() {
            for (auto const& entry : created) {
                if (table.resolve(entry.id, 1)) {
                    ++resolved;
                }
            }
        });
        auto evicted = table.evictExpired(Table::Clock::now(), 1s);
        resolver.join();

        CHECK(static_cast<std::size_t>(resolved.load()) + evicted == created.size());
        CHECK(table.size() == 0);
        for (auto const& entry : created) {
            CHECK(entry.future.ready());
        }
    }
}
