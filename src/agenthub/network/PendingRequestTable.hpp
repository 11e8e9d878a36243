#pragma once

#include "core/Error.hpp"
#include "core/PendingResult.hpp"
#include "log/TaggedLogger.hpp"
#include "network/CorrelationId.hpp"

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace AH::Network {

/**
 * PendingRequestTable — correlation engine between outbound requests and their later replies.
 *
 * Every entry is keyed by a random CorrelationId and remembers the connection it was sent
 * on. The reply, a timeout sweep, a disconnect or shutdown each remove the entry and complete
 * its promise; whichever removes it first is the only one that completes it.
 *
 * Notes:
 * - Entries live in a sharded phmap map with per-shard std::mutex locks. Removal goes through
 *   the locked erase_if(key, f) so two removers can never both observe the same entry.
 * - Promises are completed after the shard lock is released.
 * - Unknown ids are silent: resolve/fail return false.
 */
template <typename T>
class PendingRequestTable {
public:
    using Clock = std::chrono::steady_clock;

    struct Created {
        CorrelationId    id;
        PendingFuture<T> future;
    };

    explicit PendingRequestTable(std::string name = "PendingRequestTable")
        : name_(std::move(name)) {}

    PendingRequestTable(PendingRequestTable const&)            = delete;
    PendingRequestTable& operator=(PendingRequestTable const&) = delete;

    [[nodiscard]] auto create(ConnectionId const& connectionId) -> Expected<Created> {
        return create(connectionId, Clock::now());
    }

    [[nodiscard]] auto create(ConnectionId const& connectionId, Clock::time_point createdAt)
        -> Expected<Created> {
        PendingPromise<T> promise;
        auto              future = promise.future();
        Entry             entry{connectionId, createdAt, std::move(promise)};
        while (true) {
            auto id = newCorrelationId();
            if (!id) {
                return std::unexpected(id.error());
            }
            auto [it, inserted] = entries_.emplace(*id, entry);
            (void)it;
            if (inserted) {
                ah_log("Pending entry " + *id + " created for " + connectionId, name_);
                return Created{std::move(*id), std::move(future)};
            }
        }
    }

    auto resolve(CorrelationId const& id, T value) -> bool {
        auto entry = take(id);
        if (!entry) {
            ah_log("Reply for unknown id " + id + " ignored", name_);
            return false;
        }
        return entry->promise.set_value(std::move(value));
    }

    auto fail(CorrelationId const& id, Error error) -> bool {
        auto entry = take(id);
        if (!entry) {
            return false;
        }
        return entry->promise.set_error(std::move(error));
    }

    // Fails with Timeout every entry created at or before now - timeout.
    auto evictExpired(Clock::time_point now, Clock::duration timeout) -> std::size_t {
        return failMatching(
            [now, timeout](Entry const& entry) { return entry.createdAt + timeout <= now; },
            Error{Error::Code::Timeout, "no reply within " + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) + "ms"});
    }

    auto failConnection(ConnectionId const& connectionId, Error error) -> std::size_t {
        return failMatching([&connectionId](Entry const& entry) { return entry.connectionId == connectionId; },
                            std::move(error));
    }

    auto failAll(Error error) -> std::size_t {
        return failMatching([](Entry const&) { return true; }, std::move(error));
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return entries_.size();
    }

    [[nodiscard]] auto contains(CorrelationId const& id) const -> bool {
        return entries_.count(id) > 0;
    }

    [[nodiscard]] auto connectionOf(CorrelationId const& id) const -> std::optional<ConnectionId> {
        std::optional<ConnectionId> connection;
        entries_.if_contains(id, [&connection](auto const& value) { connection = value.second.connectionId; });
        return connection;
    }

private:
    struct Entry {
        ConnectionId      connectionId;
        Clock::time_point createdAt;
        PendingPromise<T> promise;
    };

    static constexpr std::size_t kSubmapsLog2 = 4;

    using EntryMap = phmap::parallel_flat_hash_map<std::string,
                                                   Entry,
                                                   std::hash<std::string>,
                                                   std::equal_to<std::string>,
                                                   std::allocator<std::pair<const std::string, Entry>>,
                                                   kSubmapsLog2,
                                                   std::mutex>;

    auto take(CorrelationId const& id) -> std::optional<Entry> {
        std::optional<Entry> taken;
        entries_.erase_if(id, [&taken](auto& value) {
            taken.emplace(std::move(value.second));
            return true;
        });
        return taken;
    }

    template <typename Predicate>
    auto failMatching(Predicate&& predicate, Error const& error) -> std::size_t {
        std::vector<CorrelationId> candidates;
        entries_.for_each([&](auto const& value) {
            if (predicate(value.second)) {
                candidates.push_back(value.first);
            }
        });

        std::size_t failed = 0;
        for (auto const& id : candidates) {
            // Another thread may have resolved the entry since the scan.
            auto entry = take(id);
            if (!entry) {
                continue;
            }
            if (entry->promise.set_error(error)) {
                ++failed;
            }
        }
        if (failed > 0) {
            ah_log("Failed " + std::to_string(failed) + " pending entries: " + describeError(error), name_);
        }
        return failed;
    }

    std::string name_;
    EntryMap    entries_;
};

} // namespace AH::Network
