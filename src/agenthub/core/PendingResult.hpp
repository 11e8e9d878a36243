#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace AH {

namespace detail {

template <typename T>
struct PendingState {
    using Continuation = std::function<void(Expected<T> const&)>;

    mutable std::mutex              mutex;
    std::condition_variable         cv;
    std::optional<Expected<T>>      result;
    std::vector<Continuation>       continuations;
};

} // namespace detail

/**
 * PendingFuture — read side of a value that arrives later from an unrelated message.
 *
 * Notes:
 * - Copies share the same state; any number of readers may wait on it.
 * - The result is an Expected<T>: either the value or the Error that failed it.
 * - then() registers a continuation that runs exactly once, on the completing
 *   thread, or immediately on the caller's thread if the result is already set.
 */
template <typename T>
class PendingFuture {
public:
    using State = detail::PendingState<T>;

    PendingFuture() = default;
    explicit PendingFuture(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    // A future that is already failed; used when a request cannot even be sent.
    static auto Failed(Error error) -> PendingFuture<T> {
        auto state    = std::make_shared<State>();
        state->result = Expected<T>{std::unexpected(std::move(error))};
        return PendingFuture<T>{std::move(state)};
    }

    [[nodiscard]] auto valid() const -> bool {
        return static_cast<bool>(state_);
    }

    [[nodiscard]] auto ready() const -> bool {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result.has_value();
    }

    auto wait() const -> void {
        if (!state_) {
            return;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return state_->result.has_value(); });
    }

    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> const& d) const -> bool {
        if (!state_) {
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, d, [this] { return state_->result.has_value(); });
    }

    // Blocking read of the result.
    [[nodiscard]] auto get() const -> Expected<T> {
        if (!state_) {
            return std::unexpected(Error{Error::Code::UnknownError, "future has no shared state"});
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return state_->result.has_value(); });
        return *state_->result;
    }

    // Non-blocking read; nullopt while the result is outstanding.
    [[nodiscard]] auto try_get() const -> std::optional<Expected<T>> {
        if (!state_) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result;
    }

    auto then(typename State::Continuation continuation) const -> void {
        if (!state_ || !continuation) {
            return;
        }
        std::optional<Expected<T>> completed;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->result.has_value()) {
                state_->continuations.push_back(std::move(continuation));
                return;
            }
            completed = state_->result;
        }
        continuation(*completed);
    }

private:
    std::shared_ptr<State> state_;
};

/**
 * PendingPromise — write side of a PendingFuture.
 *
 * The first set_value/set_error wins. Later calls return false and change
 * nothing, so a duplicate or late reply is harmless.
 */
template <typename T>
class PendingPromise {
public:
    using State = detail::PendingState<T>;

    PendingPromise()
        : state_(std::make_shared<State>()) {}

    [[nodiscard]] auto future() const -> PendingFuture<T> {
        return PendingFuture<T>{state_};
    }

    auto set_value(T value) -> bool {
        return complete(Expected<T>{std::move(value)});
    }

    auto set_error(Error error) -> bool {
        return complete(Expected<T>{std::unexpected(std::move(error))});
    }

    [[nodiscard]] auto completed() const -> bool {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result.has_value();
    }

private:
    auto complete(Expected<T> result) -> bool {
        std::vector<typename State::Continuation> continuations;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->result.has_value()) {
                return false;
            }
            state_->result = std::move(result);
            continuations.swap(state_->continuations);
        }
        state_->cv.notify_all();
        // Continuations run without the state lock so they may touch the future again.
        for (auto& continuation : continuations) {
            continuation(*state_->result);
        }
        return true;
    }

    std::shared_ptr<State> state_;
};

} // namespace AH
