#pragma once

#include "keepsake/core/Log.hh"
#include "keepsake/utils/ErrorHandling.hh"

#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <utility>

namespace keepsake::async {

/// Get the engine's main io_context. Call poll() each frame.
asio::io_context& context();

/// Initialize the async subsystem. Call once at startup.
void init();

/// Shutdown: release work guard, drain remaining handlers.
void shutdown();

/// Non-blocking poll: process all ready handlers. Call once per frame.
/// Equivalent to io_context::poll() + restart().
void poll();

/// Same as poll() for an injected context (tests, secondary sessions).
void poll(asio::io_context& io);

/// Blocking run until shutdown() or all work completes.
void run();

/// Create a steady_timer bound to the async context.
asio::steady_timer makeTimer();
asio::steady_timer makeTimer(std::chrono::steady_clock::duration duration);

/// Default completion token: returns tuple<error_code, T> instead of throwing.
inline const auto use_nothrow = asio::as_tuple(asio::use_awaitable);

/// co_spawn completion handler that logs an exception escaping `task`
/// instead of discarding it the way asio::detached would.
inline auto logOnError(const char* task) {
    return [task](std::exception_ptr error) {
        if (!error) {
            return;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            KEEPSAKE_LOG_ERROR("Async task '{}' failed: {}", task, e.what());
        }
    };
}

/// Suspend the calling coroutine for `duration` on `timer`.
/// Returns false when the wait was cancelled.
asio::awaitable<bool> sleepFor(asio::steady_timer& timer, std::chrono::steady_clock::duration duration);

/// One-shot result channel between a completion callback and a suspended
/// coroutine. The callback side calls set(); the coroutine side awaits wait().
///
/// The waiting side parks on a steady_timer that never expires (or expires
/// at the timeout); set() and cancel() wake it by cancelling the timer.
/// Only one coroutine may wait at a time.
template <typename T> class Completion {
  public:
    explicit Completion(asio::io_context& io) : timer_(io) {}

    /// Clear any previous value so the next wait() suspends until set().
    void arm() {
        value_.reset();
        cancelled_ = false;
        armed_ = true;
    }

    /// Deliver the value. Ignored unless armed; returns whether it was taken.
    bool set(T value) {
        if (!armed_ || value_) {
            return false;
        }
        value_ = std::move(value);
        timer_.cancel();
        return true;
    }

    /// Wake the waiter with ErrorCode::Cancelled.
    void cancel() {
        cancelled_ = true;
        timer_.cancel();
    }

    /// Stop accepting set() without waking anyone.
    void disarm() {
        armed_ = false;
        value_.reset();
    }

    bool armed() const { return armed_; }
    bool ready() const { return value_.has_value(); }

    /// Suspend until set(), cancel() or the timeout. A zero timeout waits
    /// without bound. Disarms the channel on return.
    asio::awaitable<Result<T>> wait(std::chrono::steady_clock::duration timeout =
                                        std::chrono::steady_clock::duration::zero()) {
        if (timeout > std::chrono::steady_clock::duration::zero()) {
            timer_.expires_after(timeout);
        } else {
            timer_.expires_at(std::chrono::steady_clock::time_point::max());
        }

        while (!value_ && !cancelled_) {
            auto [ec] = co_await timer_.async_wait(use_nothrow);
            if (!ec && !value_ && !cancelled_) {
                armed_ = false;
                co_return Result<T>::error(ErrorCode::Timeout, "completion timed out");
            }
        }

        armed_ = false;
        if (value_) {
            co_return Result<T>::ok(std::move(*std::exchange(value_, std::nullopt)));
        }
        co_return Result<T>::error(ErrorCode::Cancelled, "completion cancelled");
    }

  private:
    asio::steady_timer timer_;
    std::optional<T> value_;
    bool armed_ = false;
    bool cancelled_ = false;
};

} // namespace keepsake::async
