#pragma once

#include "keepsake/core/Async.hh"
#include "keepsake/utils/ErrorHandling.hh"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace keepsake {

/// One queued save attempt. `invoke` issues the store Save; the store's
/// completion must later be reported through WriteQueue::complete().
struct PendingWrite {
    std::string label;
    std::function<void()> invoke;
};

struct WriteResult {
    std::string label;
    ErrorCode code = ErrorCode::Ok; // Ok, Internal (store reported failure) or Timeout

    bool succeeded() const { return code == ErrorCode::Ok; }
};

/// FIFO of save attempts with at most one in flight.
///
/// run() is the processing loop: it takes the oldest write, invokes it and
/// suspends until complete() reports the outcome (or the optional timeout
/// elapses), then moves on. Failed writes are recorded, never retried. A
/// write whose invoke throws is recorded as failed without waiting.
///
/// With a non-zero timeout, a write that times out is abandoned. A store
/// outcome arriving after that is credited to whichever write is in flight
/// at that moment, so the timeout must stay above the store's worst latency.
class WriteQueue {
  public:
    using FinishedHandler = std::function<void(const WriteResult&)>;

    WriteQueue(asio::io_context& io, std::chrono::milliseconds timeout);

    /// Append a write. Returns false (write dropped) while disabled.
    bool enqueue(PendingWrite write);

    /// Store outcome for the write in flight. Returns false when no write
    /// was waiting for it.
    bool complete(bool success);

    void setEnabled(bool enabled);
    bool enabled() const { return enabled_; }

    void setFinishedHandler(FinishedHandler handler);

    asio::awaitable<void> run();

    /// Ends run() and abandons pending writes.
    void stop();

    size_t pending() const { return queue_.size(); }
    bool inFlight() const { return inFlight_; }
    bool running() const { return running_; }
    uint64_t succeededCount() const { return succeeded_; }
    uint64_t failedCount() const { return failed_; }
    uint64_t droppedCount() const { return dropped_; }
    const std::optional<WriteResult>& lastResult() const { return lastResult_; }

  private:
    void record(const WriteResult& result);

    std::deque<PendingWrite> queue_;
    asio::steady_timer wake_;
    async::Completion<bool> done_;
    std::chrono::milliseconds timeout_;
    FinishedHandler finished_;

    bool enabled_ = true;
    bool inFlight_ = false;
    bool running_ = false;
    bool stopped_ = false;
    uint64_t succeeded_ = 0;
    uint64_t failed_ = 0;
    uint64_t dropped_ = 0;
    std::optional<WriteResult> lastResult_;
};

} // namespace keepsake
