#include "keepsake/core/WriteQueue.hh"
#include "keepsake/core/Log.hh"

#include <exception>

namespace keepsake {

WriteQueue::WriteQueue(asio::io_context& io, std::chrono::milliseconds timeout)
    : wake_(io), done_(io), timeout_(timeout) {}

bool WriteQueue::enqueue(PendingWrite write) {
    if (!enabled_ || stopped_) {
        ++dropped_;
        KEEPSAKE_SYNC_LOG_WARN("Write queue disabled, dropping '{}'", write.label);
        return false;
    }

    KEEPSAKE_SYNC_LOG_DEBUG("Queued '{}' ({} ahead)", write.label, queue_.size() + (inFlight_ ? 1 : 0));
    queue_.push_back(std::move(write));
    wake_.cancel();
    return true;
}

bool WriteQueue::complete(bool success) {
    if (!done_.set(success)) {
        KEEPSAKE_SYNC_LOG_WARN("Save outcome ({}) with no write in flight ignored", success);
        return false;
    }
    return true;
}

void WriteQueue::setEnabled(bool enabled) {
    enabled_ = enabled;
}

void WriteQueue::setFinishedHandler(FinishedHandler handler) {
    finished_ = std::move(handler);
}

asio::awaitable<void> WriteQueue::run() {
    running_ = true;

    while (!stopped_) {
        if (queue_.empty()) {
            wake_.expires_at(std::chrono::steady_clock::time_point::max());
            co_await wake_.async_wait(async::use_nothrow);
            continue;
        }

        PendingWrite write = std::move(queue_.front());
        queue_.pop_front();

        inFlight_ = true;
        done_.arm();
        try {
            write.invoke();
        } catch (const std::exception& e) {
            done_.disarm();
            inFlight_ = false;
            KEEPSAKE_SYNC_LOG_ERROR("'{}' could not be issued: {}", write.label, e.what());
            record(WriteResult{write.label, ErrorCode::Internal});
            continue;
        }

        auto outcome = co_await done_.wait(timeout_);
        inFlight_ = false;

        if (outcome.isError() && outcome.code() == ErrorCode::Cancelled) {
            break;
        }

        WriteResult result{write.label, ErrorCode::Ok};
        if (outcome.isError()) {
            result.code = outcome.code();
            KEEPSAKE_SYNC_LOG_WARN("'{}' abandoned after {} ms without an outcome", write.label, timeout_.count());
        } else if (!outcome.value()) {
            result.code = ErrorCode::Internal;
            KEEPSAKE_SYNC_LOG_WARN("'{}' failed; not retried", write.label);
        }
        record(result);
    }

    running_ = false;
}

void WriteQueue::record(const WriteResult& result) {
    if (result.succeeded()) {
        ++succeeded_;
    } else {
        ++failed_;
    }
    lastResult_ = result;

    if (finished_) {
        finished_(result);
    }
}

void WriteQueue::stop() {
    stopped_ = true;
    if (!queue_.empty()) {
        KEEPSAKE_SYNC_LOG_WARN("Write queue stopped with {} pending writes", queue_.size());
        dropped_ += queue_.size();
        queue_.clear();
    }
    wake_.cancel();
    done_.cancel();
}

} // namespace keepsake
