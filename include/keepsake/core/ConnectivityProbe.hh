#pragma once

#include "keepsake/core/Async.hh"
#include "keepsake/core/StoreAdapter.hh"
#include "keepsake/core/Types.hh"

#include <chrono>
#include <optional>

namespace keepsake {

struct ProbeResult {
    bool reachable = false;
    int attempts = 0;
    // Raw List response of the follow-up index request (reachable only)
    std::optional<BinaryData> index;
};

/// Reachability check run once per session. Issues List up to `maxAttempts`
/// times, sleeping `retryInterval` between failed attempts. The first
/// successful List is followed by a second List whose data is the save
/// index. Exhausting the attempts is a routing answer (reachable = false),
/// not an error; the only error result is ErrorCode::Cancelled.
class ConnectivityProbe {
  public:
    ConnectivityProbe(asio::io_context& io, int maxAttempts, std::chrono::milliseconds retryInterval,
                      std::chrono::milliseconds requestTimeout);

    asio::awaitable<Result<ProbeResult>> run(StoreAdapter& store);

    /// Deliver a List outcome. Returns false when no List was awaited.
    bool onListOutcome(const RequestOutcome& outcome);

    void cancel();

    int attemptsMade() const { return attempts_; }
    int maxAttempts() const { return maxAttempts_; }

  private:
    asio::awaitable<Result<RequestOutcome>> issueList(StoreAdapter& store);

    async::Completion<RequestOutcome> listDone_;
    asio::steady_timer retryTimer_;
    int maxAttempts_;
    std::chrono::milliseconds retryInterval_;
    std::chrono::milliseconds requestTimeout_;
    int attempts_ = 0;
    bool cancelled_ = false;
};

} // namespace keepsake
