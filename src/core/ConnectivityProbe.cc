#include "keepsake/core/ConnectivityProbe.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

ConnectivityProbe::ConnectivityProbe(asio::io_context& io, int maxAttempts, std::chrono::milliseconds retryInterval,
                                     std::chrono::milliseconds requestTimeout)
    : listDone_(io), retryTimer_(io), maxAttempts_(maxAttempts), retryInterval_(retryInterval),
      requestTimeout_(requestTimeout) {}

asio::awaitable<Result<RequestOutcome>> ConnectivityProbe::issueList(StoreAdapter& store) {
    listDone_.arm();
    store.list();
    co_return co_await listDone_.wait(requestTimeout_);
}

asio::awaitable<Result<ProbeResult>> ConnectivityProbe::run(StoreAdapter& store) {
    attempts_ = 0;

    while (attempts_ < maxAttempts_) {
        ++attempts_;
        auto reach = co_await issueList(store);
        if (cancelled_) {
            co_return Result<ProbeResult>::error(ErrorCode::Cancelled, "probe cancelled");
        }

        if (reach.isOk() && reach.value().success) {
            KEEPSAKE_SYNC_LOG_INFO("{} store reachable after {} attempt(s)", store.name(), attempts_);

            auto index = co_await issueList(store);
            if (cancelled_) {
                co_return Result<ProbeResult>::error(ErrorCode::Cancelled, "probe cancelled");
            }
            if (index.isError() || !index.value().success) {
                KEEPSAKE_SYNC_LOG_WARN("{} store reachable but the save index request failed", store.name());
                co_return Result<ProbeResult>::ok(ProbeResult{false, attempts_, std::nullopt});
            }
            co_return Result<ProbeResult>::ok(ProbeResult{true, attempts_, index.value().data.value_or(BinaryData{})});
        }

        KEEPSAKE_SYNC_LOG_WARN("Probe attempt {}/{} against {} store failed{}", attempts_, maxAttempts_, store.name(),
                               reach.isError() ? std::string(" (") + std::string(errorCodeToString(reach.code())) + ")"
                                               : std::string());

        if (attempts_ < maxAttempts_) {
            if (!co_await async::sleepFor(retryTimer_, retryInterval_) || cancelled_) {
                co_return Result<ProbeResult>::error(ErrorCode::Cancelled, "probe cancelled");
            }
        }
    }

    KEEPSAKE_SYNC_LOG_WARN("{} store unreachable after {} attempts", store.name(), attempts_);
    co_return Result<ProbeResult>::ok(ProbeResult{false, attempts_, std::nullopt});
}

bool ConnectivityProbe::onListOutcome(const RequestOutcome& outcome) {
    return listDone_.set(outcome);
}

void ConnectivityProbe::cancel() {
    cancelled_ = true;
    listDone_.cancel();
    retryTimer_.cancel();
}

} // namespace keepsake
