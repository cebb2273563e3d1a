#include "keepsake/core/RestartSequencer.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

RestartSequencer::RestartSequencer(asio::io_context& io, std::chrono::milliseconds deleteTimeout)
    : deleteDone_(io), deleteTimeout_(deleteTimeout) {}

asio::awaitable<Result<void>> RestartSequencer::run(StoreAdapter& store, const std::string& key, ReloadFn reload) {
    if (inProgress_) {
        co_return Result<void>::error(ErrorCode::AlreadyExists, "a restart is already in progress");
    }

    inProgress_ = true;
    deleteSuccess_ = TriState::Unknown;

    KEEPSAKE_SYNC_LOG_INFO("Restart requested, deleting '{}' from {} store", key, store.name());
    deleteDone_.arm();
    store.remove(key);

    auto deleted = co_await deleteDone_.wait(deleteTimeout_);
    inProgress_ = false;

    if (deleted.isError()) {
        KEEPSAKE_SYNC_LOG_WARN("Restart aborted: delete of '{}' did not complete ({})", key,
                               errorCodeToString(deleted.code()));
        co_return Result<void>::error(deleted.code(), "delete did not complete");
    }

    deleteSuccess_ = toTriState(deleted.value());
    if (!deleted.value()) {
        KEEPSAKE_SYNC_LOG_WARN("Restart aborted: delete of '{}' failed, save preserved", key);
        co_return Result<void>::error(ErrorCode::Internal, "delete failed, save preserved");
    }

    reload(SessionReload{true, "restart"});
    co_return Result<void>::ok();
}

bool RestartSequencer::onDeleteOutcome(bool success) {
    return deleteDone_.set(success);
}

void RestartSequencer::cancel() {
    deleteDone_.cancel();
}

} // namespace keepsake
