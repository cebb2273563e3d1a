#pragma once

#include "keepsake/core/Async.hh"
#include "keepsake/core/StoreAdapter.hh"
#include "keepsake/core/Types.hh"

#include <chrono>
#include <functional>
#include <string>

namespace keepsake {

/// Request to tear the session down and build a new one. `restarted` is the
/// restart marker: the next session skips the resume prompt.
struct SessionReload {
    bool restarted = false;
    std::string reason;
};

/// Deletes the session's save and, only once the store confirms the delete,
/// requests a reload carrying the restart marker. A failed (or timed out)
/// delete aborts the restart and leaves the save where it was.
class RestartSequencer {
  public:
    using ReloadFn = std::function<void(const SessionReload&)>;

    RestartSequencer(asio::io_context& io, std::chrono::milliseconds deleteTimeout);

    /// Returns Ok after the reload was requested; otherwise the reason the
    /// restart was refused (AlreadyExists when one is already running).
    asio::awaitable<Result<void>> run(StoreAdapter& store, const std::string& key, ReloadFn reload);

    /// Deliver a Delete outcome. Returns false when no delete was awaited.
    bool onDeleteOutcome(bool success);

    void cancel();

    bool inProgress() const { return inProgress_; }
    TriState deleteSuccess() const { return deleteSuccess_; }

  private:
    async::Completion<bool> deleteDone_;
    std::chrono::milliseconds deleteTimeout_;
    TriState deleteSuccess_ = TriState::Unknown;
    bool inProgress_ = false;
};

} // namespace keepsake
