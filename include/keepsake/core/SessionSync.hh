#pragma once

#include "keepsake/core/Async.hh"
#include "keepsake/core/ConnectivityProbe.hh"
#include "keepsake/core/Event.hh"
#include "keepsake/core/LoadOutcome.hh"
#include "keepsake/core/RestartSequencer.hh"
#include "keepsake/core/SessionPayload.hh"
#include "keepsake/core/StoreAdapter.hh"
#include "keepsake/core/SyncConfig.hh"
#include "keepsake/core/Types.hh"
#include "keepsake/core/WriteQueue.hh"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace keepsake {

struct SessionOptions {
    // Restart marker handed over by the session that requested the reload.
    // Consumed by the first probe; never persisted.
    bool restarted = false;
};

struct SessionFlags {
    TriState probeSuccess = TriState::Unknown;
    TriState loadSuccess = TriState::Unknown;
    TriState deleteSuccess = TriState::Unknown;
    bool alreadyLoaded = false;
};

/// Save/load synchronization for one user session.
///
/// Owns the payload, the write queue, the connectivity probe, the load
/// outcome machine and the restart sequencer. Both store adapters report
/// into a single router that dispatches on RequestOutcome::action.
///
/// Lifetime: create with std::make_shared, call start(), then identify().
/// Spawned coroutines hold a reference to the session, so stop() must be
/// called before the last external reference is dropped.
class SessionSync : public std::enable_shared_from_this<SessionSync> {
  public:
    using ReloadHandler = std::function<void(const SessionReload&)>;

    SessionSync(asio::io_context& io, StoreAdapter& remote, StoreAdapter& local, EventDispatcher& signals,
                SyncConfig config, SessionOptions options = {});
    ~SessionSync();

    SessionSync(const SessionSync&) = delete;
    SessionSync& operator=(const SessionSync&) = delete;

    /// Attach to both adapters and start the write loop.
    void start();

    /// Cancel every pending wait, abandon queued writes and detach from
    /// the adapters. Idempotent.
    void stop();

    /// Bind the session to a user and begin the probe / load sequence.
    void identify(const std::string& userId);

    /// Queue a save of the current payload. Returns false when saving is
    /// disabled or no user is identified.
    bool requestSave();

    /// Accept the valid save found at startup.
    bool confirmResume();

    /// Delete the save and, once the delete is confirmed, reload with the
    /// restart marker. A refused restart emits restart_denied.
    void restartSession();

    // Manual store requests (developer console)
    bool requestLoad();
    bool requestDelete();
    bool requestList();

    void setSavingEnabled(bool enabled);
    bool savingEnabled() const { return writes_.enabled(); }

    void setReloadHandler(ReloadHandler handler);

    SessionPayload& payload() { return *payload_; }
    const SessionPayload& payload() const { return *payload_; }

    const SessionFlags& flags() const { return flags_; }
    LoadState loadState() const { return outcome_.state(); }
    bool settled() const { return outcome_.settled(); }
    const WriteQueue& writeQueue() const { return writes_; }
    const ConnectivityProbe& probe() const { return probe_; }
    const SyncConfig& config() const { return config_; }

    const std::string& userId() const { return userId_; }
    const std::string& sessionKey() const { return key_; }
    bool usingFallback() const { return active_ == &local_; }
    StoreAdapter& activeStore() { return *active_; }
    bool restartMarkerPending() const { return options_.restarted; }
    bool stopped() const { return stopped_; }

  private:
    asio::awaitable<void> probeAndSync();
    asio::awaitable<void> runRestart();

    void handleRequestComplete(const RequestOutcome& outcome);
    void handleLoadComplete(const RequestOutcome& outcome);
    void handleDeleteComplete(const RequestOutcome& outcome);
    void handleWriteFinished(const WriteResult& result);

    void issueLoad();
    void deleteStaleSave();
    void resetPayload();
    void failInvalidState(const std::string& message);
    void requestReload(const SessionReload& reload);
    void emit(const char* type);
    void emit(const char* type, bool success);

    asio::io_context& io_;
    StoreAdapter& remote_;
    StoreAdapter& local_;
    StoreAdapter* active_;
    EventDispatcher& signals_;
    SyncConfig config_;
    SessionOptions options_;

    std::shared_ptr<SessionPayload> payload_;
    std::optional<SessionPayload> loaded_;
    WriteQueue writes_;
    ConnectivityProbe probe_;
    LoadOutcome outcome_;
    RestartSequencer restart_;
    asio::steady_timer settleTimer_;

    SessionFlags flags_;
    ReloadHandler reloadHandler_;
    std::string userId_;
    std::string key_;
    uint64_t saveCounter_ = 0;
    // Stale-save and console deletes whose outcome has not arrived yet
    int otherDeletesPending_ = 0;
    bool started_ = false;
    bool stopped_ = false;
    bool reloadRequested_ = false;
};

} // namespace keepsake
