#pragma once

#include "keepsake/core/Async.hh"
#include "keepsake/core/Event.hh"
#include "keepsake/core/SessionSync.hh"

#include <memory>
#include <optional>
#include <string>

namespace keepsake {

/// Owns the current SessionSync and rebuilds it when the session asks for a
/// reload (restart, fallback fault, invalid state). The rebuilt session is
/// identified as the same user and carries the restart marker when the
/// reload requested it.
///
/// All sessions share the host's dispatcher, so subscribers survive reloads.
class SessionHost {
  public:
    SessionHost(asio::io_context& io, StoreAdapter& remote, StoreAdapter& local, SyncConfig config);
    ~SessionHost();

    SessionHost(const SessionHost&) = delete;
    SessionHost& operator=(const SessionHost&) = delete;

    /// Build the first session for `userId` and start its load sequence.
    void login(const std::string& userId);

    /// Stop the current session. Pending reloads are abandoned.
    void shutdown();

    EventDispatcher& signals() { return signals_; }

    /// Current session; null before login() and after shutdown().
    std::shared_ptr<SessionSync> session() const { return session_; }

    int reloadCount() const { return reloadCount_; }
    bool reloading() const { return reloading_; }
    const SyncConfig& config() const { return config_; }

  private:
    void build(const SessionOptions& options);
    void onReloadRequested(const SessionReload& reload);
    asio::awaitable<void> rebuild(SessionReload reload, std::weak_ptr<bool> alive);

    asio::io_context& io_;
    StoreAdapter& remote_;
    StoreAdapter& local_;
    SyncConfig config_;
    EventDispatcher signals_;

    std::shared_ptr<SessionSync> session_;
    std::shared_ptr<async::Completion<bool>> settled_;
    // Expires with the host; spawned rebuilds check it before touching members
    std::shared_ptr<bool> alive_;
    std::string userId_;
    std::optional<SessionReload> pending_;
    int reloadCount_ = 0;
    bool reloading_ = false;
    bool shutdown_ = false;
};

} // namespace keepsake
