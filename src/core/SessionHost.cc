#include "keepsake/core/SessionHost.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/core/SessionSignals.hh"

#include <utility>

namespace keepsake {

SessionHost::SessionHost(asio::io_context& io, StoreAdapter& remote, StoreAdapter& local, SyncConfig config)
    : io_(io), remote_(remote), local_(local), config_(std::move(config)),
      settled_(std::make_shared<async::Completion<bool>>(io)), alive_(std::make_shared<bool>(true)) {
    // A reload is complete once the new session reaches a decision point.
    auto onSettled = [this](Event&) { settled_->set(true); };
    signals_.addEventListener(signals::kValidSaveFound, onSettled, 100);
    signals_.addEventListener(signals::kFreshStart, onSettled, 100);
    signals_.addEventListener(signals::kSessionFault, onSettled, 100);
}

SessionHost::~SessionHost() {
    shutdown();
    alive_.reset();
}

void SessionHost::login(const std::string& userId) {
    if (session_) {
        KEEPSAKE_SYNC_LOG_WARN("login('{}') while '{}' is logged in, ignored", userId, userId_);
        return;
    }
    shutdown_ = false;
    userId_ = userId;
    build(SessionOptions{});
    session_->identify(userId_);
}

void SessionHost::shutdown() {
    shutdown_ = true;
    pending_.reset();
    settled_->cancel();
    if (session_) {
        session_->stop();
        session_.reset();
    }
}

void SessionHost::build(const SessionOptions& options) {
    session_ = std::make_shared<SessionSync>(io_, remote_, local_, signals_, config_, options);
    session_->setReloadHandler([this](const SessionReload& reload) { onReloadRequested(reload); });
    session_->start();
}

void SessionHost::onReloadRequested(const SessionReload& reload) {
    if (shutdown_) {
        KEEPSAKE_SYNC_LOG_DEBUG("Reload '{}' ignored after shutdown", reload.reason);
        return;
    }
    if (reloading_) {
        KEEPSAKE_SYNC_LOG_DEBUG("Reload '{}' deferred until the current reload settles", reload.reason);
        pending_ = reload;
        return;
    }
    reloading_ = true;

    // The requesting session is still on the call stack; rebuild from a
    // fresh handler. The host may be gone by the time it runs.
    asio::co_spawn(
        io_,
        [this, alive = std::weak_ptr<bool>(alive_), reload]() -> asio::awaitable<void> {
            if (alive.expired()) {
                co_return;
            }
            co_await rebuild(reload, alive);
        },
        async::logOnError("session_reload"));
}

asio::awaitable<void> SessionHost::rebuild(SessionReload reload, std::weak_ptr<bool> alive) {
    KEEPSAKE_SYNC_LOG_INFO("Reloading session for '{}' ({}, restarted={})", userId_, reload.reason,
                           reload.restarted);

    if (session_) {
        session_->stop();
    }
    session_.reset();

    // Held by the frame so a wait outliving the host stays valid
    auto settledChannel = settled_;
    settledChannel->arm();
    build(SessionOptions{reload.restarted});
    session_->identify(userId_);

    auto settled = co_await settledChannel->wait();
    if (alive.expired()) {
        co_return;
    }
    reloading_ = false;
    if (settled.isError() || shutdown_) {
        co_return;
    }

    ++reloadCount_;
    KEEPSAKE_SYNC_LOG_INFO("Session reload #{} settled in state {}", reloadCount_,
                           loadStateToString(session_->loadState()));

    Event event(signals::kSessionReloaded, signals::kSource);
    event.setData<int>(signals::kReloadCount, reloadCount_);
    event.setData<bool>(signals::kRestarted, reload.restarted);
    signals_.dispatchEvent(event);

    if (auto next = std::exchange(pending_, std::nullopt)) {
        onReloadRequested(*next);
    }
}

} // namespace keepsake
