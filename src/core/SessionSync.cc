#include "keepsake/core/SessionSync.hh"
#include "keepsake/core/ListIndex.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/core/SessionSignals.hh"

#include <string_view>
#include <utility>

namespace keepsake {

SessionSync::SessionSync(asio::io_context& io, StoreAdapter& remote, StoreAdapter& local, EventDispatcher& signals,
                         SyncConfig config, SessionOptions options)
    : io_(io),
      remote_(remote),
      local_(local),
      active_(&remote),
      signals_(signals),
      config_(std::move(config)),
      options_(options),
      payload_(std::make_shared<SessionPayload>()),
      writes_(io, config_.saveTimeout),
      probe_(io, config_.probeMaxAttempts, config_.probeRetryInterval, config_.probeRequestTimeout),
      outcome_(signals, VersionGate(config_.appVersion, config_.acceptUnversioned)),
      restart_(io, config_.deleteTimeout),
      settleTimer_(io) {
    writes_.setFinishedHandler([this](const WriteResult& result) { handleWriteFinished(result); });
    outcome_.machine().addHook(LoadState::FreshStart, [this]() { resetPayload(); });
    outcome_.machine().addHook(LoadState::VersionValid, [this]() {
        if (loaded_) {
            *payload_ = std::move(*loaded_);
            loaded_.reset();
        }
    });
}

SessionSync::~SessionSync() {
    if (started_ && !stopped_) {
        KEEPSAKE_SYNC_LOG_WARN("Session for '{}' destroyed without stop()", userId_);
    }
}

void SessionSync::start() {
    if (started_) {
        return;
    }
    started_ = true;

    std::weak_ptr<SessionSync> weak = weak_from_this();
    auto router = [weak](const RequestOutcome& outcome) {
        if (auto self = weak.lock()) {
            self->handleRequestComplete(outcome);
        }
    };
    remote_.setCompletionHandler(router);
    local_.setCompletionHandler(router);

    asio::co_spawn(
        io_, [self = shared_from_this()]() { return self->writes_.run(); }, async::logOnError("write_queue"));
}

void SessionSync::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    remote_.setCompletionHandler(nullptr);
    local_.setCompletionHandler(nullptr);

    writes_.stop();
    probe_.cancel();
    restart_.cancel();
    settleTimer_.cancel();
    KEEPSAKE_SYNC_LOG_DEBUG("Session for '{}' stopped in state {}", userId_, loadStateToString(outcome_.state()));
}

void SessionSync::identify(const std::string& userId) {
    if (!started_ || stopped_) {
        KEEPSAKE_SYNC_LOG_ERROR("identify('{}') on a session that is not running", userId);
        return;
    }
    if (!userId_.empty()) {
        KEEPSAKE_SYNC_LOG_WARN("Session already identified as '{}', ignoring '{}'", userId_, userId);
        return;
    }

    userId_ = userId;
    key_ = config_.sessionKey(userId);
    KEEPSAKE_SYNC_LOG_INFO("Session started for '{}' (key '{}')", userId_, key_);

    Event started(signals::kSessionStarted, signals::kSource);
    started.setData<std::string>(signals::kUserId, userId_);
    signals_.dispatchEvent(started);

    asio::co_spawn(
        io_, [self = shared_from_this()]() { return self->probeAndSync(); }, async::logOnError("probe_and_sync"));
}

asio::awaitable<void> SessionSync::probeAndSync() {
    if (!outcome_.beginProbe()) {
        co_return;
    }

    auto probed = co_await probe_.run(remote_);
    if (probed.isError() || stopped_) {
        co_return;
    }

    const ProbeResult& result = probed.value();
    flags_.probeSuccess = toTriState(result.reachable);
    if (!result.reachable) {
        active_ = &local_;
        KEEPSAKE_SYNC_LOG_WARN("Falling back to the {} store", local_.name());
    }

    if (std::exchange(options_.restarted, false)) {
        KEEPSAKE_SYNC_LOG_INFO("Restart marker consumed, starting fresh on the {} store", active_->name());
        if (!co_await async::sleepFor(settleTimer_, config_.restartSettleDelay) || stopped_) {
            co_return;
        }
        outcome_.startFresh(true);
        co_return;
    }

    if (!result.reachable) {
        if (flags_.alreadyLoaded) {
            failInvalidState("load completion already processed before the fallback load");
            co_return;
        }
        if (outcome_.beginFallbackLoad()) {
            issueLoad();
        }
        co_return;
    }

    const BinaryData& index = result.index.value();
    std::string_view text(reinterpret_cast<const char*>(index.data()), index.size());
    bool exists = listContainsKey(text, key_);
    KEEPSAKE_SYNC_LOG_DEBUG("Index lookup for '{}': {}", key_, exists ? "found" : "absent");

    if (exists && flags_.alreadyLoaded) {
        failInvalidState("load completion already processed before the load was issued");
        co_return;
    }
    if (outcome_.onIndex(exists)) {
        issueLoad();
    }
}

void SessionSync::issueLoad() {
    KEEPSAKE_SYNC_LOG_INFO("Loading '{}' from the {} store", key_, active_->name());
    active_->load(key_);
}

void SessionSync::handleRequestComplete(const RequestOutcome& outcome) {
    if (stopped_) {
        return;
    }

    KEEPSAKE_SYNC_LOG_DEBUG("{} completed: {}", storeActionToString(outcome.action), outcome.success);

    switch (outcome.action) {
        case StoreAction::List:
            if (!probe_.onListOutcome(outcome)) {
                KEEPSAKE_SYNC_LOG_DEBUG("List outcome outside the probe ({} bytes)",
                                        outcome.data ? outcome.data->size() : 0);
            }
            break;
        case StoreAction::Save:
            writes_.complete(outcome.success);
            break;
        case StoreAction::Load:
            handleLoadComplete(outcome);
            break;
        case StoreAction::Delete:
            handleDeleteComplete(outcome);
            break;
    }
}

void SessionSync::handleLoadComplete(const RequestOutcome& outcome) {
    // Only the first Load completion of a session is honored; console loads
    // and duplicates after it produce no transition and no signal.
    if (flags_.alreadyLoaded) {
        KEEPSAKE_SYNC_LOG_WARN("Load completion after the first one ignored ({})", outcome.success);
        return;
    }
    flags_.alreadyLoaded = true;
    flags_.loadSuccess = toTriState(outcome.success);
    emit(signals::kLoadCompleted, outcome.success);

    if (outcome_.state() != LoadState::Loading) {
        KEEPSAKE_SYNC_LOG_WARN("Load completion arrived in state {} with no load issued",
                               loadStateToString(outcome_.state()));
        return;
    }

    loaded_.reset();
    if (outcome.success) {
        auto decoded = SessionPayload::deserialize(outcome.data.value_or(BinaryData{}));
        if (decoded.isOk()) {
            loaded_ = std::move(decoded.value());
        } else {
            KEEPSAKE_SYNC_LOG_WARN("Save '{}' is corrupted: {}", key_, decoded.message());
        }
    }

    bool fallback = usingFallback();
    // Entering VersionValid moves the decoded payload in before
    // valid_save_found is emitted.
    switch (outcome_.onLoaded(loaded_, fallback)) {
        case LoadVerdict::AwaitResumeChoice:
            KEEPSAKE_SYNC_LOG_INFO("Valid save found for '{}' (version '{}')", userId_, payload_->version);
            break;
        case LoadVerdict::DeleteAndStartFresh:
            loaded_.reset();
            deleteStaleSave();
            outcome_.startFresh(false);
            break;
        case LoadVerdict::Fault:
            outcome_.fault(ErrorCode::Internal, "load from the " + local_.name() + " store failed");
            requestReload(SessionReload{false, "fallback load failed"});
            break;
    }
}

void SessionSync::handleDeleteComplete(const RequestOutcome& outcome) {
    flags_.deleteSuccess = toTriState(outcome.success);
    emit(signals::kDeleteCompleted, outcome.success);

    // Deletes share one channel; outcomes owed to earlier deletes come first
    if (otherDeletesPending_ > 0) {
        --otherDeletesPending_;
        return;
    }
    restart_.onDeleteOutcome(outcome.success);
}

void SessionSync::handleWriteFinished(const WriteResult& result) {
    emit(signals::kSaveCompleted, result.succeeded());
}

bool SessionSync::requestSave() {
    if (key_.empty()) {
        KEEPSAKE_SYNC_LOG_WARN("Save requested before a user was identified");
        return false;
    }
    if (stopped_ || !writes_.enabled()) {
        KEEPSAKE_SYNC_LOG_DEBUG("Saving disabled, save request dropped");
        return false;
    }

    emit(signals::kSaveStarted);

    // The payload is serialized when the write reaches the front of the
    // queue, so it carries every change made while it waited.
    std::string label = "save#" + std::to_string(++saveCounter_);
    return writes_.enqueue(PendingWrite{label, [this, payload = payload_]() {
                                            active_->save(key_, payload->serialize());
                                        }});
}

bool SessionSync::confirmResume() {
    return outcome_.confirmResume();
}

void SessionSync::restartSession() {
    if (stopped_) {
        return;
    }
    asio::co_spawn(
        io_, [self = shared_from_this()]() { return self->runRestart(); }, async::logOnError("restart"));
}

asio::awaitable<void> SessionSync::runRestart() {
    if (key_.empty()) {
        Event denied(signals::kRestartDenied, signals::kSource);
        denied.setData<std::string>(signals::kMessage, "no session identified");
        signals_.dispatchEvent(denied);
        co_return;
    }

    auto result = co_await restart_.run(*active_, key_, [this](const SessionReload& reload) { requestReload(reload); });
    if (result.isError() && !stopped_) {
        Event denied(signals::kRestartDenied, signals::kSource);
        denied.setData<std::string>(signals::kMessage, result.message());
        signals_.dispatchEvent(denied);
    }
}

bool SessionSync::requestLoad() {
    if (key_.empty() || stopped_) {
        return false;
    }
    active_->load(key_);
    return true;
}

bool SessionSync::requestDelete() {
    if (key_.empty() || stopped_) {
        return false;
    }
    ++otherDeletesPending_;
    active_->remove(key_);
    return true;
}

bool SessionSync::requestList() {
    if (stopped_) {
        return false;
    }
    active_->list();
    return true;
}

void SessionSync::setSavingEnabled(bool enabled) {
    writes_.setEnabled(enabled);
}

void SessionSync::setReloadHandler(ReloadHandler handler) {
    reloadHandler_ = std::move(handler);
}

void SessionSync::deleteStaleSave() {
    KEEPSAKE_SYNC_LOG_INFO("Deleting unusable save '{}' from the {} store", key_, active_->name());
    ++otherDeletesPending_;
    active_->remove(key_);
}

void SessionSync::resetPayload() {
    *payload_ = SessionPayload{};
    payload_->version = config_.appVersion;
}

void SessionSync::failInvalidState(const std::string& message) {
    outcome_.fault(ErrorCode::InvalidState, message);
    requestReload(SessionReload{false, "invalid state"});
}

void SessionSync::requestReload(const SessionReload& reload) {
    if (reloadRequested_) {
        KEEPSAKE_SYNC_LOG_DEBUG("Reload already requested, ignoring '{}'", reload.reason);
        return;
    }
    reloadRequested_ = true;

    KEEPSAKE_SYNC_LOG_INFO("Requesting session reload ({}, restarted={})", reload.reason, reload.restarted);

    Event event(signals::kSessionReload, signals::kSource);
    event.setData<bool>(signals::kRestarted, reload.restarted);
    event.setData<std::string>(signals::kReason, reload.reason);
    signals_.dispatchEvent(event);

    if (reloadHandler_) {
        reloadHandler_(reload);
    } else {
        KEEPSAKE_SYNC_LOG_WARN("No reload handler attached; reload '{}' not performed", reload.reason);
    }
}

void SessionSync::emit(const char* type) {
    Event event(type, signals::kSource);
    signals_.dispatchEvent(event);
}

void SessionSync::emit(const char* type, bool success) {
    Event event(type, signals::kSource);
    event.setData<bool>(signals::kSuccess, success);
    signals_.dispatchEvent(event);
}

} // namespace keepsake
