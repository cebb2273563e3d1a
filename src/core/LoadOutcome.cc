#include "keepsake/core/LoadOutcome.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/core/SessionSignals.hh"

namespace keepsake {

std::string loadStateToString(LoadState state) {
    switch (state) {
        case LoadState::Idle:
            return "Idle";
        case LoadState::Probing:
            return "Probing";
        case LoadState::Exists:
            return "Exists";
        case LoadState::NotExists:
            return "NotExists";
        case LoadState::Loading:
            return "Loading";
        case LoadState::LoadSucceeded:
            return "LoadSucceeded";
        case LoadState::LoadFailed:
            return "LoadFailed";
        case LoadState::VersionValid:
            return "VersionValid";
        case LoadState::VersionInvalid:
            return "VersionInvalid";
        case LoadState::Resuming:
            return "Resuming";
        case LoadState::FreshStart:
            return "FreshStart";
        case LoadState::Faulted:
            return "Faulted";
        default:
            return "Unknown";
    }
}

LoadOutcome::LoadOutcome(EventDispatcher& signals, VersionGate gate)
    : signals_(signals), gate_(std::move(gate)), machine_(LoadState::Idle, loadStateToString) {
    machine_.addTransition(LoadState::Idle, LoadState::Probing);

    machine_.addTransition(LoadState::Probing, LoadState::Exists);
    machine_.addTransition(LoadState::Probing, LoadState::NotExists);
    machine_.addTransition(LoadState::Probing, LoadState::Loading);
    machine_.addTransition(LoadState::Probing, LoadState::FreshStart);
    machine_.addTransition(LoadState::Probing, LoadState::Faulted);

    machine_.addTransition(LoadState::Exists, LoadState::Loading);
    machine_.addTransition(LoadState::NotExists, LoadState::FreshStart);

    machine_.addTransition(LoadState::Loading, LoadState::LoadSucceeded);
    machine_.addTransition(LoadState::Loading, LoadState::LoadFailed);

    machine_.addTransition(LoadState::LoadFailed, LoadState::FreshStart);
    machine_.addTransition(LoadState::LoadFailed, LoadState::Faulted);

    machine_.addTransition(LoadState::LoadSucceeded, LoadState::VersionValid);
    machine_.addTransition(LoadState::LoadSucceeded, LoadState::VersionInvalid);

    machine_.addTransition(LoadState::VersionInvalid, LoadState::FreshStart);
    machine_.addTransition(LoadState::VersionValid, LoadState::Resuming);
}

bool LoadOutcome::advance(LoadState to) {
    if (!machine_.canTransitionTo(to)) {
        KEEPSAKE_SYNC_LOG_ERROR("Load outcome refused {} -> {}", machine_.stateName(), loadStateToString(to));
        return false;
    }
    machine_.setState(to);
    return true;
}

void LoadOutcome::emit(const char* type, bool success) {
    Event event(type, signals::kSource);
    event.setData<bool>(signals::kSuccess, success);
    signals_.dispatchEvent(event);
}

bool LoadOutcome::beginProbe() {
    return advance(LoadState::Probing);
}

bool LoadOutcome::onIndex(bool exists) {
    if (exists) {
        return advance(LoadState::Exists) && advance(LoadState::Loading);
    }

    KEEPSAKE_SYNC_LOG_INFO("No save in the index, starting fresh");
    if (advance(LoadState::NotExists)) {
        startFresh(false);
    }
    return false;
}

bool LoadOutcome::beginFallbackLoad() {
    return advance(LoadState::Loading);
}

LoadVerdict LoadOutcome::onLoaded(const std::optional<SessionPayload>& payload, bool fallback) {
    if (!payload) {
        advance(LoadState::LoadFailed);
        return fallback ? LoadVerdict::Fault : LoadVerdict::DeleteAndStartFresh;
    }

    advance(LoadState::LoadSucceeded);

    if (!gate_.isValid(*payload)) {
        KEEPSAKE_SYNC_LOG_INFO("Save version '{}' does not match application version '{}'", payload->version,
                               gate_.appVersion());
        advance(LoadState::VersionInvalid);
        return LoadVerdict::DeleteAndStartFresh;
    }

    advance(LoadState::VersionValid);
    emit(signals::kValidSaveFound, true);
    return LoadVerdict::AwaitResumeChoice;
}

bool LoadOutcome::startFresh(bool restarted) {
    if (!advance(LoadState::FreshStart)) {
        return false;
    }
    Event event(signals::kFreshStart, signals::kSource);
    event.setData<bool>(signals::kRestarted, restarted);
    signals_.dispatchEvent(event);
    return true;
}

bool LoadOutcome::confirmResume() {
    if (!advance(LoadState::Resuming)) {
        return false;
    }
    emit(signals::kResumeConfirmed, true);
    return true;
}

bool LoadOutcome::fault(ErrorCode code, const std::string& message) {
    if (!advance(LoadState::Faulted)) {
        return false;
    }
    KEEPSAKE_SYNC_LOG_ERROR("Session fault ({}): {}", errorCodeToString(code), message);

    Event event(signals::kSessionFault, signals::kSource);
    event.setData<std::string>(signals::kCode, std::string(errorCodeToString(code)));
    event.setData<std::string>(signals::kMessage, message);
    signals_.dispatchEvent(event);
    return true;
}

bool LoadOutcome::settled() const {
    auto s = state();
    return s == LoadState::VersionValid || terminal();
}

bool LoadOutcome::terminal() const {
    auto s = state();
    return s == LoadState::Resuming || s == LoadState::FreshStart || s == LoadState::Faulted;
}

} // namespace keepsake
