#pragma once

#include "keepsake/core/Event.hh"
#include "keepsake/core/SessionPayload.hh"
#include "keepsake/core/StateMachine.hh"
#include "keepsake/core/VersionGate.hh"

#include <string>

namespace keepsake {

enum class LoadState {
    Idle,
    Probing,
    Exists,
    NotExists,
    Loading,
    LoadSucceeded,
    LoadFailed,
    VersionValid,
    VersionInvalid,
    Resuming,
    FreshStart,
    Faulted
};

std::string loadStateToString(LoadState state);

/// What the engine must do after a Load completion has been classified.
enum class LoadVerdict {
    AwaitResumeChoice,   // valid save found; the user decides
    DeleteAndStartFresh, // corrupted or incompatible save
    Fault                // fallback load failed; the session cannot continue
};

/// Session-start decision: resume an existing save, start fresh, or fault.
///
///   Idle -> Probing -> NotExists -> FreshStart
///                   -> Exists -> Loading -> LoadFailed -> FreshStart | Faulted
///                   -> Loading (local fallback)
///                                        -> LoadSucceeded -> VersionInvalid -> FreshStart
///                                                         -> VersionValid -> Resuming
///                   -> FreshStart (restart marker) | Faulted (invalid state)
///
/// Each step emits its signal through the dispatcher. Resuming, FreshStart
/// and Faulted are terminal: at most one of them is reached per session, and
/// later requests to reach another are refused (returning false) rather than
/// thrown, since they arrive from asynchronous completion paths.
class LoadOutcome {
  public:
    LoadOutcome(EventDispatcher& signals, VersionGate gate);

    bool beginProbe();

    /// Record the index lookup. Returns true when a Load must be issued.
    bool onIndex(bool exists);

    bool beginFallbackLoad();

    /// Classify a Load completion. `payload` is empty when the store failed
    /// or the bytes did not decode. `fallback` marks the local-fallback path.
    LoadVerdict onLoaded(const std::optional<SessionPayload>& payload, bool fallback);

    bool startFresh(bool restarted);
    bool confirmResume();
    bool fault(ErrorCode code, const std::string& message);

    LoadState state() const { return machine_.getState(); }

    /// Reached a point where the host can hand control to the user
    /// (VersionValid) or a terminal state.
    bool settled() const;
    bool terminal() const;

    const VersionGate& versionGate() const { return gate_; }
    StateMachine<LoadState>& machine() { return machine_; }

  private:
    bool advance(LoadState to);
    void emit(const char* type, bool success);

    EventDispatcher& signals_;
    VersionGate gate_;
    StateMachine<LoadState> machine_;
};

} // namespace keepsake
