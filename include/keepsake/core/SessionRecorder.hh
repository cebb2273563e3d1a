#pragma once

#include "keepsake/core/SessionClock.hh"
#include "keepsake/core/SessionHost.hh"
#include "keepsake/core/SessionPayload.hh"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace keepsake {

/// Feeds application state into the current session's payload and decides
/// when it is written.
///
/// Saving is gated by canSave: it opens once the session settles on a fresh
/// start or a confirmed resume, and closes while a reload is in progress.
/// Each record call updates the payload; a save is queued only while the
/// gate is open, after the clock's elapsed time is copied into the payload.
class SessionRecorder {
  public:
    explicit SessionRecorder(SessionHost& host);
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder&) = delete;
    SessionRecorder& operator=(const SessionRecorder&) = delete;

    /// Mark the payload as written by the running application version.
    bool stampVersion();

    // Each returns true when a save was queued.
    bool recordInspections(std::vector<InspectionRecord> inspections);
    bool recordActivity(std::vector<ActivityEntry> entries);
    bool recordPhotos(StringMap<std::string> photoTimestamps);
    bool recordLastLocation(const std::string& location);
    bool setFlag(const std::string& name, bool value);
    bool setSetting(const std::string& name, double value);

    /// Queue a save when canSave allows it.
    bool triggerSave();

    /// Save every `intervalSeconds` of ticked time while canSave holds.
    void enableAutosave(float intervalSeconds = 300.0f);
    void disableAutosave();
    bool autosaveEnabled() const { return autosaveEnabled_; }

    /// Advance the session clock and the autosave timer. Returns true when
    /// an autosave was queued.
    bool tick(float dt);

    void setCanSave(bool canSave) { canSave_ = canSave; }
    bool canSave() const { return canSave_; }
    bool* canSaveRef() { return &canSave_; }

    SessionClock& clock() { return clock_; }
    const SessionClock& clock() const { return clock_; }
    uint64_t autosaveCount() const { return autosaveCount_; }

  private:
    SessionPayload* payload();

    SessionHost& host_;
    SessionClock clock_;
    std::vector<std::pair<std::string, std::string>> listenerIds_;

    bool canSave_ = false;
    bool autosaveEnabled_ = false;
    float autosaveInterval_ = 300.0f;
    float autosaveTimer_ = 0.0f;
    uint64_t autosaveCount_ = 0;
};

} // namespace keepsake
