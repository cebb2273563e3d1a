#include "keepsake/core/SessionRecorder.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/core/SessionSignals.hh"

#include <algorithm>

namespace keepsake {

SessionRecorder::SessionRecorder(SessionHost& host) : host_(host) {
    auto& dispatcher = host_.signals();

    listenerIds_.emplace_back(signals::kFreshStart, dispatcher.addEventListener(signals::kFreshStart, [this](Event&) {
                                  clock_.reset();
                                  canSave_ = true;
                              }));

    listenerIds_.emplace_back(signals::kResumeConfirmed,
                              dispatcher.addEventListener(signals::kResumeConfirmed, [this](Event&) {
                                  if (auto* data = payload()) {
                                      clock_.reset(data->elapsed);
                                      KEEPSAKE_LOG_DEBUG("Session clock restored to {} ms", data->elapsed.count());
                                  }
                                  canSave_ = true;
                              }));

    listenerIds_.emplace_back(signals::kSessionReload,
                              dispatcher.addEventListener(signals::kSessionReload, [this](Event&) { canSave_ = false; }));
}

SessionRecorder::~SessionRecorder() {
    for (const auto& [type, id] : listenerIds_) {
        host_.signals().removeEventListener(type, id);
    }
}

SessionPayload* SessionRecorder::payload() {
    auto session = host_.session();
    if (!session) {
        return nullptr;
    }
    return &session->payload();
}

bool SessionRecorder::stampVersion() {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->version = host_.config().appVersion;
    return true;
}

bool SessionRecorder::triggerSave() {
    if (!canSave_) {
        return false;
    }
    auto session = host_.session();
    if (!session) {
        return false;
    }
    session->payload().elapsed = clock_.elapsed();
    return session->requestSave();
}

bool SessionRecorder::recordInspections(std::vector<InspectionRecord> inspections) {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->inspectionLog = std::move(inspections);
    return triggerSave();
}

bool SessionRecorder::recordActivity(std::vector<ActivityEntry> entries) {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->activityLog = std::move(entries);
    return triggerSave();
}

bool SessionRecorder::recordPhotos(StringMap<std::string> photoTimestamps) {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->photoTimestamps = std::move(photoTimestamps);
    return triggerSave();
}

bool SessionRecorder::recordLastLocation(const std::string& location) {
    if (!canSave_) {
        return false;
    }
    auto* data = payload();
    if (!data) {
        return false;
    }

    data->lastLocation = location;
    auto& visited = data->visitedLocations;
    if (std::find(visited.begin(), visited.end(), location) == visited.end()) {
        visited.push_back(location);
    }
    return triggerSave();
}

bool SessionRecorder::setFlag(const std::string& name, bool value) {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->flags[name] = value;
    return triggerSave();
}

bool SessionRecorder::setSetting(const std::string& name, double value) {
    auto* data = payload();
    if (!data) {
        return false;
    }
    data->settings[name] = value;
    return triggerSave();
}

void SessionRecorder::enableAutosave(float intervalSeconds) {
    autosaveEnabled_ = true;
    autosaveInterval_ = intervalSeconds;
    autosaveTimer_ = 0.0f;
}

void SessionRecorder::disableAutosave() {
    autosaveEnabled_ = false;
}

bool SessionRecorder::tick(float dt) {
    clock_.tick(dt);

    if (!autosaveEnabled_) {
        return false;
    }

    autosaveTimer_ += dt;
    if (autosaveTimer_ < autosaveInterval_) {
        return false;
    }

    autosaveTimer_ = 0.0f;
    if (!triggerSave()) {
        return false;
    }
    ++autosaveCount_;
    KEEPSAKE_LOG_DEBUG("Autosave #{} queued", autosaveCount_);
    return true;
}

} // namespace keepsake
