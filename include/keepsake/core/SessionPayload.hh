#pragma once

#include "keepsake/core/Types.hh"
#include "keepsake/utils/ErrorHandling.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace keepsake {

struct ActivityEntry {
    bool isPrimary = false;
    std::string message;

    bool operator==(const ActivityEntry&) const = default;
};

struct InspectionRecord {
    std::string objectId;
    bool isCompliant = false;
    bool hasPhoto = false;

    bool operator==(const InspectionRecord&) const = default;
};

/// Snapshot of a learner's session written to and read from storage as one
/// document. The engine only reads `version`; every other field belongs to
/// the collaborators that fill it.
struct SessionPayload {
    std::string version;
    std::chrono::milliseconds elapsed{0};
    std::string lastLocation;
    std::vector<std::string> visitedLocations;
    StringMap<std::string> photoTimestamps;
    std::vector<ActivityEntry> activityLog;
    std::vector<InspectionRecord> inspectionLog;
    StringMap<bool> flags;
    StringMap<double> settings;

    bool operator==(const SessionPayload&) const = default;

    BinaryData serialize() const;
    std::string toJsonString(int indent = -1) const;

    /// Decode a stored payload. Absent keys take their defaults; malformed
    /// JSON or mistyped fields yield ErrorCode::Internal.
    static Result<SessionPayload> deserialize(const BinaryData& bytes);
};

void to_json(nlohmann::json& j, const ActivityEntry& entry);
void from_json(const nlohmann::json& j, ActivityEntry& entry);

void to_json(nlohmann::json& j, const InspectionRecord& record);
void from_json(const nlohmann::json& j, InspectionRecord& record);

void to_json(nlohmann::json& j, const SessionPayload& payload);
void from_json(const nlohmann::json& j, SessionPayload& payload);

} // namespace keepsake
