#include "keepsake/core/SessionPayload.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

void to_json(nlohmann::json& j, const ActivityEntry& entry) {
    j = nlohmann::json{{"is_primary", entry.isPrimary}, {"message", entry.message}};
}

void from_json(const nlohmann::json& j, ActivityEntry& entry) {
    entry.isPrimary = j.value("is_primary", false);
    entry.message = j.value("message", std::string{});
}

void to_json(nlohmann::json& j, const InspectionRecord& record) {
    j = nlohmann::json{{"object_id", record.objectId}, {"is_compliant", record.isCompliant}, {"has_photo", record.hasPhoto}};
}

void from_json(const nlohmann::json& j, InspectionRecord& record) {
    j.at("object_id").get_to(record.objectId);
    record.isCompliant = j.value("is_compliant", false);
    record.hasPhoto = j.value("has_photo", false);
}

void to_json(nlohmann::json& j, const SessionPayload& payload) {
    j = nlohmann::json{
        {"version", payload.version},
        {"elapsed_ms", payload.elapsed.count()},
        {"last_location", payload.lastLocation},
        {"visited_locations", payload.visitedLocations},
        {"photo_timestamps", payload.photoTimestamps},
        {"activity_log", payload.activityLog},
        {"inspection_log", payload.inspectionLog},
        {"flags", payload.flags},
        {"settings", payload.settings},
    };
}

void from_json(const nlohmann::json& j, SessionPayload& payload) {
    payload = SessionPayload{};
    payload.version = j.value("version", std::string{});
    payload.elapsed = std::chrono::milliseconds(j.value("elapsed_ms", int64_t{0}));
    payload.lastLocation = j.value("last_location", std::string{});

    if (auto it = j.find("visited_locations"); it != j.end())
        it->get_to(payload.visitedLocations);
    if (auto it = j.find("photo_timestamps"); it != j.end())
        it->get_to(payload.photoTimestamps);
    if (auto it = j.find("activity_log"); it != j.end())
        it->get_to(payload.activityLog);
    if (auto it = j.find("inspection_log"); it != j.end())
        it->get_to(payload.inspectionLog);
    if (auto it = j.find("flags"); it != j.end())
        it->get_to(payload.flags);
    if (auto it = j.find("settings"); it != j.end())
        it->get_to(payload.settings);
}

BinaryData SessionPayload::serialize() const {
    std::string text = toJsonString();
    return BinaryData(text.begin(), text.end());
}

std::string SessionPayload::toJsonString(int indent) const {
    nlohmann::json j = *this;
    // Invalid UTF-8 in collaborator-supplied strings becomes U+FFFD
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<SessionPayload> SessionPayload::deserialize(const BinaryData& bytes) {
    if (bytes.empty()) {
        return Result<SessionPayload>::error(ErrorCode::Internal, "empty session payload");
    }

    try {
        auto j = nlohmann::json::parse(bytes.begin(), bytes.end());
        if (!j.is_object()) {
            return Result<SessionPayload>::error(ErrorCode::Internal, "session payload is not a JSON object");
        }
        return Result<SessionPayload>::ok(j.get<SessionPayload>());
    } catch (const nlohmann::json::exception& e) {
        KEEPSAKE_SYNC_LOG_WARN("Undecodable session payload ({} bytes): {}", bytes.size(), e.what());
        return Result<SessionPayload>::error(ErrorCode::Internal, e.what());
    }
}

} // namespace keepsake
