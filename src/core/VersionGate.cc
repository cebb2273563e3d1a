#include "keepsake/core/VersionGate.hh"

namespace keepsake {

VersionGate::VersionGate(std::string appVersion, bool acceptUnversioned)
    : appVersion_(std::move(appVersion)), acceptUnversioned_(acceptUnversioned) {}

bool VersionGate::isValid(const SessionPayload& payload) const {
    return isValid(payload.version);
}

bool VersionGate::isValid(std::string_view recordedVersion) const {
    if (recordedVersion.empty()) {
        return acceptUnversioned_;
    }
    return recordedVersion == appVersion_;
}

} // namespace keepsake
