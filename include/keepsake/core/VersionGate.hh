#pragma once

#include "keepsake/core/SessionPayload.hh"

#include <string>
#include <string_view>

namespace keepsake {

/// Decides whether a loaded payload was written by a compatible build:
/// the recorded version must equal the running application's version.
/// With `acceptUnversioned`, a payload that never had a version stamped
/// (empty string) is accepted as well.
class VersionGate {
  public:
    VersionGate(std::string appVersion, bool acceptUnversioned);

    bool isValid(const SessionPayload& payload) const;
    bool isValid(std::string_view recordedVersion) const;

    const std::string& appVersion() const { return appVersion_; }
    bool acceptsUnversioned() const { return acceptUnversioned_; }

  private:
    std::string appVersion_;
    bool acceptUnversioned_;
};

} // namespace keepsake
