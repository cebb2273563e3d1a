#pragma once

#include "keepsake/core/DataLoader.hh"
#include "keepsake/utils/ErrorHandling.hh"

#include <chrono>
#include <filesystem>
#include <string>

namespace keepsake {

/// Tunables for the save/load synchronization engine. Defaults reproduce the
/// shipped behaviour: 3 probe attempts 1 s apart, unversioned saves accepted,
/// no save timeout.
struct SyncConfig {
    // [session]
    std::string keyTemplate = "DLX_template";
    std::string appVersion = "0.0.1";

    // [probe]
    int probeMaxAttempts = 3;
    std::chrono::milliseconds probeRetryInterval{1000};
    std::chrono::milliseconds probeRequestTimeout{0};

    // [version]
    bool acceptUnversioned = true;

    // [queue] zero timeouts wait without bound
    std::chrono::milliseconds saveTimeout{0};

    // [restart]
    std::chrono::milliseconds restartSettleDelay{250};
    std::chrono::milliseconds deleteTimeout{0};

    // [autosave]
    bool autosaveEnabled = false;
    float autosaveIntervalSeconds = 300.0f;

    // [local]
    std::string localDirectory = "saves";

    /// Map a parsed TOML document onto a config. Absent keys keep their
    /// defaults; wrong types and out-of-range values are errors.
    static Result<SyncConfig> fromToml(const DataLoader& loader);

    static Result<SyncConfig> loadFile(const std::filesystem::path& path);

    /// "{keyTemplate}_{userId}"
    std::string sessionKey(const std::string& userId) const;
};

} // namespace keepsake
