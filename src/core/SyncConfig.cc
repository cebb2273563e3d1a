#include "keepsake/core/SyncConfig.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

namespace {

Result<std::chrono::milliseconds> readDuration(const DataLoader& loader, std::string_view key,
                                               std::chrono::milliseconds fallback) {
    auto value = loader.getIntOr(key, fallback.count());
    if (value.isError()) {
        return Result<std::chrono::milliseconds>::forward(value);
    }
    if (value.value() < 0) {
        return Result<std::chrono::milliseconds>::error(ErrorCode::InvalidState,
                                                        loader.sourceName() + ": key '" + std::string(key) +
                                                            "' must not be negative");
    }
    return Result<std::chrono::milliseconds>::ok(std::chrono::milliseconds(value.value()));
}

} // namespace

Result<SyncConfig> SyncConfig::fromToml(const DataLoader& loader) {
    SyncConfig config;

    auto keyTemplate = loader.getStringOr("session.key_template", config.keyTemplate);
    if (keyTemplate.isError())
        return Result<SyncConfig>::forward(keyTemplate);
    if (keyTemplate.value().empty()) {
        return Result<SyncConfig>::error(ErrorCode::InvalidState,
                                         loader.sourceName() + ": key 'session.key_template' must not be empty");
    }
    config.keyTemplate = keyTemplate.value();

    auto appVersion = loader.getStringOr("session.app_version", config.appVersion);
    if (appVersion.isError())
        return Result<SyncConfig>::forward(appVersion);
    config.appVersion = appVersion.value();

    auto attempts = loader.getIntOr("probe.max_attempts", config.probeMaxAttempts);
    if (attempts.isError())
        return Result<SyncConfig>::forward(attempts);
    if (attempts.value() < 1) {
        return Result<SyncConfig>::error(ErrorCode::InvalidState,
                                         loader.sourceName() + ": key 'probe.max_attempts' must be at least 1");
    }
    config.probeMaxAttempts = static_cast<int>(attempts.value());

    auto interval = readDuration(loader, "probe.retry_interval_ms", config.probeRetryInterval);
    if (interval.isError())
        return Result<SyncConfig>::forward(interval);
    config.probeRetryInterval = interval.value();

    auto probeTimeout = readDuration(loader, "probe.request_timeout_ms", config.probeRequestTimeout);
    if (probeTimeout.isError())
        return Result<SyncConfig>::forward(probeTimeout);
    config.probeRequestTimeout = probeTimeout.value();

    auto lenient = loader.getBoolOr("version.accept_unversioned", config.acceptUnversioned);
    if (lenient.isError())
        return Result<SyncConfig>::forward(lenient);
    config.acceptUnversioned = lenient.value();

    auto saveTimeout = readDuration(loader, "queue.save_timeout_ms", config.saveTimeout);
    if (saveTimeout.isError())
        return Result<SyncConfig>::forward(saveTimeout);
    config.saveTimeout = saveTimeout.value();

    auto settle = readDuration(loader, "restart.settle_delay_ms", config.restartSettleDelay);
    if (settle.isError())
        return Result<SyncConfig>::forward(settle);
    config.restartSettleDelay = settle.value();

    auto deleteTimeout = readDuration(loader, "restart.delete_timeout_ms", config.deleteTimeout);
    if (deleteTimeout.isError())
        return Result<SyncConfig>::forward(deleteTimeout);
    config.deleteTimeout = deleteTimeout.value();

    auto autosave = loader.getBoolOr("autosave.enabled", config.autosaveEnabled);
    if (autosave.isError())
        return Result<SyncConfig>::forward(autosave);
    config.autosaveEnabled = autosave.value();

    auto autosaveInterval = loader.getFloatOr("autosave.interval_seconds", config.autosaveIntervalSeconds);
    if (autosaveInterval.isError())
        return Result<SyncConfig>::forward(autosaveInterval);
    if (autosaveInterval.value() <= 0.0) {
        return Result<SyncConfig>::error(ErrorCode::InvalidState,
                                         loader.sourceName() + ": key 'autosave.interval_seconds' must be positive");
    }
    config.autosaveIntervalSeconds = static_cast<float>(autosaveInterval.value());

    auto directory = loader.getStringOr("local.directory", config.localDirectory);
    if (directory.isError())
        return Result<SyncConfig>::forward(directory);
    config.localDirectory = directory.value();

    return Result<SyncConfig>::ok(std::move(config));
}

Result<SyncConfig> SyncConfig::loadFile(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        KEEPSAKE_LOG_ERROR("Failed to read config {}: {}", path.string(), loader.message());
        return Result<SyncConfig>::forward(loader);
    }
    return fromToml(loader.value());
}

std::string SyncConfig::sessionKey(const std::string& userId) const {
    return keyTemplate + "_" + userId;
}

} // namespace keepsake
