#include "keepsake/core/LocalStore.hh"
#include "keepsake/core/Log.hh"

#include <asio/post.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace keepsake {

static constexpr const char* kSaveExtension = ".json";
static constexpr const char* kTempExtension = ".tmp";

LocalStore::LocalStore(asio::io_context& io, const std::string& directory) : io_(io), directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        KEEPSAKE_LOG_WARN("Failed to create local save directory {}: {}", directory_, ec.message());
    }
}

void LocalStore::list() {
    nlohmann::json index = listKeys();
    std::string text = index.dump();
    post(RequestOutcome{StoreAction::List, true, BinaryData(text.begin(), text.end())});
}

void LocalStore::save(const std::string& key, BinaryData bytes) {
    std::string filepath = keyPath(key);
    std::string tempPath = filepath + kTempExtension;

    bool ok = false;
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (file.is_open()) {
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            ok = file.good();
        }
    }

    if (ok) {
        std::error_code ec;
        std::filesystem::rename(tempPath, filepath, ec);
        ok = !ec;
        if (ec) {
            KEEPSAKE_LOG_ERROR("Failed to commit save '{}': {}", key, ec.message());
        }
    }

    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        KEEPSAKE_LOG_ERROR("Failed to save '{}' to {}", key, filepath);
    } else {
        KEEPSAKE_LOG_DEBUG("Saved '{}' to {} ({} bytes)", key, filepath, bytes.size());
    }

    post(RequestOutcome{StoreAction::Save, ok, std::nullopt});
}

void LocalStore::load(const std::string& key) {
    std::string filepath = keyPath(key);
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        KEEPSAKE_LOG_WARN("No local save for '{}' at {}", key, filepath);
        post(RequestOutcome{StoreAction::Load, false, std::nullopt});
        return;
    }

    BinaryData bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        KEEPSAKE_LOG_ERROR("Failed to read local save '{}'", key);
        post(RequestOutcome{StoreAction::Load, false, std::nullopt});
        return;
    }

    post(RequestOutcome{StoreAction::Load, true, std::move(bytes)});
}

void LocalStore::remove(const std::string& key) {
    // Deleting a key that was never saved succeeds: the store ends up
    // without it either way.
    std::error_code ec;
    bool removed = std::filesystem::remove(keyPath(key), ec);
    if (ec) {
        KEEPSAKE_LOG_ERROR("Failed to delete '{}': {}", key, ec.message());
    } else if (!removed) {
        KEEPSAKE_LOG_DEBUG("Delete of '{}': nothing stored", key);
    }
    post(RequestOutcome{StoreAction::Delete, !ec, std::nullopt});
}

std::string LocalStore::name() const {
    return "local";
}

std::vector<std::string> LocalStore::listKeys() const {
    std::vector<std::string> keys;
    std::error_code ec;

    if (!std::filesystem::is_directory(directory_, ec)) {
        return keys;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kSaveExtension) {
            continue;
        }
        keys.push_back(entry.path().stem().string());
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

bool LocalStore::contains(const std::string& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(keyPath(key), ec);
}

std::string LocalStore::keyPath(const std::string& key) const {
    return (std::filesystem::path(directory_) / (key + kSaveExtension)).string();
}

void LocalStore::post(RequestOutcome outcome) {
    asio::post(io_, [this, outcome = std::move(outcome)]() { complete(outcome); });
}

} // namespace keepsake
