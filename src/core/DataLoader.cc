#include "keepsake/core/DataLoader.hh"

#include <sstream>

#include "keepsake/core/Log.hh"

namespace keepsake {

namespace {

template <typename T> Result<T> orDefault(Result<T> found, T defaultValue) {
    if (found.isError() && found.code() == ErrorCode::NotFound) {
        return Result<T>::ok(std::move(defaultValue));
    }
    return found;
}

} // namespace

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<DataLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        KEEPSAKE_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        return fromParseError(err, path.string());
    }
}

Result<DataLoader> DataLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), std::string(sourceName)));
    } catch (const toml::parse_error& err) {
        return fromParseError(err, sourceName);
    }
}

Result<DataLoader> DataLoader::fromParseError(const toml::parse_error& err, std::string_view source) {
    std::ostringstream oss;
    oss << source << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
        << err.description();
    return Result<DataLoader>::error(ErrorCode::Internal, oss.str());
}

const toml::node* DataLoader::resolve(std::string_view dottedKey) const {
    const toml::node* current = &table_;
    std::string_view remaining = dottedKey;

    while (!remaining.empty()) {
        auto dot = remaining.find('.');
        std::string_view segment = remaining.substr(0, dot);

        const auto* table = current->as_table();
        current = table ? table->get(segment) : nullptr;
        if (!current) {
            return nullptr;
        }
        remaining = (dot == std::string_view::npos) ? std::string_view{} : remaining.substr(dot + 1);
    }
    return current;
}

template <typename T> Result<T> DataLoader::lookup(std::string_view key, std::string_view expected) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<T>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (const auto* val = node->as<T>()) {
        return Result<T>::ok(T(val->get()));
    }
    return Result<T>::error(ErrorCode::InvalidState, formatError(key, expected));
}

std::string DataLoader::formatError(std::string_view key, std::string_view problem) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << problem;
    return oss.str();
}

Result<std::string> DataLoader::getString(std::string_view key) const {
    return lookup<std::string>(key, "is not a string");
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    return lookup<int64_t>(key, "is not an integer");
}

Result<double> DataLoader::getFloat(std::string_view key) const {
    auto found = lookup<double>(key, "is not a number");
    if (found.isError() && found.code() == ErrorCode::InvalidState) {
        if (auto asInt = getInt(key); asInt.isOk()) {
            return Result<double>::ok(static_cast<double>(asInt.value()));
        }
    }
    return found;
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    return lookup<bool>(key, "is not a boolean");
}

Result<std::string> DataLoader::getStringOr(std::string_view key, std::string_view defaultValue) const {
    return orDefault(getString(key), std::string(defaultValue));
}

Result<int64_t> DataLoader::getIntOr(std::string_view key, int64_t defaultValue) const {
    return orDefault(getInt(key), defaultValue);
}

Result<double> DataLoader::getFloatOr(std::string_view key, double defaultValue) const {
    return orDefault(getFloat(key), defaultValue);
}

Result<bool> DataLoader::getBoolOr(std::string_view key, bool defaultValue) const {
    return orDefault(getBool(key), defaultValue);
}

} // namespace keepsake
