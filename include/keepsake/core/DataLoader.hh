#pragma once

#include "keepsake/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace keepsake {

// Parsed TOML document with typed, dotted-key accessors ("probe.max_attempts").
// Each getter returns NotFound when the key is absent and InvalidState on a
// type mismatch. The *Or variants substitute a default for absent keys only.
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    // Integers are accepted where a float is expected
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    Result<std::string> getStringOr(std::string_view key, std::string_view defaultValue) const;
    Result<int64_t> getIntOr(std::string_view key, int64_t defaultValue) const;
    Result<double> getFloatOr(std::string_view key, double defaultValue) const;
    Result<bool> getBoolOr(std::string_view key, bool defaultValue) const;

    const std::string& sourceName() const { return sourceName_; }

  private:
    DataLoader(toml::table tbl, std::string source);

    static Result<DataLoader> fromParseError(const toml::parse_error& err, std::string_view source);

    const toml::node* resolve(std::string_view dottedKey) const;
    template <typename T> Result<T> lookup(std::string_view key, std::string_view expected) const;
    std::string formatError(std::string_view key, std::string_view problem) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace keepsake
