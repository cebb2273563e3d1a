#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace keepsake {

// Raw bytes exchanged with a store adapter
using BinaryData = std::vector<uint8_t>;

// Values an Event can carry
using Variant = std::variant<std::nullptr_t, bool, int, double, std::string>;

template <typename T> using StringMap = std::map<std::string, T>;

// Tri-state completion flag: a request either has not reported yet, or
// reported success or failure.
enum class TriState : uint8_t {
    Unknown,
    True,
    False
};

inline TriState toTriState(bool value) {
    return value ? TriState::True : TriState::False;
}

inline const char* triStateToString(TriState state) {
    switch (state) {
        case TriState::Unknown:
            return "unknown";
        case TriState::True:
            return "true";
        case TriState::False:
            return "false";
    }
    return "unknown";
}

} // namespace keepsake
