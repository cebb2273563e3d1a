#pragma once

#include <string>

namespace keepsake {

class Utils {
public:
  // Generates prefix + `length` random hex digits. Used for listener and hook ids.
  static std::string generateUniqueId(const std::string& prefix, int length = 8);

  // UTC wall-clock time formatted as ISO 8601 (e.g. 2026-01-01T12:00:00Z).
  static std::string currentTimestamp();
};

} // namespace keepsake
