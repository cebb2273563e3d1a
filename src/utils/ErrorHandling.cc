#include "keepsake/utils/ErrorHandling.hh"
#include "keepsake/core/Log.hh"

namespace keepsake {

KeepsakeException::KeepsakeException(const std::string &message)
    : message(message) {}

const char *KeepsakeException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  KEEPSAKE_LOG_ERROR("KeepsakeException: {}", message);
  throw KeepsakeException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::ConnectionReset:
    return "ConnectionReset";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace keepsake
