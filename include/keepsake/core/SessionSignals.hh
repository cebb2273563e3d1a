#pragma once

// Event types emitted by SessionSync / SessionHost through the EventDispatcher.
// Collaborators subscribe only to the signals they need.

namespace keepsake::signals {

inline constexpr const char* kSource = "session_sync";

inline constexpr const char* kSessionStarted = "session_started";   // user_id
inline constexpr const char* kSaveStarted = "save_started";
inline constexpr const char* kSaveCompleted = "save_completed";     // success
inline constexpr const char* kLoadCompleted = "load_completed";     // success
inline constexpr const char* kDeleteCompleted = "delete_completed"; // success
inline constexpr const char* kValidSaveFound = "valid_save_found";
inline constexpr const char* kFreshStart = "fresh_start"; // restarted
inline constexpr const char* kResumeConfirmed = "resume_confirmed";
inline constexpr const char* kRestartDenied = "restart_denied";     // message
inline constexpr const char* kSessionFault = "session_fault";       // code, message
inline constexpr const char* kSessionReload = "session_reload";     // restarted, reason
inline constexpr const char* kSessionReloaded = "session_reloaded"; // reload_count

// Data keys
inline constexpr const char* kUserId = "user_id";
inline constexpr const char* kSuccess = "success";
inline constexpr const char* kRestarted = "restarted";
inline constexpr const char* kCode = "code";
inline constexpr const char* kMessage = "message";
inline constexpr const char* kReason = "reason";
inline constexpr const char* kReloadCount = "reload_count";

} // namespace keepsake::signals
