#pragma once

// Keepsake Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "keepsake/core/Log.hh"
//   KEEPSAKE_LOG_INFO("Session key {}", key);
//   KEEPSAKE_SYNC_LOG_WARN("Probe attempt {} failed", attempt);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace keepsake::log {

/// Initialize the logging subsystem (console + logs/ directory).
/// Call once at startup before any logging.
void init();

/// Initialize with an additional caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Valid after init().
quill::Logger* logger();

/// Save/load synchronization channel (probe, queue, load outcome, restart).
quill::Logger* syncLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setSyncLevel(quill::LogLevel level);

} // namespace keepsake::log

// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define KEEPSAKE_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(keepsake::log::logger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(keepsake::log::logger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(keepsake::log::logger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(keepsake::log::logger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(keepsake::log::logger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(keepsake::log::logger(), fmt, ##__VA_ARGS__)

#define KEEPSAKE_SYNC_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(keepsake::log::syncLogger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_SYNC_LOG_INFO(fmt, ...) QUILL_LOG_INFO(keepsake::log::syncLogger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_SYNC_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(keepsake::log::syncLogger(), fmt, ##__VA_ARGS__)
#define KEEPSAKE_SYNC_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(keepsake::log::syncLogger(), fmt, ##__VA_ARGS__)
