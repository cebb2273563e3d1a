#include "keepsake/core/Log.hh"

#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace keepsake::log {

namespace {
// Root logger (all channels aggregated)
quill::Logger* g_logger = nullptr;

// Save/load synchronization channel
quill::Logger* g_logger_sync = nullptr;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "KeepsakeLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;
    quill::Backend::start(backend_opts);

    std::error_code ec;
    std::filesystem::create_directories(kLogsDir, ec);
}

void createLoggers(std::vector<std::shared_ptr<quill::Sink>> extraSinks) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto pattern = makePattern();

    // Root logger: console + keepsake.log (+ caller file)
    std::vector<std::shared_ptr<quill::Sink>> rootSinks{console_sink, makeFileSink(kLogsDir + "/keepsake.log")};
    // Sync logger: console + session.log (+ caller file)
    std::vector<std::shared_ptr<quill::Sink>> syncSinks{console_sink, makeFileSink(kLogsDir + "/session.log")};
    for (const auto& sink : extraSinks) {
        rootSinks.push_back(sink);
        syncSinks.push_back(sink);
    }

    g_logger = quill::Frontend::create_or_get_logger("keepsake", std::move(rootSinks), pattern);
    g_logger_sync = quill::Frontend::create_or_get_logger("sync", std::move(syncSinks), pattern);

    g_logger->set_log_level(quill::LogLevel::Info);
    g_logger_sync->set_log_level(quill::LogLevel::Info);
}

} // namespace

void init() {
    startBackend();
    createLoggers({});
}

void init(const char* log_file_path) {
    startBackend();
    createLoggers({makeFileSink(log_file_path)});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_sync}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* syncLogger() {
    return g_logger_sync;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setSyncLevel(quill::LogLevel level) {
    if (g_logger_sync)
        g_logger_sync->set_log_level(level);
}

} // namespace keepsake::log
