#include "keepsake/core/Async.hh"
#include "keepsake/core/CloudCommand.hh"
#include "keepsake/core/DevConsole.hh"
#include "keepsake/core/LocalStore.hh"
#include "keepsake/core/Log.hh"
#include "keepsake/core/SessionHost.hh"
#include "keepsake/core/SessionRecorder.hh"
#include "keepsake/core/SessionSignals.hh"
#include "keepsake/core/SyncConfig.hh"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace {

constexpr const char* kAppName = "keepsake";
constexpr const char* kDefaultConfig = "config/keepsake.toml";
constexpr float kFrameSeconds = 1.0f / 60.0f;
constexpr int kIdleFramesBeforePrompt = 30;
constexpr int kMaxFramesPerCommand = 600;

void printUsage() {
    std::cout << "Usage: " << kAppName << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>  Load settings from a TOML file (default " << kDefaultConfig << ")" << std::endl;
    std::cout << "  --help           Display this help message" << std::endl;
}

// Run frames until the context has been idle for a while, so completions
// triggered by the last command are reported before the next prompt.
void pumpFrames(keepsake::SessionRecorder& recorder, const bool& running) {
    int idle = 0;
    for (int frame = 0; frame < kMaxFramesPerCommand && running; ++frame) {
        size_t handled = keepsake::async::context().poll();
        keepsake::async::context().restart();
        recorder.tick(kFrameSeconds);

        idle = handled == 0 ? idle + 1 : 0;
        if (idle >= kIdleFramesBeforePrompt) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::duration<float>(kFrameSeconds));
    }
}

void printConsole(keepsake::DevConsole& console, size_t& printed) {
    const auto& lines = console.output();
    if (printed > lines.size()) {
        printed = 0;
    }
    for (size_t i = printed; i < lines.size(); ++i) {
        std::cout << lines[i] << std::endl;
    }
    printed = lines.size();
}

} // namespace

int main(int argc, char* argv[]) {
    keepsake::log::init();
    KEEPSAKE_LOG_INFO("Starting {}", kAppName);

    std::string configPath = kDefaultConfig;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage();
            keepsake::log::shutdown();
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            continue;
        }
        std::cerr << "Unknown option: " << arg << std::endl;
        printUsage();
        keepsake::log::shutdown();
        return 1;
    }

    keepsake::SyncConfig config;
    if (std::filesystem::exists(configPath)) {
        auto loaded = keepsake::SyncConfig::loadFile(configPath);
        if (loaded.isError()) {
            KEEPSAKE_LOG_CRITICAL("Invalid config {}: {}", configPath, loaded.message());
            keepsake::log::shutdown();
            return 1;
        }
        config = std::move(loaded.value());
    } else {
        KEEPSAKE_LOG_INFO("No config at {}, using defaults", configPath);
    }

    try {
        keepsake::async::init();
        auto& io = keepsake::async::context();

        // The remote service is stood in for by a second directory.
        std::filesystem::path root(config.localDirectory);
        keepsake::LocalStore remote(io, (root / "remote").string());
        keepsake::LocalStore local(io, (root / "local").string());

        keepsake::SessionHost host(io, remote, local, config);
        keepsake::SessionRecorder recorder(host);
        if (config.autosaveEnabled) {
            recorder.enableAutosave(config.autosaveIntervalSeconds);
        }

        keepsake::DevConsole console;
        keepsake::CloudCommand cloud(console, host);
        console.registerCVar("can_save", recorder.canSaveRef());

        bool running = true;
        console.setQuitCallback([&running]() { running = false; });

        host.signals().addEventListener(keepsake::signals::kValidSaveFound, [&console](keepsake::Event&) {
            console.print("Saved session found. Type 'resume' to continue or 'restart' to start over.");
        });
        host.signals().addEventListener(keepsake::signals::kFreshStart, [&console](keepsake::Event& event) {
            bool restarted = event.getDataOr<bool>(keepsake::signals::kRestarted, false);
            console.print(restarted ? "Session restarted." : "Starting a new session.");
        });
        host.signals().addEventListener(keepsake::signals::kRestartDenied, [&console](keepsake::Event& event) {
            console.print("Restart failed: " + event.getDataOr<std::string>(keepsake::signals::kMessage, "unknown"));
        });
        host.signals().addEventListener(keepsake::signals::kSessionFault, [&console](keepsake::Event& event) {
            console.print("Session fault: " + event.getDataOr<std::string>(keepsake::signals::kMessage, ""));
        });

        console.bind("login", "login <user>", [&](const std::vector<std::string>& args) {
            if (args.size() != 1) {
                console.print("Usage: login <user>");
                return false;
            }
            host.login(args[0]);
            return true;
        });
        console.bind("resume", "resume", [&](const std::vector<std::string>&) {
            auto session = host.session();
            return session && session->confirmResume();
        });
        console.bind("restart", "restart", [&](const std::vector<std::string>&) {
            auto session = host.session();
            if (!session) {
                return false;
            }
            session->restartSession();
            return true;
        });
        console.bind("location", "location <name>", [&](const std::vector<std::string>& args) {
            if (args.size() != 1) {
                console.print("Usage: location <name>");
                return false;
            }
            return recorder.recordLastLocation(args[0]);
        });
        console.bind("flag", "flag <name> <true|false>", [&](const std::vector<std::string>& args) {
            if (args.size() != 2) {
                console.print("Usage: flag <name> <true|false>");
                return false;
            }
            return recorder.setFlag(args[0], args[1] == "true" || args[1] == "1");
        });
        console.bind("status", "status", [&](const std::vector<std::string>&) {
            auto session = host.session();
            if (!session) {
                console.print("Not logged in");
                return true;
            }
            console.print("user: " + session->userId());
            console.print("state: " + keepsake::loadStateToString(session->loadState()));
            console.print(std::string("store: ") + (session->usingFallback() ? "local (fallback)" : "remote"));
            console.print("elapsed: " + std::to_string(recorder.clock().elapsed().count()) + " ms");
            console.print("saves: " + std::to_string(session->writeQueue().succeededCount()) + " ok, " +
                          std::to_string(session->writeQueue().failedCount()) + " failed");
            return true;
        });

        console.print("Type 'help' for commands.");
        size_t printed = 0;
        printConsole(console, printed);

        std::string line;
        while (running && std::getline(std::cin, line)) {
            console.execute(line);
            pumpFrames(recorder, running);
            printConsole(console, printed);
        }

        host.shutdown();
        keepsake::async::poll();
        keepsake::async::shutdown();
    } catch (const std::exception& e) {
        KEEPSAKE_LOG_CRITICAL("Fatal: {}", e.what());
        keepsake::log::shutdown();
        return 1;
    }

    KEEPSAKE_LOG_INFO("Shutdown complete");
    keepsake::log::shutdown();
    return 0;
}
