#pragma once

#include "keepsake/core/DevConsole.hh"
#include "keepsake/core/SessionHost.hh"

#include <string>
#include <utility>
#include <vector>

namespace keepsake {

/// `cloud` console command: developer access to the current session's store.
///
///   cloud | cloud list   print the in-memory payload as JSON
///   cloud log            print recorded save/load/delete results
///   cloud save|load|delete
///                        issue the action; the result is recorded when the
///                        store reports it
class CloudCommand {
  public:
    static constexpr const char* kName = "cloud";
    static constexpr const char* kList = "list";
    static constexpr const char* kLog = "log";
    static constexpr const char* kSave = "save";
    static constexpr const char* kLoad = "load";
    static constexpr const char* kDelete = "delete";

    CloudCommand(DevConsole& console, SessionHost& host);
    ~CloudCommand();

    CloudCommand(const CloudCommand&) = delete;
    CloudCommand& operator=(const CloudCommand&) = delete;

    bool execute(const std::vector<std::string>& args);

    static std::string usage();

    const std::vector<std::string>& logs() const { return logs_; }

  private:
    void logResult(bool result, const std::string& action);
    static std::string attemptMessage(const std::string& action);

    DevConsole& console_;
    SessionHost& host_;
    std::vector<std::string> logs_;
    std::vector<std::pair<std::string, std::string>> listenerIds_;
};

} // namespace keepsake
