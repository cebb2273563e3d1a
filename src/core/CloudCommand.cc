#include "keepsake/core/CloudCommand.hh"
#include "keepsake/core/SessionSignals.hh"
#include "keepsake/utils/Utils.hh"

namespace keepsake {

CloudCommand::CloudCommand(DevConsole& console, SessionHost& host) : console_(console), host_(host) {
    auto record = [this](const char* type, const char* action) {
        auto id = host_.signals().addEventListener(type, [this, action](Event& event) {
            logResult(event.getDataOr<bool>(signals::kSuccess, false), action);
        });
        listenerIds_.emplace_back(type, id);
    };
    record(signals::kSaveCompleted, kSave);
    record(signals::kLoadCompleted, kLoad);
    record(signals::kDeleteCompleted, kDelete);

    console_.bind(kName, usage(), [this](const std::vector<std::string>& args) { return execute(args); });
}

CloudCommand::~CloudCommand() {
    console_.unbind(kName);
    for (const auto& [type, id] : listenerIds_) {
        host_.signals().removeEventListener(type, id);
    }
}

std::string CloudCommand::usage() {
    return std::string(kName) + " [ " + kList + " | " + kLog + " | " + kSave + " | " + kLoad + " | " + kDelete + " ]";
}

bool CloudCommand::execute(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        console_.print("Usage: " + usage());
        return false;
    }

    auto session = host_.session();
    if (!session) {
        console_.print("No active session");
        return false;
    }

    if (args.size() == 1) {
        const std::string& action = args[0];
        if (action == kLog) {
            for (const auto& line : logs_) {
                console_.print(line);
            }
            return true;
        }
        if (action == kSave) {
            session->requestSave();
            console_.print(attemptMessage(action));
            return true;
        }
        if (action == kLoad) {
            session->requestLoad();
            console_.print(attemptMessage(action));
            return true;
        }
        if (action == kDelete) {
            session->requestDelete();
            console_.print(attemptMessage(action));
            return true;
        }
        if (action != kList) {
            console_.print("Usage: " + usage());
            return false;
        }
    }

    console_.print(session->payload().toJsonString(2));
    return true;
}

void CloudCommand::logResult(bool result, const std::string& action) {
    logs_.push_back("'" + action + "' action returned '" + (result ? "true" : "false") + "' at " +
                    Utils::currentTimestamp());
}

std::string CloudCommand::attemptMessage(const std::string& action) {
    return "'" + action + "' action attempted. Check logs for response.";
}

} // namespace keepsake
