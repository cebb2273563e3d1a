#include "keepsake/core/DevConsole.hh"

#include "keepsake/core/Log.hh"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace keepsake {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

DevConsole::DevConsole() {
    registerBuiltins();
}

void DevConsole::bind(const std::string& name, const std::string& usage, CommandCallback callback) {
    commands_[toLower(name)] = Command{usage, std::move(callback)};
}

void DevConsole::unbind(const std::string& name) {
    commands_.erase(toLower(name));
}

bool DevConsole::hasCommand(const std::string& name) const {
    return commands_.count(toLower(name)) > 0;
}

bool DevConsole::execute(const std::string& input) {
    auto tokens = tokenize(input);
    if (tokens.empty()) {
        return false;
    }

    // Echo the input
    print("> " + input);

    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    auto it = commands_.find(toLower(tokens[0]));
    if (it == commands_.end()) {
        print("Unknown command: " + tokens[0]);
        return false;
    }

    KEEPSAKE_LOG_DEBUG("Console command '{}' ({} args)", it->first, args.size());
    return it->second.callback(args);
}

void DevConsole::print(const std::string& message) {
    output_.push_back(message);
    while (output_.size() > kMaxOutputLines) {
        output_.pop_front();
    }
}

void DevConsole::clear() {
    output_.clear();
}

const std::deque<std::string>& DevConsole::output() const {
    return output_;
}

void DevConsole::registerCVar(const std::string& name, int* ref) {
    cvars_[name] = ref;
}

void DevConsole::registerCVar(const std::string& name, float* ref) {
    cvars_[name] = ref;
}

void DevConsole::registerCVar(const std::string& name, bool* ref) {
    cvars_[name] = ref;
}

void DevConsole::registerCVar(const std::string& name, std::string* ref) {
    cvars_[name] = ref;
}

void DevConsole::unregisterCVar(const std::string& name) {
    cvars_.erase(name);
}

void DevConsole::setQuitCallback(std::function<void()> cb) {
    quitCallback_ = std::move(cb);
}

void DevConsole::registerBuiltins() {
    bind("help", "help", [this](const auto& args) { return cmdHelp(args); });
    bind("set", "set <cvar> <value>", [this](const auto& args) { return cmdSet(args); });
    bind("get", "get <cvar>", [this](const auto& args) { return cmdGet(args); });
    bind("clear", "clear", [this](const auto& args) { return cmdClear(args); });
    bind("quit", "quit", [this](const auto& args) { return cmdQuit(args); });
}

std::vector<std::string> DevConsole::tokenize(const std::string& input) const {
    std::vector<std::string> tokens;
    std::istringstream stream(input);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool DevConsole::cmdHelp(const std::vector<std::string>& /*args*/) {
    print("Available commands:");
    for (const auto& [name, command] : commands_) {
        print("  " + command.usage);
    }
    return true;
}

bool DevConsole::cmdSet(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print("Usage: set <cvar> <value>");
        return false;
    }

    auto it = cvars_.find(args[0]);
    if (it == cvars_.end()) {
        print("Unknown cvar: " + args[0]);
        return false;
    }

    const std::string& valueStr = args[1];

    return std::visit(
        [&](auto* ref) {
            using T = std::remove_pointer_t<decltype(ref)>;
            if constexpr (std::is_same_v<T, int>) {
                try {
                    *ref = std::stoi(valueStr);
                } catch (const std::logic_error&) {
                    print("Invalid integer value: " + valueStr);
                    return false;
                }
                print(args[0] + " = " + std::to_string(*ref));
            } else if constexpr (std::is_same_v<T, float>) {
                try {
                    *ref = std::stof(valueStr);
                } catch (const std::logic_error&) {
                    print("Invalid float value: " + valueStr);
                    return false;
                }
                print(args[0] + " = " + std::to_string(*ref));
            } else if constexpr (std::is_same_v<T, bool>) {
                if (valueStr == "true" || valueStr == "1") {
                    *ref = true;
                } else if (valueStr == "false" || valueStr == "0") {
                    *ref = false;
                } else {
                    print("Invalid bool value: " + valueStr + " (use true/false/0/1)");
                    return false;
                }
                print(args[0] + " = " + (*ref ? "true" : "false"));
            } else if constexpr (std::is_same_v<T, std::string>) {
                *ref = valueStr;
                print(args[0] + " = " + *ref);
            }
            return true;
        },
        it->second);
}

bool DevConsole::cmdGet(const std::vector<std::string>& args) {
    if (args.empty()) {
        print("Usage: get <cvar>");
        return false;
    }

    auto it = cvars_.find(args[0]);
    if (it == cvars_.end()) {
        print("Unknown cvar: " + args[0]);
        return false;
    }

    std::visit(
        [&](auto* ref) {
            using T = std::remove_pointer_t<decltype(ref)>;
            if constexpr (std::is_same_v<T, bool>) {
                print(args[0] + " = " + (*ref ? "true" : "false"));
            } else if constexpr (std::is_same_v<T, std::string>) {
                print(args[0] + " = " + *ref);
            } else {
                print(args[0] + " = " + std::to_string(*ref));
            }
        },
        it->second);
    return true;
}

bool DevConsole::cmdClear(const std::vector<std::string>& /*args*/) {
    clear();
    return true;
}

bool DevConsole::cmdQuit(const std::vector<std::string>& /*args*/) {
    print("Requesting shutdown...");
    if (quitCallback_) {
        quitCallback_();
    }
    return true;
}

} // namespace keepsake
