#pragma once

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace keepsake {

/// Text command console for developer builds. Input lines are split on
/// whitespace; the first token names the command (case-insensitive).
class DevConsole {
  public:
    using CommandCallback = std::function<bool(const std::vector<std::string>& args)>;
    using CVarRef = std::variant<int*, float*, bool*, std::string*>;

    static constexpr size_t kMaxOutputLines = 500;

    DevConsole();

    // Command registration. `usage` is shown by `help`.
    void bind(const std::string& name, const std::string& usage, CommandCallback callback);
    void unbind(const std::string& name);
    bool hasCommand(const std::string& name) const;

    // Execute a command string. Returns the command's result; false for
    // unknown commands and empty input.
    bool execute(const std::string& input);

    // Output log
    void print(const std::string& message);
    void clear();
    const std::deque<std::string>& output() const;

    // CVar system
    void registerCVar(const std::string& name, int* ref);
    void registerCVar(const std::string& name, float* ref);
    void registerCVar(const std::string& name, bool* ref);
    void registerCVar(const std::string& name, std::string* ref);
    void unregisterCVar(const std::string& name);

    // Quit callback (wired to the host loop)
    void setQuitCallback(std::function<void()> cb);

  private:
    struct Command {
        std::string usage;
        CommandCallback callback;
    };

    void registerBuiltins();
    std::vector<std::string> tokenize(const std::string& input) const;

    // Built-in command handlers
    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdSet(const std::vector<std::string>& args);
    bool cmdGet(const std::vector<std::string>& args);
    bool cmdClear(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);

    std::map<std::string, Command> commands_;
    std::unordered_map<std::string, CVarRef> cvars_;
    std::deque<std::string> output_;
    std::function<void()> quitCallback_;
};

} // namespace keepsake
