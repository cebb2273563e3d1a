#include "keepsake/core/DevConsole.hh"
#include <gtest/gtest.h>

#include <algorithm>

using namespace keepsake;

namespace {

bool outputContains(const DevConsole& console, const std::string& text) {
    const auto& out = console.output();
    return std::any_of(out.begin(), out.end(),
                       [&text](const std::string& line) { return line.find(text) != std::string::npos; });
}

} // namespace

TEST(DevConsoleTest, BuiltinsAreRegistered) {
    DevConsole console;
    EXPECT_TRUE(console.hasCommand("help"));
    EXPECT_TRUE(console.hasCommand("set"));
    EXPECT_TRUE(console.hasCommand("get"));
    EXPECT_TRUE(console.hasCommand("clear"));
    EXPECT_TRUE(console.hasCommand("quit"));
}

TEST(DevConsoleTest, BindAndExecuteCommand) {
    DevConsole console;
    bool called = false;
    console.bind("test", "test", [&](const std::vector<std::string>&) {
        called = true;
        return true;
    });
    EXPECT_TRUE(console.execute("test"));
    EXPECT_TRUE(called);
    EXPECT_EQ(console.output().front(), "> test");
}

TEST(DevConsoleTest, CommandResultIsReturned) {
    DevConsole console;
    console.bind("fail", "fail", [](const std::vector<std::string>&) { return false; });
    EXPECT_FALSE(console.execute("fail"));
}

TEST(DevConsoleTest, ExecuteWithArgs) {
    DevConsole console;
    std::vector<std::string> captured;
    console.bind("echo", "echo <words>", [&](const std::vector<std::string>& args) {
        captured = args;
        return true;
    });
    console.execute("echo hello world");
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "hello");
    EXPECT_EQ(captured[1], "world");
}

TEST(DevConsoleTest, CaseInsensitiveCommand) {
    DevConsole console;
    bool called = false;
    console.bind("MyCmd", "mycmd", [&](const std::vector<std::string>&) {
        called = true;
        return true;
    });
    console.execute("mycmd");
    EXPECT_TRUE(called);
    EXPECT_TRUE(console.hasCommand("MYCMD"));
}

TEST(DevConsoleTest, UnknownCommandPrintsError) {
    DevConsole console;
    EXPECT_FALSE(console.execute("nonexistent"));
    EXPECT_TRUE(outputContains(console, "Unknown command: nonexistent"));
}

TEST(DevConsoleTest, EmptyInputDoesNothing) {
    DevConsole console;
    EXPECT_FALSE(console.execute(""));
    EXPECT_FALSE(console.execute("   "));
    EXPECT_TRUE(console.output().empty());
}

TEST(DevConsoleTest, HelpListsUsages) {
    DevConsole console;
    console.bind("cloud", "cloud [ list | log ]", [](const std::vector<std::string>&) { return true; });
    EXPECT_TRUE(console.execute("help"));
    EXPECT_TRUE(outputContains(console, "Available commands:"));
    EXPECT_TRUE(outputContains(console, "cloud [ list | log ]"));
    EXPECT_TRUE(outputContains(console, "set <cvar> <value>"));
}

TEST(DevConsoleTest, ClearEmptiesOutput) {
    DevConsole console;
    console.print("line 1");
    console.print("line 2");
    EXPECT_EQ(console.output().size(), 2u);
    console.execute("clear");
    EXPECT_TRUE(console.output().empty());
}

TEST(DevConsoleTest, RingBufferOverflow) {
    DevConsole console;
    for (size_t i = 0; i < DevConsole::kMaxOutputLines + 100; ++i) {
        console.print("line " + std::to_string(i));
    }
    EXPECT_EQ(console.output().size(), DevConsole::kMaxOutputLines);
    // Oldest lines should have been evicted
    EXPECT_EQ(console.output().front(), "line 100");
}

TEST(DevConsoleTest, CVarSetGetInt) {
    DevConsole console;
    int val = 42;
    console.registerCVar("myint", &val);
    EXPECT_TRUE(console.execute("set myint 100"));
    EXPECT_EQ(val, 100);
    EXPECT_TRUE(console.execute("get myint"));
    EXPECT_EQ(console.output().back(), "myint = 100");
}

TEST(DevConsoleTest, CVarSetFloat) {
    DevConsole console;
    float val = 1.5f;
    console.registerCVar("myfloat", &val);
    EXPECT_TRUE(console.execute("set myfloat 2.25"));
    EXPECT_FLOAT_EQ(val, 2.25f);
}

TEST(DevConsoleTest, CVarSetBool) {
    DevConsole console;
    bool val = false;
    console.registerCVar("can_save", &val);
    EXPECT_TRUE(console.execute("set can_save true"));
    EXPECT_TRUE(val);
    EXPECT_TRUE(console.execute("set can_save 0"));
    EXPECT_FALSE(val);
    EXPECT_FALSE(console.execute("set can_save maybe"));
    EXPECT_FALSE(val);
}

TEST(DevConsoleTest, CVarSetString) {
    DevConsole console;
    std::string val = "hello";
    console.registerCVar("mystr", &val);
    EXPECT_TRUE(console.execute("set mystr world"));
    EXPECT_EQ(val, "world");
}

TEST(DevConsoleTest, InvalidNumberIsRejected) {
    DevConsole console;
    int val = 7;
    console.registerCVar("myint", &val);
    EXPECT_FALSE(console.execute("set myint abc"));
    EXPECT_EQ(val, 7);
    EXPECT_TRUE(outputContains(console, "Invalid integer value: abc"));
}

TEST(DevConsoleTest, UnregisterCVar) {
    DevConsole console;
    int val = 10;
    console.registerCVar("temp", &val);
    console.unregisterCVar("temp");
    EXPECT_FALSE(console.execute("get temp"));
    EXPECT_TRUE(outputContains(console, "Unknown cvar: temp"));
}

TEST(DevConsoleTest, UnbindRemovesCommand) {
    DevConsole console;
    bool called = false;
    console.bind("removeme", "removeme", [&](const std::vector<std::string>&) {
        called = true;
        return true;
    });
    console.unbind("removeme");
    EXPECT_FALSE(console.execute("removeme"));
    EXPECT_FALSE(called);
}

TEST(DevConsoleTest, QuitCallbackInvoked) {
    DevConsole console;
    bool quitCalled = false;
    console.setQuitCallback([&]() { quitCalled = true; });
    EXPECT_TRUE(console.execute("quit"));
    EXPECT_TRUE(quitCalled);
}

TEST(DevConsoleTest, MultipleExtraWhitespace) {
    DevConsole console;
    std::vector<std::string> captured;
    console.bind("cmd", "cmd", [&](const std::vector<std::string>& args) {
        captured = args;
        return true;
    });
    console.execute("  cmd   arg1   arg2  ");
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "arg1");
    EXPECT_EQ(captured[1], "arg2");
}
