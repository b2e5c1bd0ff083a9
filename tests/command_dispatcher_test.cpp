#include "gtest/gtest.h"
#include "ovslink/command_dispatcher.hpp"

#include <sstream>
#include <string>
#include <vector>

using ovslink::CommandDispatcher;

class CommandDispatcherTest : public ::testing::Test {
protected:
    CommandDispatcher dispatcher;
    std::vector<std::string> last_args;
    std::string last_command;

    void SetUp() override {
        dispatcher.register_command({"show"}, "<config-file>",
            [this](const std::vector<std::string>& args, std::ostream&) {
                last_command = "show";
                last_args = args;
                return ovslink::kExitOk;
            });
        dispatcher.register_command({"show", "ports"}, "<config-file>",
            [this](const std::vector<std::string>& args, std::ostream&) {
                last_command = "show ports";
                last_args = args;
                return 7;
            });
    }
};

TEST_F(CommandDispatcherTest, Dispatch_PassesRemainingWords) {
    std::ostringstream out;
    EXPECT_EQ(dispatcher.dispatch({"show", "a.conf"}, out), ovslink::kExitOk);
    EXPECT_EQ(last_command, "show");
    EXPECT_EQ(last_args, std::vector<std::string>({"a.conf"}));
}

TEST_F(CommandDispatcherTest, Dispatch_LongestPrefixWins) {
    std::ostringstream out;
    EXPECT_EQ(dispatcher.dispatch({"show", "ports", "a.conf"}, out), 7);
    EXPECT_EQ(last_command, "show ports");
    EXPECT_EQ(last_args, std::vector<std::string>({"a.conf"}));
}

TEST_F(CommandDispatcherTest, Dispatch_UnknownCommand) {
    std::ostringstream out;
    EXPECT_EQ(dispatcher.dispatch({"destroy"}, out), ovslink::kExitUsage);
    EXPECT_NE(out.str().find("Unknown command: destroy"), std::string::npos);
    EXPECT_TRUE(last_command.empty());
}

TEST_F(CommandDispatcherTest, Dispatch_EmptyInputPrintsHelp) {
    std::ostringstream out;
    EXPECT_EQ(dispatcher.dispatch({}, out), ovslink::kExitUsage);
    EXPECT_NE(out.str().find("show ports <config-file>"), std::string::npos);
}

TEST_F(CommandDispatcherTest, RegisterCommand_IgnoresEmptyKey) {
    dispatcher.register_command({}, "", [](const std::vector<std::string>&, std::ostream&) { return 99; });
    std::ostringstream out;
    EXPECT_EQ(dispatcher.dispatch({"anything"}, out), ovslink::kExitUsage);
}
