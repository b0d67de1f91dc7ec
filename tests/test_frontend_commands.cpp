#include <doctest/doctest.h>

#include "frontend_commands.h"

using namespace Quire;

TEST_SUITE_BEGIN("commands");

TEST_CASE("open_file_path acknowledges any input") {
    FrontendCommands commands;
    CHECK(commands.openFilePath("/tmp/a.pdf"));
    CHECK(commands.openFilePath(""));
    CHECK(commands.openFilePath("--not-a-path"));
    CHECK(commands.invocationCount() == 3);
}

TEST_CASE("invoke routes open_file_path whatever the arguments look like") {
    FrontendCommands commands;
    CHECK(commands.invoke("open_file_path", R"({"filePath": "/tmp/a.pdf"})"));
    CHECK(commands.invoke("open_file_path", R"({"filePath": 7})"));
    CHECK(commands.invoke("open_file_path", "{}"));
    CHECK(commands.invoke("open_file_path", ""));
    CHECK(commands.invoke("open_file_path", "[1, 2]"));
    CHECK(commands.invoke("open_file_path", "{ broken"));
    CHECK(commands.invocationCount() == 6);
}

TEST_CASE("Unknown commands fail with a message") {
    FrontendCommands commands;
    CommandResult result = commands.invoke("delete_everything", "{}");
    CHECK_FALSE(result);
    CHECK(result.error.find("delete_everything") != std::string::npos);
    CHECK(commands.invocationCount() == 0);
}

TEST_SUITE_END();
