#include "common/tool_config.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

static shardb::ToolConfig parse(std::vector<std::string> args) {
    auto argv = make_argv(args);
    return shardb::parse_config(static_cast<int>(argv.size()), argv.data());
}

// ── Valid configuration ────────────────────────────────────────────────────────

TEST(ToolConfigTest, ParsesCommandWithDefaults) {
    auto cfg = parse({"shardb-tool", "info"});

    EXPECT_EQ(cfg.root,      ".");       // default
    EXPECT_EQ(cfg.name,      "shardb");  // default
    EXPECT_EQ(cfg.log_level, "warn");    // default
    EXPECT_EQ(cfg.seed,      0u);        // default
    EXPECT_EQ(cfg.command,   "info");
    EXPECT_TRUE(cfg.args.empty());
}

TEST(ToolConfigTest, ParsesOptionsAndPositionalArguments) {
    auto cfg = parse({
        "shardb-tool",
        "--root",      "/var/lib/shardb",
        "--name",      "main",
        "--log-level", "debug",
        "--seed",      "42",
        "put", "users", "alice", "{\"age\":30}",
    });

    EXPECT_EQ(cfg.root,      "/var/lib/shardb");
    EXPECT_EQ(cfg.name,      "main");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.seed,      42u);
    EXPECT_EQ(cfg.command,   "put");
    ASSERT_EQ(cfg.args.size(), 3u);
    EXPECT_EQ(cfg.args[0], "users");
    EXPECT_EQ(cfg.args[1], "alice");
    EXPECT_EQ(cfg.args[2], "{\"age\":30}");
}

TEST(ToolConfigTest, OptionsMayFollowCommand) {
    auto cfg = parse({"shardb-tool", "get", "users", "alice", "--root", "./data"});
    EXPECT_EQ(cfg.command, "get");
    EXPECT_EQ(cfg.root, "./data");
    ASSERT_EQ(cfg.args.size(), 2u);
}

// ── Validation errors ─────────────────────────────────────────────────────────

TEST(ToolConfigTest, RejectsMissingCommand) {
    EXPECT_THROW(parse({"shardb-tool"}), std::runtime_error);
}

TEST(ToolConfigTest, RejectsUnknownCommand) {
    EXPECT_THROW(parse({"shardb-tool", "compact"}), std::runtime_error);
}

TEST(ToolConfigTest, RejectsWrongArgumentCount) {
    EXPECT_THROW(parse({"shardb-tool", "put", "users", "alice"}), std::runtime_error);
    EXPECT_THROW(parse({"shardb-tool", "info", "extra"}), std::runtime_error);
    EXPECT_THROW(parse({"shardb-tool", "create"}), std::runtime_error);
}

TEST(ToolConfigTest, RejectsBadCollectionName) {
    EXPECT_THROW(parse({"shardb-tool", "create", "a/b"}), std::runtime_error);
    EXPECT_THROW(parse({"shardb-tool", "create", ".."}), std::runtime_error);
}

TEST(ToolConfigTest, RejectsEmptyRoot) {
    EXPECT_THROW(parse({"shardb-tool", "--root", "", "info"}), std::runtime_error);
}

TEST(ToolConfigTest, RejectsNonNumericSeed) {
    EXPECT_THROW(parse({"shardb-tool", "--seed", "abc", "info"}), std::runtime_error);
}

TEST(ToolConfigTest, HelpIsReportedWithUsage) {
    try {
        parse({"shardb-tool", "--help"});
        FAIL() << "expected --help to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Usage: shardb-tool"), std::string::npos);
    }
}

// ── Command table ─────────────────────────────────────────────────────────────

TEST(ToolConfigTest, CommandArity) {
    EXPECT_EQ(shardb::command_arity("info"),     0);
    EXPECT_EQ(shardb::command_arity("create"),   1);
    EXPECT_EQ(shardb::command_arity("put"),      3);
    EXPECT_EQ(shardb::command_arity("add"),      2);
    EXPECT_EQ(shardb::command_arity("optimize"), 0);
    EXPECT_EQ(shardb::command_arity("nope"),    -1);
}

TEST(ToolConfigTest, MutatingCommands) {
    EXPECT_TRUE(shardb::is_mutating("create"));
    EXPECT_TRUE(shardb::is_mutating("put"));
    EXPECT_TRUE(shardb::is_mutating("optimize"));
    EXPECT_FALSE(shardb::is_mutating("get"));
    EXPECT_FALSE(shardb::is_mutating("info"));
    EXPECT_FALSE(shardb::is_mutating("nope"));
}
