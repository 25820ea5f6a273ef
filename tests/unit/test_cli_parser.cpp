#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/engine_errors.hpp"
#include "test_support.hpp"

namespace {

using turnloom::app::cli::CliCommand;
using turnloom::app::cli::CommandKind;
using turnloom::app::cli::parse_and_validate;
using turnloom::core::errors::ErrorCategory;
using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;
using turnloom::testing::TempWorkspace;

turnloom::core::errors::Result<CliCommand> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("turnloom");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenThreadIdentityMissing) {
    auto result = parse_tokens({"threads", "--project", "p"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"threads", "--project", "p", "--workspace", "w", "--bogus"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"threads", "--project", "p", "--workspace"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenThreadNotNumeric) {
    auto result = parse_tokens({"history", "--project", "p", "--workspace", "w", "--thread", "two"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenThreadIsZero) {
    auto result = parse_tokens({"history", "--project", "p", "--workspace", "w", "--thread", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenHistoryLimitOutOfBounds) {
    auto result = parse_tokens({"history", "--project", "p", "--workspace", "w", "--limit", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, ParsesHistoryPaging) {
    auto result = parse_tokens({"history", "--project", "p", "--workspace", "w", "--thread", "3",
                                "--before", "120", "--limit", "25"});
    ASSERT_FALSE(is_error(result));
    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::History);
    EXPECT_EQ(cmd.thread_local_id, 3u);
    ASSERT_TRUE(cmd.before_seq.has_value());
    EXPECT_EQ(*cmd.before_seq, 120u);
    EXPECT_EQ(cmd.limit, 25u);
}

TEST(CliParserTest, SendRequiresPrompt) {
    auto result = parse_tokens({"send", "--project", "p", "--workspace", "w"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, SendRejectsUnknownRunner) {
    auto result = parse_tokens(
        {"send", "--project", "p", "--workspace", "w", "--prompt", "hi", "--runner", "gpt"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_runner");
}

TEST(CliParserTest, SendRejectsUnknownEffort) {
    auto result = parse_tokens(
        {"send", "--project", "p", "--workspace", "w", "--prompt", "hi", "--effort", "max"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_effort");
}

TEST(CliParserTest, SendRejectsMissingWorkingDirectory) {
    TempWorkspace workspace("cli");
    const auto missing = (workspace.root() / "nope").string();
    auto result = parse_tokens(
        {"send", "--project", "p", "--workspace", "w", "--prompt", "hi", "--cwd", missing});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullSendCommand) {
    TempWorkspace workspace("cli");
    auto result = parse_tokens({"send", "--project", "p", "--workspace", "w", "--prompt",
                                "fix the build", "--cwd", workspace.root().string(), "--runner",
                                "claude", "--model", "sonnet", "--effort", "high", "--add-dir",
                                "/tmp/a", "--add-dir", "/tmp/b", "--db", "/tmp/t.db",
                                "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Send);
    EXPECT_EQ(cmd.prompt, "fix the build");
    EXPECT_EQ(cmd.working_directory.string(), std::filesystem::canonical(workspace.root()).string());
    ASSERT_TRUE(cmd.runner.has_value());
    EXPECT_TRUE(*cmd.runner == turnloom::protocol::AgentRunnerKind::Claude);
    EXPECT_EQ(cmd.model_id, "sonnet");
    ASSERT_TRUE(cmd.thinking_effort.has_value());
    EXPECT_TRUE(*cmd.thinking_effort == turnloom::protocol::ThinkingEffort::High);
    EXPECT_EQ(cmd.extra_dirs, (std::vector<std::string>{"/tmp/a", "/tmp/b"}));
    ASSERT_TRUE(cmd.db_path.has_value());
    EXPECT_EQ(cmd.db_path->string(), "/tmp/t.db");
    EXPECT_TRUE(cmd.verbose);
    EXPECT_EQ(cmd.thread_local_id, 1u);
}

TEST(CliParserTest, RenameRequiresTitle) {
    auto result = parse_tokens({"rename", "--project", "p", "--workspace", "w"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");

    auto renamed = parse_tokens(
        {"rename", "--project", "p", "--workspace", "w", "--title", "New", "--expect", "Old"});
    ASSERT_FALSE(is_error(renamed));
    EXPECT_EQ(get_value(renamed).title, "New");
    EXPECT_EQ(get_value(renamed).expected_title, "Old");
}

TEST(CliParserTest, ParsesDeleteWorkspace) {
    auto result = parse_tokens({"delete-workspace", "--project", "p", "--workspace", "w"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).kind, CommandKind::DeleteWorkspace);
}

}  // namespace
