#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/gate_errors.hpp"

namespace {

using hookgate::app::cli::parse_and_validate;
using hookgate::core::errors::ErrorCategory;
using hookgate::core::errors::get_error;
using hookgate::core::errors::get_value;
using hookgate::core::errors::is_error;
using hookgate::protocol::CommandKind;
using hookgate::protocol::GateRequest;

hookgate::core::errors::Result<GateRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("hookgate");
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
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
    EXPECT_NE(get_error(result).hint.find("loop-setup"), std::string::npos);
}

TEST(CliParserTest, FailsWhenArgumentUnknown) {
    auto result = parse_tokens({"hook", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"loop-cancel", "--session"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenLoopFlagGivenToHook) {
    auto result = parse_tokens({"hook", "--max-iterations", "3"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");

    result = parse_tokens({"doctor", "--session", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenMaxIterationsMissing) {
    auto result = parse_tokens({"loop-setup", "--task", "fix tests"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenMaxIterationsNotNumeric) {
    auto result = parse_tokens({"loop-setup", "--max-iterations", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxIterationsHasTrailingCharacters) {
    auto result = parse_tokens({"loop-setup", "--max-iterations", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxIterationsOutOfBounds) {
    auto result = parse_tokens({"loop-setup", "--max-iterations", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");

    result = parse_tokens({"loop-setup", "--max-iterations", "10001"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenCompletionPromiseSpansLines) {
    auto result = parse_tokens(
        {"loop-setup", "--max-iterations", "3", "--completion-promise", "ALL\nDONE"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_completion_token");
}

TEST(CliParserTest, ParsesHookWithOverrides) {
    auto result = parse_tokens({"hook", "--project-dir", "/work/app", "--config", "gate.json"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CommandKind::Hook);
    ASSERT_TRUE(req.overrides.project_dir.has_value());
    EXPECT_EQ(req.overrides.project_dir->string(), "/work/app");
    ASSERT_TRUE(req.overrides.config_file.has_value());
    EXPECT_EQ(req.overrides.config_file->string(), "gate.json");
    EXPECT_FALSE(req.session_id.has_value());
}

TEST(CliParserTest, ParsesValidLoopSetup) {
    auto result = parse_tokens({"loop-setup", "--max-iterations", "42", "--session", "s-1",
                                "--completion-promise", "SHIPPED", "--task", "fix issue"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CommandKind::LoopSetup);
    EXPECT_EQ(req.max_iterations, 42u);
    ASSERT_TRUE(req.session_id.has_value());
    EXPECT_EQ(req.session_id.value(), "s-1");
    ASSERT_TRUE(req.completion_token.has_value());
    EXPECT_EQ(req.completion_token.value(), "SHIPPED");
    ASSERT_TRUE(req.task_text.has_value());
    EXPECT_EQ(req.task_text.value(), "fix issue");
}

TEST(CliParserTest, LoopSetupWithoutTaskReadsStdinLater) {
    auto result = parse_tokens({"loop-setup", "--max-iterations", "5"});
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).task_text.has_value());
    EXPECT_FALSE(get_value(result).completion_token.has_value());
}

TEST(CliParserTest, ParsesLoopStatusAndCancel) {
    auto status = parse_tokens({"loop-status"});
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status).command, CommandKind::LoopStatus);

    auto cancel = parse_tokens({"loop-cancel", "--session", "abc"});
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel).command, CommandKind::LoopCancel);
    EXPECT_EQ(get_value(cancel).session_id.value(), "abc");
}

}  // namespace
