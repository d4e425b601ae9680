#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/broker_errors.hpp"

namespace {

using pokeme::app::cli::CliCommand;
using pokeme::app::cli::CommandKind;
using pokeme::app::cli::parse_and_validate;
using pokeme::core::errors::ErrorCategory;
using pokeme::core::errors::get_error;
using pokeme::core::errors::get_value;
using pokeme::core::errors::is_error;
using pokeme::protocol::RequestType;

pokeme::core::errors::Result<CliCommand> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("pokeme");
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
    EXPECT_EQ(get_error(result).code, "missing_command_name");
}

TEST(CliParserTest, FailsOnUnknownCommand) {
    auto result = parse_tokens({"launch"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ParsesAskWithMetadata) {
    auto result = parse_tokens({"ask", "Which port?", "--context", "ports clash", "-a",
                                "builder", "-t", "deploy", "--timeout", "30"});
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const CliCommand& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Ask);
    EXPECT_EQ(cmd.request.question, "Which port?");
    EXPECT_EQ(cmd.request.request_type, RequestType::Question);
    EXPECT_EQ(cmd.request.context.value_or(""), "ports clash");
    EXPECT_EQ(cmd.request.agent.value_or(""), "builder");
    EXPECT_EQ(cmd.request.task.value_or(""), "deploy");
    EXPECT_FALSE(cmd.request.command.has_value());
    EXPECT_EQ(cmd.timeout, std::chrono::seconds(30));
    EXPECT_EQ(cmd.port, 9131);
}

TEST(CliParserTest, PermitUsesDefaultQuestion) {
    auto result = parse_tokens({"permit", "rm -rf /tmp/cache"});
    ASSERT_FALSE(is_error(result));

    const CliCommand& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Permit);
    EXPECT_EQ(cmd.request.request_type, RequestType::Permission);
    EXPECT_EQ(cmd.request.command.value_or(""), "rm -rf /tmp/cache");
    EXPECT_EQ(cmd.request.question, "Allow this command?");
    EXPECT_EQ(cmd.timeout, std::chrono::seconds(300));
}

TEST(CliParserTest, PermitAcceptsCustomQuestion) {
    auto result = parse_tokens({"permit", "make install", "-q", "Install globally?"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).request.question, "Install globally?");
}

TEST(CliParserTest, ParsesAnswerAndDecisions) {
    auto answer = parse_tokens({"answer", "aabbccddeeff", "use staging"});
    ASSERT_FALSE(is_error(answer));
    EXPECT_EQ(get_value(answer).kind, CommandKind::Answer);
    EXPECT_EQ(get_value(answer).request_id, "aabbccddeeff");
    EXPECT_EQ(get_value(answer).answer_text, "use staging");

    auto deny = parse_tokens({"deny", "aabbccddeeff", "--comment", "too risky"});
    ASSERT_FALSE(is_error(deny));
    EXPECT_EQ(get_value(deny).kind, CommandKind::Deny);
    EXPECT_EQ(get_value(deny).comment, "too risky");

    auto approve = parse_tokens({"approve", "aabbccddeeff"});
    ASSERT_FALSE(is_error(approve));
    EXPECT_EQ(get_value(approve).kind, CommandKind::Approve);
    EXPECT_TRUE(get_value(approve).comment.empty());
}

TEST(CliParserTest, ServeAcceptsEphemeralPortAndIdleTimeout) {
    auto result = parse_tokens({"serve", "--port", "0", "--idle-timeout", "60", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const CliCommand& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Serve);
    EXPECT_EQ(cmd.port, 0);
    EXPECT_EQ(cmd.idle_timeout, std::chrono::seconds(60));
    EXPECT_TRUE(cmd.verbose);
}

TEST(CliParserTest, ClientCommandsRejectPortZero) {
    auto result = parse_tokens({"status", "--port", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, RejectsNonNumericTimeout) {
    auto result = parse_tokens({"ask", "q", "--timeout", "soon"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");

    result = parse_tokens({"ask", "q", "--timeout", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, RejectsFlagsForOtherCommands) {
    auto result = parse_tokens({"status", "--comment", "hi"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");

    result = parse_tokens({"ask", "q", "--question", "other"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, RejectsUnknownFlag) {
    auto result = parse_tokens({"ask", "q", "--force"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, MissingFlagValueIsReported) {
    auto result = parse_tokens({"ask", "q", "--agent"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, PositionalCountIsChecked) {
    auto result = parse_tokens({"ask"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");

    result = parse_tokens({"answer", "aabbccddeeff"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");

    result = parse_tokens({"shutdown", "now"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

}  // namespace
