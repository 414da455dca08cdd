#include <array>

#include <gtest/gtest.h>

#include "frameisa/cli/commands.hpp"

namespace {
    const std::array<frameisa::cli::CommandSpec, 3> kCommands = {{
        {frameisa::cli::CommandId::Help, "help", 0, 0},
        {frameisa::cli::CommandId::Calc, "calc", 2, 3},
        {frameisa::cli::CommandId::Decode, "decode", 1, 1},
    }};
} // namespace

TEST(CliCommands, MatchesNameAndForwardsArgs) {
    const char* argv[] = {"calc", "+", "15", "7"};
    frameisa::cli::CommandInvocation inv{};
    frameisa::cli::u32 consumed = 0;
    const frameisa::core::Status s = frameisa::cli::parse_command({argv, 4}, kCommands.data(), kCommands.size(), &inv, &consumed);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(inv.id, frameisa::cli::CommandId::Calc);
    ASSERT_NE(inv.spec, nullptr);
    EXPECT_STREQ(inv.spec->name, "calc");
    ASSERT_EQ(inv.args.argc, 3u);
    EXPECT_STREQ(inv.args.argv[0], "+");
    EXPECT_STREQ(inv.args.argv[2], "7");
}

TEST(CliCommands, UnknownCommandIsNotFound) {
    const char* argv[] = {"frobnicate"};
    frameisa::cli::CommandInvocation inv{};
    frameisa::cli::u32 consumed = 0;
    const frameisa::core::Status s = frameisa::cli::parse_command({argv, 1}, kCommands.data(), kCommands.size(), &inv, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::NotFound);
    EXPECT_EQ(inv.id, frameisa::cli::CommandId::None);
    EXPECT_EQ(consumed, 0u);
}

TEST(CliCommands, RejectsOptionAndEmpty) {
    frameisa::cli::CommandInvocation inv{};
    frameisa::cli::u32 consumed = 0;

    const char* opt[] = {"-x"};
    EXPECT_EQ(frameisa::cli::parse_command({opt, 1}, kCommands.data(), kCommands.size(), &inv, &consumed).code,
              frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(frameisa::cli::parse_command({nullptr, 0}, kCommands.data(), kCommands.size(), &inv, &consumed).code,
              frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(frameisa::cli::parse_command({opt, 1}, kCommands.data(), kCommands.size(), nullptr, &consumed).code,
              frameisa::core::StatusCode::Invalid);
}

TEST(CliCommands, CheckArity) {
    const frameisa::cli::CommandSpec& calc = kCommands[1];
    EXPECT_EQ(frameisa::cli::check_arity(calc, 1).code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(frameisa::cli::check_arity(calc, 1).aux, 1u);
    EXPECT_EQ(frameisa::cli::check_arity(calc, 2).code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(frameisa::cli::check_arity(calc, 3).code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(frameisa::cli::check_arity(calc, 4).code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(frameisa::cli::check_arity(kCommands[0], 0).code, frameisa::core::StatusCode::Ok);
}
