#include <array>

#include <gtest/gtest.h>

#include "frameisa/cli/options.hpp"

namespace {
    const std::array<frameisa::cli::OptionSpec, 5> kSpecs = {{
        {frameisa::cli::OptionId::Output, frameisa::cli::OptionType::String, "output", 'o'},
        {frameisa::cli::OptionId::Hex, frameisa::cli::OptionType::Flag, "hex", 'x'},
        {frameisa::cli::OptionId::Verbose, frameisa::cli::OptionType::Flag, "verbose", 'v'},
        {frameisa::cli::OptionId::Tz, frameisa::cli::OptionType::I64, "tz", 'z'},
        {frameisa::cli::OptionId::Reference, frameisa::cli::OptionType::I64, "reference", 'r'},
    }};
} // namespace

TEST(CliOptions, ParsesLongAndShortAndStopsAtCommand) {
    const char* argv[] = {"--verbose", "--output", "out.bin", "-z", "-8", "calc", "+", "1", "2"};
    const frameisa::cli::CliArgs args{argv, 9};

    frameisa::cli::ParsedOption buf[8]{};
    frameisa::cli::ParsedOptions out{buf, 0, 8};
    frameisa::cli::u32 consumed = 0;
    const frameisa::core::Status s = frameisa::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, frameisa::cli::OptionId::Verbose);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, frameisa::cli::OptionId::Output);
    EXPECT_STREQ(out.data[1].value.str, "out.bin");

    EXPECT_EQ(out.data[2].id, frameisa::cli::OptionId::Tz);
    EXPECT_EQ(out.data[2].value.i64v, -8);
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const char* argv[] = {"--output=abc", "-r1700000000", "-x"};
    const frameisa::cli::CliArgs args{argv, 3};

    frameisa::cli::ParsedOption buf[8]{};
    frameisa::cli::ParsedOptions out{buf, 0, 8};
    frameisa::cli::u32 consumed = 0;
    const frameisa::core::Status s = frameisa::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(out.data[0].value.str, "abc");
    EXPECT_EQ(out.data[1].value.i64v, 1700000000);
    EXPECT_EQ(out.data[2].id, frameisa::cli::OptionId::Hex);
}

TEST(CliOptions, NegativeNumberIsPositional) {
    const char* argv[] = {"-5", "day"};
    const frameisa::cli::CliArgs args{argv, 2};

    frameisa::cli::ParsedOption buf[4]{};
    frameisa::cli::ParsedOptions out{buf, 0, 4};
    frameisa::cli::u32 consumed = 7;
    ASSERT_EQ(frameisa::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 0u);
    EXPECT_EQ(out.len, 0u);
}

TEST(CliOptions, LeadingDotNumberIsPositional) {
    const char* argv[] = {"-.5", "-x"};
    const frameisa::cli::CliArgs args{argv, 2};

    frameisa::cli::ParsedOption buf[4]{};
    frameisa::cli::ParsedOptions out{buf, 0, 4};
    frameisa::cli::u32 consumed = 7;
    ASSERT_EQ(frameisa::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 0u);
    EXPECT_EQ(out.len, 0u);
}

TEST(CliOptions, DoubleDashEndsOptions) {
    const char* argv[] = {"-x", "--", "-v"};
    const frameisa::cli::CliArgs args{argv, 3};

    frameisa::cli::ParsedOption buf[4]{};
    frameisa::cli::ParsedOptions out{buf, 0, 4};
    frameisa::cli::u32 consumed = 0;
    ASSERT_EQ(frameisa::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              frameisa::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    EXPECT_EQ(out.len, 1u);
}

TEST(CliOptions, ErrorsReportArgumentIndex) {
    frameisa::cli::ParsedOption buf[4]{};
    frameisa::cli::ParsedOptions out{buf, 0, 4};
    frameisa::cli::u32 consumed = 0;

    const char* unknown[] = {"-x", "--nope"};
    frameisa::core::Status s = frameisa::cli::parse_options({unknown, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, frameisa::core::StatusDomain::Cli);
    EXPECT_EQ(s.aux, 1u);

    const char* missing[] = {"--output"};
    s = frameisa::cli::parse_options({missing, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(s.aux, 0u);

    const char* flag_value[] = {"--hex=1"};
    s = frameisa::cli::parse_options({flag_value, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);

    const char* not_number[] = {"-v", "--tz", "east"};
    s = frameisa::cli::parse_options({not_number, 3}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(s.aux, 1u);
}

TEST(CliOptions, CapacityExceeded) {
    const char* argv[] = {"-x", "-v"};
    frameisa::cli::ParsedOption buf[1]{};
    frameisa::cli::ParsedOptions out{buf, 0, 1};
    frameisa::cli::u32 consumed = 0;
    const frameisa::core::Status s = frameisa::cli::parse_options({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);
    EXPECT_EQ(s.aux, 1u);
}

TEST(CliOptions, FindOptionLastWins) {
    const char* argv[] = {"-o", "a.bin", "-o", "b.bin"};
    frameisa::cli::ParsedOption buf[4]{};
    frameisa::cli::ParsedOptions out{buf, 0, 4};
    frameisa::cli::u32 consumed = 0;
    ASSERT_EQ(frameisa::cli::parse_options({argv, 4}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              frameisa::core::StatusCode::Ok);

    const frameisa::cli::ParsedOption* o = frameisa::cli::find_option(out, frameisa::cli::OptionId::Output);
    ASSERT_NE(o, nullptr);
    EXPECT_STREQ(o->value.str, "b.bin");
    EXPECT_EQ(frameisa::cli::find_option(out, frameisa::cli::OptionId::Hex), nullptr);
}
