#include "ssz/tool/arg-options.h"
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

using ssz::tool::CommandLineOptions;
using ssz::tool::parse_argv;

namespace {

CommandLineOptions
parse(std::initializer_list<std::string> args)
{
    std::vector<std::string> storage = {"ssz-root"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : storage)
    {
        argv.push_back(arg.data());
    }
    return parse_argv(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(ArgOptions, PositionalInputFile)
{
    auto options = parse({"chunks.bin", "--limit", "64", "-p"});
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(options.input_file, "chunks.bin");
    EXPECT_FALSE(options.input_hex.has_value());
    EXPECT_EQ(options.limit, 64u);
    EXPECT_TRUE(options.pack);
    EXPECT_EQ(options.log_level, "error");
}

TEST(ArgOptions, HexInputWithMixIn)
{
    auto options =
        parse({"--hex", "0x01", "--mix-in-length", "3", "-b", "2", "-l", "debug"});
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(options.input_hex, "0x01");
    EXPECT_EQ(options.mix_in_length, 3u);
    EXPECT_EQ(options.branch_index, 2u);
    EXPECT_EQ(options.log_level, "debug");
}

TEST(ArgOptions, RequiresExactlyOneInput)
{
    EXPECT_FALSE(parse({}).valid);
    auto options = parse({"chunks.bin", "--hex", "00"});
    EXPECT_FALSE(options.valid);
    EXPECT_TRUE(options.error_message.has_value());
}

TEST(ArgOptions, MixInsAreExclusive)
{
    auto options = parse(
        {"--hex", "00", "--mix-in-length", "1", "--mix-in-selector", "1"});
    EXPECT_FALSE(options.valid);
}

TEST(ArgOptions, VerifyMode)
{
    const std::string zero(64, '0');
    auto options = parse(
        {"--verify",
         "--leaf",
         zero,
         "--branch",
         zero,
         "--branch",
         zero,
         "--index",
         "1",
         "--root",
         zero});
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_TRUE(options.verify);
    EXPECT_EQ(options.branch.size(), 2u);
    EXPECT_EQ(options.index, 1u);

    EXPECT_FALSE(parse({"--verify", "--leaf", zero}).valid);
}

TEST(ArgOptions, RejectsUnknownLevel)
{
    auto options = parse({"--hex", "00", "--level", "chatty"});
    EXPECT_FALSE(options.valid);
    EXPECT_EQ(options.error_message, "Unknown log level: chatty");
}

TEST(ArgOptions, RejectsMalformedNumbers)
{
    EXPECT_FALSE(parse({"--hex", "00", "--limit", "many"}).valid);
    EXPECT_FALSE(parse({"--unknown-flag"}).valid);
}

TEST(ArgOptions, Help)
{
    auto options = parse({"--help"});
    EXPECT_TRUE(options.show_help);
    EXPECT_NE(options.help_text.find("--mix-in-length"), std::string::npos);
}
