/**
 * @file test_cli.cpp
 * @brief Console harness option parsing tests.
 */

#include <gtest/gtest.h>
#include "../src/cli_options.h"
#include <cstdint>
#include <string>
#include <vector>

namespace {

// argv needs mutable storage
bool parse(std::vector<std::string> args, CliOptions& opt) {
    args.insert(args.begin(), "ctk_cli");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(&a[0]);
    return ParseArgs(static_cast<int>(argv.size()), argv.data(), opt);
}

} // namespace

TEST(CliSeedTest, AcceptsFullRange) {
    uint32_t seed = 7;
    EXPECT_TRUE(ParseSeed("0", seed));
    EXPECT_EQ(seed, 0u);
    EXPECT_TRUE(ParseSeed("2024", seed));
    EXPECT_EQ(seed, 2024u);
    EXPECT_TRUE(ParseSeed("4294967295", seed));
    EXPECT_EQ(seed, UINT32_MAX);
}

TEST(CliSeedTest, RejectsOutOfRange) {
    uint32_t seed = 7;
    EXPECT_FALSE(ParseSeed("4294967296", seed));
    EXPECT_FALSE(ParseSeed("4294967297", seed));
    EXPECT_FALSE(ParseSeed("99999999999999999999999", seed));
    EXPECT_EQ(seed, 7u);
}

TEST(CliSeedTest, RejectsNonInteger) {
    uint32_t seed = 7;
    EXPECT_FALSE(ParseSeed("1e20", seed));
    EXPECT_FALSE(ParseSeed("1.5", seed));
    EXPECT_FALSE(ParseSeed("-1", seed));
    EXPECT_FALSE(ParseSeed("+3", seed));
    EXPECT_FALSE(ParseSeed(" 3", seed));
    EXPECT_FALSE(ParseSeed("12abc", seed));
    EXPECT_FALSE(ParseSeed("", seed));
    EXPECT_FALSE(ParseSeed(nullptr, seed));
    EXPECT_EQ(seed, 7u);
}

TEST(CliArgsTest, SeedFlag) {
    CliOptions opt;
    ASSERT_TRUE(parse({"--seed", "42"}, opt));
    EXPECT_TRUE(opt.has_seed);
    EXPECT_EQ(opt.seed, 42u);

    CliOptions huge;
    EXPECT_FALSE(parse({"--seed", "1e20"}, huge));
    CliOptions wrapped;
    EXPECT_FALSE(parse({"--seed", "4294967297"}, wrapped));
}

TEST(CliArgsTest, AllFlags) {
    CliOptions opt;
    ASSERT_TRUE(parse({"--preset", "p.json", "--target", "210", "--wind", "-3.5",
                       "--angle", "40", "--path", "--dump-preset", "--verbose"}, opt));
    EXPECT_EQ(opt.preset_path, "p.json");
    EXPECT_DOUBLE_EQ(opt.target_m, 210.0);
    EXPECT_DOUBLE_EQ(opt.wind_ms, -3.5);
    EXPECT_DOUBLE_EQ(opt.angle_deg, 40.0);
    EXPECT_TRUE(opt.print_path);
    EXPECT_TRUE(opt.dump_preset);
    EXPECT_TRUE(opt.verbose);
    EXPECT_FALSE(opt.has_seed);
}

TEST(CliArgsTest, RejectsMalformedInput) {
    CliOptions opt;
    EXPECT_FALSE(parse({"--target"}, opt));
    EXPECT_FALSE(parse({"--target", "far"}, opt));
    EXPECT_FALSE(parse({"--wind", "nan"}, opt));
    EXPECT_FALSE(parse({"--bogus"}, opt));
}
