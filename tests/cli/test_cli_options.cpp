/// @file tests/cli/test_cli_options.cpp
/// @brief Flag parsing of the `thermo` command-line tool.

#include "thermo/cli_options.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using namespace thermo;
using namespace thermo::cli;

namespace {

struct Parsed {
    bool        ok;
    CliOptions  opts;
    std::string error;
};

Parsed parse(std::vector<std::string_view> flags) {
    Parsed p{};
    p.ok = parse_flags(flags, p.opts, p.error);
    return p;
}

} // anonymous namespace

// ════════════════════════════════════════════════════════════════════════════
// ParseReal / ParseCount
// ════════════════════════════════════════════════════════════════════════════

TEST(ParseReal, AcceptsCompleteFiniteNumbers) {
    EXPECT_EQ(parse_real("2.5").value_or(-1.0), 2.5);
    EXPECT_EQ(parse_real("-1e-3").value_or(-1.0), -1e-3);
    EXPECT_EQ(parse_real("0").value_or(-1.0), 0.0);
}

TEST(ParseReal, RejectsGarbageAndNonFinite) {
    EXPECT_FALSE(parse_real(""));
    EXPECT_FALSE(parse_real("abc"));
    EXPECT_FALSE(parse_real("1.5x"));
    EXPECT_FALSE(parse_real("nan"));
    EXPECT_FALSE(parse_real("inf"));
    EXPECT_FALSE(parse_real("-inf"));
    EXPECT_FALSE(parse_real("1e999"));
}

TEST(ParseCount, AcceptsWholeNumbers) {
    EXPECT_EQ(parse_count("4").value_or(0), 4u);
    EXPECT_EQ(parse_count("1048576").value_or(0), 1048576u);
}

TEST(ParseCount, RejectsFractionsSignsAndExponents) {
    EXPECT_FALSE(parse_count(""));
    EXPECT_FALSE(parse_count("2.7"));
    EXPECT_FALSE(parse_count("-1"));
    EXPECT_FALSE(parse_count("1e12"));
    EXPECT_FALSE(parse_count("nan"));
    EXPECT_FALSE(parse_count("99999999999999999999999"));
}

// ════════════════════════════════════════════════════════════════════════════
// ParseFlags
// ════════════════════════════════════════════════════════════════════════════

TEST(ParseFlags, NoFlagsKeepsDefaults) {
    const auto p = parse({});
    ASSERT_TRUE(p.ok);
    EXPECT_EQ(p.opts.penalty_weight, constants::DEFAULT_PENALTY_WEIGHT);
    EXPECT_EQ(p.opts.histogram.num_bins, constants::DEFAULT_NUM_BINS);
    EXPECT_EQ(p.opts.engine.mode, ExecutionMode::Parallel);
    EXPECT_FALSE(p.opts.engine.verbose);
}

TEST(ParseFlags, EveryFlagReachesItsField) {
    const auto p = parse({"--lambda", "2.5", "--bins", "16",
                          "--min", "200", "--max", "900",
                          "--gamma1", "0.5", "--gamma2", "1.5",
                          "--alpha", "3", "--beta", "0.25",
                          "--deterministic", "--verbose"});
    ASSERT_TRUE(p.ok) << p.error;
    EXPECT_EQ(p.opts.penalty_weight, 2.5);
    EXPECT_EQ(p.opts.histogram.num_bins, 16u);
    EXPECT_EQ(p.opts.histogram.domain_min, 200.0);
    EXPECT_EQ(p.opts.histogram.domain_max, 900.0);
    EXPECT_EQ(p.opts.histogram.entropy_weight, 0.5);
    EXPECT_EQ(p.opts.histogram.divergence_weight, 1.5);
    EXPECT_EQ(p.opts.ranking.alpha, 3.0);
    EXPECT_EQ(p.opts.ranking.beta, 0.25);
    EXPECT_EQ(p.opts.engine.mode, ExecutionMode::Deterministic);
    EXPECT_TRUE(p.opts.engine.verbose);
}

TEST(ParseFlags, BinsRejectsNaNHugeFractionalAndZero) {
    for (std::string_view bad : {"nan", "1e12", "2.7", "0", "-3", "1048577"}) {
        const auto p = parse({"--bins", bad});
        EXPECT_FALSE(p.ok) << bad;
        EXPECT_NE(p.error.find("--bins"), std::string::npos) << bad;
    }
}

TEST(ParseFlags, BinsAcceptsTheCap) {
    const auto p = parse({"--bins", "1048576"});
    ASSERT_TRUE(p.ok) << p.error;
    EXPECT_EQ(p.opts.histogram.num_bins, constants::MAX_NUM_BINS);
}

TEST(ParseFlags, NonFiniteRealIsRejected) {
    const auto p = parse({"--lambda", "inf"});
    EXPECT_FALSE(p.ok);
    EXPECT_EQ(p.error, "invalid value 'inf' for --lambda");
}

TEST(ParseFlags, MissingValue) {
    const auto p = parse({"--deterministic", "--alpha"});
    EXPECT_FALSE(p.ok);
    EXPECT_EQ(p.error, "--alpha requires a value");
}

TEST(ParseFlags, UnknownFlag) {
    const auto p = parse({"--frobnicate", "1"});
    EXPECT_FALSE(p.ok);
    EXPECT_EQ(p.error, "unknown option '--frobnicate'");
}
