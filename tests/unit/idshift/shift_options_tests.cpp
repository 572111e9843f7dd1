#include <gtest/gtest.h>

#include "shift_errors.hpp"
#include "shift_options.hpp"

#include "idshift/options.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace idshift::shift;

TEST(ShiftOptions, ParsesSingleIdentifierAsOneElementRange)
{
    EXPECT_EQ(parseIdRange("1000"), (IdRange{1000, 1001}));
    EXPECT_EQ(parseIdRange("0x10"), (IdRange{16, 17}));
}

TEST(ShiftOptions, ParsesInclusiveRangesWithOpenEnds)
{
    EXPECT_EQ(parseIdRange("0-999"), (IdRange{0, 1000}));
    EXPECT_EQ(parseIdRange("-999"), (IdRange{0, 1000}));
    EXPECT_EQ(parseIdRange("100000-"), (IdRange{100000, kIdSpaceSize}));
    EXPECT_EQ(parseIdRange("-"), (IdRange{0, kIdSpaceSize}));
    EXPECT_EQ(parseIdRange("5-5"), (IdRange{5, 6}));
    EXPECT_EQ(parseIdRange("0-4294967295"), (IdRange{0, kIdSpaceSize}));
}

TEST(ShiftOptions, RejectsMalformedRanges)
{
    EXPECT_THROW(parseIdRange(""), ConfigurationError);
    EXPECT_THROW(parseIdRange("abc"), ConfigurationError);
    EXPECT_THROW(parseIdRange("10-5"), ConfigurationError);
    EXPECT_THROW(parseIdRange("1-2-3"), ConfigurationError);
    EXPECT_THROW(parseIdRange("4294967296"), ConfigurationError);
    EXPECT_THROW(parseIdRanges({"1-2", "x"}), ConfigurationError);
}

TEST(ShiftOptions, ParsesOffsetPairs)
{
    EXPECT_EQ(parseOffsets("100000"), (std::pair<std::int64_t, std::int64_t>{100000, 100000}));
    EXPECT_EQ(parseOffsets("100000:0"), (std::pair<std::int64_t, std::int64_t>{100000, 0}));
    EXPECT_EQ(parseOffsets("-100000:-200000"), (std::pair<std::int64_t, std::int64_t>{-100000, -200000}));
    EXPECT_EQ(parseOffsets("0x186a0"), (std::pair<std::int64_t, std::int64_t>{100000, 100000}));
}

TEST(ShiftOptions, RejectsMalformedOffsets)
{
    EXPECT_THROW(parseOffsets(""), ConfigurationError);
    EXPECT_THROW(parseOffsets("12:"), ConfigurationError);
    EXPECT_THROW(parseOffsets("1:2:3"), ConfigurationError);
    EXPECT_THROW(parseOffsets("ten"), ConfigurationError);
}

TEST(ShiftOptions, RegistersExpectedDefinitions)
{
    idshift::config::OptionRegistry registry("idshift");
    registerShiftOptions(registry);

    EXPECT_TRUE(registry.hasOption(kOptionExcludeUidRanges));
    EXPECT_TRUE(registry.hasOption(kOptionExcludePaths));
    EXPECT_TRUE(registry.getBool(kOptionShiftOwner));
    EXPECT_TRUE(registry.getBool(kOptionShiftAcl));
    EXPECT_TRUE(registry.getBool(kOptionImplicitDryRun));
    EXPECT_FALSE(registry.getBool(kOptionQuiet));
    EXPECT_TRUE(registry.getStringList(kOptionExcludeGidRanges).empty());

    EXPECT_TRUE(registry.hasOption(kOptionExcludeGidRanges));
    EXPECT_FALSE(registry.hasOption("excludeUids"));
}

TEST(ShiftOptions, ParsesIntegerLiteralsLikeTheCommandLineGrammar)
{
    EXPECT_EQ(parseInteger("0").value_or(-1), 0);
    EXPECT_EQ(parseInteger("000").value_or(-1), 0);
    EXPECT_EQ(parseInteger("100000").value_or(-1), 100000);
    EXPECT_EQ(parseInteger("+42").value_or(-1), 42);
    EXPECT_EQ(parseInteger("-42").value_or(-1), -42);
    EXPECT_EQ(parseInteger("0x186A0").value_or(-1), 100000);
    EXPECT_EQ(parseInteger("0o303240").value_or(-1), 100000);
    EXPECT_EQ(parseInteger("0b101").value_or(-1), 5);
    EXPECT_EQ(parseInteger("100_000").value_or(-1), 100000);
    EXPECT_EQ(parseInteger("0x_ff").value_or(-1), 255);
    EXPECT_EQ(parseInteger("-9223372036854775808").value_or(-1), std::numeric_limits<std::int64_t>::min());
}

TEST(ShiftOptions, RejectsLeadingZerosAndMalformedLiterals)
{
    EXPECT_FALSE(parseInteger("0100000").has_value());
    EXPECT_FALSE(parseInteger("007").has_value());
    EXPECT_FALSE(parseInteger("0x").has_value());
    EXPECT_FALSE(parseInteger("0o8").has_value());
    EXPECT_FALSE(parseInteger("0b2").has_value());
    EXPECT_FALSE(parseInteger("_1").has_value());
    EXPECT_FALSE(parseInteger("1__0").has_value());
    EXPECT_FALSE(parseInteger("10_").has_value());
    EXPECT_FALSE(parseInteger(" 10").has_value());
    EXPECT_FALSE(parseInteger("--1").has_value());
    EXPECT_FALSE(parseInteger("9223372036854775808").has_value());

    EXPECT_THROW(parseOffsets("0100000"), ConfigurationError);
    EXPECT_THROW(parseIdRange("0100-0200"), ConfigurationError);
}
