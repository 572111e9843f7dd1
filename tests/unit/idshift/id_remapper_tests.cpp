#include <gtest/gtest.h>

#include "id_remapper.hpp"
#include "shift_errors.hpp"

#include <cstdint>
#include <vector>

using idshift::shift::ConfigurationError;
using idshift::shift::IdKind;
using idshift::shift::IdRange;
using idshift::shift::IdRemapper;
using idshift::shift::OutOfRangeError;

TEST(IdRemapper, AddsOffsetToIdentifiersOutsideExclusions)
{
    IdRemapper remapper(IdKind::User, 100000);
    EXPECT_EQ(remapper.remap(0), 100000u);
    EXPECT_EQ(remapper.remap(1000), 101000u);
}

TEST(IdRemapper, SupportsNegativeOffsets)
{
    IdRemapper remapper(IdKind::Group, -100000);
    EXPECT_EQ(remapper.remap(101000), 1000u);
    EXPECT_EQ(remapper.remap(100000), 0u);
}

TEST(IdRemapper, LeavesExcludedIdentifiersUnchangedRegardlessOfOffset)
{
    std::vector<IdRange> excluded{{0, 1000}, {65534, 65535}};
    for (std::int64_t offset : {std::int64_t{-5}, std::int64_t{0}, std::int64_t{100000}})
    {
        IdRemapper remapper(IdKind::User, offset, excluded);
        EXPECT_FALSE(remapper.remap(0).has_value());
        EXPECT_FALSE(remapper.remap(500).has_value());
        EXPECT_FALSE(remapper.remap(999).has_value());
        EXPECT_FALSE(remapper.remap(65534).has_value());
    }

    IdRemapper remapper(IdKind::User, 100000, excluded);
    EXPECT_EQ(remapper.remap(1000), 101000u);
    EXPECT_EQ(remapper.remap(65535), 165535u);
}

TEST(IdRemapper, OverlappingRangesBehaveAsUnion)
{
    IdRemapper remapper(IdKind::User, 10, {{0, 100}, {50, 200}});
    EXPECT_FALSE(remapper.remap(150).has_value());
    EXPECT_EQ(remapper.remap(200), 210u);
}

TEST(IdRemapper, ZeroOffsetMapsOntoItself)
{
    IdRemapper remapper(IdKind::User, 0);
    ASSERT_TRUE(remapper.remap(42).has_value());
    EXPECT_EQ(*remapper.remap(42), 42u);
    EXPECT_FALSE(remapper.changedId(42).has_value());
    EXPECT_EQ(IdRemapper(IdKind::User, 1).changedId(42), 43u);
}

TEST(IdRemapper, RejectsResultsAboveTheIdentifierSpace)
{
    IdRemapper remapper(IdKind::User, 100000);
    try
    {
        (void)remapper.remap(4294000000u);
        FAIL() << "expected OutOfRangeError";
    }
    catch (const OutOfRangeError &error)
    {
        EXPECT_EQ(error.kind(), IdKind::User);
        EXPECT_EQ(error.original(), 4294000000u);
        EXPECT_EQ(error.computed(), std::int64_t{4294100000});
        EXPECT_NE(std::string(error.what()).find("4294100000"), std::string::npos);
    }

    EXPECT_EQ(IdRemapper(IdKind::User, 1).remap(4294967294u), 4294967295u);
    EXPECT_THROW((void)IdRemapper(IdKind::User, 1).remap(4294967295u), OutOfRangeError);
}

TEST(IdRemapper, RejectsNegativeResults)
{
    IdRemapper remapper(IdKind::Group, -100000);
    EXPECT_THROW((void)remapper.remap(99999), OutOfRangeError);
}

TEST(IdRemapper, ExclusionReachingTopOfSpaceCoversMaximumId)
{
    IdRemapper remapper(IdKind::User, 1, {{4000000000u, idshift::shift::kIdSpaceSize}});
    EXPECT_FALSE(remapper.remap(4294967295u).has_value());
}

TEST(IdRemapper, RejectsMalformedConfiguration)
{
    EXPECT_THROW(IdRemapper(IdKind::User, 0, {{10, 5}}), ConfigurationError);
    EXPECT_THROW(IdRemapper(IdKind::User, 0, {{0, idshift::shift::kIdSpaceSize + 1}}), ConfigurationError);
    EXPECT_THROW(IdRemapper(IdKind::User, std::int64_t{1} << 32), ConfigurationError);
    EXPECT_THROW(IdRemapper(IdKind::Group, -(std::int64_t{1} << 32)), ConfigurationError);
    EXPECT_NO_THROW(IdRemapper(IdKind::User, 0, {{5, 5}}));
}
