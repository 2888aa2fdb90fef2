#include "core/SeedPattern.h"

#include <algorithm>
#include <gtest/gtest.h>

using namespace Convida;

TEST(SeedPatternTest, NameLookup)
{
    EXPECT_STREQ(getSeedPatternName(SeedPattern::Default), "default");
    EXPECT_STREQ(getSeedPatternName(SeedPattern::Glider), "glider");
    EXPECT_STREQ(getSeedPatternName(SeedPattern::Random), "random");

    auto parsed = parseSeedPattern("glider");
    ASSERT_TRUE(parsed.isValue());
    EXPECT_EQ(parsed.value(), SeedPattern::Glider);

    EXPECT_EQ(getSeedPatternNames(), "default, glider, random");
}

TEST(SeedPatternTest, UnknownNameIsAnError)
{
    auto parsed = parseSeedPattern("spaceship");
    ASSERT_TRUE(parsed.isError());
    EXPECT_NE(parsed.errorValue().message.find("spaceship"), std::string::npos);

    // Lookup is case sensitive.
    EXPECT_TRUE(parseSeedPattern("Random").isError());
}

TEST(SeedPatternTest, UnknownNameThrowsWhenSeeding)
{
    std::mt19937 rng(1);
    EXPECT_THROW(createCells("spaceship", 64, 8, rng), std::runtime_error);
}

TEST(SeedPatternTest, DefaultStripes)
{
    std::mt19937 rng(1);
    auto cells = createCells(SeedPattern::Default, 100, 10, rng);

    ASSERT_EQ(cells.size(), 100u);
    for (size_t i = 0; i < cells.size(); ++i) {
        const bool expectAlive = (i % 2 == 0) || (i % 7 == 0);
        EXPECT_EQ(cells[i], expectAlive ? Cell::Alive : Cell::Dead) << "index " << i;
    }
}

TEST(SeedPatternTest, DefaultByNameMatchesEnum)
{
    std::mt19937 rng(1);
    EXPECT_EQ(createCells("default", 49, 7, rng), createCells(SeedPattern::Default, 49, 7, rng));
}

TEST(SeedPatternTest, GliderAtOrigin)
{
    std::mt19937 rng(1);
    const size_t width = 8;
    auto cells = createCells(SeedPattern::Glider, 64, width, rng);

    ASSERT_EQ(cells.size(), 64u);
    const std::vector<size_t> alive = { 1, width + 2, 2 * width, 2 * width + 1, 2 * width + 2 };
    for (size_t i = 0; i < cells.size(); ++i) {
        const bool expectAlive = std::find(alive.begin(), alive.end(), i) != alive.end();
        EXPECT_EQ(cells[i], expectAlive ? Cell::Alive : Cell::Dead) << "index " << i;
    }
}

TEST(SeedPatternTest, GliderNeedsRoom)
{
    std::mt19937 rng(1);
    EXPECT_THROW(createCells(SeedPattern::Glider, 4, 2, rng), std::out_of_range);
    EXPECT_THROW(createCells(SeedPattern::Glider, 0, 0, rng), std::out_of_range);
    EXPECT_NO_THROW(createCells(SeedPattern::Glider, 9, 3, rng));
}

TEST(SeedPatternTest, RandomIsRoughlyHalfAlive)
{
    std::mt19937 rng(12345);
    auto cells = createCells(SeedPattern::Random, 10000, 100, rng);

    ASSERT_EQ(cells.size(), 10000u);
    const auto alive = std::count(cells.begin(), cells.end(), Cell::Alive);
    EXPECT_GT(alive, 4500);
    EXPECT_LT(alive, 5500);
}

TEST(SeedPatternTest, RandomIsReproducibleForSameSeed)
{
    std::mt19937 a(7);
    std::mt19937 b(7);
    EXPECT_EQ(createCells(SeedPattern::Random, 256, 16, a), createCells(SeedPattern::Random, 256, 16, b));
}

TEST(SeedPatternTest, EmptyBuffers)
{
    std::mt19937 rng(1);
    EXPECT_TRUE(createCells(SeedPattern::Default, 0, 0, rng).empty());
    EXPECT_TRUE(createCells(SeedPattern::Random, 0, 0, rng).empty());
}

TEST(SeedPatternTest, JsonConversion)
{
    nlohmann::json j = SeedPattern::Glider;
    EXPECT_EQ(j, "glider");
    EXPECT_EQ(nlohmann::json("default").get<SeedPattern>(), SeedPattern::Default);
    EXPECT_THROW(nlohmann::json("blinker").get<SeedPattern>(), std::runtime_error);
}
