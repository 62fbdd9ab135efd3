#include "sample_table.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <random>
#include <vector>

TEST(SampleTable, RejectsEmptyTables) {
    EXPECT_THROW(SampleTable(std::vector<std::uint32_t>{}), ConfigError);

    ZipfDistribution dist(kZipfSupport, 4.0);
    std::mt19937_64 rng(1);
    EXPECT_THROW(SampleTable::build(dist, 0, rng), ConfigError);
}

TEST(SampleTable, LookupWrapsModuloLength) {
    SampleTable table({5, 6, 7});
    EXPECT_EQ(table.size(), 3u);
    EXPECT_EQ(table.at(0), 5u);
    EXPECT_EQ(table.at(2), 7u);
    EXPECT_EQ(table.at(4), 6u);
    EXPECT_EQ(table.at(3000000002ULL), 7u);
    EXPECT_EQ(table.at(std::numeric_limits<std::uint64_t>::max()), 5u);
}

TEST(SampleTable, BuildDrawsFromDistribution) {
    ZipfDistribution dist(kZipfSupport, 4.0);
    std::mt19937_64 rng(77);
    SampleTable table = SampleTable::build(dist, 100000, rng);

    ASSERT_EQ(table.size(), 100000u);
    std::size_t ones = 0;
    for (std::size_t i = 0; i < table.size(); ++i) {
        ASSERT_GE(table.at(i), 1u);
        ASSERT_LE(table.at(i), kZipfSupport);
        if (table.at(i) == 1) ++ones;
    }
    EXPECT_NEAR(static_cast<double>(ones) / table.size(), 0.92394, 0.01);
}

TEST(SampleTable, SameGeneratorStateBuildsSameTable) {
    ZipfDistribution dist(kZipfSupport, 2.75);
    std::mt19937_64 a(9), b(9);
    SampleTable ta = SampleTable::build(dist, 4096, a);
    SampleTable tb = SampleTable::build(dist, 4096, b);
    for (std::size_t i = 0; i < ta.size(); ++i) ASSERT_EQ(ta.at(i), tb.at(i));
}

TEST(SampleTable, DefaultLengthIsSixteenMebiEntries) {
    EXPECT_EQ(SampleTable::kDefaultSize, 16777216u);
}
