#include "zipf.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

TEST(ZipfDistribution, RejectsZeroSupport) {
    EXPECT_THROW(ZipfDistribution(0, 2.75), ConfigError);
}

TEST(ZipfDistribution, RejectsNonPositiveShape) {
    EXPECT_THROW(ZipfDistribution(kZipfSupport, 0.0), ConfigError);
    EXPECT_THROW(ZipfDistribution(kZipfSupport, -1.5), ConfigError);
    EXPECT_THROW(ZipfDistribution(kZipfSupport, std::numeric_limits<double>::quiet_NaN()), ConfigError);
    EXPECT_THROW(ZipfDistribution(kZipfSupport, std::numeric_limits<double>::infinity()), ConfigError);
}

TEST(ZipfDistribution, DrawsStayInSupport) {
    ZipfDistribution dist(kZipfSupport, 1.1);
    std::mt19937_64 rng(11);
    for (int i = 0; i < 50000; ++i) {
        std::uint64_t v = dist(rng);
        ASSERT_GE(v, 1u);
        ASSERT_LE(v, kZipfSupport);
    }
    EXPECT_EQ(dist.min(), 1u);
    EXPECT_EQ(dist.max(), kZipfSupport);
}

TEST(ZipfDistribution, SingleElementAlwaysDrawsOne) {
    ZipfDistribution dist(1, 4.0);
    std::mt19937_64 rng(3);
    for (int i = 0; i < 100; ++i) EXPECT_EQ(dist(rng), 1u);
}

// P(1) = 1 / sum_k k^-s over the support.
TEST(ZipfDistribution, HeadProbabilityMatchesPowerLaw) {
    struct Case { double shape; double p1; double p2; };
    const Case cases[] = {
        {2.75, 0.79353, 0.11796},
        {4.0, 0.92394, 0.05775},
    };

    for (const auto& c : cases) {
        ZipfDistribution dist(kZipfSupport, c.shape);
        std::mt19937_64 rng(2024);
        const int draws = 200000;
        int ones = 0, twos = 0;
        for (int i = 0; i < draws; ++i) {
            std::uint64_t v = dist(rng);
            if (v == 1) ++ones;
            if (v == 2) ++twos;
        }
        EXPECT_NEAR(static_cast<double>(ones) / draws, c.p1, 0.01) << "shape " << c.shape;
        EXPECT_NEAR(static_cast<double>(twos) / draws, c.p2, 0.01) << "shape " << c.shape;
    }
}

TEST(ZipfDistribution, ReportsParameters) {
    ZipfDistribution dist(kZipfSupport, 2.75);
    EXPECT_DOUBLE_EQ(dist.shape(), 2.75);
    EXPECT_EQ(dist.support(), kZipfSupport);
}
