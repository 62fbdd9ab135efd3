#include "pool.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

TEST(PoolAllocator, AllocationsAreAlignedAndDisjoint) {
    PoolAllocator pool(4096);
    ASSERT_EQ(pool.capacity, 4096u);

    std::uint64_t* a = pool.allocate<std::uint64_t>(3, 64);
    std::uint64_t* b = pool.allocate<std::uint64_t>(5, 64);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(a) % 64, 0u);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(b) % 64, 0u);
    EXPECT_GE(reinterpret_cast<char*>(b), reinterpret_cast<char*>(a + 3));
    EXPECT_EQ(pool.used(), 64u + 5 * sizeof(std::uint64_t));
}

TEST(PoolAllocator, CapacityRoundsUpToCacheLine) {
    PoolAllocator pool(100);
    EXPECT_EQ(pool.capacity, 128u);
}

TEST(PoolAllocator, ExhaustionReturnsNullAndResetReclaims) {
    PoolAllocator pool(256);
    EXPECT_NE(pool.allocate<std::uint64_t>(32), nullptr);
    EXPECT_EQ(pool.allocate<std::uint64_t>(1), nullptr);
    EXPECT_EQ(pool.remaining(), 0u);

    pool.reset();
    EXPECT_EQ(pool.used(), 0u);
    EXPECT_NE(pool.allocate<std::uint64_t>(32), nullptr);
}

TEST(PoolAllocator, HugeCountDoesNotOverflow) {
    PoolAllocator pool(256);
    EXPECT_EQ(pool.allocate<std::uint64_t>(SIZE_MAX / 4), nullptr);
    EXPECT_EQ(pool.used(), 0u);
}

TEST(PoolAllocator, ZeroCapacityPoolNeverAllocates) {
    PoolAllocator pool(0);
    EXPECT_EQ(pool.capacity, 0u);
    EXPECT_EQ(pool.allocate<std::uint64_t>(1), nullptr);
}

TEST(ArenaScope, ResetsOnNormalExitAndOnException) {
    PoolAllocator pool(1024);
    {
        ArenaScope scope(pool);
        ASSERT_NE(pool.allocate<std::uint64_t>(10), nullptr);
        EXPECT_GT(pool.used(), 0u);
    }
    EXPECT_EQ(pool.used(), 0u);

    auto failedLaunch = [&pool]() {
        ArenaScope scope(pool);
        pool.allocate<std::uint64_t>(10);
        throw std::runtime_error("launch failed");
    };
    EXPECT_THROW(failedLaunch(), std::runtime_error);
    EXPECT_EQ(pool.used(), 0u);
}
