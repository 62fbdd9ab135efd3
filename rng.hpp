// ========================================
// rng.hpp - Seeds and Lane Generators
// ========================================
/**
 * @file rng.hpp
 * @brief SplitMix64 generator and the seed stream that feeds trials and lanes.
 *
 * SplitMix64 advances a 64-bit counter by a fixed odd increment and passes it
 * through a bijective mixer. Two consequences matter here:
 * - Seeds taken from one `SeedStream` are pairwise distinct for 2^64 draws,
 *   so no two trials of a batch ever share a seed.
 * - A lane generator is a single 64-bit word of state: cheap to keep per lane
 *   and trivially reproducible from its seed.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <random>
#include <vector>

/**
 * @brief SplitMix64; satisfies UniformRandomBitGenerator.
 */
class SplitMix64 {
public:
    using result_type = std::uint64_t;

    static constexpr std::uint64_t kGamma = 0x9E3779B97F4A7C15ULL;

    explicit SplitMix64(std::uint64_t seed) : state_(seed) {}

    std::uint64_t next() {
        state_ += kGamma;
        std::uint64_t z = state_;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    std::uint64_t operator()() { return next(); }

    static constexpr std::uint64_t min() { return 0; }
    static constexpr std::uint64_t max() { return std::numeric_limits<std::uint64_t>::max(); }

private:
    std::uint64_t state_;
};

/**
 * @brief Source of per-trial and per-lane seeds.
 *
 * Default construction takes its base from `std::random_device`, so each run
 * uses fresh entropy. Passing an explicit base makes the whole batch
 * reproducible.
 */
class SeedStream {
public:
    SeedStream() : gen_(freshBase()) {}
    explicit SeedStream(std::uint64_t base) : gen_(base) {}

    std::uint64_t next() { return gen_.next(); }

    /// The next `count` seeds, in order.
    std::vector<std::uint64_t> take(std::size_t count) {
        std::vector<std::uint64_t> seeds(count);
        for (auto& s : seeds) s = gen_.next();
        return seeds;
    }

private:
    static std::uint64_t freshBase() {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }

    SplitMix64 gen_;
};
