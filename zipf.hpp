// ========================================
// zipf.hpp - Zipf Demand Distributions
// ========================================
/**
 * @file zipf.hpp
 * @brief Discrete power-law distribution over `[1, N]`.
 *
 * `P(k)` is proportional to `k^-shape`. Weights are tabulated once at
 * construction and handed to `std::discrete_distribution`, so each draw costs
 * one uniform variate and a binary search over N cumulative weights.
 *
 * The simulator uses two instances per engine:
 * - job lot: units requested by one customer (default shape 2.75)
 * - itemwise traffic: customers arriving on one day (default shape 4.0)
 */

#pragma once

#include "errors.hpp"

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

/// Element-count bound of both demand distributions.
inline constexpr std::uint64_t kZipfSupport = 1000;

/**
 * @brief Zipf-like distribution with values in `[1, n]`.
 */
class ZipfDistribution {
public:
    using result_type = std::uint64_t;

    /**
     * @param n     Number of elements; values are drawn from `[1, n]`.
     * @param shape Power-law exponent.
     * @throws ConfigError if `n == 0` or `shape` is not a finite positive number.
     */
    ZipfDistribution(std::uint64_t n, double shape) : n_(n), shape_(shape) {
        if (n == 0)
            throw ConfigError("zipf: element count must be at least 1");
        if (!std::isfinite(shape) || shape <= 0.0)
            throw ConfigError("zipf: shape must be a positive number, got " + std::to_string(shape));

        std::vector<double> weights;
        weights.reserve(static_cast<std::size_t>(n));
        for (std::uint64_t k = 1; k <= n; ++k)
            weights.push_back(std::pow(static_cast<double>(k), -shape));
        dist_ = std::discrete_distribution<std::uint64_t>(weights.begin(), weights.end());
    }

    /// Draw one value in `[1, n]`.
    template <class URNG>
    std::uint64_t operator()(URNG& rng) {
        return dist_(rng) + 1;
    }

    double shape() const { return shape_; }
    std::uint64_t support() const { return n_; }

    std::uint64_t min() const { return 1; }
    std::uint64_t max() const { return n_; }

private:
    std::uint64_t n_;
    double shape_;
    std::discrete_distribution<std::uint64_t> dist_;
};
