// ========================================
// sample_table.hpp - Precomputed Samples
// ========================================
/**
 * @file sample_table.hpp
 * @brief Fixed-length table of pre-drawn distribution samples.
 *
 * Lanes of the batched backend do not run the Zipf sampler. Instead they index
 * a table filled once per batch, modulo its length, with their own cheap
 * generator. The trade is a period of `size()` draws for a lookup that costs
 * one modulo and one load.
 *
 * The default length of 16M entries keeps that period far above the number of
 * draws a single batch makes. The table is immutable after construction and
 * is shared read-only by every lane.
 */

#pragma once

#include "errors.hpp"
#include "zipf.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

class SampleTable {
public:
    static constexpr std::size_t kDefaultSize = std::size_t{16} << 20;

    /**
     * @brief Wrap an explicit sample sequence.
     * @throws ConfigError if `samples` is empty.
     */
    explicit SampleTable(std::vector<std::uint32_t> samples) : samples_(std::move(samples)) {
        if (samples_.empty())
            throw ConfigError("sample table: length must be at least 1");
    }

    /**
     * @brief Draw `size` i.i.d. samples from `dist`.
     * @throws ConfigError if `size == 0`.
     */
    template <class URNG>
    static SampleTable build(ZipfDistribution& dist, std::size_t size, URNG& rng) {
        if (size == 0)
            throw ConfigError("sample table: length must be at least 1");
        std::vector<std::uint32_t> samples(size);
        for (auto& s : samples) s = static_cast<std::uint32_t>(dist(rng));
        return SampleTable(std::move(samples));
    }

    /// Sample at `index mod size()`.
    std::uint32_t at(std::uint64_t index) const {
        return samples_[static_cast<std::size_t>(index % samples_.size())];
    }

    std::size_t size() const { return samples_.size(); }

private:
    std::vector<std::uint32_t> samples_;
};
