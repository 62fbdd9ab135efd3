// ========================================
// inventory.hpp - Inventory Simulation Kernel
// ========================================
/**
 * @file inventory.hpp
 * @brief One-year periodic-review inventory trial under Zipf demand.
 *
 * This module holds the simulation kernel shared by every execution backend:
 * the configuration, the per-trial counters, the per-day transition, and the
 * scalar engine that drives it with direct Zipf draws.
 *
 * ---
 *
 * ## The Day Transition
 * A trial is 365 calls of `advanceDay()`. Each day, in order:
 *
 * 1. **Arrival**: the pipeline slot due today is added to on-hand stock.
 * 2. **Demand**: `c` customers arrive (traffic distribution). Each asks for
 *    `r` units (job lot distribution). If `stock >= r` the sale succeeds and
 *    stock drops by `r`; otherwise the request is counted as failed and
 *    dropped. Lost sales, no backorders.
 * 3. **Reorder**: if `stock < safety_stock`, order
 *    `ceil((safety_stock - stock) / order_quantity) * order_quantity` units
 *    into the pipeline. At or above the threshold nothing is ordered.
 *
 * There is no early exit and no failure mode once a trial starts. All
 * counters are 64-bit.
 *
 * ---
 *
 * ## Sample Sources
 * `advanceDay()` is a template over where samples come from. A source only
 * has to provide two calls:
 * ```cpp
 * std::uint64_t customers();  // customers arriving today
 * std::uint64_t request();    // units wanted by the next customer
 * ```
 * - `DirectSampleSource` draws from the two `ZipfDistribution`s. Scalar path.
 * - `TableSampleSource` indexes two `SampleTable`s with a per-lane SplitMix64.
 *   Batched path (see device.hpp).
 *
 * Both backends therefore run exactly the same transition; they differ only
 * in the source and in where the counters end up.
 *
 * ---
 *
 * ## Success Rates
 * Rates are `std::optional<double>`. When a trial saw no demand at all the
 * denominator is zero and the rate is `std::nullopt`; no division happens.
 */

#pragma once

#include "errors.hpp"
#include "pipeline.hpp"
#include "rng.hpp"
#include "sample_table.hpp"
#include "zipf.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

inline constexpr std::uint64_t kDaysPerYear = 365;
inline constexpr double kDefaultJobLotShape = 2.75;
inline constexpr double kDefaultTrafficShape = 4.0;

/**
 * @brief Immutable policy and demand parameters of one engine.
 */
struct SimulationConfig {
    std::uint64_t safety_stock{0};     ///< Reorder when stock falls below this
    std::uint64_t lead_time{1};        ///< Ring size of the replenishment pipeline, >= 1
    std::uint64_t order_quantity{1};   ///< Orders are multiples of this, >= 1
    double job_lot_shape{kDefaultJobLotShape};
    double traffic_shape{kDefaultTrafficShape};
};

/**
 * @brief Reject configurations the kernel cannot run.
 * @throws ConfigError naming the offending field.
 */
inline void validateConfig(const SimulationConfig& cfg) {
    if (cfg.lead_time == 0)
        throw ConfigError("lead_time must be at least 1");
    if (cfg.order_quantity == 0)
        throw ConfigError("order_quantity must be at least 1");
    if (!std::isfinite(cfg.job_lot_shape) || cfg.job_lot_shape <= 0.0)
        throw ConfigError("job_lot_shape must be a positive number, got " + std::to_string(cfg.job_lot_shape));
    if (!std::isfinite(cfg.traffic_shape) || cfg.traffic_shape <= 0.0)
        throw ConfigError("traffic_shape must be a positive number, got " + std::to_string(cfg.traffic_shape));
}

/**
 * @brief `ok / (ok + failed)`, or `std::nullopt` when both are zero.
 */
inline std::optional<double> successRate(std::uint64_t ok, std::uint64_t failed) {
    std::uint64_t total = ok + failed;
    if (total == 0) return std::nullopt;
    return static_cast<double>(ok) / static_cast<double>(total);
}

/**
 * @brief Outcome counters of one trial, or their sum over a batch.
 */
struct TrialCounters {
    std::uint64_t successful_transactions{0};
    std::uint64_t successful_sales{0};         ///< units
    std::uint64_t failed_transactions{0};
    std::uint64_t failed_sales{0};             ///< units
    std::uint64_t reorder_days{0};             ///< days on which an order was placed

    TrialCounters& operator+=(const TrialCounters& o) {
        successful_transactions += o.successful_transactions;
        successful_sales += o.successful_sales;
        failed_transactions += o.failed_transactions;
        failed_sales += o.failed_sales;
        reorder_days += o.reorder_days;
        return *this;
    }

    /// Customers served or turned away.
    std::uint64_t transactions() const { return successful_transactions + failed_transactions; }

    /// Units asked for, sold or not.
    std::uint64_t demandedUnits() const { return successful_sales + failed_sales; }

    std::optional<double> transactionSuccessRate() const {
        return successRate(successful_transactions, failed_transactions);
    }

    std::optional<double> volumeSuccessRate() const {
        return successRate(successful_sales, failed_sales);
    }
};

inline bool operator==(const TrialCounters& a, const TrialCounters& b) {
    return a.successful_transactions == b.successful_transactions
        && a.successful_sales == b.successful_sales
        && a.failed_transactions == b.failed_transactions
        && a.failed_sales == b.failed_sales
        && a.reorder_days == b.reorder_days;
}

inline bool operator!=(const TrialCounters& a, const TrialCounters& b) {
    return !(a == b);
}

/**
 * @brief Trial state between two days.
 */
struct DayState {
    std::uint64_t day{0};      ///< Next day to simulate
    std::uint64_t stock{0};    ///< On-hand units
    TrialCounters counters;
};

/**
 * @brief Simulate one day: arrival, demand, reorder.
 *
 * @param state    State before the day; `state.day` selects the pipeline slot.
 * @param cfg      Policy parameters (validated).
 * @param source   Sample source providing `customers()` and `request()`.
 * @param pipeline Replenishment ring of this trial.
 * @return State after the day, with `day` advanced by one.
 */
template <class Source>
DayState advanceDay(DayState state, const SimulationConfig& cfg, Source& source,
                    ReplenishmentPipeline& pipeline) {
    state.stock += pipeline.arrivalDueToday(state.day);

    std::uint64_t customers = source.customers();
    for (std::uint64_t c = 0; c < customers; ++c) {
        std::uint64_t request = source.request();
        if (state.stock >= request) {
            ++state.counters.successful_transactions;
            state.counters.successful_sales += request;
            state.stock -= request;
        } else {
            ++state.counters.failed_transactions;
            state.counters.failed_sales += request;
        }
    }

    if (state.stock < cfg.safety_stock) {
        std::uint64_t shortfall = cfg.safety_stock - state.stock;
        std::uint64_t orders = shortfall / cfg.order_quantity + (shortfall % cfg.order_quantity != 0);
        pipeline.schedule(state.day, orders * cfg.order_quantity);
        ++state.counters.reorder_days;
    }

    ++state.day;
    return state;
}

/**
 * @brief Run a full 365-day trial from `startingQuantity` units on hand.
 * @return Counters accumulated over the year.
 */
template <class Source>
TrialCounters simulateTrial(const SimulationConfig& cfg, std::uint64_t startingQuantity,
                            Source& source, ReplenishmentPipeline& pipeline) {
    DayState state;
    state.stock = startingQuantity;
    while (state.day < kDaysPerYear)
        state = advanceDay(state, cfg, source, pipeline);
    return state.counters;
}

/**
 * @brief Samples drawn directly from the engine's Zipf distributions.
 */
template <class URNG>
class DirectSampleSource {
public:
    DirectSampleSource(ZipfDistribution& traffic, ZipfDistribution& jobLot, URNG& rng)
        : traffic_(traffic), jobLot_(jobLot), rng_(rng) {}

    std::uint64_t customers() { return traffic_(rng_); }
    std::uint64_t request() { return jobLot_(rng_); }

private:
    ZipfDistribution& traffic_;
    ZipfDistribution& jobLot_;
    URNG& rng_;
};

/**
 * @brief Samples looked up in precomputed tables at positions chosen by a
 * per-lane SplitMix64. One generator step per lookup, traffic first.
 */
class TableSampleSource {
public:
    TableSampleSource(const SampleTable& traffic, const SampleTable& jobLot, std::uint64_t seed)
        : traffic_(traffic), jobLot_(jobLot), rng_(seed) {}

    std::uint64_t customers() { return traffic_.at(rng_.next()); }
    std::uint64_t request() { return jobLot_.at(rng_.next()); }

private:
    const SampleTable& traffic_;
    const SampleTable& jobLot_;
    SplitMix64 rng_;
};

/**
 * @brief Owns a validated configuration and its two demand distributions.
 */
class SimulationEngine {
public:
    /// @throws ConfigError if `cfg` is invalid.
    explicit SimulationEngine(const SimulationConfig& cfg)
        : config_(validated(cfg)),
          jobLot_(kZipfSupport, cfg.job_lot_shape),
          traffic_(kZipfSupport, cfg.traffic_shape) {}

    const SimulationConfig& config() const { return config_; }

    ZipfDistribution& jobLot() { return jobLot_; }
    ZipfDistribution& traffic() { return traffic_; }

    /**
     * @brief One trial with direct Zipf draws and a fresh pipeline.
     * @param startingQuantity Units on hand on day 0.
     * @param rng              Generator for this trial only.
     */
    template <class URNG>
    TrialCounters runTrial(std::uint64_t startingQuantity, URNG& rng) {
        std::vector<std::uint64_t> ring(static_cast<std::size_t>(config_.lead_time));
        ReplenishmentPipeline pipeline(ring.data(), config_.lead_time);
        DirectSampleSource<URNG> source(traffic_, jobLot_, rng);
        return simulateTrial(config_, startingQuantity, source, pipeline);
    }

    /// Job lot table of `size` samples for one batch.
    template <class URNG>
    SampleTable buildJobLotTable(std::size_t size, URNG& rng) {
        return SampleTable::build(jobLot_, size, rng);
    }

    /// Traffic table of `size` samples for one batch.
    template <class URNG>
    SampleTable buildTrafficTable(std::size_t size, URNG& rng) {
        return SampleTable::build(traffic_, size, rng);
    }

private:
    static const SimulationConfig& validated(const SimulationConfig& cfg) {
        validateConfig(cfg);
        return cfg;
    }

    SimulationConfig config_;
    ZipfDistribution jobLot_;
    ZipfDistribution traffic_;
};
