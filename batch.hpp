// ========================================
// batch.hpp - Batch Runner and Entry Points
// ========================================
/**
 * @file batch.hpp
 * @brief Runs many independent trials and reduces them to aggregate statistics.
 *
 * Two strategies produce the same `AggregateStats` contract:
 *
 * - **Scalar**: a sequential loop on the calling thread. Each trial gets its
 *   own `std::mt19937_64` seeded from the runner's `SeedStream` and draws
 *   directly from the engine's Zipf distributions. This is the reference.
 * - **Batched**: one full 365-day trial per lane on a `Device`. The runner
 *   builds the two sample tables for the batch, hands every lane a distinct
 *   seed, launches as many lanes per launch as the device arena holds, and
 *   sums the reduced launch totals.
 *
 * `runLanesSequential()` executes the batched lane kernel on the calling
 * thread, lane after lane. Given the same tables and seeds it returns
 * exactly what `runBatched()` returns, which makes it the oracle for the
 * device path.
 *
 * The public entry points at the bottom of this file are what callers use:
 * ```cpp
 * SimulationEngine engine = configure(10, 10, 7);
 * TrialCounters one = simulateOnce(engine, 10);
 * AggregateStats many = simulateBatch(engine, 10, 10000);
 *
 * Device device;
 * AggregateStats fast = simulateBatch(engine, 10, 10000, Backend::Batched, &device);
 * ```
 */

#pragma once

#include "device.hpp"
#include "errors.hpp"
#include "inventory.hpp"
#include "rng.hpp"
#include "sample_table.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <new>
#include <optional>
#include <random>
#include <string>
#include <vector>

enum class Backend { Scalar, Batched };

inline const char* backendName(Backend backend) {
    switch (backend) {
        case Backend::Scalar: return "Scalar";
        case Backend::Batched: return "Batched";
    }
    return "Unknown";
}

/**
 * @brief Counter totals over a batch and the success rates derived from them.
 *
 * A rate is `std::nullopt` when its denominator is zero, i.e. the batch saw no
 * customers (transaction rate) or no requested units (volume rate).
 */
struct AggregateStats {
    TrialCounters totals;
    std::uint64_t trials{0};
    std::optional<double> transaction_success_rate;
    std::optional<double> volume_success_rate;

    static AggregateStats fromTotals(const TrialCounters& totals, std::uint64_t trials) {
        AggregateStats stats;
        stats.totals = totals;
        stats.trials = trials;
        stats.transaction_success_rate = totals.transactionSuccessRate();
        stats.volume_success_rate = totals.volumeSuccessRate();
        return stats;
    }

    /// Fraction of simulated days on which an order was placed.
    std::optional<double> reorderDayFraction() const {
        if (trials == 0) return std::nullopt;
        return static_cast<double>(totals.reorder_days) / static_cast<double>(trials * kDaysPerYear);
    }
};

class BatchRunner {
public:
    /// Largest batch whose day total, `trials * kDaysPerYear`, fits in 64 bits.
    static constexpr std::uint64_t kMaxTrials = std::numeric_limits<std::uint64_t>::max() / kDaysPerYear;

    /// Seeds from fresh entropy.
    explicit BatchRunner(SimulationEngine& engine) : engine_(engine) {}

    /// Reproducible seeds derived from `seedBase`.
    BatchRunner(SimulationEngine& engine, std::uint64_t seedBase) : engine_(engine), seeds_(seedBase) {}

    /**
     * @brief `trials` sequential trials with direct sampling.
     * @throws ConfigError if `trials` exceeds `kMaxTrials`.
     */
    AggregateStats runScalar(std::uint64_t startingQuantity, std::uint64_t trials) {
        checkTrialCount(trials);
        TrialCounters totals;
        for (std::uint64_t t = 0; t < trials; ++t) {
            std::mt19937_64 rng(seeds_.next());
            totals += engine_.runTrial(startingQuantity, rng);
        }
        return AggregateStats::fromTotals(totals, trials);
    }

    /**
     * @brief `trials` lanes on `device`, with tables built for this batch.
     *
     * Lane seeds are drawn one launch at a time, so host memory is bounded by
     * the device's lane capacity rather than by `trials`.
     * @throws ConfigError if `trials` exceeds `kMaxTrials`.
     * @throws AcceleratorError if not even one lane fits, or on device failure.
     */
    AggregateStats runBatched(Device& device, std::uint64_t startingQuantity, std::uint64_t trials) {
        checkTrialCount(trials);
        if (trials == 0) return AggregateStats::fromTotals(TrialCounters(), 0);
        const std::size_t capacity = launchCapacity(device);

        std::mt19937_64 tableRng(seeds_.next());
        std::optional<SampleTable> jobLot;
        std::optional<SampleTable> traffic;
        try {
            jobLot.emplace(engine_.buildJobLotTable(device.options().table_size, tableRng));
            traffic.emplace(engine_.buildTrafficTable(device.options().table_size, tableRng));
        } catch (const std::bad_alloc&) {
            throw AcceleratorError("device: failed to allocate two sample tables of "
                                   + std::to_string(device.options().table_size) + " entries");
        }

        LaneProgram program{&engine_.config(), &*jobLot, &*traffic, startingQuantity};

        TrialCounters totals;
        for (std::uint64_t done = 0; done < trials;) {
            std::size_t lanes = static_cast<std::size_t>(std::min<std::uint64_t>(capacity, trials - done));
            std::vector<std::uint64_t> launchSeeds = hostBuffer([&] { return seeds_.take(lanes); });
            totals += reduceLanes(device.execute(program, launchSeeds));
            done += lanes;
        }
        return AggregateStats::fromTotals(totals, trials);
    }

    /**
     * @brief One lane per seed on `device`, with caller-provided tables.
     *
     * Launches are split to fit the device arena; their totals are summed.
     * @throws AcceleratorError if not even one lane fits, or on device failure.
     */
    AggregateStats runBatched(Device& device, std::uint64_t startingQuantity,
                              const SampleTable& jobLot, const SampleTable& traffic,
                              const std::vector<std::uint64_t>& laneSeeds) {
        const std::size_t capacity = launchCapacity(device);
        LaneProgram program{&engine_.config(), &jobLot, &traffic, startingQuantity};

        TrialCounters totals;
        for (std::size_t begin = 0; begin < laneSeeds.size(); begin += capacity) {
            std::size_t end = std::min(laneSeeds.size(), begin + capacity);
            std::vector<std::uint64_t> launchSeeds = hostBuffer([&] {
                return std::vector<std::uint64_t>(laneSeeds.begin() + begin, laneSeeds.begin() + end);
            });
            totals += reduceLanes(device.execute(program, launchSeeds));
        }
        return AggregateStats::fromTotals(totals, laneSeeds.size());
    }

    /**
     * @brief The lane kernel run sequentially over `laneSeeds`.
     */
    AggregateStats runLanesSequential(std::uint64_t startingQuantity,
                                      const SampleTable& jobLot, const SampleTable& traffic,
                                      const std::vector<std::uint64_t>& laneSeeds) {
        LaneProgram program{&engine_.config(), &jobLot, &traffic, startingQuantity};
        std::vector<std::uint64_t> ring(static_cast<std::size_t>(engine_.config().lead_time));

        TrialCounters totals;
        for (std::uint64_t seed : laneSeeds) totals += runLane(program, seed, ring.data());
        return AggregateStats::fromTotals(totals, laneSeeds.size());
    }

private:
    static void checkTrialCount(std::uint64_t trials) {
        if (trials > kMaxTrials)
            throw ConfigError("trial count " + std::to_string(trials) + " exceeds the maximum of "
                              + std::to_string(kMaxTrials));
    }

    /// Lanes per launch for this engine's lead time.
    std::size_t launchCapacity(const Device& device) const {
        const std::size_t capacity = device.laneCapacity(engine_.config().lead_time);
        if (capacity == 0)
            throw AcceleratorError("device: arena of " + std::to_string(device.arenaBytes())
                                   + " bytes cannot hold a single lane");
        return capacity;
    }

    template <class Fill>
    static std::vector<std::uint64_t> hostBuffer(Fill fill) {
        try {
            return fill();
        } catch (const std::bad_alloc&) {
            throw AcceleratorError("device: failed to allocate the host seed buffer");
        }
    }

    SimulationEngine& engine_;
    SeedStream seeds_;
};

/**
 * @brief Validate parameters and build an engine.
 * @throws ConfigError on `lead_time == 0`, `order_quantity == 0`, or a
 *         non-positive shape.
 */
inline SimulationEngine configure(std::uint64_t safetyStock, std::uint64_t leadTime,
                                  std::uint64_t orderQuantity,
                                  double jobLotShape = kDefaultJobLotShape,
                                  double trafficShape = kDefaultTrafficShape) {
    SimulationConfig cfg;
    cfg.safety_stock = safetyStock;
    cfg.lead_time = leadTime;
    cfg.order_quantity = orderQuantity;
    cfg.job_lot_shape = jobLotShape;
    cfg.traffic_shape = trafficShape;
    return SimulationEngine(cfg);
}

/**
 * @brief One freshly seeded trial with direct sampling.
 */
inline TrialCounters simulateOnce(SimulationEngine& engine, std::uint64_t startingQuantity) {
    SeedStream seeds;
    std::mt19937_64 rng(seeds.next());
    return engine.runTrial(startingQuantity, rng);
}

/**
 * @brief `trials` freshly seeded trials on the chosen backend.
 * @param device Required for `Backend::Batched`; ignored for `Backend::Scalar`.
 * @throws ConfigError if `trials` exceeds `BatchRunner::kMaxTrials`.
 * @throws AcceleratorError if the batched backend is chosen without a device
 *         or the device fails.
 */
inline AggregateStats simulateBatch(SimulationEngine& engine, std::uint64_t startingQuantity,
                                    std::uint64_t trials, Backend backend = Backend::Scalar,
                                    Device* device = nullptr) {
    BatchRunner runner(engine);
    if (backend == Backend::Scalar) return runner.runScalar(startingQuantity, trials);

    if (!device) throw AcceleratorError("batched backend requested without a device");
    return runner.runBatched(*device, startingQuantity, trials);
}
