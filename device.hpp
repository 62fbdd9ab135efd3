// ========================================
// device.hpp - Batched Lane Backend
// ========================================
/**
 * @file device.hpp
 * @brief Data-parallel execution of independent trials, one trial per lane.
 *
 * A `Device` is the caller-owned handle of the batched backend. It owns a
 * fixed pool of worker threads (spawned per launch) and an aligned memory
 * arena. A launch runs the lane kernel `runLane()` for every lane and
 * returns the per-lane counters; the host then reduces them to one
 * `TrialCounters` with `reduceLanes()`.
 *
 * ---
 *
 * ## Launch Sequence
 * 1. **Acquire**: carve the batch buffers out of the arena inside an
 *    `ArenaScope`. The scope resets the arena when the launch ends, whether
 *    it returns or throws.
 * 2. **Upload**: copy the lane seeds into the seed buffer. The two sample
 *    tables and the configuration are shared read-only; workers run in the
 *    host address space, so they are passed by pointer and never copied.
 * 3. **Execute**: lanes are split into contiguous ranges, one per worker.
 *    Each lane builds its own replenishment ring in its own arena slice and
 *    writes its five counters into its own slot of five counter arrays.
 *    Nothing else is written, so no synchronization is needed and results do
 *    not depend on which worker runs a lane or when.
 * 4. **Download**: after every worker has joined, copy the counter arrays
 *    back into a `LaneCounters`.
 *
 * ---
 *
 * ## Buffer Layout
 * Structure-of-arrays, every array 64-byte aligned:
 *
 * | Buffer                    | Elements            |
 * |---------------------------|---------------------|
 * | seeds                     | lanes               |
 * | replenishment rings       | lanes * lead_time   |
 * | successful_transactions   | lanes               |
 * | successful_sales          | lanes               |
 * | failed_transactions       | lanes               |
 * | failed_sales              | lanes               |
 * | reorder_days              | lanes               |
 *
 * ---
 *
 * ## Failure Model
 * Any failure fails the whole launch with an `AcceleratorError`:
 * - the arena cannot hold the buffers,
 * - a worker thread cannot be started (already started workers are joined
 *   first),
 * - a lane throws (the first error per worker is captured and rethrown after
 *   all workers have joined).
 * No partial result is ever returned, so a missing lane cannot skew a ratio.
 *
 * ---
 *
 * ## Reduction
 * Counters are summed as 64-bit integers. Integer addition is associative and
 * commutative, so any lane order gives the same totals. The sum uses AVX2 (4
 * lanes per add) or NEON (2 lanes per add) when available, with a scalar
 * loop for the remainder and as the fallback.
 *
 * - AVX2: define `USE_AVX` (CMake option `INVSIM_USE_AVX`). The AVX2 routine
 *   is compiled with a function-level target attribute and selected at run
 *   time only on CPUs that report AVX2.
 * - NEON: enabled automatically via `__ARM_NEON`.
 */

#pragma once

#include "errors.hpp"
#include "inventory.hpp"
#include "pool.hpp"
#include "sample_table.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <new>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if defined(USE_AVX)
    #include <immintrin.h>
#elif defined(__ARM_NEON) || defined(__ARM_NEON__)
    #define USE_NEON
    #include <arm_neon.h>
#endif

/**
 * @brief Read-only arguments shared by every lane of a launch.
 */
struct LaneProgram {
    const SimulationConfig* config;
    const SampleTable* job_lot;
    const SampleTable* traffic;
    std::uint64_t starting_quantity;
};

/**
 * @brief Lane kernel: one full 365-day trial drawing from the sample tables.
 *
 * @param program Shared launch arguments.
 * @param seed    Seed of this lane's SplitMix64.
 * @param ring    `lead_time` slots owned by this lane.
 * @return Counters of the trial.
 */
inline TrialCounters runLane(const LaneProgram& program, std::uint64_t seed, std::uint64_t* ring) {
    ReplenishmentPipeline pipeline(ring, program.config->lead_time);
    TableSampleSource source(*program.traffic, *program.job_lot, seed);
    return simulateTrial(*program.config, program.starting_quantity, source, pipeline);
}

/**
 * @brief Per-lane counters downloaded from a launch (structure of arrays).
 */
struct LaneCounters {
    std::vector<std::uint64_t> successful_transactions;
    std::vector<std::uint64_t> successful_sales;
    std::vector<std::uint64_t> failed_transactions;
    std::vector<std::uint64_t> failed_sales;
    std::vector<std::uint64_t> reorder_days;

    LaneCounters() = default;
    explicit LaneCounters(std::size_t lanes)
        : successful_transactions(lanes), successful_sales(lanes),
          failed_transactions(lanes), failed_sales(lanes), reorder_days(lanes) {}

    std::size_t lanes() const { return successful_transactions.size(); }

    /// Counters of lane `i`.
    TrialCounters lane(std::size_t i) const {
        TrialCounters c;
        c.successful_transactions = successful_transactions[i];
        c.successful_sales = successful_sales[i];
        c.failed_transactions = failed_transactions[i];
        c.failed_sales = failed_sales[i];
        c.reorder_days = reorder_days[i];
        return c;
    }
};

/**
 * @brief Sum `values[begin, end)` one element at a time.
 */
inline std::uint64_t sumLanes_SCALAR(const std::uint64_t* values, std::size_t begin, std::size_t end) {
    std::uint64_t sum = 0;
    for (std::size_t i = begin; i < end; ++i) sum += values[i];
    return sum;
}

#ifdef USE_AVX
/**
 * @brief AVX2 sum: four 64-bit lanes per `_mm256_add_epi64`, scalar tail.
 */
__attribute__((target("avx2")))
inline std::uint64_t sumLanes_AVX(const std::uint64_t* values, std::size_t n) {
    const std::size_t batch = 4;
    std::size_t loopEnd = n - (n % batch);

    __m256i acc = _mm256_setzero_si256();
    for (std::size_t i = 0; i < loopEnd; i += batch) {
        __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(values + i));
        acc = _mm256_add_epi64(acc, v);
    }

    alignas(32) std::uint64_t partial[4];
    _mm256_store_si256(reinterpret_cast<__m256i*>(partial), acc);
    return partial[0] + partial[1] + partial[2] + partial[3] + sumLanes_SCALAR(values, loopEnd, n);
}
#endif

#ifdef USE_NEON
/**
 * @brief NEON sum: two 64-bit lanes per `vaddq_u64`, scalar tail.
 */
inline std::uint64_t sumLanes_NEON(const std::uint64_t* values, std::size_t n) {
    const std::size_t batch = 2;
    std::size_t loopEnd = n - (n % batch);

    uint64x2_t acc = vdupq_n_u64(0);
    for (std::size_t i = 0; i < loopEnd; i += batch) {
        acc = vaddq_u64(acc, vld1q_u64(values + i));
    }
    return vgetq_lane_u64(acc, 0) + vgetq_lane_u64(acc, 1) + sumLanes_SCALAR(values, loopEnd, n);
}
#endif

/**
 * @brief Sum `n` lane values with the best available instruction set.
 */
inline std::uint64_t sumLanes(const std::uint64_t* values, std::size_t n) {
#if defined(USE_AVX)
    if (__builtin_cpu_supports("avx2")) return sumLanes_AVX(values, n);
#elif defined(USE_NEON)
    return sumLanes_NEON(values, n);
#endif
    return sumLanes_SCALAR(values, 0, n);
}

/**
 * @brief Name of the reduction path `sumLanes()` takes on this machine.
 */
inline const char* reductionBackendName() {
#if defined(USE_AVX)
    if (__builtin_cpu_supports("avx2")) return "AVX2";
#elif defined(USE_NEON)
    return "NEON";
#endif
    return "scalar";
}

/**
 * @brief Totals over all lanes of a launch.
 */
inline TrialCounters reduceLanes(const LaneCounters& lanes) {
    const std::size_t n = lanes.lanes();
    TrialCounters total;
    total.successful_transactions = sumLanes(lanes.successful_transactions.data(), n);
    total.successful_sales = sumLanes(lanes.successful_sales.data(), n);
    total.failed_transactions = sumLanes(lanes.failed_transactions.data(), n);
    total.failed_sales = sumLanes(lanes.failed_sales.data(), n);
    total.reorder_days = sumLanes(lanes.reorder_days.data(), n);
    return total;
}

/**
 * @brief Worker threads of one launch; joins all of them on destruction.
 *
 * A launch that fails halfway through spawning still joins the workers it
 * already started before the error leaves the scope.
 */
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void reserve(std::size_t count) { threads_.reserve(count); }

    template <class Fn, class... Args>
    void spawn(Fn&& fn, Args&&... args) {
        threads_.emplace_back(std::forward<Fn>(fn), std::forward<Args>(args)...);
    }

    void join() {
        for (auto& th : threads_)
            if (th.joinable()) th.join();
    }

    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

struct DeviceOptions {
    std::size_t workers = 0;                              ///< 0 = std::thread::hardware_concurrency()
    std::size_t arena_bytes = std::size_t{64} << 20;      ///< Device arena capacity
    std::size_t table_size = SampleTable::kDefaultSize;   ///< Entries per sample table
};

/**
 * @brief Caller-owned batched backend: worker threads plus a memory arena.
 *
 * Construct once, launch any number of batches, destroy when done. A device
 * runs one launch at a time; it is not meant to be shared between threads.
 */
class Device {
public:
    static constexpr std::size_t kBufferAlign = 64;
    static constexpr std::size_t kBuffersPerLaunch = 7;

    /**
     * @throws AcceleratorError if the arena cannot be allocated or the table
     *         size is zero.
     */
    explicit Device(const DeviceOptions& options = DeviceOptions())
        : options_(options),
          workers_(resolveWorkers(options.workers)),
          arena_(options.arena_bytes) {
        if (arena_.capacity == 0)
            throw AcceleratorError("device: failed to allocate a " + std::to_string(options.arena_bytes)
                                   + " byte arena");
        if (options.table_size == 0)
            throw AcceleratorError("device: sample table size must be at least 1");
    }

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const DeviceOptions& options() const { return options_; }
    std::size_t workers() const { return workers_; }
    std::size_t arenaBytes() const { return arena_.capacity; }

    /// Arena bytes one lane needs, excluding alignment padding.
    static std::size_t bytesPerLane(std::uint64_t leadTime) {
        return (kBuffersPerLaunch - 1 + static_cast<std::size_t>(leadTime)) * sizeof(std::uint64_t);
    }

    /**
     * @brief Largest number of lanes a single launch can hold for `leadTime`.
     * @return 0 if not even one lane fits.
     */
    std::size_t laneCapacity(std::uint64_t leadTime) const {
        const std::size_t padding = kBuffersPerLaunch * kBufferAlign;
        if (arena_.capacity <= padding) return 0;
        if (leadTime > (std::numeric_limits<std::size_t>::max() / sizeof(std::uint64_t)) - kBuffersPerLaunch)
            return 0;
        return (arena_.capacity - padding) / bytesPerLane(leadTime);
    }

    /**
     * @brief Run `seeds.size()` lanes of `program` and download their counters.
     *
     * @param program Shared launch arguments; must outlive the call.
     * @param seeds   One seed per lane.
     * @return Per-lane counters, in lane order.
     * @throws AcceleratorError on buffer, launch, or lane failure.
     */
    LaneCounters execute(const LaneProgram& program, const std::vector<std::uint64_t>& seeds) {
        const std::size_t lanes = seeds.size();
        LaneCounters result;
        try {
            result = LaneCounters(lanes);
        } catch (const std::bad_alloc&) {
            throw AcceleratorError("device: failed to allocate download buffers for "
                                   + std::to_string(lanes) + " lanes");
        }
        if (lanes == 0) return result;

        ArenaScope scope(arena_);
        Buffers buf = acquire(lanes, program.config->lead_time);

        std::copy(seeds.begin(), seeds.end(), buf.seeds);

        launch(program, buf, lanes);

        download(buf, lanes, result);
        return result;
    }

private:
    struct Buffers {
        std::uint64_t* seeds;
        std::uint64_t* rings;
        std::uint64_t* successful_transactions;
        std::uint64_t* successful_sales;
        std::uint64_t* failed_transactions;
        std::uint64_t* failed_sales;
        std::uint64_t* reorder_days;
    };

    static std::size_t resolveWorkers(std::size_t requested) {
        if (requested > 0) return requested;
        std::size_t hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }

    std::uint64_t* allocateArray(std::size_t count, const char* what) {
        std::uint64_t* ptr = arena_.allocate<std::uint64_t>(count, kBufferAlign);
        if (!ptr)
            throw AcceleratorError(std::string("device: arena exhausted allocating ") + what + " ("
                                   + std::to_string(count) + " elements, "
                                   + std::to_string(arena_.remaining()) + " bytes left)");
        return ptr;
    }

    Buffers acquire(std::size_t lanes, std::uint64_t leadTime) {
        if (leadTime > std::numeric_limits<std::size_t>::max() / lanes)
            throw AcceleratorError("device: replenishment ring buffer size overflows");

        Buffers buf;
        buf.seeds = allocateArray(lanes, "lane seeds");
        buf.rings = allocateArray(lanes * static_cast<std::size_t>(leadTime), "replenishment rings");
        buf.successful_transactions = allocateArray(lanes, "successful_transactions");
        buf.successful_sales = allocateArray(lanes, "successful_sales");
        buf.failed_transactions = allocateArray(lanes, "failed_transactions");
        buf.failed_sales = allocateArray(lanes, "failed_sales");
        buf.reorder_days = allocateArray(lanes, "reorder_days");
        return buf;
    }

    void launch(const LaneProgram& program, const Buffers& buf, std::size_t lanes) {
        const std::size_t workerCount = std::min(workers_, lanes);
        const std::size_t chunk = (lanes + workerCount - 1) / workerCount;
        const std::size_t leadTime = static_cast<std::size_t>(program.config->lead_time);

        std::vector<std::exception_ptr> errors(workerCount);
        WorkerGroup group;

        auto work = [&](std::size_t w) {
            try {
                std::size_t begin = w * chunk;
                std::size_t end = std::min(lanes, begin + chunk);
                for (std::size_t lane = begin; lane < end; ++lane) {
                    TrialCounters c = runLane(program, buf.seeds[lane], buf.rings + lane * leadTime);
                    buf.successful_transactions[lane] = c.successful_transactions;
                    buf.successful_sales[lane] = c.successful_sales;
                    buf.failed_transactions[lane] = c.failed_transactions;
                    buf.failed_sales[lane] = c.failed_sales;
                    buf.reorder_days[lane] = c.reorder_days;
                }
            } catch (...) {
                errors[w] = std::current_exception();
            }
        };

        try {
            group.reserve(workerCount);
            for (std::size_t w = 0; w < workerCount; ++w) group.spawn(work, w);
        } catch (const std::exception& e) {
            group.join();
            throw AcceleratorError(std::string("device: failed to launch worker: ") + e.what());
        }

        group.join();

        for (std::size_t w = 0; w < workerCount; ++w) {
            if (!errors[w]) continue;
            try {
                std::rethrow_exception(errors[w]);
            } catch (const std::exception& e) {
                throw AcceleratorError("device: worker " + std::to_string(w) + " failed: " + e.what());
            }
        }
    }

    static void download(const Buffers& buf, std::size_t lanes, LaneCounters& out) {
        std::copy(buf.successful_transactions, buf.successful_transactions + lanes, out.successful_transactions.begin());
        std::copy(buf.successful_sales, buf.successful_sales + lanes, out.successful_sales.begin());
        std::copy(buf.failed_transactions, buf.failed_transactions + lanes, out.failed_transactions.begin());
        std::copy(buf.failed_sales, buf.failed_sales + lanes, out.failed_sales.begin());
        std::copy(buf.reorder_days, buf.reorder_days + lanes, out.reorder_days.begin());
    }

    DeviceOptions options_;
    std::size_t workers_;
    PoolAllocator arena_;
};
