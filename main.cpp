// ========================================
// main.cpp - Simulation Launcher
// ========================================
/**
 * @file main.cpp
 * @brief CLI runner for benchmarking the inventory simulation backends.
 *
 * Runs a batch of one-year inventory trials on the scalar backend, the batched
 * device backend, or both, and prints the aggregate statistics of each.
 *
 * ## Usage
 * ```bash
 * ./invsim_bench                           # 10000 trials on all backends, default policy
 * ./invsim_bench 100000 Batched            # 100k trials on the device only
 * ./invsim_bench 5000 All 20 5 10 30       # safety stock 20, lead time 5, order qty 10, start 30
 * ```
 *
 * ## CLI Arguments (all positional, all optional)
 * - `argv[1]` trials (default 10000)
 * - `argv[2]` method: `Scalar`, `Batched`, or `All` (default All)
 * - `argv[3]` safety_stock (default 10)
 * - `argv[4]` lead_time (default 10)
 * - `argv[5]` order_quantity (default 7)
 * - `argv[6]` starting_quantity (default 10)
 * - `argv[7]` job_lot_shape (default 2.75)
 * - `argv[8]` traffic_shape (default 4.0)
 * - `argv[9]` device workers, 0 = hardware concurrency (default 0)
 *
 * ## Notes
 * - Invalid configuration is reported as `[ERROR]` and exits non-zero.
 * - If the device cannot be set up or fails mid-batch, a `[WARN]` is logged
 *   and `Batched` falls back to the scalar backend.
 */

#include "batch.hpp"
#include "benchmark.hpp"
#include "device.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

#include <sys/utsname.h>

/**
 * @brief Prints detected platform architecture and the lane reduction path.
 */
void print_arch_info() {
    struct utsname info;
    if (uname(&info) == 0)
        std::cout << "[INFO] Detected platform: " << info.machine << "\n";
    else
        std::cout << "[WARN] Could not detect platform\n";

    std::cout << "[INFO] Lane reduction: " << reductionBackendName() << "\n";
}

/**
 * @brief Parse a non-negative integer argument.
 * @throws ConfigError if `text` is not a plain decimal integer.
 */
std::uint64_t parse_count(const char* text, const char* name) {
    std::string s{text};
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        throw ConfigError(std::string(name) + ": expected a non-negative integer, got '" + s + "'");
    errno = 0;
    unsigned long long value = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE)
        throw ConfigError(std::string(name) + ": value out of range: " + s);
    return static_cast<std::uint64_t>(value);
}

/**
 * @brief Parse a floating-point argument.
 * @throws ConfigError if `text` is not a number.
 */
double parse_real(const char* text, const char* name) {
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE)
        throw ConfigError(std::string(name) + ": expected a number, got '" + text + "'");
    return value;
}

/**
 * @brief Entry point for running inventory simulations via CLI.
 *
 * @param argc Number of CLI arguments
 * @param argv Array of CLI argument strings
 * @return 0 on success, non-zero on invalid arguments or configuration
 */
int main(int argc, char* argv[]) {
    print_arch_info();

    std::uint64_t totalTrials = 10'000;
    std::string method = "All";
    std::uint64_t safetyStock = 10;
    std::uint64_t leadTime = 10;
    std::uint64_t orderQuantity = 7;
    std::uint64_t startingQuantity = 10;
    double jobLotShape = kDefaultJobLotShape;
    double trafficShape = kDefaultTrafficShape;
    DeviceOptions deviceOptions;

    try {
        if (argc > 1) totalTrials = parse_count(argv[1], "trials");
        if (totalTrials > BatchRunner::kMaxTrials)
            throw ConfigError("trials: at most " + std::to_string(BatchRunner::kMaxTrials) + " per batch");
        if (argc > 2) method = argv[2];
        if (argc > 3) safetyStock = parse_count(argv[3], "safety_stock");
        if (argc > 4) leadTime = parse_count(argv[4], "lead_time");
        if (argc > 5) orderQuantity = parse_count(argv[5], "order_quantity");
        if (argc > 6) startingQuantity = parse_count(argv[6], "starting_quantity");
        if (argc > 7) jobLotShape = parse_real(argv[7], "job_lot_shape");
        if (argc > 8) trafficShape = parse_real(argv[8], "traffic_shape");
        if (argc > 9) deviceOptions.workers = static_cast<std::size_t>(parse_count(argv[9], "workers"));
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    std::unordered_set<std::string> validMethods = {
        "Scalar", "Batched", "All"
    };
    if (!validMethods.count(method)) {
        std::cerr << "[ERROR] Unknown method: " << method << "\n";
        std::cerr << "Valid options: Scalar, Batched, All\n";
        return EXIT_FAILURE;
    }

    std::optional<SimulationEngine> engine;
    try {
        engine.emplace(configure(safetyStock, leadTime, orderQuantity, jobLotShape, trafficShape));
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "[INFO] Policy: safety_stock=" << safetyStock
              << " lead_time=" << leadTime
              << " order_quantity=" << orderQuantity
              << " starting_quantity=" << startingQuantity
              << " job_lot_shape=" << jobLotShape
              << " traffic_shape=" << trafficShape << "\n";

    bool runScalar = (method == "Scalar" || method == "All");

    if (method == "Batched" || method == "All") {
        try {
            Device device(deviceOptions);
            std::cout << "[INFO] Device: " << device.workers() << " workers, "
                      << device.arenaBytes() << " byte arena, "
                      << device.laneCapacity(leadTime) << " lanes per launch, "
                      << deviceOptions.table_size << " samples per table\n";

            benchmark("Batched (Device)", totalTrials, [&]() {
                return simulateBatch(*engine, startingQuantity, totalTrials, Backend::Batched, &device);
            });
        } catch (const AcceleratorError& e) {
            std::cout << "[WARN] Batched backend unavailable: " << e.what() << "\n";
            if (!runScalar) {
                std::cout << "[WARN] Falling back to the scalar backend\n";
                runScalar = true;
            }
        }
    }

    if (runScalar) {
        benchmark("Scalar", totalTrials, [&]() {
            return simulateBatch(*engine, startingQuantity, totalTrials, Backend::Scalar);
        });
    }

    return 0;
}
