// ========================================
// benchmark.hpp - Timing Utility Wrapper
// ========================================
/**
 * @file benchmark.hpp
 * @brief Wall-clock timing of one simulation batch, printed with its results.
 *
 * Wraps a batch and logs:
 * - Trials and the five counter totals
 * - Transaction and volume success rates (`n/a` when undefined)
 * - Fraction of days with a reorder
 * - Wall time in seconds + nanoseconds
 *
 * ## Example
 * ```cpp
 * benchmark("Scalar", 10000, [&]() {
 *     return simulateBatch(engine, 10, 10000);
 * });
 * ```
*/

#pragma once

#include "batch.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

/**
 * @brief Print a rate with six decimals, or `n/a` if it is undefined.
 */
inline void printRate(std::ostream& out, const std::optional<double>& rate) {
    if (rate) out << std::fixed << std::setprecision(6) << *rate << std::defaultfloat;
    else out << "n/a";
}

/**
 * @brief Benchmark wrapper that logs wall time and batch statistics.
 *
 * @param name   Name of the benchmark (e.g., "Batched")
 * @param trials Number of trials in the batch
 * @param func   Function that runs the batch
 * @return The batch statistics, for callers that need them afterwards
 */
inline AggregateStats benchmark(const std::string& name, std::uint64_t trials,
                                std::function<AggregateStats()> func) {
    auto start = std::chrono::high_resolution_clock::now();

    AggregateStats stats = func();

    auto end = std::chrono::high_resolution_clock::now();

    auto elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    const TrialCounters& t = stats.totals;

    std::cout << name << ":\n"
              << "  Trials: " << trials << "\n"
              << "  Successful transactions: " << t.successful_transactions << "\n"
              << "  Successful sales: " << t.successful_sales << "\n"
              << "  Failed transactions: " << t.failed_transactions << "\n"
              << "  Failed sales: " << t.failed_sales << "\n"
              << "  Reorder days: " << t.reorder_days << "\n";

    std::cout << "  Transaction success rate: ";
    printRate(std::cout, stats.transaction_success_rate);
    std::cout << "\n  Volume success rate: ";
    printRate(std::cout, stats.volume_success_rate);
    std::cout << "\n  Reorder day fraction: ";
    printRate(std::cout, stats.reorderDayFraction());
    std::cout << "\n  Time: " << (elapsed_ns / 1e9) << "s (" << elapsed_ns << " ns)\n";

    return stats;
}
