// ========================================
// errors.hpp - Simulator Error Types
// ========================================
/**
 * @file errors.hpp
 * @brief Exception types raised by the inventory simulator.
 *
 * - `ConfigError`      : rejected parameters, raised while configuring. Never mid-run.
 * - `AcceleratorError` : the batched backend could not acquire buffers, launch
 *                        its workers, or finish a lane. The whole batch fails.
 *
 * Both keep `what()` human readable; the CLI prints it behind an `[ERROR]` tag.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Invalid simulation configuration (zero lead time, zero order quantity,
 * non-positive Zipf shape, empty sample table, ...).
 */
struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Failure of the batched execution backend.
 *
 * The scalar path does not depend on the device and stays usable after this
 * is thrown.
 */
struct AcceleratorError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
