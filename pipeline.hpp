// ========================================
// pipeline.hpp - Replenishment Pipeline
// ========================================
/**
 * @file pipeline.hpp
 * @brief Ring of pending truck arrivals, one slot per day of lead time.
 *
 * - `arrivalDueToday(day)` takes (returns and clears) slot `day % L`.
 * - `schedule(day, q)` writes slot `(day + L - 1) % L`.
 *
 * With the arrival step at the start of each day and the reorder step at its
 * end, an order placed on day `d` is on the shelf at the start of day
 * `d + L - 1` for `L >= 2`, and of day `d + 1` for `L == 1`. Counting the
 * placement day itself, that is the L-th day of the order's lead time. An
 * order whose arrival day falls past the simulated horizon is never delivered.
 *
 * ## Replace, not add
 * `schedule()` overwrites whatever the slot holds. If the slot still carries an
 * unconsumed quantity, that quantity is lost. Within one trial this cannot
 * happen, because the arrival step clears each slot before it is reused.
 *
 * The pipeline does not own its slots. The scalar engine backs it with a
 * `std::vector`, a device lane with memory from the device arena.
 */

#pragma once

#include <cstddef>
#include <cstdint>

class ReplenishmentPipeline {
public:
    /**
     * @param slots    Storage for `leadTime` quantities; zeroed here.
     * @param leadTime Days between placing and receiving an order, >= 1.
     */
    ReplenishmentPipeline(std::uint64_t* slots, std::uint64_t leadTime)
        : slots_(slots), leadTime_(leadTime) {
        for (std::uint64_t i = 0; i < leadTime_; ++i) slots_[i] = 0;
    }

    /**
     * @brief Quantity arriving at the start of `day`; the slot is cleared.
     */
    std::uint64_t arrivalDueToday(std::uint64_t day) {
        std::uint64_t& slot = slots_[day % leadTime_];
        std::uint64_t quantity = slot;
        slot = 0;
        return quantity;
    }

    /**
     * @brief Place an order at the end of `day`. Replaces any pending value.
     */
    void schedule(std::uint64_t day, std::uint64_t quantity) {
        slots_[(day + leadTime_ - 1) % leadTime_] = quantity;
    }

    /// Quantity currently held in ring slot `index`.
    std::uint64_t pending(std::size_t index) const { return slots_[index]; }

private:
    std::uint64_t* slots_;
    std::uint64_t leadTime_;
};
