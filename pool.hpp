// =======================================
// pool.hpp - Device memory arena
// =======================================
/**
 * @file pool.hpp
 * @brief Fixed-size aligned pool allocator backing the batched device buffers.
 *
 * `PoolAllocator` is a linear (bump) allocator over one 64-byte aligned block.
 * The batched backend carves its per-batch buffers out of it: the uploaded
 * lane seeds, the per-lane replenishment rings, and the five per-lane counter
 * arrays that are downloaded and reduced after the launch.
 *
 * ---
 *
 * ## Lifetime
 * - The block is allocated once, when the owning `Device` is constructed.
 * - Every batch allocates from offset zero and calls `reset()` when it ends,
 *   on success and on failure alike (see `ArenaScope`).
 * - There is no per-allocation free.
 *
 * ## Alignment Model
 * - The block itself is aligned to 64 bytes (one cache line).
 * - Each `allocate<T>(count, align)` rounds the current offset up to `align`,
 *   so two arrays allocated with `align = 64` never share a cache line. Lanes
 *   owned by different workers therefore do not false-share at array edges.
 *
 * ## Overflow
 * `allocate()` returns `nullptr` when the request does not fit. The caller
 * turns that into an `AcceleratorError`; the allocator itself never throws
 * and never aborts.
 *
 * ## Usage Example
 * ```cpp
 * PoolAllocator pool(1 << 20);
 * std::uint64_t* seeds = pool.allocate<std::uint64_t>(lanes, 64);
 * if (!seeds) { ... }   // arena exhausted
 * pool.reset();
 * ```
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>

/**
 * @brief Aligned bump allocator over a single preallocated block.
 */
struct PoolAllocator {
    static constexpr std::size_t kBlockAlign = 64;

    char* memory;               ///< Raw memory block (nullptr if the block could not be allocated)
    std::size_t capacity;       ///< Usable capacity in bytes
    std::size_t offset;         ///< Offset for bump allocation

public:
    /**
     * @brief Allocate the backing block.
     * @param bytes Requested capacity; rounded up to a multiple of 64 as
     *              `std::aligned_alloc` requires.
     *
     * A failed or zero-sized allocation leaves the pool with zero capacity, so
     * every later `allocate()` reports exhaustion instead of crashing.
     */
    explicit PoolAllocator(std::size_t bytes) : memory(nullptr), capacity(0), offset(0) {
        std::size_t rounded = (bytes + (kBlockAlign - 1)) & ~(kBlockAlign - 1);
        if (rounded == 0) return;
        memory = static_cast<char*>(std::aligned_alloc(kBlockAlign, rounded));
        if (memory) capacity = rounded;
    }

    ~PoolAllocator() {
        std::free(memory);
    }

    PoolAllocator(const PoolAllocator&) = delete;
    PoolAllocator& operator=(const PoolAllocator&) = delete;

    /**
     * @brief Allocate storage for `count` objects of type T.
     * @tparam T Trivially constructible element type.
     * @param count Number of elements.
     * @param align Alignment in bytes, a power of two (default: alignof(T)).
     * @return Aligned pointer, or nullptr when the arena is exhausted.
     */
    template<typename T>
    T* allocate(std::size_t count = 1, std::size_t align = alignof(T)) {
        if (!memory) return nullptr;
        if (count > (capacity / sizeof(T))) return nullptr;

        std::size_t aligned = (offset + (align - 1)) & ~(align - 1);
        std::size_t bytes = count * sizeof(T);
        if (aligned > capacity || bytes > capacity - aligned) return nullptr;

        offset = aligned + bytes;
        return reinterpret_cast<T*>(memory + aligned);
    }

    /// Bytes handed out since the last reset.
    std::size_t used() const { return offset; }

    /// Bytes still available (ignoring alignment padding of the next request).
    std::size_t remaining() const { return capacity - offset; }

    /**
     * @brief Reclaim the whole block for the next batch.
     */
    void reset() {
        offset = 0;
    }
};

/**
 * @brief Scope guard that resets a pool when the batch using it ends.
 */
class ArenaScope {
public:
    explicit ArenaScope(PoolAllocator& pool) : pool_(pool) { pool_.reset(); }
    ~ArenaScope() { pool_.reset(); }

    ArenaScope(const ArenaScope&) = delete;
    ArenaScope& operator=(const ArenaScope&) = delete;

private:
    PoolAllocator& pool_;
};
