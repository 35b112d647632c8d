#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>

namespace tender {

/**
 * @brief Bounded single-producer single-consumer queue, wait-free on both ends.
 *
 * Read and write positions count up forever and are masked on access, so all
 * Size slots are usable. push() fails instead of overwriting when full.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert(Size > 0 && (Size & (Size - 1)) == 0, "Size must be a power of 2");

    // Producer side
    bool push(const T& item) {
        const size_t write = write_pos_.load(std::memory_order_relaxed);
        if (write - read_pos_.load(std::memory_order_acquire) == Size) {
            return false;
        }
        slots_[write & kMask] = item;
        write_pos_.store(write + 1, std::memory_order_release);
        return true;
    }

    // Consumer side
    std::optional<T> pop() {
        const size_t read = read_pos_.load(std::memory_order_relaxed);
        if (read == write_pos_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        T item = slots_[read & kMask];
        read_pos_.store(read + 1, std::memory_order_release);
        return item;
    }

    /**
     * @brief Entries waiting; exact only when called from one of the two ends.
     */
    size_t size() const {
        const size_t read = read_pos_.load(std::memory_order_acquire);
        return write_pos_.load(std::memory_order_acquire) - read;
    }

    bool empty() const { return size() == 0; }

    static constexpr size_t capacity() { return Size; }

private:
    static constexpr size_t kMask = Size - 1;

    std::array<T, Size> slots_{};
    std::atomic<size_t> write_pos_{0};
    std::atomic<size_t> read_pos_{0};
};

} // namespace tender
