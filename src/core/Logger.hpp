#pragma once

#include "LockFreeRingBuffer.hpp"
#include <atomic>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>

namespace tender {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[64];  // Static message (for Type::Message)
    uint64_t sequence; // Order of submission across the process
};

/**
 * @brief Singleton Logger for Audio Thread telemetry.
 *
 * The audio thread pushes entries without blocking; a background thread drains
 * them. Entries are dropped (and counted) when the ring is full.
 */
class AudioLogger {
public:
    static constexpr size_t CAPACITY = 1024;

    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        submit(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        submit(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer_.pop();
    }

    /**
     * @brief Format and remove every pending entry.
     *
     * @return Number of entries written.
     */
    size_t drain(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer_.pop()) {
            out << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << '\n';
            ++count;
        }
        return count;
    }

    uint64_t dropped_count() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    AudioLogger() = default;

    void submit(LogEntry& entry) {
        entry.sequence = sequence_.fetch_add(1, std::memory_order_relaxed);
        if (!ring_buffer_.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    LockFreeRingBuffer<LogEntry, CAPACITY> ring_buffer_;
    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace tender
