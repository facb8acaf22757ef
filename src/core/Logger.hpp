/**
 * @file Logger.hpp
 * @brief RT-safe telemetry logger shared by the audio and control threads.
 */

#ifndef MORPHO_LOGGER_HPP
#define MORPHO_LOGGER_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>

namespace morpho {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};      // Category ("SAFETY", "RENDER", "GRAPH", ...)
    float value = 0.0f;     // Numeric value (for Type::Event)
    char message[64] = {};  // Static message (for Type::Message)
    uint64_t timestamp = 0; // Steady-clock microseconds
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer for RT-Safe logging.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton logger for engine telemetry.
 *
 * The ring itself is single-producer. Producers on different threads (audio
 * callback, control tick, export worker) serialize on a try-flag; an entry
 * that loses the flag or does not fit is counted as dropped, never waited on.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        push(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Write every pending entry as "[TAG] message" / "[TAG] value".
     *
     * @return Number of entries written.
     */
    size_t drain(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
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

    /**
     * @brief Entries lost because the ring was full.
     */
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    AudioLogger() = default;

    void push(const LogEntry& entry) {
        if (producer_busy_.test_and_set(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        producer_busy_.clear(std::memory_order_release);
    }

    static uint64_t now_us() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic<uint64_t> dropped_{0};
    std::atomic_flag producer_busy_ = ATOMIC_FLAG_INIT;
};

} // namespace morpho

#endif // MORPHO_LOGGER_HPP
