/**
 * @file Logger.hpp
 * @brief Injected ring-buffer logger shared by the capture and analysis layers.
 */

#ifndef OMEGA_LOGGER_HPP
#define OMEGA_LOGGER_HPP

#include <algorithm>
#include <atomic>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace omega {

/**
 * @brief A single log record.
 * Fixed-size so that pushing never allocates.
 */
struct LogEntry {
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    Level level;
    char tag[32];
    char message[160];
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer.
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
 * @brief Logger handed to each component at construction.
 *
 * Writers come from several non-RT threads (control calls, the processing
 * thread, the ALSA reader on setup), so pushes are serialized; the reader
 * side stays lock-free. The driver callback must not log.
 */
class Logger {
public:
    using Level = LogEntry::Level;

    explicit Logger(Level min_level = Level::Info)
        : min_level_(min_level)
    {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(Level level, const char* tag, std::string_view msg) {
        if (level < min_level_.load(std::memory_order_relaxed)) return;

        LogEntry entry{};
        entry.level = level;
        copy_truncated(entry.tag, sizeof(entry.tag), tag ? std::string_view(tag) : std::string_view());
        copy_truncated(entry.message, sizeof(entry.message), msg);
        entry.timestamp = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!ring_buffer_.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void debug(const char* tag, std::string_view msg) { log(Level::Debug, tag, msg); }
    void info(const char* tag, std::string_view msg) { log(Level::Info, tag, msg); }
    void warn(const char* tag, std::string_view msg) { log(Level::Warning, tag, msg); }
    void error(const char* tag, std::string_view msg) { log(Level::Error, tag, msg); }

    // Reader side (single consumer)
    std::optional<LogEntry> pop_entry() {
        return ring_buffer_.pop();
    }

    /**
     * @brief Drain every pending entry into a stream.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer_.pop()) {
            out << "[" << level_name(entry->level) << "] " << entry->tag << ": "
                << entry->message << '\n';
            ++count;
        }
        out.flush();
        return count;
    }

    void set_min_level(Level level) { min_level_.store(level, std::memory_order_relaxed); }
    Level min_level() const { return min_level_.load(std::memory_order_relaxed); }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    static const char* level_name(Level level) {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO";
            case Level::Warning: return "WARN";
            case Level::Error: return "ERROR";
        }
        return "?";
    }

private:
    static void copy_truncated(char* dst, size_t capacity, std::string_view src) {
        const size_t n = std::min(src.size(), capacity - 1);
        if (n > 0) std::memcpy(dst, src.data(), n);
        dst[n] = '\0';
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer_;
    std::mutex write_mutex_;
    std::atomic<Level> min_level_;
    std::atomic<size_t> dropped_{0};
};

} // namespace omega

#endif // OMEGA_LOGGER_HPP
