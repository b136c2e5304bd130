#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <thread>

namespace intraday {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

// Category constants for the simulator
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Market = 1;
constexpr uint8_t Strategy = 2;
constexpr uint8_t Position = 3;
constexpr uint8_t Status = 4;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Market:
        return "market";
    case LogCategory::Strategy:
        return "strategy";
    case LogCategory::Position:
        return "position";
    case LogCategory::Status:
        return "status";
    default:
        return "other";
    }
}

/**
 * Log Entry - Fixed size for predictable latency
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes (wall clock)
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // 240 bytes (null-terminated)
    // Total: 256 bytes (four cache lines)

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Lock-Free SPSC Ring Buffer
 *
 * Single Producer, Single Consumer - no locks needed.
 * Cache-line aligned to prevent false sharing.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    /**
     * Try to push a log entry (producer side)
     * Returns true if successful, false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /**
     * Try to pop a log entry (consumer side)
     * Returns true if entry was available, false if empty.
     */
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * A background thread does the I/O. Producers may log from any thread:
 * pushes are serialized on producer_mutex_ since the ring is single
 * producer. The consumer side stays lock-free.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   INTRADAY_LOG_INFO(logger, Position, "BUY executed at %s", price.c_str());
 *   logger.stop();
 *
 * Without start(), entries stay buffered until drain() is called on the
 * producer thread (tests use this to read output deterministically).
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return; // Already stopped

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        drain();
    }

    /**
     * Output everything buffered on the calling thread.
     * Only valid while the consumer thread is not running.
     */
    size_t drain() {
        if (running_.load(std::memory_order_acquire))
            return 0;

        size_t count = 0;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
            ++count;
        }
        return count;
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        bool pushed;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            pushed = buffer_.try_push(entry);
        }
        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting (truncated to the entry size)
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }

private:
    LogRingBuffer<4096> buffer_;
    std::mutex producer_mutex_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            // Sleep briefly to avoid busy spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            // Default: print to stderr
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%lu.%03lu] [%s] [%s] %s\n", static_cast<unsigned long>(ts_ms / 1000),
                         static_cast<unsigned long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros (printf-style)
#define INTRADAY_LOG_DEBUG(logger, cat, fmt, ...)                                                                      \
    (logger).logf(::intraday::logging::LogLevel::Debug, ::intraday::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define INTRADAY_LOG_INFO(logger, cat, fmt, ...)                                                                       \
    (logger).logf(::intraday::logging::LogLevel::Info, ::intraday::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define INTRADAY_LOG_WARN(logger, cat, fmt, ...)                                                                       \
    (logger).logf(::intraday::logging::LogLevel::Warn, ::intraday::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define INTRADAY_LOG_ERROR(logger, cat, fmt, ...)                                                                      \
    (logger).logf(::intraday::logging::LogLevel::Error, ::intraday::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace intraday
