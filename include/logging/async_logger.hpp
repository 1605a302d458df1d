#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace quantcode {
namespace logging {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

// Case-insensitive; "warning" is accepted for Warn
inline std::optional<LogLevel> level_from_string(const std::string& s) {
    std::string lower(s);
    for (char& c : lower) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    return std::nullopt;
}

/**
 * Pipeline stage that produced an entry
 */
enum class LogCategory : uint8_t {
    System = 0,
    Data,      // Price history fetch and preprocessing
    Indicator, // Per-indicator votes
    Consensus, // Final signal per ticker
    Risk,      // Position sizing, trade setups
    Journal    // Trade journal updates
};

inline const char* category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Data:
        return "data";
    case LogCategory::Indicator:
        return "indicator";
    case LogCategory::Consensus:
        return "consensus";
    case LogCategory::Risk:
        return "risk";
    case LogCategory::Journal:
        return "journal";
    }
    return "other";
}

/**
 * Log Entry - fixed 256 bytes so the queue never allocates
 */
struct LogEntry {
    uint64_t wall_ms = 0;  // Unix epoch milliseconds
    uint32_t sequence = 0; // Per-logger, in submission order
    LogLevel level = LogLevel::Info;
    LogCategory category = LogCategory::System;
    uint16_t reserved = 0;
    char message[240] = {}; // Null-terminated, truncated

    void set_message(const char* msg) {
        const size_t len = std::min(std::strlen(msg), sizeof(message) - 1);
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Bounded single-producer / single-consumer queue
 *
 * Read and write positions grow monotonically and are masked on access,
 * so all Capacity slots are usable.
 */
template <typename T, size_t Capacity>
class SpscRing {
public:
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0, "Capacity must be a power of 2");

    SpscRing() : slots_(std::make_unique<T[]>(Capacity)) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer side; false when full
    bool try_push(const T& item) {
        const uint64_t write = write_.load(std::memory_order_relaxed);
        if (write - read_.load(std::memory_order_acquire) == Capacity)
            return false;

        slots_[write & MASK] = item;
        write_.store(write + 1, std::memory_order_release);
        return true;
    }

    // Consumer side; false when empty
    bool try_pop(T& item) {
        const uint64_t read = read_.load(std::memory_order_relaxed);
        if (read == write_.load(std::memory_order_acquire))
            return false;

        item = slots_[read & MASK];
        read_.store(read + 1, std::memory_order_release);
        return true;
    }

    size_t size() const {
        return static_cast<size_t>(write_.load(std::memory_order_acquire) - read_.load(std::memory_order_acquire));
    }
    bool empty() const { return size() == 0; }
    bool full() const { return size() == Capacity; }
    static constexpr size_t capacity() { return Capacity; }

private:
    static constexpr uint64_t MASK = Capacity - 1;

    alignas(64) std::atomic<uint64_t> write_{0};
    alignas(64) std::atomic<uint64_t> read_{0};
    std::unique_ptr<T[]> slots_;
};

/**
 * "2024-01-02T14:30:05.123Z INFO  [consensus] AAPL: SELL ..."
 */
inline std::string format_line(const LogEntry& entry) {
    const std::time_t secs = static_cast<std::time_t>(entry.wall_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

    char line[sizeof(LogEntry::message) + 64];
    std::snprintf(line, sizeof(line), "%s.%03uZ %-5s [%s] %s", stamp, static_cast<unsigned>(entry.wall_ms % 1000),
                  level_to_string(entry.level), category_to_string(entry.category), entry.message);
    return line;
}

/**
 * Async Logger
 *
 * Callers format into a fixed entry and enqueue it; a background thread
 * writes entries to the sink (stderr unless a callback is set).
 * Entries are dropped, and counted, when the queue is full.
 *
 * One producer thread only. The analyzer gathers worker outcomes and
 * logs them from the calling thread.
 *
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(logger, Consensus, "%s: %s", ticker, signal);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    static constexpr size_t QUEUE_CAPACITY = 4096;

    AsyncLogger() = default;
    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;
        consumer_ = std::thread([this]() { run(); });
    }

    // Joins the consumer, then writes whatever is still queued
    void stop() {
        if (!running_.exchange(false))
            return;
        if (consumer_.joinable())
            consumer_.join();
        drain();
    }

    bool running() const { return running_.load(std::memory_order_relaxed); }

    void log(LogLevel level, LogCategory category, const char* message) {
        if (!enabled(level))
            return;

        LogEntry entry;
        entry.wall_ms = now_ms();
        entry.sequence = next_sequence_++;
        entry.level = level;
        entry.category = category;
        entry.set_message(message);

        if (queue_.try_push(entry))
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        else
            dropped_.fetch_add(1, std::memory_order_relaxed);
    }

    template <typename... Args>
    void logf(LogLevel level, LogCategory category, const char* fmt, Args... args) {
        if (!enabled(level))
            return;

        char text[sizeof(LogEntry::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    bool enabled(LogLevel level) const { return level >= min_level_.load(std::memory_order_relaxed); }
    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Set before start()
    void set_output_callback(OutputCallback cb) { callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return queue_.size(); }

private:
    SpscRing<LogEntry, QUEUE_CAPACITY> queue_;
    std::thread consumer_;
    std::atomic<bool> running_{false};
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    OutputCallback callback_;
    uint32_t next_sequence_ = 0;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> total_logged_{0};

    void run() {
        while (running_.load(std::memory_order_relaxed)) {
            if (drain() == 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    size_t drain() {
        size_t written = 0;
        LogEntry entry;
        while (queue_.try_pop(entry)) {
            write(entry);
            ++written;
        }
        return written;
    }

    void write(const LogEntry& entry) {
        if (callback_) {
            callback_(entry);
            return;
        }
        std::fprintf(stderr, "%s\n", format_line(entry).c_str());
    }

    static uint64_t now_ms() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::system_clock::now().time_since_epoch())
                                         .count());
    }
};

// Plain messages go to the System category
#define LOG_DEBUG(logger, msg) \
    (logger).log(quantcode::logging::LogLevel::Debug, quantcode::logging::LogCategory::System, msg)
#define LOG_INFO(logger, msg) \
    (logger).log(quantcode::logging::LogLevel::Info, quantcode::logging::LogCategory::System, msg)
#define LOG_WARN(logger, msg) \
    (logger).log(quantcode::logging::LogLevel::Warn, quantcode::logging::LogCategory::System, msg)
#define LOG_ERROR(logger, msg) \
    (logger).log(quantcode::logging::LogLevel::Error, quantcode::logging::LogCategory::System, msg)

// Printf-style, category first
#define LOGF_DEBUG(logger, cat, fmt, ...) \
    (logger).logf(quantcode::logging::LogLevel::Debug, quantcode::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...) \
    (logger).logf(quantcode::logging::LogLevel::Info, quantcode::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...) \
    (logger).logf(quantcode::logging::LogLevel::Warn, quantcode::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...) \
    (logger).logf(quantcode::logging::LogLevel::Error, quantcode::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace quantcode
