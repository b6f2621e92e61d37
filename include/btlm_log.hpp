#ifndef BTLM_LOG_HPP
#define BTLM_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <deque>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace btlm {

// ============================================================================
// LOG LEVELS & RECORDS
// ============================================================================

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::time_t timestamp = 0;
    std::string message;
};

// "2026-01-03 14:02:11 INFO     btlm: message"
inline std::string format_log_record(const LogRecord& record) {
    std::tm tm_buf{};
    localtime_r(&record.timestamp, &tm_buf);

    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ' '
         << std::left << std::setw(8) << log_level_name(record.level)
         << " btlm: " << record.message;
    return line.str();
}

// ============================================================================
// SINKS
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/*
 * Keeps the newest `capacity` formatted lines for the Log screen.
 * Records below `min_level` (INFO by default) are not retained.
 */
class MemoryLogSink final : public ILogSink {
public:
    explicit MemoryLogSink(size_t capacity = 200, LogLevel min_level = LogLevel::INFO)
        : capacity_(capacity), min_level_(min_level) {}

    void write(const LogRecord& record) override {
        if (record.level < min_level_) return;
        std::string line = format_log_record(record);

        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
        while (lines_.size() > capacity_) {
            lines_.pop_front();
        }
        sequence_.fetch_add(1, std::memory_order_release);
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(lines_.begin(), lines_.end());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

    size_t capacity() const { return capacity_; }

    // Incremented on every retained line.
    uint64_t sequence() const {
        return sequence_.load(std::memory_order_acquire);
    }

private:
    size_t capacity_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    std::atomic<uint64_t> sequence_{0};
};

class StreamLogSink final : public ILogSink {
public:
    explicit StreamLogSink(std::ostream& out, LogLevel min_level = LogLevel::DEBUG)
        : out_(out), min_level_(min_level) {}

    void write(const LogRecord& record) override {
        if (record.level < min_level_) return;
        std::string line = format_log_record(record);

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << '\n';
        out_.flush();
    }

private:
    std::ostream& out_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ============================================================================
// LOGGER
// ============================================================================

/*
 * Thread-safe fan-out to the attached sinks. Called from the scan context,
 * the consumer task and the render thread alike.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::INFO) : level_(level) {}

    void add_sink(std::shared_ptr<ILogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    bool enabled(LogLevel level) const { return level >= level_.load(); }

    void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) return;

        LogRecord record;
        record.level = level;
        record.timestamp = std::time(nullptr);
        record.message = message;

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& sink : sinks_) {
            sink->write(record);
        }
    }

    void debug(const std::string& message)   { log(LogLevel::DEBUG, message); }
    void info(const std::string& message)    { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message)   { log(LogLevel::ERROR, message); }

private:
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

// ============================================================================
// TIMING
// ============================================================================

// Logs "[label] took X s" at DEBUG when the scope ends.
class ScopedTimer {
public:
    ScopedTimer(Logger& logger, std::string label)
        : logger_(logger),
          label_(std::move(label)),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        if (!logger_.enabled(LogLevel::DEBUG)) return;
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        std::ostringstream msg;
        msg << "[" << label_ << "] took " << std::fixed << std::setprecision(4)
            << elapsed.count() << " s";
        logger_.debug(msg.str());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Logger& logger_;
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace btlm

#endif // BTLM_LOG_HPP
