#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cstddef>
#include <functional>

namespace pelo {

// User-facing log line (what a front end shows in its log panel)
struct LogEntry {
    std::string timestamp;   // "[HH:MM:SS]"
    std::string message;
    std::string category;    // info, status, error, command, stdout, stderr
};

// Log sink handed to lower layers: (message, category)
using LogSink = std::function<void(const std::string& message, const std::string& category)>;

/**
 * Bounded log ring.
 * Append-only in arrival order; once capacity is exceeded the oldest entry
 * is evicted.
 */
class LogRing {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit LogRing(size_t capacity = DEFAULT_CAPACITY);

    LogEntry append(const std::string& message, const std::string& category);

    std::vector<LogEntry> entries() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    // Current local time as "[HH:MM:SS]"
    static std::string timestampNow();

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
};

} // namespace pelo
