#include "log_ring.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

namespace pelo {

LogRing::LogRing(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

LogEntry LogRing::append(const std::string& message, const std::string& category) {
    LogEntry entry{timestampNow(), message, category};
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return entry;
}

std::vector<LogEntry> LogRing::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

size_t LogRing::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void LogRing::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::string LogRing::timestampNow() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[16];
    snprintf(buf, sizeof(buf), "[%02d:%02d:%02d]", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    return buf;
}

} // namespace pelo
