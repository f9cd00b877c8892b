#include "idelens/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

namespace idelens {

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR" || name == "ERR") return LogLevel::ERR;
    return std::nullopt;
}

static std::string now_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    return ss.str();
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    Sink sink;
    LogMessage lm{level, now_timestamp(), msg};
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (level < min_level_) return;

        std::string formatted = "[" + lm.timestamp + "] [" +
                                std::string(log_level_name(level)) + "] " + msg;
        std::cerr << formatted << std::endl;
#ifdef _WIN32
        std::string win_msg = formatted + "\n";
        OutputDebugStringA(win_msg.c_str());
#endif

        buffer_.push_back(lm);
        if (buffer_.size() > MAX_LOGS) {
            buffer_.erase(buffer_.begin());
        }
        sink = sink_;
    }
    // Sink runs unlocked so it may log or inspect the buffer itself.
    if (sink) sink(lm);
}

std::vector<LogMessage> Logger::get_recent_logs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= buffer_.size()) return buffer_;
    return std::vector<LogMessage>(buffer_.end() - static_cast<std::ptrdiff_t>(count), buffer_.end());
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return min_level_;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(mu_);
    sink_ = std::move(sink);
}

void Logger::clear_recent() {
    std::lock_guard<std::mutex> lk(mu_);
    buffer_.clear();
}

} // namespace idelens
