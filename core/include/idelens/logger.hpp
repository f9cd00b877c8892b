#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace idelens {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

std::optional<LogLevel> parse_log_level(std::string_view name);
std::string_view log_level_name(LogLevel level);

class Logger {
public:
    using Sink = std::function<void(const LogMessage &)>;

    static Logger& get();

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);
    std::vector<LogMessage> get_recent_logs(size_t count = 100);
    void set_level(LogLevel level);
    LogLevel level() const;

    // Extra consumer for every message at or above the current level.
    // Passing an empty function removes it.
    void set_sink(Sink sink);
    void clear_recent();

private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::INFO;
    std::vector<LogMessage> buffer_;
    Sink sink_;
    static constexpr size_t MAX_LOGS = 256;
};

#define LOG_AT_LEVEL(level, msg) \
    do { if (idelens::Logger::get().should_log(level)) idelens::Logger::get().log(level, msg); } while(0)

#define LOG_TRACE(msg) LOG_AT_LEVEL(idelens::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) LOG_AT_LEVEL(idelens::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  LOG_AT_LEVEL(idelens::LogLevel::INFO, msg)
#define LOG_WARN(msg)  LOG_AT_LEVEL(idelens::LogLevel::WARN, msg)
#define LOG_ERROR(msg) LOG_AT_LEVEL(idelens::LogLevel::ERR, msg)

} // namespace idelens
