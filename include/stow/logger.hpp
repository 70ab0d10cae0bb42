#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace stow {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error
};

std::string_view to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view text);

/*
 * Process-wide logger.
 * Formats "[timestamp] [LEVEL] message" lines and hands them to a sink,
 * std::cerr unless replaced.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel level, std::string_view line)>;

    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Passing an empty sink restores the std::cerr default
    void set_sink(Sink sink);

    void log(LogLevel level, std::string_view message);

    void trace(std::string_view msg) { log(LogLevel::Trace, msg); }
    void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
    void info(std::string_view msg)  { log(LogLevel::Info, msg); }
    void warn(std::string_view msg)  { log(LogLevel::Warn, msg); }
    void error(std::string_view msg) { log(LogLevel::Error, msg); }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp();

    std::atomic<LogLevel> threshold_{LogLevel::Info};
    Sink sink_;
    std::mutex mutex_;
};

} // namespace stow
