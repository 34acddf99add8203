#ifndef FILESHARE_BASE_LOGGER_H
#define FILESHARE_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <string>
#include <memory>
#include <mutex>
#include <fstream>

namespace fileshare {

// Alias for Elio's log level
using LogLevel = elio::log::level;

// Console output goes through the Elio logger, File appends to a log file
enum class LogOutput {
    Console,
    File
};

// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive).
// Unknown names map to info.
LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;

    // Output configuration
    void set_output(LogOutput output);
    bool set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(level)) return;
        log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    void debug(const std::string& message) { log(LogLevel::debug, message); }
    void info(const std::string& message) { log(LogLevel::info, message); }
    void warning(const std::string& message) { log(LogLevel::warning, message); }
    void error(const std::string& message) { log(LogLevel::error, message); }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::debug, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::info, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::warning, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::error, fmt_str, std::forward<Args>(args)...);
    }

    bool enabled(LogLevel level) const;

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_file(LogLevel level, const std::string& message);

    elio::log::logger& logger_ = elio::log::logger::instance();
    LogLevel level_ = LogLevel::info;
    LogOutput output_ = LogOutput::Console;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;
};

} // namespace fileshare

#endif // FILESHARE_BASE_LOGGER_H
