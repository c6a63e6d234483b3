#pragma once

#include <atomic>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace clouddrop {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// "debug" | "info" | "warn" | "error"; anything else maps to INFO and returns false.
bool parse_log_level(const std::string& s, LogLevel& out);

// Thread-safe file logger. Never writes to stdout so the console stays clean.
// A logger that was never opened discards everything except what the tap sees.
class Logger {
public:
    // Receives every line that passes the level filter, file or not.
    using Tap = std::function<void(LogLevel, const std::string&)>;

    Logger() = default;
    explicit Logger(const std::string& path, LogLevel lvl = LogLevel::INFO);

    bool open(const std::string& path);
    void set_level(LogLevel lvl);
    bool enabled(LogLevel lvl) const;
    void set_tap(Tap tap);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void log(LogLevel lvl, const std::string& msg);
    static std::string ts();
    static const char* level_str(LogLevel lvl);

    std::mutex mu_;
    std::ofstream out_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    Tap tap_;
};

} // namespace clouddrop
