#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clouddrop {

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::DEBUG; return true; }
    if (s == "info") { out = LogLevel::INFO; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::WARN; return true; }
    if (s == "error") { out = LogLevel::ERROR; return true; }
    out = LogLevel::INFO;
    return false;
}

Logger::Logger(const std::string& path, LogLevel lvl) : level_(lvl) {
    open(path);
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    out_.open(path, std::ios::out | std::ios::app);
    return out_.is_open();
}

void Logger::set_level(LogLevel lvl) {
    level_ = lvl;
}

bool Logger::enabled(LogLevel lvl) const {
    return static_cast<int>(lvl) >= static_cast<int>(level_.load());
}

void Logger::set_tap(Tap tap) {
    std::lock_guard<std::mutex> lk(mu_);
    tap_ = std::move(tap);
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { log(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { log(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "?";
    }
}

std::string Logger::ts() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto tt = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lk(mu_);
    if (tap_) tap_(lvl, msg);
    if (!out_.is_open()) return;
    out_ << ts() << " [" << level_str(lvl) << "] " << msg << "\n";
    out_.flush();
}

} // namespace clouddrop
