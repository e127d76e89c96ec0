// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace core {

namespace {

constexpr std::array<std::pair<LogLevel, std::string_view>, 7> LEVEL_NAMES = {{
    {LogLevel::TRACE, "trace"},
    {LogLevel::DEBUG, "debug"},
    {LogLevel::INFO,  "info"},
    {LogLevel::WARN,  "warn"},
    {LogLevel::ERR,   "error"},
    {LogLevel::FATAL, "fatal"},
    {LogLevel::OFF,   "off"},
}};

bool same_ignoring_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// UTC, millisecond precision.
std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    const std::time_t secs = system_clock::to_time_t(now);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif

    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf),
                                "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                                utc.tm_year + 1900, utc.tm_mon + 1,
                                utc.tm_mday, utc.tm_hour, utc.tm_min,
                                utc.tm_sec, static_cast<int>(ms.count()));
    return std::string(buf, n > 0 ? static_cast<size_t>(n) : 0);
}

} // anonymous namespace

std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (const auto& [level, spelling] : LEVEL_NAMES) {
        if (same_ignoring_case(name, spelling)) return level;
    }
    return std::nullopt;
}

std::string_view log_category_string(LogCategory cat) noexcept {
    const auto bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (cat == LogCategory::ALL) return "ALL";

    switch (static_cast<LogCategory>(bits & (~bits + 1u))) {
        case LogCategory::ASM:       return "ASM";
        case LogCategory::SCRIPT:    return "SCRIPT";
        case LogCategory::SCRIPTNUM: return "SCRIPTNUM";
        case LogCategory::LOCKTIME:  return "LOCKTIME";
        case LogCategory::TOOL:      return "TOOL";
        default:                     return "OTHER";
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

bool Logger::will_log(LogLevel level, LogCategory cat) const noexcept {
    if (static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) {
        return false;
    }
    const auto bits = static_cast<uint32_t>(cat);
    if (bits != 0 && (categories_.load(std::memory_order_relaxed) & bits) == 0) {
        return false;
    }
    return to_console_.load(std::memory_order_relaxed) ||
           to_file_.load(std::memory_order_relaxed);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    to_file_.store(false, std::memory_order_relaxed);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }

    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return false;
    }
    to_file_.store(true, std::memory_order_relaxed);
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cerr.flush();
}

void Logger::write(LogLevel level, LogCategory cat, std::string_view message) {
    std::string line = "[" + timestamp() + "] [";
    line += log_level_string(level);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (to_console_.load(std::memory_order_relaxed)) {
        std::cerr << line;
    }
    if (to_file_.load(std::memory_order_relaxed) && file_.is_open()) {
        file_ << line;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

} // namespace core
