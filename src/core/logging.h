#pragma once
// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR,    // not ERROR: clashes with a <windows.h> macro
    FATAL,
    OFF,
};

// Subsystems, as bits so that several can be enabled at once.
enum class LogCategory : uint32_t {
    NONE      = 0,
    ASM       = 1u << 0,  // tokenizer and assembler
    SCRIPT    = 1u << 1,  // script builder, iteration, disassembly
    SCRIPTNUM = 1u << 2,  // stack number codec
    LOCKTIME  = 1u << 3,  // relative lock-time decoding
    TOOL      = 1u << 4,  // command-line front end and config
    ALL       = 0xffffffffu,
};

[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// "trace" .. "off", any case.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Name of the lowest set bit of @p cat ("NONE" for no bits, "ALL" for all).
[[nodiscard]] std::string_view log_category_string(LogCategory cat) noexcept;

// ---------------------------------------------------------------------------
// Logger  --  process-wide sink for diagnostic lines
//
// Lines look like
//   [2026-02-03 12:00:00.123] [DEBUG] [ASM] parse_asm: ...
// and go to stderr, to a log file, or both. Filtering reads atomics only,
// so a suppressed LOG_* call costs no allocation.
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }
    void enable_category(LogCategory cat) noexcept {
        categories_.fetch_or(static_cast<uint32_t>(cat),
                             std::memory_order_relaxed);
    }
    void disable_category(LogCategory cat) noexcept {
        categories_.fetch_and(~static_cast<uint32_t>(cat),
                              std::memory_order_relaxed);
    }
    void set_print_to_console(bool enable) noexcept {
        to_console_.store(enable, std::memory_order_relaxed);
    }

    [[nodiscard]] bool will_log(LogLevel level, LogCategory cat) const noexcept;

    /// Append to @p path from now on. An empty path closes the current file.
    /// Returns false if the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    void write(LogLevel level, LogCategory cat, std::string_view message);

private:
    Logger() = default;
    ~Logger();

    std::atomic<int>      min_level_{static_cast<int>(LogLevel::WARN)};
    std::atomic<uint32_t> categories_{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     to_console_{true};
    std::atomic<bool>     to_file_{false};

    std::mutex    mutex_;  // guards file_ and interleaving of lines
    std::ofstream file_;
};

} // namespace core

// LOG_DEBUG(core::LogCategory::ASM, "unknown instruction '" + word + "'");
#define SCRIPTASM_LOG(lvl, cat, msg)                                      \
    do {                                                                  \
        auto& scriptasm_logger_ = core::Logger::instance();               \
        if (scriptasm_logger_.will_log((lvl), (cat))) {                   \
            scriptasm_logger_.write((lvl), (cat), std::string(msg));      \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SCRIPTASM_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SCRIPTASM_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SCRIPTASM_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  SCRIPTASM_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) SCRIPTASM_LOG(core::LogLevel::ERR, cat, msg)
