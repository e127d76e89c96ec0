#pragma once
// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ---------------------------------------------------------------------------
// ErrorCode  --  what went wrong at the tool / library boundary
//
// Grouped by hundreds so that a code's family can be read off its value.
// ---------------------------------------------------------------------------
enum class ErrorCode : uint16_t {
    NONE              = 0,

    PARSE_ERROR       = 100,  // generic malformed input
    PARSE_OVERFLOW    = 101,  // value does not fit its target type
    PARSE_BAD_HEX     = 102,  // odd length or non-hex digit
    PARSE_BAD_ASM     = 103,  // ASM text rejected by the assembler

    SCRIPT_ERROR      = 200,
    SCRIPT_TRUNCATED  = 201,  // a push runs past the end of the script

    CONFIG_ERROR      = 300,  // malformed option or config line
    CONFIG_MISSING    = 301,  // required option or file absent
    IO_ERROR          = 302,

    INTERNAL_ERROR    = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error  --  an ErrorCode plus a message and the place it was raised
// ---------------------------------------------------------------------------
class Error {
public:
    Error() noexcept = default;

    explicit Error(ErrorCode code, std::string message = {},
                   std::source_location where =
                       std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), where_(where) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return where_;
    }

    /// A default-constructed Error (code NONE) means "no error".
    [[nodiscard]] bool is_ok() const noexcept {
        return code_ == ErrorCode::NONE;
    }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }

    /// "NAME(code): message [file:line]"
    [[nodiscard]] std::string format() const;

    /// Errors compare by code only.
    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

private:
    ErrorCode            code_ = ErrorCode::NONE;
    std::string          message_;
    std::source_location where_;
};

// ---------------------------------------------------------------------------
// Result<T, E>  --  either a T or an E
//
// E defaults to Error, but any type distinct from T works; the script
// layer uses its own error enums and structs.
// ---------------------------------------------------------------------------
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result needs distinct value and error types");

public:
    Result(const T& v) : data_(std::in_place_index<0>, v) {}             // NOLINT
    Result(T&& v) : data_(std::in_place_index<0>, std::move(v)) {}       // NOLINT
    Result(const E& e) : data_(std::in_place_index<1>, e) {}             // NOLINT
    Result(E&& e) : data_(std::in_place_index<1>, std::move(e)) {}       // NOLINT

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        require_value();
        return std::get<0>(data_);
    }
    [[nodiscard]] const T& value() const& {
        require_value();
        return std::get<0>(data_);
    }
    [[nodiscard]] T&& value() && {
        require_value();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& error() & {
        require_error();
        return std::get<1>(data_);
    }
    [[nodiscard]] const E& error() const& {
        require_error();
        return std::get<1>(data_);
    }
    [[nodiscard]] E&& error() && {
        require_error();
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const {
        if (ok()) return std::get<0>(data_);
        return fallback;
    }

    /// Translate the error with @p fn, passing a value through untouched.
    template <typename Fn>
    [[nodiscard]] auto map_error(Fn&& fn) const&
        -> Result<T, std::invoke_result_t<Fn, const E&>> {
        if (ok()) return std::get<0>(data_);
        return std::forward<Fn>(fn)(std::get<1>(data_));
    }

    /// Feed the value to @p fn, which returns another Result with the same
    /// error type; an error is passed through untouched.
    template <typename Fn>
    [[nodiscard]] auto and_then(Fn&& fn) const&
        -> std::invoke_result_t<Fn, const T&> {
        if (ok()) return std::forward<Fn>(fn)(std::get<0>(data_));
        return std::get<1>(data_);
    }

private:
    void require_value() const {
        if (!ok()) throw std::logic_error("Result: value() on an error");
    }
    void require_error() const {
        if (ok()) throw std::logic_error("Result: error() on a value");
    }

    std::variant<T, E> data_;
};

// Result<void, E>: success carries nothing.
template <typename E>
class Result<void, E> {
public:
    Result() noexcept = default;
    Result(const E& e) : err_(e), failed_(true) {}                      // NOLINT
    Result(E&& e) : err_(std::move(e)), failed_(true) {}                // NOLINT

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (failed_) throw std::logic_error("Result: value() on an error");
    }
    [[nodiscard]] const E& error() const& {
        if (!failed_) throw std::logic_error("Result: error() on a value");
        return err_;
    }
    [[nodiscard]] E&& error() && {
        if (!failed_) throw std::logic_error("Result: error() on a value");
        return std::move(err_);
    }

private:
    E    err_{};
    bool failed_ = false;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code, std::string message = {},
    std::source_location where = std::source_location::current()) noexcept {
    return Error(code, std::move(message), where);
}

[[nodiscard]] inline Result<void> make_ok() noexcept { return {}; }

// ---------------------------------------------------------------------------
// Early-return helpers for functions returning a Result.
//
//   SCRIPTASM_TRY_ASSIGN(text, read_source(config));
//   SCRIPTASM_TRY_VOID(config.parse_file(path));
// ---------------------------------------------------------------------------
#define SCRIPTASM_TRY_ASSIGN(var, expr)                                   \
    auto var##_result_ = (expr);                                          \
    if (!var##_result_.ok()) return std::move(var##_result_).error();     \
    auto var = std::move(var##_result_).value()

#define SCRIPTASM_TRY_VOID(expr)                                          \
    do {                                                                  \
        auto try_result_ = (expr);                                        \
        if (!try_result_.ok()) return std::move(try_result_).error();     \
    } while (false)

} // namespace core
