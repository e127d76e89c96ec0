#pragma once

#include "core/error.h"
#include "script/script_error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace script {

/// Default maximum size of a stack element interpreted as a number.
static constexpr size_t MAX_SCRIPTNUM_SIZE = 4;

/// Largest encoding write_scriptint() can produce: eight magnitude bytes
/// plus a sign byte, reached only by INT64_MIN.
static constexpr size_t MAX_SCRIPTINT_ENCODED_SIZE = 9;

using ScriptIntBuffer = std::array<uint8_t, MAX_SCRIPTINT_ENCODED_SIZE>;

// ---------------------------------------------------------------------------
// ScriptIntError  --  ways decoding a stack number can fail
// ---------------------------------------------------------------------------
enum class ScriptIntError {
    /// The encoding carries a redundant most-significant byte (BIP62 rule 4).
    NON_MINIMAL_PUSH,
    /// The element is longer than the permitted number size.
    NUMERIC_OVERFLOW,
};

std::string_view scriptint_error_string(ScriptIntError err);

/// Encode @p n in minimal CScriptNum form into @p out and return the number
/// of bytes written. Zero encodes as no bytes at all.
///
/// The encoding is little-endian magnitude with the sign carried in the top
/// bit of the last byte. Values that need more than four bytes are encoded,
/// but do not read back through read_scriptint() with the default size cap;
/// this mirrors CScriptNum::serialize in Bitcoin Core.
size_t write_scriptint(ScriptIntBuffer& out, int64_t n) noexcept;

/// Minimal CScriptNum encoding of @p n as a byte vector.
std::vector<uint8_t> scriptint_vec(int64_t n);

/// Decode a stack element as a number with an explicit size cap.
///
/// Elements longer than @p max_size fail with NUMERIC_OVERFLOW. With
/// @p minimal set, encodings with a redundant top byte (including negative
/// zero) fail with NON_MINIMAL_PUSH.
///
/// Throws std::invalid_argument if @p max_size exceeds 8.
core::Result<int64_t, ScriptIntError> read_scriptint_size(
    std::span<const uint8_t> bytes, size_t max_size, bool minimal);

/// Decode a stack element, reporting failures in the execution engine's
/// terms: NON_MINIMAL_PUSH -> MINIMALDATA and NUMERIC_OVERFLOW ->
/// SCRIPTNUM_OVERFLOW.
core::Result<int64_t, ScriptError> read_scriptint(
    std::span<const uint8_t> bytes,
    size_t max_size = MAX_SCRIPTNUM_SIZE,
    bool minimal = true);

/// read_scriptint() with the default 4-byte cap and no minimality check.
core::Result<int64_t, ScriptError> read_scriptint_non_minimal(
    std::span<const uint8_t> bytes);

} // namespace script
