#pragma once

#include "core/error.h"
#include "script/asm_tokenizer.h"
#include "script/opcodes.h"
#include "script/script.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace script {

// ---------------------------------------------------------------------------
// ASM parse errors
// ---------------------------------------------------------------------------
enum class AsmParseErrorKind {
    /// The text ended where a push operand was expected.
    UNEXPECTED_EOF,
    /// The word is not an opcode, a number, or hex bytes.
    UNKNOWN_INSTRUCTION,
    /// The operand of a push opcode is not valid hex.
    INVALID_HEX,
    /// The payload is too large for any push encoding.
    PUSH_EXCEEDS_MAX_SIZE,
    /// A push opcode was named whose length prefix is not the minimal one
    /// for its operand. Such pushes cannot be built, so they are rejected.
    NON_MINIMAL_BYTE_PUSH,
};

std::string_view asm_parse_error_string(AsmParseErrorKind kind);

struct ParseAsmError {
    AsmPosition position;
    AsmParseErrorKind kind;

    /// "<phrase> at line L, word W" with one-based line and word numbers.
    std::string to_string() const;

    bool operator==(const ParseAsmError&) const = default;
};

// ---------------------------------------------------------------------------
// Word transforms used by the assembler
// ---------------------------------------------------------------------------

/// Remove one leading '<' and one trailing '>' if the word has both.
std::string_view strip_angle_brackets(std::string_view word);

/// Remove a leading "0x" if present.
std::string_view strip_hex_prefix(std::string_view word);

/// Parse a signed 64-bit decimal integer with an optional sign. The whole
/// word must be consumed; out-of-range values are rejected.
std::optional<int64_t> parse_asm_int(std::string_view word);

// ---------------------------------------------------------------------------
// Assembler / disassembler
// ---------------------------------------------------------------------------

/// Assemble ASM text into a script.
///
/// Each word is, in order of preference: the literal OP_0; an opcode known
/// to @p table (push opcodes take the following word as raw hex and must
/// be the minimal opcode for its length); a decimal integer, optionally in
/// angle brackets; or hex bytes, optionally in angle brackets and/or with a
/// 0x prefix. Either the whole text assembles or an error is returned.
core::Result<Script, ParseAsmError> parse_asm(
    std::string_view asm_text,
    const OpcodeTable& table = standard_opcode_table());

/// Render a script as ASM that parse_asm() reads back to the same bytes
/// for every script it can produce. Returns nullopt if a push runs past
/// the end of the script.
std::optional<std::string> to_asm(const Script& script);

} // namespace script
