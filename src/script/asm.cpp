#include "script/asm.h"

#include "core/hex.h"
#include "core/logging.h"

#include <charconv>
#include <system_error>
#include <vector>

namespace script {

// ===================================================================
// Errors
// ===================================================================

std::string_view asm_parse_error_string(AsmParseErrorKind kind) {
    switch (kind) {
        case AsmParseErrorKind::UNEXPECTED_EOF:
            return "unexpected end of script";
        case AsmParseErrorKind::UNKNOWN_INSTRUCTION:
            return "unknown instruction";
        case AsmParseErrorKind::INVALID_HEX:
            return "invalid hex";
        case AsmParseErrorKind::PUSH_EXCEEDS_MAX_SIZE:
            return "push exceeds maximum size";
        case AsmParseErrorKind::NON_MINIMAL_BYTE_PUSH:
            return "non-minimal byte push";
    }
    return "unknown asm error";
}

std::string ParseAsmError::to_string() const {
    std::string out{asm_parse_error_string(kind)};
    out += " at line ";
    out += std::to_string(position.line + 1);
    out += ", word ";
    out += std::to_string(position.word + 1);
    return out;
}

// ===================================================================
// Word transforms
// ===================================================================

std::string_view strip_angle_brackets(std::string_view word) {
    if (word.size() >= 2 && word.front() == '<' && word.back() == '>') {
        return word.substr(1, word.size() - 2);
    }
    return word;
}

std::string_view strip_hex_prefix(std::string_view word) {
    if (word.starts_with("0x")) {
        word.remove_prefix(2);
    }
    return word;
}

std::optional<int64_t> parse_asm_int(std::string_view word) {
    // from_chars takes '-' but not '+'; an explicit plus sign is allowed
    // only in front of a digit.
    if (word.starts_with('+')) {
        word.remove_prefix(1);
        if (word.starts_with('-')) {
            return std::nullopt;
        }
    }
    if (word.empty()) {
        return std::nullopt;
    }

    int64_t value = 0;
    const char* first = word.data();
    const char* last = word.data() + word.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

// ===================================================================
// Assembler
// ===================================================================

core::Result<Script, ParseAsmError> parse_asm(std::string_view asm_text,
                                              const OpcodeTable& table) {
    auto fail = [](AsmPosition pos, AsmParseErrorKind kind,
                   std::string_view word) {
        ParseAsmError err{pos, kind};
        LOG_DEBUG(core::LogCategory::ASM,
                  "parse_asm: " + err.to_string() + " ('" +
                  std::string(word) + "')");
        return err;
    };

    // Hex scratch space, reused for every push in this run.
    std::vector<uint8_t> buf;
    buf.reserve(65);

    Script script;
    AsmWordIterator words(asm_text);
    while (auto current = words.next()) {
        const AsmPosition pos = current->position;
        std::string_view word = current->text;

        // The general table does not map this spelling uniquely.
        if (word == "OP_0") {
            script.push_opcode(Opcode::OP_0);
            continue;
        }

        if (auto op = table.lookup(word)) {
            if (!table.is_push_bytes(*op) && !table.is_push_data(*op)) {
                script.push_opcode(*op);
                continue;
            }

            auto operand = words.next();
            if (!operand) {
                return fail(pos, AsmParseErrorKind::UNEXPECTED_EOF, word);
            }
            if (!core::decode_hex_into(operand->text, buf)) {
                return fail(operand->position, AsmParseErrorKind::INVALID_HEX,
                            operand->text);
            }

            // Push opcodes are only accepted in their minimal form; the
            // builder cannot emit a longer length prefix.
            auto expected = minimal_push_opcode(buf.size());
            if (!expected) {
                return fail(operand->position,
                            AsmParseErrorKind::PUSH_EXCEEDS_MAX_SIZE,
                            operand->text);
            }
            if (*op != *expected) {
                return fail(pos, AsmParseErrorKind::NON_MINIMAL_BYTE_PUSH,
                            word);
            }
            script.push_data(buf);
            continue;
        }

        // Not an opcode: a number or hex bytes.
        word = strip_angle_brackets(word);

        if (auto n = parse_asm_int(word)) {
            script.push_int(*n);
            continue;
        }

        word = strip_hex_prefix(word);
        if (core::decode_hex_into(word, buf)) {
            if (!minimal_push_opcode(buf.size())) {
                return fail(pos, AsmParseErrorKind::PUSH_EXCEEDS_MAX_SIZE,
                            current->text);
            }
            script.push_data(buf);
            continue;
        }

        return fail(pos, AsmParseErrorKind::UNKNOWN_INSTRUCTION,
                    current->text);
    }

    LOG_TRACE(core::LogCategory::ASM,
              "parse_asm: assembled " + std::to_string(script.size()) +
              " bytes");
    return script;
}

// ===================================================================
// Disassembler
// ===================================================================

std::optional<std::string> to_asm(const Script& script) {
    std::string out;
    auto it = script.begin_iter();
    while (auto elem = it.next()) {
        if (!out.empty()) {
            out += ' ';
        }
        // Byte 0x00 renders as OP_0, which parse_asm() special-cases.
        out += opcode_name(elem->opcode);
        if (is_push_bytes(elem->opcode) || is_push_data(elem->opcode)) {
            out += ' ';
            out += core::to_hex(elem->data);
        }
    }

    if (it.failed()) {
        LOG_DEBUG(core::LogCategory::SCRIPT,
                  "to_asm: push runs past end of " +
                  std::to_string(script.size()) + "-byte script");
        return std::nullopt;
    }
    return out;
}

} // namespace script
