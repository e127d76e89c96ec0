// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <string>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:             return "NONE";
        case ErrorCode::PARSE_ERROR:      return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:   return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_BAD_HEX:    return "PARSE_BAD_HEX";
        case ErrorCode::PARSE_BAD_ASM:    return "PARSE_BAD_ASM";
        case ErrorCode::SCRIPT_ERROR:     return "SCRIPT_ERROR";
        case ErrorCode::SCRIPT_TRUNCATED: return "SCRIPT_TRUNCATED";
        case ErrorCode::CONFIG_ERROR:     return "CONFIG_ERROR";
        case ErrorCode::CONFIG_MISSING:   return "CONFIG_MISSING";
        case ErrorCode::IO_ERROR:         return "IO_ERROR";
        case ErrorCode::INTERNAL_ERROR:   return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

std::string Error::format() const {
    if (is_ok()) {
        return "no error";
    }

    std::string out{error_code_name(code_)};
    out += '(';
    out += std::to_string(static_cast<unsigned>(code_));
    out += ')';
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }

    // Base name of the raising file only.
    std::string_view file = where_.file_name();
    if (!file.empty()) {
        if (auto slash = file.find_last_of("/\\");
            slash != std::string_view::npos) {
            file.remove_prefix(slash + 1);
        }
        out += " [";
        out += file;
        out += ':';
        out += std::to_string(where_.line());
        out += ']';
    }
    return out;
}

} // namespace core
