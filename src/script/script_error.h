#pragma once

#include <string_view>

namespace script {

// Failure codes in the vocabulary of a script execution engine. The number
// codec reports its own ScriptIntError and translates into these at the
// read_scriptint() boundary.
enum class ScriptError {
    OK = 0,
    UNKNOWN,
    SCRIPTNUM_OVERFLOW,  // numeric operand longer than allowed
    MINIMALDATA,         // numeric operand not minimally encoded
};

/// Upper-case name of @p err, e.g. "MINIMALDATA".
std::string_view script_error_string(ScriptError err);

}  // namespace script
