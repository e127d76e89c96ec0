#include "script/script_error.h"

namespace script {

std::string_view script_error_string(ScriptError err) {
    switch (err) {
        case ScriptError::OK:                 return "OK";
        case ScriptError::UNKNOWN:            break;
        case ScriptError::SCRIPTNUM_OVERFLOW: return "SCRIPTNUM_OVERFLOW";
        case ScriptError::MINIMALDATA:        return "MINIMALDATA";
    }
    return "UNKNOWN";
}

}  // namespace script
