#include "script/scriptint.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>

namespace script {

namespace {

// Caller guarantees 1 <= bytes.size() <= 8.
int64_t scriptint_parse(std::span<const uint8_t> bytes) {
    uint64_t acc = 0;
    for (size_t i = 0; i < bytes.size(); ++i) {
        acc |= static_cast<uint64_t>(bytes[i]) << (8 * i);
    }

    // Sign bit is the MSB of the last byte.
    if (bytes.back() & 0x80) {
        const size_t sign_bit = 8 * bytes.size() - 1;
        acc &= (uint64_t{1} << sign_bit) - 1;
        return -static_cast<int64_t>(acc);
    }
    return static_cast<int64_t>(acc);
}

} // anonymous namespace

std::string_view scriptint_error_string(ScriptIntError err) {
    switch (err) {
        case ScriptIntError::NON_MINIMAL_PUSH:
            return "non-minimal datapush";
        case ScriptIntError::NUMERIC_OVERFLOW:
            return "numeric overflow (number on stack larger than 4 bytes)";
    }
    return "unknown scriptint error";
}

size_t write_scriptint(ScriptIntBuffer& out, int64_t n) noexcept {
    size_t len = 0;
    if (n == 0) {
        return len;
    }

    const bool negative = n < 0;
    // Two's-complement negation in unsigned space also covers INT64_MIN.
    uint64_t abs_val = negative ? ~static_cast<uint64_t>(n) + 1
                                : static_cast<uint64_t>(n);

    while (abs_val > 0xFF) {
        out[len++] = static_cast<uint8_t>(abs_val & 0xFF);
        abs_val >>= 8;
    }

    // If the top byte already uses bit 0x80, the sign needs its own byte.
    if (abs_val & 0x80) {
        out[len++] = static_cast<uint8_t>(abs_val);
        out[len++] = negative ? 0x80 : 0x00;
    } else {
        if (negative) {
            abs_val |= 0x80;
        }
        out[len++] = static_cast<uint8_t>(abs_val);
    }
    return len;
}

std::vector<uint8_t> scriptint_vec(int64_t n) {
    ScriptIntBuffer buf{};
    const size_t len = write_scriptint(buf, n);
    return std::vector<uint8_t>(buf.begin(),
                                buf.begin() + static_cast<ptrdiff_t>(len));
}

core::Result<int64_t, ScriptIntError> read_scriptint_size(
        std::span<const uint8_t> bytes, size_t max_size, bool minimal) {
    if (max_size > 8) {
        throw std::invalid_argument(
            "read_scriptint_size: max_size " + std::to_string(max_size) +
            " exceeds 8");
    }

    if (bytes.size() > max_size) {
        LOG_TRACE(core::LogCategory::SCRIPTNUM,
                  "read_scriptint: " + std::to_string(bytes.size()) +
                  "-byte element exceeds limit of " +
                  std::to_string(max_size));
        return ScriptIntError::NUMERIC_OVERFLOW;
    }
    if (bytes.empty()) {
        return int64_t{0};
    }

    if (minimal) {
        // If the most-significant byte, excluding the sign bit, is zero
        // the encoding is not minimal. This also rejects negative zero
        // (0x80). The exception is a sign byte that is required because
        // the previous byte already has its top bit set, e.g. +-255
        // encode as ff00 and ff80.
        if ((bytes.back() & 0x7f) == 0) {
            if (bytes.size() <= 1 || (bytes[bytes.size() - 2] & 0x80) == 0) {
                LOG_TRACE(core::LogCategory::SCRIPTNUM,
                          "read_scriptint: non-minimal encoding");
                return ScriptIntError::NON_MINIMAL_PUSH;
            }
        }
    }

    return scriptint_parse(bytes);
}

core::Result<int64_t, ScriptError> read_scriptint(
        std::span<const uint8_t> bytes, size_t max_size, bool minimal) {
    return read_scriptint_size(bytes, max_size, minimal)
        .map_error([](ScriptIntError err) {
            switch (err) {
                case ScriptIntError::NON_MINIMAL_PUSH:
                    return ScriptError::MINIMALDATA;
                case ScriptIntError::NUMERIC_OVERFLOW:
                    return ScriptError::SCRIPTNUM_OVERFLOW;
            }
            return ScriptError::UNKNOWN;
        });
}

core::Result<int64_t, ScriptError> read_scriptint_non_minimal(
        std::span<const uint8_t> bytes) {
    return read_scriptint(bytes, MAX_SCRIPTNUM_SIZE, false);
}

} // namespace script
