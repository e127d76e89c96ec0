#include "core/hex.h"

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Value of one hex digit, or -1.
constexpr int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string to_hex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2, '\0');
    size_t pos = 0;
    for (uint8_t b : data) {
        out[pos++] = HEX_DIGITS[b >> 4];
        out[pos++] = HEX_DIGITS[b & 0x0f];
    }
    return out;
}

bool decode_hex_into(std::string_view hex, std::vector<uint8_t>& out) {
    out.clear();
    if (hex.size() & 1) {
        return false;
    }
    out.reserve(hex.size() / 2);

    for (size_t pos = 0; pos < hex.size(); pos += 2) {
        const int hi = nibble(hex[pos]);
        const int lo = nibble(hex[pos + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    std::vector<uint8_t> bytes;
    if (!decode_hex_into(hex, bytes)) {
        return std::nullopt;
    }
    return bytes;
}

bool is_hex(std::string_view str) {
    if (str.size() & 1) {
        return false;
    }
    for (char c : str) {
        if (nibble(c) < 0) return false;
    }
    return true;
}

}  // namespace core
