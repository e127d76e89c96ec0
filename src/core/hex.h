#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Lowercase hex of a byte span, two digits per byte.
std::string to_hex(std::span<const uint8_t> data);

// Decode into a caller-owned buffer, which is cleared first and keeps its
// capacity between calls. Digits may be in either case; no "0x" prefix or
// whitespace is accepted. Returns false on odd length or a non-hex digit,
// leaving the buffer contents unspecified.
bool decode_hex_into(std::string_view hex, std::vector<uint8_t>& out);

// Allocating form of decode_hex_into().
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// True if decode_hex_into() would accept @p str.
bool is_hex(std::string_view str);

}  // namespace core
