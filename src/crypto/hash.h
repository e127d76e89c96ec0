#pragma once
// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Script hashing primitives over the OpenSSL 3.0+ EVP API.
//
// Digests are returned in raw byte order (no endian reversal), which is the
// order in which they are embedded into output scripts.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

using Hash256 = std::array<uint8_t, 32>;
using Hash160 = std::array<uint8_t, 20>;

/// SHA-256 of a byte span.
[[nodiscard]] Hash256 sha256(std::span<const uint8_t> data);

/// RIPEMD-160 of a byte span.
[[nodiscard]] Hash160 ripemd160(std::span<const uint8_t> data);

/// RIPEMD160(SHA256(data)); the P2SH script hash.
[[nodiscard]] Hash160 hash160(std::span<const uint8_t> data);

/// SHA256(SHA256(data)).
[[nodiscard]] Hash256 hash256(std::span<const uint8_t> data);

}  // namespace crypto
