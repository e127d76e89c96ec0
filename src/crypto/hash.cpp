// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hash.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

/// Run a one-shot EVP digest of @p md and write exactly @p out_len bytes.
void raw_digest(const EVP_MD* md, const char* name,
                const void* data, size_t len,
                uint8_t* out, unsigned int out_len) {
    if (!md) {
        throw std::runtime_error(
            std::string(name) + ": digest not available in OpenSSL");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error(
            std::string(name) + ": EVP_MD_CTX_new() allocation failed");
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(
            std::string(name) + ": EVP_DigestInit_ex() failed");
    }

    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(
            std::string(name) + ": EVP_DigestUpdate() failed");
    }

    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &digest_len) != 1 ||
        digest_len != out_len) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(
            std::string(name) + ": EVP_DigestFinal_ex() failed");
    }

    EVP_MD_CTX_free(ctx);
}

}  // namespace

Hash256 sha256(std::span<const uint8_t> data) {
    Hash256 out{};
    raw_digest(EVP_sha256(), "sha256", data.data(), data.size(),
               out.data(), 32);
    return out;
}

Hash160 ripemd160(std::span<const uint8_t> data) {
    Hash160 out{};
    raw_digest(EVP_ripemd160(), "ripemd160", data.data(), data.size(),
               out.data(), 20);
    return out;
}

Hash160 hash160(std::span<const uint8_t> data) {
    auto first = sha256(data);
    return ripemd160(first);
}

Hash256 hash256(std::span<const uint8_t> data) {
    auto first = sha256(data);
    return sha256(first);
}

}  // namespace crypto
