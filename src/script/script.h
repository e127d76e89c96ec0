#pragma once

#include "script/opcodes.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace script {

/// Largest element a script may push.
static constexpr size_t MAX_SCRIPT_ELEMENT_SIZE = 520;

/// Raw script bytecode with an append-only builder and a decoding cursor.
class Script {
public:
    /// One decoded instruction. @c data is empty except for pushes.
    struct Element {
        Opcode opcode;
        std::span<const uint8_t> data;
    };

    /// Cursor over the instructions of a script. Does not own the bytes.
    class Iterator {
    public:
        Iterator(const uint8_t* begin, const uint8_t* end);

        /// The next instruction, or nullopt once the bytes are used up.
        /// A push whose header or payload is cut short also yields nullopt
        /// and sets failed().
        std::optional<Element> next();

        bool has_more() const { return pos_ < end_; }
        bool failed() const { return failed_; }

    private:
        const uint8_t* pos_;
        const uint8_t* end_;
        bool failed_ = false;
    };

    Script() = default;
    explicit Script(std::vector<uint8_t> bytes) : data_(std::move(bytes)) {}
    explicit Script(std::span<const uint8_t> bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// OP_HASH160 <hash160(redeem)> OP_EQUAL
    static Script p2sh(const Script& redeem);

    /// OP_0 <sha256(witness)>
    static Script p2wsh(const Script& witness);

    const std::vector<uint8_t>& data() const { return data_; }
    const uint8_t* bytes() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    bool operator==(const Script& other) const = default;

    Script& push_opcode(Opcode op);

    /// Length-prefixed push with the narrowest header that fits. The
    /// payload is copied as-is, even when it encodes a small integer.
    /// Throws std::length_error past the OP_PUSHDATA4 limit.
    Script& push_data(std::span<const uint8_t> payload);

    /// OP_1NEGATE, OP_0 and OP_1..OP_16 where they apply, otherwise the
    /// minimal scriptint encoding pushed with push_data().
    Script& push_int(int64_t n);

    Iterator begin_iter() const;

    std::array<uint8_t, 20> script_hash() const;          // hash160
    std::array<uint8_t, 32> witness_script_hash() const;  // sha256

private:
    std::vector<uint8_t> data_;
};

/// Opcode that starts a minimal push of @p len bytes, or nullopt when
/// @p len needs more than a 4-byte length header.
std::optional<Opcode> minimal_push_opcode(uint64_t len);

} // namespace script
