#include "script/script.h"
#include "script/scriptint.h"
#include "crypto/hash.h"

#include <stdexcept>
#include <string>

namespace script {

// ===================================================================
// Push encoding
// ===================================================================

std::optional<Opcode> minimal_push_opcode(uint64_t len) {
    if (len < OP_PUSHDATA1_CODE) {
        return static_cast<Opcode>(static_cast<uint8_t>(len));
    }
    if (len < 0x100) {
        return Opcode::OP_PUSHDATA1;
    }
    if (len < 0x10000) {
        return Opcode::OP_PUSHDATA2;
    }
    if (len < 0x100000000ULL) {
        return Opcode::OP_PUSHDATA4;
    }
    return std::nullopt;
}

// ===================================================================
// Output templates
// ===================================================================

Script Script::p2sh(const Script& redeem_script) {
    auto hash = redeem_script.script_hash();
    Script out;
    out.push_opcode(Opcode::OP_HASH160)
       .push_data(hash)
       .push_opcode(Opcode::OP_EQUAL);
    return out;
}

Script Script::p2wsh(const Script& witness_script) {
    auto hash = witness_script.witness_script_hash();
    Script out;
    out.push_opcode(Opcode::OP_0).push_data(hash);
    return out;
}

// ===================================================================
// Builder
// ===================================================================

Script& Script::push_opcode(Opcode op) {
    data_.push_back(static_cast<uint8_t>(op));
    return *this;
}

Script& Script::push_data(std::span<const uint8_t> payload) {
    const auto len = static_cast<uint64_t>(payload.size());
    auto op = minimal_push_opcode(len);
    if (!op) {
        throw std::length_error(
            "Script::push_data: payload of " + std::to_string(len) +
            " bytes exceeds OP_PUSHDATA4");
    }

    data_.push_back(static_cast<uint8_t>(*op));
    switch (*op) {
    case Opcode::OP_PUSHDATA1:
        data_.push_back(static_cast<uint8_t>(len));
        break;
    case Opcode::OP_PUSHDATA2:
        data_.push_back(static_cast<uint8_t>(len & 0xFF));
        data_.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        break;
    case Opcode::OP_PUSHDATA4:
        data_.push_back(static_cast<uint8_t>(len & 0xFF));
        data_.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        data_.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
        data_.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
        break;
    default:
        // OP_PUSHBYTES_N: the length byte IS the opcode.
        break;
    }
    data_.insert(data_.end(), payload.begin(), payload.end());
    return *this;
}

Script& Script::push_int(int64_t n) {
    if (n == -1) {
        return push_opcode(Opcode::OP_1NEGATE);
    }
    if (n == 0) {
        return push_opcode(Opcode::OP_0);
    }
    if (n >= 1 && n <= 16) {
        return push_opcode(encode_small_int(static_cast<int>(n)));
    }

    ScriptIntBuffer buf{};
    const size_t len = write_scriptint(buf, n);
    return push_data(std::span<const uint8_t>(buf.data(), len));
}

// ===================================================================
// Iterator
// ===================================================================

Script::Iterator::Iterator(const uint8_t* begin, const uint8_t* end)
    : pos_(begin), end_(end) {}

std::optional<Script::Element> Script::Iterator::next() {
    if (pos_ >= end_) {
        return std::nullopt;
    }

    auto raw = *pos_++;
    auto op = static_cast<Opcode>(raw);

    // Width of the little-endian length header that follows the opcode.
    size_t header = 0;
    size_t count = 0;
    if (is_push_bytes(op)) {
        count = raw;
    } else if (op == Opcode::OP_PUSHDATA1) {
        header = 1;
    } else if (op == Opcode::OP_PUSHDATA2) {
        header = 2;
    } else if (op == Opcode::OP_PUSHDATA4) {
        header = 4;
    } else {
        return Element{op, {}};
    }

    if (static_cast<size_t>(end_ - pos_) < header) {
        pos_ = end_;
        failed_ = true;
        return std::nullopt;
    }
    for (size_t i = 0; i < header; ++i) {
        count |= static_cast<size_t>(pos_[i]) << (8 * i);
    }
    pos_ += header;

    if (static_cast<size_t>(end_ - pos_) < count) {
        pos_ = end_;
        failed_ = true;
        return std::nullopt;
    }
    Element elem{op, std::span<const uint8_t>(pos_, count)};
    pos_ += count;
    return elem;
}

Script::Iterator Script::begin_iter() const {
    return Iterator(data_.data(), data_.data() + data_.size());
}

// ===================================================================
// Hashing
// ===================================================================

std::array<uint8_t, 20> Script::script_hash() const {
    return crypto::hash160(data_);
}

std::array<uint8_t, 32> Script::witness_script_hash() const {
    return crypto::sha256(data_);
}

} // namespace script
