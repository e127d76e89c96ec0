#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace script {

// Bitcoin script opcodes. Bytes 0x01-0x4b ("OP_PUSHBYTES_N": push the next
// N bytes) have no enumerators; cast the byte value instead.
enum class Opcode : uint8_t {
    // constants
    OP_0 = 0x00, OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c, OP_PUSHDATA2 = 0x4d, OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f, OP_RESERVED = 0x50,
    OP_1 = 0x51, OP_TRUE = OP_1, OP_2, OP_3, OP_4, OP_5, OP_6, OP_7, OP_8,
    OP_9, OP_10, OP_11, OP_12, OP_13, OP_14, OP_15, OP_16,

    // control
    OP_NOP = 0x61, OP_VER, OP_IF, OP_NOTIF, OP_VERIF, OP_VERNOTIF, OP_ELSE,
    OP_ENDIF, OP_VERIFY, OP_RETURN,

    // stack
    OP_TOALTSTACK = 0x6b, OP_FROMALTSTACK, OP_2DROP, OP_2DUP, OP_3DUP,
    OP_2OVER, OP_2ROT, OP_2SWAP, OP_IFDUP, OP_DEPTH, OP_DROP, OP_DUP, OP_NIP,
    OP_OVER, OP_PICK, OP_ROLL, OP_ROT, OP_SWAP, OP_TUCK,

    // splice
    OP_CAT = 0x7e, OP_SUBSTR, OP_LEFT, OP_RIGHT, OP_SIZE,

    // bitwise
    OP_INVERT = 0x83, OP_AND, OP_OR, OP_XOR, OP_EQUAL, OP_EQUALVERIFY,
    OP_RESERVED1, OP_RESERVED2,

    // arithmetic
    OP_1ADD = 0x8b, OP_1SUB, OP_2MUL, OP_2DIV, OP_NEGATE, OP_ABS, OP_NOT,
    OP_0NOTEQUAL, OP_ADD, OP_SUB, OP_MUL, OP_DIV, OP_MOD, OP_LSHIFT,
    OP_RSHIFT, OP_BOOLAND, OP_BOOLOR, OP_NUMEQUAL, OP_NUMEQUALVERIFY,
    OP_NUMNOTEQUAL, OP_LESSTHAN, OP_GREATERTHAN, OP_LESSTHANOREQUAL,
    OP_GREATERTHANOREQUAL, OP_MIN, OP_MAX, OP_WITHIN,

    // crypto
    OP_RIPEMD160 = 0xa6, OP_SHA1, OP_SHA256, OP_HASH160, OP_HASH256,
    OP_CODESEPARATOR, OP_CHECKSIG, OP_CHECKSIGVERIFY, OP_CHECKMULTISIG,
    OP_CHECKMULTISIGVERIFY,

    // expansion; 0xb1/0xb2 are the BIP65/BIP112 lock-time checks
    OP_NOP1 = 0xb0,
    OP_CHECKLOCKTIMEVERIFY = 0xb1, OP_NOP2 = OP_CHECKLOCKTIMEVERIFY,
    OP_CHECKSEQUENCEVERIFY = 0xb2, OP_NOP3 = OP_CHECKSEQUENCEVERIFY,
    OP_NOP4 = 0xb3, OP_NOP5, OP_NOP6, OP_NOP7, OP_NOP8, OP_NOP9, OP_NOP10,

    // tapscript
    OP_CHECKSIGADD = 0xba,

    OP_INVALIDOPCODE = 0xff,
};

static_assert(static_cast<uint8_t>(Opcode::OP_16) == 0x60);
static_assert(static_cast<uint8_t>(Opcode::OP_RETURN) == 0x6a);
static_assert(static_cast<uint8_t>(Opcode::OP_TUCK) == 0x7d);
static_assert(static_cast<uint8_t>(Opcode::OP_RESERVED2) == 0x8a);
static_assert(static_cast<uint8_t>(Opcode::OP_WITHIN) == 0xa5);
static_assert(static_cast<uint8_t>(Opcode::OP_CHECKMULTISIGVERIFY) == 0xaf);
static_assert(static_cast<uint8_t>(Opcode::OP_NOP10) == 0xb9);

/// Display name of any byte: the named opcode ("OP_DUP"), "OP_PUSHBYTES_N"
/// for 0x01-0x4b, otherwise "OP_RETURN_N" with N in decimal. BIP65/BIP112
/// names are used for 0xb1/0xb2.
std::string_view opcode_name(Opcode op);

/// Inverse of opcode_name(), also accepting the aliases OP_FALSE, OP_TRUE,
/// OP_PUSHBYTES_0, OP_PUSHNUM_NEG1, OP_PUSHNUM_1..16, OP_NOP2, OP_NOP3,
/// OP_CLTV and OP_CSV. Case-sensitive.
std::optional<Opcode> opcode_from_name(std::string_view name);

// ---------------------------------------------------------------------------
// Push classification
// ---------------------------------------------------------------------------

/// Numeric value of OP_PUSHDATA1; every direct push opcode is below it.
inline constexpr uint8_t OP_PUSHDATA1_CODE = 0x4c;

/// True for OP_PUSHBYTES_1..OP_PUSHBYTES_75: "the next N bytes are data".
/// OP_0 is not included; it pushes the empty array without an operand.
constexpr bool is_push_bytes(Opcode op) noexcept {
    auto raw = static_cast<uint8_t>(op);
    return raw >= 0x01 && raw < OP_PUSHDATA1_CODE;
}

/// True for OP_PUSHDATA1/2/4: "read a length header, then the data".
constexpr bool is_push_data(Opcode op) noexcept {
    return op == Opcode::OP_PUSHDATA1 ||
           op == Opcode::OP_PUSHDATA2 ||
           op == Opcode::OP_PUSHDATA4;
}

/// Encode an integer in [1, 16] to the corresponding OP_N opcode.
constexpr Opcode encode_small_int(int n) noexcept {
    return static_cast<Opcode>(static_cast<uint8_t>(Opcode::OP_1) + n - 1);
}

// ---------------------------------------------------------------------------
// OpcodeTable  --  name resolution seam used by the ASM assembler
// ---------------------------------------------------------------------------
class OpcodeTable {
public:
    virtual ~OpcodeTable() = default;

    virtual std::optional<Opcode> lookup(std::string_view name) const = 0;

    virtual bool is_push_bytes(Opcode op) const {
        return script::is_push_bytes(op);
    }
    virtual bool is_push_data(Opcode op) const {
        return script::is_push_data(op);
    }
};

/// Table backed by opcode_from_name().
class StandardOpcodeTable : public OpcodeTable {
public:
    std::optional<Opcode> lookup(std::string_view name) const override {
        return opcode_from_name(name);
    }
};

/// Process-wide immutable StandardOpcodeTable.
const OpcodeTable& standard_opcode_table();

} // namespace script
