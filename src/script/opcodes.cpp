#include "script/opcodes.h"

#include <array>
#include <cstdio>
#include <string>
#include <unordered_map>

namespace script {

namespace detail {

struct NamedOpcode {
    Opcode op;
    const char* name;
};

// Canonical names, one entry per named byte value. Aliases that share a
// byte (OP_FALSE, OP_TRUE, OP_NOP2, OP_NOP3) are registered separately in
// NameMap so that opcode_name() stays single-valued.
constexpr NamedOpcode NAMED_OPCODES[] = {
    {Opcode::OP_0, "OP_0"},
    {Opcode::OP_PUSHDATA1, "OP_PUSHDATA1"},
    {Opcode::OP_PUSHDATA2, "OP_PUSHDATA2"},
    {Opcode::OP_PUSHDATA4, "OP_PUSHDATA4"},
    {Opcode::OP_1NEGATE, "OP_1NEGATE"},
    {Opcode::OP_RESERVED, "OP_RESERVED"},
    {Opcode::OP_1, "OP_1"},   {Opcode::OP_2, "OP_2"},
    {Opcode::OP_3, "OP_3"},   {Opcode::OP_4, "OP_4"},
    {Opcode::OP_5, "OP_5"},   {Opcode::OP_6, "OP_6"},
    {Opcode::OP_7, "OP_7"},   {Opcode::OP_8, "OP_8"},
    {Opcode::OP_9, "OP_9"},   {Opcode::OP_10, "OP_10"},
    {Opcode::OP_11, "OP_11"}, {Opcode::OP_12, "OP_12"},
    {Opcode::OP_13, "OP_13"}, {Opcode::OP_14, "OP_14"},
    {Opcode::OP_15, "OP_15"}, {Opcode::OP_16, "OP_16"},

    // Flow control
    {Opcode::OP_NOP, "OP_NOP"},
    {Opcode::OP_VER, "OP_VER"},
    {Opcode::OP_IF, "OP_IF"},
    {Opcode::OP_NOTIF, "OP_NOTIF"},
    {Opcode::OP_VERIF, "OP_VERIF"},
    {Opcode::OP_VERNOTIF, "OP_VERNOTIF"},
    {Opcode::OP_ELSE, "OP_ELSE"},
    {Opcode::OP_ENDIF, "OP_ENDIF"},
    {Opcode::OP_VERIFY, "OP_VERIFY"},
    {Opcode::OP_RETURN, "OP_RETURN"},

    // Stack
    {Opcode::OP_TOALTSTACK, "OP_TOALTSTACK"},
    {Opcode::OP_FROMALTSTACK, "OP_FROMALTSTACK"},
    {Opcode::OP_2DROP, "OP_2DROP"},
    {Opcode::OP_2DUP, "OP_2DUP"},
    {Opcode::OP_3DUP, "OP_3DUP"},
    {Opcode::OP_2OVER, "OP_2OVER"},
    {Opcode::OP_2ROT, "OP_2ROT"},
    {Opcode::OP_2SWAP, "OP_2SWAP"},
    {Opcode::OP_IFDUP, "OP_IFDUP"},
    {Opcode::OP_DEPTH, "OP_DEPTH"},
    {Opcode::OP_DROP, "OP_DROP"},
    {Opcode::OP_DUP, "OP_DUP"},
    {Opcode::OP_NIP, "OP_NIP"},
    {Opcode::OP_OVER, "OP_OVER"},
    {Opcode::OP_PICK, "OP_PICK"},
    {Opcode::OP_ROLL, "OP_ROLL"},
    {Opcode::OP_ROT, "OP_ROT"},
    {Opcode::OP_SWAP, "OP_SWAP"},
    {Opcode::OP_TUCK, "OP_TUCK"},

    // Splice
    {Opcode::OP_CAT, "OP_CAT"},
    {Opcode::OP_SUBSTR, "OP_SUBSTR"},
    {Opcode::OP_LEFT, "OP_LEFT"},
    {Opcode::OP_RIGHT, "OP_RIGHT"},
    {Opcode::OP_SIZE, "OP_SIZE"},

    // Bitwise logic
    {Opcode::OP_INVERT, "OP_INVERT"},
    {Opcode::OP_AND, "OP_AND"},
    {Opcode::OP_OR, "OP_OR"},
    {Opcode::OP_XOR, "OP_XOR"},
    {Opcode::OP_EQUAL, "OP_EQUAL"},
    {Opcode::OP_EQUALVERIFY, "OP_EQUALVERIFY"},
    {Opcode::OP_RESERVED1, "OP_RESERVED1"},
    {Opcode::OP_RESERVED2, "OP_RESERVED2"},

    // Arithmetic
    {Opcode::OP_1ADD, "OP_1ADD"},
    {Opcode::OP_1SUB, "OP_1SUB"},
    {Opcode::OP_2MUL, "OP_2MUL"},
    {Opcode::OP_2DIV, "OP_2DIV"},
    {Opcode::OP_NEGATE, "OP_NEGATE"},
    {Opcode::OP_ABS, "OP_ABS"},
    {Opcode::OP_NOT, "OP_NOT"},
    {Opcode::OP_0NOTEQUAL, "OP_0NOTEQUAL"},
    {Opcode::OP_ADD, "OP_ADD"},
    {Opcode::OP_SUB, "OP_SUB"},
    {Opcode::OP_MUL, "OP_MUL"},
    {Opcode::OP_DIV, "OP_DIV"},
    {Opcode::OP_MOD, "OP_MOD"},
    {Opcode::OP_LSHIFT, "OP_LSHIFT"},
    {Opcode::OP_RSHIFT, "OP_RSHIFT"},
    {Opcode::OP_BOOLAND, "OP_BOOLAND"},
    {Opcode::OP_BOOLOR, "OP_BOOLOR"},
    {Opcode::OP_NUMEQUAL, "OP_NUMEQUAL"},
    {Opcode::OP_NUMEQUALVERIFY, "OP_NUMEQUALVERIFY"},
    {Opcode::OP_NUMNOTEQUAL, "OP_NUMNOTEQUAL"},
    {Opcode::OP_LESSTHAN, "OP_LESSTHAN"},
    {Opcode::OP_GREATERTHAN, "OP_GREATERTHAN"},
    {Opcode::OP_LESSTHANOREQUAL, "OP_LESSTHANOREQUAL"},
    {Opcode::OP_GREATERTHANOREQUAL, "OP_GREATERTHANOREQUAL"},
    {Opcode::OP_MIN, "OP_MIN"},
    {Opcode::OP_MAX, "OP_MAX"},
    {Opcode::OP_WITHIN, "OP_WITHIN"},

    // Crypto
    {Opcode::OP_RIPEMD160, "OP_RIPEMD160"},
    {Opcode::OP_SHA1, "OP_SHA1"},
    {Opcode::OP_SHA256, "OP_SHA256"},
    {Opcode::OP_HASH160, "OP_HASH160"},
    {Opcode::OP_HASH256, "OP_HASH256"},
    {Opcode::OP_CODESEPARATOR, "OP_CODESEPARATOR"},
    {Opcode::OP_CHECKSIG, "OP_CHECKSIG"},
    {Opcode::OP_CHECKSIGVERIFY, "OP_CHECKSIGVERIFY"},
    {Opcode::OP_CHECKMULTISIG, "OP_CHECKMULTISIG"},
    {Opcode::OP_CHECKMULTISIGVERIFY, "OP_CHECKMULTISIGVERIFY"},

    // Expansion / locktime (BIP65/BIP112 names win over OP_NOP2/OP_NOP3)
    {Opcode::OP_NOP1, "OP_NOP1"},
    {Opcode::OP_CHECKLOCKTIMEVERIFY, "OP_CHECKLOCKTIMEVERIFY"},
    {Opcode::OP_CHECKSEQUENCEVERIFY, "OP_CHECKSEQUENCEVERIFY"},
    {Opcode::OP_NOP4, "OP_NOP4"},
    {Opcode::OP_NOP5, "OP_NOP5"},
    {Opcode::OP_NOP6, "OP_NOP6"},
    {Opcode::OP_NOP7, "OP_NOP7"},
    {Opcode::OP_NOP8, "OP_NOP8"},
    {Opcode::OP_NOP9, "OP_NOP9"},
    {Opcode::OP_NOP10, "OP_NOP10"},

    {Opcode::OP_CHECKSIGADD, "OP_CHECKSIGADD"},
    {Opcode::OP_INVALIDOPCODE, "OP_INVALIDOPCODE"},
};

// Byte-indexed name table. Slots without a named opcode get a generated
// "OP_PUSHBYTES_N" (0x01-0x4b) or "OP_RETURN_N" (0xbb-0xfe) spelling,
// stored here so opcode_name() can hand out views without allocating.
struct NameTable {
    std::array<std::array<char, 24>, 256> buf{};
    std::array<std::string_view, 256> views{};

    NameTable() {
        for (int i = 0; i < 256; ++i) {
            auto idx = static_cast<size_t>(i);
            const char* fmt = (i >= 0x01 && i < OP_PUSHDATA1_CODE)
                ? "OP_PUSHBYTES_%d"
                : "OP_RETURN_%d";
            auto n = std::snprintf(buf[idx].data(), buf[idx].size(), fmt, i);
            views[idx] = std::string_view(buf[idx].data(),
                                          static_cast<size_t>(n));
        }
        for (const auto& entry : NAMED_OPCODES) {
            views[static_cast<uint8_t>(entry.op)] = entry.name;
        }
    }
};

static const NameTable& name_table() {
    static const NameTable instance;
    return instance;
}

struct NameMap {
    std::unordered_map<std::string_view, Opcode> map;
    std::array<std::string, 17> pushnum_names;

    NameMap() {
        const auto& names = name_table();
        for (int i = 0; i < 256; ++i) {
            map.try_emplace(names.views[static_cast<size_t>(i)],
                            static_cast<Opcode>(static_cast<uint8_t>(i)));
        }

        map.try_emplace("OP_FALSE",        Opcode::OP_FALSE);
        map.try_emplace("OP_PUSHBYTES_0",  Opcode::OP_0);
        map.try_emplace("OP_TRUE",         Opcode::OP_TRUE);
        map.try_emplace("OP_PUSHNUM_NEG1", Opcode::OP_1NEGATE);
        map.try_emplace("OP_NOP2",         Opcode::OP_NOP2);
        map.try_emplace("OP_CLTV",         Opcode::OP_CHECKLOCKTIMEVERIFY);
        map.try_emplace("OP_NOP3",         Opcode::OP_NOP3);
        map.try_emplace("OP_CSV",          Opcode::OP_CHECKSEQUENCEVERIFY);

        // Keys are views, so the generated spellings live in this object.
        for (int n = 1; n <= 16; ++n) {
            auto idx = static_cast<size_t>(n);
            pushnum_names[idx] = "OP_PUSHNUM_" + std::to_string(n);
            map.try_emplace(pushnum_names[idx], encode_small_int(n));
        }
    }
};

static const NameMap& name_map() {
    static const NameMap instance;
    return instance;
}

} // namespace detail

std::string_view opcode_name(Opcode op) {
    return detail::name_table().views[static_cast<uint8_t>(op)];
}

std::optional<Opcode> opcode_from_name(std::string_view name) {
    const auto& m = detail::name_map().map;
    auto it = m.find(name);
    if (it != m.end()) {
        return it->second;
    }
    return std::nullopt;
}

const OpcodeTable& standard_opcode_table() {
    static const StandardOpcodeTable table;
    return table;
}

} // namespace script
