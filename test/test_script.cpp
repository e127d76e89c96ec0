// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for opcodes, the script builder and script hashing.

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/hash.h"
#include "script/opcodes.h"
#include "script/script.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

script::Script script_from_hex(const std::string& hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        throw std::invalid_argument("bad hex in test: " + hex);
    }
    return script::Script(std::move(*bytes));
}

std::string script_hex(const script::Script& s) {
    return core::to_hex(s.data());
}

} // anonymous namespace

// ============================================================================
// Opcodes
// ============================================================================

TEST_CASE(Opcodes, canonical_names) {
    using script::Opcode;
    CHECK_EQ(script::opcode_name(Opcode::OP_0), "OP_0");
    CHECK_EQ(script::opcode_name(Opcode::OP_DUP), "OP_DUP");
    CHECK_EQ(script::opcode_name(Opcode::OP_1), "OP_1");
    CHECK_EQ(script::opcode_name(Opcode::OP_SHA256), "OP_SHA256");
    CHECK_EQ(script::opcode_name(Opcode::OP_CHECKLOCKTIMEVERIFY),
             "OP_CHECKLOCKTIMEVERIFY");
    CHECK_EQ(script::opcode_name(Opcode::OP_INVALIDOPCODE), "OP_INVALIDOPCODE");
}

TEST_CASE(Opcodes, generated_names) {
    CHECK_EQ(script::opcode_name(static_cast<script::Opcode>(0x01)),
             "OP_PUSHBYTES_1");
    CHECK_EQ(script::opcode_name(static_cast<script::Opcode>(0x4b)),
             "OP_PUSHBYTES_75");
    CHECK_EQ(script::opcode_name(static_cast<script::Opcode>(0xbb)),
             "OP_RETURN_187");
    CHECK_EQ(script::opcode_name(static_cast<script::Opcode>(0xfe)),
             "OP_RETURN_254");
    CHECK(script::opcode_from_name("OP_RETURN_187") ==
          static_cast<script::Opcode>(0xbb));
}

TEST_CASE(Opcodes, from_name_and_aliases) {
    using script::Opcode;
    CHECK(script::opcode_from_name("OP_CHECKSIG") == Opcode::OP_CHECKSIG);
    CHECK(script::opcode_from_name("OP_FALSE") == Opcode::OP_0);
    CHECK(script::opcode_from_name("OP_PUSHBYTES_0") == Opcode::OP_0);
    CHECK(script::opcode_from_name("OP_TRUE") == Opcode::OP_1);
    CHECK(script::opcode_from_name("OP_PUSHNUM_1") == Opcode::OP_1);
    CHECK(script::opcode_from_name("OP_PUSHNUM_16") == Opcode::OP_16);
    CHECK(script::opcode_from_name("OP_PUSHNUM_NEG1") == Opcode::OP_1NEGATE);
    CHECK(script::opcode_from_name("OP_NOP2") ==
          Opcode::OP_CHECKLOCKTIMEVERIFY);
    CHECK(script::opcode_from_name("OP_CLTV") ==
          Opcode::OP_CHECKLOCKTIMEVERIFY);
    CHECK(script::opcode_from_name("OP_CSV") ==
          Opcode::OP_CHECKSEQUENCEVERIFY);
    CHECK(script::opcode_from_name("OP_PUSHBYTES_20") ==
          static_cast<Opcode>(0x14));
}

TEST_CASE(Opcodes, from_name_rejects_unknown) {
    CHECK(!script::opcode_from_name("op_dup").has_value());
    CHECK(!script::opcode_from_name("OP_PUSHBYTES_76").has_value());
    CHECK(!script::opcode_from_name("DUP").has_value());
    CHECK(!script::opcode_from_name("").has_value());
}

TEST_CASE(Opcodes, every_name_round_trips) {
    for (int i = 0; i < 256; ++i) {
        auto op = static_cast<script::Opcode>(static_cast<uint8_t>(i));
        auto back = script::opcode_from_name(script::opcode_name(op));
        CHECK(back.has_value());
        if (back) {
            CHECK_EQ(static_cast<int>(*back), i);
        }
    }
}

TEST_CASE(Opcodes, push_classification) {
    using script::Opcode;
    CHECK(!script::is_push_bytes(Opcode::OP_0));
    CHECK(script::is_push_bytes(static_cast<Opcode>(0x01)));
    CHECK(script::is_push_bytes(static_cast<Opcode>(0x4b)));
    CHECK(!script::is_push_bytes(Opcode::OP_PUSHDATA1));

    CHECK(script::is_push_data(Opcode::OP_PUSHDATA1));
    CHECK(script::is_push_data(Opcode::OP_PUSHDATA2));
    CHECK(script::is_push_data(Opcode::OP_PUSHDATA4));
    CHECK(!script::is_push_data(Opcode::OP_1NEGATE));

    CHECK(script::encode_small_int(1) == Opcode::OP_1);
    CHECK(script::encode_small_int(16) == Opcode::OP_16);
}

TEST_CASE(Opcodes, standard_table) {
    const auto& table = script::standard_opcode_table();
    CHECK(table.lookup("OP_HASH160") == script::Opcode::OP_HASH160);
    CHECK(!table.lookup("HASH160").has_value());
    CHECK(table.is_push_data(script::Opcode::OP_PUSHDATA2));
    CHECK(&table == &script::standard_opcode_table());
}

// ============================================================================
// Push encoding
// ============================================================================

TEST_CASE(Script, minimal_push_opcode_boundaries) {
    using script::Opcode;
    CHECK(script::minimal_push_opcode(0) == Opcode::OP_0);
    CHECK(script::minimal_push_opcode(1) == static_cast<Opcode>(0x01));
    CHECK(script::minimal_push_opcode(75) == static_cast<Opcode>(0x4b));
    CHECK(script::minimal_push_opcode(76) == Opcode::OP_PUSHDATA1);
    CHECK(script::minimal_push_opcode(255) == Opcode::OP_PUSHDATA1);
    CHECK(script::minimal_push_opcode(256) == Opcode::OP_PUSHDATA2);
    CHECK(script::minimal_push_opcode(65535) == Opcode::OP_PUSHDATA2);
    CHECK(script::minimal_push_opcode(65536) == Opcode::OP_PUSHDATA4);
    CHECK(script::minimal_push_opcode(0xffffffffULL) == Opcode::OP_PUSHDATA4);
    CHECK(!script::minimal_push_opcode(0x100000000ULL).has_value());
}

TEST_CASE(Script, push_data_prefixes) {
    script::Script empty_push;
    empty_push.push_data(std::vector<uint8_t>{});
    CHECK_EQ(script_hex(empty_push), "00");

    // A single byte is never turned into a small-integer opcode.
    script::Script one;
    one.push_data(std::vector<uint8_t>{0x05});
    CHECK_EQ(script_hex(one), "0105");

    script::Script pd1;
    pd1.push_data(std::vector<uint8_t>(76, 0xab));
    CHECK_EQ(pd1.size(), 78u);
    CHECK_EQ(pd1.data()[0], 0x4c);
    CHECK_EQ(pd1.data()[1], 76);

    script::Script pd2;
    pd2.push_data(std::vector<uint8_t>(256, 0x00));
    CHECK_EQ(pd2.size(), 259u);
    CHECK_EQ(pd2.data()[0], 0x4d);
    CHECK_EQ(pd2.data()[1], 0x00);
    CHECK_EQ(pd2.data()[2], 0x01);

    script::Script pd4;
    pd4.push_data(std::vector<uint8_t>(65536, 0x11));
    CHECK_EQ(pd4.size(), 65541u);
    CHECK_EQ(pd4.data()[0], 0x4e);
    CHECK_EQ(pd4.data()[1], 0x00);
    CHECK_EQ(pd4.data()[2], 0x00);
    CHECK_EQ(pd4.data()[3], 0x01);
    CHECK_EQ(pd4.data()[4], 0x00);
}

TEST_CASE(Script, push_data_limits) {
    script::Script s;
    CHECK_NOTHROW(s.push_data(std::vector<uint8_t>(script::MAX_SCRIPT_ELEMENT_SIZE, 0x01)));
    CHECK_EQ(s.size(), script::MAX_SCRIPT_ELEMENT_SIZE + 3);
}

TEST_CASE(Script, push_int_values) {
    auto encode = [](int64_t n) {
        script::Script s;
        s.push_int(n);
        return script_hex(s);
    };
    CHECK_EQ(encode(-1), "4f");
    CHECK_EQ(encode(0), "00");
    CHECK_EQ(encode(1), "51");
    CHECK_EQ(encode(16), "60");
    CHECK_EQ(encode(17), "0111");
    CHECK_EQ(encode(-2), "0182");
    CHECK_EQ(encode(255), "02ff00");
    CHECK_EQ(encode(1000), "02e803");
    CHECK_EQ(encode(INT64_MIN), "09000000000000008080");
}

TEST_CASE(Script, builder_chains) {
    script::Script s;
    s.push_opcode(script::Opcode::OP_DUP)
     .push_opcode(script::Opcode::OP_HASH160)
     .push_data(std::vector<uint8_t>(20, 0x00))
     .push_opcode(script::Opcode::OP_EQUALVERIFY)
     .push_opcode(script::Opcode::OP_CHECKSIG);
    CHECK_EQ(s.size(), 25u);
    CHECK_EQ(script_hex(s).substr(0, 6), "76a914");
    CHECK_EQ(script_hex(s).substr(46), "88ac");
}

// ============================================================================
// Iteration
// ============================================================================

TEST_CASE(Script, iterate_p2pkh) {
    auto s = script_from_hex(
        "76a91462e907b15cbf27d5425399ebf6f0fb50ebb88f1888ac");
    auto it = s.begin_iter();

    std::vector<script::Script::Element> elems;
    while (auto e = it.next()) {
        elems.push_back(*e);
    }
    CHECK(!it.failed());
    CHECK(!it.has_more());
    CHECK_EQ(elems.size(), 5u);
    if (elems.size() == 5) {
        CHECK(elems[0].opcode == script::Opcode::OP_DUP);
        CHECK(elems[2].opcode == static_cast<script::Opcode>(0x14));
        CHECK_EQ(elems[2].data.size(), 20u);
        CHECK_EQ(core::to_hex(elems[2].data),
                 "62e907b15cbf27d5425399ebf6f0fb50ebb88f18");
        CHECK(elems[4].opcode == script::Opcode::OP_CHECKSIG);
    }
}

TEST_CASE(Script, iterate_pushdata_headers) {
    auto s = script_from_hex("4c02abcd4d0100ee4e01000000ff");
    auto it = s.begin_iter();

    auto e1 = it.next();
    CHECK(e1.has_value());
    if (e1) CHECK_EQ(core::to_hex(e1->data), "abcd");
    auto e2 = it.next();
    CHECK(e2.has_value());
    if (e2) CHECK_EQ(core::to_hex(e2->data), "ee");
    auto e3 = it.next();
    CHECK(e3.has_value());
    if (e3) CHECK_EQ(core::to_hex(e3->data), "ff");
    CHECK(!it.next().has_value());
    CHECK(!it.failed());
}

TEST_CASE(Script, iterate_truncated) {
    // Push runs past the end.
    auto a = script_from_hex("4c050102");
    auto it_a = a.begin_iter();
    CHECK(!it_a.next().has_value());
    CHECK(it_a.failed());

    // Length header itself is cut short.
    auto b = script_from_hex("514d01");
    auto it_b = b.begin_iter();
    CHECK(it_b.next().has_value());
    CHECK(!it_b.next().has_value());
    CHECK(it_b.failed());
}

// ============================================================================
// Hashing
// ============================================================================

TEST_CASE(Hashing, empty_input_vectors) {
    std::vector<uint8_t> empty;
    CHECK_EQ(core::to_hex(crypto::sha256(empty)),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK_EQ(core::to_hex(crypto::ripemd160(empty)),
             "9c1185a5c5e9fc54612808977ee8f548b2258d31");
    CHECK_EQ(core::to_hex(crypto::hash160(empty)),
             "b472a266d0bd89c13706a4132ccfb16f7c3b9fcb");
    CHECK_EQ(core::to_hex(crypto::hash256(empty)),
             "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

TEST_CASE(Hashing, sha256_abc) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    CHECK_EQ(core::to_hex(crypto::sha256(abc)),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE(Hashing, output_templates) {
    script::Script empty;
    CHECK_EQ(script_hex(script::Script::p2sh(empty)),
             "a914b472a266d0bd89c13706a4132ccfb16f7c3b9fcb87");
    CHECK_EQ(script_hex(script::Script::p2wsh(empty)),
             "0020e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
