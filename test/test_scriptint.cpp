// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for CScriptNum encoding and relative lock-time decoding.

#include "test_framework.h"

#include "core/hex.h"
#include "script/locktime.h"
#include "script/script_error.h"
#include "script/scriptint.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string encode_hex(int64_t n) {
    return core::to_hex(script::scriptint_vec(n));
}

std::vector<uint8_t> bytes(const std::string& hex) {
    auto out = core::from_hex(hex);
    if (!out) {
        throw std::invalid_argument("bad hex in test: " + hex);
    }
    return *out;
}

} // anonymous namespace

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE(ScriptInt, encode_known_values) {
    CHECK_EQ(encode_hex(0), "");
    CHECK_EQ(encode_hex(1), "01");
    CHECK_EQ(encode_hex(-1), "81");
    CHECK_EQ(encode_hex(127), "7f");
    CHECK_EQ(encode_hex(-127), "ff");
    CHECK_EQ(encode_hex(128), "8000");
    CHECK_EQ(encode_hex(-128), "8080");
    CHECK_EQ(encode_hex(255), "ff00");
    CHECK_EQ(encode_hex(-255), "ff80");
    CHECK_EQ(encode_hex(256), "0001");
    CHECK_EQ(encode_hex(32767), "ff7f");
    CHECK_EQ(encode_hex(32768), "008000");
    CHECK_EQ(encode_hex(-32768), "008080");
}

TEST_CASE(ScriptInt, encode_extremes) {
    CHECK_EQ(encode_hex(INT64_MAX), "ffffffffffffff7f");
    CHECK_EQ(encode_hex(INT64_MIN + 1), "ffffffffffffffff");

    script::ScriptIntBuffer buf{};
    CHECK_EQ(script::write_scriptint(buf, INT64_MIN),
             script::MAX_SCRIPTINT_ENCODED_SIZE);
    CHECK_EQ(encode_hex(INT64_MIN), "000000000000008080");
}

TEST_CASE(ScriptInt, write_returns_length) {
    script::ScriptIntBuffer buf{};
    CHECK_EQ(script::write_scriptint(buf, 0), 0u);
    CHECK_EQ(script::write_scriptint(buf, 100), 1u);
    CHECK_EQ(buf[0], 100);
    CHECK_EQ(script::write_scriptint(buf, -0x7fffffffLL), 4u);
    CHECK_EQ(script::write_scriptint(buf, 0x80000000LL), 5u);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE(ScriptInt, decode_known_values) {
    auto dec = [](const std::string& hex) {
        return script::read_scriptint(bytes(hex)).value();
    };
    CHECK_EQ(dec(""), 0);
    CHECK_EQ(dec("01"), 1);
    CHECK_EQ(dec("81"), -1);
    CHECK_EQ(dec("ff00"), 255);
    CHECK_EQ(dec("ff80"), -255);
    CHECK_EQ(dec("8080"), -128);
    CHECK_EQ(dec("ffffff7f"), 0x7fffffffLL);
    CHECK_EQ(dec("ffffffff"), -0x7fffffffLL);
}

TEST_CASE(ScriptInt, round_trip_within_four_bytes) {
    const int64_t values[] = {
        0, 1, -1, 16, -16, 127, -127, 128, -128, 255, -255, 256, -256,
        0x7fff, -0x7fff, 0x8000, -0x8000, 0x7fffff, -0x7fffff,
        0x800000, -0x800000, 0x7fffffff, -0x7fffffff,
    };
    for (int64_t v : values) {
        auto enc = script::scriptint_vec(v);
        auto dec = script::read_scriptint(enc);
        CHECK(dec.ok());
        if (dec.ok()) {
            CHECK_EQ(dec.value(), v);
        }
    }
}

TEST_CASE(ScriptInt, rejects_non_minimal) {
    for (const char* hex : {"00", "80", "0100", "0180", "ff0000", "00000080"}) {
        auto r = script::read_scriptint_size(bytes(hex), 4, true);
        CHECK(!r.ok());
        if (!r.ok()) {
            CHECK(r.error() == script::ScriptIntError::NON_MINIMAL_PUSH);
        }
    }
}

TEST_CASE(ScriptInt, non_minimal_allowed_when_not_required) {
    auto a = script::read_scriptint_non_minimal(bytes("0100"));
    CHECK(a.ok());
    if (a.ok()) CHECK_EQ(a.value(), 1);

    // Negative zero decodes to zero.
    auto b = script::read_scriptint_non_minimal(bytes("80"));
    CHECK(b.ok());
    if (b.ok()) CHECK_EQ(b.value(), 0);

    auto c = script::read_scriptint_non_minimal(bytes("000080"));
    CHECK(c.ok());
    if (c.ok()) CHECK_EQ(c.value(), 0);
}

TEST_CASE(ScriptInt, overflow_and_size_cap) {
    auto five = script::scriptint_vec(0x100000000LL);
    CHECK_EQ(five.size(), 5u);

    auto capped = script::read_scriptint_size(five, 4, true);
    CHECK(!capped.ok());
    if (!capped.ok()) {
        CHECK(capped.error() == script::ScriptIntError::NUMERIC_OVERFLOW);
    }

    auto wider = script::read_scriptint_size(five, 5, true);
    CHECK(wider.ok());
    if (wider.ok()) CHECK_EQ(wider.value(), 0x100000000LL);

    auto eight = script::read_scriptint_size(bytes("ffffffffffffff7f"), 8, true);
    CHECK(eight.ok());
    if (eight.ok()) CHECK_EQ(eight.value(), INT64_MAX);
}

TEST_CASE(ScriptInt, size_cap_above_eight_throws) {
    CHECK_THROWS(script::read_scriptint_size(bytes("01"), 9, true),
                 std::invalid_argument);
    CHECK_NOTHROW(script::read_scriptint_size(bytes("01"), 8, true));
}

TEST_CASE(ScriptInt, error_mapping) {
    auto non_min = script::read_scriptint(bytes("0000"));
    CHECK(!non_min.ok());
    if (!non_min.ok()) {
        CHECK(non_min.error() == script::ScriptError::MINIMALDATA);
        CHECK_EQ(script::script_error_string(non_min.error()), "MINIMALDATA");
    }

    auto overflow = script::read_scriptint(bytes("0102030405"));
    CHECK(!overflow.ok());
    if (!overflow.ok()) {
        CHECK(overflow.error() == script::ScriptError::SCRIPTNUM_OVERFLOW);
    }

    // Overflow is checked before minimality.
    auto both = script::read_scriptint(bytes("0000000000"));
    CHECK(!both.ok());
    if (!both.ok()) {
        CHECK(both.error() == script::ScriptError::SCRIPTNUM_OVERFLOW);
    }
}

TEST_CASE(ScriptInt, error_strings) {
    CHECK_EQ(script::scriptint_error_string(
                 script::ScriptIntError::NON_MINIMAL_PUSH),
             "non-minimal datapush");
    CHECK_EQ(script::scriptint_error_string(
                 script::ScriptIntError::NUMERIC_OVERFLOW),
             "numeric overflow (number on stack larger than 4 bytes)");
}

// ============================================================================
// Relative lock time
// ============================================================================

TEST_CASE(LockTime, block_based) {
    auto lt = script::relative_lock_time_from_num(5);
    CHECK(lt.has_value());
    if (lt) {
        CHECK(lt->is_block_based());
        CHECK(lt->kind() == script::RelativeLockTime::Kind::BLOCKS);
        CHECK_EQ(lt->value(), 5);
        CHECK_EQ(lt->to_sequence(), 5u);
    }
}

TEST_CASE(LockTime, time_based) {
    auto lt = script::relative_lock_time_from_num(0x00400005);
    CHECK(lt.has_value());
    if (lt) {
        CHECK(lt->is_time_based());
        CHECK_EQ(lt->value(), 5);
        CHECK_EQ(lt->seconds(), 5u * 512u);
        CHECK_EQ(lt->to_sequence(), 0x00400005u);
    }
}

TEST_CASE(LockTime, disabled_and_out_of_range) {
    CHECK(!script::relative_lock_time_from_num(0x80000005LL).has_value());
    CHECK(!script::relative_lock_time_from_num(-1).has_value());
    CHECK(!script::relative_lock_time_from_num(0x100000000LL).has_value());
    CHECK(!script::relative_lock_time_from_sequence(0xffffffffu).has_value());
}

TEST_CASE(LockTime, ignores_unused_bits) {
    // Bits 16-21 and 23-30 carry no meaning.
    auto lt = script::relative_lock_time_from_num(0x7fbf0010LL);
    CHECK(lt.has_value());
    if (lt) {
        CHECK(lt->is_block_based());
        CHECK_EQ(lt->value(), 0x10);
    }

    auto max_time = script::relative_lock_time_from_num(0x0040ffffLL);
    CHECK(max_time.has_value());
    if (max_time) {
        CHECK(max_time->is_time_based());
        CHECK_EQ(max_time->value(), 0xffff);
    }
}

TEST_CASE(LockTime, from_stack_element) {
    // 0x00400005 as a stack number: 05 00 40
    auto num = script::read_scriptint(bytes("050040"), 5);
    CHECK(num.ok());
    if (num.ok()) {
        auto lt = script::relative_lock_time_from_num(num.value());
        CHECK(lt.has_value());
        if (lt) CHECK(lt->is_time_based());
    }
}

TEST_CASE(LockTime, implied_by) {
    using script::RelativeLockTime;
    auto ten = RelativeLockTime::from_height(10);
    auto twenty = RelativeLockTime::from_height(20);
    auto time_ten = RelativeLockTime::from_512_second_intervals(10);

    CHECK(ten.is_implied_by(twenty));
    CHECK(ten.is_implied_by(ten));
    CHECK(!twenty.is_implied_by(ten));
    CHECK(!ten.is_implied_by(time_ten));
    CHECK(ten != time_ten);
    CHECK(ten == RelativeLockTime::from_height(10));
}
