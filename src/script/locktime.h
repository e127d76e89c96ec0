#pragma once

#include <cstdint>
#include <optional>

namespace script {

// BIP68 sequence-lock bit layout.
static constexpr uint32_t SEQUENCE_LOCKTIME_DISABLE_FLAG = (1u << 31);
static constexpr uint32_t SEQUENCE_LOCKTIME_TYPE_FLAG    = (1u << 22);
static constexpr uint32_t SEQUENCE_LOCKTIME_MASK         = 0x0000ffff;

/// Time-based relative locks count in units of 2^9 = 512 seconds.
static constexpr int SEQUENCE_LOCKTIME_GRANULARITY = 9;

// ---------------------------------------------------------------------------
// RelativeLockTime  --  a decoded BIP68 relative lock
// ---------------------------------------------------------------------------
class RelativeLockTime {
public:
    enum class Kind : uint8_t { BLOCKS, TIME };

    static constexpr RelativeLockTime from_height(uint16_t blocks) noexcept {
        return RelativeLockTime(Kind::BLOCKS, blocks);
    }
    static constexpr RelativeLockTime from_512_second_intervals(
            uint16_t intervals) noexcept {
        return RelativeLockTime(Kind::TIME, intervals);
    }

    Kind kind() const noexcept { return kind_; }
    bool is_block_based() const noexcept { return kind_ == Kind::BLOCKS; }
    bool is_time_based() const noexcept { return kind_ == Kind::TIME; }

    /// Block count or 512-second interval count, depending on kind().
    uint16_t value() const noexcept { return value_; }

    /// Lock duration in seconds; only meaningful for time-based locks.
    uint32_t seconds() const noexcept {
        return static_cast<uint32_t>(value_) << SEQUENCE_LOCKTIME_GRANULARITY;
    }

    /// Encode back into the nSequence bit layout.
    uint32_t to_sequence() const noexcept {
        uint32_t seq = value_;
        if (kind_ == Kind::TIME) {
            seq |= SEQUENCE_LOCKTIME_TYPE_FLAG;
        }
        return seq;
    }

    /// True when a lock of this value is satisfied by an input whose own
    /// relative lock is @p other: same kind, and other is at least as long.
    /// This is the comparison OP_CHECKSEQUENCEVERIFY performs.
    bool is_implied_by(const RelativeLockTime& other) const noexcept {
        return kind_ == other.kind_ && value_ <= other.value_;
    }

    bool operator==(const RelativeLockTime&) const = default;

private:
    constexpr RelativeLockTime(Kind kind, uint16_t value) noexcept
        : kind_(kind), value_(value) {}

    Kind     kind_;
    uint16_t value_;
};

/// Interpret a stack number as a relative lock time.
///
/// Returns nothing if @p num is negative, does not fit in 32 bits, or has
/// the disable flag (bit 31) set. Otherwise the low 16 bits are the value
/// and bit 22 selects time-based (set) or block-based (clear).
std::optional<RelativeLockTime> relative_lock_time_from_num(int64_t num);

/// Same as relative_lock_time_from_num() for a raw nSequence field.
std::optional<RelativeLockTime> relative_lock_time_from_sequence(
    uint32_t sequence);

} // namespace script
