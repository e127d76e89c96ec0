#include "script/locktime.h"

#include "core/logging.h"

#include <string>

namespace script {

std::optional<RelativeLockTime> relative_lock_time_from_sequence(
        uint32_t sequence) {
    if (sequence & SEQUENCE_LOCKTIME_DISABLE_FLAG) {
        LOG_TRACE(core::LogCategory::LOCKTIME,
                  "sequence " + std::to_string(sequence) +
                  " has the disable flag set");
        return std::nullopt;
    }

    const auto low16 = static_cast<uint16_t>(sequence & SEQUENCE_LOCKTIME_MASK);
    if (sequence & SEQUENCE_LOCKTIME_TYPE_FLAG) {
        return RelativeLockTime::from_512_second_intervals(low16);
    }
    return RelativeLockTime::from_height(low16);
}

std::optional<RelativeLockTime> relative_lock_time_from_num(int64_t num) {
    if (num < 0 || num > static_cast<int64_t>(UINT32_MAX)) {
        LOG_TRACE(core::LogCategory::LOCKTIME,
                  "lock value " + std::to_string(num) +
                  " is outside the sequence range");
        return std::nullopt;
    }
    return relative_lock_time_from_sequence(static_cast<uint32_t>(num));
}

} // namespace script
