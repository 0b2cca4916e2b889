/**
 * @file rotation_generator.cpp
 * @brief Rotation generator implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "rotation_generator.hpp"

namespace oncall {
namespace schedule {

Result<void> validateRule(const RotationRule& rule) {
    if (rule.users.empty()) {
        return Err(ErrorCode::EMPTY_USER_SET, "Rotation rule has no users");
    }
    if (rule.interval_days <= 0) {
        return Err(ErrorCode::NON_POSITIVE_INTERVAL,
                   "Handover interval must be positive, got " + std::to_string(rule.interval_days));
    }
    if (rule.interval_days > kMaxIntervalDays) {
        return Err(ErrorCode::INVALID_ARGUMENT,
                   "Handover interval exceeds " + std::to_string(kMaxIntervalDays) + " days");
    }
    return Ok();
}

Result<ShiftList> generateShifts(const RotationRule& rule, TimePoint until,
                                 std::optional<TimePoint> lowerBound) {
    if (auto valid = validateRule(rule); valid.isError()) {
        return Err<ShiftList>(valid.error());
    }

    const TimePoint from = lowerBound.value_or(rule.anchor_start);
    const time_utils::Seconds period =
        time_utils::addDays(TimePoint{}, rule.interval_days).time_since_epoch();

    // Jump over every period whose end is strictly before `from`. Those
    // periods would emit nothing and leave the rotation index untouched.
    TimePoint start = rule.anchor_start;
    if (from > start) {
        const auto skipped = (from - start + period - time_utils::Seconds{1}) / period - 1;
        if (skipped > 0) start += period * skipped;
    }

    ShiftList shifts;
    std::size_t index = 0;
    while (start < until) {
        const TimePoint end = start + period;
        if (end >= from) {
            shifts.push_back(Shift{rule.users[index % rule.users.size()], start, end});
            ++index;
        }
        start = end;
    }
    return shifts;
}

} // namespace schedule
} // namespace oncall
