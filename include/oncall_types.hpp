/**
 * @file oncall_types.hpp
 * @brief Core type definitions for the on-call rotation scheduler
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef ONCALL_TYPES_HPP
#define ONCALL_TYPES_HPP

#include "oncall_time_utils.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace oncall {

using time_utils::TimePoint;

/**
 * @struct RotationRule
 * @brief Periodic handover definition
 *
 * Shifts start at anchor_start and last interval_days each; users are
 * assigned round-robin in list order.
 */
struct RotationRule {
    TimePoint anchor_start{};
    int64_t interval_days = 0;
    std::vector<std::string> users;
};

/**
 * @struct Shift
 * @brief One contiguous interval [start, end) of on-call responsibility
 */
struct Shift {
    std::string user;
    TimePoint start{};
    TimePoint end{};

    [[nodiscard]] bool empty() const { return !(start < end); }
    [[nodiscard]] bool contains(TimePoint t) const { return start <= t && t < end; }

    [[nodiscard]] Shift withStart(TimePoint s) const { return Shift{user, s, end}; }
    [[nodiscard]] Shift withEnd(TimePoint e) const { return Shift{user, start, e}; }

    bool operator==(const Shift& other) const {
        return user == other.user && start == other.start && end == other.end;
    }
    bool operator!=(const Shift& other) const { return !(*this == other); }
};

/**
 * @struct OverrideInterval
 * @brief Manually assigned interval that supersedes the rotation
 */
struct OverrideInterval {
    std::string user;
    TimePoint start{};
    TimePoint end{};

    [[nodiscard]] Shift toShift() const { return Shift{user, start, end}; }

    bool operator==(const OverrideInterval& other) const {
        return user == other.user && start == other.start && end == other.end;
    }
    bool operator!=(const OverrideInterval& other) const { return !(*this == other); }
};

using ShiftList = std::vector<Shift>;
using OverrideList = std::vector<OverrideInterval>;

inline std::ostream& operator<<(std::ostream& os, const Shift& s) {
    return os << s.user << " [" << time_utils::formatTimestamp(s.start)
              << ", " << time_utils::formatTimestamp(s.end) << ")";
}

inline std::ostream& operator<<(std::ostream& os, const OverrideInterval& o) {
    return os << o.toShift();
}

} // namespace oncall

#endif // ONCALL_TYPES_HPP
