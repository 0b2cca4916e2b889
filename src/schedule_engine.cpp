/**
 * @file schedule_engine.cpp
 * @brief Schedule computation pipeline implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "schedule_engine.hpp"
#include "oncall_logger.hpp"
#include "override_merger.hpp"
#include "rotation_generator.hpp"
#include "window_clipper.hpp"

#include <sstream>

namespace oncall {

namespace {

constexpr const char* kComponent = "ScheduleEngine";

std::string describeWindow(TimePoint from, TimePoint until) {
    return "[" + time_utils::formatTimestamp(from) + ", " + time_utils::formatTimestamp(until) + ")";
}

} // namespace

Result<ShiftList> compute(const RotationRule& rule,
                          const std::optional<OverrideList>& overrides,
                          std::optional<TimePoint> from,
                          TimePoint until) {
    if (auto valid = schedule::validateRule(rule); valid.isError()) {
        ONCALL_LOG_WARNING(kComponent, "Rejected rotation rule: " + valid.error().toString());
        return Err<ShiftList>(valid.error());
    }

    const TimePoint windowStart = from.value_or(rule.anchor_start);
    if (!(windowStart < until)) {
        ONCALL_LOG_DEBUG(kComponent, "Empty window " + describeWindow(windowStart, until));
        return ShiftList{};
    }

    OverrideList sortedOverrides;
    if (overrides && !overrides->empty()) {
        auto normalized = schedule::normalizeOverrides(*overrides);
        if (normalized.isError()) {
            ONCALL_LOG_WARNING(kComponent, "Rejected overrides: " + normalized.error().toString());
            return Err<ShiftList>(normalized.error());
        }
        sortedOverrides = std::move(normalized.value());
    }

    auto generated = schedule::generateShifts(rule, until, windowStart);
    if (generated.isError()) return Err<ShiftList>(generated.error());
    ONCALL_LOG_DEBUG(kComponent, "Generated " + std::to_string(generated->size()) +
                                 " rotation shifts for " + describeWindow(windowStart, until));

    ShiftList merged = schedule::mergeOverrides(*generated, sortedOverrides);
    ONCALL_LOG_DEBUG(kComponent, "Merged " + std::to_string(sortedOverrides.size()) +
                                 " overrides into " + std::to_string(merged.size()) + " shifts");

    ShiftList clipped = schedule::clipToWindow(merged, windowStart, until);
    ONCALL_LOG_INFO(kComponent, "Computed " + std::to_string(clipped.size()) + " shifts for " +
                                describeWindow(windowStart, until));
    return clipped;
}

Result<ShiftList> compute(const ScheduleRequest& request) {
    return compute(request.rule, request.overrides, request.from, request.until);
}

Result<void> checkScheduleInvariants(const ShiftList& shifts, TimePoint from, TimePoint until) {
    for (std::size_t i = 0; i < shifts.size(); ++i) {
        const Shift& s = shifts[i];
        std::ostringstream oss;
        if (s.empty()) {
            oss << "Shift " << i << " is empty: " << s;
        } else if (s.start < from || s.end > until) {
            oss << "Shift " << i << " outside window " << describeWindow(from, until) << ": " << s;
        } else if (i > 0 && shifts[i - 1].end > s.start) {
            oss << "Shift " << i << " overlaps or precedes its predecessor: " << s;
        }
        if (!oss.str().empty()) {
            return Err(ErrorCode::INTERNAL_ERROR, oss.str());
        }
    }
    return Ok();
}

} // namespace oncall
