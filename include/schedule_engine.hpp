/**
 * @file schedule_engine.hpp
 * @brief Schedule computation pipeline: generate, merge overrides, clip
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * compute() is the single entry point used by the CLI and the fixture
 * self-test. It holds no state and is safe to call concurrently.
 */
#ifndef ONCALL_SCHEDULE_ENGINE_HPP
#define ONCALL_SCHEDULE_ENGINE_HPP

#include "oncall_types.hpp"
#include "result.hpp"

#include <optional>

namespace oncall {

/**
 * @struct ScheduleRequest
 * @brief Inputs of one schedule computation
 */
struct ScheduleRequest {
    RotationRule rule;
    std::optional<OverrideList> overrides;  // absent and empty are equivalent
    std::optional<TimePoint> from;          // defaults to rule.anchor_start
    TimePoint until{};
};

/**
 * @brief Compute the on-call schedule for [from, until)
 * @param rule Rotation rule
 * @param overrides Optional override intervals, in any order
 * @param from Window start (default: rule.anchor_start)
 * @param until Window end (exclusive)
 * @return Ordered, non-overlapping shifts inside the window; empty when
 *         until <= from; rule or override validation errors otherwise
 */
[[nodiscard]] Result<ShiftList> compute(const RotationRule& rule,
                                        const std::optional<OverrideList>& overrides,
                                        std::optional<TimePoint> from,
                                        TimePoint until);

[[nodiscard]] Result<ShiftList> compute(const ScheduleRequest& request);

/**
 * @brief Verify ordering, non-overlap, non-emptiness and window containment
 * @return INTERNAL_ERROR describing the first violation
 */
[[nodiscard]] Result<void> checkScheduleInvariants(const ShiftList& shifts,
                                                   TimePoint from, TimePoint until);

} // namespace oncall

#endif // ONCALL_SCHEDULE_ENGINE_HPP
