/**
 * @file rotation_generator.hpp
 * @brief Expansion of a periodic handover rule into concrete shifts
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef ONCALL_ROTATION_GENERATOR_HPP
#define ONCALL_ROTATION_GENERATOR_HPP

#include "oncall_types.hpp"
#include "result.hpp"

#include <optional>

namespace oncall {
namespace schedule {

// Longest accepted handover interval (100 years)
inline constexpr int64_t kMaxIntervalDays = 36500;

/**
 * @brief Check the structural invariants of a rotation rule
 * @return EMPTY_USER_SET, NON_POSITIVE_INTERVAL or INVALID_ARGUMENT on failure
 */
[[nodiscard]] Result<void> validateRule(const RotationRule& rule);

/**
 * @brief Generate rotation shifts from rule.anchor_start up to until
 *
 * Periods that end strictly before lowerBound are skipped and do not
 * consume a rotation slot: the first emitted shift always goes to
 * users[0]. The last shift may extend past until.
 *
 * @param rule Rotation rule
 * @param until Exclusive upper bound on shift start times
 * @param lowerBound Skip periods ending before this instant (default: anchor)
 * @return Ordered, contiguous shifts, or the validateRule() error
 */
[[nodiscard]] Result<ShiftList> generateShifts(const RotationRule& rule, TimePoint until,
                                               std::optional<TimePoint> lowerBound = std::nullopt);

} // namespace schedule
} // namespace oncall

#endif // ONCALL_ROTATION_GENERATOR_HPP
