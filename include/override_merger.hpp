/**
 * @file override_merger.hpp
 * @brief Merging of manual override intervals into a rotation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Overrides always win: a shift overlapped by an override is trimmed,
 * split around it, or dropped, and the override appears verbatim.
 */
#ifndef ONCALL_OVERRIDE_MERGER_HPP
#define ONCALL_OVERRIDE_MERGER_HPP

#include "oncall_types.hpp"
#include "result.hpp"

namespace oncall {
namespace schedule {

/**
 * @brief Sort overrides by start and reject malformed or overlapping ones
 * @return Sorted copy, INVALID_INTERVAL for start >= end, or
 *         OVERLAPPING_OVERRIDES when two intervals share any instant
 */
[[nodiscard]] Result<OverrideList> normalizeOverrides(const OverrideList& overrides);

/**
 * @brief Merge overrides into an ordered shift sequence
 *
 * Preconditions (see normalizeOverrides()): overrides sorted ascending by
 * start and mutually non-overlapping; shifts ordered and non-overlapping.
 * The inputs are never modified; trimmed pieces are new values.
 *
 * @return Ordered, non-overlapping sequence in which every instant covered
 *         by an override belongs to that override
 */
[[nodiscard]] ShiftList mergeOverrides(const ShiftList& shifts, const OverrideList& overrides);

} // namespace schedule
} // namespace oncall

#endif // ONCALL_OVERRIDE_MERGER_HPP
