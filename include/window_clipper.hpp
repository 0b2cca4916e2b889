/**
 * @file window_clipper.hpp
 * @brief Restriction of a shift sequence to a half-open time window
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef ONCALL_WINDOW_CLIPPER_HPP
#define ONCALL_WINDOW_CLIPPER_HPP

#include "oncall_types.hpp"

namespace oncall {
namespace schedule {

/**
 * @brief Clip an ordered, non-overlapping sequence to [from, until)
 *
 * Shifts wholly outside the window are dropped; the boundary shifts are
 * truncated. Returns a new sequence and is idempotent. An empty window
 * (until <= from) yields an empty list.
 */
[[nodiscard]] ShiftList clipToWindow(const ShiftList& shifts, TimePoint from, TimePoint until);

} // namespace schedule
} // namespace oncall

#endif // ONCALL_WINDOW_CLIPPER_HPP
