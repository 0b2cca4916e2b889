/**
 * @file window_clipper.cpp
 * @brief Window clipping implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "window_clipper.hpp"

#include <algorithm>

namespace oncall {
namespace schedule {

ShiftList clipToWindow(const ShiftList& shifts, TimePoint from, TimePoint until) {
    ShiftList clipped;
    if (!(from < until)) return clipped;

    auto first = std::find_if(shifts.begin(), shifts.end(),
                              [from](const Shift& s) { return s.end > from; });
    auto last = std::find_if(shifts.rbegin(), shifts.rend(),
                             [until](const Shift& s) { return s.start < until; }).base();
    if (first >= last) return clipped;

    clipped.reserve(static_cast<std::size_t>(last - first));
    for (auto it = first; it != last; ++it) {
        Shift piece = *it;
        if (piece.start < from) piece = piece.withStart(from);
        if (piece.end > until) piece = piece.withEnd(until);
        clipped.push_back(std::move(piece));
    }
    return clipped;
}

} // namespace schedule
} // namespace oncall
