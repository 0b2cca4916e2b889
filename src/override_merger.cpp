/**
 * @file override_merger.cpp
 * @brief Override merge sweep implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "override_merger.hpp"

#include <algorithm>
#include <sstream>

namespace oncall {
namespace schedule {

Result<OverrideList> normalizeOverrides(const OverrideList& overrides) {
    for (std::size_t i = 0; i < overrides.size(); ++i) {
        if (!(overrides[i].start < overrides[i].end)) {
            std::ostringstream oss;
            oss << "Override " << i << " has start >= end: " << overrides[i];
            return Err<OverrideList>(ErrorCode::INVALID_INTERVAL, oss.str());
        }
    }

    OverrideList sorted = overrides;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const OverrideInterval& a, const OverrideInterval& b) {
                         return a.start < b.start;
                     });

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i].start < sorted[i - 1].end) {
            std::ostringstream oss;
            oss << "Overrides overlap: " << sorted[i - 1] << " and " << sorted[i];
            return Err<OverrideList>(ErrorCode::OVERLAPPING_OVERRIDES, oss.str());
        }
    }
    return sorted;
}

ShiftList mergeOverrides(const ShiftList& shifts, const OverrideList& overrides) {
    if (overrides.empty()) return shifts;

    ShiftList merged;
    merged.reserve(shifts.size() + 2 * overrides.size());

    std::size_t si = 0;
    std::size_t oi = 0;
    // Uncovered remainder of shifts[si]; its start moves forward as
    // overrides consume the head of the shift.
    Shift pending = shifts.empty() ? Shift{} : shifts.front();
    auto advanceShift = [&]() {
        if (++si < shifts.size()) pending = shifts[si];
    };

    while (si < shifts.size() && oi < overrides.size()) {
        const OverrideInterval& ovr = overrides[oi];

        if (pending.end <= ovr.start) {
            // Shift entirely before the override
            merged.push_back(pending);
            advanceShift();
        } else if (pending.start >= ovr.end) {
            // Override entirely before the shift
            merged.push_back(ovr.toShift());
            ++oi;
        } else if (pending.start >= ovr.start && pending.end <= ovr.end) {
            // Shift fully covered
            advanceShift();
        } else if (pending.start < ovr.start && pending.end <= ovr.end) {
            // Override covers the tail
            merged.push_back(pending.withEnd(ovr.start));
            advanceShift();
        } else if (pending.start >= ovr.start) {
            // Override covers the head; the rest of the shift is compared
            // against the next override
            merged.push_back(ovr.toShift());
            pending = pending.withStart(ovr.end);
            ++oi;
        } else {
            // Override strictly inside the shift: head, override, then the
            // tail stays pending in case another override falls inside it
            merged.push_back(pending.withEnd(ovr.start));
            merged.push_back(ovr.toShift());
            pending = pending.withStart(ovr.end);
            ++oi;
        }
    }

    if (si < shifts.size()) {
        merged.push_back(pending);
        merged.insert(merged.end(), shifts.begin() + static_cast<std::ptrdiff_t>(si + 1), shifts.end());
    }
    for (; oi < overrides.size(); ++oi) {
        merged.push_back(overrides[oi].toShift());
    }
    return merged;
}

} // namespace schedule
} // namespace oncall
