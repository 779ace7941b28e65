#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include <vector>
#include <optional>

struct RangeResult {
    std::optional<AsianRange> range;
    std::optional<Rejection> error;

    bool ok() const { return range.has_value(); }
};

class RangeTracker {
public:
    // Bars must be sorted ascending and belong to window.symbol; bars
    // outside [start, end) are ignored. Fails with InsufficientData when
    // fewer than min_bars_for_range bars fall inside the window.
    static RangeResult compute_range(const std::vector<Bar>& bars,
                                     const SessionWindow& window,
                                     const StrategyConfig& config);

    static RangeGrade grade_range(double range_pips, const GradeThresholds& thresholds);
};
