#include "range_tracker.hpp"
#include <algorithm>
#include <fmt/format.h>

RangeResult RangeTracker::compute_range(const std::vector<Bar>& bars,
                                        const SessionWindow& window,
                                        const StrategyConfig& config) {
    RangeResult result;

    int count = 0;
    double high = 0.0;
    double low = 0.0;
    for (const auto& bar : bars) {
        if (!window.contains(bar.timestamp_ms)) continue;
        if (count == 0) {
            high = bar.high;
            low = bar.low;
        } else {
            high = std::max(high, bar.high);
            low = std::min(low, bar.low);
        }
        ++count;
    }

    if (count < config.min_bars_for_range) {
        result.error = Rejection{
            ErrorKind::InsufficientData,
            fmt::format("{} bars in window {} {}, need {}",
                        count, window.symbol, window.date, config.min_bars_for_range)
        };
        return result;
    }

    AsianRange range;
    range.window = window;
    range.high = high;
    range.low = low;
    range.midpoint = (high + low) / 2.0;
    range.bar_count = count;
    // Degenerate range keeps its numbers but cannot be swept
    range.is_valid = high > low;
    range.range_pips = config.price_to_pips(high - low);
    range.grade = grade_range(range.range_pips, config.grading);

    result.range = range;
    return result;
}

RangeGrade RangeTracker::grade_range(double range_pips, const GradeThresholds& thresholds) {
    if (range_pips < thresholds.no_trade_below_pips) return RangeGrade::NoTrade;
    if (range_pips <= thresholds.tight_max_pips) return RangeGrade::Tight;
    if (range_pips <= thresholds.normal_max_pips) return RangeGrade::Normal;
    if (range_pips <= thresholds.wide_max_pips) return RangeGrade::Wide;
    return RangeGrade::NoTrade;
}
