#include "sweep_detector.hpp"
#include "util.hpp"
#include <fmt/format.h>

SweepDetection SweepDetector::detect_sweep(const AsianRange& range,
                                           const Bar& bar,
                                           double threshold,
                                           TieBreakPolicy tie_break) {
    SweepDetection result;

    if (bar.timestamp_ms <= range.window.end_ms) {
        return result;
    }

    bool upside = bar.high >= range.high + threshold;
    bool downside = bar.low <= range.low - threshold;
    if (!upside && !downside) {
        return result;
    }

    SweepDirection direction = upside ? SweepDirection::Upside : SweepDirection::Downside;
    if (upside && downside) {
        auto resolved = break_tie(range, bar, tie_break);
        if (!resolved) {
            result.error = Rejection{
                ErrorKind::AmbiguousSweep,
                fmt::format("bar at {} breached both sides (policy {})",
                            util::format_iso8601(bar.timestamp_ms), to_string(tie_break))
            };
            return result;
        }
        direction = *resolved;
    }

    SweepEvent event;
    event.direction = direction;
    event.breach_price = direction == SweepDirection::Upside ? bar.high : bar.low;
    event.breach_time_ms = bar.timestamp_ms;
    event.threshold_used = threshold;
    event.range_reference = range;
    result.event = event;
    return result;
}

std::optional<SweepDirection> SweepDetector::break_tie(const AsianRange& range,
                                                       const Bar& bar,
                                                       TieBreakPolicy tie_break) {
    double up_excursion = bar.high - range.high;
    double down_excursion = range.low - bar.low;

    auto larger_excursion = [&]() -> std::optional<SweepDirection> {
        if (up_excursion > down_excursion) return SweepDirection::Upside;
        if (down_excursion > up_excursion) return SweepDirection::Downside;
        return std::nullopt;
    };

    switch (tie_break) {
        case TieBreakPolicy::MidpointClose:
            if (bar.close > range.midpoint) return SweepDirection::Upside;
            if (bar.close < range.midpoint) return SweepDirection::Downside;
            return larger_excursion();
        case TieBreakPolicy::LargerExcursion:
            return larger_excursion();
        case TieBreakPolicy::Reject:
        case TieBreakPolicy::None:
            return std::nullopt;
    }
    return std::nullopt;
}

SweepThreshold SweepDetector::resolve_threshold(const AsianRange& range,
                                                const StrategyConfig& config,
                                                std::optional<double> atr_h1) {
    SweepThreshold threshold;

    if (config.threshold_mode == ThresholdMode::Fixed) {
        threshold.pips = config.sweep_threshold_pips;
        threshold.source = "fixed";
    } else {
        threshold.pips = config.threshold_floor_pips;
        threshold.source = "floor";

        double range_component = range.range_pips * config.threshold_range_pct;
        if (range_component > threshold.pips) {
            threshold.pips = range_component;
            threshold.source = "range";
        }

        if (atr_h1 && *atr_h1 > 0.0) {
            double atr_component = 0.5 * config.price_to_pips(*atr_h1);
            if (atr_component > threshold.pips) {
                threshold.pips = atr_component;
                threshold.source = "atr";
            }
        }
    }

    threshold.price = config.pips_to_price(threshold.pips);
    return threshold;
}
