#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include <optional>
#include <string>

struct SweepDetection {
    std::optional<SweepEvent> event;
    std::optional<Rejection> error;

    bool detected() const { return event.has_value(); }
};

struct SweepThreshold {
    double price;
    double pips;
    std::string source; // "fixed", "floor", "range", "atr"
};

class SweepDetector {
public:
    // Only bars strictly after the window end are evaluated. Boundaries are
    // inclusive: high == range.high + threshold is a sweep.
    static SweepDetection detect_sweep(const AsianRange& range,
                                       const Bar& bar,
                                       double threshold,
                                       TieBreakPolicy tie_break);

    // max(floor, range_pips * pct, 0.5 * ATR(H1)) in dynamic mode
    static SweepThreshold resolve_threshold(const AsianRange& range,
                                            const StrategyConfig& config,
                                            std::optional<double> atr_h1 = std::nullopt);

private:
    static std::optional<SweepDirection> break_tie(const AsianRange& range,
                                                   const Bar& bar,
                                                   TieBreakPolicy tie_break);
};
