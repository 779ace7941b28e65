#pragma once

#include "types.hpp"
#include <vector>
#include <optional>

// Rolls a finer bar series into a coarser timeframe. A bucket is complete
// once a bar from a later bucket arrives; no wall clock is consulted.
class BarAggregator {
public:
    explicit BarAggregator(Timeframe target);

    std::vector<Bar> add_bar(const Bar& bar);
    std::optional<Bar> current_bar() const;

    int64_t bucket_start(int64_t ts_ms) const;
    Timeframe target() const { return target_; }

private:
    Timeframe target_;
    int64_t interval_ms_;
    int64_t current_bucket_ms_;
    int64_t last_ts_ms_;
    std::vector<Bar> pending_;

    Bar synthesize_bar(int64_t start_ms, const std::vector<Bar>& bucket_bars) const;
};
