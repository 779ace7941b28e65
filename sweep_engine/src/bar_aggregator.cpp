#include "bar_aggregator.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

BarAggregator::BarAggregator(Timeframe target)
    : target_(target)
    , interval_ms_(timeframe_minutes(target) * util::MS_PER_MINUTE)
    , current_bucket_ms_(std::numeric_limits<int64_t>::min())
    , last_ts_ms_(std::numeric_limits<int64_t>::min())
{}

int64_t BarAggregator::bucket_start(int64_t ts_ms) const {
    int64_t bucket = ts_ms / interval_ms_;
    if (ts_ms < 0 && ts_ms % interval_ms_ != 0) {
        --bucket;
    }
    return bucket * interval_ms_;
}

std::vector<Bar> BarAggregator::add_bar(const Bar& bar) {
    std::vector<Bar> completed;

    if (bar.timestamp_ms <= last_ts_ms_) {
        spdlog::debug("Aggregator {}: ignoring stale bar at {}",
                      to_string(target_), util::format_iso8601(bar.timestamp_ms));
        return completed;
    }
    last_ts_ms_ = bar.timestamp_ms;

    int64_t bucket = bucket_start(bar.timestamp_ms);
    if (bucket != current_bucket_ms_) {
        // New bucket started
        if (!pending_.empty()) {
            completed.push_back(synthesize_bar(current_bucket_ms_, pending_));
        }
        current_bucket_ms_ = bucket;
        pending_.clear();
    }

    pending_.push_back(bar);
    return completed;
}

std::optional<Bar> BarAggregator::current_bar() const {
    if (pending_.empty()) {
        return std::nullopt;
    }
    return synthesize_bar(current_bucket_ms_, pending_);
}

Bar BarAggregator::synthesize_bar(int64_t start_ms,
                                  const std::vector<Bar>& bucket_bars) const {
    Bar bar;
    bar.timestamp_ms = start_ms;
    bar.open = bucket_bars.front().open;
    bar.close = bucket_bars.back().close;
    bar.high = bucket_bars.front().high;
    bar.low = bucket_bars.front().low;
    bar.volume = 0.0;
    bar.spread_pips = bucket_bars.back().spread_pips;

    for (const auto& b : bucket_bars) {
        bar.high = std::max(bar.high, b.high);
        bar.low = std::min(bar.low, b.low);
        bar.volume += b.volume;
    }

    return bar;
}
