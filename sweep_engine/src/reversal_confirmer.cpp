#include "reversal_confirmer.hpp"
#include "indicators.hpp"
#include "util.hpp"
#include <limits>
#include <spdlog/spdlog.h>

std::string to_string(ReversalStatus status) {
    switch (status) {
        case ReversalStatus::Pending: return "pending";
        case ReversalStatus::Confirmed: return "confirmed";
        case ReversalStatus::Expired: return "expired";
    }
    return "pending";
}

nlohmann::json ReversalConfirmation::to_json() const {
    nlohmann::json j = {
        {"direction", to_string(sweep.direction)},
        {"breach_price", sweep.breach_price},
        {"breach_time", util::format_iso8601(sweep.breach_time_ms)},
        {"status", to_string(status)},
        {"close_back_inside", close_back_inside},
        {"displacement_ok", displacement_ok},
        {"structural_break", structural_break},
        {"extreme_price", extreme_price},
        {"primary_bars_seen", primary_bars_seen}
    };
    if (close_back_inside) {
        j["reentry_close"] = reentry_close;
    }
    if (displacement_ok) {
        j["displacement_ratio"] = displacement_ratio;
    }
    if (swing_level) {
        j["swing_level"] = *swing_level;
    }
    if (confirmed_at_ms) {
        j["confirmed_at"] = util::format_iso8601(*confirmed_at_ms);
    }
    if (!expiry_reason.empty()) {
        j["expiry_reason"] = expiry_reason;
    }
    return j;
}

ReversalConfirmer::ReversalConfirmer(const StrategyConfig& config)
    : lookahead_bars_(config.reversal_lookahead_bars)
    , lookahead_minutes_(config.reversal_lookahead_minutes)
    , displacement_min_fraction_(config.displacement_min_fraction)
    , displacement_max_bars_(config.displacement_max_bars)
    , swing_lookback_(config.swing_lookback)
    , acceptance_outside_closes_(config.acceptance_outside_closes)
{}

ReversalConfirmation ReversalConfirmer::begin(const SweepEvent& sweep,
                                              const std::vector<Bar>& micro_history) const {
    ReversalConfirmation record;
    record.sweep = sweep;
    record.extreme_price = sweep.breach_price;
    // The sweep bar itself is the first primary bar evaluated
    record.last_primary_ts_ms = sweep.breach_time_ms - 1;
    record.last_micro_ts_ms = std::numeric_limits<int64_t>::min();

    for (const auto& bar : micro_history) {
        if (bar.timestamp_ms <= record.last_micro_ts_ms) continue;
        process_micro(record, bar);
    }
    return record;
}

ReversalStatus ReversalConfirmer::evaluate(ReversalConfirmation& record,
                                           const std::vector<Bar>& primary_bars,
                                           const std::vector<Bar>& micro_bars) const {
    if (record.status != ReversalStatus::Pending) {
        return record.status;
    }

    for (const auto& bar : micro_bars) {
        if (bar.timestamp_ms <= record.last_micro_ts_ms) continue;
        process_micro(record, bar);
        try_confirm(record, bar.timestamp_ms);
        if (record.status != ReversalStatus::Pending) {
            return record.status;
        }
    }

    for (const auto& bar : primary_bars) {
        if (bar.timestamp_ms <= record.last_primary_ts_ms) continue;
        process_primary(record, bar);
        if (record.status != ReversalStatus::Pending) {
            break;
        }
    }

    return record.status;
}

bool ReversalConfirmer::within_time_budget(const ReversalConfirmation& record,
                                           int64_t ts_ms) const {
    if (lookahead_minutes_ <= 0) return true;
    return ts_ms - record.sweep.breach_time_ms <= lookahead_minutes_ * util::MS_PER_MINUTE;
}

void ReversalConfirmer::expire(ReversalConfirmation& record, const std::string& reason) const {
    record.status = ReversalStatus::Expired;
    record.expiry_reason = reason;
}

void ReversalConfirmer::process_micro(ReversalConfirmation& record, const Bar& bar) const {
    record.last_micro_ts_ms = bar.timestamp_ms;

    size_t span = static_cast<size_t>(2 * swing_lookback_ + 1);
    record.micro_window.push_back(bar);
    if (record.micro_window.size() > span) {
        record.micro_window.erase(record.micro_window.begin());
    }

    bool upside = record.sweep.direction == SweepDirection::Upside;
    size_t center = static_cast<size_t>(swing_lookback_);

    // A pivot is confirmed once swing_lookback bars have printed after it
    if (record.micro_window.size() == span) {
        const Bar& pivot = record.micro_window[center];
        if (upside && Indicators::is_swing_low(record.micro_window, center, swing_lookback_)) {
            record.swing_level = pivot.low;
            record.swing_time_ms = pivot.timestamp_ms;
        } else if (!upside && Indicators::is_swing_high(record.micro_window, center, swing_lookback_)) {
            record.swing_level = pivot.high;
            record.swing_time_ms = pivot.timestamp_ms;
        }
    }

    // A break printed before the re-entry is only a candidate; a later one replaces it
    if (has_valid_break(record) || !record.swing_level) return;
    if (bar.timestamp_ms < record.sweep.breach_time_ms) return;
    if (!within_time_budget(record, bar.timestamp_ms)) return;

    bool broken = upside ? bar.close < *record.swing_level
                         : bar.close > *record.swing_level;
    if (broken) {
        record.break_time_ms = bar.timestamp_ms;
        spdlog::debug("Micro structure break at {} through {}",
                      util::format_iso8601(bar.timestamp_ms), *record.swing_level);
    }
}

void ReversalConfirmer::process_primary(ReversalConfirmation& record, const Bar& bar) const {
    record.last_primary_ts_ms = bar.timestamp_ms;
    int index = record.primary_bars_seen++;

    if (lookahead_bars_ > 0 && index > lookahead_bars_) {
        expire(record, "lookahead_elapsed");
        return;
    }
    if (!within_time_budget(record, bar.timestamp_ms)) {
        expire(record, "lookahead_elapsed");
        return;
    }

    const AsianRange& range = record.sweep.range_reference;
    bool upside = record.sweep.direction == SweepDirection::Upside;

    // Same-direction extension moves the extreme until displacement passes
    if (!record.displacement_ok) {
        bool extended = upside ? bar.high > record.extreme_price
                               : bar.low < record.extreme_price;
        if (extended) {
            record.extreme_price = upside ? bar.high : bar.low;
            record.extreme_bar_index = index;
            // Structure broken before a new extreme no longer counts
            if (record.break_time_ms) {
                spdlog::debug("Extreme extended to {}, discarding micro break at {}",
                              record.extreme_price, util::format_iso8601(*record.break_time_ms));
                record.break_time_ms.reset();
            }
        }
    }

    // Step 1: close back inside
    if (!record.close_back_inside) {
        bool inside = bar.close >= range.low && bar.close <= range.high;
        if (!inside) {
            bool outside_sweep_side = upside ? bar.close > range.high : bar.close < range.low;
            record.consecutive_closes_outside = outside_sweep_side
                ? record.consecutive_closes_outside + 1 : 0;
            if (acceptance_outside_closes_ > 0 &&
                record.consecutive_closes_outside >= acceptance_outside_closes_) {
                expire(record, "acceptance_outside");
            }
            return;
        }
        record.close_back_inside = true;
        record.consecutive_closes_outside = 0;
        record.reentry_close = bar.close;
        record.reentry_time_ms = bar.timestamp_ms;
    }

    // Step 2: displacement away from the extreme
    if (!record.displacement_ok) {
        double excursion = upside ? record.extreme_price - range.high
                                  : range.low - record.extreme_price;
        double move = upside ? record.extreme_price - bar.close
                             : bar.close - record.extreme_price;
        int bars_since_extreme = index - record.extreme_bar_index;

        if (bars_since_extreme <= displacement_max_bars_ &&
            move >= displacement_min_fraction_ * excursion) {
            record.displacement_ok = true;
            record.displacement_ratio = excursion > 0.0 ? move / excursion : 0.0;
        } else {
            return;
        }
    }

    // Step 3: micro structure break
    try_confirm(record, bar.timestamp_ms);
}

bool ReversalConfirmer::has_valid_break(const ReversalConfirmation& record) {
    return record.close_back_inside && record.break_time_ms &&
           *record.break_time_ms >= record.reentry_time_ms;
}

void ReversalConfirmer::try_confirm(ReversalConfirmation& record, int64_t ts_ms) const {
    if (record.status != ReversalStatus::Pending) return;
    if (!record.close_back_inside || !record.displacement_ok) return;
    if (!has_valid_break(record)) return;

    record.structural_break = true;
    record.status = ReversalStatus::Confirmed;
    record.confirmed_at_ms = ts_ms;
}
