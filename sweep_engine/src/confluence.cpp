#include "confluence.hpp"
#include "indicators.hpp"
#include "util.hpp"
#include <cstdlib>
#include <algorithm>
#include <fmt/format.h>

GateOutcome SpreadGate::evaluate(const ReversalConfirmation&,
                                 const MarketContext& context) const {
    // Unknown spread passes
    if (!context.spread_pips) {
        return {true, ""};
    }
    if (*context.spread_pips > max_spread_pips_) {
        return {false, fmt::format("spread {:.1f} pips > {:.1f}", *context.spread_pips, max_spread_pips_)};
    }
    return {true, ""};
}

GateOutcome NewsBlackoutGate::evaluate(const ReversalConfirmation&,
                                       const MarketContext& context) const {
    for (const auto& event : context.news) {
        int buffer = event.tier1 ? tier1_buffer_minutes_ : other_buffer_minutes_;
        int64_t distance = std::llabs(context.timestamp_ms - event.time_ms);
        if (distance <= buffer * util::MS_PER_MINUTE) {
            return {false, fmt::format("news blackout: {} at {}", event.title,
                                       util::format_iso8601(event.time_ms))};
        }
    }
    return {true, ""};
}

GateOutcome AuctionBlackoutGate::evaluate(const ReversalConfirmation&,
                                          const MarketContext& context) const {
    int minute_of_day = static_cast<int>(
        (context.timestamp_ms - util::day_start_ms(context.timestamp_ms)) / util::MS_PER_MINUTE);

    for (int auction : auction_times_) {
        int diff = std::abs(minute_of_day - auction);
        diff = std::min(diff, 24 * 60 - diff);
        if (diff <= buffer_minutes_) {
            return {false, fmt::format("auction blackout: {:02d}:{:02d} UTC", auction / 60, auction % 60)};
        }
    }
    return {true, ""};
}

GateOutcome BiasGate::evaluate(const ReversalConfirmation& confirmation,
                               const MarketContext& context) const {
    bool upside = confirmation.sweep.direction == SweepDirection::Upside;
    if (upside && context.bias_d1 == TrendBias::Bull && context.bias_h4 == TrendBias::Bull) {
        return {false, "fading aligned bullish D1/H4 trend"};
    }
    if (!upside && context.bias_d1 == TrendBias::Bear && context.bias_h4 == TrendBias::Bear) {
        return {false, "fading aligned bearish D1/H4 trend"};
    }
    return {true, ""};
}

GateOutcome RangeGradeGate::evaluate(const ReversalConfirmation& confirmation,
                                     const MarketContext&) const {
    const AsianRange& range = confirmation.sweep.range_reference;
    if (range.grade == RangeGrade::NoTrade) {
        return {false, fmt::format("range grade NO_TRADE ({:.1f} pips)", range.range_pips)};
    }
    return {true, ""};
}

GateOutcome VelocitySpikeGate::evaluate(const ReversalConfirmation&,
                                        const MarketContext& context) const {
    const auto& bars = context.recent_bars;
    if (lookback_bars_ < 1 || bars.size() < static_cast<size_t>(lookback_bars_) + 1) {
        return {true, ""};
    }

    double average = Indicators::average_range(bars, bars.size() - 1, lookback_bars_);
    double latest = bars.back().high - bars.back().low;
    if (average > 0.0 && latest > multiplier_ * average) {
        return {false, fmt::format("velocity spike: bar range {:.2f} > {:.1f}x average {:.2f}",
                                   latest, multiplier_, average)};
    }
    return {true, ""};
}

GateOutcome TrendDayGate::evaluate(const ReversalConfirmation& confirmation,
                                   const MarketContext& context) const {
    if (!context.adx_m15 || *context.adx_m15 <= adx_threshold_ || !context.h1_band_walk) {
        return {true, ""};
    }
    bool upside = confirmation.sweep.direction == SweepDirection::Upside;
    if ((upside && context.bias_h4 == TrendBias::Bull) ||
        (!upside && context.bias_h4 == TrendBias::Bear)) {
        return {false, fmt::format("trend day: ADX(M15) {:.1f} > {:.1f} with H1 band walk, H4 {}",
                                   *context.adx_m15, adx_threshold_, to_string(context.bias_h4))};
    }
    return {true, ""};
}

GateOutcome NyParticipationGate::evaluate(const ReversalConfirmation&,
                                          const MarketContext& context) const {
    if (context.london_traversed_asia && !context.ny_fresh_sweep) {
        return {false, "London traversed the Asian range, no fresh NY sweep"};
    }
    return {true, ""};
}

GateOutcome ParticipationGate::evaluate(const ReversalConfirmation&,
                                        const MarketContext& context) const {
    auto month_day = util::utc_month_day(context.timestamp_ms);
    int month = month_day.first;
    int day = month_day.second;

    if ((month == 12 && day >= 20) || (month == 1 && day <= 5)) {
        return {false, fmt::format("year-end low participation ({:02d}-{:02d})", month, day)};
    }
    for (const auto& holiday : holidays_) {
        if (holiday.first == month && holiday.second == day) {
            return {false, fmt::format("holiday {:02d}-{:02d}", month, day)};
        }
    }
    return {true, ""};
}

nlohmann::json ConfluenceResult::to_json() const {
    return {
        {"passed", passed},
        {"failure_reasons", failure_reasons}
    };
}

void ConfluenceChecker::add_gate(std::unique_ptr<ConfluenceGate> gate) {
    gates_.push_back(std::move(gate));
}

ConfluenceResult ConfluenceChecker::check(const ReversalConfirmation& confirmation,
                                          const MarketContext& context) const {
    ConfluenceResult result;
    result.passed = true;

    for (const auto& gate : gates_) {
        auto outcome = gate->evaluate(confirmation, context);
        if (!outcome.passed) {
            result.passed = false;
            result.failure_reasons.push_back(gate->name() + ": " + outcome.reason);
        }
    }
    return result;
}

std::vector<std::string> ConfluenceChecker::gate_names() const {
    std::vector<std::string> names;
    for (const auto& gate : gates_) {
        names.push_back(gate->name());
    }
    return names;
}

std::shared_ptr<ConfluenceChecker> ConfluenceChecker::with_default_gates(const ConfluenceSettings& settings) {
    auto checker = std::make_shared<ConfluenceChecker>();
    checker->add_gate(std::make_unique<SpreadGate>(settings.max_spread_pips));
    checker->add_gate(std::make_unique<NewsBlackoutGate>(settings.tier1_news_buffer_minutes,
                                                         settings.other_news_buffer_minutes));
    checker->add_gate(std::make_unique<AuctionBlackoutGate>(settings.auction_times,
                                                            settings.auction_buffer_minutes));
    if (settings.bias_gate) {
        checker->add_gate(std::make_unique<BiasGate>());
    }
    if (settings.grade_gate) {
        checker->add_gate(std::make_unique<RangeGradeGate>());
    }
    checker->add_gate(std::make_unique<VelocitySpikeGate>(settings.velocity_spike_multiplier,
                                                          settings.velocity_lookback_bars));
    if (settings.trend_day_gate) {
        checker->add_gate(std::make_unique<TrendDayGate>(settings.adx_trend_threshold));
    }
    if (settings.ny_participation_gate) {
        checker->add_gate(std::make_unique<NyParticipationGate>());
    }
    if (settings.participation_gate) {
        checker->add_gate(std::make_unique<ParticipationGate>(settings.holidays));
    }
    return checker;
}
