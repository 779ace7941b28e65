#pragma once

#include "types.hpp"
#include "config.hpp"
#include "reversal_confirmer.hpp"
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

struct NewsEvent {
    int64_t time_ms;
    std::string title;
    bool tier1;
};

// Everything the gates may look at besides the confirmation itself
struct MarketContext {
    int64_t timestamp_ms = 0;
    std::optional<double> spread_pips;
    std::optional<double> atr_h1;
    TrendBias bias_d1 = TrendBias::Unknown;
    TrendBias bias_h4 = TrendBias::Unknown;
    std::vector<NewsEvent> news;
    std::vector<Bar> recent_bars; // primary timeframe, oldest first
    bool symbol_busy = false;     // another session of the symbol holds a position
    std::optional<double> adx_m15;
    bool h1_band_walk = false;
    // Set by the session from its own primary bars
    bool london_traversed_asia = false;
    bool ny_fresh_sweep = false;
};

struct GateOutcome {
    bool passed;
    std::string reason;
};

class ConfluenceGate {
public:
    virtual ~ConfluenceGate() = default;
    virtual std::string name() const = 0;
    virtual GateOutcome evaluate(const ReversalConfirmation& confirmation,
                                 const MarketContext& context) const = 0;
};

class SpreadGate : public ConfluenceGate {
public:
    explicit SpreadGate(double max_spread_pips) : max_spread_pips_(max_spread_pips) {}
    std::string name() const override { return "spread"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    double max_spread_pips_;
};

class NewsBlackoutGate : public ConfluenceGate {
public:
    NewsBlackoutGate(int tier1_buffer_minutes, int other_buffer_minutes)
        : tier1_buffer_minutes_(tier1_buffer_minutes)
        , other_buffer_minutes_(other_buffer_minutes) {}
    std::string name() const override { return "news_blackout"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    int tier1_buffer_minutes_;
    int other_buffer_minutes_;
};

class AuctionBlackoutGate : public ConfluenceGate {
public:
    AuctionBlackoutGate(std::vector<int> auction_times, int buffer_minutes)
        : auction_times_(std::move(auction_times))
        , buffer_minutes_(buffer_minutes) {}
    std::string name() const override { return "auction_blackout"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    std::vector<int> auction_times_;
    int buffer_minutes_;
};

// Do not fade a sweep in the direction of an aligned D1/H4 trend
class BiasGate : public ConfluenceGate {
public:
    std::string name() const override { return "htf_bias"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
};

class RangeGradeGate : public ConfluenceGate {
public:
    std::string name() const override { return "range_grade"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
};

class VelocitySpikeGate : public ConfluenceGate {
public:
    VelocitySpikeGate(double multiplier, int lookback_bars)
        : multiplier_(multiplier), lookback_bars_(lookback_bars) {}
    std::string name() const override { return "velocity_spike"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    double multiplier_;
    int lookback_bars_;
};

// Trend day: strong M15 ADX plus an H1 band walk. Blocks a fade that runs
// against the H4 trend.
class TrendDayGate : public ConfluenceGate {
public:
    explicit TrendDayGate(double adx_threshold) : adx_threshold_(adx_threshold) {}
    std::string name() const override { return "trend_day"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    double adx_threshold_;
};

// Once London has traded through both sides of the Asian range, NY needs its own sweep
class NyParticipationGate : public ConfluenceGate {
public:
    std::string name() const override { return "ny_participation"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
};

// Year-end weeks and listed holidays (month, day)
class ParticipationGate : public ConfluenceGate {
public:
    explicit ParticipationGate(std::vector<std::pair<int, int>> holidays)
        : holidays_(std::move(holidays)) {}
    std::string name() const override { return "participation"; }
    GateOutcome evaluate(const ReversalConfirmation& confirmation,
                         const MarketContext& context) const override;
private:
    std::vector<std::pair<int, int>> holidays_;
};

struct ConfluenceResult {
    bool passed;
    std::vector<std::string> failure_reasons;

    nlohmann::json to_json() const;
};

// All gates must pass. Gates are const and side-effect free, so one checker
// may be shared by every session.
class ConfluenceChecker {
public:
    ConfluenceChecker() = default;

    void add_gate(std::unique_ptr<ConfluenceGate> gate);
    ConfluenceResult check(const ReversalConfirmation& confirmation,
                           const MarketContext& context) const;

    size_t gate_count() const { return gates_.size(); }
    std::vector<std::string> gate_names() const;

    static std::shared_ptr<ConfluenceChecker> with_default_gates(const ConfluenceSettings& settings);

private:
    std::vector<std::unique_ptr<ConfluenceGate>> gates_;
};
