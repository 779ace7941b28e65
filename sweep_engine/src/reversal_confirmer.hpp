#pragma once

#include "types.hpp"
#include "config.hpp"
#include <vector>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class ReversalStatus {
    Pending,
    Confirmed,
    Expired
};

std::string to_string(ReversalStatus status);

// One confirmation attempt per sweep, updated in place. The three step
// flags only ever go from false to true.
struct ReversalConfirmation {
    SweepEvent sweep;

    bool close_back_inside = false;
    bool displacement_ok = false;
    bool structural_break = false;
    std::optional<int64_t> confirmed_at_ms;
    ReversalStatus status = ReversalStatus::Pending;
    std::string expiry_reason;

    // Primary timeframe tracking; the sweep bar is index 0
    double extreme_price = 0.0;
    int extreme_bar_index = 0;
    int primary_bars_seen = 0;
    int consecutive_closes_outside = 0;
    double reentry_close = 0.0;
    int64_t reentry_time_ms = 0;
    double displacement_ratio = 0.0;
    int64_t last_primary_ts_ms = 0;

    // Micro timeframe structure
    int64_t last_micro_ts_ms = 0;
    std::vector<Bar> micro_window;
    std::optional<double> swing_level;
    int64_t swing_time_ms = 0;
    std::optional<int64_t> break_time_ms;

    nlohmann::json to_json() const;
};

class ReversalConfirmer {
public:
    explicit ReversalConfirmer(const StrategyConfig& config);

    // Opens an attempt; micro_history seeds swing detection and may already
    // contain bars at or after the breach
    ReversalConfirmation begin(const SweepEvent& sweep,
                               const std::vector<Bar>& micro_history) const;

    // Bars at or before the last processed timestamp of their timeframe are
    // skipped, so repeated calls with the same bars change nothing
    ReversalStatus evaluate(ReversalConfirmation& record,
                            const std::vector<Bar>& primary_bars,
                            const std::vector<Bar>& micro_bars) const;

private:
    int lookahead_bars_;
    int lookahead_minutes_;
    double displacement_min_fraction_;
    int displacement_max_bars_;
    int swing_lookback_;
    int acceptance_outside_closes_;

    void process_micro(ReversalConfirmation& record, const Bar& bar) const;
    void process_primary(ReversalConfirmation& record, const Bar& bar) const;
    bool within_time_budget(const ReversalConfirmation& record, int64_t ts_ms) const;
    void expire(ReversalConfirmation& record, const std::string& reason) const;
    void try_confirm(ReversalConfirmation& record, int64_t ts_ms) const;
    // Break at or after the close back inside
    static bool has_valid_break(const ReversalConfirmation& record);
};
