#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdlib>

enum class ThresholdMode {
    Fixed,
    Dynamic
};

enum class TieBreakPolicy {
    None,
    MidpointClose,
    LargerExcursion,
    Reject
};

enum class OppositeSweepPolicy {
    Abandon,
    Supersede
};

std::string to_string(ThresholdMode mode);
std::string to_string(TieBreakPolicy policy);
std::string to_string(OppositeSweepPolicy policy);
std::optional<ThresholdMode> parse_threshold_mode(const std::string& name);
std::optional<TieBreakPolicy> parse_tie_break(const std::string& name);
std::optional<OppositeSweepPolicy> parse_opposite_sweep_policy(const std::string& name);

// Range width grading in pips
struct GradeThresholds {
    double no_trade_below_pips = 30.0;
    double tight_max_pips = 49.0;
    double normal_max_pips = 150.0;
    double wide_max_pips = 180.0;
};

struct ConfluenceSettings {
    double max_spread_pips = 2.0;

    int tier1_news_buffer_minutes = 60;
    int other_news_buffer_minutes = 30;

    // Minutes after midnight UTC (LBMA auctions)
    std::vector<int> auction_times = {10 * 60 + 30, 15 * 60};
    int auction_buffer_minutes = 15;

    double velocity_spike_multiplier = 2.0;
    int velocity_lookback_bars = 12;

    bool bias_gate = true;
    bool grade_gate = true;

    bool trend_day_gate = true;
    double adx_trend_threshold = 25.0;

    // London and NY session bounds, minutes after midnight UTC
    bool ny_participation_gate = true;
    int london_start_minute = 8 * 60;
    int london_end_minute = 16 * 60;
    int ny_start_minute = 13 * 60;

    // Late December and early January always count as low participation
    bool participation_gate = true;
    std::vector<std::pair<int, int>> holidays = {{1, 1}, {7, 4}, {12, 25}};
};

struct StrategyConfig {
    // Session window, minutes after midnight UTC
    int session_start_minute = 0;
    int session_end_minute = 6 * 60;

    double pip_size = 0.1;

    ThresholdMode threshold_mode = ThresholdMode::Fixed;
    double sweep_threshold_pips = 5.0;
    double threshold_floor_pips = 10.0;
    double threshold_range_pct = 0.09;

    TieBreakPolicy tie_break = TieBreakPolicy::MidpointClose;
    OppositeSweepPolicy opposite_sweep_policy = OppositeSweepPolicy::Abandon;

    int min_bars_for_range = 12;

    // Either budget may be 0 (disabled) but not both
    int reversal_lookahead_bars = 0;
    int reversal_lookahead_minutes = 30;

    double displacement_min_fraction = 1.5;
    int displacement_max_bars = 3;
    int swing_lookback = 2;
    int acceptance_outside_closes = 2;   // 0 disables

    int confluence_max_wait_minutes = 15;
    int cooldown_minutes = 60;
    int max_trades_per_session = 2;
    int session_retention_hours = 24;

    double sl_buffer_pips = 2.0;
    double tp2_buffer_pips = 2.0;

    GradeThresholds grading;
    ConfluenceSettings confluence;

    double pips_to_price(double pips) const { return pips * pip_size; }
    double price_to_pips(double price) const { return price / pip_size; }

    void validate() const;
};

struct Config {
    StrategyConfig strategy;

    // Symbols and bar series
    std::vector<std::string> symbols;
    Timeframe primary_timeframe;
    Timeframe micro_timeframe;
    bool derive_primary_from_micro;
    int poll_interval_ms;

    // Redis
    std::string redis_url;
    std::string stream_events;
    long long events_maxlen;
    std::string stream_execution;
    std::string execution_group;

    // Postgres
    std::string pg_dsn;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
    static int get_env_minutes(const char* name, int default_val);
};
