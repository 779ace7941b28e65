#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

enum class Timeframe {
    M1,
    M5,
    M15,
    H1,
    H4,
    D1
};

int timeframe_minutes(Timeframe tf);
std::string to_string(Timeframe tf);
std::optional<Timeframe> parse_timeframe(const std::string& name);

// OHLC bar keyed by its open time (UTC epoch ms)
struct Bar {
    int64_t timestamp_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
    double spread_pips = 0.0; // 0 when the feed does not report it
};

// Half-open [start_ms, end_ms) in UTC
struct SessionWindow {
    std::string symbol;
    std::string date;
    int64_t start_ms;
    int64_t end_ms;

    bool contains(int64_t ts_ms) const;
    bool is_closed_at(int64_t ts_ms) const;

    static SessionWindow for_day(const std::string& symbol, int64_t ts_ms,
                                 int start_minute, int end_minute);
};

enum class RangeGrade {
    NoTrade,
    Tight,
    Normal,
    Wide
};

struct AsianRange {
    SessionWindow window;
    double high;
    double low;
    double midpoint;
    int bar_count;
    bool is_valid;

    double range_pips;
    RangeGrade grade;
};

enum class SweepDirection {
    Upside,
    Downside
};

SweepDirection opposite(SweepDirection direction);

struct SweepEvent {
    SweepDirection direction;
    double breach_price;
    int64_t breach_time_ms;
    double threshold_used;
    AsianRange range_reference;
};

enum class SessionState {
    Idle,
    Swept,
    Confirmed,
    Armed,
    InTrade,
    Cooldown
};

enum class TrendBias {
    Bull,
    Bear,
    Range,
    Unknown
};

std::string to_string(RangeGrade grade);
std::string to_string(SweepDirection direction);
std::string to_string(SessionState state);
std::string to_string(TrendBias bias);
