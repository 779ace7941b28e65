#include "types.hpp"
#include "util.hpp"

int timeframe_minutes(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return 1;
        case Timeframe::M5: return 5;
        case Timeframe::M15: return 15;
        case Timeframe::H1: return 60;
        case Timeframe::H4: return 240;
        case Timeframe::D1: return 1440;
    }
    return 1;
}

std::string to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "M1";
        case Timeframe::M5: return "M5";
        case Timeframe::M15: return "M15";
        case Timeframe::H1: return "H1";
        case Timeframe::H4: return "H4";
        case Timeframe::D1: return "D1";
    }
    return "M1";
}

std::optional<Timeframe> parse_timeframe(const std::string& name) {
    if (name == "M1") return Timeframe::M1;
    if (name == "M5") return Timeframe::M5;
    if (name == "M15") return Timeframe::M15;
    if (name == "H1") return Timeframe::H1;
    if (name == "H4") return Timeframe::H4;
    if (name == "D1") return Timeframe::D1;
    return std::nullopt;
}

bool SessionWindow::contains(int64_t ts_ms) const {
    return ts_ms >= start_ms && ts_ms < end_ms;
}

bool SessionWindow::is_closed_at(int64_t ts_ms) const {
    return ts_ms >= end_ms;
}

SessionWindow SessionWindow::for_day(const std::string& symbol, int64_t ts_ms,
                                     int start_minute, int end_minute) {
    int64_t day_start = util::day_start_ms(ts_ms);

    SessionWindow window;
    window.symbol = symbol;
    window.date = util::utc_date(day_start);
    window.start_ms = day_start + start_minute * util::MS_PER_MINUTE;
    window.end_ms = day_start + end_minute * util::MS_PER_MINUTE;
    return window;
}

SweepDirection opposite(SweepDirection direction) {
    return direction == SweepDirection::Upside ? SweepDirection::Downside
                                               : SweepDirection::Upside;
}

std::string to_string(RangeGrade grade) {
    switch (grade) {
        case RangeGrade::NoTrade: return "NO_TRADE";
        case RangeGrade::Tight: return "TIGHT";
        case RangeGrade::Normal: return "NORMAL";
        case RangeGrade::Wide: return "WIDE";
    }
    return "NO_TRADE";
}

std::string to_string(SweepDirection direction) {
    return direction == SweepDirection::Upside ? "upside" : "downside";
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "IDLE";
        case SessionState::Swept: return "SWEPT";
        case SessionState::Confirmed: return "CONFIRMED";
        case SessionState::Armed: return "ARMED";
        case SessionState::InTrade: return "IN_TRADE";
        case SessionState::Cooldown: return "COOLDOWN";
    }
    return "IDLE";
}

std::string to_string(TrendBias bias) {
    switch (bias) {
        case TrendBias::Bull: return "BULL";
        case TrendBias::Bear: return "BEAR";
        case TrendBias::Range: return "RANGE";
        case TrendBias::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}
