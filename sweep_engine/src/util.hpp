#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <utility>

namespace util {
    constexpr int64_t MS_PER_MINUTE = 60 * 1000;
    constexpr int64_t MS_PER_DAY = 24 * 60 * MS_PER_MINUTE;

    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // UTC formatting helpers; timestamps are epoch milliseconds
    std::string format_iso8601(int64_t ts_ms);
    std::string utc_date(int64_t ts_ms);          // "YYYY-MM-DD"
    int64_t day_start_ms(int64_t ts_ms);
    std::pair<int, int> utc_month_day(int64_t ts_ms);   // (1-12, 1-31)
    std::optional<int64_t> parse_utc_date(const std::string& date);

    // "HH:MM" -> minutes after midnight
    std::optional<int> parse_hhmm(const std::string& hhmm);

    std::vector<std::string> split(const std::string& str, char delim);
    std::string redact_dsn(const std::string& dsn);
}
