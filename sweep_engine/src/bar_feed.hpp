#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// Pull-based source of time-ordered bars
class BarFeed {
public:
    virtual ~BarFeed() = default;

    // Bars with start_ms <= timestamp < end_ms, ascending
    virtual std::vector<Bar> get_bars(const std::string& symbol, Timeframe tf,
                                      int64_t start_ms, int64_t end_ms) = 0;
};
