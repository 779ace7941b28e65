#pragma once

#include "types.hpp"
#include <vector>

class Indicators {
public:
    // Mean true range over the last `period` bars; 0.0 with fewer than 2 bars
    static double atr(const std::vector<Bar>& bars, int period);

    // Simple mean of the last `period` values; 0.0 if not enough values
    static double sma(const std::vector<double>& values, int period);

    // BULL if last close > SMA * (1 + band), BEAR if < SMA * (1 - band)
    static TrendBias trend_bias(const std::vector<Bar>& bars, int period = 20,
                                double band = 0.001);

    // Mean high-low range of `count` bars ending before `end_index`
    static double average_range(const std::vector<Bar>& bars, size_t end_index, int count);

    // Pivot with `lookback` bars on each side strictly beyond it
    static bool is_swing_high(const std::vector<Bar>& bars, size_t center, int lookback);
    static bool is_swing_low(const std::vector<Bar>& bars, size_t center, int lookback);

    // Average directional index from simple rolling means of TR and +DM/-DM;
    // 0.0 with fewer than 2 * period bars
    static double adx(const std::vector<Bar>& bars, int period = 14);

    // Last `count` bars print strictly higher highs or strictly lower lows
    static bool band_walk(const std::vector<Bar>& bars, int count = 3);
};
