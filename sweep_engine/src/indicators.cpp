#include "indicators.hpp"
#include <algorithm>
#include <cmath>

double Indicators::atr(const std::vector<Bar>& bars, int period) {
    if (bars.size() < 2 || period < 1) {
        return 0.0;
    }

    std::vector<double> true_ranges;
    true_ranges.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        true_ranges.push_back(std::max({
            bars[i].high - bars[i].low,
            std::abs(bars[i].high - prev_close),
            std::abs(bars[i].low - prev_close)
        }));
    }

    size_t used = std::min(static_cast<size_t>(period), true_ranges.size());
    double sum = 0.0;
    for (size_t i = true_ranges.size() - used; i < true_ranges.size(); ++i) {
        sum += true_ranges[i];
    }
    return sum / used;
}

double Indicators::sma(const std::vector<double>& values, int period) {
    if (period < 1 || values.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        sum += values[i];
    }
    return sum / period;
}

TrendBias Indicators::trend_bias(const std::vector<Bar>& bars, int period, double band) {
    if (bars.size() < static_cast<size_t>(period)) {
        return TrendBias::Unknown;
    }

    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }

    double average = sma(closes, period);
    double last = closes.back();
    if (last > average * (1.0 + band)) return TrendBias::Bull;
    if (last < average * (1.0 - band)) return TrendBias::Bear;
    return TrendBias::Range;
}

double Indicators::average_range(const std::vector<Bar>& bars, size_t end_index, int count) {
    if (count < 1 || end_index > bars.size() || end_index < static_cast<size_t>(count)) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = end_index - count; i < end_index; ++i) {
        sum += bars[i].high - bars[i].low;
    }
    return sum / count;
}

bool Indicators::is_swing_high(const std::vector<Bar>& bars, size_t center, int lookback) {
    size_t lb = static_cast<size_t>(lookback);
    if (lookback < 1 || center < lb || center + lb >= bars.size()) {
        return false;
    }
    for (size_t j = center - lb; j <= center + lb; ++j) {
        if (j != center && bars[j].high >= bars[center].high) {
            return false;
        }
    }
    return true;
}

bool Indicators::is_swing_low(const std::vector<Bar>& bars, size_t center, int lookback) {
    size_t lb = static_cast<size_t>(lookback);
    if (lookback < 1 || center < lb || center + lb >= bars.size()) {
        return false;
    }
    for (size_t j = center - lb; j <= center + lb; ++j) {
        if (j != center && bars[j].low <= bars[center].low) {
            return false;
        }
    }
    return true;
}

double Indicators::adx(const std::vector<Bar>& bars, int period) {
    if (period < 1 || bars.size() < 2 * static_cast<size_t>(period)) {
        return 0.0;
    }

    std::vector<double> tr, plus_dm, minus_dm;
    for (size_t i = 1; i < bars.size(); ++i) {
        const Bar& cur = bars[i];
        const Bar& prev = bars[i - 1];
        tr.push_back(std::max({cur.high - cur.low,
                               std::abs(cur.high - prev.close),
                               std::abs(cur.low - prev.close)}));
        double up = cur.high - prev.high;
        double down = prev.low - cur.low;
        plus_dm.push_back(up > down && up > 0.0 ? up : 0.0);
        minus_dm.push_back(down > up && down > 0.0 ? down : 0.0);
    }

    size_t p = static_cast<size_t>(period);
    std::vector<double> dx;
    for (size_t end = p; end <= tr.size(); ++end) {
        double tr_sum = 0.0, plus_sum = 0.0, minus_sum = 0.0;
        for (size_t i = end - p; i < end; ++i) {
            tr_sum += tr[i];
            plus_sum += plus_dm[i];
            minus_sum += minus_dm[i];
        }
        if (tr_sum <= 0.0) {
            dx.push_back(0.0);
            continue;
        }
        double di_plus = 100.0 * plus_sum / tr_sum;
        double di_minus = 100.0 * minus_sum / tr_sum;
        double di_total = di_plus + di_minus;
        dx.push_back(di_total > 0.0 ? 100.0 * std::abs(di_plus - di_minus) / di_total : 0.0);
    }
    return sma(dx, period);
}

bool Indicators::band_walk(const std::vector<Bar>& bars, int count) {
    if (count < 2 || bars.size() < static_cast<size_t>(count)) {
        return false;
    }
    bool higher = true;
    bool lower = true;
    for (size_t i = bars.size() - count + 1; i < bars.size(); ++i) {
        higher = higher && bars[i].high > bars[i - 1].high;
        lower = lower && bars[i].low < bars[i - 1].low;
    }
    return higher || lower;
}
