#include "bar_poller.hpp"
#include "indicators.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

constexpr int64_t MS_PER_HOUR = 60 * util::MS_PER_MINUTE;
constexpr int ATR_PERIOD = 14;
constexpr int ADX_PERIOD = 14;
constexpr int BIAS_PERIOD = 20;
constexpr int MICRO_HISTORY_MINUTES = 30;

struct RoutedBar {
    int64_t close_ms;
    bool micro;
    Bar bar;
};

} // namespace

BarPoller::BarPoller(BarFeed& feed, SweepEngine& engine, const StrategyConfig& config,
                     const std::vector<std::string>& symbols, bool derive_primary,
                     EventSink sink)
    : feed_(feed)
    , engine_(engine)
    , config_(config)
    , symbols_(symbols)
    , derive_primary_(derive_primary)
    , sink_(std::move(sink))
{}

void BarPoller::set_news(std::vector<NewsEvent> news) {
    news_ = std::move(news);
}

void BarPoller::start(int64_t now_ms) {
    for (const auto& symbol : symbols_) {
        SymbolCursor& cursor = cursors_[symbol];
        try {
            start_symbol(symbol, cursor, now_ms);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] start failed, retrying on next poll: {}", symbol, e.what());
        }
    }
}

void BarPoller::start_symbol(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms) {
    cursor.aggregator = std::make_unique<BarAggregator>(engine_.primary_timeframe());
    refresh_context(symbol, cursor, now_ms);

    auto window = SessionWindow::for_day(symbol, now_ms, config_.session_start_minute,
                                         config_.session_end_minute);

    if (!window.is_closed_at(now_ms)) {
        // Window still open: replay the whole day as it arrives
        int64_t day_start = util::day_start_ms(now_ms);
        cursor.primary_ms = day_start - 1;
        cursor.micro_ms = day_start - 1;
        cursor.started = true;
        spdlog::info("[{}] starting before window close, replaying from {}",
                     symbol, util::format_iso8601(day_start));
        return;
    }

    std::vector<Bar> window_bars;
    if (derive_primary_) {
        BarAggregator aggregator(engine_.primary_timeframe());
        for (const auto& bar : feed_.get_bars(symbol, engine_.micro_timeframe(),
                                              window.start_ms, window.end_ms)) {
            auto done = aggregator.add_bar(bar);
            window_bars.insert(window_bars.end(), done.begin(), done.end());
        }
        if (auto last = aggregator.current_bar()) {
            window_bars.push_back(*last);
        }
    } else {
        window_bars = feed_.get_bars(symbol, engine_.primary_timeframe(),
                                     window.start_ms, window.end_ms);
    }

    spdlog::info("[{}] backfilling closed window with {} bars", symbol, window_bars.size());
    emit(engine_.backfill_window(symbol, window.end_ms, window_bars, cursor.atr_h1));

    cursor.primary_ms = window.end_ms - 1;
    cursor.micro_ms = window.end_ms - 1 - MICRO_HISTORY_MINUTES * util::MS_PER_MINUTE;
    cursor.started = true;
}

size_t BarPoller::poll(int64_t now_ms) {
    size_t routed = 0;
    for (const auto& symbol : symbols_) {
        SymbolCursor& cursor = cursors_[symbol];
        try {
            if (!cursor.started) {
                start_symbol(symbol, cursor, now_ms);
            }
            routed += poll_symbol(symbol, cursor, now_ms);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] poll failed, retrying next cycle: {}", symbol, e.what());
        }
    }
    return routed;
}

size_t BarPoller::poll_symbol(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms) {
    Timeframe primary_tf = engine_.primary_timeframe();
    Timeframe micro_tf = engine_.micro_timeframe();
    int64_t primary_ms = timeframe_minutes(primary_tf) * util::MS_PER_MINUTE;
    int64_t micro_ms = timeframe_minutes(micro_tf) * util::MS_PER_MINUTE;

    refresh_context(symbol, cursor, now_ms);

    auto micro = completed_bars(symbol, micro_tf, cursor.micro_ms, now_ms);

    std::vector<Bar> primary;
    if (derive_primary_) {
        for (const auto& bar : micro) {
            for (const auto& done : cursor.aggregator->add_bar(bar)) {
                if (done.timestamp_ms > cursor.primary_ms) {
                    primary.push_back(done);
                }
            }
        }
    } else {
        primary = completed_bars(symbol, primary_tf, cursor.primary_ms, now_ms);
    }

    std::vector<RoutedBar> ordered;
    ordered.reserve(micro.size() + primary.size());
    for (const auto& bar : micro) {
        ordered.push_back({bar.timestamp_ms + micro_ms, true, bar});
    }
    for (const auto& bar : primary) {
        ordered.push_back({bar.timestamp_ms + primary_ms, false, bar});
    }
    // By close time; a micro bar closing with a primary bar goes first
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RoutedBar& a, const RoutedBar& b) {
                         if (a.close_ms != b.close_ms) return a.close_ms < b.close_ms;
                         return a.micro && !b.micro;
                     });

    size_t routed = 0;
    MarketContext context = build_context(cursor);
    for (const auto& item : ordered) {
        emit(engine_.on_bar(symbol, item.micro ? micro_tf : primary_tf, item.bar, context));
        if (item.micro) {
            cursor.micro_ms = std::max(cursor.micro_ms, item.bar.timestamp_ms);
        } else {
            cursor.primary_ms = std::max(cursor.primary_ms, item.bar.timestamp_ms);
        }
        ++routed;
    }
    return routed;
}

std::vector<Bar> BarPoller::completed_bars(const std::string& symbol, Timeframe tf,
                                           int64_t after_ms, int64_t now_ms) {
    int64_t duration = timeframe_minutes(tf) * util::MS_PER_MINUTE;
    std::vector<Bar> bars = feed_.get_bars(symbol, tf, after_ms + 1, now_ms);
    bars.erase(std::remove_if(bars.begin(), bars.end(),
                              [&](const Bar& bar) { return bar.timestamp_ms + duration > now_ms; }),
               bars.end());
    return bars;
}

void BarPoller::refresh_context(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms) {
    int64_t hour = now_ms / MS_PER_HOUR * MS_PER_HOUR;
    if (hour == cursor.context_hour_ms) {
        return;
    }

    try {
        auto d1 = feed_.get_bars(symbol, Timeframe::D1, now_ms - 40 * util::MS_PER_DAY, now_ms);
        auto h4 = feed_.get_bars(symbol, Timeframe::H4, now_ms - 10 * util::MS_PER_DAY, now_ms);
        auto h1 = feed_.get_bars(symbol, Timeframe::H1, now_ms - 2 * util::MS_PER_DAY, now_ms);
        auto m15 = feed_.get_bars(symbol, Timeframe::M15, now_ms - util::MS_PER_DAY, now_ms);

        cursor.bias_d1 = Indicators::trend_bias(d1, BIAS_PERIOD);
        cursor.bias_h4 = Indicators::trend_bias(h4, BIAS_PERIOD);
        double atr = Indicators::atr(h1, ATR_PERIOD);
        cursor.atr_h1 = atr > 0.0 ? std::optional<double>(atr) : std::nullopt;
        double adx = Indicators::adx(m15, ADX_PERIOD);
        cursor.adx_m15 = adx > 0.0 ? std::optional<double>(adx) : std::nullopt;
        cursor.h1_band_walk = Indicators::band_walk(h1);
        cursor.context_hour_ms = hour;

        spdlog::debug("[{}] context: D1={} H4={} ATR(H1)={} ADX(M15)={} band_walk={}", symbol,
                      to_string(cursor.bias_d1), to_string(cursor.bias_h4), atr, adx,
                      cursor.h1_band_walk);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] context refresh failed, keeping previous: {}", symbol, e.what());
    }
}

MarketContext BarPoller::build_context(const SymbolCursor& cursor) const {
    MarketContext context;
    context.bias_d1 = cursor.bias_d1;
    context.bias_h4 = cursor.bias_h4;
    context.atr_h1 = cursor.atr_h1;
    context.adx_m15 = cursor.adx_m15;
    context.h1_band_walk = cursor.h1_band_walk;
    context.news = news_;
    return context;
}

void BarPoller::emit(const std::vector<TransitionEvent>& events) {
    if (!sink_) return;
    for (const auto& event : events) {
        sink_(event);
    }
}
