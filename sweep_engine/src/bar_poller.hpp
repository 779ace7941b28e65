#pragma once

#include "bar_feed.hpp"
#include "bar_aggregator.hpp"
#include "sweep_engine.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

using EventSink = std::function<void(const TransitionEvent& event)>;

// Pulls completed bars from the feed and routes them through the engine in
// close-time order. Driven by the caller's clock.
class BarPoller {
public:
    BarPoller(BarFeed& feed, SweepEngine& engine, const StrategyConfig& config,
              const std::vector<std::string>& symbols, bool derive_primary,
              EventSink sink);

    // Positions cursors; a window that already closed is backfilled in one go.
    // A symbol whose feed fails here is started again by the next poll.
    void start(int64_t now_ms);

    // Returns the number of bars routed. A feed failure skips that symbol
    // for this cycle only.
    size_t poll(int64_t now_ms);

    void set_news(std::vector<NewsEvent> news);

private:
    struct SymbolCursor {
        bool started = false;
        int64_t primary_ms = 0;
        int64_t micro_ms = 0;
        std::unique_ptr<BarAggregator> aggregator;

        int64_t context_hour_ms = -1;
        TrendBias bias_d1 = TrendBias::Unknown;
        TrendBias bias_h4 = TrendBias::Unknown;
        std::optional<double> atr_h1;
        std::optional<double> adx_m15;
        bool h1_band_walk = false;
    };

    BarFeed& feed_;
    SweepEngine& engine_;
    StrategyConfig config_;
    std::vector<std::string> symbols_;
    bool derive_primary_;
    EventSink sink_;
    std::vector<NewsEvent> news_;
    std::map<std::string, SymbolCursor> cursors_;

    void start_symbol(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms);
    size_t poll_symbol(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms);
    std::vector<Bar> completed_bars(const std::string& symbol, Timeframe tf,
                                    int64_t after_ms, int64_t now_ms);
    void refresh_context(const std::string& symbol, SymbolCursor& cursor, int64_t now_ms);
    MarketContext build_context(const SymbolCursor& cursor) const;
    void emit(const std::vector<TransitionEvent>& events);
};
