#include <catch2/catch_test_macros.hpp>
#include "../src/bar_poller.hpp"
#include "test_bars.hpp"
#include <map>
#include <stdexcept>

using namespace testbars;

namespace {

class FakeFeed : public BarFeed {
public:
    std::map<std::pair<std::string, Timeframe>, std::vector<Bar>> series;
    bool fail_context = false;
    std::string failing_symbol;

    std::vector<Bar> get_bars(const std::string& symbol, Timeframe tf,
                              int64_t start_ms, int64_t end_ms) override {
        if (symbol == failing_symbol) {
            throw std::runtime_error("feed unavailable for " + symbol);
        }
        if (fail_context && (tf == Timeframe::D1 || tf == Timeframe::H4 || tf == Timeframe::H1)) {
            throw std::runtime_error("context query failed");
        }
        std::vector<Bar> result;
        for (const auto& b : series[{symbol, tf}]) {
            if (b.timestamp_ms >= start_ms && b.timestamp_ms < end_ms) {
                result.push_back(b);
            }
        }
        return result;
    }

    void add(Timeframe tf, const Bar& b) {
        series[{"XAUUSD", tf}].push_back(b);
    }
};

void load_session(FakeFeed& feed) {
    for (const auto& b : asian_window()) {
        feed.add(Timeframe::M5, b);
    }
    for (const auto& b : micro_before_upside_break()) {
        feed.add(Timeframe::M1, b);
    }
    feed.add(Timeframe::M5, upside_sweep_bar());
    feed.add(Timeframe::M1, micro_break_bar());
    feed.add(Timeframe::M5, reversal_bar());
}

std::vector<SessionEventKind> kinds(const std::vector<TransitionEvent>& events) {
    std::vector<SessionEventKind> result;
    for (const auto& e : events) {
        result.push_back(e.event);
    }
    return result;
}

} // namespace

TEST_CASE("Bar poller", "[poller]") {
    StrategyConfig config;
    SweepEngine engine(config, Timeframe::M5, Timeframe::M1);
    FakeFeed feed;
    load_session(feed);

    std::vector<TransitionEvent> published;
    BarPoller poller(feed, engine, config, {"XAUUSD"}, false,
                     [&published](const TransitionEvent& e) { published.push_back(e); });

    SECTION("Starting after the window backfills it") {
        poller.start(at(6, 2));
        REQUIRE(kinds(published) == std::vector<SessionEventKind>{SessionEventKind::WindowClosed});
        REQUIRE(published[0].timestamp_ms == at(6, 0));

        REQUIRE(poller.poll(at(6, 16)) == 8);
        REQUIRE(kinds(published) == std::vector<SessionEventKind>{
            SessionEventKind::WindowClosed,
            SessionEventKind::SweepDetected,
            SessionEventKind::ReversalConfirmed,
            SessionEventKind::ConfluencePassed});

        REQUIRE(poller.poll(at(6, 16)) == 0);
    }

    SECTION("Starting inside the window replays the day") {
        poller.start(at(3, 0));
        REQUIRE(published.empty());

        REQUIRE(poller.poll(at(6, 16)) == 80);
        REQUIRE(kinds(published).front() == SessionEventKind::WindowClosed);
        REQUIRE(published.front().timestamp_ms == at(6, 5));
        REQUIRE(engine.registry().find("XAUUSD", "2024-01-15")->state() == SessionState::Armed);
    }

    SECTION("Bars still forming are not routed") {
        poller.start(at(6, 2));
        REQUIRE(poller.poll(at(6, 12)) == 7);
        REQUIRE(kinds(published).back() == SessionEventKind::SweepDetected);
    }

    SECTION("Context failure keeps polling") {
        feed.fail_context = true;
        poller.start(at(6, 2));
        REQUIRE(poller.poll(at(6, 16)) == 8);
        REQUIRE(engine.registry().find("XAUUSD", "2024-01-15")->state() == SessionState::Armed);
    }

    SECTION("Trend day context blocks the fade") {
        constexpr int64_t MS_PER_HOUR = 60 * util::MS_PER_MINUTE;
        for (int i = 0; i < 21; ++i) {
            double close = 1900.0 + i * 5;
            feed.add(Timeframe::H4, bar(at(0, 0) - (21 - i) * 4 * MS_PER_HOUR,
                                        close, close + 2.0, close - 2.0, close));
        }
        for (int i = 0; i < 28; ++i) {
            double base = 1970.0 + i;
            feed.add(Timeframe::M15, bar(at(6, 0) - (28 - i) * 15 * util::MS_PER_MINUTE,
                                         base, base + 1.0, base - 1.0, base + 0.5));
        }
        for (int i = 0; i < 3; ++i) {
            double base = 1995.0 + i;
            feed.add(Timeframe::H1, bar(at(6, 0) - (3 - i) * MS_PER_HOUR,
                                        base, base + 1.0, base - 1.0, base + 0.5));
        }

        poller.start(at(6, 2));
        REQUIRE(poller.poll(at(6, 16)) == 8);
        REQUIRE(kinds(published).back() == SessionEventKind::ReversalConfirmed);

        auto snap = engine.registry().find("XAUUSD", "2024-01-15")->snapshot();
        REQUIRE(snap.state == SessionState::Confirmed);
        REQUIRE(snap.last_confluence->failure_reasons.size() == 1);
        REQUIRE(snap.last_confluence->failure_reasons[0].rfind("trend_day: ", 0) == 0);
    }
}

TEST_CASE("A failing symbol does not stall the others", "[poller]") {
    StrategyConfig config;
    SweepEngine engine(config, Timeframe::M5, Timeframe::M1);
    FakeFeed feed;
    load_session(feed);
    feed.failing_symbol = "XAGUSD";

    std::vector<TransitionEvent> published;
    BarPoller poller(feed, engine, config, {"XAGUSD", "XAUUSD"}, false,
                     [&published](const TransitionEvent& e) { published.push_back(e); });

    REQUIRE_NOTHROW(poller.start(at(6, 2)));
    REQUIRE(kinds(published) == std::vector<SessionEventKind>{SessionEventKind::WindowClosed});
    REQUIRE(published[0].symbol == "XAUUSD");

    REQUIRE(poller.poll(at(6, 16)) == 8);
    REQUIRE(engine.registry().find("XAUUSD", "2024-01-15")->state() == SessionState::Armed);
    REQUIRE(engine.registry().find("XAGUSD", "2024-01-15") == nullptr);

    // The feed recovers and the skipped symbol starts on the next cycle
    feed.failing_symbol.clear();
    REQUIRE(poller.poll(at(6, 20)) == 0);
    REQUIRE(engine.registry().find("XAGUSD", "2024-01-15") != nullptr);
}

TEST_CASE("Bar poller derives primary bars from micro", "[poller]") {
    StrategyConfig config;
    SweepEngine engine(config, Timeframe::M5, Timeframe::M1);
    FakeFeed feed;

    // One M1 bar per minute for 00:00-06:15, ranging 1990-2000 in the window
    for (int minute = 0; minute < 6 * 60 + 15; ++minute) {
        int64_t ts = at(0, 0) + minute * util::MS_PER_MINUTE;
        double high = minute == 30 ? 2000.0 : 1998.0;
        double low = minute == 200 ? 1990.0 : 1992.0;
        double close = 1995.0;
        if (minute >= 6 * 60) {
            high = minute == 6 * 60 + 6 ? 2000.6 : 1999.0;
            low = 1998.0;
            close = 1998.5;
        }
        feed.add(Timeframe::M1, bar(ts, close, high, low, close));
    }

    std::vector<TransitionEvent> published;
    BarPoller poller(feed, engine, config, {"XAUUSD"}, true,
                     [&published](const TransitionEvent& e) { published.push_back(e); });

    poller.start(at(6, 1));
    REQUIRE(kinds(published) == std::vector<SessionEventKind>{SessionEventKind::WindowClosed});
    REQUIRE(published[0].payload["bar_count"] == 72);
    REQUIRE(published[0].payload["high"] == 2000.0);
    REQUIRE(published[0].payload["low"] == 1990.0);

    poller.poll(at(6, 12));
    REQUIRE(kinds(published).back() == SessionEventKind::SweepDetected);
    REQUIRE(published.back().payload["breach_price"] == 2000.6);
}
