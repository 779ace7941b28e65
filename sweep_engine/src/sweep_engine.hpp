#pragma once

#include "session_registry.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// {symbol, trading_day, kind: "entry_executed" | "position_closed", ts}
struct ExecutionReport {
    std::string symbol;
    std::string trading_day;
    SessionEventKind kind;
    int64_t timestamp_ms;
    nlohmann::json details;

    static std::optional<ExecutionReport> parse(const nlohmann::json& j, std::string& error);
};

// Routes bars and execution reports to the owning session. Does no I/O;
// every call returns the transitions it caused.
class SweepEngine {
public:
    SweepEngine(const StrategyConfig& config, Timeframe primary, Timeframe micro,
                std::shared_ptr<const ConfluenceChecker> confluence = nullptr);

    std::vector<TransitionEvent> on_bar(const std::string& symbol, Timeframe tf,
                                        const Bar& bar,
                                        const MarketContext& context = MarketContext{});

    TransitionResult on_execution_report(const ExecutionReport& report);

    TransitionResult reset_session(const std::string& symbol, const std::string& trading_day,
                                   int64_t ts_ms, const std::string& reason);

    std::vector<TransitionEvent> backfill_window(const std::string& symbol, int64_t ts_ms,
                                                 const std::vector<Bar>& window_bars,
                                                 std::optional<double> atr_h1 = std::nullopt);

    std::vector<TransitionEvent> on_clock(int64_t now_ms);
    size_t evict(int64_t now_ms);

    std::vector<SessionSnapshot> snapshots() const;
    nlohmann::json status() const;

    SessionRegistry& registry() { return registry_; }
    Timeframe primary_timeframe() const { return primary_; }
    Timeframe micro_timeframe() const { return micro_; }

private:
    StrategyConfig config_;
    Timeframe primary_;
    Timeframe micro_;
    SessionRegistry registry_;

    void roll_over(const std::string& symbol, const std::shared_ptr<SessionStateMachine>& current,
                   int64_t ts_ms, bool created, MarketContext& context,
                   std::vector<TransitionEvent>& out);
};
