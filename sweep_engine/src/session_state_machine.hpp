#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "range_tracker.hpp"
#include "sweep_detector.hpp"
#include "reversal_confirmer.hpp"
#include "confluence.hpp"
#include <string>
#include <vector>
#include <deque>
#include <set>
#include <mutex>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

enum class SessionEventKind {
    WindowClosed,
    SweepDetected,
    SweepInvalidated,
    ReversalConfirmed,
    ReversalExpired,
    ConfluencePassed,
    ConfluenceTimedOut,
    EntryExecuted,
    PositionClosed,
    CooldownElapsed,
    Reset
};

std::string to_string(SessionEventKind kind);
std::optional<SessionEventKind> parse_event_kind(const std::string& name);

struct TransitionRule {
    SessionState from;
    SessionEventKind event;
    SessionState to;
};

// The full set of legal edges; anything else is InvalidTransition
const std::vector<TransitionRule>& transition_table();
std::optional<SessionState> lookup_transition(SessionState from, SessionEventKind event);

struct TransitionEvent {
    std::string symbol;
    std::string trading_day;
    SessionState from_state;
    SessionState to_state;
    SessionEventKind event;
    int64_t timestamp_ms;
    nlohmann::json payload;

    nlohmann::json to_json() const;
};

enum class TransitionOutcome {
    Applied,
    Duplicate,
    Rejected
};

struct TransitionResult {
    TransitionOutcome outcome;
    std::optional<TransitionEvent> event;
    std::optional<Rejection> rejection;

    bool applied() const { return outcome == TransitionOutcome::Applied; }
};

struct TradePlan {
    std::string side; // "SELL" after an upside sweep, "BUY" after a downside sweep
    double entry;
    double stop_loss;
    double take_profit_1;
    double take_profit_2;
    double risk_reward;

    nlohmann::json to_json() const;

    static TradePlan build(const ReversalConfirmation& confirmation, double entry,
                           const StrategyConfig& config);
};

// High and low of the primary bars seen inside a time-of-day span
struct PriceSpan {
    bool seen = false;
    double high = 0.0;
    double low = 0.0;

    void add(const Bar& bar);
};

// Copy of a session's state taken under its lock
struct SessionSnapshot {
    std::string symbol;
    std::string trading_day;
    SessionState state;
    std::optional<AsianRange> range;
    std::optional<SweepEvent> sweep;
    std::optional<ReversalConfirmation> confirmation;
    std::optional<TradePlan> trade_plan;
    std::optional<ConfluenceResult> last_confluence;
    int trades_taken;
    bool sweeps_locked;
    std::optional<SweepDirection> breakout_direction;
    std::optional<int64_t> cooldown_until_ms;
    int64_t last_activity_ms;

    nlohmann::json to_json() const;
};

// Lifecycle of one (symbol, trading day). Every public method takes the
// session lock, so a session has a single writer at a time.
class SessionStateMachine {
public:
    SessionStateMachine(const std::string& symbol, int64_t ts_ms,
                        const StrategyConfig& config,
                        std::shared_ptr<const ConfluenceChecker> confluence);

    std::vector<TransitionEvent> on_primary_bar(const Bar& bar, const MarketContext& context);
    std::vector<TransitionEvent> on_micro_bar(const Bar& bar);
    std::vector<TransitionEvent> on_clock(int64_t now_ms);

    // Entry and exit reports from the execution side
    TransitionResult on_execution(SessionEventKind kind, int64_t ts_ms,
                                  const nlohmann::json& details = nlohmann::json::object());

    TransitionResult reset(int64_t ts_ms, const std::string& reason);

    // Retry for a window that closed without enough bars
    std::vector<TransitionEvent> backfill_window(const std::vector<Bar>& window_bars,
                                                 int64_t ts_ms,
                                                 std::optional<double> atr_h1 = std::nullopt);

    SessionState state() const;
    SessionSnapshot snapshot() const;
    int64_t last_activity_ms() const;

    const SessionWindow& window() const { return window_; }
    const std::string& symbol() const { return window_.symbol; }
    const std::string& trading_day() const { return window_.date; }

private:
    mutable std::mutex mutex_;
    StrategyConfig config_;
    const SessionWindow window_;
    ReversalConfirmer confirmer_;
    std::shared_ptr<const ConfluenceChecker> confluence_;

    SessionState state_;
    bool window_closed_;
    std::vector<Bar> window_bars_;
    std::optional<AsianRange> range_;
    std::optional<Rejection> range_error_;
    std::optional<SweepThreshold> threshold_;

    std::optional<SweepEvent> sweep_;
    std::optional<ReversalConfirmation> confirmation_;
    std::optional<ConfluenceResult> last_confluence_;
    std::optional<TradePlan> trade_plan_;
    std::optional<int64_t> cooldown_until_ms_;
    int trades_taken_;
    bool sweeps_locked_;
    // Side whose breakout was accepted; it cannot be swept again today
    std::optional<SweepDirection> breakout_direction_;
    // Side of the last attempt that ended without a trade
    std::optional<SweepDirection> last_sweep_direction_;

    PriceSpan london_;
    PriceSpan new_york_;

    std::deque<Bar> recent_primary_;
    std::deque<Bar> micro_history_;
    MarketContext last_context_;

    int64_t last_primary_ts_ms_;
    int64_t last_micro_ts_ms_;
    int64_t last_activity_ms_;
    std::set<std::pair<int64_t, SessionEventKind>> seen_events_;

    TransitionResult transition(SessionEventKind kind, int64_t ts_ms, nlohmann::json payload);
    std::optional<Rejection> check_guard(SessionEventKind kind) const;
    void collect(const TransitionResult& result, std::vector<TransitionEvent>& out) const;

    void close_window(int64_t ts_ms, std::optional<double> atr_h1, std::vector<TransitionEvent>& out);
    void handle_timers(int64_t now_ms, std::vector<TransitionEvent>& out);
    void handle_idle_bar(const Bar& bar, std::vector<TransitionEvent>& out);
    void handle_swept_bar(const Bar& bar, std::vector<TransitionEvent>& out);
    void open_sweep(const SweepEvent& sweep, const Bar& bar, std::vector<TransitionEvent>& out);
    void run_confirmation(const std::vector<Bar>& primary, const std::vector<Bar>& micro,
                          int64_t ts_ms, std::vector<TransitionEvent>& out);
    void run_confluence(int64_t ts_ms, std::vector<TransitionEvent>& out);
    void clear_attempt();
    void track_sessions(const Bar& bar);
};
