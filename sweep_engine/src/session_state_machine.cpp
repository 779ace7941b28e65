#include "session_state_machine.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

constexpr size_t RECENT_PRIMARY_BARS = 64;
constexpr size_t MICRO_HISTORY_BARS = 120;

nlohmann::json range_json(const AsianRange& range) {
    return {
        {"high", range.high},
        {"low", range.low},
        {"midpoint", range.midpoint},
        {"bar_count", range.bar_count},
        {"is_valid", range.is_valid},
        {"range_pips", range.range_pips},
        {"grade", to_string(range.grade)},
        {"window_start", util::format_iso8601(range.window.start_ms)},
        {"window_end", util::format_iso8601(range.window.end_ms)}
    };
}

} // namespace

std::string to_string(SessionEventKind kind) {
    switch (kind) {
        case SessionEventKind::WindowClosed: return "window_closed";
        case SessionEventKind::SweepDetected: return "sweep_detected";
        case SessionEventKind::SweepInvalidated: return "sweep_invalidated";
        case SessionEventKind::ReversalConfirmed: return "reversal_confirmed";
        case SessionEventKind::ReversalExpired: return "reversal_expired";
        case SessionEventKind::ConfluencePassed: return "confluence_passed";
        case SessionEventKind::ConfluenceTimedOut: return "confluence_timed_out";
        case SessionEventKind::EntryExecuted: return "entry_executed";
        case SessionEventKind::PositionClosed: return "position_closed";
        case SessionEventKind::CooldownElapsed: return "cooldown_elapsed";
        case SessionEventKind::Reset: return "reset";
    }
    return "reset";
}

std::optional<SessionEventKind> parse_event_kind(const std::string& name) {
    static const SessionEventKind all[] = {
        SessionEventKind::WindowClosed, SessionEventKind::SweepDetected,
        SessionEventKind::SweepInvalidated, SessionEventKind::ReversalConfirmed,
        SessionEventKind::ReversalExpired, SessionEventKind::ConfluencePassed,
        SessionEventKind::ConfluenceTimedOut, SessionEventKind::EntryExecuted,
        SessionEventKind::PositionClosed, SessionEventKind::CooldownElapsed,
        SessionEventKind::Reset
    };
    for (auto kind : all) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

const std::vector<TransitionRule>& transition_table() {
    static const std::vector<TransitionRule> table = {
        {SessionState::Idle,      SessionEventKind::WindowClosed,       SessionState::Idle},
        {SessionState::Idle,      SessionEventKind::SweepDetected,      SessionState::Swept},
        {SessionState::Swept,     SessionEventKind::ReversalConfirmed,  SessionState::Confirmed},
        {SessionState::Swept,     SessionEventKind::ReversalExpired,    SessionState::Idle},
        {SessionState::Swept,     SessionEventKind::SweepInvalidated,   SessionState::Idle},
        {SessionState::Confirmed, SessionEventKind::ConfluencePassed,   SessionState::Armed},
        {SessionState::Confirmed, SessionEventKind::ConfluenceTimedOut, SessionState::Idle},
        {SessionState::Armed,     SessionEventKind::EntryExecuted,      SessionState::InTrade},
        {SessionState::InTrade,   SessionEventKind::PositionClosed,     SessionState::Cooldown},
        {SessionState::Cooldown,  SessionEventKind::CooldownElapsed,    SessionState::Idle},
        // Explicit reset from anywhere
        {SessionState::Idle,      SessionEventKind::Reset,              SessionState::Idle},
        {SessionState::Swept,     SessionEventKind::Reset,              SessionState::Idle},
        {SessionState::Confirmed, SessionEventKind::Reset,              SessionState::Idle},
        {SessionState::Armed,     SessionEventKind::Reset,              SessionState::Idle},
        {SessionState::InTrade,   SessionEventKind::Reset,              SessionState::Idle},
        {SessionState::Cooldown,  SessionEventKind::Reset,              SessionState::Idle},
    };
    return table;
}

std::optional<SessionState> lookup_transition(SessionState from, SessionEventKind event) {
    for (const auto& rule : transition_table()) {
        if (rule.from == from && rule.event == event) {
            return rule.to;
        }
    }
    return std::nullopt;
}

nlohmann::json TransitionEvent::to_json() const {
    return {
        {"symbol", symbol},
        {"trading_day", trading_day},
        {"from_state", to_string(from_state)},
        {"to_state", to_string(to_state)},
        {"event", to_string(event)},
        {"ts", timestamp_ms},
        {"time", util::format_iso8601(timestamp_ms)},
        {"payload", payload}
    };
}

nlohmann::json TradePlan::to_json() const {
    return {
        {"side", side},
        {"entry", entry},
        {"stop_loss", stop_loss},
        {"take_profit_1", take_profit_1},
        {"take_profit_2", take_profit_2},
        {"risk_reward", risk_reward}
    };
}

TradePlan TradePlan::build(const ReversalConfirmation& confirmation, double entry,
                           const StrategyConfig& config) {
    const AsianRange& range = confirmation.sweep.range_reference;
    double sl_buffer = config.pips_to_price(config.sl_buffer_pips);
    double tp2_buffer = config.pips_to_price(config.tp2_buffer_pips);

    TradePlan plan;
    plan.entry = entry;
    plan.take_profit_1 = range.midpoint;
    if (confirmation.sweep.direction == SweepDirection::Upside) {
        plan.side = "SELL";
        plan.stop_loss = confirmation.extreme_price + sl_buffer;
        plan.take_profit_2 = range.low - tp2_buffer;
    } else {
        plan.side = "BUY";
        plan.stop_loss = confirmation.extreme_price - sl_buffer;
        plan.take_profit_2 = range.high + tp2_buffer;
    }

    double risk = std::abs(entry - plan.stop_loss);
    plan.risk_reward = risk > 0.0 ? std::abs(plan.take_profit_1 - entry) / risk : 0.0;
    return plan;
}

void PriceSpan::add(const Bar& bar) {
    if (!seen) {
        seen = true;
        high = bar.high;
        low = bar.low;
        return;
    }
    high = std::max(high, bar.high);
    low = std::min(low, bar.low);
}

nlohmann::json SessionSnapshot::to_json() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"trading_day", trading_day},
        {"state", to_string(state)},
        {"trades_taken", trades_taken},
        {"sweeps_locked", sweeps_locked},
        {"last_activity", util::format_iso8601(last_activity_ms)}
    };
    if (range) j["range"] = range_json(*range);
    if (confirmation) j["confirmation"] = confirmation->to_json();
    if (trade_plan) j["trade_plan"] = trade_plan->to_json();
    if (last_confluence) j["last_confluence"] = last_confluence->to_json();
    if (cooldown_until_ms) j["cooldown_until"] = util::format_iso8601(*cooldown_until_ms);
    if (breakout_direction) j["breakout_direction"] = to_string(*breakout_direction);
    return j;
}

SessionStateMachine::SessionStateMachine(const std::string& symbol, int64_t ts_ms,
                                         const StrategyConfig& config,
                                         std::shared_ptr<const ConfluenceChecker> confluence)
    : config_(config)
    , window_(SessionWindow::for_day(symbol, ts_ms, config.session_start_minute,
                                     config.session_end_minute))
    , confirmer_(config)
    , confluence_(std::move(confluence))
    , state_(SessionState::Idle)
    , window_closed_(false)
    , trades_taken_(0)
    , sweeps_locked_(false)
    , last_primary_ts_ms_(std::numeric_limits<int64_t>::min())
    , last_micro_ts_ms_(std::numeric_limits<int64_t>::min())
    , last_activity_ms_(ts_ms)
{}

std::vector<TransitionEvent> SessionStateMachine::on_primary_bar(const Bar& bar,
                                                                 const MarketContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEvent> out;

    if (bar.timestamp_ms <= last_primary_ts_ms_) {
        spdlog::debug("[{} {}] stale primary bar at {} ignored", window_.symbol, window_.date,
                      util::format_iso8601(bar.timestamp_ms));
        return out;
    }
    last_primary_ts_ms_ = bar.timestamp_ms;
    last_activity_ms_ = bar.timestamp_ms;

    if (bar.timestamp_ms < window_.start_ms) {
        return out;
    }
    if (window_.contains(bar.timestamp_ms)) {
        window_bars_.push_back(bar);
        return out;
    }

    recent_primary_.push_back(bar);
    if (recent_primary_.size() > RECENT_PRIMARY_BARS) {
        recent_primary_.pop_front();
    }
    track_sessions(bar);

    last_context_ = context;
    last_context_.timestamp_ms = bar.timestamp_ms;
    last_context_.recent_bars.assign(recent_primary_.begin(), recent_primary_.end());
    if (!last_context_.spread_pips && bar.spread_pips > 0.0) {
        last_context_.spread_pips = bar.spread_pips;
    }

    if (!window_closed_) {
        close_window(bar.timestamp_ms, context.atr_h1, out);
    }

    handle_timers(bar.timestamp_ms, out);

    switch (state_) {
        case SessionState::Idle:
            handle_idle_bar(bar, out);
            break;
        case SessionState::Swept:
            handle_swept_bar(bar, out);
            break;
        case SessionState::Confirmed:
            // A fresh bar re-runs a failed confluence check
            run_confluence(bar.timestamp_ms, out);
            break;
        case SessionState::Armed:
        case SessionState::InTrade:
        case SessionState::Cooldown:
            break;
    }

    return out;
}

std::vector<TransitionEvent> SessionStateMachine::on_micro_bar(const Bar& bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEvent> out;

    if (bar.timestamp_ms <= last_micro_ts_ms_) {
        spdlog::debug("[{} {}] stale micro bar at {} ignored", window_.symbol, window_.date,
                      util::format_iso8601(bar.timestamp_ms));
        return out;
    }
    last_micro_ts_ms_ = bar.timestamp_ms;
    last_activity_ms_ = std::max(last_activity_ms_, bar.timestamp_ms);

    micro_history_.push_back(bar);
    if (micro_history_.size() > MICRO_HISTORY_BARS) {
        micro_history_.pop_front();
    }

    handle_timers(bar.timestamp_ms, out);

    if (state_ == SessionState::Swept && confirmation_) {
        run_confirmation({}, {bar}, bar.timestamp_ms, out);
    }
    return out;
}

std::vector<TransitionEvent> SessionStateMachine::on_clock(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEvent> out;
    handle_timers(now_ms, out);
    return out;
}

TransitionResult SessionStateMachine::on_execution(SessionEventKind kind, int64_t ts_ms,
                                                   const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (kind != SessionEventKind::EntryExecuted && kind != SessionEventKind::PositionClosed) {
        TransitionResult result{TransitionOutcome::Rejected, std::nullopt,
                                Rejection{ErrorKind::InvalidTransition,
                                          "not an execution event: " + to_string(kind)}};
        return result;
    }

    nlohmann::json payload = details.is_object() ? details : nlohmann::json::object();
    if (kind == SessionEventKind::PositionClosed) {
        payload["cooldown_until"] = util::format_iso8601(
            ts_ms + config_.cooldown_minutes * util::MS_PER_MINUTE);
    }

    auto result = transition(kind, ts_ms, payload);
    if (!result.applied()) {
        return result;
    }

    last_activity_ms_ = std::max(last_activity_ms_, ts_ms);
    if (kind == SessionEventKind::EntryExecuted) {
        ++trades_taken_;
    } else {
        cooldown_until_ms_ = ts_ms + config_.cooldown_minutes * util::MS_PER_MINUTE;
        last_sweep_direction_.reset();
        clear_attempt();
    }
    return result;
}

TransitionResult SessionStateMachine::reset(int64_t ts_ms, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = transition(SessionEventKind::Reset, ts_ms, {{"reason", reason}});
    if (result.applied()) {
        clear_attempt();
        cooldown_until_ms_.reset();
    }
    return result;
}

std::vector<TransitionEvent> SessionStateMachine::backfill_window(const std::vector<Bar>& window_bars,
                                                                  int64_t ts_ms,
                                                                  std::optional<double> atr_h1) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEvent> out;

    if (range_) {
        spdlog::debug("[{} {}] range already attached, backfill ignored",
                      window_.symbol, window_.date);
        return out;
    }

    window_bars_.clear();
    for (const auto& bar : window_bars) {
        if (window_.contains(bar.timestamp_ms)) {
            window_bars_.push_back(bar);
        }
    }
    close_window(ts_ms, atr_h1, out);
    return out;
}

SessionState SessionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int64_t SessionStateMachine::last_activity_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_ms_;
}

SessionSnapshot SessionStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionSnapshot snap;
    snap.symbol = window_.symbol;
    snap.trading_day = window_.date;
    snap.state = state_;
    snap.range = range_;
    snap.sweep = sweep_;
    snap.confirmation = confirmation_;
    snap.trade_plan = trade_plan_;
    snap.last_confluence = last_confluence_;
    snap.trades_taken = trades_taken_;
    snap.sweeps_locked = sweeps_locked_;
    snap.breakout_direction = breakout_direction_;
    snap.cooldown_until_ms = cooldown_until_ms_;
    snap.last_activity_ms = last_activity_ms_;
    return snap;
}

TransitionResult SessionStateMachine::transition(SessionEventKind kind, int64_t ts_ms,
                                                 nlohmann::json payload) {
    auto key = std::make_pair(ts_ms, kind);
    if (seen_events_.count(key)) {
        spdlog::debug("[{} {}] duplicate {} at {} ignored", window_.symbol, window_.date,
                      to_string(kind), util::format_iso8601(ts_ms));
        return {TransitionOutcome::Duplicate, std::nullopt, std::nullopt};
    }

    auto target = lookup_transition(state_, kind);
    if (!target) {
        Rejection rejection{ErrorKind::InvalidTransition,
                            fmt::format("no transition from {} on {}", to_string(state_), to_string(kind))};
        spdlog::warn("[{} {}] {}", window_.symbol, window_.date, rejection.reason);
        return {TransitionOutcome::Rejected, std::nullopt, rejection};
    }

    if (auto rejection = check_guard(kind)) {
        spdlog::warn("[{} {}] {} rejected: {}", window_.symbol, window_.date,
                     to_string(kind), rejection->reason);
        return {TransitionOutcome::Rejected, std::nullopt, rejection};
    }

    seen_events_.insert(key);

    TransitionEvent event;
    event.symbol = window_.symbol;
    event.trading_day = window_.date;
    event.from_state = state_;
    event.to_state = *target;
    event.event = kind;
    event.timestamp_ms = ts_ms;
    event.payload = std::move(payload);

    state_ = *target;

    spdlog::info("[{} {}] {} -> {} ({}) at {}", window_.symbol, window_.date,
                 to_string(event.from_state), to_string(event.to_state),
                 to_string(kind), util::format_iso8601(ts_ms));

    return {TransitionOutcome::Applied, event, std::nullopt};
}

std::optional<Rejection> SessionStateMachine::check_guard(SessionEventKind kind) const {
    switch (kind) {
        case SessionEventKind::WindowClosed:
            if (range_) {
                return Rejection{ErrorKind::InvalidTransition, "range already attached"};
            }
            break;
        case SessionEventKind::SweepDetected:
            if (!range_) {
                return Rejection{ErrorKind::InvalidTransition, "no range attached"};
            }
            if (!range_->is_valid) {
                return Rejection{ErrorKind::InvalidTransition, "range is not valid"};
            }
            if (sweeps_locked_) {
                return Rejection{ErrorKind::InvalidTransition, "both sides swept, session locked"};
            }
            if (trades_taken_ >= config_.max_trades_per_session) {
                return Rejection{ErrorKind::InvalidTransition,
                                 fmt::format("trade limit reached ({})", config_.max_trades_per_session)};
            }
            if (last_context_.symbol_busy) {
                return Rejection{ErrorKind::InvalidTransition, "symbol busy in another session"};
            }
            break;
        default:
            break;
    }
    return std::nullopt;
}

void SessionStateMachine::collect(const TransitionResult& result,
                                  std::vector<TransitionEvent>& out) const {
    if (result.applied() && result.event) {
        out.push_back(*result.event);
    }
}

void SessionStateMachine::close_window(int64_t ts_ms, std::optional<double> atr_h1,
                                       std::vector<TransitionEvent>& out) {
    window_closed_ = true;

    auto result = RangeTracker::compute_range(window_bars_, window_, config_);
    if (!result.ok()) {
        range_error_ = result.error;
        spdlog::warn("[{} {}] range unavailable: {}", window_.symbol, window_.date,
                     result.error ? result.error->reason : "unknown");
        return;
    }

    auto threshold = SweepDetector::resolve_threshold(*result.range, config_, atr_h1);

    nlohmann::json payload = range_json(*result.range);
    payload["threshold"] = threshold.price;
    payload["threshold_pips"] = threshold.pips;
    payload["threshold_source"] = threshold.source;

    // The range is attached only if the edge is taken
    auto applied = transition(SessionEventKind::WindowClosed, ts_ms, payload);
    if (!applied.applied()) {
        return;
    }
    range_ = result.range;
    range_error_.reset();
    threshold_ = threshold;
    window_bars_.clear();
    window_bars_.shrink_to_fit();
    collect(applied, out);

    if (!range_->is_valid) {
        spdlog::warn("[{} {}] degenerate range high={} low={}, sweeps disabled",
                     window_.symbol, window_.date, range_->high, range_->low);
    }
}

void SessionStateMachine::handle_timers(int64_t now_ms, std::vector<TransitionEvent>& out) {
    if (state_ == SessionState::Cooldown && cooldown_until_ms_ && now_ms >= *cooldown_until_ms_) {
        auto result = transition(SessionEventKind::CooldownElapsed, now_ms,
                                 {{"trades_taken", trades_taken_}});
        if (result.applied()) {
            cooldown_until_ms_.reset();
            trade_plan_.reset();
        }
        collect(result, out);
        return;
    }

    if (state_ == SessionState::Confirmed && confirmation_ && confirmation_->confirmed_at_ms) {
        int64_t waited = now_ms - *confirmation_->confirmed_at_ms;
        if (waited > config_.confluence_max_wait_minutes * util::MS_PER_MINUTE) {
            nlohmann::json payload = {{"waited_minutes", waited / util::MS_PER_MINUTE}};
            if (last_confluence_) {
                payload["last_confluence"] = last_confluence_->to_json();
            }
            auto result = transition(SessionEventKind::ConfluenceTimedOut, now_ms, payload);
            if (result.applied()) {
                last_sweep_direction_ = confirmation_->sweep.direction;
                clear_attempt();
            }
            collect(result, out);
        }
    }
}

void SessionStateMachine::handle_idle_bar(const Bar& bar, std::vector<TransitionEvent>& out) {
    if (!range_ || !threshold_) {
        return;
    }

    auto detection = SweepDetector::detect_sweep(*range_, bar, threshold_->price, config_.tie_break);
    if (detection.error) {
        spdlog::warn("[{} {}] {}: {}", window_.symbol, window_.date,
                     to_string(detection.error->kind), detection.error->reason);
        return;
    }
    if (!detection.event) {
        return;
    }

    SweepDirection direction = detection.event->direction;
    if (breakout_direction_ && direction == *breakout_direction_) {
        spdlog::debug("[{} {}] {} breakout already accepted, no new sweep", window_.symbol,
                      window_.date, to_string(direction));
        return;
    }
    if (last_sweep_direction_ && direction == opposite(*last_sweep_direction_) &&
        config_.opposite_sweep_policy == OppositeSweepPolicy::Abandon) {
        sweeps_locked_ = true;
        spdlog::info("[{} {}] {} sweep after a failed {} attempt, session locked",
                     window_.symbol, window_.date, to_string(direction),
                     to_string(*last_sweep_direction_));
        return;
    }
    open_sweep(*detection.event, bar, out);
}

void SessionStateMachine::handle_swept_bar(const Bar& bar, std::vector<TransitionEvent>& out) {
    auto detection = SweepDetector::detect_sweep(*range_, bar, threshold_->price, config_.tie_break);

    if (detection.event && detection.event->direction != sweep_->direction) {
        nlohmann::json payload = {
            {"reason", "opposite_sweep"},
            {"policy", to_string(config_.opposite_sweep_policy)},
            {"active_direction", to_string(sweep_->direction)},
            {"new_direction", to_string(detection.event->direction)},
            {"breach_price", detection.event->breach_price}
        };
        auto result = transition(SessionEventKind::SweepInvalidated, bar.timestamp_ms, payload);
        if (!result.applied()) {
            return;
        }
        clear_attempt();
        collect(result, out);

        if (config_.opposite_sweep_policy == OppositeSweepPolicy::Abandon) {
            sweeps_locked_ = true;
        } else {
            open_sweep(*detection.event, bar, out);
        }
        return;
    }

    run_confirmation({bar}, {}, bar.timestamp_ms, out);
}

void SessionStateMachine::open_sweep(const SweepEvent& sweep, const Bar& bar,
                                     std::vector<TransitionEvent>& out) {
    nlohmann::json payload = {
        {"direction", to_string(sweep.direction)},
        {"breach_price", sweep.breach_price},
        {"breach_time", util::format_iso8601(sweep.breach_time_ms)},
        {"threshold", sweep.threshold_used},
        {"threshold_source", threshold_ ? threshold_->source : "fixed"},
        {"range_high", sweep.range_reference.high},
        {"range_low", sweep.range_reference.low}
    };

    auto result = transition(SessionEventKind::SweepDetected, bar.timestamp_ms, payload);
    if (!result.applied()) {
        return;
    }
    collect(result, out);

    sweep_ = sweep;
    std::vector<Bar> history(micro_history_.begin(), micro_history_.end());
    confirmation_ = confirmer_.begin(sweep, history);
    last_confluence_.reset();

    run_confirmation({bar}, {}, bar.timestamp_ms, out);
}

void SessionStateMachine::run_confirmation(const std::vector<Bar>& primary,
                                           const std::vector<Bar>& micro,
                                           int64_t ts_ms,
                                           std::vector<TransitionEvent>& out) {
    auto status = confirmer_.evaluate(*confirmation_, primary, micro);

    if (status == ReversalStatus::Confirmed) {
        int64_t confirmed_at = confirmation_->confirmed_at_ms.value_or(ts_ms);
        auto result = transition(SessionEventKind::ReversalConfirmed, confirmed_at,
                                 confirmation_->to_json());
        collect(result, out);
        if (result.applied()) {
            run_confluence(confirmed_at, out);
        }
    } else if (status == ReversalStatus::Expired) {
        auto result = transition(SessionEventKind::ReversalExpired, ts_ms,
                                 confirmation_->to_json());
        if (result.applied()) {
            last_sweep_direction_ = confirmation_->sweep.direction;
            if (confirmation_->expiry_reason == "acceptance_outside") {
                breakout_direction_ = confirmation_->sweep.direction;
            }
            clear_attempt();
        }
        collect(result, out);
    }
}

void SessionStateMachine::run_confluence(int64_t ts_ms, std::vector<TransitionEvent>& out) {
    if (!confirmation_ || !confluence_) {
        return;
    }

    MarketContext context = last_context_;
    context.timestamp_ms = ts_ms;
    if (range_ && threshold_) {
        context.london_traversed_asia = london_.seen && london_.high >= range_->high &&
                                        london_.low <= range_->low;
        context.ny_fresh_sweep = new_york_.seen &&
            (new_york_.high > range_->high + threshold_->price ||
             new_york_.low < range_->low - threshold_->price);
    }

    auto check = confluence_->check(*confirmation_, context);
    last_confluence_ = check;
    if (!check.passed) {
        spdlog::info("[{} {}] confluence blocked: {}", window_.symbol, window_.date,
                     fmt::join(check.failure_reasons, "; "));
        return;
    }

    double entry = recent_primary_.empty() ? confirmation_->reentry_close
                                           : recent_primary_.back().close;
    auto plan = TradePlan::build(*confirmation_, entry, config_);

    nlohmann::json payload = {
        {"direction", to_string(confirmation_->sweep.direction)},
        {"confluence", check.to_json()},
        {"trade_plan", plan.to_json()}
    };
    auto result = transition(SessionEventKind::ConfluencePassed, ts_ms, payload);
    if (result.applied()) {
        trade_plan_ = plan;
    }
    collect(result, out);
}

void SessionStateMachine::clear_attempt() {
    sweep_.reset();
    confirmation_.reset();
    last_confluence_.reset();
}

void SessionStateMachine::track_sessions(const Bar& bar) {
    int minute = static_cast<int>((bar.timestamp_ms - util::day_start_ms(bar.timestamp_ms)) /
                                  util::MS_PER_MINUTE);
    const auto& settings = config_.confluence;
    if (minute >= settings.london_start_minute && minute < settings.london_end_minute) {
        london_.add(bar);
    }
    if (minute >= settings.ny_start_minute) {
        new_york_.add(bar);
    }
}
