#include "sweep_engine.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::optional<ExecutionReport> ExecutionReport::parse(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "execution report is not an object";
        return std::nullopt;
    }
    for (const char* field : {"symbol", "trading_day", "kind"}) {
        if (!j.contains(field) || !j[field].is_string()) {
            error = std::string("missing or non-string field: ") + field;
            return std::nullopt;
        }
    }
    if (!j.contains("ts") || !j["ts"].is_number_integer()) {
        error = "missing or non-integer field: ts";
        return std::nullopt;
    }

    auto kind = parse_event_kind(j["kind"].get<std::string>());
    if (!kind || (*kind != SessionEventKind::EntryExecuted &&
                  *kind != SessionEventKind::PositionClosed)) {
        error = "unsupported kind: " + j["kind"].get<std::string>();
        return std::nullopt;
    }

    ExecutionReport report;
    report.symbol = j["symbol"].get<std::string>();
    report.trading_day = j["trading_day"].get<std::string>();
    report.kind = *kind;
    report.timestamp_ms = j["ts"].get<int64_t>();
    report.details = j.value("details", nlohmann::json::object());
    return report;
}

SweepEngine::SweepEngine(const StrategyConfig& config, Timeframe primary, Timeframe micro,
                         std::shared_ptr<const ConfluenceChecker> confluence)
    : config_(config)
    , primary_(primary)
    , micro_(micro)
    , registry_(config, confluence ? confluence
                                   : std::shared_ptr<const ConfluenceChecker>(
                                         ConfluenceChecker::with_default_gates(config.confluence)))
{}

std::vector<TransitionEvent> SweepEngine::on_bar(const std::string& symbol, Timeframe tf,
                                                 const Bar& bar, const MarketContext& context) {
    std::vector<TransitionEvent> out;

    if (tf != primary_ && tf != micro_) {
        spdlog::debug("[{}] ignoring {} bar", symbol, to_string(tf));
        return out;
    }

    try {
        bool created = false;
        auto session = registry_.get_or_create(symbol, bar.timestamp_ms, &created);

        MarketContext ctx = context;
        roll_over(symbol, session, bar.timestamp_ms, created, ctx, out);

        std::vector<TransitionEvent> events = tf == primary_
            ? session->on_primary_bar(bar, ctx)
            : session->on_micro_bar(bar);
        out.insert(out.end(), events.begin(), events.end());
    } catch (const std::exception& e) {
        spdlog::error("[{}] session fault on {} bar at {}: {}", symbol, to_string(tf),
                      util::format_iso8601(bar.timestamp_ms), e.what());
    }

    return out;
}

void SweepEngine::roll_over(const std::string& symbol,
                            const std::shared_ptr<SessionStateMachine>& current,
                            int64_t ts_ms, bool created, MarketContext& context,
                            std::vector<TransitionEvent>& out) {
    for (const auto& session : registry_.sessions_for(symbol)) {
        if (session == current || session->trading_day() > current->trading_day()) continue;

        // Older sessions only advance their timers
        auto events = session->on_clock(ts_ms);
        out.insert(out.end(), events.begin(), events.end());

        SessionState state = session->state();
        if (created && (state == SessionState::Swept || state == SessionState::Confirmed ||
                        state == SessionState::Armed)) {
            auto result = session->reset(ts_ms, "new_session");
            if (result.applied() && result.event) {
                out.push_back(*result.event);
            }
            state = session->state();
        }

        if (state == SessionState::InTrade || state == SessionState::Cooldown) {
            context.symbol_busy = true;
        }
    }
}

TransitionResult SweepEngine::on_execution_report(const ExecutionReport& report) {
    auto session = registry_.find(report.symbol, report.trading_day);
    if (!session) {
        Rejection rejection{ErrorKind::InvalidTransition,
                            "unknown session " + report.symbol + " " + report.trading_day};
        spdlog::warn("Execution report rejected: {}", rejection.reason);
        return {TransitionOutcome::Rejected, std::nullopt, rejection};
    }

    try {
        return session->on_execution(report.kind, report.timestamp_ms, report.details);
    } catch (const std::exception& e) {
        spdlog::error("[{} {}] session fault on execution report: {}",
                      report.symbol, report.trading_day, e.what());
        return {TransitionOutcome::Rejected, std::nullopt,
                Rejection{ErrorKind::InvalidTransition, e.what()}};
    }
}

TransitionResult SweepEngine::reset_session(const std::string& symbol, const std::string& trading_day,
                                            int64_t ts_ms, const std::string& reason) {
    auto session = registry_.find(symbol, trading_day);
    if (!session) {
        return {TransitionOutcome::Rejected, std::nullopt,
                Rejection{ErrorKind::InvalidTransition, "unknown session " + symbol + " " + trading_day}};
    }
    return session->reset(ts_ms, reason);
}

std::vector<TransitionEvent> SweepEngine::backfill_window(const std::string& symbol, int64_t ts_ms,
                                                          const std::vector<Bar>& window_bars,
                                                          std::optional<double> atr_h1) {
    std::vector<TransitionEvent> out;
    try {
        auto session = registry_.get_or_create(symbol, ts_ms);
        out = session->backfill_window(window_bars, ts_ms, atr_h1);
    } catch (const std::exception& e) {
        spdlog::error("[{}] session fault on window backfill: {}", symbol, e.what());
    }
    return out;
}

std::vector<TransitionEvent> SweepEngine::on_clock(int64_t now_ms) {
    std::vector<TransitionEvent> out;
    for (const auto& session : registry_.all()) {
        try {
            auto events = session->on_clock(now_ms);
            out.insert(out.end(), events.begin(), events.end());
        } catch (const std::exception& e) {
            spdlog::error("[{} {}] session fault on clock: {}",
                          session->symbol(), session->trading_day(), e.what());
        }
    }
    return out;
}

size_t SweepEngine::evict(int64_t now_ms) {
    return registry_.evict_expired(now_ms);
}

std::vector<SessionSnapshot> SweepEngine::snapshots() const {
    std::vector<SessionSnapshot> result;
    for (const auto& session : registry_.all()) {
        result.push_back(session->snapshot());
    }
    return result;
}

nlohmann::json SweepEngine::status() const {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& snap : snapshots()) {
        sessions.push_back(snap.to_json());
    }
    return {
        {"primary_timeframe", to_string(primary_)},
        {"micro_timeframe", to_string(micro_)},
        {"session_count", sessions.size()},
        {"sessions", sessions}
    };
}
