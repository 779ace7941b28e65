#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <sstream>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

std::string to_string(ThresholdMode mode) {
    return mode == ThresholdMode::Fixed ? "fixed" : "dynamic";
}

std::string to_string(TieBreakPolicy policy) {
    switch (policy) {
        case TieBreakPolicy::None: return "none";
        case TieBreakPolicy::MidpointClose: return "midpoint_close";
        case TieBreakPolicy::LargerExcursion: return "larger_excursion";
        case TieBreakPolicy::Reject: return "reject";
    }
    return "none";
}

std::string to_string(OppositeSweepPolicy policy) {
    return policy == OppositeSweepPolicy::Abandon ? "abandon" : "supersede";
}

std::optional<ThresholdMode> parse_threshold_mode(const std::string& name) {
    if (name == "fixed") return ThresholdMode::Fixed;
    if (name == "dynamic") return ThresholdMode::Dynamic;
    return std::nullopt;
}

std::optional<TieBreakPolicy> parse_tie_break(const std::string& name) {
    if (name == "none") return TieBreakPolicy::None;
    if (name == "midpoint_close") return TieBreakPolicy::MidpointClose;
    if (name == "larger_excursion") return TieBreakPolicy::LargerExcursion;
    if (name == "reject") return TieBreakPolicy::Reject;
    return std::nullopt;
}

std::optional<OppositeSweepPolicy> parse_opposite_sweep_policy(const std::string& name) {
    if (name == "abandon") return OppositeSweepPolicy::Abandon;
    if (name == "supersede") return OppositeSweepPolicy::Supersede;
    return std::nullopt;
}

void StrategyConfig::validate() const {
    if (session_start_minute < 0 || session_end_minute > 24 * 60 ||
        session_start_minute >= session_end_minute) {
        throw ConfigurationError(fmt::format(
            "Invalid session window: start={} end={} (minutes UTC)",
            session_start_minute, session_end_minute));
    }
    if (pip_size <= 0.0) {
        throw ConfigurationError("PIP_SIZE must be positive");
    }
    if (threshold_mode == ThresholdMode::Fixed && sweep_threshold_pips <= 0.0) {
        throw ConfigurationError("SWEEP_THRESHOLD_PIPS must be positive");
    }
    if (threshold_mode == ThresholdMode::Dynamic &&
        (threshold_floor_pips <= 0.0 || threshold_range_pct < 0.0)) {
        throw ConfigurationError("Dynamic threshold needs a positive floor and non-negative range pct");
    }
    if (min_bars_for_range < 1) {
        throw ConfigurationError("MIN_BARS_FOR_RANGE must be at least 1");
    }
    if (reversal_lookahead_bars < 0 || reversal_lookahead_minutes < 0 ||
        (reversal_lookahead_bars == 0 && reversal_lookahead_minutes == 0)) {
        throw ConfigurationError("Reversal lookahead needs a bar or minute budget");
    }
    if (displacement_min_fraction < 0.0 || displacement_max_bars < 0) {
        throw ConfigurationError("Displacement settings must be non-negative");
    }
    if (swing_lookback < 1) {
        throw ConfigurationError("SWING_LOOKBACK must be at least 1");
    }
    if (acceptance_outside_closes < 0 || confluence_max_wait_minutes < 0 ||
        cooldown_minutes < 0 || session_retention_hours < 0) {
        throw ConfigurationError("Durations and counts must be non-negative");
    }
    if (max_trades_per_session < 1) {
        throw ConfigurationError("MAX_TRADES_PER_SESSION must be at least 1");
    }
    if (grading.no_trade_below_pips > grading.tight_max_pips ||
        grading.tight_max_pips > grading.normal_max_pips ||
        grading.normal_max_pips > grading.wide_max_pips) {
        throw ConfigurationError("Range grade thresholds must be ascending");
    }
    for (int t : confluence.auction_times) {
        if (t < 0 || t >= 24 * 60) {
            throw ConfigurationError(fmt::format("Invalid auction time: {} minutes", t));
        }
    }
    if (confluence.adx_trend_threshold <= 0.0) {
        throw ConfigurationError("ADX_15M_HIGH_THRESHOLD must be positive");
    }
    if (confluence.london_start_minute < 0 || confluence.london_end_minute > 24 * 60 ||
        confluence.london_start_minute >= confluence.london_end_minute ||
        confluence.ny_start_minute < 0 || confluence.ny_start_minute >= 24 * 60) {
        throw ConfigurationError(fmt::format(
            "Invalid London/NY sessions: london={}-{} ny_start={} (minutes UTC)",
            confluence.london_start_minute, confluence.london_end_minute, confluence.ny_start_minute));
    }
    for (const auto& holiday : confluence.holidays) {
        if (holiday.first < 1 || holiday.first > 12 || holiday.second < 1 || holiday.second > 31) {
            throw ConfigurationError(fmt::format("Invalid holiday: {}-{}", holiday.first, holiday.second));
        }
    }
}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

int Config::get_env_minutes(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    auto minutes = util::parse_hhmm(val);
    if (!minutes) {
        throw ConfigurationError(fmt::format("{} must be HH:MM, got '{}'", name, val));
    }
    return *minutes;
}

Config Config::from_env() {
    Config cfg;
    StrategyConfig& s = cfg.strategy;

    // Session and detection
    s.session_start_minute = get_env_minutes("SESSION_START_UTC", s.session_start_minute);
    s.session_end_minute = get_env_minutes("SESSION_END_UTC", s.session_end_minute);
    s.pip_size = get_env_double("PIP_SIZE", s.pip_size);

    auto mode_name = get_env("SWEEP_THRESHOLD_MODE", to_string(s.threshold_mode));
    auto mode = parse_threshold_mode(mode_name);
    if (!mode) {
        throw ConfigurationError("Unknown SWEEP_THRESHOLD_MODE: " + mode_name);
    }
    s.threshold_mode = *mode;
    s.sweep_threshold_pips = get_env_double("SWEEP_THRESHOLD_PIPS", s.sweep_threshold_pips);
    s.threshold_floor_pips = get_env_double("SWEEP_THRESHOLD_FLOOR_PIPS", s.threshold_floor_pips);
    s.threshold_range_pct = get_env_double("SWEEP_THRESHOLD_RANGE_PCT", s.threshold_range_pct);

    auto tie_name = get_env("SWEEP_TIE_BREAK", to_string(s.tie_break));
    auto tie = parse_tie_break(tie_name);
    if (!tie) {
        throw ConfigurationError("Unknown SWEEP_TIE_BREAK: " + tie_name);
    }
    s.tie_break = *tie;

    auto policy_name = get_env("OPPOSITE_SWEEP_POLICY", to_string(s.opposite_sweep_policy));
    auto policy = parse_opposite_sweep_policy(policy_name);
    if (!policy) {
        throw ConfigurationError("Unknown OPPOSITE_SWEEP_POLICY: " + policy_name);
    }
    s.opposite_sweep_policy = *policy;

    s.min_bars_for_range = get_env_int("MIN_BARS_FOR_RANGE", s.min_bars_for_range);
    s.reversal_lookahead_bars = get_env_int("REVERSAL_LOOKAHEAD_BARS", s.reversal_lookahead_bars);
    s.reversal_lookahead_minutes = get_env_int("REVERSAL_LOOKAHEAD_MINUTES", s.reversal_lookahead_minutes);
    s.displacement_min_fraction = get_env_double("DISPLACEMENT_MIN_FRACTION", s.displacement_min_fraction);
    s.displacement_max_bars = get_env_int("DISPLACEMENT_MAX_BARS", s.displacement_max_bars);
    s.swing_lookback = get_env_int("SWING_LOOKBACK", s.swing_lookback);
    s.acceptance_outside_closes = get_env_int("ACCEPTANCE_OUTSIDE_CLOSES", s.acceptance_outside_closes);

    // Lifecycle
    s.confluence_max_wait_minutes = get_env_int("CONFLUENCE_MAX_WAIT_MINUTES", s.confluence_max_wait_minutes);
    s.cooldown_minutes = get_env_int("COOLDOWN_MINUTES", s.cooldown_minutes);
    s.max_trades_per_session = get_env_int("MAX_TRADES_PER_SESSION", s.max_trades_per_session);
    s.session_retention_hours = get_env_int("SESSION_RETENTION_HOURS", s.session_retention_hours);
    s.sl_buffer_pips = get_env_double("SL_BUFFER_PIPS", s.sl_buffer_pips);
    s.tp2_buffer_pips = get_env_double("TP2_BUFFER_PIPS", s.tp2_buffer_pips);

    // Range grading
    s.grading.no_trade_below_pips = get_env_double("GRADE_NO_TRADE_BELOW_PIPS", s.grading.no_trade_below_pips);
    s.grading.tight_max_pips = get_env_double("GRADE_TIGHT_MAX_PIPS", s.grading.tight_max_pips);
    s.grading.normal_max_pips = get_env_double("GRADE_NORMAL_MAX_PIPS", s.grading.normal_max_pips);
    s.grading.wide_max_pips = get_env_double("GRADE_WIDE_MAX_PIPS", s.grading.wide_max_pips);

    // Confluence gates
    ConfluenceSettings& c = s.confluence;
    c.max_spread_pips = get_env_double("MAX_SPREAD_PIPS", c.max_spread_pips);
    c.tier1_news_buffer_minutes = get_env_int("NEWS_TIER1_BUFFER_MINUTES", c.tier1_news_buffer_minutes);
    c.other_news_buffer_minutes = get_env_int("NEWS_OTHER_BUFFER_MINUTES", c.other_news_buffer_minutes);
    c.auction_buffer_minutes = get_env_int("AUCTION_BUFFER_MINUTES", c.auction_buffer_minutes);
    c.velocity_spike_multiplier = get_env_double("VELOCITY_SPIKE_MULTIPLIER", c.velocity_spike_multiplier);
    c.velocity_lookback_bars = get_env_int("VELOCITY_LOOKBACK_BARS", c.velocity_lookback_bars);
    c.bias_gate = get_env_bool("BIAS_GATE", c.bias_gate);
    c.grade_gate = get_env_bool("RANGE_GRADE_GATE", c.grade_gate);

    c.trend_day_gate = get_env_bool("TREND_DAY_GATE", c.trend_day_gate);
    c.adx_trend_threshold = get_env_double("ADX_15M_HIGH_THRESHOLD", c.adx_trend_threshold);
    c.ny_participation_gate = get_env_bool("NY_PARTICIPATION_GATE", c.ny_participation_gate);
    c.participation_gate = get_env_bool("PARTICIPATION_GATE", c.participation_gate);

    c.london_start_minute = get_env_minutes("LONDON_START_UTC", c.london_start_minute);
    c.london_end_minute = get_env_minutes("LONDON_END_UTC", c.london_end_minute);
    c.ny_start_minute = get_env_minutes("NY_START_UTC", c.ny_start_minute);

    auto holidays = get_env("HOLIDAYS_UTC");
    if (!holidays.empty()) {
        c.holidays.clear();
        for (const auto& entry : util::split(holidays, ',')) {
            std::istringstream in(entry);
            int month = 0;
            int day = 0;
            char dash = 0;
            if (!(in >> month >> dash >> day) || dash != '-') {
                throw ConfigurationError("Invalid HOLIDAYS_UTC entry (MM-DD): " + entry);
            }
            c.holidays.emplace_back(month, day);
        }
    }

    auto auctions = get_env("AUCTION_TIMES_UTC");
    if (!auctions.empty()) {
        c.auction_times.clear();
        for (const auto& t : util::split(auctions, ',')) {
            auto minutes = util::parse_hhmm(t);
            if (!minutes) {
                throw ConfigurationError("Invalid AUCTION_TIMES_UTC entry: " + t);
            }
            c.auction_times.push_back(*minutes);
        }
    }

    // Symbols and series
    cfg.symbols = util::split(get_env("SYMBOLS", "XAUUSD"), ',');

    auto primary_name = get_env("PRIMARY_TIMEFRAME", "M5");
    auto primary = parse_timeframe(primary_name);
    if (!primary) {
        throw ConfigurationError("Unknown PRIMARY_TIMEFRAME: " + primary_name);
    }
    cfg.primary_timeframe = *primary;

    auto micro_name = get_env("MICRO_TIMEFRAME", "M1");
    auto micro = parse_timeframe(micro_name);
    if (!micro) {
        throw ConfigurationError("Unknown MICRO_TIMEFRAME: " + micro_name);
    }
    cfg.micro_timeframe = *micro;

    cfg.derive_primary_from_micro = get_env_bool("DERIVE_PRIMARY_FROM_MICRO", false);
    cfg.poll_interval_ms = get_env_int("POLL_INTERVAL_MS", 5000);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_events = get_env("STREAM_EVENTS", "sweep.session.events");
    cfg.events_maxlen = get_env_int("STREAM_EVENTS_MAXLEN", 10000);
    cfg.stream_execution = get_env("STREAM_EXECUTION", "sweep.execution.reports");
    cfg.execution_group = get_env("EXECUTION_GROUP", "sweep_engine");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "sweep_engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw ConfigurationError("PG_DSN is required");
    }
    if (symbols.empty()) {
        throw ConfigurationError("SYMBOLS must list at least one symbol");
    }
    if (timeframe_minutes(micro_timeframe) >= timeframe_minutes(primary_timeframe)) {
        throw ConfigurationError("MICRO_TIMEFRAME must be finer than PRIMARY_TIMEFRAME");
    }
    if (events_maxlen <= 0) {
        throw ConfigurationError("STREAM_EVENTS_MAXLEN must be positive");
    }
    if (poll_interval_ms <= 0) {
        throw ConfigurationError("POLL_INTERVAL_MS must be positive");
    }
    strategy.validate();

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Symbols: {} ({} / {})", fmt::join(symbols, ","),
                 to_string(primary_timeframe), to_string(micro_timeframe));
    spdlog::info("  Session window: {} - {} min UTC",
                 strategy.session_start_minute, strategy.session_end_minute);
    spdlog::info("  Sweep threshold: mode={}, fixed={} pips, tie_break={}, opposite={}",
                 to_string(strategy.threshold_mode), strategy.sweep_threshold_pips,
                 to_string(strategy.tie_break), to_string(strategy.opposite_sweep_policy));
    spdlog::info("  Reversal: lookahead={} bars / {} min, displacement>={}",
                 strategy.reversal_lookahead_bars, strategy.reversal_lookahead_minutes,
                 strategy.displacement_min_fraction);
    spdlog::info("  Gates: trend_day={} (ADX>{}), ny_participation={}, participation={} ({} holidays)",
                 strategy.confluence.trend_day_gate, strategy.confluence.adx_trend_threshold,
                 strategy.confluence.ny_participation_gate, strategy.confluence.participation_gate,
                 strategy.confluence.holidays.size());
    spdlog::info("  Lifecycle: confluence_wait={}min, cooldown={}min, max_trades={}",
                 strategy.confluence_max_wait_minutes, strategy.cooldown_minutes,
                 strategy.max_trades_per_session);
    spdlog::info("  Redis: {} -> {} (maxlen {}), execution <- {}",
                 util::redact_dsn(redis_url), stream_events, events_maxlen, stream_execution);
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
}
