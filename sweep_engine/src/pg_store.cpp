#include "pg_store.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // price_bars and economic_news are written by the feed side
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS session_transitions (
                id BIGSERIAL PRIMARY KEY,
                symbol TEXT NOT NULL,
                trading_day DATE NOT NULL,
                from_state TEXT NOT NULL,
                to_state TEXT NOT NULL,
                event TEXT NOT NULL,
                ts TIMESTAMPTZ NOT NULL,
                payload JSONB NOT NULL,
                UNIQUE (symbol, trading_day, event, ts)
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}

std::vector<Bar> PostgresStore::get_bars(const std::string& symbol, Timeframe tf,
                                         int64_t start_ms, int64_t end_ms) {
    std::vector<Bar> bars;

    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        "SELECT (EXTRACT(EPOCH FROM ts) * 1000)::BIGINT, open, high, low, close, "
        "COALESCE(volume, 0), COALESCE(spread_pips, 0) "
        "FROM price_bars "
        "WHERE symbol = $1 AND timeframe = $2 "
        "AND ts >= to_timestamp($3::BIGINT / 1000.0) "
        "AND ts < to_timestamp($4::BIGINT / 1000.0) "
        "ORDER BY ts ASC",
        symbol, to_string(tf), start_ms, end_ms
    );
    txn.commit();

    bars.reserve(result.size());
    for (const auto& row : result) {
        Bar bar;
        bar.timestamp_ms = row[0].as<int64_t>();
        bar.open = row[1].as<double>();
        bar.high = row[2].as<double>();
        bar.low = row[3].as<double>();
        bar.close = row[4].as<double>();
        bar.volume = row[5].as<double>();
        bar.spread_pips = row[6].as<double>();
        bars.push_back(bar);
    }

    spdlog::debug("Loaded {} {} bars for {}", bars.size(), to_string(tf), symbol);
    return bars;
}

std::vector<NewsEvent> PostgresStore::load_news(int64_t start_ms, int64_t end_ms) {
    std::vector<NewsEvent> events;

    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        "SELECT (EXTRACT(EPOCH FROM release_time) * 1000)::BIGINT, event_name, "
        "COALESCE(tier, 'OTHER') = 'TIER1' "
        "FROM economic_news "
        "WHERE severity IN ('HIGH', 'CRITICAL') "
        "AND release_time >= to_timestamp($1::BIGINT / 1000.0) "
        "AND release_time < to_timestamp($2::BIGINT / 1000.0) "
        "ORDER BY release_time ASC",
        start_ms, end_ms
    );
    txn.commit();

    for (const auto& row : result) {
        events.push_back(NewsEvent{
            row[0].as<int64_t>(),
            row[1].as<std::string>(),
            row[2].as<bool>()
        });
    }
    return events;
}

void PostgresStore::record_transition(const TransitionEvent& event) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO session_transitions "
            "(symbol, trading_day, from_state, to_state, event, ts, payload) "
            "VALUES ($1, $2::DATE, $3, $4, $5, to_timestamp($6::BIGINT / 1000.0), $7::JSONB) "
            "ON CONFLICT (symbol, trading_day, event, ts) DO NOTHING",
            event.symbol, event.trading_day, to_string(event.from_state),
            to_string(event.to_state), to_string(event.event),
            event.timestamp_ms, event.payload.dump()
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to record transition: {}", e.what());
    }
}
