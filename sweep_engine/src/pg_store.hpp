#pragma once

#include "bar_feed.hpp"
#include "confluence.hpp"
#include "session_state_machine.hpp"
#include <string>
#include <vector>
#include <pqxx/pqxx>

class PostgresStore : public BarFeed {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema();
    bool ping();

    std::vector<Bar> get_bars(const std::string& symbol, Timeframe tf,
                              int64_t start_ms, int64_t end_ms) override;

    // High and critical impact releases only
    std::vector<NewsEvent> load_news(int64_t start_ms, int64_t end_ms);

    void record_transition(const TransitionEvent& event);

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
