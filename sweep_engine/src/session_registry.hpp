#pragma once

#include "session_state_machine.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct SessionKey {
    std::string symbol;
    std::string trading_day;

    bool operator<(const SessionKey& other) const {
        if (symbol != other.symbol) return symbol < other.symbol;
        return trading_day < other.trading_day;
    }
};

// Explicit (symbol, trading day) -> session map. The registry lock covers
// lookup, insert and evict only; work on a session happens under the
// session's own lock.
class SessionRegistry {
public:
    SessionRegistry(const StrategyConfig& config,
                    std::shared_ptr<const ConfluenceChecker> confluence);

    // Creates the session for the UTC day of ts_ms on first use
    std::shared_ptr<SessionStateMachine> get_or_create(const std::string& symbol, int64_t ts_ms,
                                                       bool* created = nullptr);

    std::shared_ptr<SessionStateMachine> find(const std::string& symbol,
                                              const std::string& trading_day) const;

    // All sessions of a symbol, oldest day first
    std::vector<std::shared_ptr<SessionStateMachine>> sessions_for(const std::string& symbol) const;
    std::vector<std::shared_ptr<SessionStateMachine>> all() const;

    // Drops idle sessions of past days once retention has passed
    size_t evict_expired(int64_t now_ms);

    size_t size() const;

private:
    StrategyConfig config_;
    std::shared_ptr<const ConfluenceChecker> confluence_;

    mutable std::mutex mutex_;
    std::map<SessionKey, std::shared_ptr<SessionStateMachine>> sessions_;
};
