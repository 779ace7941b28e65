#include "session_registry.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SessionRegistry::SessionRegistry(const StrategyConfig& config,
                                 std::shared_ptr<const ConfluenceChecker> confluence)
    : config_(config)
    , confluence_(std::move(confluence))
{}

std::shared_ptr<SessionStateMachine> SessionRegistry::get_or_create(const std::string& symbol,
                                                                    int64_t ts_ms,
                                                                    bool* created) {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionKey key{symbol, util::utc_date(ts_ms)};
    auto it = sessions_.find(key);
    if (it != sessions_.end()) {
        if (created) *created = false;
        return it->second;
    }

    auto session = std::make_shared<SessionStateMachine>(symbol, ts_ms, config_, confluence_);
    sessions_.emplace(key, session);
    if (created) *created = true;

    spdlog::info("Session created: {} {}", symbol, key.trading_day);
    return session;
}

std::shared_ptr<SessionStateMachine> SessionRegistry::find(const std::string& symbol,
                                                           const std::string& trading_day) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(SessionKey{symbol, trading_day});
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<SessionStateMachine>> SessionRegistry::sessions_for(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionStateMachine>> result;
    for (const auto& [key, session] : sessions_) {
        if (key.symbol == symbol) {
            result.push_back(session);
        }
    }
    return result;
}

std::vector<std::shared_ptr<SessionStateMachine>> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SessionStateMachine>> result;
    result.reserve(sessions_.size());
    for (const auto& [key, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

size_t SessionRegistry::evict_expired(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t today_start = util::day_start_ms(now_ms);
    int64_t retention_ms = static_cast<int64_t>(config_.session_retention_hours) * 60 * util::MS_PER_MINUTE;
    size_t removed = 0;

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& session = it->second;
        bool past_day = util::day_start_ms(session->window().start_ms) < today_start;
        bool idle = session->state() == SessionState::Idle;
        bool stale = now_ms - session->last_activity_ms() >= retention_ms;

        if (past_day && idle && stale) {
            spdlog::info("Session evicted: {} {}", it->first.symbol, it->first.trading_day);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
