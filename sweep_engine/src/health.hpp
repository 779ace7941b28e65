#pragma once
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "sweep_engine.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<SweepEngine> engine);

    nlohmann::json get_status();

    void set_loop_status(const std::string& status);
    void mark_poll(int64_t ts_ms);

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<SweepEngine> engine_;

    mutable std::mutex mutex_;
    std::string loop_status_;
    std::atomic<int64_t> last_poll_ms_;
};
