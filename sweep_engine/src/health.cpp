#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<SweepEngine> engine)
    : redis_(redis), pg_(pg), engine_(engine), loop_status_("starting"), last_poll_ms_(0) {}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    std::string loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_status_;
    }

    int64_t last_poll = last_poll_ms_.load();
    return {
        {"ok", redis_ok && pg_ok && loop == "running"},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"loop", loop},
        {"last_poll_ts", last_poll > 0 ? util::format_iso8601(last_poll) : ""},
        {"engine", engine_->status()}
    };
}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthCheck::mark_poll(int64_t ts_ms) {
    last_poll_ms_ = ts_ms;
}
