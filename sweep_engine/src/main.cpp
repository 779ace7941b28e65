#include "config.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "sweep_engine.hpp"
#include "bar_poller.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("sweepwatch", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        auto redis = std::make_shared<RedisBus>(config.redis_url, config.events_maxlen);
        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);

        if (!redis->ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }
        if (!pg->ping()) {
            spdlog::error("Failed to connect to Postgres");
            return 1;
        }
        pg->init_schema();

        redis->create_consumer_group(config.stream_execution, config.execution_group);

        auto engine = std::make_shared<SweepEngine>(config.strategy,
                                                    config.primary_timeframe,
                                                    config.micro_timeframe);
        HealthCheck health(redis, pg, engine);

        auto publish = [&](const TransitionEvent& event) {
            if (!redis->publish_transition(config.stream_events, event)) {
                spdlog::warn("{} for {} {} recorded in Postgres only",
                             to_string(event.event), event.symbol, event.trading_day);
            }
            pg->record_transition(event);
        };

        BarPoller poller(*pg, *engine, config.strategy, config.symbols,
                         config.derive_primary_from_micro, publish);

        // Setup HTTP server for /health endpoint
        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto status = health.get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        auto refresh_news = [&](int64_t now_ms) {
            try {
                poller.set_news(pg->load_news(now_ms - util::MS_PER_DAY, now_ms + util::MS_PER_DAY));
            } catch (const std::exception& e) {
                spdlog::warn("News calendar unavailable, keeping previous: {}", e.what());
            }
        };

        int64_t now = util::current_timestamp_ms();
        refresh_news(now);
        poller.start(now);

        const std::string consumer = config.service_name + "_consumer";
        int64_t last_poll_ms = 0;
        int64_t last_news_ms = now;
        int64_t last_evict_ms = now;

        spdlog::info("Entering main loop");
        health.set_loop_status("running");

        while (!shutdown_requested) {
            try {
                now = util::current_timestamp_ms();

                // 1. Pull completed bars through the engine
                if (now - last_poll_ms >= config.poll_interval_ms) {
                    size_t routed = poller.poll(now);
                    if (routed > 0) {
                        spdlog::debug("Routed {} bars", routed);
                    }
                    for (const auto& event : engine->on_clock(now)) {
                        publish(event);
                    }
                    last_poll_ms = now;
                    health.mark_poll(now);
                }

                // 2. Execution reports from the order side
                auto reports = redis->read_execution_reports(
                    config.stream_execution, config.execution_group, consumer, 50, 100);

                for (const auto& msg : reports) {
                    std::string error;
                    auto report = ExecutionReport::parse(msg.payload, error);
                    if (!report) {
                        spdlog::warn("Dropping execution report {}: {}", msg.id, error);
                    } else {
                        auto result = engine->on_execution_report(*report);
                        if (result.applied() && result.event) {
                            publish(*result.event);
                        } else if (result.rejection) {
                            spdlog::warn("Execution report {} rejected: {}",
                                         msg.id, result.rejection->reason);
                        }
                    }
                    redis->ack(config.stream_execution, config.execution_group, msg.id);
                }

                // 3. Housekeeping
                if (now - last_news_ms >= 15 * util::MS_PER_MINUTE) {
                    refresh_news(now);
                    last_news_ms = now;
                }
                if (now - last_evict_ms >= 60 * util::MS_PER_MINUTE) {
                    size_t evicted = engine->evict(now);
                    if (evicted > 0) {
                        spdlog::info("Evicted {} expired sessions", evicted);
                    }
                    last_evict_ms = now;
                }

            } catch (const std::exception& e) {
                spdlog::error("Error in main loop: {}", e.what());
                health.set_loop_status("error");
                std::this_thread::sleep_for(std::chrono::seconds(1));
                health.set_loop_status("running");
            }
        }

        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
