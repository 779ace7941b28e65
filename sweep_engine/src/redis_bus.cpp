#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <iterator>
#include <chrono>

RedisBus::RedisBus(const std::string& redis_url, long long events_maxlen)
    : redis_(std::make_shared<sw::redis::Redis>(redis_url)),
      events_maxlen_(events_maxlen) {
    spdlog::info("Connected to Redis: {}", util::redact_dsn(redis_url));
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on {}", group, stream);
    } catch (const sw::redis::Error& e) {
        // BUSYGROUP on restart
        spdlog::debug("Consumer group {} on {} not created: {}", group, stream, e.what());
    }
}

bool RedisBus::publish_transition(const std::string& stream, const TransitionEvent& event) {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"symbol", event.symbol},
        {"event", to_string(event.event)},
        {"data", event.to_json().dump()},
    };

    try {
        redis_->xadd(stream, "*", fields.begin(), fields.end(), events_maxlen_, true);
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish {} for {} {}: {}", to_string(event.event),
                      event.symbol, event.trading_day, e.what());
        return false;
    }
}

std::vector<StreamMessage>
RedisBus::read_execution_reports(const std::string& stream, const std::string& group,
                                 const std::string& consumer, int count, int block_ms) {
    std::vector<StreamMessage> messages;
    std::unordered_map<std::string, StreamItems> items;

    try {
        redis_->xreadgroup(group, consumer, stream, ">", count,
                           std::chrono::milliseconds(block_ms),
                           std::inserter(items, items.end()));
    } catch (const sw::redis::TimeoutError&) {
        return messages;
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to read execution reports from {}: {}", stream, e.what());
        return messages;
    }

    for (const auto& entry : items) {
        for (const auto& item : entry.second) {
            StreamMessage msg{item.first, nullptr};
            if (item.second) {
                auto data = item.second->find("data");
                if (data != item.second->end()) {
                    msg.payload = nlohmann::json::parse(data->second, nullptr, false);
                    if (msg.payload.is_discarded()) {
                        msg.payload = nullptr;
                    }
                }
            }
            if (msg.payload.is_null()) {
                spdlog::warn("Execution report {} has no readable data field", msg.id);
            }
            messages.push_back(std::move(msg));
        }
    }
    return messages;
}

void RedisBus::ack(const std::string& stream, const std::string& group, const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to ack {} on {}: {}", msg_id, stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
