#pragma once
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>
#include "session_state_machine.hpp"

using StreamAttrs = std::unordered_map<std::string, std::string>;
using StreamItem = std::pair<std::string, sw::redis::Optional<StreamAttrs>>;
using StreamItems = std::vector<StreamItem>;

// One entry read from the execution stream. A payload that is missing or not
// valid JSON arrives as null and still has to be acked.
struct StreamMessage {
    std::string id;
    nlohmann::json payload;
};

class RedisBus {
public:
    RedisBus(const std::string& redis_url, long long events_maxlen);

    void create_consumer_group(const std::string& stream, const std::string& group);

    // Entries are written as {symbol, event, data} so consumers can filter
    // without parsing the payload. The stream is trimmed to about events_maxlen.
    bool publish_transition(const std::string& stream, const TransitionEvent& event);

    std::vector<StreamMessage> read_execution_reports(const std::string& stream,
                                                      const std::string& group,
                                                      const std::string& consumer,
                                                      int count, int block_ms);
    void ack(const std::string& stream, const std::string& group, const std::string& msg_id);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    long long events_maxlen_;
};
