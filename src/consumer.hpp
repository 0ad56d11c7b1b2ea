// SPDX-License-Identifier: MIT

// src/consumer.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lib/net/error.hpp"
#include "src/query_response.hpp"

namespace tsdb_pipe {

// Rows of one table carried by a subscribed message
struct MessageBlock {
    std::string table_name;
    std::vector<std::vector<Value>> rows;
};

// A message delivered by a topic consumer. Shared read-only once polled.
struct SubscribedMessage {
    std::string topic;
    std::string db_name;
    std::vector<MessageBlock> blocks;
    int64_t offset = 0;
};

using MessagePtr = std::shared_ptr<const SubscribedMessage>;

// Poll result the consumer did not expect; logged and ignored by the bridge
struct UnexpectedEvent {
    std::string type_name;
};

// Result of one poll: nothing (timeout), a message, an error, or something else
using ConsumerEvent = std::variant<std::monostate, MessagePtr, Error, UnexpectedEvent>;

// Settings for a topic consumer connecting over the websocket endpoint
struct ConsumerConfig {
    std::string ws_url;     // ws[s]://host:port/rest/tmq
    std::string user;
    std::string password;
    std::string group_id;
    std::string client_id;
    std::string auto_offset_reset = "latest";
    bool enable_auto_commit = true;

    // Derive the settings for one topic from the database address:
    // group.id is the topic, client.id is iot_<hostname>-<0..86399>.
    static std::expected<ConsumerConfig, Error> ForTopic(std::string_view addr,
                                                         std::string_view user,
                                                         std::string_view password,
                                                         std::string_view topic);

    // Driver configuration keys ("ws.url", "group.id", ...) in a stable order
    std::vector<std::pair<std::string, std::string>> ToConfigMap() const;
};

// ITopicConsumer - poll-based consumer of one topic subscription
//
// Implementations wrap a message-queue driver. Calls come from one thread.
class ITopicConsumer {
public:
    virtual ~ITopicConsumer() = default;

    virtual std::expected<void, Error> Subscribe(std::string_view topic) = 0;

    // Block up to timeout for the next event
    virtual ConsumerEvent Poll(std::chrono::milliseconds timeout) = 0;

    virtual std::expected<void, Error> Unsubscribe() = 0;
    virtual std::expected<void, Error> Close() = 0;
};

using ConsumerFactory =
    std::function<std::expected<std::unique_ptr<ITopicConsumer>, Error>(const ConsumerConfig&)>;

}  // namespace tsdb_pipe
