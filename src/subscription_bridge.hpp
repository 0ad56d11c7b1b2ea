// SPDX-License-Identifier: MIT

// src/subscription_bridge.hpp
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string_view>
#include <utility>

#include "lib/net/error.hpp"
#include "src/channel.hpp"
#include "src/consumer.hpp"

namespace tsdb_pipe {

// SubscriptionBridge - turns a poll-based topic consumer into a channel stream
//
// Run() owns one consumer for its whole duration:
//   Created -> Subscribed -> Polling <-> Delivering -> Unsubscribing -> Closed
//
// - Stop is checked once per poll, so it takes effect within one poll timeout.
//   On stop the consumer is unsubscribed; on success the channel is closed and
//   Run() returns success, on failure the error is returned and the channel
//   stays open.
// - Messages are forwarded with a non-blocking send. When the channel is full
//   the message is dropped and logged; the poll loop never blocks on it.
// - An error event ends the loop and is returned; the channel stays open.
// - Any other event is logged and ignored.
// - The consumer is always unsubscribed (best effort) and closed on exit.
class SubscriptionBridge {
public:
    static constexpr std::chrono::milliseconds kDefaultPollTimeout{5000};

    SubscriptionBridge(ConsumerFactory factory, ConsumerConfig config,
                       std::chrono::milliseconds poll_timeout = kDefaultPollTimeout)
        : factory_(std::move(factory)),
          config_(std::move(config)),
          poll_timeout_(poll_timeout) {}

    std::expected<void, Error> Run(std::stop_token stop, std::string_view topic,
                                   const std::shared_ptr<Channel<MessagePtr>>& messages);

private:
    ConsumerFactory factory_;
    ConsumerConfig config_;
    std::chrono::milliseconds poll_timeout_;
};

}  // namespace tsdb_pipe
