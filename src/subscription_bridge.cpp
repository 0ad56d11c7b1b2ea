// SPDX-License-Identifier: MIT

// src/subscription_bridge.cpp
#include "src/subscription_bridge.hpp"

#include <string>

#include "src/log.hpp"

namespace tsdb_pipe {

namespace {

// Releases the consumer on every exit path: unsubscribe unless that was
// already attempted, then close. Failures here are logged only.
class ConsumerGuard {
public:
    explicit ConsumerGuard(std::unique_ptr<ITopicConsumer> consumer)
        : consumer_(std::move(consumer)) {}

    ~ConsumerGuard() {
        if (subscribed_) {
            if (auto r = consumer_->Unsubscribe(); !r) {
                Log::debug("subscribe") << "release: unsubscribe failed: " << r.error().message;
            }
        }
        if (auto r = consumer_->Close(); !r) {
            Log::warn("subscribe") << "release: close consumer failed: " << r.error().message;
        }
    }

    ConsumerGuard(const ConsumerGuard&) = delete;
    ConsumerGuard& operator=(const ConsumerGuard&) = delete;

    ITopicConsumer* operator->() const { return consumer_.get(); }

    std::expected<void, Error> Subscribe(std::string_view topic) {
        auto r = consumer_->Subscribe(topic);
        if (r) subscribed_ = true;
        return r;
    }

    // One attempt only; the destructor does not retry a failed unsubscribe
    std::expected<void, Error> Unsubscribe() {
        subscribed_ = false;
        return consumer_->Unsubscribe();
    }

private:
    std::unique_ptr<ITopicConsumer> consumer_;
    bool subscribed_ = false;
};

}  // namespace

std::expected<void, Error> SubscriptionBridge::Run(
    std::stop_token stop, std::string_view topic,
    const std::shared_ptr<Channel<MessagePtr>>& messages) {
    if (topic.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "invalid args: topic is empty"});
    }
    if (!messages) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "invalid args: message channel is null"});
    }

    auto consumer = factory_(config_);
    if (!consumer) return std::unexpected(consumer.error());
    if (!*consumer) {
        return std::unexpected(Error{ErrorCode::SubscriptionFailed,
                                     "consumer factory returned no consumer"});
    }

    ConsumerGuard guard(std::move(*consumer));
    if (auto r = guard.Subscribe(topic); !r) return std::unexpected(r.error());

    for (;;) {
        if (stop.stop_requested()) {
            Log::info("subscribe") << "stop requested, unsubscribing from " << topic;
            if (auto r = guard.Unsubscribe(); !r) {
                Log::error("subscribe") << "unsubscribe error: " << r.error().message;
                return std::unexpected(r.error());
            }
            Log::info("subscribe") << "unsubscribe success";
            messages->Close();
            Log::info("subscribe") << "message channel closed";
            return {};
        }

        ConsumerEvent event = guard->Poll(poll_timeout_);

        if (auto* msg = std::get_if<MessagePtr>(&event)) {
            if (!*msg) {
                Log::warn("subscribe") << "consumer delivered an empty message";
                continue;
            }
            switch (messages->TrySend(std::move(*msg))) {
                case SendStatus::Sent:
                    break;
                case SendStatus::Full:
                    Log::warn("subscribe") << "message channel full, dropping message";
                    break;
                case SendStatus::Closed:
                    Log::warn("subscribe") << "message channel closed by receiver, dropping message";
                    break;
            }
        } else if (auto* err = std::get_if<Error>(&event)) {
            Log::error("subscribe") << "consumer error: " << err->message;
            return std::unexpected(std::move(*err));
        } else if (auto* other = std::get_if<UnexpectedEvent>(&event)) {
            Log::warn("subscribe") << "not expected receive type: " << other->type_name;
        }
    }
}

}  // namespace tsdb_pipe
