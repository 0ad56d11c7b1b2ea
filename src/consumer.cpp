// SPDX-License-Identifier: MIT

// src/consumer.cpp
#include "src/consumer.hpp"

#include <unistd.h>

#include <array>
#include <random>

#include <fmt/format.h>

#include "lib/net/url.hpp"

namespace tsdb_pipe {

namespace {

constexpr int kClientIdSpread = 86400;

std::string LocalHostname() {
    std::array<char, 256> buf{};
    if (gethostname(buf.data(), buf.size() - 1) != 0) return "";
    return std::string(buf.data());
}

int RandomClientSuffix() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, kClientIdSpread - 1);
    return dist(rng);
}

}  // namespace

std::expected<ConsumerConfig, Error> ConsumerConfig::ForTopic(std::string_view addr,
                                                              std::string_view user,
                                                              std::string_view password,
                                                              std::string_view topic) {
    auto url = ParseUrl(addr);
    if (!url) return std::unexpected(url.error());

    ConsumerConfig config;
    config.ws_url = fmt::format("{}://{}{}/rest/tmq", url->IsTls() ? "wss" : "ws",
                                url->HostHeader(), url->base_path);
    config.user = std::string(user);
    config.password = std::string(password);
    config.group_id = std::string(topic);
    config.client_id = fmt::format("iot_{}-{}", LocalHostname(), RandomClientSuffix());
    return config;
}

std::vector<std::pair<std::string, std::string>> ConsumerConfig::ToConfigMap() const {
    return {
        {"ws.url", ws_url},
        {"td.connect.user", user},
        {"td.connect.pass", password},
        {"group.id", group_id},
        {"client.id", client_id},
        {"auto.offset.reset", auto_offset_reset},
        {"enable.auto.commit", enable_auto_commit ? "true" : "false"},
    };
}

}  // namespace tsdb_pipe
