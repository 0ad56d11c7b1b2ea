// SPDX-License-Identifier: MIT

// tests/consumer_test.cpp
#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "src/consumer.hpp"

using namespace tsdb_pipe;

TEST(ConsumerConfigTest, ForTopicDerivesWebsocketSettings) {
    auto config = ConsumerConfig::ForTopic("http://127.0.0.1:6041", "root", "taosdata", "alarms");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->ws_url, "ws://127.0.0.1:6041/rest/tmq");
    EXPECT_EQ(config->user, "root");
    EXPECT_EQ(config->password, "taosdata");
    EXPECT_EQ(config->group_id, "alarms");
    EXPECT_EQ(config->auto_offset_reset, "latest");
    EXPECT_TRUE(config->enable_auto_commit);
}

TEST(ConsumerConfigTest, HttpsBecomesWss) {
    auto config = ConsumerConfig::ForTopic("https://tsdb.example.com/proxy", "u", "p", "t");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->ws_url, "wss://tsdb.example.com/proxy/rest/tmq");
}

TEST(ConsumerConfigTest, ClientIdHasHostnameAndSuffix) {
    auto config = ConsumerConfig::ForTopic("http://127.0.0.1:6041", "root", "taosdata", "t");
    ASSERT_TRUE(config.has_value());
    const std::string& id = config->client_id;
    ASSERT_TRUE(id.starts_with("iot_"));
    auto dash = id.rfind('-');
    ASSERT_NE(dash, std::string::npos);
    int suffix = std::atoi(id.c_str() + dash + 1);
    EXPECT_GE(suffix, 0);
    EXPECT_LT(suffix, 86400);
}

TEST(ConsumerConfigTest, InvalidAddress) {
    auto config = ConsumerConfig::ForTopic("tcp://127.0.0.1:6030", "root", "taosdata", "t");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidAddress);
}

TEST(ConsumerConfigTest, ToConfigMap) {
    ConsumerConfig config;
    config.ws_url = "ws://h:6041/rest/tmq";
    config.user = "root";
    config.password = "taosdata";
    config.group_id = "alarms";
    config.client_id = "iot_h-1";
    config.enable_auto_commit = false;

    auto map = config.ToConfigMap();
    ASSERT_EQ(map.size(), 7u);
    EXPECT_EQ(map[0], (std::pair<std::string, std::string>{"ws.url", "ws://h:6041/rest/tmq"}));
    EXPECT_EQ(map[3], (std::pair<std::string, std::string>{"group.id", "alarms"}));
    EXPECT_EQ(map[5], (std::pair<std::string, std::string>{"auto.offset.reset", "latest"}));
    EXPECT_EQ(map[6], (std::pair<std::string, std::string>{"enable.auto.commit", "false"}));
}
