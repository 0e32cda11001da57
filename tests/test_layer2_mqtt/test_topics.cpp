/**
 * @file test_topics.cpp
 * @brief Topic filter matching and broker URL normalization.
 */
#include "mqtt/client.hpp"

#include <gtest/gtest.h>

using namespace mqttop::mqtt;

TEST(TopicMatchesTest, ExactAndSingleLevelWildcard)
{
    EXPECT_TRUE(topic_matches("mqttop/bridge/stop", "mqttop/bridge/stop"));
    EXPECT_FALSE(topic_matches("mqttop/bridge/stop", "mqttop/bridge/update"));
    EXPECT_TRUE(topic_matches("mqttop/+/stop", "mqttop/bridge/stop"));
    EXPECT_FALSE(topic_matches("mqttop/+/stop", "mqttop/a/b/stop"));
    EXPECT_TRUE(topic_matches("+/+", "a/b"));
    EXPECT_FALSE(topic_matches("+", "a/b"));
}

TEST(TopicMatchesTest, MultiLevelWildcard)
{
    EXPECT_TRUE(topic_matches("#", "a/b/c"));
    EXPECT_TRUE(topic_matches("mqttop/#", "mqttop/metric/memory"));
    EXPECT_TRUE(topic_matches("mqttop/#", "mqttop"));
    EXPECT_FALSE(topic_matches("mqttop/#", "other/metric"));
}

TEST(TopicMatchesTest, SystemTopicsNeedExplicitPrefix)
{
    EXPECT_FALSE(topic_matches("#", "$SYS/broker/uptime"));
    EXPECT_FALSE(topic_matches("+/broker/uptime", "$SYS/broker/uptime"));
    EXPECT_TRUE(topic_matches("$SYS/#", "$SYS/broker/uptime"));
}

TEST(BrokerUrlTest, AddsSchemeAndDefaultPort)
{
    EXPECT_EQ(normalize_broker_url("127.0.0.1"), "tcp://127.0.0.1:1883");
    EXPECT_EQ(normalize_broker_url("broker.local:1884"), "tcp://broker.local:1884");
    EXPECT_EQ(normalize_broker_url("ssl://broker.local"), "ssl://broker.local:8883");
    EXPECT_EQ(normalize_broker_url("ws://broker.local"), "ws://broker.local:80");
    EXPECT_EQ(normalize_broker_url("tcp://[::1]"), "tcp://[::1]:1883");
    EXPECT_EQ(normalize_broker_url("tcp://[::1]:1999"), "tcp://[::1]:1999");
    EXPECT_EQ(normalize_broker_url(""), "");
}
