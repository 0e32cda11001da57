/**
 * @file test_mock_client.cpp
 * @brief Behaviour of the in-process MockClient the bridge tests rely on.
 */
#include "mqtt/errors.hpp"
#include "mqtt/mock_client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>

using namespace mqttop::mqtt;
using namespace std::chrono_literals;

namespace
{

ClientOptions with_will()
{
    ClientOptions o;
    o.broker = "tcp://localhost:1883";
    o.will.enabled = true;
    o.will.topic = "mqttop/bridge/status";
    return o;
}

} // namespace

TEST(MockClientTest, PublishRequiresConnection)
{
    MockClient c;
    EXPECT_EQ(wait_token({}, c.publish("a", 0, false, "x")), Errc::not_connected);
    EXPECT_TRUE(c.published().empty());

    ASSERT_FALSE(wait_token({}, c.connect()));
    EXPECT_TRUE(c.is_connected());
    EXPECT_FALSE(wait_token({}, c.publish("a", 0, false, "x")));
    ASSERT_EQ(c.published_to("a").size(), 1u);
    EXPECT_EQ(c.connect_count(), 1u);
}

TEST(MockClientTest, DeliversToMatchingSubscriptions)
{
    MockClient c;
    ASSERT_FALSE(wait_token({}, c.connect()));

    std::mutex m;
    std::vector<std::string> got;
    ASSERT_FALSE(wait_token({}, c.subscribe("m/+/stop", 1, [&](const Message &msg) {
        std::lock_guard<std::mutex> lock(m);
        got.push_back(msg.topic);
    })));

    c.inject("m/a/stop", "");
    c.inject("m/a/update", "");
    c.publish("m/b/stop", 0, false, "");
    c.drain();

    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(got, (std::vector<std::string>{"m/a/stop", "m/b/stop"}));
}

TEST(MockClientTest, RetainedMessagesReachNewSubscribers)
{
    MockClient c;
    ASSERT_FALSE(wait_token({}, c.connect()));
    c.publish("status", 1, true, "online");
    EXPECT_EQ(c.retained("status"), "online");

    std::atomic<int> hits{0};
    ASSERT_FALSE(wait_token({}, c.subscribe("status", 0, [&](const Message &msg) {
        EXPECT_TRUE(msg.retained);
        EXPECT_EQ(msg.payload, "online");
        ++hits;
    })));
    c.drain();
    EXPECT_EQ(hits.load(), 1);

    // An empty retained payload clears the topic.
    c.publish("status", 1, true, "");
    EXPECT_FALSE(c.retained("status").has_value());
}

TEST(MockClientTest, ScriptedFailures)
{
    MockClient c;
    c.set_connect_error(Errc::connect_failed);
    EXPECT_EQ(wait_token({}, c.connect()), Errc::connect_failed);
    EXPECT_FALSE(c.is_connected());

    c.set_connect_error({});
    ASSERT_FALSE(wait_token({}, c.connect()));

    c.set_subscribe_error("bad", Errc::subscribe_failed);
    EXPECT_EQ(wait_token({}, c.subscribe_multiple({{"ok", 0}, {"bad", 0}}, [](const Message &) {})),
              Errc::subscribe_failed);
    EXPECT_TRUE(c.subscriptions().empty());

    c.set_publish_error("m/#", Errc::publish_failed);
    EXPECT_EQ(wait_token({}, c.publish("m/a", 0, false, "1")), Errc::publish_failed);
    EXPECT_FALSE(wait_token({}, c.publish("n/a", 0, false, "1")));
}

TEST(MockClientTest, HeldConnectCompletesOnRelease)
{
    MockClient c;
    c.set_hold_connect(true);
    auto t = c.connect();
    EXPECT_FALSE(t->wait_for(20ms));
    c.release_connect();
    EXPECT_TRUE(t->wait_for(1s));
    EXPECT_TRUE(c.is_connected());
}

TEST(MockClientTest, DisconnectClearsSubscriptions)
{
    MockClient c;
    ASSERT_FALSE(wait_token({}, c.connect()));
    ASSERT_FALSE(wait_token({}, c.subscribe("a", 0, [](const Message &) {})));
    ASSERT_FALSE(wait_token({}, c.subscribe("b", 0, [](const Message &) {})));
    EXPECT_EQ(c.subscriptions(), (std::vector<std::string>{"a", "b"}));

    ASSERT_FALSE(wait_token({}, c.unsubscribe({"a"})));
    EXPECT_EQ(c.subscriptions(), (std::vector<std::string>{"b"}));

    c.disconnect(0ms);
    EXPECT_FALSE(c.is_connected());
    EXPECT_TRUE(c.subscriptions().empty());
    EXPECT_EQ(c.disconnect_count(), 1u);
}

TEST(MockClientTest, DroppedConnectionPublishesTheWill)
{
    MockClient c(with_will());
    ASSERT_FALSE(wait_token({}, c.connect()));
    c.drop_connection();
    EXPECT_FALSE(c.is_connected());
    EXPECT_EQ(c.retained("mqttop/bridge/status"), "offline");
}

TEST(MockClientTest, WaitForPayload)
{
    MockClient c;
    ASSERT_FALSE(wait_token({}, c.connect()));
    EXPECT_FALSE(c.wait_for_payload("t", "2", 10ms));
    c.publish("t", 0, false, "1");
    c.publish("t", 0, false, "2");
    EXPECT_TRUE(c.wait_for_payload("t", "2", 1s));
    EXPECT_EQ(c.last_published_to("t")->payload, "2");
}
