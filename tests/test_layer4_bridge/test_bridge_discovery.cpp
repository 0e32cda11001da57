/**
 * @file test_bridge_discovery.cpp
 * @brief Discovery driven by the bridge: startup announcement, rediscovery,
 *        the bridge's own button and migration from a previous run.
 */
#include "bridge/bridge.hpp"
#include "discovery/discovery.hpp"
#include "fake_metric.hpp"
#include "metrics/errors.hpp"
#include "mqtt/errors.hpp"
#include "mqtt/mock_client.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <future>

using namespace mqttop;
using namespace mqttop::tests::helper;
using namespace std::chrono_literals;
using nlohmann::json;
using tests::FakeMetric;

namespace
{

constexpr const char *kStatus = "mqttop/bridge/status";
constexpr const char *kDeviceTopic = "homeassistant/device/mqttop/abc/config";

discovery::Discovery make_doc(discovery::Method method)
{
    discovery::Device dev;
    dev.identifiers = {"abc"};
    dev.name = "Host";
    discovery::Options o;
    o.method = method;
    o.availability_topic = kStatus;
    auto doc = discovery::Discovery::create(o, dev, discovery::Origin{"mqttop", "1.0", ""});
    EXPECT_TRUE(doc.is_ok());
    return std::move(doc).content();
}

class BridgeDiscoveryTest : public ::testing::Test
{
  protected:
    static mqtt::ClientOptions client_options()
    {
        mqtt::ClientOptions o;
        o.will.enabled = true;
        o.will.topic = kStatus;
        return o;
    }

    static bridge::Options options(std::chrono::milliseconds settle = 1h)
    {
        bridge::Options o;
        o.settle_delay = settle;
        o.disconnect_grace = 10ms;
        return o;
    }

    std::unique_ptr<bridge::Bridge>
    make_bridge(std::vector<metrics::MetricPtr> metrics, discovery::Method method,
                bridge::Options opts = options(),
                std::optional<discovery::Discovery> previous = std::nullopt)
    {
        return std::make_unique<bridge::Bridge>(m_client, std::move(metrics), opts,
                                                make_doc(method), std::move(previous));
    }

    size_t discovery_publishes() const
    {
        const auto all = m_client->published();
        return std::count_if(all.begin(), all.end(), [](const mqtt::Message &m) {
            return m.topic.rfind("homeassistant/", 0) == 0;
        });
    }

    std::shared_ptr<mqtt::MockClient> m_client =
        std::make_shared<mqtt::MockClient>(client_options());
};

} // namespace

TEST_F(BridgeDiscoveryTest, StartupPublishesWholeDocumentWithBridgeButton)
{
    auto disk = std::make_shared<FakeMetric>("disk", "m/disk", std::vector<std::string>{"disk_a"});
    auto plain = std::make_shared<FakeMetric>("plain", "m/plain");
    auto b = make_bridge({disk, plain}, discovery::Method::Device);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(b->error());

    const auto msg = m_client->last_published_to(kDeviceTopic);
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->retained);
    const auto j = json::parse(msg->payload);
    ASSERT_TRUE(j["cmps"].contains("disk_a"));
    ASSERT_TRUE(j["cmps"].contains("mqttop_update"));
    EXPECT_EQ(j["cmps"]["mqttop_update"]["p"], "button");
    EXPECT_EQ(j["cmps"]["mqttop_update"]["cmd_t"], "mqttop/bridge/update");
    EXPECT_EQ(j["cmps"].size(), 2u);
    EXPECT_EQ(disk->discover_calls.load(), 1);

    const auto subs = m_client->subscriptions();
    EXPECT_NE(std::find(subs.begin(), subs.end(), "homeassistant/status"), subs.end());

    b->stop();
    ASSERT_TRUE(b->discovery().has_value());
    EXPECT_EQ(b->discovery()->nodes().at("bridge"), (std::vector<std::string>{"mqttop_update"}));
}

TEST_F(BridgeDiscoveryTest, OfflineMetricsAreNotDiscovered)
{
    auto disk = std::make_shared<FakeMetric>("disk", "m/disk", std::vector<std::string>{"disk_a"});
    disk->start_error = make_error_code(metrics::Errc::not_supported);
    auto b = make_bridge({disk}, discovery::Method::Device);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);

    EXPECT_EQ(disk->discover_calls.load(), 0);
    const auto j = json::parse(m_client->last_published_to(kDeviceTopic)->payload);
    EXPECT_FALSE(j["cmps"].contains("disk_a"));
    b->stop();
}

TEST_F(BridgeDiscoveryTest, TopologyChangeRepublishesOnlyThatNode)
{
    auto disk = std::make_shared<FakeMetric>("disk", "m/disk", std::vector<std::string>{"disk_a"});
    auto cpu = std::make_shared<FakeMetric>("cpu", "m/cpu", std::vector<std::string>{"cpu_0"});
    auto b = make_bridge({disk, cpu}, discovery::Method::Nodes);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);
    ASSERT_TRUE(m_client->last_published_to("homeassistant/device/mqttop_disk/abc/config"));
    ASSERT_TRUE(m_client->last_published_to("homeassistant/device/mqttop_cpu/abc/config"));
    m_client->clear_published();

    disk->set_components({"disk_b", "disk_a"});
    ASSERT_TRUE(disk->emit(make_error_code(metrics::Errc::rescanned)));
    // The publish loop handles events in order; this value publish fences the rediscovery.
    ASSERT_TRUE(disk->emit());
    ASSERT_TRUE(m_client->wait_for_publish("m/disk", [](const std::string &) { return true; }, 5s));

    EXPECT_EQ(discovery_publishes(), 1u);
    const auto msg = m_client->last_published_to("homeassistant/device/mqttop_disk/abc/config");
    ASSERT_TRUE(msg.has_value());
    const auto j = json::parse(msg->payload);
    EXPECT_EQ(j["cmps"].size(), 2u);
    EXPECT_EQ(disk->discover_calls.load(), 2);
    EXPECT_EQ(cpu->discover_calls.load(), 1);

    b->stop();
    EXPECT_EQ(b->discovery()->nodes().at("disk"),
              (std::vector<std::string>{"disk_a", "disk_b"}));
}

TEST_F(BridgeDiscoveryTest, VanishedComponentBecomesPlaceholderOnRediscovery)
{
    auto disk = std::make_shared<FakeMetric>("disk", "m/disk",
                                             std::vector<std::string>{"disk_a", "disk_b"});
    auto b = make_bridge({disk}, discovery::Method::Components);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);
    m_client->clear_published();

    disk->set_components({"disk_b"});
    ASSERT_TRUE(disk->emit(make_error_code(metrics::Errc::rescanned)));
    ASSERT_TRUE(disk->emit());
    ASSERT_TRUE(m_client->wait_for_publish("m/disk", [](const std::string &) { return true; }, 5s));

    EXPECT_EQ(m_client->published_to("homeassistant/sensor/mqttop/disk_a/config"),
              (std::vector<std::string>{""}));
    const auto kept = m_client->published_to("homeassistant/sensor/mqttop/disk_b/config");
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(json::parse(kept.front())["stat_t"], "m/disk");
    // The bridge button is another node and is not republished.
    EXPECT_TRUE(m_client->published_to("homeassistant/button/mqttop/mqttop_update/config").empty());
    b->stop();
}

TEST_F(BridgeDiscoveryTest, HotAddIsRediscovered)
{
    auto cpu = std::make_shared<FakeMetric>("cpu", "m/cpu", std::vector<std::string>{"cpu_0"});
    auto b = make_bridge({cpu}, discovery::Method::Nodes);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);

    auto gpu = std::make_shared<FakeMetric>("gpu", "m/gpu", std::vector<std::string>{"gpu_0"});
    b->add_metric(gpu);
    ASSERT_TRUE(m_client->wait_for_publish(
        "homeassistant/device/mqttop_gpu/abc/config",
        [](const std::string &p) { return json::parse(p)["cmps"].contains("gpu_0"); }, 5s));
    b->stop();
}

TEST_F(BridgeDiscoveryTest, SettledRefreshAndPlatformOnline)
{
    auto cpu = std::make_shared<FakeMetric>("cpu", "m/cpu", std::vector<std::string>{"cpu_0"});
    auto b = make_bridge({cpu}, discovery::Method::Device, options(10ms));
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);

    // The first full refresh follows discovery after the settle delay.
    ASSERT_TRUE(wait_until([&] { return cpu->update_calls.load() >= 1; }));
    ASSERT_TRUE(m_client->wait_for_publish("m/cpu", [](const std::string &) { return true; }, 5s));

    const int before = cpu->update_calls.load();
    m_client->inject("homeassistant/status", "online");
    EXPECT_TRUE(wait_until([&] { return cpu->update_calls.load() > before; }));
    b->stop();
}

TEST_F(BridgeDiscoveryTest, MigratesFromPreviousRun)
{
    auto old = make_doc(discovery::Method::Components);
    old.add_component("cpu", "old_cpu",
                      discovery::Component{{"p", "sensor"}, {"name", "old"}, {"uniq_id", "old_cpu"}});

    auto disk = std::make_shared<FakeMetric>("disk", "m/disk", std::vector<std::string>{"disk_a"});
    auto b = make_bridge({disk}, discovery::Method::Device, options(), std::move(old));
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);

    // Every component topic first gets the migrate marker, then is cleared.
    EXPECT_EQ(m_client->published_to("homeassistant/sensor/mqttop/old_cpu/config"),
              (std::vector<std::string>{R"({"migrate_discovery": true})", ""}));
    EXPECT_EQ(m_client->published_to("homeassistant/sensor/mqttop/disk_a/config"),
              (std::vector<std::string>{R"({"migrate_discovery": true})", ""}));

    const auto j = json::parse(m_client->last_published_to(kDeviceTopic)->payload);
    EXPECT_EQ(j["cmps"]["old_cpu"], json({{"p", "sensor"}}));
    EXPECT_EQ(j["cmps"]["disk_a"]["stat_t"], "m/disk");
    b->stop();
}

TEST_F(BridgeDiscoveryTest, DiscoveryFailureIsRecorded)
{
    m_client->set_publish_error("homeassistant/#", make_error_code(mqtt::Errc::publish_failed));
    auto disk = std::make_shared<FakeMetric>("disk", "m/disk", std::vector<std::string>{"disk_a"});
    auto b = make_bridge({disk}, discovery::Method::Device);
    ASSERT_FALSE(b->start());
    ASSERT_EQ(b->ready().wait_for(5s), std::future_status::ready);
    EXPECT_EQ(b->error(), mqtt::Errc::publish_failed);

    // Values still flow.
    ASSERT_TRUE(disk->emit());
    EXPECT_TRUE(m_client->wait_for_publish("m/disk", [](const std::string &) { return true; }, 5s));
    b->stop();
}
