/**
 * @file test_discovery.cpp
 * @brief Discovery document editing, persistence and the three publishing methods.
 */
#include "discovery/discovery.hpp"
#include "discovery/errors.hpp"
#include "mqtt/errors.hpp"
#include "mqtt/mock_client.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

using namespace mqttop;
using namespace mqttop::discovery;
using namespace mqttop::tests::helper;
using namespace std::chrono_literals;
using nlohmann::json;

namespace
{

constexpr const char *kMigrate = "{\"migrate_discovery\": true}";

Device test_device()
{
    Device dev;
    dev.identifiers = {"abc"};
    dev.name = "Host";
    return dev;
}

Discovery make_doc(Method method = Method::Device, Options options = {})
{
    options.method = method;
    auto doc = Discovery::create(std::move(options), test_device(), Origin{"mqttop", "1.0", ""});
    EXPECT_TRUE(doc.is_ok());
    return std::move(doc).content();
}

Component sensor(const std::string &id, const std::string &topic)
{
    return Component{{opt::Platform, discovery::platform::Sensor},
                     {opt::Name, id},
                     {opt::StateTopic, topic},
                     {opt::UniqueId, id}};
}

void add_memory(Discovery &doc)
{
    doc.add_component("memory", "mqttop_memory", sensor("mqttop_memory", "m/memory"));
    doc.add_component("memory", "mqttop_memory_total", sensor("mqttop_memory_total", "m/memory"));
}

void add_cpu(Discovery &doc)
{
    doc.add_component("cpu", "mqttop_cpu", sensor("mqttop_cpu", "m/cpu"));
}

class DiscoveryPublishTest : public ::testing::Test
{
  protected:
    void SetUp() override { ASSERT_FALSE(mqtt::wait_token({}, m_client.connect())); }

    mqtt::MockClient m_client;
};

} // namespace

TEST(DiscoveryTest, ParseMethod)
{
    EXPECT_EQ(parse_method(""), Method::Device);
    EXPECT_EQ(parse_method("device"), Method::Device);
    EXPECT_EQ(parse_method("components"), Method::Components);
    EXPECT_EQ(parse_method("nodes"), Method::Nodes);
    EXPECT_EQ(parse_method("metrics"), Method::Nodes);
    EXPECT_FALSE(parse_method("Device").has_value());
    EXPECT_EQ(to_string(Method::Components), "components");

    EXPECT_TRUE(should_migrate(Method::Device, Method::Components));
    EXPECT_TRUE(should_migrate(Method::Components, Method::Device));
    EXPECT_FALSE(should_migrate(Method::Nodes, Method::Device));
    EXPECT_FALSE(should_migrate(Method::Device, Method::Nodes));
    EXPECT_FALSE(should_migrate(Method::Device, Method::Device));
}

TEST(DiscoveryTest, CreateNeedsAnObjectId)
{
    Device dev;
    auto doc = Discovery::create({}, dev);
    ASSERT_TRUE(doc.is_error());
    EXPECT_EQ(doc.error(), Errc::no_object_id);

    dev.connections = {{"mac", "02:5b:26:a8:dc:12"}};
    auto by_mac = Discovery::create({}, dev);
    ASSERT_TRUE(by_mac.is_ok());
    EXPECT_EQ(by_mac.content().object_id(), "02:5b:26:a8:dc:12");
    EXPECT_EQ(by_mac.content().device().name, "Mqttop");
}

TEST(DiscoveryTest, DeviceNameOverride)
{
    Options o;
    o.device_name = "Office";
    auto doc = make_doc(Method::Device, o);
    EXPECT_EQ(doc.device().name, "Office");

    o.device_name = "hostname";
    EXPECT_EQ(make_doc(Method::Device, o).device().name, "Host");
}

TEST(DiscoveryTest, Topics)
{
    auto doc = make_doc();
    EXPECT_EQ(doc.topic("device", "mqttop"), "homeassistant/device/mqttop/abc/config");
    EXPECT_EQ(doc.topic("sensor", "mqttop", "mqttop_cpu"),
              "homeassistant/sensor/mqttop/mqttop_cpu/config");
    EXPECT_EQ(doc.topic("sensor", ""), "homeassistant/sensor/abc/config");
}

TEST(DiscoveryTest, AvailabilityTemplateQuotesTopic)
{
    const auto tpl = availability_template("m/memory");
    EXPECT_NE(tpl.find("value_json[\"m/memory\"]"), std::string::npos);
    EXPECT_NE(tpl.find("else value"), std::string::npos);
}

TEST(DiscoveryTest, ResetAndRestoreNode)
{
    auto doc = make_doc();
    add_memory(doc);
    add_cpu(doc);

    auto previous = doc.reset_node("memory");
    EXPECT_EQ(previous, (std::vector<std::string>{"mqttop_memory", "mqttop_memory_total"}));
    EXPECT_TRUE(doc.nodes().at("memory").empty());
    EXPECT_EQ(doc.components().at("mqttop_memory_total"), json({{"p", "sensor"}}));
    // Other producers are untouched.
    EXPECT_EQ(doc.components().at("mqttop_cpu")["stat_t"], "m/cpu");

    doc.add_component("memory", "mqttop_memory", sensor("mqttop_memory", "m/memory"));
    doc.restore_node("memory", std::move(previous));

    EXPECT_EQ(doc.nodes().at("memory"),
              (std::vector<std::string>{"mqttop_memory", "mqttop_memory_total"}));
    EXPECT_EQ(doc.components().at("mqttop_memory")["stat_t"], "m/memory");
    EXPECT_EQ(doc.components().at("mqttop_memory_total").size(), 1u);

    EXPECT_TRUE(doc.reset_node("unknown").empty());
}

TEST(DiscoveryTest, DiffAddsPlaceholdersForVanishedComponents)
{
    auto old = make_doc(Method::Components);
    add_memory(old);
    add_cpu(old);

    auto doc = make_doc(Method::Device);
    add_memory(doc);

    EXPECT_TRUE(doc.diff(old));
    EXPECT_EQ(doc.components().at("mqttop_cpu"), json({{"p", "sensor"}}));
    EXPECT_EQ(doc.nodes().at("cpu"), (std::vector<std::string>{"mqttop_cpu"}));
    EXPECT_EQ(doc.components().at("mqttop_memory")["stat_t"], "m/memory");

    // Placeholders in the old document are not carried forward twice.
    auto next = make_doc(Method::Device);
    add_memory(next);
    EXPECT_FALSE(next.diff(doc));
    EXPECT_FALSE(next.components().contains("mqttop_cpu"));
}

TEST(DiscoveryTest, WriteThenLoadPreservesDocument)
{
    TempDir dir("mqttop_discovery");
    const auto path = dir / "discovery.json";

    auto doc = make_doc(Method::Nodes);
    add_memory(doc);
    add_cpu(doc);
    ASSERT_FALSE(doc.write(path));

    auto loaded = Discovery::load(path);
    ASSERT_TRUE(loaded.is_ok());
    const auto &d = loaded.content();
    EXPECT_EQ(d.method(), Method::Nodes);
    EXPECT_EQ(d.device(), doc.device());
    EXPECT_EQ(d.origin(), doc.origin());
    EXPECT_EQ(d.components(), doc.components());
    EXPECT_EQ(d.nodes(), doc.nodes());
    EXPECT_EQ(d.object_id(), "abc");
}

TEST(DiscoveryTest, LoadRejectsBadDocuments)
{
    TempDir dir("mqttop_discovery");
    EXPECT_TRUE(Discovery::load(dir / "missing.json").is_error());

    write_file(dir / "bad.json", "{\"o\": {}");
    auto bad = Discovery::load(dir / "bad.json");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error(), Errc::invalid_document);

    write_file(dir / "nocmps.json", R"({"dev": {"ids": ["abc"]}})");
    EXPECT_EQ(Discovery::load(dir / "nocmps.json").error(), Errc::invalid_document);

    write_file(dir / "method.json", R"({"cmps": {}, "_method": "smoke"})");
    EXPECT_EQ(Discovery::load(dir / "method.json").error(), Errc::invalid_document);
}

TEST_F(DiscoveryPublishTest, DeviceMethodPublishesOnePayload)
{
    auto doc = make_doc(Method::Device);
    add_memory(doc);
    ASSERT_FALSE(doc.publish({}, m_client));

    const auto msg = m_client.last_published_to("homeassistant/device/mqttop/abc/config");
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->retained);
    const auto j = json::parse(msg->payload);
    EXPECT_EQ(j["dev"]["ids"][0], "abc");
    EXPECT_EQ(j["o"]["name"], "mqttop");
    EXPECT_EQ(j["cmps"].size(), 2u);
    EXPECT_EQ(m_client.published().size(), 1u);
}

TEST_F(DiscoveryPublishTest, ComponentsMethodPublishesEachComponent)
{
    auto doc = make_doc(Method::Components);
    add_memory(doc);
    add_cpu(doc);
    doc.reset_node("cpu");
    ASSERT_FALSE(doc.publish({}, m_client));

    EXPECT_EQ(m_client.published().size(), 3u);
    const auto mem = m_client.published_to("homeassistant/sensor/mqttop/mqttop_memory/config");
    ASSERT_EQ(mem.size(), 1u);
    const auto j = json::parse(mem.front());
    EXPECT_FALSE(j.contains("p"));
    EXPECT_EQ(j["dev"]["name"], "Host");
    EXPECT_EQ(j["stat_t"], "m/memory");

    // Removal placeholder.
    EXPECT_EQ(m_client.published_to("homeassistant/sensor/mqttop/mqttop_cpu/config"),
              (std::vector<std::string>{""}));
}

TEST_F(DiscoveryPublishTest, NodesMethodPublishesPerProducer)
{
    auto doc = make_doc(Method::Nodes);
    add_memory(doc);
    add_cpu(doc);
    ASSERT_FALSE(doc.publish({}, m_client));

    const auto mem = m_client.last_published_to("homeassistant/device/mqttop_memory/abc/config");
    const auto cpu = m_client.last_published_to("homeassistant/device/mqttop_cpu/abc/config");
    ASSERT_TRUE(mem && cpu);
    EXPECT_EQ(json::parse(mem->payload)["cmps"].size(), 2u);
    EXPECT_EQ(json::parse(cpu->payload)["cmps"].size(), 1u);

    m_client.clear_published();
    ASSERT_FALSE(doc.publish_node({}, m_client, "cpu"));
    ASSERT_EQ(m_client.published().size(), 1u);
    EXPECT_EQ(m_client.published().front().topic, "homeassistant/device/mqttop_cpu/abc/config");
}

TEST_F(DiscoveryPublishTest, PublishNodeInComponentsMethodSendsOnlyThatNode)
{
    auto doc = make_doc(Method::Components);
    add_memory(doc);
    add_cpu(doc);
    ASSERT_FALSE(doc.publish_node({}, m_client, "memory"));
    EXPECT_EQ(m_client.published().size(), 2u);
    EXPECT_TRUE(m_client.published_to("homeassistant/sensor/mqttop/mqttop_cpu/config").empty());
    EXPECT_FALSE(doc.publish_node({}, m_client, "unknown"));
}

TEST_F(DiscoveryPublishTest, MigrationFromComponentsToDevice)
{
    auto doc = make_doc(Method::Device);
    add_memory(doc);
    ASSERT_FALSE(doc.publish({}, m_client, true));

    const auto topic = "homeassistant/sensor/mqttop/mqttop_memory/config";
    EXPECT_EQ(m_client.published_to(topic), (std::vector<std::string>{kMigrate, ""}));
    EXPECT_TRUE(m_client.retained("homeassistant/device/mqttop/abc/config").has_value());
    EXPECT_FALSE(m_client.retained(topic).has_value());
}

TEST_F(DiscoveryPublishTest, MigrationFromDeviceToComponents)
{
    auto doc = make_doc(Method::Components);
    add_memory(doc);
    ASSERT_FALSE(doc.publish({}, m_client, true));

    const auto device = "homeassistant/device/mqttop/abc/config";
    EXPECT_EQ(m_client.published_to(device), (std::vector<std::string>{kMigrate, ""}));
    EXPECT_EQ(m_client.published().front().topic, device);
    EXPECT_EQ(m_client.published_to("homeassistant/sensor/mqttop/mqttop_memory/config").size(), 1u);
}

TEST_F(DiscoveryPublishTest, PublishErrorIsReturned)
{
    m_client.set_publish_error("homeassistant/#", make_error_code(mqtt::Errc::publish_failed));
    auto doc = make_doc();
    add_memory(doc);
    EXPECT_EQ(doc.publish({}, m_client), mqtt::Errc::publish_failed);
}

TEST_F(DiscoveryPublishTest, WaitsForConfiguredPayload)
{
    Options o;
    o.wait_topic = "homeassistant/status";
    o.wait_payload = "online";
    auto doc = make_doc(Method::Device, o);
    add_memory(doc);

    auto result = std::async(std::launch::async, [&] { return doc.publish({}, m_client); });
    ASSERT_TRUE(wait_until(
        [&] { return m_client.subscriptions() == std::vector<std::string>{"homeassistant/status"}; }));

    m_client.inject("homeassistant/status", "offline");
    m_client.drain();
    EXPECT_EQ(result.wait_for(50ms), std::future_status::timeout);
    EXPECT_TRUE(m_client.published().empty());

    m_client.inject("homeassistant/status", "online");
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_EQ(m_client.published().size(), 1u);
    EXPECT_TRUE(m_client.subscriptions().empty());
}

TEST_F(DiscoveryPublishTest, WaitIsCancellable)
{
    Options o;
    o.wait_topic = "homeassistant/status";
    auto doc = make_doc(Method::Device, o);
    add_memory(doc);

    std::stop_source ss;
    auto result = std::async(std::launch::async, [&] { return doc.publish(ss.get_token(), m_client); });
    ASSERT_TRUE(wait_until([&] { return !m_client.subscriptions().empty(); }));
    ss.request_stop();
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(result.get());
    EXPECT_TRUE(m_client.published().empty());
}

TEST_F(DiscoveryPublishTest, SubscribeStatusFiresOnOnline)
{
    auto doc = make_doc();
    std::atomic<int> online{0};
    ASSERT_FALSE(doc.subscribe_status({}, m_client, [&] { ++online; }));

    m_client.inject("homeassistant/status", "online");
    m_client.inject("homeassistant/status", "offline");
    m_client.inject("homeassistant/status", "online");
    m_client.drain();
    EXPECT_EQ(online.load(), 2);
}
