/**
 * @file test_config.cpp
 * @brief Config loading, merging, value expansion and validation.
 */
#include "config/config.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <stdexcept>

using namespace mqttop;
using namespace mqttop::config;
using namespace mqttop::tests::helper;
using namespace std::chrono_literals;

namespace
{

class ConfigTest : public ::testing::Test
{
  protected:
    // Keep the developer's environment out of the defaults.
    ScopedEnv m_broker{"MQTTOP_BROKER_ADDRESS", std::nullopt};
    ScopedEnv m_user{"MQTTOP_BROKER_USERNAME", std::nullopt};
    ScopedEnv m_pass{"MQTTOP_BROKER_PASSWORD", std::nullopt};
    ScopedEnv m_path{"MQTTOP_CONFIG_PATH", std::nullopt};
    ScopedEnv m_xdg{"XDG_CONFIG_HOME", std::nullopt};
    TempDir m_dir{"mqttop_config"};
};

} // namespace

TEST_F(ConfigTest, DefaultsAfterFinalize)
{
    Config cfg;
    cfg.finalize();
    EXPECT_EQ(cfg.interval, 2s);
    EXPECT_EQ(cfg.base_topic, "mqttop");
    EXPECT_EQ(cfg.mqtt.broker, "");
    EXPECT_EQ(cfg.mqtt.birth_lwt_topic, "mqttop/bridge/status");
    EXPECT_EQ(cfg.will_topic(), "mqttop/bridge/status");
    EXPECT_EQ(cfg.discovery.availability_topic, "mqttop/bridge/status");
    EXPECT_EQ(cfg.memory.topic, "mqttop/metric/memory");
    EXPECT_EQ(cfg.memory_interval(), 2s);
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_EQ(cfg.log.queue_size, 10000);
}

TEST_F(ConfigTest, FilesMergeInOrder)
{
    const auto a = m_dir / "a.json";
    const auto b = m_dir / "b.json";
    write_file(a, R"({"interval": "5s", "mqtt": {"broker": "broker.a", "client_id": "first"},
                      "memory": {"include_swap": true}})");
    write_file(b, R"({"base_topic": "host1", "mqtt": {"broker": "ssl://broker.b"},
                      "memory": {"interval": 30}})");

    auto cfg = Config::load({a, b});
    cfg.finalize();

    EXPECT_EQ(cfg.interval, 5s);
    EXPECT_EQ(cfg.base_topic, "host1");
    EXPECT_EQ(cfg.mqtt.broker, "ssl://broker.b:8883");
    EXPECT_EQ(cfg.mqtt.client_id, "first");
    EXPECT_TRUE(cfg.memory.include_swap);
    EXPECT_EQ(cfg.memory_interval(), 30s);
    EXPECT_EQ(cfg.memory.topic, "host1/metric/memory");
    EXPECT_EQ(cfg.will_topic(), "host1/bridge/status");
}

TEST_F(ConfigTest, ClientOptionsCarryTheWill)
{
    Config cfg;
    cfg.mqtt.broker = "localhost";
    cfg.mqtt.keep_alive = 45s;
    cfg.finalize();
    auto o = cfg.mqtt.client_options();
    EXPECT_EQ(o.broker, "tcp://localhost:1883");
    EXPECT_EQ(o.keep_alive, 45s);
    EXPECT_TRUE(o.will.enabled);
    EXPECT_EQ(o.will.topic, "mqttop/bridge/status");

    cfg.mqtt.birth_lwt_enabled = false;
    EXPECT_FALSE(cfg.mqtt.client_options().will.enabled);
    EXPECT_EQ(cfg.will_topic(), "");
}

TEST_F(ConfigTest, EnvironmentExpansion)
{
    ScopedEnv host("MQTTOP_TEST_HOST", std::string("broker.env"));
    ScopedEnv user("MQTTOP_TEST_USER", std::string("alice"));

    EXPECT_EQ(expand_value("${MQTTOP_TEST_HOST}:1884"), "broker.env:1884");
    EXPECT_EQ(expand_value("user-$MQTTOP_TEST_USER!"), "user-alice!");
    EXPECT_EQ(expand_value("env:MQTTOP_TEST_USER"), "alice");
    EXPECT_EQ(expand_value("${MQTTOP_TEST_UNSET_VARIABLE}"), "");
    EXPECT_EQ(expand_value("cost $5"), "cost ");
    EXPECT_EQ(expand_value("trailing $"), "trailing $");
    EXPECT_EQ(expand_value("${unterminated"), "${unterminated");
}

TEST_F(ConfigTest, DefaultsReadBrokerFromEnvironment)
{
    ScopedEnv broker("MQTTOP_BROKER_ADDRESS", std::string("10.0.0.2"));
    ScopedEnv user("MQTTOP_BROKER_USERNAME", std::string("bob"));
    Config cfg;
    cfg.discovery.device_name = "username";
    cfg.finalize();
    EXPECT_EQ(cfg.mqtt.broker, "tcp://10.0.0.2:1883");
    EXPECT_EQ(cfg.mqtt.username, "bob");
    EXPECT_EQ(cfg.discovery.device_name, "bob");
}

TEST_F(ConfigTest, SecretsAreReadFromSecretsDir)
{
    ScopedEnv dir("MQTTOP_SECRETS_DIR", m_dir.path().string());
    write_file(m_dir / "mqtt_password", "s3cret\n");
    EXPECT_EQ(expand_value("!secret mqtt_password"), "s3cret");
    EXPECT_EQ(expand_value("!secret missing"), "");
}

TEST_F(ConfigTest, TopicsAnchorAtBase)
{
    EXPECT_EQ(expand_topic("~/status", "base"), "base/status");
    EXPECT_EQ(expand_topic("status/~", "base"), "status/base");
    EXPECT_EQ(expand_topic("plain/topic", "base"), "plain/topic");
    EXPECT_EQ(expand_topic("~/x", ""), "~/x");
    EXPECT_EQ(expand_topic("", "base"), "");
}

TEST_F(ConfigTest, InvalidValuesThrow)
{
    const auto f = m_dir / "bad.json";
    write_file(f, R"({"interval": "soon"})");
    EXPECT_THROW(Config::load({f}), std::runtime_error);

    write_file(f, R"({"discovery": {"qos": "high"}})");
    EXPECT_THROW(Config::load({f}), std::runtime_error);

    write_file(f, R"({"mqtt": "not an object"})");
    EXPECT_THROW(Config::load({f}), std::runtime_error);

    write_file(f, "{ not json");
    EXPECT_THROW(Config::load({f}), std::runtime_error);

    EXPECT_THROW(Config::load({m_dir / "missing.json"}), std::runtime_error);

    Config cfg;
    cfg.discovery.method = "everything";
    EXPECT_THROW(cfg.finalize(), std::runtime_error);

    Config qos;
    qos.discovery.qos = 3;
    EXPECT_THROW(qos.finalize(), std::runtime_error);

    Config queue;
    queue.log.queue_size = 0;
    EXPECT_THROW(queue.finalize(), std::runtime_error);

    Config unit;
    unit.memory.size_unit = "XB";
    EXPECT_THROW(unit.finalize(), std::runtime_error);

    Config level;
    level.log.level = "chatty";
    EXPECT_THROW(level.finalize(), std::runtime_error);
}

TEST_F(ConfigTest, DiscoveryOptionsMapMethod)
{
    Config cfg;
    cfg.discovery.method = "nodes";
    cfg.discovery.prefix = "ha";
    cfg.finalize();
    const auto o = cfg.discovery.options();
    EXPECT_EQ(o.method, discovery::Method::Nodes);
    EXPECT_EQ(o.prefix, "ha");
    EXPECT_EQ(o.availability_topic, "mqttop/bridge/status");
}

TEST_F(ConfigTest, SearchPathTakesFirstExistingFile)
{
    const auto second = m_dir / "second.json";
    const auto third = m_dir / "third.json";
    write_file(second, R"({"base_topic": "from-second"})");
    write_file(third, R"({"base_topic": "from-third"})");
    ScopedEnv path("MQTTOP_CONFIG_PATH", fmt::format("{}, {},{}", (m_dir / "first.json").string(),
                                                      second.string(), third.string()));
    ScopedEnv home("HOME", m_dir.path().string());

    const auto found = Config::search_path();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found.front(), second);

    const auto cfg = Config::load({});
    EXPECT_EQ(cfg.base_topic, "from-second");
}

TEST_F(ConfigTest, NoFileMeansDefaults)
{
    ScopedEnv home("HOME", m_dir.path().string());
    EXPECT_TRUE(Config::search_path().empty());
    const auto cfg = Config::load({});
    EXPECT_EQ(cfg.base_topic, "mqttop");
}
