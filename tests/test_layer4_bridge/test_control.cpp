/**
 * @file test_control.cpp
 * @brief `/update` payload handling.
 */
#include "bridge/control.hpp"
#include "fake_metric.hpp"

#include <gtest/gtest.h>

using namespace mqttop;
using namespace std::chrono_literals;

TEST(ControlPayloadTest, EmptyPayloadChangesNothing)
{
    tests::FakeMetric m("fake", "t/fake");
    EXPECT_FALSE(bridge::apply_update_payload(m, ""));
    EXPECT_FALSE(bridge::apply_update_payload(m, "  \n"));
    EXPECT_FALSE(m.interval().has_value());
    EXPECT_EQ(m.selection_mode(), "");
}

TEST(ControlPayloadTest, AppliesIntervalAndSelectionMode)
{
    tests::FakeMetric m("fake", "t/fake");
    EXPECT_FALSE(bridge::apply_update_payload(
        m, R"({"interval": "1m30s", "selection_mode": "manual"})"));
    EXPECT_EQ(m.interval(), 90s);
    EXPECT_EQ(m.selection_mode(), "manual");
}

TEST(ControlPayloadTest, BadValuesAreIgnored)
{
    tests::FakeMetric m("fake", "t/fake");
    EXPECT_FALSE(bridge::apply_update_payload(m, R"({"interval": "soon", "other": 1})"));
    EXPECT_FALSE(bridge::apply_update_payload(m, R"({"interval": 5})"));
    EXPECT_FALSE(m.interval().has_value());
}

TEST(ControlPayloadTest, NonObjectPayloadIsInvalid)
{
    tests::FakeMetric m("fake", "t/fake");
    EXPECT_EQ(bridge::apply_update_payload(m, "{not json"), std::errc::invalid_argument);
    EXPECT_EQ(bridge::apply_update_payload(m, "[1, 2]"), std::errc::invalid_argument);
    EXPECT_EQ(bridge::apply_update_payload(m, "\"interval\""), std::errc::invalid_argument);
}
