/**
 * @file test_periodic_metric.cpp
 * @brief Ticker semantics of PeriodicMetric.
 */
#include "metrics/errors.hpp"
#include "metrics/periodic_metric.hpp"

#include <gtest/gtest.h>

#include <atomic>

using namespace mqttop::metrics;
using namespace std::chrono_literals;

namespace
{

class CountingMetric final : public PeriodicMetric
{
  public:
    explicit CountingMetric(std::chrono::milliseconds interval) : PeriodicMetric(interval) {}
    ~CountingMetric() override { join(); }

    std::string type() const override { return "counting"; }
    std::string topic() const override { return "test/counting"; }

    std::error_code update() override
    {
        const int n = ++updates;
        return n % 2 == 0 ? make_error_code(Errc::no_change) : std::error_code{};
    }

    std::error_code append_text(std::string &out) const override
    {
        out += std::to_string(updates.load());
        return {};
    }

    std::atomic<int> updates{0};
};

} // namespace

TEST(PeriodicMetricTest, SendsEveryOutcome)
{
    CountingMetric m(10ms);
    std::stop_source ss;
    ASSERT_FALSE(m.start(ss.get_token()));

    auto first = m.updated().receive();
    auto second = m.updated().receive();
    ASSERT_TRUE(first && second);
    EXPECT_FALSE(*first);
    EXPECT_EQ(*second, Errc::no_change);

    m.stop();
    while (m.updated().receive())
    {
    }
    EXPECT_TRUE(m.updated().is_closed());
}

TEST(PeriodicMetricTest, ZeroIntervalIsDisabled)
{
    CountingMetric m(0ms);
    EXPECT_EQ(m.start({}), Errc::disabled);
    EXPECT_EQ(m.updates.load(), 0);

    // stop() still closes the channel of a metric that never ran.
    m.stop();
    EXPECT_TRUE(m.updated().is_closed());
}

TEST(PeriodicMetricTest, StartsOnlyOnce)
{
    CountingMetric m(1h);
    ASSERT_FALSE(m.start({}));
    EXPECT_EQ(m.start({}), Errc::already_running);
    m.stop();
}

TEST(PeriodicMetricTest, ParentStopTokenStopsTicker)
{
    CountingMetric m(10ms);
    std::stop_source ss;
    ASSERT_FALSE(m.start(ss.get_token()));
    ASSERT_TRUE(m.updated().receive().has_value());
    ss.request_stop();
    while (m.updated().receive())
    {
    }
    EXPECT_TRUE(m.updated().is_closed());
}

TEST(PeriodicMetricTest, SetIntervalRestartsThePeriod)
{
    CountingMetric m(1h);
    ASSERT_FALSE(m.start({}));
    EXPECT_FALSE(m.updated().try_receive().has_value());

    m.set_interval(10ms);
    EXPECT_EQ(m.interval(), 10ms);
    auto outcome = m.updated().receive();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_GE(m.updates.load(), 1);
    m.stop();
}

TEST(PeriodicMetricTest, SelectionModeIsUnsupportedByDefault)
{
    CountingMetric m(1s);
    ASSERT_NE(m.as_reconfigurable(), nullptr);
    EXPECT_EQ(m.as_reconfigurable()->set_selection_mode("auto"), Errc::not_supported);
    EXPECT_EQ(m.as_discoverer(), nullptr);
}
