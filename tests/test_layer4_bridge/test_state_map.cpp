/**
 * @file test_state_map.cpp
 * @brief StateMap operations and its JSON form.
 */
#include "bridge/state_map.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace mqttop::bridge;

TEST(StateMapTest, StoreGetErase)
{
    StateMap m;
    EXPECT_FALSE(m.get("a").has_value());
    m.store("a", true);
    m.store("b", false);
    EXPECT_EQ(m.get("a"), true);
    EXPECT_EQ(m.get("b"), false);
    EXPECT_EQ(m.size(), 2u);
    m.erase("a");
    m.erase("missing");
    EXPECT_FALSE(m.get("a").has_value());
    EXPECT_EQ(m.size(), 1u);
}

TEST(StateMapTest, CompareAndSwap)
{
    StateMap m;
    EXPECT_FALSE(m.compare_and_swap("a", true, false));
    EXPECT_FALSE(m.get("a").has_value());

    m.store("a", true);
    EXPECT_FALSE(m.compare_and_swap("a", false, true));
    EXPECT_TRUE(m.compare_and_swap("a", true, false));
    EXPECT_EQ(m.get("a"), false);
}

TEST(StateMapTest, JsonIsCompactAndSorted)
{
    StateMap m;
    EXPECT_EQ(m.to_json(), "{}");
    m.store("mqttop/metric/memory", true);
    m.store("mqttop/metric/cpu", false);
    EXPECT_EQ(m.to_json(), R"({"mqttop/metric/cpu":false,"mqttop/metric/memory":true})");
}

TEST(StateMapTest, OnlyOneConcurrentFlipWins)
{
    StateMap m;
    m.store("t", true);
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&] {
            if (m.compare_and_swap("t", true, false))
                ++wins;
        });
    }
    for (auto &t : threads)
        t.join();
    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(m.snapshot(), (std::map<std::string, bool>{{"t", false}}));
}
