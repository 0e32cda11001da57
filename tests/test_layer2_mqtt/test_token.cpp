/**
 * @file test_token.cpp
 * @brief Unit tests for mqtt::Token completion, waiting and cancellation.
 */
#include "mqtt/errors.hpp"
#include "mqtt/token.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace mqttop::mqtt;
using namespace std::chrono_literals;

TEST(TokenTest, CompletesOnceWithFirstError)
{
    Token t;
    EXPECT_FALSE(t.is_done());
    t.complete(Errc::publish_failed);
    t.complete({});
    EXPECT_TRUE(t.is_done());
    EXPECT_EQ(t.error(), Errc::publish_failed);
}

TEST(TokenTest, HandlersRunOnCompletionOrImmediately)
{
    Token t;
    std::atomic<int> calls{0};
    t.on_complete([&](const std::error_code &ec) {
        EXPECT_FALSE(ec);
        ++calls;
    });
    EXPECT_EQ(calls.load(), 0);
    t.complete();
    EXPECT_EQ(calls.load(), 1);

    t.on_complete([&](const std::error_code &) { ++calls; });
    EXPECT_EQ(calls.load(), 2);
}

TEST(TokenTest, WaitReturnsWhenCompletedFromAnotherThread)
{
    auto t = std::make_shared<Token>();
    std::thread completer([t] {
        std::this_thread::sleep_for(10ms);
        t->complete();
    });
    EXPECT_TRUE(t->wait());
    completer.join();
}

TEST(TokenTest, WaitForTimesOut)
{
    Token t;
    EXPECT_FALSE(t.wait_for(10ms));
}

TEST(TokenTest, CancelledWaitIsNotAnError)
{
    auto t = std::make_shared<Token>();
    std::stop_source ss;
    std::thread canceller([&] {
        std::this_thread::sleep_for(10ms);
        ss.request_stop();
    });
    EXPECT_FALSE(wait_token(ss.get_token(), t));
    canceller.join();
    EXPECT_FALSE(t->is_done());
}

TEST(TokenTest, WaitTokenReturnsOperationError)
{
    EXPECT_EQ(wait_token({}, make_completed_token(Errc::subscribe_failed)), Errc::subscribe_failed);
    EXPECT_FALSE(wait_token({}, make_completed_token()));
    EXPECT_FALSE(wait_token({}, nullptr));
}

TEST(TokenTest, ErrorCategoryHasMessages)
{
    const std::error_code ec = Errc::not_connected;
    EXPECT_STREQ(ec.category().name(), "mqtt");
    EXPECT_FALSE(ec.message().empty());
}
