#include <atomic>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include "../../src/cdp/waiter.hpp"

using namespace Tether::CDP;

TEST(WaiterTest, FirstSettlementWins) {
    Waiter<int> waiter;
    EXPECT_TRUE(waiter.resolve(1));
    EXPECT_FALSE(waiter.resolve(2));
    EXPECT_FALSE(waiter.fail(std::runtime_error("late")));
    EXPECT_TRUE(waiter.is_settled());
    EXPECT_FALSE(waiter.is_rejected());
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(0)).value(), 1);
}

TEST(WaiterTest, RejectionIsRethrown) {
    Waiter<int> waiter;
    EXPECT_TRUE(waiter.fail(std::runtime_error("boom")));
    EXPECT_FALSE(waiter.resolve(3));
    EXPECT_TRUE(waiter.is_rejected());
    EXPECT_THROW(waiter.wait_for(std::chrono::milliseconds(10)), std::runtime_error);
}

TEST(WaiterTest, WaitForTimesOut) {
    Waiter<int> waiter;
    EXPECT_FALSE(waiter.wait_for(std::chrono::milliseconds(20)).has_value());
    EXPECT_FALSE(waiter.is_settled());
}

TEST(WaiterTest, WaitForWakesOnOtherThread) {
    Waiter<std::string> waiter;
    std::thread         settler([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        waiter.resolve("done");
    });
    auto value = waiter.wait_for(std::chrono::seconds(5));
    settler.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "done");
}

TEST(WaiterTest, CoroutineReceivesValue) {
    boost::asio::io_context io_context;
    auto                    waiter = std::make_shared<Waiter<int>>();
    int                     result = 0;

    boost::asio::co_spawn(
        io_context,
        [waiter, &result]() -> boost::asio::awaitable<void> { result = co_await waiter->wait(); },
        boost::asio::detached);

    io_context.poll();
    EXPECT_EQ(result, 0);

    waiter->resolve(42);
    // Resumption is posted, never inline in resolve().
    EXPECT_EQ(result, 0);

    io_context.restart();
    io_context.run();
    EXPECT_EQ(result, 42);
}

TEST(WaiterTest, CoroutineAfterSettlement) {
    boost::asio::io_context io_context;
    auto                    waiter = std::make_shared<Waiter<int>>();
    waiter->fail(std::logic_error("closed"));

    std::string caught;
    boost::asio::co_spawn(
        io_context,
        [waiter, &caught]() -> boost::asio::awaitable<void> {
            try {
                co_await waiter->wait();
            } catch (const std::logic_error& e) {
                caught = e.what();
            }
        },
        boost::asio::detached);

    io_context.run();
    EXPECT_EQ(caught, "closed");
}

TEST(WaiterTest, ConcurrentSettlersResolveOnce) {
    Waiter<int>              waiter;
    std::atomic<int>         wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            if (i % 2 ? waiter.resolve(i) : waiter.fail(std::runtime_error("x")))
                ++wins;
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(wins.load(), 1);
}
