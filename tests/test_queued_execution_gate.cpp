#include "../src/QueuedExecutionGate.h"
#include "fake_substrate.h"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

GateConfig fast_gate(std::chrono::milliseconds interval = std::chrono::milliseconds(0), size_t capacity = 16) {
    GateConfig config;
    config.capacity = capacity;
    config.min_interval = interval;
    return config;
}

} // namespace

TEST(QueuedExecutionGateTest, ReturnsResultOfWork) {
    QueuedExecutionGate gate(fast_gate());
    EXPECT_EQ(gate.submit(std::stop_token{}, [] { return 42; }), 42);

    bool ran = false;
    gate.submit(std::stop_token{}, [&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(QueuedExecutionGateTest, RethrowsWorkErrorOnCaller) {
    QueuedExecutionGate gate(fast_gate());
    EXPECT_THROW(gate.submit(std::stop_token{},
                             []() -> int { throw SubstrateError(SubstrateError::Kind::Refusal, "nope"); }),
                 SubstrateError);
    // the worker survives a failing job
    EXPECT_EQ(gate.submit(std::stop_token{}, [] { return 1; }), 1);
}

TEST(QueuedExecutionGateTest, NeverRunsTwoJobsAtOnce) {
    QueuedExecutionGate gate(fast_gate());
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    std::vector<std::thread> callers;
    for(int i = 0; i < 8; ++i) {
        callers.emplace_back([&] {
            for(int j = 0; j < 10; ++j) {
                gate.submit(std::stop_token{}, [&] {
                    const int now_active = ++active;
                    int seen = max_active.load();
                    while(now_active > seen && !max_active.compare_exchange_weak(seen, now_active)) {
                    }
                    std::this_thread::sleep_for(std::chrono::microseconds(200));
                    --active;
                });
            }
        });
    }
    for(auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(max_active.load(), 1);
}

TEST(QueuedExecutionGateTest, SpacesConsecutiveJobs) {
    QueuedExecutionGate gate(fast_gate(std::chrono::milliseconds(40)));
    std::vector<std::chrono::steady_clock::time_point> runs;
    for(int i = 0; i < 3; ++i) {
        gate.submit(std::stop_token{}, [&runs] { runs.push_back(std::chrono::steady_clock::now()); });
    }
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_GE(runs[1] - runs[0], std::chrono::milliseconds(40));
    EXPECT_GE(runs[2] - runs[1], std::chrono::milliseconds(40));
}

TEST(QueuedExecutionGateTest, StoppedTokenIsRefusedBeforeQueueing) {
    QueuedExecutionGate gate(fast_gate());
    std::stop_source source;
    source.request_stop();

    bool ran = false;
    EXPECT_THROW(gate.submit(source.get_token(), [&ran] { ran = true; }), GateCancelledError);
    EXPECT_FALSE(ran);
}

TEST(QueuedExecutionGateTest, ClosedGateRefusesWork) {
    QueuedExecutionGate gate(fast_gate());
    gate.close();
    gate.close();
    EXPECT_TRUE(gate.is_closed());
    EXPECT_THROW(gate.submit(std::stop_token{}, [] { return 1; }), GateClosedError);
}

TEST(QueuedExecutionGateTest, CloseDropsQueuedWork) {
    QueuedExecutionGate gate(fast_gate());
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> blocker_running{false};

    auto blocker = std::async(std::launch::async, [&] {
        gate.submit(std::stop_token{}, [&] {
            blocker_running = true;
            released.wait();
        });
    });
    ASSERT_TRUE(test_support::eventually([&] { return blocker_running.load(); }));

    std::atomic<bool> queued_ran{false};
    auto queued = std::async(std::launch::async, [&] { gate.submit(std::stop_token{}, [&] { queued_ran = true; }); });
    ASSERT_TRUE(test_support::eventually([&] { return gate.size() == 1; }));

    auto closer = std::async(std::launch::async, [&] { gate.close(); });
    EXPECT_THROW(queued.get(), GateClosedError);
    EXPECT_FALSE(queued_ran.load());

    release.set_value();
    closer.get();
    // admitted work still completes for its caller
    EXPECT_NO_THROW(blocker.get());
}

TEST(QueuedExecutionGateTest, CancelledCallerStopsWaitingForQueuedWork) {
    QueuedExecutionGate gate(fast_gate());
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> blocker_running{false};

    auto blocker = std::async(std::launch::async, [&] {
        gate.submit(std::stop_token{}, [&] {
            blocker_running = true;
            released.wait();
        });
    });
    ASSERT_TRUE(test_support::eventually([&] { return blocker_running.load(); }));

    std::stop_source source;
    auto waiting = std::async(std::launch::async, [&] { gate.submit(source.get_token(), [] {}); });
    ASSERT_TRUE(test_support::eventually([&] { return gate.size() == 1; }));
    source.request_stop();
    EXPECT_THROW(waiting.get(), GateCancelledError);

    release.set_value();
    blocker.get();
}

TEST(QueuedExecutionGateTest, RoutesSubstrateCalls) {
    const auto market = test_support::make_market();
    FakeSubstrate substrate(market);
    QueuedExecutionGate gate(fast_gate());

    OrderRequest request;
    request.market = market.slug;
    request.asset_id = market.yes_asset_id;
    request.price_pips = cents_to_pips(40);
    request.size = 5.0;
    const Order placed = gate.place_order(std::stop_token{}, substrate, request);
    EXPECT_EQ(placed.status, OrderStatus::OPEN);

    gate.cancel_order(std::stop_token{}, substrate, placed.id);
    EXPECT_EQ(substrate.get_order(placed.id)->status, OrderStatus::CANCELED);
    EXPECT_THROW(gate.cancel_order(std::stop_token{}, substrate, "missing"), SubstrateError);
}

TEST(QueuedExecutionGateTest, ZeroCapacityFallsBackToDefault) {
    QueuedExecutionGate gate(fast_gate(std::chrono::milliseconds(0), 0));
    EXPECT_EQ(gate.get_capacity(), 256u);
}
