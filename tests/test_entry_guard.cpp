#include "../src/EntryGuard.h"
#include "../src/OmsState.h"
#include <gtest/gtest.h>

namespace {

using Clock = EntryGuard::Clock;
using std::chrono::seconds;

const Clock::time_point T0 = Clock::time_point{} + std::chrono::hours(1000);

EntryGuardConfig make_config() {
    EntryGuardConfig config;
    config.max_reorders = 2;
    config.max_cancels = 2;
    config.max_forced_fills = 1;
    config.max_age = seconds(60);
    config.cooldown = seconds(30);
    return config;
}

} // namespace

TEST(EntryGuardTest, RejectsNonPositiveLimits) {
    auto config = make_config();
    config.max_reorders = 0;
    EXPECT_THROW(EntryGuard{config}, std::invalid_argument);

    config = make_config();
    config.cooldown = seconds(0);
    EXPECT_THROW(EntryGuard{config}, std::invalid_argument);
}

TEST(EntryGuardTest, InitIsIdempotentAndDefaultsStartToNow) {
    EntryGuard guard(make_config());
    guard.init_entry_budget("e1", "m1", Clock::time_point{}, T0);
    guard.init_entry_budget("e1", "m1", T0 + seconds(5), T0 + seconds(5));

    const auto budget = guard.get_budget("e1");
    ASSERT_TRUE(budget.has_value());
    EXPECT_EQ(budget->started_at, T0);
    EXPECT_EQ(budget->market, "m1");
    EXPECT_EQ(budget->reorders, 0);
}

TEST(EntryGuardTest, ReordersStopAtLimitAndRaiseCooldown) {
    EntryGuard guard(make_config());
    EXPECT_TRUE(guard.consume_reorder_attempt("e1", "m1", T0, T0));
    EXPECT_TRUE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(1)));
    EXPECT_FALSE(guard.market_cooldown("m1", T0 + seconds(1)).has_value());

    EXPECT_FALSE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(2)));
    EXPECT_EQ(guard.get_budget("e1")->reorders, 2);

    const auto cooldown = guard.market_cooldown("m1", T0 + seconds(2));
    ASSERT_TRUE(cooldown.has_value());
    EXPECT_EQ(cooldown->reason, "entry_reorder_exceeded 2");
    EXPECT_EQ(cooldown->remaining, seconds(30));
}

TEST(EntryGuardTest, AgedEntryIsRefusedBeforeCountingReorders) {
    EntryGuard guard(make_config());
    EXPECT_FALSE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(61)));
    EXPECT_EQ(guard.get_budget("e1")->reorders, 0);

    const auto cooldown = guard.market_cooldown("m1", T0 + seconds(61));
    ASSERT_TRUE(cooldown.has_value());
    EXPECT_EQ(cooldown->reason, "entry_age_exceeded 61s");
}

TEST(EntryGuardTest, EmptyEntryIdIsAlwaysAllowed) {
    EntryGuard guard(make_config());
    for(int i = 0; i < 5; ++i) {
        EXPECT_TRUE(guard.consume_reorder_attempt("", "m1", T0, T0));
    }
    EXPECT_FALSE(guard.market_cooldown("m1", T0).has_value());
}

TEST(EntryGuardTest, CancelsAboveLimitOnlyRaiseCooldown) {
    EntryGuard guard(make_config());
    guard.record_cancel("e1", "m1", T0, T0);
    guard.record_cancel("e1", "m1", T0, T0);
    EXPECT_FALSE(guard.market_cooldown("m1", T0).has_value());

    guard.record_cancel("e1", "m1", T0, T0);
    EXPECT_EQ(guard.get_budget("e1")->cancels, 3);
    const auto cooldown = guard.market_cooldown("m1", T0);
    ASSERT_TRUE(cooldown.has_value());
    EXPECT_EQ(cooldown->reason, "entry_cancel_exceeded 3");
}

TEST(EntryGuardTest, SecondForcedFillRaisesCooldown) {
    EntryGuard guard(make_config());
    guard.record_forced_fill("e1", "m1", T0, T0);
    EXPECT_FALSE(guard.market_cooldown("m1", T0).has_value());

    guard.record_forced_fill("e1", "m1", T0, T0);
    const auto cooldown = guard.market_cooldown("m1", T0);
    ASSERT_TRUE(cooldown.has_value());
    EXPECT_EQ(cooldown->reason, "entry_fak_exceeded 2");
}

TEST(EntryGuardTest, CooldownNeverShortensAndExpires) {
    EntryGuard guard(make_config());
    guard.set_cooldown("m1", seconds(100), "long", T0);
    guard.set_cooldown("m1", seconds(10), "short", T0);

    ASSERT_TRUE(guard.cooldown_until("m1").has_value());
    EXPECT_EQ(*guard.cooldown_until("m1"), T0 + seconds(100));
    EXPECT_EQ(guard.market_cooldown("m1", T0)->reason, "short");

    EXPECT_FALSE(guard.market_cooldown("m1", T0 + seconds(100)).has_value());
    EXPECT_FALSE(guard.cooldown_until("m1").has_value());
}

TEST(EntryGuardTest, NonPositiveCooldownUsesConfiguredDuration) {
    EntryGuard guard(make_config());
    guard.set_cooldown("m1", seconds(0), "manual", T0);
    EXPECT_EQ(*guard.cooldown_until("m1"), T0 + seconds(30));
}

TEST(EntryGuardTest, ClearAndReset) {
    EntryGuard guard(make_config());
    guard.init_entry_budget("e1", "m1", T0, T0);
    guard.set_cooldown("m1", seconds(10), "manual", T0);

    guard.clear_entry_budget("e1");
    EXPECT_FALSE(guard.get_budget("e1").has_value());
    EXPECT_TRUE(guard.market_cooldown("m1", T0).has_value());

    guard.reset();
    EXPECT_FALSE(guard.market_cooldown("m1", T0).has_value());
}

TEST(EntryGuardTest, AgeCheck) {
    EntryGuard guard(make_config());
    EXPECT_FALSE(guard.entry_age_exceeded(T0, T0 + seconds(60)));
    EXPECT_TRUE(guard.entry_age_exceeded(T0, T0 + seconds(61)));
}

TEST(EntryGuardTest, FourthReorderOnDefaultBudgetIsRefused) {
    EntryGuard guard(EntryGuardConfig{});
    for(int i = 0; i < 3; ++i) {
        EXPECT_TRUE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(i)));
    }
    EXPECT_FALSE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(3)));

    const auto cooldown = guard.market_cooldown("m1", T0 + seconds(3));
    ASSERT_TRUE(cooldown.has_value());
    EXPECT_NE(cooldown->reason.find("entry_reorder_exceeded 3"), std::string::npos);
}

TEST(EntryGuardTest, RefusalsAndCooldownsAreQueuedUntilDrained) {
    EntryGuard guard(make_config());
    EXPECT_TRUE(guard.drain_events().empty());

    EXPECT_TRUE(guard.consume_reorder_attempt("e1", "m1", T0, T0));
    EXPECT_TRUE(guard.consume_reorder_attempt("e1", "m1", T0, T0));
    EXPECT_TRUE(guard.drain_events().empty());

    EXPECT_FALSE(guard.consume_reorder_attempt("e1", "m1", T0, T0 + seconds(1)));
    const auto events = guard.drain_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, GuardEvent::Kind::COOLDOWN);
    EXPECT_EQ(events[0].market, "m1");
    EXPECT_EQ(events[0].reason, "entry_reorder_exceeded 2");
    EXPECT_EQ(events[1].kind, GuardEvent::Kind::REORDER_REFUSED);
    EXPECT_EQ(events[1].entry_id, "e1");
    EXPECT_EQ(events[1].reason, "entry_reorder_exceeded");

    EXPECT_TRUE(guard.drain_events().empty());
}

TEST(EntryGuardTest, StateDrainsGuardEventsBeforeReleasingTheLock) {
    OmsState state(make_config());
    state.with_entry_guard([](EntryGuard& guard) {
        guard.record_forced_fill("e1", "m1", T0, T0);
        guard.record_forced_fill("e1", "m1", T0, T0);
    });

    const auto leftover = state.with_entry_guard([](EntryGuard& guard) { return guard.drain_events().size(); });
    EXPECT_EQ(leftover, 0u);
    EXPECT_TRUE(state.with_entry_guard([](EntryGuard& guard) { return guard.market_cooldown("m1", T0).has_value(); }));
}
