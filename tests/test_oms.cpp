#include "../oms/papersubstrate.hpp"
#include "../src/Oms.h"
#include "fake_substrate.h"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::seconds;
using test_support::eventually;
using test_support::make_book;
using test_support::make_filled_entry;
using test_support::make_market;
using test_support::make_resting_hedge;

class OmsTest : public ::testing::Test {
protected:
    OmsTest()
        : market_(make_market())
        , substrate_(market_) {}

    static OmsConfig base_config(const MarketInfo& market) {
        OmsConfig config;
        config.market = market;
        config.execution.gate.min_interval = milliseconds(0);
        config.execution.sequential_check_interval = milliseconds(10);
        config.execution.sequential_max_wait = milliseconds(500);
        config.execution.hedge_fallback_delay = milliseconds(50);
        config.hedge.top_of_book_timeout = milliseconds(10);
        config.hedge.cancel_settle_delay = milliseconds(0);
        config.hedge.check_interval = milliseconds(50);
        config.hedge.aggressive_hedge_timeout = seconds(60);
        config.settlement.merge_delay = seconds(0);
        return config;
    }

    void build(const OmsConfig& config) {
        oms_ = std::make_unique<Oms>(config, substrate_, settlement_);
        substrate_.set_order_update_callback([this](const Order& order) { oms_->on_order_update(order); });
        // UP ask 40, DOWN ask 62
        substrate_.set_book(market_.slug, make_book(38, 40, 60, 62));
    }

    static Decision decision(double size = 10.0) {
        Decision d;
        d.entry_token = TokenSide::UP;
        d.entry_price_pips = cents_to_pips(40);
        d.entry_size = size;
        d.hedge_price_pips = cents_to_pips(57);
        d.hedge_size = size;
        return d;
    }

    OmsContext& context() { return oms_->context(); }

    MarketInfo market_;
    FakeSubstrate substrate_;
    RecordingSettlement settlement_;
    std::unique_ptr<Oms> oms_;
};

TEST_F(OmsTest, SequentialRoundTripSettlesAfterHedgeFill) {
    build(base_config(market_));

    const auto result = oms_->execute_order(market_, decision());
    ASSERT_TRUE(result.ok) << result.reason;
    EXPECT_TRUE(oms_->has_unhedged_risk(market_.slug));
    EXPECT_EQ(oms_->pending_hedges().at(result.entry_order_id), result.hedge_order_id);

    // the missing-hedge fallback sees the executor's hedge and stands down
    std::this_thread::sleep_for(milliseconds(200));
    EXPECT_EQ(substrate_.placed().size(), 2u);

    substrate_.fill(result.hedge_order_id);
    EXPECT_TRUE(oms_->pending_hedges().empty());
    EXPECT_FALSE(context().risk().has_exposure(result.entry_order_id));
    EXPECT_EQ(context().state().read_timing(
                  [&](const HedgeTimingTracker& timing) { return timing.get_sample_count(market_.slug); }),
              1u);
    EXPECT_TRUE(eventually([&] { return settlement_.merged().size() == 1; }));
    EXPECT_EQ(settlement_.merged()[0], market_.slug);
    EXPECT_FALSE(oms_->has_unhedged_risk(market_.slug));
}

TEST_F(OmsTest, FallbackHedgesEntryReportedWithoutHedge) {
    build(base_config(market_));
    const auto entry = make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now());
    substrate_.put_order(entry);

    oms_->on_order_update(entry);
    EXPECT_TRUE(context().risk().has_exposure("e1"));

    ASSERT_TRUE(eventually([&] { return oms_->pending_hedges().count("e1") > 0; }));
    const auto placed = substrate_.placed();
    ASSERT_EQ(placed.size(), 1u);
    EXPECT_EQ(placed[0].token, TokenSide::DOWN);
    EXPECT_EQ(placed[0].price_pips, cents_to_pips(57));
    EXPECT_EQ(placed[0].linked_order_id, "e1");

    // a repeated fill report does not hedge twice
    oms_->on_order_update(entry);
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_EQ(substrate_.placed().size(), 1u);
}

TEST_F(OmsTest, NoFallbackInParallelMode) {
    auto config = base_config(market_);
    config.execution.mode = ExecutionMode::PARALLEL;
    build(config);

    oms_->on_order_update(make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now()));
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_TRUE(substrate_.placed().empty());
    EXPECT_TRUE(context().risk().has_exposure("e1"));
}

TEST_F(OmsTest, LateEntryReportWithFilledPairedHedgeOpensNoExposure) {
    auto config = base_config(market_);
    config.execution.mode = ExecutionMode::PARALLEL;
    build(config);
    const auto entry = make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now());
    auto hedge = make_resting_hedge("h1", entry, 62);
    hedge.linked_order_id.clear();
    hedge.status = OrderStatus::FILLED;
    hedge.filled_size = hedge.size;
    hedge.filled_at = Clock::now() + seconds(1);
    substrate_.put_order(entry);
    substrate_.put_order(hedge);
    context().state().record_pair("e1", "h1");

    oms_->on_order_update(entry);

    EXPECT_FALSE(context().risk().has_exposure("e1"));
    EXPECT_FALSE(context().state().has_monitor("e1"));
    EXPECT_EQ(context().state().read_timing([&](const HedgeTimingTracker& timing) { return timing.get_pending_count(); }),
              0u);
}

TEST(OmsParallelPaperTest, HedgeFilledOnPlacementClosesExposure) {
    const MarketInfo market = make_market();
    OmsConfig config;
    config.market = market;
    config.execution.mode = ExecutionMode::PARALLEL;
    config.execution.gate.min_interval = milliseconds(0);
    config.hedge.offset_cents = 0;
    config.hedge.allow_negative_profit_on_reorder = true;
    config.hedge.max_negative_profit_cents = 5;
    config.hedge.top_of_book_timeout = milliseconds(10);
    config.settlement.merge_delay = seconds(0);

    PaperTradingSubstrate paper(market);
    RecordingSettlement settlement;
    Oms oms(config, paper, settlement);
    paper.set_order_update_callback([&oms](const Order& order) { oms.on_order_update(order); });
    // UP ask 40, DOWN ask 62: the hedge takes the ask and crosses at once
    paper.update_book(market.slug, make_book(38, 40, 60, 62));

    Decision d;
    d.entry_token = TokenSide::UP;
    d.entry_price_pips = cents_to_pips(40);
    d.entry_size = 10.0;
    d.hedge_price_pips = cents_to_pips(57);
    d.hedge_size = 10.0;
    const auto result = oms.execute_order(market, d);
    ASSERT_TRUE(result.ok) << result.reason;

    const auto hedge = paper.get_order(result.hedge_order_id);
    ASSERT_TRUE(hedge.has_value());
    EXPECT_EQ(hedge->status, OrderStatus::FILLED);

    auto& context = oms.context();
    EXPECT_EQ(context.risk().count(), 0u);
    EXPECT_TRUE(oms.pending_hedges().empty());
    EXPECT_EQ(context.state().paired_entry(result.hedge_order_id), std::optional<std::string>(result.entry_order_id));
    EXPECT_EQ(context.state().read_timing([](const HedgeTimingTracker& timing) { return timing.get_pending_count(); }), 0u);
    EXPECT_FALSE(context.state().has_monitor(result.entry_order_id));
    EXPECT_FALSE(oms.has_unhedged_risk(market.slug));
    EXPECT_TRUE(eventually([&] { return !settlement.merged().empty(); }));
}

TEST_F(OmsTest, FallbackRefusesEntryFromAnotherMarket) {
    build(base_config(market_));
    substrate_.set_market(make_market("btc-15m-2"));

    oms_->on_order_update(make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now()));
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_TRUE(substrate_.placed().empty());
}

TEST_F(OmsTest, EntryWithPendingHedgeGetsMonitor) {
    build(base_config(market_));
    const auto entry = make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now());
    substrate_.put_order(entry);
    substrate_.put_order(make_resting_hedge("h1", entry, 57));
    oms_->record_pending_hedge("e1", "h1");

    oms_->on_order_update(entry);
    EXPECT_TRUE(context().state().has_monitor("e1"));
    EXPECT_EQ(context().risk().get_exposures()[0].hedge_order_id, "h1");
}

TEST_F(OmsTest, HedgeFillFoundThroughLinkedEntry) {
    build(base_config(market_));
    const auto now = Clock::now();
    const auto entry = make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, now);
    context().risk().register_entry(entry, "", now);
    context().state().with_timing([&](HedgeTimingTracker& timing) { timing.record_entry_filled("e1", market_.slug, now); });

    auto hedge = make_filled_entry("h9", market_, TokenSide::DOWN, 57, 10.0, now + seconds(3));
    hedge.is_entry = false;
    hedge.linked_order_id = "e1";
    oms_->on_order_update(hedge);

    EXPECT_FALSE(context().risk().has_exposure("e1"));
    EXPECT_EQ(context().state().paired_entry("h9"), std::optional<std::string>("e1"));
    EXPECT_DOUBLE_EQ(context().state().read_timing(
                         [&](const HedgeTimingTracker& timing) { return timing.get_ewma_seconds(market_.slug); }),
                     3.0);
}

TEST_F(OmsTest, SettlementFailureIsCounted) {
    build(base_config(market_));
    settlement_.set_fail(true);

    auto hedge = make_filled_entry("h1", market_, TokenSide::DOWN, 57, 10.0, Clock::now());
    hedge.is_entry = false;
    oms_->on_order_update(hedge);

    EXPECT_TRUE(eventually([&] { return context().settlement().failed_count() == 1; }));
    EXPECT_EQ(context().settlement().completed_count(), 0u);
}

TEST_F(OmsTest, CycleRolloverClearsState) {
    build(base_config(market_));
    const auto now = Clock::now();
    oms_->record_pending_hedge("e1", "h1");
    context().risk().register_entry(make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, now), "h1", now);
    context().state().with_entry_guard(
        [&](EntryGuard& guard) { guard.set_cooldown(market_.slug, seconds(30), "manual", Clock::now()); });
    ASSERT_TRUE(context().reorder_limiter().allow(market_.slug, 5.0));

    const auto next = make_market("btc-15m-2");
    oms_->on_cycle(market_, next);

    EXPECT_TRUE(oms_->pending_hedges().empty());
    EXPECT_EQ(context().risk().count(), 0u);
    EXPECT_FALSE(oms_->market_cooldown(market_.slug).has_value());
    EXPECT_DOUBLE_EQ(context().reorder_limiter().get_tokens(market_.slug), context().reorder_limiter().get_capacity());
    EXPECT_TRUE(context().cycle_token().stop_possible());
    EXPECT_FALSE(context().cycle_token().stop_requested());
}

TEST_F(OmsTest, UnhedgedRiskComparesOpenPositions) {
    build(base_config(market_));
    EXPECT_FALSE(oms_->has_unhedged_risk(market_.slug));

    substrate_.add_position(market_.slug, TokenSide::UP, 10.0);
    EXPECT_TRUE(oms_->has_unhedged_risk(market_.slug));

    substrate_.add_position(market_.slug, TokenSide::DOWN, 10.0);
    EXPECT_FALSE(oms_->has_unhedged_risk(market_.slug));

    oms_->record_pending_hedge("e1", "h1");
    EXPECT_TRUE(oms_->has_unhedged_risk(market_.slug));
}

TEST_F(OmsTest, RiskStatusCountsDownToAggressiveHedge) {
    build(base_config(market_));
    const auto filled_at = Clock::now();
    context().risk().register_entry(make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, filled_at), "h1", filled_at);
    context().state().set_hedge_price("e1", 57);
    context().state().set_hedge_price("e1", 59);

    const auto status = oms_->risk_management_status(filled_at + seconds(20));
    ASSERT_EQ(status.exposure_count, 1u);
    EXPECT_DOUBLE_EQ(status.exposures[0].countdown_seconds, 40.0);
    EXPECT_EQ(status.exposures[0].original_hedge_cents, 57);
    EXPECT_EQ(status.exposures[0].current_hedge_cents, 59);
    EXPECT_EQ(status.current_action, "idle");

    const auto late = oms_->risk_management_status(filled_at + seconds(90));
    EXPECT_DOUBLE_EQ(late.exposures[0].countdown_seconds, 0.0);
}

TEST_F(OmsTest, OpsMetricsReportCooldownAndBacklog) {
    build(base_config(market_));
    oms_->record_pending_hedge("e1", "h1");
    context().state().with_entry_guard(
        [&](EntryGuard& guard) { guard.set_cooldown(market_.slug, seconds(30), "entry_fak_exceeded 2", Clock::now()); });

    const auto metrics = oms_->ops_metrics(market_.slug);
    EXPECT_EQ(metrics.pending_hedges, 1u);
    EXPECT_EQ(metrics.cooldown_reason, "entry_fak_exceeded 2");
    EXPECT_GT(metrics.cooldown_remaining_seconds, 25.0);
    EXPECT_EQ(metrics.queue_length, 0u);
}

TEST_F(OmsTest, StoppedOmsRefusesOrdersUntilRestarted) {
    build(base_config(market_));
    oms_->start();
    oms_->start();
    EXPECT_TRUE(oms_->is_started());

    oms_->stop();
    EXPECT_FALSE(oms_->is_started());
    EXPECT_EQ(oms_->execute_order(market_, decision()).reason, "gate_closed");

    oms_->start();
    const auto result = oms_->execute_order(market_, decision());
    EXPECT_TRUE(result.ok) << result.reason;
    oms_->stop();
}

TEST_F(OmsTest, StartResumesMonitorsForPendingHedges) {
    build(base_config(market_));
    const auto entry = make_filled_entry("e1", market_, TokenSide::UP, 40, 10.0, Clock::now());
    substrate_.put_order(entry);
    substrate_.put_order(make_resting_hedge("h1", entry, 57));
    oms_->record_pending_hedge("e1", "h1");

    auto filled = make_resting_hedge("h2", entry, 57);
    filled.status = OrderStatus::FILLED;
    filled.filled_size = filled.size;
    substrate_.put_order(filled);
    oms_->record_pending_hedge("e2", "h2");

    oms_->start();
    EXPECT_TRUE(eventually([&] { return context().state().has_monitor("e1"); }, milliseconds(4000)));
    EXPECT_FALSE(oms_->pending_hedges().count("e2"));
    oms_->stop();
}

TEST_F(OmsTest, PriceStopLocksLossOnAdverseTick) {
    auto config = base_config(market_);
    config.price_stop.enabled = true;
    config.price_stop.cancel_settle_delay = milliseconds(0);
    config.price_stop.settle_after_fill = milliseconds(0);
    build(config);

    const auto result = oms_->execute_order(market_, decision());
    ASSERT_TRUE(result.ok) << result.reason;
    ASSERT_EQ(oms_->price_stop_status(market_.slug).active, 1u);

    // 100 - (40 + 75) = -15 breaches the -10 hard stop
    substrate_.set_book(market_.slug, make_book(20, 22, 73, 75));
    oms_->on_price_changed(PriceChangedEvent{market_.slug, TokenSide::DOWN, cents_to_pips(75), Clock::now()});

    EXPECT_TRUE(eventually(
        [&] { return oms_->pending_hedges().empty() && !context().risk().has_exposure(result.entry_order_id); }));
    const auto placed = substrate_.placed();
    ASSERT_EQ(placed.size(), 3u);
    EXPECT_EQ(placed[2].order_class, OrderClass::IOC);
    EXPECT_EQ(placed[2].price_pips, cents_to_pips(75));
    EXPECT_FALSE(oms_->has_unhedged_risk(market_.slug));
}
