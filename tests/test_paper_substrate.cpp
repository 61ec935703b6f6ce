#include "../oms/papersubstrate.hpp"
#include "fake_substrate.h"
#include <gtest/gtest.h>

using namespace test_support;

namespace {

OrderRequest buy(const MarketInfo& market, TokenSide token, int cents, double size, OrderClass order_class) {
    OrderRequest request;
    request.market = market.slug;
    request.asset_id = market.asset_for(token);
    request.token = token;
    request.price_pips = cents_to_pips(cents);
    request.size = size;
    request.order_class = order_class;
    return request;
}

} // namespace

class PaperTradingSubstrateTest : public ::testing::Test {
protected:
    void SetUp() override { paper.update_book(market.slug, make_book(39, 41, 57, 60)); }

    MarketInfo market = make_market();
    PaperTradingSubstrate paper{market};
};

TEST_F(PaperTradingSubstrateTest, IocCrossingAskFillsAtLimit) {
    const Order order = paper.place_order(buy(market, TokenSide::UP, 42, 10.0, OrderClass::IOC));

    EXPECT_EQ(order.id, "paper-1");
    EXPECT_EQ(order.status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(order.filled_size, 10.0);
    ASSERT_TRUE(order.filled_price_pips.has_value());
    EXPECT_EQ(*order.filled_price_pips, cents_to_pips(42));
    EXPECT_TRUE(order.filled_at.has_value());
}

TEST_F(PaperTradingSubstrateTest, IocBelowAskIsCanceled) {
    const Order order = paper.place_order(buy(market, TokenSide::UP, 40, 10.0, OrderClass::IOC));
    EXPECT_EQ(order.status, OrderStatus::CANCELED);
    EXPECT_TRUE(paper.open_positions_for_market(market.slug).empty());
}

TEST_F(PaperTradingSubstrateTest, GtcRestsUntilBookCrosses) {
    const Order order = paper.place_order(buy(market, TokenSide::DOWN, 57, 10.0, OrderClass::GTC));
    EXPECT_EQ(order.status, OrderStatus::OPEN);

    paper.update_book(market.slug, make_book(39, 41, 55, 58));
    EXPECT_EQ(paper.get_order(order.id)->status, OrderStatus::OPEN);

    paper.update_book(market.slug, make_book(39, 41, 55, 56));
    const auto filled = paper.get_order(order.id);
    ASSERT_TRUE(filled.has_value());
    EXPECT_EQ(filled->status, OrderStatus::FILLED);
    EXPECT_EQ(*filled->filled_price_pips, cents_to_pips(57));
}

TEST_F(PaperTradingSubstrateTest, CancelSemantics) {
    EXPECT_THROW(paper.cancel_order("paper-99"), SubstrateError);

    const Order resting = paper.place_order(buy(market, TokenSide::DOWN, 50, 5.0, OrderClass::GTC));
    paper.cancel_order(resting.id);
    EXPECT_EQ(paper.get_order(resting.id)->status, OrderStatus::CANCELED);

    const Order filled = paper.place_order(buy(market, TokenSide::UP, 45, 5.0, OrderClass::IOC));
    ASSERT_EQ(filled.status, OrderStatus::FILLED);
    EXPECT_NO_THROW(paper.cancel_order(filled.id));
    EXPECT_EQ(paper.get_order(filled.id)->status, OrderStatus::FILLED);
}

TEST_F(PaperTradingSubstrateTest, MultiLegIsAllOrNothing) {
    MultiLegRequest request;
    request.name = "entry_and_hedge";
    request.market = market.slug;
    request.legs.push_back(buy(market, TokenSide::UP, 42, 10.0, OrderClass::IOC));
    auto bad = buy(market, TokenSide::DOWN, 57, 10.0, OrderClass::GTC);
    bad.side = TradeSide::SELL;
    request.legs.push_back(bad);

    try {
        paper.execute_multi_leg(request);
        FAIL() << "expected a refusal";
    } catch(const SubstrateError& e) {
        EXPECT_TRUE(e.is_refusal());
    }
    EXPECT_EQ(paper.order_count(), 0u);

    request.legs[1].side = TradeSide::BUY;
    const auto orders = paper.execute_multi_leg(request);
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].status, OrderStatus::FILLED);
    EXPECT_EQ(orders[1].status, OrderStatus::OPEN);
    EXPECT_EQ(paper.order_count(), 2u);
}

TEST_F(PaperTradingSubstrateTest, PausedVenueRefusesUnlessBypassed) {
    paper.set_paused(true);
    auto request = buy(market, TokenSide::UP, 42, 1.0, OrderClass::IOC);
    EXPECT_THROW(paper.place_order(request), SubstrateError);

    request.bypass_risk_off = true;
    EXPECT_EQ(paper.place_order(request).status, OrderStatus::FILLED);
}

TEST_F(PaperTradingSubstrateTest, RefusesForeignMarketAndBadParameters) {
    auto foreign = buy(make_market("eth-15m-1"), TokenSide::UP, 42, 1.0, OrderClass::IOC);
    EXPECT_THROW(paper.place_order(foreign), SubstrateError);

    EXPECT_THROW(paper.place_order(buy(market, TokenSide::UP, 42, 0.0, OrderClass::IOC)), SubstrateError);
    EXPECT_THROW(paper.place_order(buy(market, TokenSide::UP, 100, 1.0, OrderClass::IOC)), SubstrateError);
    EXPECT_EQ(paper.order_count(), 0u);
}

TEST_F(PaperTradingSubstrateTest, TopOfBookTimesOutAsTransient) {
    PaperTradingSubstrate empty(market);
    try {
        empty.get_top_of_book(market, std::chrono::milliseconds(20));
        FAIL() << "expected a transient error";
    } catch(const SubstrateError& e) {
        EXPECT_EQ(e.kind(), SubstrateError::Kind::Transient);
    }

    const BookTop top = paper.get_top_of_book(market, std::chrono::milliseconds(20));
    EXPECT_EQ(top.no_ask, cents_to_pips(60));
    EXPECT_FALSE(paper.best_book_snapshot("eth-15m-1").has_value());
}

TEST_F(PaperTradingSubstrateTest, PositionsAccumulatePerToken) {
    paper.place_order(buy(market, TokenSide::UP, 42, 10.0, OrderClass::IOC));
    paper.place_order(buy(market, TokenSide::UP, 42, 5.0, OrderClass::IOC));
    paper.place_order(buy(market, TokenSide::DOWN, 61, 3.0, OrderClass::IOC));

    const auto positions = paper.open_positions_for_market(market.slug);
    ASSERT_EQ(positions.size(), 2u);
    double up = 0.0;
    double down = 0.0;
    for(const auto& position : positions) {
        (position.token == TokenSide::UP ? up : down) = position.size;
    }
    EXPECT_DOUBLE_EQ(up, 15.0);
    EXPECT_DOUBLE_EQ(down, 3.0);
}

TEST_F(PaperTradingSubstrateTest, CallbackRunsOutsideVenueLock) {
    std::vector<OrderStatus> seen;
    paper.set_order_update_callback([&](const Order& order) {
        // re-entering the venue from the callback must not deadlock
        seen.push_back(paper.get_order(order.id)->status);
    });

    const Order order = paper.place_order(buy(market, TokenSide::DOWN, 57, 2.0, OrderClass::GTC));
    paper.update_book(market.slug, make_book(39, 41, 55, 56));
    paper.cancel_order(order.id);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], OrderStatus::OPEN);
    EXPECT_EQ(seen[1], OrderStatus::FILLED);
}
