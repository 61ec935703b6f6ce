#pragma once

#include "../oms/tradingsubstrate.hpp"
#include "../src/SettlementTrigger.h"
#include "../src/format.h"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Scriptable venue for the OMS tests. IOC buys fill when they cross the
// stored ask and are canceled otherwise; GTC buys rest until the test fills
// them. Every mutating call is recorded.
class FakeSubstrate : public TradingSubstrate {
public:
    explicit FakeSubstrate(MarketInfo market)
        : market_(std::move(market)) {}

    void set_order_update_callback(OrderUpdateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    void set_book(const std::string& market, BookTop top) {
        std::lock_guard<std::mutex> lock(mutex_);
        books_[market] = top;
    }

    void clear_book(const std::string& market) {
        std::lock_guard<std::mutex> lock(mutex_);
        books_.erase(market);
    }

    void set_market(std::optional<MarketInfo> market) {
        std::lock_guard<std::mutex> lock(mutex_);
        market_ = std::move(market);
    }

    void put_order(const Order& order) {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_[order.id] = order;
    }

    // Fills a stored order and reports it through the update callback.
    Order fill(const std::string& order_id, std::optional<double> filled_size = std::nullopt) {
        Order order;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& stored = orders_.at(order_id);
            stored.filled_size = filled_size.value_or(stored.size);
            stored.filled_price_pips = stored.price_pips;
            stored.filled_at = Clock::now();
            stored.status = stored.filled_size + SIZE_EPSILON >= stored.size ? OrderStatus::FILLED : OrderStatus::PARTIAL;
            order = stored;
        }
        publish(order);
        return order;
    }

    void set_status(const std::string& order_id, OrderStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_.at(order_id).status = status;
    }

    void add_position(const std::string& market, TokenSide token, double size) {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_.push_back(Position{market, token, size, true});
    }

    void fail_next_place(SubstrateError::Kind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        place_failure_ = kind;
    }

    // When set, entries are stored as OPEN and only fill through fill().
    void set_hold_entries(bool hold) {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_entries_ = hold;
    }

    Order place_order(const OrderRequest& request) override {
        Order order;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if(place_failure_) {
                const auto kind = *place_failure_;
                place_failure_.reset();
                throw SubstrateError(kind, "scripted place failure");
            }
            order = accept_locked(request);
        }
        publish(order);
        return order;
    }

    void cancel_order(const std::string& order_id) override {
        Order order;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancels_.push_back(order_id);
            auto it = orders_.find(order_id);
            if(it == orders_.end()) {
                throw SubstrateError(SubstrateError::Kind::Refusal, "unknown order " + order_id);
            }
            if(it->second.is_done()) {
                return;
            }
            it->second.status = OrderStatus::CANCELED;
            order = it->second;
        }
        publish(order);
    }

    std::vector<Order> execute_multi_leg(const MultiLegRequest& request) override {
        std::vector<Order> orders;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            multi_legs_.push_back(request);
            for(const auto& leg : request.legs) {
                orders.push_back(accept_locked(leg));
            }
        }
        for(const auto& order : orders) {
            publish(order);
        }
        return orders;
    }

    [[nodiscard]] std::optional<Order> get_order(const std::string& order_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if(it == orders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    BookTop get_top_of_book(const MarketInfo& market, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(market.slug);
        if(it == books_.end()) {
            throw SubstrateError(SubstrateError::Kind::Transient, "no book for " + market.slug);
        }
        return it->second;
    }

    [[nodiscard]] std::optional<BookTop> best_book_snapshot(const std::string& market) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(market);
        if(it == books_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::vector<Position> open_positions_for_market(const std::string& market) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Position> result;
        for(const auto& position : positions_) {
            if(position.market == market) {
                result.push_back(position);
            }
        }
        return result;
    }

    [[nodiscard]] std::optional<MarketInfo> current_market_info() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return market_;
    }

    [[nodiscard]] std::vector<OrderRequest> placed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed_;
    }

    [[nodiscard]] std::vector<std::string> cancels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancels_;
    }

    [[nodiscard]] std::vector<MultiLegRequest> multi_legs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return multi_legs_;
    }

private:
    Order accept_locked(const OrderRequest& request) {
        placed_.push_back(request);

        Order order;
        order.id = "fake-" + std::to_string(++next_id_);
        order.market = request.market;
        order.asset_id = request.asset_id;
        order.token = request.token;
        order.side = request.side;
        order.price_pips = request.price_pips;
        order.size = request.size;
        order.order_class = request.order_class;
        order.is_entry = request.is_entry;
        order.linked_order_id = request.linked_order_id;
        order.created_at = Clock::now();
        order.status = OrderStatus::OPEN;

        const bool held = request.is_entry && hold_entries_;
        if(order.order_class == OrderClass::IOC && !held) {
            int64_t ask = 0;
            if(auto it = books_.find(order.market); it != books_.end()) {
                ask = it->second.ask_for(order.token);
            }
            if(ask > 0 && ask <= order.price_pips) {
                order.filled_size = order.size;
                order.filled_price_pips = order.price_pips;
                order.filled_at = Clock::now();
                order.status = OrderStatus::FILLED;
            } else {
                order.status = OrderStatus::CANCELED;
            }
        }
        orders_[order.id] = order;
        return order;
    }

    void publish(const Order& order) {
        OrderUpdateCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if(callback) {
            callback(order);
        }
    }

    mutable std::mutex mutex_;
    std::optional<MarketInfo> market_;
    std::unordered_map<std::string, BookTop> books_;
    std::map<std::string, Order> orders_;
    std::vector<Position> positions_;
    std::vector<OrderRequest> placed_;
    std::vector<std::string> cancels_;
    std::vector<MultiLegRequest> multi_legs_;
    std::optional<SubstrateError::Kind> place_failure_;
    bool hold_entries_ = false;
    uint64_t next_id_ = 0;
    OrderUpdateCallback callback_;
};

class RecordingSettlement : public SettlementCollaborator {
public:
    void try_merge_current_cycle(const MarketInfo& market) override {
        std::lock_guard<std::mutex> lock(mutex_);
        merged_.push_back(market.slug);
        if(fail_) {
            throw SettlementError("scripted settlement failure");
        }
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    [[nodiscard]] std::vector<std::string> merged() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return merged_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> merged_;
    bool fail_ = false;
};

namespace test_support {

inline MarketInfo make_market(const std::string& slug = "btc-15m-1") {
    return MarketInfo{slug, slug + "-yes", slug + "-no"};
}

inline BookTop make_book(int yes_bid_cents, int yes_ask_cents, int no_bid_cents, int no_ask_cents,
                         Clock::time_point at = Clock::now()) {
    BookTop top;
    top.yes_bid = cents_to_pips(yes_bid_cents);
    top.yes_ask = cents_to_pips(yes_ask_cents);
    top.no_bid = cents_to_pips(no_bid_cents);
    top.no_ask = cents_to_pips(no_ask_cents);
    top.updated_at = at;
    return top;
}

// A filled entry as the venue would report it.
inline Order make_filled_entry(const std::string& id, const MarketInfo& market, TokenSide token, int price_cents,
                               double size, Clock::time_point filled_at) {
    Order order;
    order.id = id;
    order.market = market.slug;
    order.asset_id = market.asset_for(token);
    order.token = token;
    order.price_pips = cents_to_pips(price_cents);
    order.size = size;
    order.filled_size = size;
    order.filled_price_pips = order.price_pips;
    order.status = OrderStatus::FILLED;
    order.order_class = OrderClass::IOC;
    order.is_entry = true;
    order.created_at = filled_at;
    order.filled_at = filled_at;
    return order;
}

inline Order make_resting_hedge(const std::string& id, const Order& entry, int price_cents) {
    Order order;
    order.id = id;
    order.market = entry.market;
    order.token = opposite(entry.token);
    order.price_pips = cents_to_pips(price_cents);
    order.size = entry.executed_size();
    order.status = OrderStatus::OPEN;
    order.order_class = OrderClass::GTC;
    order.linked_order_id = entry.id;
    order.created_at = entry.filled_time_or(entry.created_at);
    return order;
}

// Polls a condition for up to the given time.
template<typename Pred>
bool eventually(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(std::chrono::steady_clock::now() < deadline) {
        if(pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace test_support
