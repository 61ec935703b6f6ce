#pragma once

#include "../src/logging.h"
#include "tradingsubstrate.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// In-memory venue for paper sessions and tests. IOC buys fill in full at
// their limit when it crosses the ask, otherwise they are canceled. GTC buys
// rest until a book update brings the ask down to their price.
class PaperTradingSubstrate : public TradingSubstrate {
public:
    explicit PaperTradingSubstrate(MarketInfo market)
        : m_market(std::move(market)) {}

    void set_order_update_callback(OrderUpdateCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callback = std::move(callback);
    }

    void set_market(MarketInfo market) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_market = std::move(market);
    }

    void set_paused(bool paused) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_paused = paused;
    }

    // Stores the new top of book and fills any resting order it crosses.
    void update_book(const std::string& market, BookTop top) {
        if(top.updated_at == Clock::time_point{}) {
            top.updated_at = Clock::now();
        }
        std::vector<Order> updates;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_books[market] = top;
            for(auto& [id, order] : m_orders) {
                if(order.market != market || order.is_done() || order.order_class != OrderClass::GTC) {
                    continue;
                }
                const int64_t ask = top.ask_for(order.token);
                if(ask > 0 && ask <= order.price_pips) {
                    fill_locked(order, order.price_pips);
                    updates.push_back(order);
                }
            }
        }
        m_bookCv.notify_all();
        publish(updates);
    }

    Order place_order(const OrderRequest& request) override {
        Order order;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            order = accept_locked(request);
        }
        publish({order});
        return order;
    }

    void cancel_order(const std::string& order_id) override {
        Order order;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_orders.find(order_id);
            if(it == m_orders.end()) {
                throw SubstrateError(SubstrateError::Kind::Refusal, "unknown order " + order_id);
            }
            if(it->second.is_done()) {
                return;
            }
            it->second.status = OrderStatus::CANCELED;
            order = it->second;
        }
        publish({order});
    }

    // Both legs are accepted under one lock, so either both reach the book or
    // neither does.
    std::vector<Order> execute_multi_leg(const MultiLegRequest& request) override {
        std::vector<Order> orders;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for(const auto& leg : request.legs) {
                check_accept_locked(leg);
            }
            for(const auto& leg : request.legs) {
                orders.push_back(accept_locked(leg));
            }
        }
        publish(orders);
        return orders;
    }

    [[nodiscard]] std::optional<Order> get_order(const std::string& order_id) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_orders.find(order_id);
        if(it == m_orders.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    BookTop get_top_of_book(const MarketInfo& market, std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        const bool ready = m_bookCv.wait_for(lock, timeout, [&] { return m_books.count(market.slug) > 0; });
        if(!ready) {
            throw SubstrateError(SubstrateError::Kind::Transient, "no book for " + market.slug);
        }
        return m_books.at(market.slug);
    }

    [[nodiscard]] std::optional<BookTop> best_book_snapshot(const std::string& market) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_books.find(market);
        if(it == m_books.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::vector<Position> open_positions_for_market(const std::string& market) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Position> positions;
        for(const auto& [key, size] : m_positions) {
            if(key.first == market && size > SIZE_EPSILON) {
                positions.push_back(Position{key.first, key.second, size, true});
            }
        }
        return positions;
    }

    [[nodiscard]] std::optional<MarketInfo> current_market_info() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_market;
    }

    [[nodiscard]] size_t order_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_orders.size();
    }

private:
    void check_accept_locked(const OrderRequest& request) const {
        if(m_paused && !request.bypass_risk_off) {
            throw SubstrateError(SubstrateError::Kind::Refusal, "trading paused");
        }
        if(request.market != m_market.slug) {
            throw SubstrateError(SubstrateError::Kind::Refusal,
                                 "market mismatch: " + request.market + " != " + m_market.slug);
        }
        if(request.side != TradeSide::BUY) {
            throw SubstrateError(SubstrateError::Kind::Refusal, "only buys are supported");
        }
        if(request.size <= SIZE_EPSILON || request.price_pips <= 0 || request.price_pips >= UNIT_TOTAL_PIPS) {
            throw SubstrateError(SubstrateError::Kind::Refusal, "invalid order parameters");
        }
    }

    Order accept_locked(const OrderRequest& request) {
        check_accept_locked(request);

        Order order;
        order.id = "paper-" + std::to_string(++m_nextId);
        order.market = request.market;
        order.asset_id = request.asset_id;
        order.token = request.token;
        order.side = request.side;
        order.price_pips = request.price_pips;
        order.size = request.size;
        order.order_class = request.order_class;
        order.is_entry = request.is_entry;
        order.linked_order_id = request.linked_order_id;
        order.disable_size_adjust = request.disable_size_adjust;
        order.bypass_risk_off = request.bypass_risk_off;
        order.created_at = Clock::now();
        order.status = OrderStatus::OPEN;

        int64_t ask = 0;
        if(auto it = m_books.find(order.market); it != m_books.end()) {
            ask = it->second.ask_for(order.token);
        }
        const bool crosses = ask > 0 && ask <= order.price_pips;
        if(crosses) {
            fill_locked(order, order.price_pips);
        } else if(order.order_class == OrderClass::IOC) {
            order.status = OrderStatus::CANCELED;
        }

        LOG_INFRA_DEBUG("paper_order id=",
                        order.id,
                        " class=",
                        to_string(order.order_class),
                        " token=",
                        to_string(order.token),
                        " price_pips=",
                        order.price_pips,
                        " size=",
                        order.size,
                        " status=",
                        to_string(order.status));
        m_orders[order.id] = order;
        return order;
    }

    void fill_locked(Order& order, int64_t price_pips) {
        order.filled_size = order.size;
        order.filled_price_pips = price_pips;
        order.filled_at = Clock::now();
        order.status = OrderStatus::FILLED;
        m_positions[{order.market, order.token}] += order.size;
    }

    void publish(const std::vector<Order>& orders) {
        OrderUpdateCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            callback = m_callback;
        }
        if(!callback) {
            return;
        }
        for(const auto& order : orders) {
            callback(order);
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_bookCv;
    MarketInfo m_market;
    bool m_paused = false;
    uint64_t m_nextId = 0;
    std::unordered_map<std::string, BookTop> m_books;
    std::unordered_map<std::string, Order> m_orders;
    std::map<std::pair<std::string, TokenSide>, double> m_positions;
    OrderUpdateCallback m_callback;
};
