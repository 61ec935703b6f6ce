#pragma once
#include "../infra/book.hpp"
#include "order.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised by the trading substrate. Transient errors (timeouts, connectivity)
// may be retried by the caller on its next scheduled check; refusals are a
// deliberate answer from the venue and are not retried.
class SubstrateError : public std::runtime_error {
public:
    enum class Kind { Transient, Refusal };

    SubstrateError(Kind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_refusal() const { return kind_ == Kind::Refusal; }

private:
    Kind kind_;
};

inline std::string to_string(SubstrateError::Kind kind) {
    return kind == SubstrateError::Kind::Refusal ? "refusal" : "transient";
}

// Venue access used by the OMS. The mutating surface is only ever driven
// through the execution gate; reads must be safe to call concurrently.
class TradingSubstrate {
public:
    using OrderUpdateCallback = std::function<void(const Order&)>;

    virtual ~TradingSubstrate() = default;

    virtual Order place_order(const OrderRequest& request) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;
    virtual std::vector<Order> execute_multi_leg(const MultiLegRequest& request) = 0;

    [[nodiscard]] virtual std::optional<Order> get_order(const std::string& order_id) const = 0;
    virtual BookTop get_top_of_book(const MarketInfo& market, std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual std::optional<BookTop> best_book_snapshot(const std::string& market) const = 0;
    [[nodiscard]] virtual std::vector<Position> open_positions_for_market(const std::string& market) const = 0;
    [[nodiscard]] virtual std::optional<MarketInfo> current_market_info() const = 0;
};
