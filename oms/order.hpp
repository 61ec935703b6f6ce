#pragma once
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Prices are integer pips: 1/100 of a cent, so 10000 pips is a full unit.
constexpr int64_t PIPS_PER_CENT = 100;
constexpr int UNIT_TOTAL_CENTS = 100;
constexpr int64_t UNIT_TOTAL_PIPS = UNIT_TOTAL_CENTS * PIPS_PER_CENT;
constexpr double SIZE_EPSILON = 1e-9;

inline int pips_to_cents(int64_t pips) {
    return static_cast<int>(std::llround(static_cast<double>(pips) / PIPS_PER_CENT));
}

inline int64_t cents_to_pips(int cents) { return static_cast<int64_t>(cents) * PIPS_PER_CENT; }

inline double pips_to_decimal(int64_t pips) { return static_cast<double>(pips) / UNIT_TOTAL_PIPS; }

inline int64_t decimal_to_pips(double price) { return std::llround(price * UNIT_TOTAL_PIPS); }

enum class OrderStatus { PENDING, OPEN, PARTIAL, FILLED, CANCELED, FAILED };

// IOC is immediate-or-cancel (fill-and-kill), GTC rests until canceled
enum class OrderClass { IOC, GTC };

enum class TokenSide { UP, DOWN };

enum class TradeSide { BUY, SELL };

inline std::string to_string(OrderStatus status) {
    switch(status) {
    case OrderStatus::PENDING: return "pending";
    case OrderStatus::OPEN: return "open";
    case OrderStatus::PARTIAL: return "partial";
    case OrderStatus::FILLED: return "filled";
    case OrderStatus::CANCELED: return "canceled";
    case OrderStatus::FAILED: return "failed";
    default: return "unknown";
    }
}

inline std::string to_string(OrderClass order_class) { return order_class == OrderClass::IOC ? "IOC" : "GTC"; }

inline std::string to_string(TokenSide token) { return token == TokenSide::UP ? "up" : "down"; }

inline std::string to_string(TradeSide side) { return side == TradeSide::BUY ? "buy" : "sell"; }

inline TokenSide opposite(TokenSide token) { return token == TokenSide::UP ? TokenSide::DOWN : TokenSide::UP; }

inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::FILLED || status == OrderStatus::CANCELED || status == OrderStatus::FAILED;
}

struct MarketInfo {
    std::string slug;
    std::string yes_asset_id;
    std::string no_asset_id;

    [[nodiscard]] const std::string& asset_for(TokenSide token) const {
        return token == TokenSide::UP ? yes_asset_id : no_asset_id;
    }

    [[nodiscard]] bool valid() const { return !slug.empty() && !yes_asset_id.empty() && !no_asset_id.empty(); }
};

struct Order {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string market;
    std::string asset_id;
    TokenSide token = TokenSide::UP;
    TradeSide side = TradeSide::BUY;

    int64_t price_pips = 0;
    double size = 0.0;
    double filled_size = 0.0;
    std::optional<int64_t> filled_price_pips;

    OrderStatus status = OrderStatus::PENDING;
    OrderClass order_class = OrderClass::GTC;
    bool is_entry = false;
    // For a hedge order this is the entry it covers.
    std::string linked_order_id;

    Clock::time_point created_at{};
    std::optional<Clock::time_point> filled_at;

    bool disable_size_adjust = false;
    bool bypass_risk_off = false;

    [[nodiscard]] bool is_filled() const { return status == OrderStatus::FILLED; }
    [[nodiscard]] bool is_done() const { return is_terminal(status); }

    // Execution price in cents, falling back to the limit price.
    [[nodiscard]] int price_cents() const {
        return filled_price_pips ? pips_to_cents(*filled_price_pips) : pips_to_cents(price_pips);
    }

    [[nodiscard]] double executed_size() const { return filled_size > 0.0 ? filled_size : size; }

    [[nodiscard]] Clock::time_point filled_time_or(Clock::time_point fallback) const {
        return filled_at.value_or(fallback);
    }
};

struct OrderRequest {
    std::string market;
    std::string asset_id;
    TokenSide token = TokenSide::UP;
    TradeSide side = TradeSide::BUY;
    int64_t price_pips = 0;
    double size = 0.0;
    OrderClass order_class = OrderClass::GTC;
    bool is_entry = false;
    std::string linked_order_id;
    bool disable_size_adjust = false;
    bool bypass_risk_off = false;
};

struct MultiLegRequest {
    std::string name;
    std::string market;
    std::vector<OrderRequest> legs;
};

struct Decision {
    TokenSide entry_token = TokenSide::UP;
    int64_t entry_price_pips = 0;
    double entry_size = 0.0;
    int64_t hedge_price_pips = 0;
    double hedge_size = 0.0;
};

struct Position {
    std::string market;
    TokenSide token = TokenSide::UP;
    double size = 0.0;
    bool open = true;
};
