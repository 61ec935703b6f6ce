#pragma once
#include "../oms/order.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstring>
#include <string>

constexpr size_t MAX_LEVELS = 200;
constexpr double PRICE_EPSILON = 1e-9;

struct PriceLevel {
    double price;
    double quantity;

    PriceLevel()
        : price(0.0)
        , quantity(0.0) {}
};

// Sorted level ladder; bids are kept descending, asks ascending.
struct PriceLevelArray {
    std::array<PriceLevel, MAX_LEVELS> levels;
    size_t size;
    bool isDescending = false;

    PriceLevelArray(bool descending = false)
        : size(0)
        , isDescending(descending) {}

    inline size_t findIndex(double price) const {
        int left = 0;
        int right = static_cast<int>(size) - 1;

        while(left <= right) {
            int mid = left + ((right - left) >> 1);
            double midPrice = levels[mid].price;

            if(std::abs(midPrice - price) < PRICE_EPSILON) return mid;
            if(isDescending ? midPrice > price : midPrice < price) {
                left = mid + 1;
            } else {
                right = mid - 1;
            }
        }
        return static_cast<size_t>(left);
    }

    // A zero quantity removes the level.
    inline void update(double price, double quantity) {
        size_t index = findIndex(price);

        if(index < size && std::abs(levels[index].price - price) < PRICE_EPSILON) {
            if(quantity <= PRICE_EPSILON) {
                std::memmove(&levels[index], &levels[index + 1], (size - index - 1) * sizeof(PriceLevel));
                size--;
            } else {
                levels[index].quantity = quantity;
            }
            return;
        }

        if(quantity > PRICE_EPSILON && size < MAX_LEVELS) {
            std::memmove(&levels[index + 1], &levels[index], (size - index) * sizeof(PriceLevel));
            levels[index].price = price;
            levels[index].quantity = quantity;
            size++;
        }
    }

    inline void clear() { size = 0; }

    inline double getBestPrice() const { return size > 0 ? levels[0].price : 0.0; }
};

// Depth for one outcome token of a binary market.
class Book {
public:
    explicit Book(std::string assetId)
        : m_assetId(std::move(assetId)) {}

    void applyLevel(bool bid, double price, double quantity) {
        (bid ? bidSide : askSide).update(price, quantity);
    }

    void reset() {
        bidSide.clear();
        askSide.clear();
    }

    // Overrides from a best_bid/best_ask hint when the ladder is not maintained.
    void setBestBid(double price) { m_bestBidHint = price; }
    void setBestAsk(double price) { m_bestAskHint = price; }

    double getBestBid() const { return bidSide.size > 0 ? bidSide.getBestPrice() : m_bestBidHint; }
    double getBestAsk() const { return askSide.size > 0 ? askSide.getBestPrice() : m_bestAskHint; }

    const std::string& getAssetId() const { return m_assetId; }

    PriceLevelArray bidSide{true};
    PriceLevelArray askSide;

private:
    std::string m_assetId;
    double m_bestBidHint = 0.0;
    double m_bestAskHint = 0.0;
};

// Best-of-book for both tokens of a market, in pips.
struct BookTop {
    int64_t yes_bid = 0;
    int64_t yes_ask = 0;
    int64_t no_bid = 0;
    int64_t no_ask = 0;
    std::chrono::system_clock::time_point updated_at{};

    [[nodiscard]] int64_t ask_for(TokenSide token) const { return token == TokenSide::UP ? yes_ask : no_ask; }
    [[nodiscard]] int64_t bid_for(TokenSide token) const { return token == TokenSide::UP ? yes_bid : no_bid; }
};

struct PriceChangedEvent {
    std::string market;
    TokenSide token = TokenSide::UP;
    int64_t new_price_pips = 0;
    std::chrono::system_clock::time_point at{};
};
