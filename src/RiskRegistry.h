#pragma once

#include "../oms/order.hpp"
#include "format.h"
#include "logging.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct Exposure {
    std::string market;
    std::string entry_order_id;
    TokenSide entry_token = TokenSide::UP;
    double entry_size = 0.0;
    int entry_price_cents = 0;
    Clock::time_point entry_filled_at{};
    std::string hedge_order_id;
    OrderStatus hedge_status = OrderStatus::PENDING;
    double exposure_seconds = 0.0;
    int max_loss_cents = 0;
};

// Filled entries whose hedge has not been confirmed filled yet.
class RiskRegistry {
public:
    static constexpr int DEFAULT_MAX_LOSS_CENTS = 5;

    explicit RiskRegistry(int max_loss_cents = DEFAULT_MAX_LOSS_CENTS)
        : max_loss_cents_(max_loss_cents > 0 ? max_loss_cents : DEFAULT_MAX_LOSS_CENTS) {}

    // Only filled entries are tracked. A repeated registration keeps the
    // original fill data and only refreshes the hedge id.
    void register_entry(const Order& entry, const std::string& hedge_order_id, Clock::time_point now) {
        if(!entry.is_entry || !entry.is_filled() || entry.id.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = exposures_.find(entry.id);
        if(it != exposures_.end()) {
            if(!hedge_order_id.empty()) {
                it->second.hedge_order_id = hedge_order_id;
            }
            return;
        }

        Exposure exposure;
        exposure.market = entry.market;
        exposure.entry_order_id = entry.id;
        exposure.entry_token = entry.token;
        exposure.entry_size = entry.executed_size();
        exposure.entry_price_cents = entry.price_cents();
        exposure.entry_filled_at = entry.filled_time_or(now);
        exposure.hedge_order_id = hedge_order_id;
        exposure.max_loss_cents = max_loss_cents_;
        exposures_.emplace(entry.id, std::move(exposure));

        log_event("exposure_registered",
                  f("entry_id", entry.id),
                  f("hedge_id", hedge_order_id.empty() ? std::string("-") : hedge_order_id),
                  f("token", to_string(entry.token)),
                  f("price_cents", entry.price_cents()),
                  f("size", entry.executed_size()));
    }

    // A filled hedge closes its exposure.
    void update_hedge_status(const std::string& hedge_order_id, OrderStatus status) {
        if(hedge_order_id.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for(auto it = exposures_.begin(); it != exposures_.end(); ++it) {
            if(it->second.hedge_order_id != hedge_order_id) {
                continue;
            }
            if(status == OrderStatus::FILLED) {
                log_event("exposure_closed", f("entry_id", it->first), f("hedge_id", hedge_order_id));
                exposures_.erase(it);
            } else {
                it->second.hedge_status = status;
            }
            return;
        }
    }

    void update_hedge_order_id(const std::string& entry_order_id, const std::string& hedge_order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = exposures_.find(entry_order_id);
        if(it == exposures_.end()) {
            return;
        }
        it->second.hedge_order_id = hedge_order_id;
        it->second.hedge_status = OrderStatus::PENDING;
    }

    void remove_exposure(const std::string& entry_order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        exposures_.erase(entry_order_id);
    }

    // Snapshot ordered by entry fill time, oldest first.
    [[nodiscard]] std::vector<Exposure> get_exposures(Clock::time_point now) const {
        std::vector<Exposure> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result.reserve(exposures_.size());
            for(const auto& [_, exposure] : exposures_) {
                result.push_back(exposure);
                result.back().exposure_seconds = std::max(0.0, to_seconds(now - exposure.entry_filled_at));
            }
        }
        std::sort(result.begin(), result.end(), [](const Exposure& a, const Exposure& b) {
            return a.entry_filled_at < b.entry_filled_at;
        });
        return result;
    }

    [[nodiscard]] std::vector<Exposure> get_exposures() const { return get_exposures(Clock::now()); }

    [[nodiscard]] bool has_exposure(const std::string& entry_order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exposures_.count(entry_order_id) > 0;
    }

    [[nodiscard]] size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exposures_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        exposures_.clear();
    }

private:
    const int max_loss_cents_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Exposure> exposures_;
};
