#pragma once

#include "Configuration.h"
#include "OmsConfig.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

// Maps the strategy YAML onto OmsConfig.
class OmsConfigLoader {
public:
    // Sections are optional; a missing section or key keeps its default. Where a
    // non-positive value has no meaning the default is kept as well.
    static OmsConfig from_configuration(const Configuration& config) {
        OmsConfig result;

        if(config.has_key("market")) {
            const auto market = config.child("market");
            result.market.slug = market.get<std::string>("slug");
            result.market.yes_asset_id = market.get<std::string>("yes_asset_id");
            result.market.no_asset_id = market.get<std::string>("no_asset_id");
        }

        if(config.has_key("execution")) {
            const auto section = config.child("execution");
            auto& execution = result.execution;
            if(section.has_key("mode")) {
                execution.mode = execution_mode_from_string(section.get<std::string>("mode"));
            }
            execution.sequential_check_interval =
                positive_ms(section, "sequential_check_interval_ms", execution.sequential_check_interval);
            execution.sequential_max_wait = positive_ms(section, "sequential_max_wait_ms", execution.sequential_max_wait);
            execution.hedge_fallback_delay =
                positive_ms(section, "hedge_fallback_delay_ms", execution.hedge_fallback_delay);
            const double notional = section.get<double>("min_order_notional", execution.min_order_notional);
            if(notional > 0.0) {
                execution.min_order_notional = notional;
            }
            const double resting = section.get<double>("min_resting_hedge_size", execution.min_resting_hedge_size);
            if(resting >= 0.0) {
                execution.min_resting_hedge_size = resting;
            }
            const int capacity = section.get<int>("queue_capacity", static_cast<int>(execution.gate.capacity));
            if(capacity > 0) {
                execution.gate.capacity = static_cast<size_t>(capacity);
            }
            const int interval = section.get<int>("queue_min_interval_ms", static_cast<int>(execution.gate.min_interval.count()));
            if(interval >= 0) {
                execution.gate.min_interval = std::chrono::milliseconds(interval);
            }
        }

        if(config.has_key("hedge")) {
            const auto section = config.child("hedge");
            auto& hedge = result.hedge;
            const int offset = section.get<int>("offset_cents", hedge.offset_cents);
            if(offset > 0) {
                hedge.offset_cents = offset;
            }
            hedge.allow_negative_profit_on_reorder =
                section.get<bool>("allow_negative_profit_on_reorder", hedge.allow_negative_profit_on_reorder);
            const int max_negative = section.get<int>("max_negative_profit_cents", hedge.max_negative_profit_cents);
            if(max_negative >= 0) {
                hedge.max_negative_profit_cents = max_negative;
            }
            hedge.reorder_timeout = positive_s(section, "reorder_timeout_seconds", hedge.reorder_timeout);
            const int forced = section.get<int>("forced_fill_timeout_seconds", 0);
            hedge.forced_fill_timeout = std::chrono::seconds(std::max(forced, 0));
            hedge.aggressive_hedge_timeout =
                positive_s(section, "aggressive_hedge_timeout_seconds", hedge.aggressive_hedge_timeout);
            const int max_loss = section.get<int>("max_acceptable_loss_cents", hedge.max_acceptable_loss_cents);
            if(max_loss > 0) {
                hedge.max_acceptable_loss_cents = max_loss;
            }
            hedge.cancel_settle_delay = non_negative_ms(section, "cancel_settle_delay_ms", hedge.cancel_settle_delay);
            hedge.check_interval = positive_ms(section, "check_interval_ms", hedge.check_interval);
            hedge.top_of_book_timeout = positive_ms(section, "top_of_book_timeout_ms", hedge.top_of_book_timeout);
            const int attempts = section.get<int>("max_reorder_attempts", hedge.max_reorder_attempts);
            if(attempts > 0) {
                hedge.max_reorder_attempts = attempts;
            }
        }

        if(config.has_key("entry_guard")) {
            const auto section = config.child("entry_guard");
            auto& guard = result.entry_guard;
            guard.max_reorders = positive_int(section, "max_reorders_per_entry", guard.max_reorders);
            guard.max_cancels = positive_int(section, "max_cancels_per_entry", guard.max_cancels);
            guard.max_forced_fills = positive_int(section, "max_forced_fills_per_entry", guard.max_forced_fills);
            guard.max_age = positive_s(section, "max_entry_age_seconds", guard.max_age);
            guard.cooldown = positive_s(section, "cooldown_seconds", guard.cooldown);
        }

        if(config.has_key("price_stop")) {
            const auto section = config.child("price_stop");
            auto& stop = result.price_stop;
            stop.enabled = section.get<bool>("enabled", stop.enabled);
            stop.soft_loss_cents = section.get<int>("soft_loss_cents", stop.soft_loss_cents);
            stop.hard_loss_cents = section.get<int>("hard_loss_cents", stop.hard_loss_cents);
            stop.take_profit_cents = std::max(0, section.get<int>("take_profit_cents", stop.take_profit_cents));
            stop.check_interval = non_negative_ms(section, "check_interval_ms", stop.check_interval);
            stop.confirm_ticks = section.get<int>("confirm_ticks", stop.confirm_ticks);
            stop.take_profit_confirm_ticks = section.get<int>("take_profit_confirm_ticks", stop.take_profit_confirm_ticks);
            stop.snapshot_max_age = positive_ms(section, "snapshot_max_age_ms", stop.snapshot_max_age);
        }
        result.price_stop.normalize();

        if(config.has_key("settlement")) {
            const auto section = config.child("settlement");
            const int delay = section.get<int>("merge_delay_seconds", static_cast<int>(result.settlement.merge_delay.count()));
            if(delay >= 0) {
                result.settlement.merge_delay = std::chrono::seconds(delay);
            }
        }

        if(config.has_key("paper") && config.child("paper").has_key("decisions")) {
            config.child("paper").child("decisions").for_each_child([&result](const Configuration& item) {
                ScheduledDecision scheduled;
                scheduled.delay = std::chrono::milliseconds(item.get<int>("delay_ms", 0));
                const auto token = item.get<std::string>("entry_token");
                if(token != "up" && token != "down") {
                    throw std::runtime_error("paper decision entry_token must be 'up' or 'down', got: " + token);
                }
                scheduled.decision.entry_token = token == "up" ? TokenSide::UP : TokenSide::DOWN;
                scheduled.decision.entry_price_pips = cents_to_pips(item.get<int>("entry_price_cents"));
                scheduled.decision.hedge_price_pips = cents_to_pips(item.get<int>("hedge_price_cents"));
                scheduled.decision.entry_size = item.get<double>("size");
                scheduled.decision.hedge_size = scheduled.decision.entry_size;
                result.paper_decisions.push_back(scheduled);
            });
        }

        return result;
    }

private:
    static int positive_int(const Configuration& section, const std::string& key, int fallback) {
        const int value = section.get<int>(key, fallback);
        return value > 0 ? value : fallback;
    }

    static std::chrono::milliseconds
    positive_ms(const Configuration& section, const std::string& key, std::chrono::milliseconds fallback) {
        const auto value = section.get<int64_t>(key, fallback.count());
        return value > 0 ? std::chrono::milliseconds(value) : fallback;
    }

    static std::chrono::milliseconds
    non_negative_ms(const Configuration& section, const std::string& key, std::chrono::milliseconds fallback) {
        const auto value = section.get<int64_t>(key, fallback.count());
        return value >= 0 ? std::chrono::milliseconds(value) : fallback;
    }

    static std::chrono::seconds
    positive_s(const Configuration& section, const std::string& key, std::chrono::seconds fallback) {
        const auto value = section.get<int64_t>(key, fallback.count());
        return value > 0 ? std::chrono::seconds(value) : fallback;
    }
};
