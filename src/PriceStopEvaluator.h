#pragma once

#include "OmsContext.h"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

enum class StopKind { HARD_STOP, SOFT_STOP, TAKE_PROFIT };

inline std::string to_string(StopKind kind) {
    switch(kind) {
    case StopKind::HARD_STOP: return "hard_stop";
    case StopKind::SOFT_STOP: return "soft_stop";
    case StopKind::TAKE_PROFIT: return "take_profit";
    default: return "unknown";
    }
}

struct StopTrigger {
    StopKind kind = StopKind::HARD_STOP;
    PriceStopWatch watch;
    std::string hedge_order_id;
    double remaining = 0.0;
    int64_t hedge_ask_pips = 0;
    int profit_cents = 0;
};

struct PriceStopStatus {
    bool enabled = false;
    size_t active = 0;
    int soft_loss_cents = 0;
    int hard_loss_cents = 0;
    int take_profit_cents = 0;
    int confirm_ticks = 0;
    int take_profit_confirm_ticks = 0;
    Clock::time_point last_evaluated_at{};
    std::vector<PriceStopWatch> watches;
};

// Locked-profit guard evaluated on every price tick of a market. There is no
// polling loop; the caller's thread runs the evaluation and any protective
// action is handed to the task group.
class PriceStopEvaluator {
public:
    using TimePoint = Clock::time_point;

    explicit PriceStopEvaluator(OmsContext& context)
        : context_(context)
        , config_(context.config().price_stop) {}

    [[nodiscard]] bool enabled() const { return config_.enabled; }

    bool register_watch(const Order& entry, const std::string& hedge_order_id) {
        if(!config_.enabled || entry.id.empty()) {
            return false;
        }
        const int entry_cents = entry.price_cents();
        const double size = entry.executed_size();
        if(entry_cents <= 0 || size <= SIZE_EPSILON) {
            log_action_fail<LogLevel::WARNING>("register_price_stop",
                                               "invalid_entry",
                                               f("entry_id", entry.id),
                                               f("entry_cents", entry_cents),
                                               f("size", size));
            return false;
        }

        PriceStopWatch watch;
        watch.entry_order_id = entry.id;
        watch.market = entry.market;
        watch.entry_token = entry.token;
        watch.entry_price_cents = entry_cents;
        watch.entry_size = size;
        watch.hedge_order_id = hedge_order_id;
        if(!context_.state().add_watch(std::move(watch))) {
            return false;
        }
        log_action_pass("register_price_stop",
                        f("entry_id", entry.id),
                        f("hedge_id", hedge_order_id),
                        f("entry_cents", entry_cents),
                        f("size", size));
        return true;
    }

    // Evaluates every watch of the event's market and hands triggered ones to
    // background lock-loss tasks.
    void on_price_changed(const PriceChangedEvent& event) { on_price_changed(event, Clock::now()); }

    void on_price_changed(const PriceChangedEvent& event, TimePoint now) {
        for(auto& trigger : evaluate(event, now)) {
            context_.tasks().spawn([this, trigger](std::stop_token token) {
                try {
                    lock_loss(token, trigger);
                } catch(const GateClosedError& e) {
                    log_action_fail<LogLevel::WARNING>("lock_loss", e.what(), f("entry_id", trigger.watch.entry_order_id));
                } catch(const GateCancelledError& e) {
                    log_action_fail<LogLevel::WARNING>("lock_loss", e.what(), f("entry_id", trigger.watch.entry_order_id));
                } catch(const std::exception& e) {
                    log_action_fail<LogLevel::ERROR>("lock_loss", e.what(), f("entry_id", trigger.watch.entry_order_id));
                }
            });
        }
    }

    // Pure evaluation step: updates hit counters, retires finished or fired
    // watches, and returns the triggers without acting on them.
    std::vector<StopTrigger> evaluate(const PriceChangedEvent& event, TimePoint now) {
        std::vector<StopTrigger> triggers;
        if(!config_.enabled) {
            return triggers;
        }

        const auto snapshot = context_.substrate().best_book_snapshot(event.market);
        if(!snapshot || snapshot->updated_at == TimePoint{} || now - snapshot->updated_at > config_.snapshot_max_age) {
            LOG_ACTION_FAIL_DEBUG("evaluate_price_stop", "stale_snapshot", f("market", event.market));
            return triggers;
        }

        for(const auto& watch : context_.state().watches_for_market(event.market)) {
            if(watch.triggered) {
                continue;
            }

            auto hedge_id = context_.state().pending_hedge(watch.entry_order_id);
            if(!hedge_id) {
                context_.state().finish_watch(watch.entry_order_id, "completed");
                continue;
            }

            if(config_.check_interval.count() > 0 && watch.last_evaluated_at != TimePoint{} &&
               now - watch.last_evaluated_at < config_.check_interval) {
                continue;
            }

            double remaining = watch.entry_size - context_.state().retired_hedge_fill(watch.entry_order_id);
            if(auto hedge = context_.substrate().get_order(*hedge_id)) {
                if(hedge->is_filled()) {
                    context_.state().finish_watch(watch.entry_order_id, "completed");
                    continue;
                }
                remaining -= hedge->filled_size;
            }
            if(remaining <= SIZE_EPSILON) {
                context_.state().finish_watch(watch.entry_order_id, "completed");
                continue;
            }

            const int64_t ask_pips = snapshot->ask_for(opposite(watch.entry_token));
            const int ask_cents = pips_to_cents(ask_pips);
            if(ask_cents <= 0) {
                continue;
            }
            const int profit = UNIT_TOTAL_CENTS - (watch.entry_price_cents + ask_cents);

            auto fired = context_.state().with_watch(watch.entry_order_id, [&](PriceStopWatch& live) {
                return apply_sample(live, profit, now);
            });
            if(!fired || !*fired) {
                continue;
            }

            StopTrigger trigger;
            trigger.kind = **fired;
            trigger.watch = watch;
            trigger.hedge_order_id = *hedge_id;
            trigger.remaining = remaining;
            trigger.hedge_ask_pips = ask_pips;
            trigger.profit_cents = profit;
            context_.state().finish_watch(watch.entry_order_id, "triggered");

            log_event<LogLevel::WARNING>("price_stop_triggered",
                                         f("kind", to_string(trigger.kind)),
                                         f("entry_id", watch.entry_order_id),
                                         f("hedge_id", *hedge_id),
                                         f("entry_cents", watch.entry_price_cents),
                                         f("ask_cents", ask_cents),
                                         f("profit_cents", profit),
                                         f("remaining", remaining));
            triggers.push_back(std::move(trigger));
        }

        last_evaluated_at_ = now;
        return triggers;
    }

    // Cancels the live hedge, re-reads what is still uncovered and buys exactly
    // that much on the hedge side with an IOC. The hedge acted on is the one the
    // entry tracks now; a reprice may have replaced the one seen at trigger time.
    void lock_loss(std::stop_token token, const StopTrigger& trigger) {
        const auto& watch = trigger.watch;
        const auto& entry_id = watch.entry_order_id;
        if(trigger.remaining <= SIZE_EPSILON) {
            return;
        }
        auto& state = context_.state();
        const auto tracked = state.pending_hedge(entry_id);
        if(!tracked) {
            log_action_pass("lock_loss", f("entry_id", entry_id), f("result", "no_pending_hedge"));
            return;
        }
        const std::string target = *tracked;
        if(target != trigger.hedge_order_id) {
            log_event("lock_loss_hedge_moved", f("entry_id", entry_id), f("trigger_hedge_id", trigger.hedge_order_id), f("hedge_id", target));
        }

        const TokenSide hedge_token = opposite(watch.entry_token);
        const auto now = Clock::now();

        state.with_entry_guard([&](EntryGuard& guard) {
            guard.record_forced_fill(entry_id, watch.market, TimePoint{}, now);
            guard.record_cancel(entry_id, watch.market, TimePoint{}, now);
        });
        const double target_filled = cancel_and_read_fill(token, target);
        if(target_filled < 0.0) {
            return;
        }
        double remaining = watch.entry_size - state.retired_hedge_fill(entry_id) - target_filled;
        if(remaining <= SIZE_EPSILON) {
            log_action_pass("lock_loss", f("entry_id", entry_id), f("result", "hedge_filled_during_cancel"));
            return;
        }

        int64_t ask_pips = trigger.hedge_ask_pips;
        if(auto snapshot = context_.substrate().best_book_snapshot(watch.market)) {
            if(snapshot->ask_for(hedge_token) > 0) {
                ask_pips = snapshot->ask_for(hedge_token);
            }
        }

        const MarketInfo market = context_.market_info();
        OrderRequest request;
        request.market = watch.market;
        request.asset_id = market.asset_for(hedge_token);
        request.token = hedge_token;
        request.side = TradeSide::BUY;
        request.price_pips = ask_pips;
        request.size = remaining;
        request.order_class = OrderClass::IOC;
        request.linked_order_id = entry_id;
        request.disable_size_adjust = true;
        request.bypass_risk_off = true;

        Order placed;
        try {
            placed = context_.place_order(token, request);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("lock_loss",
                                             "place_failed",
                                             f("entry_id", entry_id),
                                             f("kind", to_string(e.kind())),
                                             f("error", e.what()),
                                             f("unhedged", true));
            return;
        }
        state.record_pair(entry_id, placed.id);

        if(!state.supersede_hedge(entry_id, target, placed.id, target_filled)) {
            // a reprice swapped in another resting hedge while this IOC was in flight
            if(auto replaced = state.pending_hedge(entry_id); replaced && *replaced != placed.id) {
                const double replaced_filled = cancel_and_read_fill(token, *replaced);
                state.supersede_hedge(entry_id, *replaced, placed.id, std::max(replaced_filled, 0.0));
                log_action_pass<LogLevel::WARNING>(
                    "cancel_replaced_hedge", f("entry_id", entry_id), f("hedge_id", *replaced), f("filled", replaced_filled));
            }
        }
        state.set_hedge_price(entry_id, pips_to_cents(ask_pips));
        context_.risk().update_hedge_order_id(entry_id, placed.id);

        if(placed.is_filled()) {
            state.erase_pending_hedge_if(entry_id, placed.id);
            state.with_entry_guard([&](EntryGuard& guard) { guard.clear_entry_budget(entry_id); });
            context_.risk().remove_exposure(entry_id);
            context_.settlement().schedule(market, config_.settle_after_fill);
        }

        log_action_pass<LogLevel::WARNING>("lock_loss",
                                           f("kind", to_string(trigger.kind)),
                                           f("entry_id", entry_id),
                                           f("hedge_id", placed.id),
                                           f("ask_cents", pips_to_cents(ask_pips)),
                                           f("size", remaining),
                                           f("status", to_string(placed.status)));
    }

    [[nodiscard]] PriceStopStatus status(const std::string& market) const {
        PriceStopStatus result;
        result.enabled = config_.enabled;
        result.soft_loss_cents = config_.soft_loss_cents;
        result.hard_loss_cents = config_.hard_loss_cents;
        result.take_profit_cents = config_.take_profit_cents;
        result.confirm_ticks = config_.confirm_ticks;
        result.take_profit_confirm_ticks = config_.take_profit_confirm_ticks;
        result.last_evaluated_at = last_evaluated_at_.load();
        result.watches = context_.state().watches_for_market(market);
        result.active = result.watches.size();
        for(auto& finished : context_.state().finished_watches_for_market(market)) {
            result.watches.push_back(std::move(finished));
        }
        return result;
    }

private:
    // Cancels a hedge and returns what it filled once the cancel settled, or
    // -1 when the wait was interrupted.
    double cancel_and_read_fill(std::stop_token token, const std::string& hedge_order_id) {
        try {
            context_.cancel_order(token, hedge_order_id);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::WARNING>("lock_loss", "cancel_failed", f("hedge_id", hedge_order_id), f("error", e.what()));
        }
        if(!interruptible_sleep(token, config_.cancel_settle_delay)) {
            return -1.0;
        }
        if(auto hedge = context_.substrate().get_order(hedge_order_id)) {
            return hedge->is_filled() ? hedge->executed_size() : hedge->filled_size;
        }
        return 0.0;
    }

    // Folds one profit sample into the watch and returns the stop it fires, if any.
    std::optional<StopKind> apply_sample(PriceStopWatch& watch, int profit, TimePoint now) const {
        watch.last_evaluated_at = now;
        watch.last_profit_cents = profit;

        std::optional<StopKind> fired;
        if(profit <= config_.hard_loss_cents) {
            fired = StopKind::HARD_STOP;
        }

        if(profit <= config_.soft_loss_cents) {
            watch.soft_hits++;
            if(!fired && watch.soft_hits >= config_.confirm_ticks) {
                fired = StopKind::SOFT_STOP;
            }
        } else {
            watch.soft_hits = 0;
        }

        if(config_.take_profit_cents > 0) {
            if(profit >= config_.take_profit_cents) {
                watch.take_profit_hits++;
                if(!fired && watch.take_profit_hits >= config_.take_profit_confirm_ticks) {
                    fired = StopKind::TAKE_PROFIT;
                }
            } else {
                watch.take_profit_hits = 0;
            }
        }

        if(fired) {
            watch.triggered = true;
        }
        return fired;
    }

    OmsContext& context_;
    const PriceStopConfig& config_;
    std::atomic<TimePoint> last_evaluated_at_{TimePoint{}};
};
