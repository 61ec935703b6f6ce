#pragma once

#include "OmsContext.h"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

enum class MonitorState { MONITORING, REORDERING, FORCED_FILL, HEDGE_FILLED, EXTERNALLY_CLOSED, FROZEN, EXHAUSTED, CANCELLED };

inline std::string to_string(MonitorState state) {
    switch(state) {
    case MonitorState::MONITORING: return "monitoring";
    case MonitorState::REORDERING: return "reordering";
    case MonitorState::FORCED_FILL: return "forced_fill";
    case MonitorState::HEDGE_FILLED: return "hedge_filled";
    case MonitorState::EXTERNALLY_CLOSED: return "externally_closed";
    case MonitorState::FROZEN: return "frozen";
    case MonitorState::EXHAUSTED: return "exhausted";
    case MonitorState::CANCELLED: return "cancelled";
    default: return "unknown";
    }
}

inline bool is_terminal(MonitorState state) {
    return state == MonitorState::FORCED_FILL || state == MonitorState::HEDGE_FILLED ||
           state == MonitorState::EXTERNALLY_CLOSED || state == MonitorState::EXHAUSTED ||
           state == MonitorState::CANCELLED;
}

// Reprice / forced-fill state machine for one filled entry and its hedge.
//
// Each check() looks at, in order: the entry age budget, the hedge order
// status, the forced-fill deadline and the reorder deadline. A reprice cancels
// the live hedge before placing its replacement, and the pending-hedge mapping
// is only swapped if it still points at the hedge this monitor owns, so a
// concurrent price-stop action wins and the monitor steps aside.
class HedgeReorderMonitor {
public:
    using TimePoint = Clock::time_point;

    static constexpr auto DENIED_BY_GUARD_DELAY = std::chrono::seconds(5);
    static constexpr auto DENIED_BY_LIMITER_DELAY = std::chrono::seconds(3);
    static constexpr auto FAILED_REPRICE_DELAY = std::chrono::seconds(5);

    HedgeReorderMonitor(OmsContext& context, Order entry, std::string hedge_order_id)
        : context_(context)
        , config_(context.config().hedge)
        , entry_(std::move(entry))
        , hedge_order_id_(std::move(hedge_order_id))
        , hedge_token_(opposite(entry_.token))
        , started_at_(entry_.filled_time_or(entry_.created_at)) {
        reorder_deadline_ = started_at_ + config_.reorder_timeout;
        if(config_.forced_fill_timeout.count() > 0) {
            forced_fill_deadline_ = started_at_ + config_.forced_fill_timeout;
        }
    }

    // Spawns a monitor task unless one already runs for this entry.
    static bool spawn(OmsContext& context, const Order& entry, const std::string& hedge_order_id) {
        if(entry.id.empty() || hedge_order_id.empty()) {
            return false;
        }
        if(!context.state().try_mark_monitor(entry.id)) {
            LOG_ACTION_FAIL_DEBUG("spawn_hedge_monitor", "already_running", f("entry_id", entry.id));
            return false;
        }
        context.tasks().spawn([&context, entry, hedge_order_id](std::stop_token token) {
            HedgeReorderMonitor monitor(context, entry, hedge_order_id);
            monitor.run(token);
            context.state().clear_monitor(entry.id);
        });
        return true;
    }

    void run(std::stop_token token) {
        log_action_attempt("hedge_monitor",
                           f("entry_id", entry_.id),
                           f("hedge_id", hedge_order_id_),
                           f("reorder_timeout", format_duration(config_.reorder_timeout)),
                           f("forced_fill_timeout", format_duration(config_.forced_fill_timeout)));

        while(!is_terminal(state_)) {
            if(token.stop_requested()) {
                state_ = MonitorState::CANCELLED;
                break;
            }
            try {
                check(token, Clock::now());
            } catch(const GateClosedError& e) {
                state_ = MonitorState::CANCELLED;
                log_action_fail<LogLevel::WARNING>("hedge_monitor", e.what(), f("entry_id", entry_.id));
            } catch(const GateCancelledError&) {
                state_ = MonitorState::CANCELLED;
            } catch(const std::exception& e) {
                // Unexpected; the next tick starts over from the order status
                log_action_fail<LogLevel::ERROR>("hedge_monitor", e.what(), f("entry_id", entry_.id));
            }
            if(is_terminal(state_)) {
                break;
            }
            if(!interruptible_sleep(token, config_.check_interval)) {
                state_ = MonitorState::CANCELLED;
            }
        }

        log_action_pass("hedge_monitor",
                        f("entry_id", entry_.id),
                        f("hedge_id", hedge_order_id_),
                        f("state", to_string(state_)),
                        f("attempts", attempts_));
    }

    MonitorState check(std::stop_token token, TimePoint now) {
        if(is_terminal(state_)) {
            return state_;
        }

        // 1. the entry outlived its age budget: no more reprices
        const bool age_exceeded =
            context_.state().with_entry_guard([&](EntryGuard& guard) { return guard.entry_age_exceeded(started_at_, now); });
        if(age_exceeded) {
            log_event<LogLevel::WARNING>("entry_age_exceeded",
                                         f("entry_id", entry_.id),
                                         f("age_s", to_seconds(now - started_at_)));
            context_.state().counters().total_aggressive_hedges++;
            forced_fill(token, now);
            return state_;
        }

        // another actor already replaced the hedge this monitor owns
        if(auto tracked = context_.state().pending_hedge(entry_.id); tracked && *tracked != hedge_order_id_) {
            log_event("hedge_monitor_superseded",
                      f("entry_id", entry_.id),
                      f("hedge_id", hedge_order_id_),
                      f("tracked_hedge_id", *tracked));
            state_ = MonitorState::EXTERNALLY_CLOSED;
            return state_;
        }

        // 2. and 3. terminal hedge states
        if(auto hedge = context_.substrate().get_order(hedge_order_id_)) {
            if(hedge->is_filled() || remaining_after(*hedge) <= SIZE_EPSILON) {
                context_.state().erase_pending_hedge_if(entry_.id, hedge_order_id_);
                state_ = MonitorState::HEDGE_FILLED;
                return state_;
            }
            const bool closed = hedge->status == OrderStatus::CANCELED || hedge->status == OrderStatus::FAILED;
            if(closed && !own_cancel_) {
                context_.state().erase_pending_hedge_if(entry_.id, hedge_order_id_);
                log_event<LogLevel::WARNING>("hedge_closed_externally",
                                             f("entry_id", entry_.id),
                                             f("hedge_id", hedge_order_id_),
                                             f("status", to_string(hedge->status)));
                state_ = MonitorState::EXTERNALLY_CLOSED;
                return state_;
            }
        } else {
            LOG_ACTION_FAIL_DEBUG("hedge_monitor_lookup", "order_unknown", f("hedge_id", hedge_order_id_));
        }

        // 4. forced-fill deadline
        if(forced_fill_deadline_ && now >= *forced_fill_deadline_) {
            forced_fill(token, now);
            return state_;
        }

        // 5. reorder deadline
        if(now >= reorder_deadline_) {
            handle_reorder_deadline(token, now);
            return state_;
        }

        if(state_ != MonitorState::FROZEN) {
            state_ = MonitorState::MONITORING;
        }
        return state_;
    }

    [[nodiscard]] MonitorState state() const { return state_; }
    [[nodiscard]] int attempts() const { return attempts_; }
    [[nodiscard]] const std::string& hedge_order_id() const { return hedge_order_id_; }
    [[nodiscard]] TimePoint reorder_deadline() const { return reorder_deadline_; }
    [[nodiscard]] std::optional<TimePoint> forced_fill_deadline() const { return forced_fill_deadline_; }

private:
    void handle_reorder_deadline(std::stop_token token, TimePoint now) {
        const auto& market = entry_.market;

        const bool allowed = context_.state().with_entry_guard([&](EntryGuard& guard) {
            return guard.consume_reorder_attempt(entry_.id, market, started_at_, now);
        });
        if(!allowed) {
            reorder_deadline_ = now + DENIED_BY_GUARD_DELAY;
            return;
        }

        if(!context_.reorder_limiter().allow(market, 1.0, now)) {
            context_.state().counters().reorder_budget_skips++;
            log_action_fail<LogLevel::WARNING>("reprice_hedge", "rate_limited", f("entry_id", entry_.id), f("market", market));
            reorder_deadline_ = now + DENIED_BY_LIMITER_DELAY;
            return;
        }

        if(attempts_ >= config_.max_reorder_attempts) {
            if(forced_fill_deadline_ && now < *forced_fill_deadline_) {
                if(state_ != MonitorState::FROZEN) {
                    log_event<LogLevel::WARNING>("hedge_monitor_frozen",
                                                 f("entry_id", entry_.id),
                                                 f("attempts", attempts_),
                                                 f("forced_fill_at", format_time_point_iso8601(*forced_fill_deadline_)));
                }
                state_ = MonitorState::FROZEN;
                reorder_deadline_ = *forced_fill_deadline_;
                return;
            }
            log_action_fail<LogLevel::ERROR>("hedge_monitor",
                                             "reorder_attempts_exhausted",
                                             f("entry_id", entry_.id),
                                             f("hedge_id", hedge_order_id_),
                                             f("attempts", attempts_),
                                             f("unhedged", true));
            state_ = MonitorState::EXHAUSTED;
            return;
        }

        state_ = MonitorState::REORDERING;
        auto new_hedge = reprice(token, now);
        attempts_++;
        if(new_hedge) {
            hedge_order_id_ = *new_hedge;
            reorder_deadline_ = now + config_.reorder_timeout;
            state_ = MonitorState::MONITORING;
        } else if(!is_terminal(state_)) {
            reorder_deadline_ = now + FAILED_REPRICE_DELAY;
            state_ = MonitorState::MONITORING;
        }
    }

    // Cancels the live hedge and rests a new one at the recomputed price.
    std::optional<std::string> reprice(std::stop_token token, TimePoint now) {
        const auto old_hedge = context_.substrate().get_order(hedge_order_id_);
        const int old_price_cents = old_hedge ? old_hedge->price_cents() : 0;

        context_.state().with_entry_guard(
            [&](EntryGuard& guard) { guard.record_cancel(entry_.id, entry_.market, started_at_, now); });
        try {
            context_.cancel_order(token, hedge_order_id_);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>(
                "reprice_hedge", "cancel_failed", f("entry_id", entry_.id), f("hedge_id", hedge_order_id_), f("error", e.what()));
            return std::nullopt;
        }
        own_cancel_ = true;
        if(!interruptible_sleep(token, config_.cancel_settle_delay)) {
            state_ = MonitorState::CANCELLED;
            return std::nullopt;
        }

        // the hedge may have filled while the cancel was in flight
        double old_filled = 0.0;
        if(auto hedge = context_.substrate().get_order(hedge_order_id_)) {
            old_filled = hedge->filled_size;
            if(hedge->is_filled() || remaining_after(*hedge) <= SIZE_EPSILON) {
                context_.state().erase_pending_hedge_if(entry_.id, hedge_order_id_);
                state_ = MonitorState::HEDGE_FILLED;
                return std::nullopt;
            }
        }
        const double remaining = remaining_after(old_filled);

        const MarketInfo market = context_.market_info();
        BookTop top;
        try {
            top = context_.substrate().get_top_of_book(market, config_.top_of_book_timeout);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("reprice_hedge", "book_unavailable", f("entry_id", entry_.id), f("error", e.what()));
            return std::nullopt;
        }

        const int entry_cents = entry_.price_cents();
        const int ask_cents = pips_to_cents(top.ask_for(hedge_token_));
        const int ideal_cents = UNIT_TOTAL_CENTS - entry_cents - config_.offset_cents;

        int new_cents = ideal_cents;
        std::string pricing;
        if(config_.allow_negative_profit_on_reorder) {
            const int max_allowed = ideal_cents + config_.max_negative_profit_cents;
            if(ask_cents > 0 && ask_cents <= max_allowed) {
                new_cents = ask_cents;
                pricing = "take_ask";
            } else {
                new_cents = max_allowed;
                pricing = "max_negative_profit";
            }
        } else if(ask_cents > 0 && ideal_cents >= ask_cents) {
            new_cents = ask_cents - 1;
            pricing = "below_ask";
        } else {
            pricing = "ideal";
        }

        if(new_cents <= 0 || new_cents >= UNIT_TOTAL_CENTS) {
            log_action_fail<LogLevel::ERROR>("reprice_hedge",
                                             "invalid_price",
                                             f("entry_id", entry_.id),
                                             f("entry_cents", entry_cents),
                                             f("ideal_cents", ideal_cents),
                                             f("ask_cents", ask_cents),
                                             f("new_cents", new_cents));
            return std::nullopt;
        }

        OrderRequest request;
        request.market = market.slug;
        request.asset_id = market.asset_for(hedge_token_);
        request.token = hedge_token_;
        request.side = TradeSide::BUY;
        request.price_pips = cents_to_pips(new_cents);
        request.size = remaining;
        request.order_class = OrderClass::GTC;
        request.linked_order_id = entry_.id;
        request.disable_size_adjust = true;
        request.bypass_risk_off = true;

        Order placed;
        try {
            placed = context_.place_order(token, request);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("reprice_hedge",
                                             "place_failed",
                                             f("entry_id", entry_.id),
                                             f("kind", to_string(e.kind())),
                                             f("error", e.what()));
            return std::nullopt;
        }

        if(!context_.state().supersede_hedge(entry_.id, hedge_order_id_, placed.id, old_filled)) {
            // someone else moved the mapping while this reprice was in flight
            log_action_fail<LogLevel::WARNING>(
                "reprice_hedge", "superseded", f("entry_id", entry_.id), f("new_hedge_id", placed.id));
            try {
                context_.cancel_order(token, placed.id);
            } catch(const SubstrateError& e) {
                log_action_fail<LogLevel::ERROR>("cancel_orphan_hedge", e.what(), f("hedge_id", placed.id));
            }
            state_ = MonitorState::EXTERNALLY_CLOSED;
            return std::nullopt;
        }
        own_cancel_ = false;
        context_.risk().update_hedge_order_id(entry_.id, placed.id);
        context_.state().set_hedge_price(entry_.id, new_cents);
        context_.state().counters().total_reorders++;

        RepriceStatus status;
        status.action = "reprice";
        status.entry_order_id = entry_.id;
        status.hedge_order_id = placed.id;
        status.at = now;
        status.description = "replaced " + hedge_order_id_;
        status.old_price_cents = old_price_cents;
        status.new_price_cents = new_cents;
        status.change_cents = new_cents - old_price_cents;
        status.strategy = pricing;
        status.entry_cost_cents = entry_cents;
        status.market_ask_cents = ask_cents;
        status.ideal_price_cents = ideal_cents;
        status.total_cost_cents = entry_cents + new_cents;
        status.profit_cents = UNIT_TOTAL_CENTS - status.total_cost_cents;
        context_.state().set_reprice_status(status);

        log_action_pass("reprice_hedge",
                        f("entry_id", entry_.id),
                        f("old_hedge_id", hedge_order_id_),
                        f("new_hedge_id", placed.id),
                        f("old_cents", old_price_cents),
                        f("new_cents", new_cents),
                        f("pricing", pricing),
                        f("size", remaining));
        return placed.id;
    }

    // Cancels the live hedge and takes the ask with an IOC for what is left.
    void forced_fill(std::stop_token token, TimePoint now) {
        state_ = MonitorState::FORCED_FILL;
        const auto& market_slug = entry_.market;

        context_.state().with_entry_guard(
            [&](EntryGuard& guard) { guard.record_forced_fill(entry_.id, market_slug, started_at_, now); });
        if(!context_.forced_fill_limiter().allow(market_slug, 1.0, now)) {
            context_.state().counters().forced_fill_budget_warnings++;
            log_action_fail<LogLevel::WARNING>("forced_fill", "rate_limited_proceeding", f("entry_id", entry_.id));
        }

        context_.state().with_entry_guard(
            [&](EntryGuard& guard) { guard.record_cancel(entry_.id, market_slug, started_at_, now); });
        try {
            context_.cancel_order(token, hedge_order_id_);
            own_cancel_ = true;
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::WARNING>(
                "forced_fill", "cancel_failed", f("hedge_id", hedge_order_id_), f("error", e.what()));
        }
        if(!interruptible_sleep(token, config_.cancel_settle_delay)) {
            state_ = MonitorState::CANCELLED;
            return;
        }

        double old_filled = 0.0;
        int old_price_cents = 0;
        if(auto hedge = context_.substrate().get_order(hedge_order_id_)) {
            old_price_cents = hedge->price_cents();
            old_filled = hedge->filled_size;
            if(hedge->is_filled() || remaining_after(*hedge) <= SIZE_EPSILON) {
                context_.state().erase_pending_hedge_if(entry_.id, hedge_order_id_);
                state_ = MonitorState::HEDGE_FILLED;
                return;
            }
        }
        const double remaining = remaining_after(old_filled);

        const MarketInfo market = context_.market_info();
        BookTop top;
        try {
            top = context_.substrate().get_top_of_book(market, config_.top_of_book_timeout);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>(
                "forced_fill", "book_unavailable", f("entry_id", entry_.id), f("error", e.what()), f("unhedged", true));
            state_ = MonitorState::MONITORING;
            return;
        }

        const int64_t ask_pips = top.ask_for(hedge_token_);
        if(ask_pips <= 0) {
            log_action_fail<LogLevel::ERROR>(
                "forced_fill", "no_ask", f("entry_id", entry_.id), f("token", to_string(hedge_token_)), f("unhedged", true));
            state_ = MonitorState::MONITORING;
            return;
        }

        OrderRequest request;
        request.market = market.slug;
        request.asset_id = market.asset_for(hedge_token_);
        request.token = hedge_token_;
        request.side = TradeSide::BUY;
        request.price_pips = ask_pips;
        request.size = remaining;
        request.order_class = OrderClass::IOC;
        request.linked_order_id = entry_.id;
        request.disable_size_adjust = true;
        request.bypass_risk_off = true;

        Order placed;
        try {
            placed = context_.place_order(token, request);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("forced_fill",
                                             "place_failed",
                                             f("entry_id", entry_.id),
                                             f("kind", to_string(e.kind())),
                                             f("error", e.what()),
                                             f("unhedged", true));
            state_ = MonitorState::MONITORING;
            return;
        }

        own_cancel_ = false;
        context_.state().record_pair(entry_.id, placed.id);
        if(placed.is_filled()) {
            context_.state().settle_forced_fill(entry_.id, hedge_order_id_, placed.id);
            context_.risk().remove_exposure(entry_.id);
        } else if(context_.state().supersede_hedge(entry_.id, hedge_order_id_, placed.id, old_filled)) {
            context_.risk().update_hedge_order_id(entry_.id, placed.id);
        } else {
            log_action_fail<LogLevel::WARNING>(
                "forced_fill", "superseded", f("entry_id", entry_.id), f("new_hedge_id", placed.id));
        }
        context_.state().set_hedge_price(entry_.id, pips_to_cents(ask_pips));
        context_.state().counters().total_forced_fills++;

        RepriceStatus status;
        status.action = "forced_fill";
        status.entry_order_id = entry_.id;
        status.hedge_order_id = placed.id;
        status.at = now;
        status.description = "ioc at ask, replaced " + hedge_order_id_;
        status.old_price_cents = old_price_cents;
        status.new_price_cents = pips_to_cents(ask_pips);
        status.change_cents = status.new_price_cents - old_price_cents;
        status.strategy = "take_ask";
        status.entry_cost_cents = entry_.price_cents();
        status.market_ask_cents = status.new_price_cents;
        status.ideal_price_cents = UNIT_TOTAL_CENTS - status.entry_cost_cents - config_.offset_cents;
        status.total_cost_cents = status.entry_cost_cents + status.new_price_cents;
        status.profit_cents = UNIT_TOTAL_CENTS - status.total_cost_cents;
        context_.state().set_reprice_status(status);

        log_action_pass<LogLevel::WARNING>("forced_fill",
                                           f("entry_id", entry_.id),
                                           f("old_hedge_id", hedge_order_id_),
                                           f("new_hedge_id", placed.id),
                                           f("ask_cents", status.new_price_cents),
                                           f("size", remaining),
                                           f("status", to_string(placed.status)));
        hedge_order_id_ = placed.id;
    }

    // Entry size not yet covered by the retired hedges plus the given fill of the live one.
    [[nodiscard]] double remaining_after(double live_filled) const {
        return entry_.executed_size() - context_.state().retired_hedge_fill(entry_.id) - live_filled;
    }

    [[nodiscard]] double remaining_after(const Order& hedge) const { return remaining_after(hedge.filled_size); }

    OmsContext& context_;
    const HedgeConfig& config_;
    const Order entry_;
    std::string hedge_order_id_;
    const TokenSide hedge_token_;
    const TimePoint started_at_;

    MonitorState state_ = MonitorState::MONITORING;
    // the tracked hedge was canceled by this monitor and not yet replaced
    bool own_cancel_ = false;
    int attempts_ = 0;
    TimePoint reorder_deadline_;
    std::optional<TimePoint> forced_fill_deadline_;
};
