#pragma once

#include "HedgeReorderMonitor.h"
#include "OmsContext.h"
#include "PriceStopEvaluator.h"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

struct ExecutionResult {
    bool ok = false;
    std::string reason;
    std::string entry_order_id;
    std::string hedge_order_id;

    static ExecutionResult failure(std::string reason, std::string entry_order_id = "") {
        return ExecutionResult{false, std::move(reason), std::move(entry_order_id), ""};
    }
};

// Places the entry and its hedge for one decision, sequentially (entry IOC,
// wait for the fill, then the hedge) or as a single two-leg request.
class OrderExecutor {
public:
    OrderExecutor(OmsContext& context, PriceStopEvaluator& price_stop)
        : context_(context)
        , price_stop_(price_stop) {}

    ExecutionResult execute(std::stop_token token, const MarketInfo& market, const Decision& decision) {
        const auto& execution = context_.config().execution;

        if(!market.valid()) {
            return reject("invalid_market", market, decision);
        }
        const double size = std::min(decision.entry_size, decision.hedge_size);
        if(size <= SIZE_EPSILON) {
            return reject("invalid_size", market, decision);
        }
        if(!valid_price(decision.entry_price_pips) || !valid_price(decision.hedge_price_pips)) {
            return reject("invalid_price", market, decision);
        }
        if(size * pips_to_decimal(decision.entry_price_pips) < execution.min_order_notional) {
            return reject("below_min_notional", market, decision);
        }
        const auto cooldown = context_.state().with_entry_guard(
            [&](EntryGuard& guard) { return guard.market_cooldown(market.slug, Clock::now()); });
        if(cooldown) {
            return reject("market_cooldown " + cooldown->reason, market, decision);
        }

        log_action_attempt("execute_order",
                           f("market", market.slug),
                           f("mode", to_string(execution.mode)),
                           f("entry_token", to_string(decision.entry_token)),
                           f("entry_cents", pips_to_cents(decision.entry_price_pips)),
                           f("size", size));

        ExecutionScope scope(context_.state(), market.slug);
        try {
            return execution.mode == ExecutionMode::PARALLEL ? execute_parallel(token, market, decision, size)
                                                             : execute_sequential(token, market, decision, size);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::WARNING>(
                "execute_order", e.what(), f("market", market.slug), f("kind", to_string(e.kind())));
            return ExecutionResult::failure(std::string("substrate_") + to_string(e.kind()) + ": " + e.what());
        }
    }

    // Exposure, reorder monitor and price-stop watch for an entry known to be
    // filled whose hedge is already on the book.
    void arm_hedge_tracking(const Order& entry, const Order& hedge) {
        context_.risk().register_entry(entry, hedge.id, Clock::now());
        if(!hedge.is_done()) {
            HedgeReorderMonitor::spawn(context_, entry, hedge.id);
        }
        price_stop_.register_watch(entry, hedge.id);
    }

    // Closes out an entry whose hedge filled without ever being tracked as
    // pending, e.g. a parallel hedge that crossed the book on placement.
    void close_hedged_entry(const std::string& entry_id, const Order& hedge) {
        auto& state = context_.state();
        const auto filled_at = hedge.filled_time_or(Clock::now());
        state.with_timing([&](HedgeTimingTracker& timing) { return timing.record_hedge_filled(entry_id, filled_at); });
        state.with_entry_guard([&](EntryGuard& guard) { guard.clear_entry_budget(entry_id); });
        state.erase_pending_hedge_if(entry_id, hedge.id);
        context_.risk().remove_exposure(entry_id);
        state.finish_watch(entry_id, "completed");
        log_action_pass("close_hedged_entry", f("entry_id", entry_id), f("hedge_id", hedge.id), f("size", hedge.executed_size()));
    }

    // Places a resting hedge for a filled entry that has none.
    std::optional<Order> auto_hedge_position(std::stop_token token,
                                             const MarketInfo& market,
                                             TokenSide hedge_token,
                                             double size,
                                             const std::optional<Order>& entry) {
        const auto& hedge = context_.config().hedge;
        if(size <= SIZE_EPSILON) {
            return std::nullopt;
        }

        BookTop top;
        try {
            top = context_.substrate().get_top_of_book(market, hedge.top_of_book_timeout);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("auto_hedge", "book_unavailable", f("market", market.slug), f("error", e.what()));
            return std::nullopt;
        }
        int64_t price_pips = top.ask_for(hedge_token);
        if(price_pips <= 0) {
            log_action_fail<LogLevel::ERROR>("auto_hedge", "no_ask", f("market", market.slug), f("token", to_string(hedge_token)));
            return std::nullopt;
        }
        if(entry) {
            const int ideal = UNIT_TOTAL_CENTS - entry->price_cents() - hedge.offset_cents;
            if(ideal >= 1 && ideal <= UNIT_TOTAL_CENTS - 1 && cents_to_pips(ideal) < price_pips) {
                price_pips = cents_to_pips(ideal);
            }
        }
        price_pips = cents_to_pips(pips_to_cents(price_pips));

        OrderRequest request;
        request.market = market.slug;
        request.asset_id = market.asset_for(hedge_token);
        request.token = hedge_token;
        request.side = TradeSide::BUY;
        request.price_pips = price_pips;
        request.size = size;
        request.order_class = OrderClass::GTC;
        request.linked_order_id = entry ? entry->id : "";
        request.disable_size_adjust = true;
        request.bypass_risk_off = true;

        Order placed;
        try {
            placed = context_.place_order(token, request);
        } catch(const SubstrateError& e) {
            log_action_fail<LogLevel::ERROR>("auto_hedge",
                                             "place_failed",
                                             f("market", market.slug),
                                             f("kind", to_string(e.kind())),
                                             f("error", e.what()),
                                             f("unhedged", true));
            return std::nullopt;
        }

        if(entry) {
            context_.state().record_pair(entry->id, placed.id);
            context_.state().set_hedge_price(entry->id, pips_to_cents(price_pips));
            if(!placed.is_filled()) {
                context_.state().record_pending_hedge(entry->id, placed.id);
                arm_hedge_tracking(*entry, placed);
            }
        }
        log_action_pass("auto_hedge",
                        f("market", market.slug),
                        f("entry_id", entry ? entry->id : std::string("-")),
                        f("hedge_id", placed.id),
                        f("price_cents", pips_to_cents(price_pips)),
                        f("size", size));
        return placed;
    }

    // Resting price for a fresh hedge. extra_cents is how much more the
    // negative-profit mode is willing to pay under load.
    static int compute_initial_hedge_cents(int entry_cents, int ask_cents, const HedgeConfig& config, int extra_cents) {
        const int ideal = std::clamp(UNIT_TOTAL_CENTS - entry_cents - config.offset_cents, 1, UNIT_TOTAL_CENTS - 1);
        if(config.allow_negative_profit_on_reorder) {
            const int max_allowed =
                std::clamp(ideal + config.max_negative_profit_cents + extra_cents, 1, UNIT_TOTAL_CENTS - 1);
            if(ask_cents > 0 && ask_cents <= max_allowed) {
                return ask_cents;
            }
            return max_allowed;
        }
        int price = ideal;
        if(ask_cents > 0 && ideal >= ask_cents) {
            price = ask_cents - 1;
        }
        return std::max(price, 1);
    }

    // More pending work and slower recent hedges buy a few cents of urgency.
    [[nodiscard]] int hedge_price_extra_cents(const std::string& market) const {
        int extra = 0;
        if(context_.risk().count() > 0) {
            extra += 2;
        }
        extra += static_cast<int>(std::min<size_t>(context_.state().pending_count(), 3));
        const double ewma =
            context_.state().read_timing([&](const HedgeTimingTracker& timing) { return timing.get_ewma_seconds(market); });
        if(ewma > 25.0) {
            extra += 4;
        } else if(ewma > 15.0) {
            extra += 2;
        } else if(ewma > 8.0) {
            extra += 1;
        }
        return std::clamp(extra, 0, MAX_EXTRA_CENTS);
    }

    static constexpr int MAX_EXTRA_CENTS = 8;

private:
    // Marks the market as having a placement in flight, so the orchestrator's
    // missing-hedge fallback waits for it.
    class ExecutionScope {
    public:
        ExecutionScope(OmsState& state, std::string market)
            : state_(state)
            , market_(std::move(market)) {
            state_.begin_execution(market_);
        }
        ~ExecutionScope() { state_.end_execution(market_); }

        ExecutionScope(const ExecutionScope&) = delete;
        ExecutionScope& operator=(const ExecutionScope&) = delete;

    private:
        OmsState& state_;
        const std::string market_;
    };

    ExecutionResult execute_sequential(std::stop_token token, const MarketInfo& market, const Decision& decision, double size) {
        const auto& execution = context_.config().execution;
        const TokenSide hedge_token = opposite(decision.entry_token);

        OrderRequest entry_request;
        entry_request.market = market.slug;
        entry_request.asset_id = market.asset_for(decision.entry_token);
        entry_request.token = decision.entry_token;
        entry_request.side = TradeSide::BUY;
        entry_request.price_pips = decision.entry_price_pips;
        entry_request.size = size;
        entry_request.order_class = OrderClass::IOC;
        entry_request.is_entry = true;

        const Order placed_entry = context_.place_order(token, entry_request);
        auto entry = wait_for_fill(token, placed_entry);
        if(!entry) {
            log_action_fail<LogLevel::WARNING>("execute_order", "entry_not_filled", f("entry_id", placed_entry.id));
            return ExecutionResult::failure("entry_not_filled", placed_entry.id);
        }

        const double hedge_size = entry->filled_size > SIZE_EPSILON ? entry->filled_size : size;
        const int64_t hedge_price = initial_hedge_price(market, hedge_token, entry->price_cents(), decision.hedge_price_pips);

        OrderRequest hedge_request;
        hedge_request.market = market.slug;
        hedge_request.asset_id = market.asset_for(hedge_token);
        hedge_request.token = hedge_token;
        hedge_request.side = TradeSide::BUY;
        hedge_request.price_pips = hedge_price;
        hedge_request.size = hedge_size;
        hedge_request.order_class = hedge_size < execution.min_resting_hedge_size ? OrderClass::IOC : OrderClass::GTC;
        hedge_request.linked_order_id = entry->id;
        hedge_request.disable_size_adjust = true;
        hedge_request.bypass_risk_off = true;

        Order hedge;
        try {
            hedge = context_.place_order(token, hedge_request);
        } catch(const SubstrateError& e) {
            // The entry is filled: the fallback hedge and the risk view pick it up from here
            log_action_fail<LogLevel::ERROR>("place_hedge",
                                             e.what(),
                                             f("entry_id", entry->id),
                                             f("kind", to_string(e.kind())),
                                             f("unhedged", true));
            return ExecutionResult::failure("hedge_place_failed", entry->id);
        }

        context_.state().record_pair(entry->id, hedge.id);
        context_.state().set_hedge_price(entry->id, pips_to_cents(hedge_price));
        if(!hedge.is_filled()) {
            context_.state().record_pending_hedge(entry->id, hedge.id);
            arm_hedge_tracking(*entry, hedge);
        }

        log_action_pass("execute_order",
                        f("mode", "sequential"),
                        f("entry_id", entry->id),
                        f("hedge_id", hedge.id),
                        f("hedge_cents", pips_to_cents(hedge_price)),
                        f("hedge_class", to_string(hedge_request.order_class)),
                        f("size", hedge_size));
        return ExecutionResult{true, "", entry->id, hedge.id};
    }

    ExecutionResult execute_parallel(std::stop_token token, const MarketInfo& market, const Decision& decision, double size) {
        const TokenSide hedge_token = opposite(decision.entry_token);
        const int64_t hedge_price =
            initial_hedge_price(market, hedge_token, pips_to_cents(decision.entry_price_pips), decision.hedge_price_pips);

        MultiLegRequest request;
        request.name = "entry_hedge";
        request.market = market.slug;

        OrderRequest entry_leg;
        entry_leg.market = market.slug;
        entry_leg.asset_id = market.asset_for(decision.entry_token);
        entry_leg.token = decision.entry_token;
        entry_leg.side = TradeSide::BUY;
        entry_leg.price_pips = decision.entry_price_pips;
        entry_leg.size = size;
        entry_leg.order_class = OrderClass::IOC;
        entry_leg.is_entry = true;
        request.legs.push_back(entry_leg);

        OrderRequest hedge_leg;
        hedge_leg.market = market.slug;
        hedge_leg.asset_id = market.asset_for(hedge_token);
        hedge_leg.token = hedge_token;
        hedge_leg.side = TradeSide::BUY;
        hedge_leg.price_pips = hedge_price;
        hedge_leg.size = size;
        hedge_leg.order_class = OrderClass::GTC;
        request.legs.push_back(hedge_leg);

        const auto orders = context_.execute_multi_leg(token, request);
        if(orders.size() < 2) {
            log_action_fail<LogLevel::ERROR>("execute_order", "incomplete_multi_leg", f("orders", orders.size()));
            return ExecutionResult::failure("incomplete_multi_leg");
        }
        const Order& entry = orders[0];
        const Order& hedge = orders[1];

        context_.state().record_pair(entry.id, hedge.id);
        context_.state().set_hedge_price(entry.id, pips_to_cents(hedge_price));
        if(!hedge.is_filled()) {
            context_.state().record_pending_hedge(entry.id, hedge.id);
        }
        // the entry fill may have been reported before the pair was recorded
        if(auto current = context_.substrate().get_order(entry.id); current && current->is_filled()) {
            if(hedge.is_filled()) {
                close_hedged_entry(entry.id, hedge);
            } else {
                arm_hedge_tracking(*current, hedge);
            }
        }

        log_action_pass("execute_order",
                        f("mode", "parallel"),
                        f("entry_id", entry.id),
                        f("hedge_id", hedge.id),
                        f("hedge_cents", pips_to_cents(hedge_price)),
                        f("size", size));
        return ExecutionResult{true, "", entry.id, hedge.id};
    }

    // Polls until the entry fills or the wait budget runs out, then checks once more.
    std::optional<Order> wait_for_fill(std::stop_token token, const Order& placed) {
        if(placed.is_filled()) {
            return placed;
        }
        const auto& execution = context_.config().execution;
        const auto deadline = std::chrono::steady_clock::now() + execution.sequential_max_wait;
        while(std::chrono::steady_clock::now() < deadline) {
            if(auto order = context_.substrate().get_order(placed.id)) {
                if(order->is_filled()) {
                    return order;
                }
                if(order->status == OrderStatus::CANCELED || order->status == OrderStatus::FAILED) {
                    return std::nullopt;
                }
            }
            if(!interruptible_sleep(token, execution.sequential_check_interval)) {
                return std::nullopt;
            }
        }
        if(auto order = context_.substrate().get_order(placed.id); order && order->is_filled()) {
            return order;
        }
        return std::nullopt;
    }

    int64_t initial_hedge_price(const MarketInfo& market, TokenSide hedge_token, int entry_cents, int64_t fallback_pips) {
        BookTop top;
        try {
            top = context_.substrate().get_top_of_book(market, context_.config().hedge.top_of_book_timeout);
        } catch(const SubstrateError& e) {
            LOG_ACTION_FAIL_DEBUG("initial_hedge_price", "book_unavailable", f("error", e.what()));
            return fallback_pips;
        }
        const int extra = hedge_price_extra_cents(market.slug);
        const int cents =
            compute_initial_hedge_cents(entry_cents, pips_to_cents(top.ask_for(hedge_token)), context_.config().hedge, extra);
        return cents_to_pips(cents);
    }

    ExecutionResult reject(const std::string& reason, const MarketInfo& market, const Decision& decision) {
        log_action_fail<LogLevel::WARNING>("execute_order",
                                           reason,
                                           f("market", market.slug),
                                           f("entry_cents", pips_to_cents(decision.entry_price_pips)),
                                           f("entry_size", decision.entry_size),
                                           f("hedge_size", decision.hedge_size));
        return ExecutionResult::failure(reason);
    }

    static bool valid_price(int64_t pips) { return pips > 0 && pips < UNIT_TOTAL_PIPS; }

    OmsContext& context_;
    PriceStopEvaluator& price_stop_;
};
