#pragma once

#include "../infra/timer.hpp"
#include "HedgeReorderMonitor.h"
#include "OmsContext.h"
#include "OrderExecutor.h"
#include "PriceStopEvaluator.h"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

struct ExposureInfo {
    Exposure exposure;
    int original_hedge_cents = 0;
    int current_hedge_cents = 0;
    double countdown_seconds = 0.0;
};

struct RiskManagementStatus {
    size_t exposure_count = 0;
    std::vector<ExposureInfo> exposures;
    std::string current_action;
    uint64_t total_reorders = 0;
    uint64_t total_forced_fills = 0;
    uint64_t total_aggressive_hedges = 0;
    RepriceStatus last_reprice;
};

struct OpsMetrics {
    size_t queue_length = 0;
    size_t pending_hedges = 0;
    size_t exposures = 0;
    size_t running_tasks = 0;
    size_t active_watches = 0;
    double hedge_ewma_seconds = 0.0;
    uint64_t reorder_budget_skips = 0;
    uint64_t forced_fill_budget_warnings = 0;
    double cooldown_remaining_seconds = 0.0;
    std::string cooldown_reason;
};

// Paired entry+hedge order management for one binary market. Strategy
// decisions come in through execute_order, venue reports through
// on_order_update and book ticks through on_price_changed. Everything that
// may wait on the venue runs on the context's task group.
class Oms {
public:
    static constexpr auto METRICS_PERIOD = std::chrono::seconds(30);
    static constexpr auto RESUME_DELAY = std::chrono::seconds(2);
    static constexpr auto FALLBACK_POLL = std::chrono::milliseconds(50);
    static constexpr double POSITION_TOLERANCE = 0.0001;

    Oms(const OmsConfig& config, TradingSubstrate& substrate, SettlementCollaborator& settlement)
        : context_(config, substrate, settlement)
        , price_stop_(context_)
        , executor_(context_, price_stop_) {}

    Oms(const Oms&) = delete;
    Oms& operator=(const Oms&) = delete;

    // Tasks hold pointers into the evaluator and executor, so they are joined
    // before those members go away.
    ~Oms() {
        metrics_timer_.stop();
        context_.close_gate();
        context_.tasks().join_all();
    }

    ExecutionResult execute_order(const MarketInfo& market, const Decision& decision) {
        try {
            return executor_.execute(context_.cycle_token(), market, decision);
        } catch(const GateClosedError& e) {
            log_action_fail<LogLevel::WARNING>("execute_order", e.what(), f("market", market.slug));
            return ExecutionResult::failure("gate_closed");
        } catch(const GateCancelledError& e) {
            log_action_fail<LogLevel::WARNING>("execute_order", e.what(), f("market", market.slug));
            return ExecutionResult::failure("cancelled");
        }
    }

    // Must not block on the gate: the paper venue reports fills from the gate
    // worker itself.
    void on_order_update(const Order& order) {
        if(order.id.empty()) {
            return;
        }
        auto& state = context_.state();

        if(!order.is_entry && !order.linked_order_id.empty()) {
            state.record_pair(order.linked_order_id, order.id);
        }

        const bool is_entry = order.is_entry || state.is_pending_entry(order.id);
        if(is_entry) {
            if(order.is_filled()) {
                handle_entry_filled(order);
            }
            return;
        }

        context_.risk().update_hedge_status(order.id, order.status);
        if(order.is_filled()) {
            handle_hedge_filled(order);
        }
    }

    void on_price_changed(const PriceChangedEvent& event) { price_stop_.on_price_changed(event); }

    void on_price_changed(const PriceChangedEvent& event, Clock::time_point now) {
        price_stop_.on_price_changed(event, now);
    }

    void on_cycle(const MarketInfo& old_market, const MarketInfo& new_market) {
        log_event<LogLevel::INFO>("cycle_rollover",
                                  f("old_market", old_market.slug),
                                  f("new_market", new_market.slug),
                                  f("pending_hedges", context_.state().pending_count()),
                                  f("exposures", context_.risk().count()),
                                  f("tasks", context_.tasks().running_count()));

        context_.rotate_cycle();
        context_.tasks().join_all();

        context_.state().reset();
        context_.risk().clear();
        context_.reorder_limiter().reset();
        context_.forced_fill_limiter().reset();
    }

    [[nodiscard]] bool has_unhedged_risk(const std::string& market) const {
        if(context_.state().pending_count() > 0) {
            return true;
        }
        double up = 0.0;
        double down = 0.0;
        for(const auto& position : context_.substrate().open_positions_for_market(market)) {
            if(!position.open) {
                continue;
            }
            (position.token == TokenSide::UP ? up : down) += position.size;
        }
        return std::fabs(up - down) > POSITION_TOLERANCE;
    }

    void record_pending_hedge(const std::string& entry_order_id, const std::string& hedge_order_id) {
        context_.state().record_pending_hedge(entry_order_id, hedge_order_id);
    }

    [[nodiscard]] std::unordered_map<std::string, std::string> pending_hedges() const {
        return context_.state().pending_hedges();
    }

    std::optional<CooldownLedger::Status> market_cooldown(const std::string& market) {
        return context_.state().with_entry_guard(
            [&](EntryGuard& guard) { return guard.market_cooldown(market, Clock::now()); });
    }

    std::optional<Order> auto_hedge_position(const MarketInfo& market,
                                             TokenSide hedge_token,
                                             double size,
                                             const std::string& entry_order_id) {
        std::optional<Order> entry;
        if(!entry_order_id.empty()) {
            entry = context_.substrate().get_order(entry_order_id);
        }
        try {
            return executor_.auto_hedge_position(context_.cycle_token(), market, hedge_token, size, entry);
        } catch(const GateClosedError& e) {
            log_action_fail<LogLevel::WARNING>("auto_hedge", e.what(), f("market", market.slug));
        } catch(const GateCancelledError& e) {
            log_action_fail<LogLevel::WARNING>("auto_hedge", e.what(), f("market", market.slug));
        }
        return std::nullopt;
    }

    void start() {
        if(started_.exchange(true)) {
            return;
        }
        if(context_.reopen_gate()) {
            log_event<LogLevel::INFO>("gate_reopened");
        }

        metrics_timer_.clearCallbacks();
        metrics_timer_.addCallback([this]() { log_ops_metrics(); });
        metrics_timer_.start(std::chrono::duration_cast<std::chrono::milliseconds>(METRICS_PERIOD));

        context_.tasks().spawn([this](std::stop_token token) {
            if(!interruptible_sleep(token, RESUME_DELAY)) {
                return;
            }
            resume_monitors();
        });
        log_event<LogLevel::INFO>("oms_started",
                                  f("mode", to_string(context_.config().execution.mode)),
                                  f("price_stop", price_stop_.enabled()));
    }

    void stop() {
        if(!started_.exchange(false)) {
            return;
        }
        context_.close_gate();
        context_.state().clear_watches();
        metrics_timer_.stop();
        context_.tasks().request_stop_all();
        context_.tasks().join_all();
        log_event<LogLevel::INFO>("oms_stopped");
    }

    [[nodiscard]] bool is_started() const { return started_; }

    [[nodiscard]] RiskManagementStatus risk_management_status() const { return risk_management_status(Clock::now()); }

    [[nodiscard]] RiskManagementStatus risk_management_status(Clock::time_point now) const {
        const auto& state = context_.state();
        const double aggressive_seconds = to_seconds(context_.config().hedge.aggressive_hedge_timeout);

        RiskManagementStatus status;
        for(auto& exposure : context_.risk().get_exposures(now)) {
            ExposureInfo info;
            if(auto prices = state.hedge_prices(exposure.entry_order_id)) {
                info.original_hedge_cents = prices->original_cents;
                info.current_hedge_cents = prices->current_cents;
            }
            info.countdown_seconds = std::max(0.0, aggressive_seconds - exposure.exposure_seconds);
            info.exposure = std::move(exposure);
            status.exposures.push_back(std::move(info));
        }
        status.exposure_count = status.exposures.size();
        status.current_action = state.current_action();
        status.total_reorders = state.counters().total_reorders.load();
        status.total_forced_fills = state.counters().total_forced_fills.load();
        status.total_aggressive_hedges = state.counters().total_aggressive_hedges.load();
        status.last_reprice = state.reprice_status();
        return status;
    }

    OpsMetrics ops_metrics(const std::string& market) {
        auto& state = context_.state();

        OpsMetrics metrics;
        if(auto gate = context_.gate()) {
            metrics.queue_length = gate->size();
        }
        metrics.pending_hedges = state.pending_count();
        metrics.exposures = context_.risk().count();
        metrics.running_tasks = context_.tasks().running_count();
        metrics.active_watches = state.watch_count();
        metrics.hedge_ewma_seconds =
            state.read_timing([&](const HedgeTimingTracker& timing) { return timing.get_ewma_seconds(market); });
        metrics.reorder_budget_skips = state.counters().reorder_budget_skips.load();
        metrics.forced_fill_budget_warnings = state.counters().forced_fill_budget_warnings.load();
        if(auto cooldown = market_cooldown(market)) {
            metrics.cooldown_remaining_seconds = to_seconds(cooldown->remaining);
            metrics.cooldown_reason = cooldown->reason;
        }
        return metrics;
    }

    [[nodiscard]] PriceStopStatus price_stop_status(const std::string& market) const {
        return price_stop_.status(market);
    }

    void log_ops_metrics() {
        const auto market = context_.market_info().slug;
        const auto metrics = ops_metrics(market);
        log_event<LogLevel::INFO>("ops_metrics",
                                  f("market", market),
                                  f("queue", metrics.queue_length),
                                  f("pending_hedges", metrics.pending_hedges),
                                  f("exposures", metrics.exposures),
                                  f("tasks", metrics.running_tasks),
                                  f("watches", metrics.active_watches),
                                  f("hedge_ewma_s", metrics.hedge_ewma_seconds),
                                  f("reorder_skips", metrics.reorder_budget_skips),
                                  f("forced_fill_warnings", metrics.forced_fill_budget_warnings),
                                  f("cooldown_s", metrics.cooldown_remaining_seconds),
                                  f("cooldown_reason", metrics.cooldown_reason.empty() ? "-" : metrics.cooldown_reason));
    }

    OmsContext& context() { return context_; }

private:
    void handle_entry_filled(const Order& entry) {
        auto& state = context_.state();
        const auto now = Clock::now();
        const auto started_at = entry.filled_time_or(now);

        state.with_entry_guard(
            [&](EntryGuard& guard) { guard.init_entry_budget(entry.id, entry.market, started_at, now); });
        state.with_timing(
            [&](HedgeTimingTracker& timing) { timing.record_entry_filled(entry.id, entry.market, started_at); });

        const auto hedge_id = state.pending_hedge(entry.id);
        if(!hedge_id) {
            if(auto hedge = filled_paired_hedge(entry.id)) {
                executor_.close_hedged_entry(entry.id, *hedge);
                return;
            }
        }
        if(!hedge_id && !state.has_paired_hedge(entry.id) &&
           context_.config().execution.mode == ExecutionMode::SEQUENTIAL && state.try_mark_fallback(entry.id)) {
            schedule_hedge_fallback(entry);
        }

        context_.risk().register_entry(entry, hedge_id.value_or(""), now);
        if(!hedge_id) {
            return;
        }

        const auto hedge = context_.substrate().get_order(*hedge_id);
        if(!hedge || !hedge->is_filled()) {
            HedgeReorderMonitor::spawn(context_, entry, *hedge_id);
        }
        price_stop_.register_watch(entry, *hedge_id);
    }

    void handle_hedge_filled(const Order& hedge) {
        auto& state = context_.state();

        std::optional<std::string> entry_id = state.entry_for_pending_hedge(hedge.id);
        if(!entry_id && !hedge.linked_order_id.empty() && state.pending_hedge(hedge.linked_order_id) == hedge.id) {
            entry_id = hedge.linked_order_id;
        }

        if(entry_id) {
            state.erase_pending_hedge_if(*entry_id, hedge.id);
            state.with_entry_guard([&](EntryGuard& guard) { guard.clear_entry_budget(*entry_id); });
        }

        std::string timing_key = hedge.linked_order_id;
        if(timing_key.empty()) {
            timing_key = entry_id ? *entry_id : state.paired_entry(hedge.id).value_or("");
        }
        if(!timing_key.empty()) {
            const auto filled_at = hedge.filled_time_or(Clock::now());
            state.with_timing([&](HedgeTimingTracker& timing) { return timing.record_hedge_filled(timing_key, filled_at); });
            context_.risk().remove_exposure(timing_key);
            state.finish_watch(timing_key, "completed");
        }

        log_action_pass("hedge_filled",
                        f("hedge_id", hedge.id),
                        f("entry_id", timing_key.empty() ? std::string("-") : timing_key),
                        f("price_cents", hedge.price_cents()),
                        f("size", hedge.executed_size()));

        context_.settlement().schedule(context_.market_info(), context_.config().settlement.merge_delay);
    }

    [[nodiscard]] std::optional<Order> filled_paired_hedge(const std::string& entry_id) const {
        for(const auto& hedge_id : context_.state().paired_hedges(entry_id)) {
            if(auto hedge = context_.substrate().get_order(hedge_id); hedge && hedge->is_filled()) {
                return hedge;
            }
        }
        return std::nullopt;
    }

    // Sequential mode places the hedge itself. This catches entries whose
    // hedge never appeared, once the placement in flight on the market is done.
    void schedule_hedge_fallback(const Order& entry) {
        context_.tasks().spawn([this, entry](std::stop_token token) {
            const auto& execution = context_.config().execution;
            if(!interruptible_sleep(token, execution.hedge_fallback_delay)) {
                return;
            }
            const auto deadline = Clock::now() + execution.sequential_max_wait + context_.config().hedge.top_of_book_timeout;
            while(context_.state().executions_in_flight(entry.market) > 0 && Clock::now() < deadline) {
                if(!interruptible_sleep(token, FALLBACK_POLL)) {
                    return;
                }
            }

            if(auto hedge_id = context_.state().pending_hedge(entry.id)) {
                context_.risk().update_hedge_order_id(entry.id, *hedge_id);
                return;
            }
            if(context_.state().has_paired_hedge(entry.id)) {
                return;
            }

            log_event<LogLevel::WARNING>("missing_hedge", f("entry_id", entry.id), f("market", entry.market));
            MarketInfo market = context_.market_info();
            if(market.slug != entry.market) {
                log_action_fail<LogLevel::ERROR>("auto_hedge",
                                                 "market_mismatch",
                                                 f("entry_id", entry.id),
                                                 f("entry_market", entry.market),
                                                 f("current_market", market.slug));
                return;
            }
            try {
                executor_.auto_hedge_position(token, market, opposite(entry.token), entry.executed_size(), entry);
            } catch(const GateClosedError& e) {
                log_action_fail<LogLevel::WARNING>("auto_hedge", e.what(), f("entry_id", entry.id));
            } catch(const GateCancelledError& e) {
                log_action_fail<LogLevel::WARNING>("auto_hedge", e.what(), f("entry_id", entry.id));
            }
        });
    }

    void resume_monitors() {
        auto& state = context_.state();
        size_t resumed = 0;
        for(const auto& [entry_id, hedge_id] : state.pending_hedges()) {
            const auto hedge = context_.substrate().get_order(hedge_id);
            if(hedge && hedge->is_filled()) {
                state.erase_pending_hedge_if(entry_id, hedge_id);
                continue;
            }
            const auto entry = context_.substrate().get_order(entry_id);
            if(!entry || !entry->is_filled()) {
                continue;
            }
            if(HedgeReorderMonitor::spawn(context_, *entry, hedge_id)) {
                resumed++;
            }
        }
        log_event<LogLevel::INFO>("monitors_resumed", f("count", resumed));
    }

    OmsContext context_;
    PriceStopEvaluator price_stop_;
    OrderExecutor executor_;
    Timer metrics_timer_;
    std::atomic<bool> started_{false};
};
