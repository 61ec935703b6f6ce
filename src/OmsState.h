#pragma once

#include "../oms/order.hpp"
#include "EntryGuard.h"
#include "HedgeTimingTracker.h"
#include "format.h"
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct PriceStopWatch {
    std::string entry_order_id;
    std::string market;
    TokenSide entry_token = TokenSide::UP;
    int entry_price_cents = 0;
    double entry_size = 0.0;
    std::string hedge_order_id;

    int soft_hits = 0;
    int take_profit_hits = 0;
    bool triggered = false;
    Clock::time_point last_evaluated_at{};
    std::optional<int> last_profit_cents;
    std::string status = "monitoring";
};

// Last reprice or forced fill, kept for the risk status view.
struct RepriceStatus {
    std::string action;
    std::string entry_order_id;
    std::string hedge_order_id;
    Clock::time_point at{};
    std::string description;
    int old_price_cents = 0;
    int new_price_cents = 0;
    int change_cents = 0;
    std::string strategy;
    int entry_cost_cents = 0;
    int market_ask_cents = 0;
    int ideal_price_cents = 0;
    int total_cost_cents = 0;
    int profit_cents = 0;
};

struct HedgePrices {
    int original_cents = 0;
    int current_cents = 0;
};

struct OmsCounters {
    std::atomic<uint64_t> total_reorders{0};
    std::atomic<uint64_t> total_forced_fills{0};
    std::atomic<uint64_t> total_aggressive_hedges{0};
    std::atomic<uint64_t> reorder_budget_skips{0};
    std::atomic<uint64_t> forced_fill_budget_warnings{0};

    void reset() {
        total_reorders = 0;
        total_forced_fills = 0;
        total_aggressive_hedges = 0;
        reorder_budget_skips = 0;
        forced_fill_budget_warnings = 0;
    }
};

// Every per-entry and per-market map of the OMS, behind one reader/writer
// lock. Accessors copy out; nothing hands a reference to guarded data past
// the end of the call, except the with_* helpers which run under the lock.
class OmsState {
public:
    static constexpr size_t FINISHED_WATCH_HISTORY = 20;

    explicit OmsState(const EntryGuardConfig& guard_config)
        : entry_guard_(guard_config) {}

    // pending hedges: entry id -> the one live hedge id tracked for it

    void record_pending_hedge(const std::string& entry_id, const std::string& hedge_id) {
        if(entry_id.empty() || hedge_id.empty()) {
            return;
        }
        std::unique_lock lock(mutex_);
        pending_hedges_[entry_id] = hedge_id;
        hedge_to_entry_[hedge_id] = entry_id;
    }

    [[nodiscard]] std::optional<std::string> pending_hedge(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        auto it = pending_hedges_.find(entry_id);
        if(it == pending_hedges_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool is_pending_entry(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        return pending_hedges_.count(entry_id) > 0;
    }

    // Entry whose pending hedge is this order, if any.
    [[nodiscard]] std::optional<std::string> entry_for_pending_hedge(const std::string& hedge_id) const {
        std::shared_lock lock(mutex_);
        for(const auto& [entry_id, pending] : pending_hedges_) {
            if(pending == hedge_id) {
                return entry_id;
            }
        }
        return std::nullopt;
    }

    // Replaces old_hedge with new_hedge only if the entry still tracks old_hedge.
    // old_filled is what old_hedge filled before it was canceled; it stays
    // counted against the entry after the swap.
    bool supersede_hedge(const std::string& entry_id,
                         const std::string& old_hedge,
                         const std::string& new_hedge,
                         double old_filled = 0.0) {
        std::unique_lock lock(mutex_);
        auto it = pending_hedges_.find(entry_id);
        if(it == pending_hedges_.end() || it->second != old_hedge) {
            return false;
        }
        it->second = new_hedge;
        hedge_to_entry_[new_hedge] = entry_id;
        if(old_filled > SIZE_EPSILON) {
            retired_fills_[entry_id] += old_filled;
        }
        return true;
    }

    // Size filled by hedges the entry no longer tracks.
    [[nodiscard]] double retired_hedge_fill(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        auto it = retired_fills_.find(entry_id);
        return it == retired_fills_.end() ? 0.0 : it->second;
    }

    bool erase_pending_hedge_if(const std::string& entry_id, const std::string& hedge_id) {
        std::unique_lock lock(mutex_);
        auto it = pending_hedges_.find(entry_id);
        if(it == pending_hedges_.end() || it->second != hedge_id) {
            return false;
        }
        pending_hedges_.erase(it);
        return true;
    }

    // After a forced fill completed: the mapping is dropped when it still refers to
    // either hedge or is already gone. A mapping to any third hedge is left alone.
    bool settle_forced_fill(const std::string& entry_id, const std::string& old_hedge, const std::string& new_hedge) {
        std::unique_lock lock(mutex_);
        auto it = pending_hedges_.find(entry_id);
        if(it == pending_hedges_.end()) {
            return true;
        }
        if(it->second == old_hedge || it->second == new_hedge) {
            pending_hedges_.erase(it);
            return true;
        }
        return false;
    }

    [[nodiscard]] std::unordered_map<std::string, std::string> pending_hedges() const {
        std::shared_lock lock(mutex_);
        return pending_hedges_;
    }

    [[nodiscard]] size_t pending_count() const {
        std::shared_lock lock(mutex_);
        return pending_hedges_.size();
    }

    // pairs: hedge id -> entry id, kept after the pending mapping is gone

    void record_pair(const std::string& entry_id, const std::string& hedge_id) {
        if(entry_id.empty() || hedge_id.empty()) {
            return;
        }
        std::unique_lock lock(mutex_);
        hedge_to_entry_[hedge_id] = entry_id;
    }

    [[nodiscard]] std::optional<std::string> paired_entry(const std::string& hedge_id) const {
        std::shared_lock lock(mutex_);
        auto it = hedge_to_entry_.find(hedge_id);
        if(it == hedge_to_entry_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> paired_hedges(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        for(const auto& [hedge_id, entry] : hedge_to_entry_) {
            if(entry == entry_id) {
                result.push_back(hedge_id);
            }
        }
        return result;
    }

    [[nodiscard]] bool has_paired_hedge(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        for(const auto& [_, entry] : hedge_to_entry_) {
            if(entry == entry_id) {
                return true;
            }
        }
        return false;
    }

    // executions in flight per market; survives a cycle reset

    void begin_execution(const std::string& market) {
        std::unique_lock lock(mutex_);
        executions_in_flight_[market]++;
    }

    void end_execution(const std::string& market) {
        std::unique_lock lock(mutex_);
        auto it = executions_in_flight_.find(market);
        if(it == executions_in_flight_.end()) {
            return;
        }
        if(--it->second == 0) {
            executions_in_flight_.erase(it);
        }
    }

    [[nodiscard]] size_t executions_in_flight(const std::string& market) const {
        std::shared_lock lock(mutex_);
        auto it = executions_in_flight_.find(market);
        return it == executions_in_flight_.end() ? 0 : it->second;
    }

    void set_hedge_price(const std::string& entry_id, int price_cents) {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = hedge_prices_.try_emplace(entry_id, HedgePrices{price_cents, price_cents});
        if(!inserted) {
            it->second.current_cents = price_cents;
        }
    }

    [[nodiscard]] std::optional<HedgePrices> hedge_prices(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        auto it = hedge_prices_.find(entry_id);
        if(it == hedge_prices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // one-shot markers

    bool try_mark_fallback(const std::string& entry_id) {
        std::unique_lock lock(mutex_);
        return fallback_entries_.insert(entry_id).second;
    }

    bool try_mark_monitor(const std::string& entry_id) {
        std::unique_lock lock(mutex_);
        return monitored_entries_.insert(entry_id).second;
    }

    void clear_monitor(const std::string& entry_id) {
        std::unique_lock lock(mutex_);
        monitored_entries_.erase(entry_id);
    }

    [[nodiscard]] bool has_monitor(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        return monitored_entries_.count(entry_id) > 0;
    }

    // price-stop watches

    bool add_watch(PriceStopWatch watch) {
        std::unique_lock lock(mutex_);
        const auto key = watch.entry_order_id;
        return watches_.try_emplace(key, std::move(watch)).second;
    }

    [[nodiscard]] bool has_watch(const std::string& entry_id) const {
        std::shared_lock lock(mutex_);
        return watches_.count(entry_id) > 0;
    }

    // Removes the watch and keeps it in the short finished history with the given status.
    void finish_watch(const std::string& entry_id, const std::string& status) {
        std::unique_lock lock(mutex_);
        auto it = watches_.find(entry_id);
        if(it == watches_.end()) {
            return;
        }
        it->second.status = status;
        finished_watches_.push_back(std::move(it->second));
        if(finished_watches_.size() > FINISHED_WATCH_HISTORY) {
            finished_watches_.pop_front();
        }
        watches_.erase(it);
    }

    // Runs func(PriceStopWatch&) for every active watch under the exclusive lock.
    // func must not call back into OmsState.
    template<typename Func>
    void for_each_watch(Func&& func) {
        std::unique_lock lock(mutex_);
        for(auto& [_, watch] : watches_) {
            func(watch);
        }
    }

    template<typename Func>
    auto with_watch(const std::string& entry_id, Func&& func) -> std::optional<std::invoke_result_t<Func, PriceStopWatch&>> {
        std::unique_lock lock(mutex_);
        auto it = watches_.find(entry_id);
        if(it == watches_.end()) {
            return std::nullopt;
        }
        return func(it->second);
    }

    [[nodiscard]] std::vector<PriceStopWatch> watches_for_market(const std::string& market) const {
        std::shared_lock lock(mutex_);
        std::vector<PriceStopWatch> result;
        for(const auto& [_, watch] : watches_) {
            if(watch.market == market) {
                result.push_back(watch);
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<PriceStopWatch> finished_watches_for_market(const std::string& market) const {
        std::shared_lock lock(mutex_);
        std::vector<PriceStopWatch> result;
        for(const auto& watch : finished_watches_) {
            if(watch.market == market) {
                result.push_back(watch);
            }
        }
        return result;
    }

    [[nodiscard]] size_t watch_count() const {
        std::shared_lock lock(mutex_);
        return watches_.size();
    }

    void clear_watches() {
        std::unique_lock lock(mutex_);
        watches_.clear();
        finished_watches_.clear();
    }

    // entry guard and latency tracker run under the exclusive lock

    // Cooldowns and refusals raised by func are logged once the lock is released.
    template<typename Func>
    decltype(auto) with_entry_guard(Func&& func) {
        GuardEventLog log;
        std::unique_lock lock(mutex_);
        GuardEventDrain drain{entry_guard_, log};
        return func(entry_guard_);
    }

    template<typename Func>
    decltype(auto) with_timing(Func&& func) {
        std::unique_lock lock(mutex_);
        return func(timing_);
    }

    template<typename Func>
    decltype(auto) read_timing(Func&& func) const {
        std::shared_lock lock(mutex_);
        return func(timing_);
    }

    // status fields

    void set_reprice_status(RepriceStatus status) {
        std::unique_lock lock(mutex_);
        reprice_status_ = std::move(status);
        current_action_ = reprice_status_.action;
    }

    [[nodiscard]] RepriceStatus reprice_status() const {
        std::shared_lock lock(mutex_);
        return reprice_status_;
    }

    void set_current_action(const std::string& action) {
        std::unique_lock lock(mutex_);
        current_action_ = action;
    }

    [[nodiscard]] std::string current_action() const {
        std::shared_lock lock(mutex_);
        return current_action_;
    }

    OmsCounters& counters() { return counters_; }
    [[nodiscard]] const OmsCounters& counters() const { return counters_; }

    // Cycle rollover: everything goes in one critical section.
    void reset() {
        std::unique_lock lock(mutex_);
        pending_hedges_.clear();
        retired_fills_.clear();
        hedge_to_entry_.clear();
        hedge_prices_.clear();
        fallback_entries_.clear();
        monitored_entries_.clear();
        watches_.clear();
        finished_watches_.clear();
        entry_guard_.reset();
        timing_.clear_pending();
        reprice_status_ = RepriceStatus{};
        current_action_ = "idle";
    }

private:
    struct GuardEventLog {
        std::vector<GuardEvent> events;

        ~GuardEventLog() {
            for(const auto& event : events) {
                log_guard_event(event);
            }
        }
    };

    // Destroyed while the lock is still held, before the log above.
    struct GuardEventDrain {
        EntryGuard& guard;
        GuardEventLog& log;

        ~GuardEventDrain() { log.events = guard.drain_events(); }
    };

    mutable std::shared_mutex mutex_;

    std::unordered_map<std::string, std::string> pending_hedges_;
    std::unordered_map<std::string, double> retired_fills_;
    std::unordered_map<std::string, std::string> hedge_to_entry_;
    std::unordered_map<std::string, HedgePrices> hedge_prices_;
    std::unordered_set<std::string> fallback_entries_;
    std::unordered_set<std::string> monitored_entries_;
    std::unordered_map<std::string, PriceStopWatch> watches_;
    std::deque<PriceStopWatch> finished_watches_;
    std::unordered_map<std::string, size_t> executions_in_flight_;

    EntryGuard entry_guard_;
    HedgeTimingTracker timing_;

    RepriceStatus reprice_status_;
    std::string current_action_ = "idle";

    OmsCounters counters_;
};
