#pragma once

#include "CooldownLedger.h"
#include "format.h"
#include "logging.h"
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct EntryGuardConfig {
    int max_reorders = 3;
    int max_cancels = 6;
    int max_forced_fills = 1;
    std::chrono::seconds max_age{120};
    std::chrono::seconds cooldown{30};
};

struct EntryBudget {
    std::string market;
    std::chrono::system_clock::time_point started_at;
    int reorders = 0;
    int cancels = 0;
    int forced_fills = 0;
};

// Policy signal raised by the guard. Queued so the caller can log it
// outside of whatever lock serializes the guard.
struct GuardEvent {
    enum class Kind { COOLDOWN, REORDER_REFUSED };

    Kind kind = Kind::COOLDOWN;
    std::string market;
    std::string entry_id;
    std::string reason;
    std::string detail;
};

inline void log_guard_event(const GuardEvent& event) {
    if(event.kind == GuardEvent::Kind::COOLDOWN) {
        log_event<LogLevel::WARNING>("market_cooldown", f("market", event.market), f("reason", event.reason));
        return;
    }
    log_action_fail<LogLevel::WARNING>("consume_reorder_attempt", event.reason, f("entry_id", event.entry_id), event.detail);
}

// Per-entry retry budget and the per-market cooldown it feeds. Cancels and
// forced fills are always allowed; exceeding their limit only raises a
// cooldown. Not synchronized: OmsState serializes access.
class EntryGuard {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    explicit EntryGuard(const EntryGuardConfig& config)
        : config_(validate(config)) {}

    void init_entry_budget(const std::string& entry_id, const std::string& market, TimePoint started_at, TimePoint now) {
        if(entry_id.empty() || budgets_.count(entry_id) > 0) {
            return;
        }
        if(started_at == TimePoint{}) {
            started_at = now;
        }
        budgets_.emplace(entry_id, EntryBudget{market, started_at, 0, 0, 0});
    }

    [[nodiscard]] bool consume_reorder_attempt(const std::string& entry_id,
                                               const std::string& market,
                                               TimePoint started_at,
                                               TimePoint now) {
        if(entry_id.empty()) {
            return true;
        }
        init_entry_budget(entry_id, market, started_at, now);
        auto& budget = budgets_.at(entry_id);

        const auto age = now - budget.started_at;
        if(age > config_.max_age) {
            const auto age_seconds = std::llround(to_seconds(age));
            set_cooldown(market, config_.cooldown, "entry_age_exceeded " + std::to_string(age_seconds) + "s", now);
            events_.push_back(GuardEvent{
                GuardEvent::Kind::REORDER_REFUSED, market, entry_id, "entry_age_exceeded", f("age_s", age_seconds)});
            return false;
        }
        if(budget.reorders >= config_.max_reorders) {
            set_cooldown(market, config_.cooldown, "entry_reorder_exceeded " + std::to_string(budget.reorders), now);
            events_.push_back(GuardEvent{
                GuardEvent::Kind::REORDER_REFUSED, market, entry_id, "entry_reorder_exceeded", f("reorders", budget.reorders)});
            return false;
        }
        budget.reorders++;
        return true;
    }

    void record_cancel(const std::string& entry_id, const std::string& market, TimePoint started_at, TimePoint now) {
        if(entry_id.empty()) {
            return;
        }
        init_entry_budget(entry_id, market, started_at, now);
        auto& budget = budgets_.at(entry_id);
        budget.cancels++;
        if(budget.cancels > config_.max_cancels) {
            set_cooldown(market, config_.cooldown, "entry_cancel_exceeded " + std::to_string(budget.cancels), now);
        }
    }

    void record_forced_fill(const std::string& entry_id,
                            const std::string& market,
                            TimePoint started_at,
                            TimePoint now) {
        if(entry_id.empty()) {
            return;
        }
        init_entry_budget(entry_id, market, started_at, now);
        auto& budget = budgets_.at(entry_id);
        budget.forced_fills++;
        if(budget.forced_fills > config_.max_forced_fills) {
            set_cooldown(market, config_.cooldown, "entry_fak_exceeded " + std::to_string(budget.forced_fills), now);
        }
    }

    void set_cooldown(const std::string& market, Duration duration, const std::string& reason, TimePoint now) {
        if(market.empty()) {
            return;
        }
        if(duration <= Duration::zero()) {
            duration = config_.cooldown;
        }
        cooldowns_.extend(market, now, duration, reason);
        events_.push_back(GuardEvent{GuardEvent::Kind::COOLDOWN, market, "", reason, ""});
    }

    // Events raised since the last drain, oldest first.
    std::vector<GuardEvent> drain_events() { return std::exchange(events_, {}); }

    [[nodiscard]] std::optional<CooldownLedger::Status> market_cooldown(const std::string& market, TimePoint now) {
        return cooldowns_.query(market, now);
    }

    [[nodiscard]] std::optional<TimePoint> cooldown_until(const std::string& market) const {
        return cooldowns_.get_until(market);
    }

    [[nodiscard]] std::optional<EntryBudget> get_budget(const std::string& entry_id) const {
        auto it = budgets_.find(entry_id);
        if(it == budgets_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool entry_age_exceeded(TimePoint started_at, TimePoint now) const {
        return now - started_at > config_.max_age;
    }

    void clear_entry_budget(const std::string& entry_id) { budgets_.erase(entry_id); }

    void reset() {
        budgets_.clear();
        cooldowns_.clear();
        events_.clear();
    }

    [[nodiscard]] const EntryGuardConfig& get_config() const { return config_; }

private:
    static EntryGuardConfig validate(const EntryGuardConfig& config) {
        if(config.max_reorders <= 0 || config.max_cancels <= 0 || config.max_forced_fills <= 0) {
            throw std::invalid_argument("Entry guard limits must be positive");
        }
        if(config.max_age.count() <= 0 || config.cooldown.count() <= 0) {
            throw std::invalid_argument("Entry guard durations must be positive");
        }
        return config;
    }

    const EntryGuardConfig config_;
    std::unordered_map<std::string, EntryBudget> budgets_;
    CooldownLedger cooldowns_;
    std::vector<GuardEvent> events_;
};
