#pragma once

#include "../oms/order.hpp"
#include "EntryGuard.h"
#include "QueuedExecutionGate.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

enum class ExecutionMode { SEQUENTIAL, PARALLEL };

inline std::string to_string(ExecutionMode mode) { return mode == ExecutionMode::PARALLEL ? "parallel" : "sequential"; }

inline ExecutionMode execution_mode_from_string(const std::string& mode) {
    if(mode == "sequential") {
        return ExecutionMode::SEQUENTIAL;
    }
    if(mode == "parallel") {
        return ExecutionMode::PARALLEL;
    }
    throw std::invalid_argument("Unknown execution mode: " + mode);
}

struct ExecutionConfig {
    ExecutionMode mode = ExecutionMode::SEQUENTIAL;
    std::chrono::milliseconds sequential_check_interval{100};
    std::chrono::milliseconds sequential_max_wait{5000};
    double min_order_notional = 1.01;
    // Hedges smaller than this are sent as IOC instead of resting.
    double min_resting_hedge_size = 5.0;
    // Sequential mode only: how long an entry fill waits for its hedge before
    // the orchestrator places one itself.
    std::chrono::milliseconds hedge_fallback_delay{100};
    GateConfig gate;
};

struct HedgeConfig {
    int offset_cents = 3;
    bool allow_negative_profit_on_reorder = false;
    int max_negative_profit_cents = 5;
    std::chrono::seconds reorder_timeout{15};
    // Zero disables the forced-fill deadline.
    std::chrono::seconds forced_fill_timeout{0};
    std::chrono::seconds aggressive_hedge_timeout{60};
    int max_acceptable_loss_cents = 5;
    std::chrono::milliseconds cancel_settle_delay{500};
    std::chrono::milliseconds check_interval{1000};
    std::chrono::milliseconds top_of_book_timeout{5000};
    int max_reorder_attempts = 10;
    int reorder_limiter_capacity = 30;
    int forced_fill_limiter_capacity = 10;
};

struct PriceStopConfig {
    bool enabled = false;
    int soft_loss_cents = -5;
    int hard_loss_cents = -10;
    // Zero disables take-profit.
    int take_profit_cents = 0;
    // Zero disables throttling.
    std::chrono::milliseconds check_interval{0};
    int confirm_ticks = 2;
    int take_profit_confirm_ticks = 2;
    std::chrono::milliseconds snapshot_max_age{3000};
    std::chrono::milliseconds cancel_settle_delay{200};
    std::chrono::milliseconds settle_after_fill{500};

    // Soft must be the less extreme threshold; the pair is swapped otherwise.
    void normalize() {
        if(soft_loss_cents < hard_loss_cents) {
            std::swap(soft_loss_cents, hard_loss_cents);
        }
        if(check_interval.count() > 0) {
            check_interval = std::clamp(check_interval, std::chrono::milliseconds(20), std::chrono::milliseconds(2000));
        }
        confirm_ticks = std::clamp(confirm_ticks, 1, 10);
        take_profit_confirm_ticks = std::clamp(take_profit_confirm_ticks, 1, 10);
        if(snapshot_max_age.count() <= 0) {
            snapshot_max_age = std::chrono::milliseconds(3000);
        }
    }
};

struct SettlementConfig {
    std::chrono::seconds merge_delay{15};
};

// One scheduled decision of a paper session.
struct ScheduledDecision {
    std::chrono::milliseconds delay{0};
    Decision decision;
};

struct OmsConfig {
    MarketInfo market;
    ExecutionConfig execution;
    HedgeConfig hedge;
    EntryGuardConfig entry_guard;
    PriceStopConfig price_stop;
    SettlementConfig settlement;
    std::vector<ScheduledDecision> paper_decisions;
};
