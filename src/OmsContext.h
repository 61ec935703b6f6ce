#pragma once

#include "../oms/tradingsubstrate.hpp"
#include "OmsConfig.h"
#include "OmsState.h"
#include "QueuedExecutionGate.h"
#include "RiskRegistry.h"
#include "SettlementTrigger.h"
#include "TaskGroup.h"
#include "TokenBucketLimiter.h"
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

// Everything the OMS components share. Owned by Oms and passed by reference
// to the executor, the reorder monitors and the price-stop evaluator.
class OmsContext {
public:
    OmsContext(const OmsConfig& config, TradingSubstrate& substrate, SettlementCollaborator& settlement)
        : config_(config)
        , substrate_(substrate)
        , state_(config_.entry_guard)
        , risk_(config_.hedge.max_acceptable_loss_cents)
        , reorder_limiter_(config_.hedge.reorder_limiter_capacity, config_.hedge.reorder_limiter_capacity)
        , forced_fill_limiter_(config_.hedge.forced_fill_limiter_capacity, config_.hedge.forced_fill_limiter_capacity)
        , gate_(std::make_shared<QueuedExecutionGate>(config_.execution.gate))
        , settlement_(tasks_, settlement) {}

    OmsContext(const OmsContext&) = delete;
    OmsContext& operator=(const OmsContext&) = delete;

    ~OmsContext() {
        tasks_.join_all();
        close_gate();
    }

    [[nodiscard]] const OmsConfig& config() const { return config_; }
    TradingSubstrate& substrate() { return substrate_; }
    [[nodiscard]] const TradingSubstrate& substrate() const { return substrate_; }
    OmsState& state() { return state_; }
    [[nodiscard]] const OmsState& state() const { return state_; }
    RiskRegistry& risk() { return risk_; }
    [[nodiscard]] const RiskRegistry& risk() const { return risk_; }
    TokenBucketLimiter& reorder_limiter() { return reorder_limiter_; }
    TokenBucketLimiter& forced_fill_limiter() { return forced_fill_limiter_; }
    TaskGroup& tasks() { return tasks_; }
    [[nodiscard]] const TaskGroup& tasks() const { return tasks_; }
    SettlementTrigger& settlement() { return settlement_; }

    [[nodiscard]] std::shared_ptr<QueuedExecutionGate> gate() const {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        return gate_;
    }

    // Returns true when a new gate replaced a closed one.
    bool reopen_gate() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        if(gate_ && !gate_->is_closed()) {
            return false;
        }
        gate_ = std::make_shared<QueuedExecutionGate>(config_.execution.gate);
        return true;
    }

    void close_gate() {
        auto gate = this->gate();
        if(gate) {
            gate->close();
        }
    }

    Order place_order(std::stop_token token, const OrderRequest& request) {
        return gate()->place_order(token, substrate_, request);
    }

    void cancel_order(std::stop_token token, const std::string& order_id) {
        gate()->cancel_order(token, substrate_, order_id);
    }

    std::vector<Order> execute_multi_leg(std::stop_token token, const MultiLegRequest& request) {
        return gate()->execute_multi_leg(token, substrate_, request);
    }

    // The configured market, unless the substrate reports a current one.
    [[nodiscard]] MarketInfo market_info() const {
        if(auto current = substrate_.current_market_info(); current && current->valid()) {
            return *current;
        }
        return config_.market;
    }

    // Token for work started by callers outside the task group. Stopped on cycle rollover.
    [[nodiscard]] std::stop_token cycle_token() const {
        std::lock_guard<std::mutex> lock(cycle_mutex_);
        return cycle_source_.get_token();
    }

    void rotate_cycle() {
        std::lock_guard<std::mutex> lock(cycle_mutex_);
        cycle_source_.request_stop();
        cycle_source_ = std::stop_source();
    }

private:
    const OmsConfig config_;
    TradingSubstrate& substrate_;
    OmsState state_;
    RiskRegistry risk_;
    TokenBucketLimiter reorder_limiter_;
    TokenBucketLimiter forced_fill_limiter_;

    mutable std::mutex gate_mutex_;
    std::shared_ptr<QueuedExecutionGate> gate_;

    mutable std::mutex cycle_mutex_;
    std::stop_source cycle_source_;

    TaskGroup tasks_;
    SettlementTrigger settlement_;
};
