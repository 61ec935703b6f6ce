#pragma once

#include "../oms/order.hpp"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

class SettlementError : public std::runtime_error {
public:
    explicit SettlementError(const std::string& message)
        : std::runtime_error(message) {}
};

// Merges the complete sets held for the current market cycle.
class SettlementCollaborator {
public:
    virtual ~SettlementCollaborator() = default;

    // Throws SettlementError when the merge could not be requested.
    virtual void try_merge_current_cycle(const MarketInfo& market) = 0;
};

// Used when no settlement endpoint is configured.
class LoggingSettlementCollaborator : public SettlementCollaborator {
public:
    void try_merge_current_cycle(const MarketInfo& market) override {
        log_event<LogLevel::WARNING>("settlement_skipped", f("market", market.slug), f("reason", "no_endpoint"));
    }
};

// Defers the merge call-out so that fills have time to show up as positions.
class SettlementTrigger {
public:
    SettlementTrigger(TaskGroup& tasks, SettlementCollaborator& collaborator)
        : tasks_(tasks)
        , collaborator_(collaborator) {}

    void schedule(const MarketInfo& market, std::chrono::milliseconds delay) {
        if(!market.valid()) {
            log_action_fail<LogLevel::WARNING>("schedule_settlement", "invalid_market", f("market", market.slug));
            return;
        }
        scheduled_++;
        log_action_attempt("schedule_settlement", f("market", market.slug), f("delay", format_duration(delay)));
        tasks_.spawn([this, market, delay](std::stop_token token) {
            if(!interruptible_sleep(token, delay)) {
                return;
            }
            try {
                collaborator_.try_merge_current_cycle(market);
                completed_++;
                log_action_pass("settlement", f("market", market.slug));
            } catch(const SettlementError& e) {
                failed_++;
                log_action_fail<LogLevel::ERROR>("settlement", e.what(), f("market", market.slug));
            } catch(const std::exception& e) {
                failed_++;
                log_action_fail<LogLevel::ERROR>("settlement", e.what(), f("market", market.slug));
            }
        });
    }

    [[nodiscard]] uint64_t scheduled_count() const { return scheduled_.load(); }
    [[nodiscard]] uint64_t completed_count() const { return completed_.load(); }
    [[nodiscard]] uint64_t failed_count() const { return failed_.load(); }

private:
    TaskGroup& tasks_;
    SettlementCollaborator& collaborator_;
    std::atomic<uint64_t> scheduled_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};
