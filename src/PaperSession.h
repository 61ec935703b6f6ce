#pragma once

#include "../infra/marketwebsocket.hpp"
#include "../infra/timer.hpp"
#include "../oms/papersubstrate.hpp"
#include "../oms/settlementclient.hpp"
#include "InfraConfigManager.h"
#include "Oms.h"
#include "OmsConfig.h"
#include "TaskGroup.h"
#include "format.h"
#include "logging.h"
#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>

// Paper trading session: live market data from the market channel feeds an
// in-memory venue, and the configured decisions are replayed through the OMS.
// Driven by Signal::run.
class PaperSession {
public:
    static constexpr auto HEARTBEAT_PERIOD = std::chrono::seconds(10);

    PaperSession(const InfraConfig& infra, OmsConfig config)
        : config_(std::move(config))
        , settlement_(make_settlement(infra.settlement))
        , paper_(config_.market)
        , oms_(config_, paper_, *settlement_)
        , market_ws_(infra.market_ws_uri, infra.ws_retry_limit, config_.market) {
        log_action_pass("construct_paper_session",
                        f("market", config_.market.slug),
                        f("decisions", config_.paper_decisions.size()),
                        f("settlement", infra.settlement.enabled() ? "http" : "log_only"));
        start_market_data();
    }

    PaperSession(const PaperSession&) = delete;
    PaperSession& operator=(const PaperSession&) = delete;

    ~PaperSession() {
        cleanup();
        log_action_pass("destruct_paper_session");
    }

    // NOTE: called by class Signal
    [[nodiscard]] bool is_trading_ready() const {
        if(!market_ws_.isBookReady()) {
            log_action_fail<LogLevel::WARNING>("check_trading_ready", "market_ws_not_ready");
            return false;
        }
        log_action_pass("check_trading_ready");
        return true;
    }

    // NOTE: called by class Signal
    void initialize_trading() {
        paper_.set_order_update_callback([this](const Order& order) { oms_.on_order_update(order); });
        log_action_pass("initialize_trading");
    }

    // NOTE: called by class Signal
    void start_trading() {
        oms_.start();
        replay_ = std::jthread([this](std::stop_token token) { replay_decisions(token); });
        log_action_pass("start_trading");
    }

private:
    static std::unique_ptr<SettlementCollaborator> make_settlement(const SettlementEndpointConfig& settlement) {
        if(!settlement.enabled()) {
            return std::make_unique<LoggingSettlementCollaborator>();
        }
        return std::make_unique<HttpSettlementClient>(settlement.endpoint, settlement.api_key, settlement.api_secret);
    }

    void start_market_data() {
        market_ws_.setPriceCallback([this](const PriceChangedEvent& event, const BookTop& top) {
            paper_.update_book(event.market, top);
            oms_.on_price_changed(event);
        });
        market_ws_.setWebSocketStatusUpdateCallback([this](bool terminal) {
            if(terminal) {
                log_event<LogLevel::ERROR>("market_data_lost", f("market", config_.market.slug));
                paper_.set_paused(true);
            }
        });
        ws_thread_ = std::thread([this]() { market_ws_.start(); });
        heartbeat_.addCallback([this]() { market_ws_.send_heartbeat(); });
        heartbeat_.start(std::chrono::duration_cast<std::chrono::milliseconds>(HEARTBEAT_PERIOD));
    }

    // Each decision waits its delay after the previous one.
    void replay_decisions(std::stop_token token) {
        for(const auto& scheduled : config_.paper_decisions) {
            if(!interruptible_sleep(token, scheduled.delay)) {
                return;
            }
            const auto result = oms_.execute_order(config_.market, scheduled.decision);
            if(result.ok) {
                log_action_pass("paper_decision",
                                f("entry_id", result.entry_order_id),
                                f("hedge_id", result.hedge_order_id.empty() ? std::string("-") : result.hedge_order_id));
            } else {
                log_action_fail<LogLevel::WARNING>("paper_decision", result.reason, f("entry_id", result.entry_order_id));
            }
        }
        const auto status = oms_.risk_management_status();
        log_event<LogLevel::INFO>("paper_replay_done",
                                  f("exposures", status.exposure_count),
                                  f("reorders", status.total_reorders),
                                  f("forced_fills", status.total_forced_fills),
                                  f("unhedged", oms_.has_unhedged_risk(config_.market.slug)));
    }

    void cleanup() {
        if(replay_.joinable()) {
            replay_.request_stop();
            replay_.join();
        }
        heartbeat_.stop();
        oms_.stop();
        market_ws_.request_shutdown();
        if(ws_thread_.joinable()) {
            ws_thread_.join();
        }
    }

    const OmsConfig config_;
    std::unique_ptr<SettlementCollaborator> settlement_;
    PaperTradingSubstrate paper_;
    Oms oms_;
    MarketWebSocketClient market_ws_;
    Timer heartbeat_;
    std::thread ws_thread_;
    std::jthread replay_;
};
