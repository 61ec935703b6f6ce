#pragma once
#include "../utils/logger.hpp"
#include "marketfeed.hpp"
#include "websocket.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

// Market channel client for one binary market. Every book or price_change
// payload updates the parser; each token whose top moved is reported to the
// price callback together with the full top of book.
class MarketWebSocketClient : public WebSocketClient<MarketWebSocketClient> {
public:
    using PriceCallback = std::function<void(const PriceChangedEvent&, const BookTop&)>;
    using WebSocketStatusUpdateCallback = std::function<void(bool)>;

    MarketWebSocketClient(const std::string& uri, const uint32_t retry_limit, MarketInfo market)
        : WebSocketClient(retry_limit, uri)
        , m_parser(std::move(market)) {}

    void setPriceCallback(PriceCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_priceCallback = std::move(callback);
    }

    void setWebSocketStatusUpdateCallback(WebSocketStatusUpdateCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_statusCallback = std::move(callback);
    }

    void onOpen(websocketpp::connection_hdl) {
        LoggerSingleton::get().infra().info("market websocket connection opened");
        std::string subscribe;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            subscribe = m_parser.subscribe_message();
        }
        if(!send(subscribe)) {
            LoggerSingleton::get().infra().error("error sending market subscribe message");
        }
    }

    void onMessage(websocketpp::connection_hdl, client_tls::message_ptr msg) {
        const std::string message = msg->get_payload();
        LoggerSingleton::get().plain().ws_response(message);

        std::vector<PriceChangedEvent> events;
        BookTop top;
        PriceCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            events = m_parser.parse(message, std::chrono::system_clock::now());
            top = m_parser.top();
            m_bookReady = m_parser.is_ready();
            callback = m_priceCallback;
        }
        if(!callback) {
            return;
        }
        for(const auto& event : events) {
            callback(event, top);
        }
    }

    void onClose(websocketpp::connection_hdl, const std::string& message) {
        LoggerSingleton::get().infra().error("market channel closed reason=", message);
        m_bookReady = false;
        WebSocketStatusUpdateCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            callback = m_statusCallback;
        }
        if(callback) {
            callback(message == "connection_end");
        }
    }

    // Keep-alive; the channel answers "PONG".
    void send_heartbeat() { send("PING"); }

    // Resubscribes to the next cycle's tokens on the live connection.
    void switch_market(MarketInfo market) {
        std::string subscribe;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_parser.reset(std::move(market));
            subscribe = m_parser.subscribe_message();
        }
        m_bookReady = false;
        send(subscribe);
    }

    [[nodiscard]] bool isBookReady() const noexcept { return m_bookReady; }

private:
    mutable std::mutex m_mutex;
    MarketFeedParser m_parser;
    PriceCallback m_priceCallback;
    WebSocketStatusUpdateCallback m_statusCallback;
    std::atomic<bool> m_bookReady{false};
};
