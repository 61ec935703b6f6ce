#pragma once
#include "../utils/logger.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>
#include <string>
#include <vector>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

typedef websocketpp::client<websocketpp::config::asio_tls_client> client_tls;

// CRTP base class. Derived provides onOpen, onMessage and onClose; onClose
// receives "disconnect" while a reconnect is still allowed and
// "connection_end" once the retry limit is used up.
template<typename Derived>
class WebSocketClient {
public:
    WebSocketClient(const uint32_t retry_limit, const std::string& uri, const std::string& proxy_uri = "")
        : uri(uri)
        , proxy_uri(proxy_uri)
        , retry_limit(retry_limit) {
        ws_client = std::make_unique<client_tls>();
    }

    void request_shutdown() {
        shutdown_requested = true;
        stop();
    }

    // Blocks running the asio loop until the client is stopped.
    void start() {
        reconnect_attempt = 0;
        connect_to_websocket();
    }

    void connect_to_websocket() {
        setupClient();
        websocketpp::lib::error_code ec;
        client_tls::connection_ptr con = ws_client->get_connection(uri, ec);
        if(ec) {
            LoggerSingleton::get().infra().error("connection error: ", ec.message());
            return;
        }
        LOG_INFRA_DEBUG("con setup ok uri=", uri);

        if(!proxy_uri.empty()) {
            con->set_proxy(proxy_uri);
        }
        ws_client->connect(con);
        ws_client->run();
    }

    void stop() {
        if(cleaning_up.exchange(true)) {
            return;
        }
        try {
            if(ws_client) {
                LOG_INFRA_DEBUG("stopping TLS client");
                ws_client->stop();
            }
        } catch(const std::exception& e) {
            LoggerSingleton::get().infra().error("error stopping websocket client: ", e.what());
        }
    }

    bool send(const std::string& payload) {
        websocketpp::lib::error_code ec;
        ws_client->send(current_hdl, payload, websocketpp::frame::opcode::text, ec);
        if(ec) {
            LoggerSingleton::get().infra().error("websocket send failed: ", ec.message());
            return false;
        }
        LoggerSingleton::get().plain().ws_request(payload);
        return true;
    }

    [[nodiscard]] uint32_t reconnect_attempts() const { return reconnect_attempt.load(); }

protected:
    void schedule_reconnection() {
        if(shutdown_requested) {
            LOG_INFRA_DEBUG("shutdown requested; not scheduling reconnection");
            return;
        }
        reconnect_attempt++;
        LoggerSingleton::get().infra().warning("reconnecting market channel attempt=", reconnect_attempt.load());
        // Called from inside the old client's handler, which is still on the
        // stack, so the old instance is parked instead of destroyed.
        ws_client->stop();
        retired_clients.push_back(std::move(ws_client));
        ws_client = std::make_unique<client_tls>();
        cleaning_up = false;
        connect_to_websocket();
    }

    void setupClient() {
        ws_client->init_asio();
        ws_client->clear_access_channels(websocketpp::log::alevel::all);
        ws_client->clear_error_channels(websocketpp::log::elevel::all);
        ws_client->set_tls_init_handler([](websocketpp::connection_hdl) {
            auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12);
            try {
                ctx->set_options(boost::asio::ssl::context::default_workarounds | boost::asio::ssl::context::no_sslv2 |
                                 boost::asio::ssl::context::no_sslv3 | boost::asio::ssl::context::single_dh_use);
            } catch(const std::exception& e) {
                LoggerSingleton::get().infra().error("error in tls initialization: ", e.what());
            }
            return ctx;
        });
        ws_client->set_message_handler([this](websocketpp::connection_hdl hdl, client_tls::message_ptr msg) {
            static_cast<Derived*>(this)->onMessage(hdl, msg);
        });
        ws_client->set_open_handler([this](websocketpp::connection_hdl hdl) {
            current_hdl = hdl;
            reconnect_attempt = 0;
            static_cast<Derived*>(this)->onOpen(hdl);
        });
        ws_client->set_close_handler([this](websocketpp::connection_hdl hdl) { handle_disconnect(hdl); });
        ws_client->set_fail_handler([this](websocketpp::connection_hdl hdl) { handle_disconnect(hdl); });
    }

    void handle_disconnect(websocketpp::connection_hdl hdl) {
        if(shutdown_requested || reconnect_attempt + 1 > retry_limit) {
            static_cast<Derived*>(this)->onClose(hdl, "connection_end");
            return;
        }
        static_cast<Derived*>(this)->onClose(hdl, "disconnect");
        schedule_reconnection();
    }

    websocketpp::connection_hdl current_hdl;
    std::atomic<bool> cleaning_up{false};
    std::atomic<bool> shutdown_requested{false};
    std::unique_ptr<client_tls> ws_client;
    std::vector<std::unique_ptr<client_tls>> retired_clients;
    std::string uri;
    std::string proxy_uri;
    const uint32_t retry_limit = 0;
    std::atomic<uint32_t> reconnect_attempt{0};
};
