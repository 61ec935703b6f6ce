#pragma once

#include <string>
namespace Connections {

inline std::string getMarketChannel() { return "wss://ws-subscriptions-clob.polymarket.com/ws/market"; }

inline std::string getUserChannel() { return "wss://ws-subscriptions-clob.polymarket.com/ws/user"; }

inline std::string getClobRestBaseUrl() { return "https://clob.polymarket.com"; }

inline uint32_t getDefaultRetryLimit() { return 5; }

}; // namespace Connections
