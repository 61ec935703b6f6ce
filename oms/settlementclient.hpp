#pragma once

#include "../src/SettlementTrigger.h"
#include "../utils/helper.hpp"
#include "../utils/logger.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Posts merge requests for the current cycle's complete sets to the
// settlement service. Each request is signed like the venue's REST calls.
class HttpSettlementClient : public SettlementCollaborator {
public:
    HttpSettlementClient(const std::string& endpoint,
                         const std::string& apiKey,
                         const std::string& apiSecret,
                         long timeoutMs = 5000)
        : m_apiKey(apiKey)
        , m_apiSecret(apiSecret)
        , m_timeoutMs(timeoutMs) {
        split_endpoint(endpoint);
    }

    void try_merge_current_cycle(const MarketInfo& market) override {
        nlohmann::json payload = {{"market", market.slug},
                                  {"yes_asset_id", market.yes_asset_id},
                                  {"no_asset_id", market.no_asset_id},
                                  {"timestamp", helper::get_current_timestamp_ms()}};
        const std::string body = payload.dump();

        const auto response = post(body);
        if(!response.success) {
            throw SettlementError("merge request failed: " + response.error);
        }
        LoggerSingleton::get().plain().curl_response("settlement merge response: ", response.body);
        if(response.httpCode < 200 || response.httpCode >= 300) {
            throw SettlementError("merge request rejected with http " + std::to_string(response.httpCode) + ": " +
                                  response.body);
        }
    }

    [[nodiscard]] const std::string& base_url() const { return m_baseUrl; }
    [[nodiscard]] const std::string& request_path() const { return m_path; }

private:
    struct Response {
        long httpCode;
        std::string body;
        std::string error;
        bool success;
    };

    // "https://host:port/a/b" becomes base "https://host:port" and path "/a/b".
    void split_endpoint(const std::string& endpoint) {
        const auto scheme = endpoint.find("://");
        if(endpoint.empty() || scheme == std::string::npos) {
            throw std::invalid_argument("settlement endpoint must be an absolute url: " + endpoint);
        }
        const auto slash = endpoint.find('/', scheme + 3);
        if(slash == std::string::npos) {
            m_baseUrl = endpoint;
            m_path = "/";
        } else {
            m_baseUrl = endpoint.substr(0, slash);
            m_path = endpoint.substr(slash);
        }
    }

    Response post(const std::string& body) const {
        Response response{0, "", "", false};
        CURL* curl = curl_easy_init();
        if(!curl) {
            response.error = "failed to initialize curl";
            return response;
        }
        std::string responseData;

        const std::string url = m_baseUrl + m_path;
        const std::string timestamp = std::to_string(helper::get_current_timestamp_ms());
        const std::string signature = helper::generate_request_signature(m_apiSecret, timestamp, "POST", m_path, body);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, ("X-HG-API-KEY: " + m_apiKey).c_str());
        headers = curl_slist_append(headers, ("X-HG-SIGNATURE: " + signature).c_str());
        headers = curl_slist_append(headers, ("X-HG-TIMESTAMP: " + timestamp).c_str());
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_timeoutMs);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);

        LoggerSingleton::get().plain().curl_request("settlement merge request: url=", url, " body=", body);

        CURLcode res = curl_easy_perform(curl);
        if(res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
        } else {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.httpCode);
            response.body = responseData;
            response.success = true;
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return response;
    }

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    std::string m_baseUrl;
    std::string m_path;
    std::string m_apiKey;
    std::string m_apiSecret;
    long m_timeoutMs;
};
