#pragma once

#include "../utils/connections.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

struct SettlementEndpointConfig {
    std::string endpoint;
    std::string api_key;
    std::string api_secret;

    [[nodiscard]] bool enabled() const { return !endpoint.empty(); }
};

struct InfraConfig {
    const fs::path strategy_config_path;
    const fs::path strategy_log_dir;
    std::string market_ws_uri = Connections::getMarketChannel();
    uint32_t ws_retry_limit = Connections::getDefaultRetryLimit();
    SettlementEndpointConfig settlement;

    InfraConfig(fs::path strat_path, fs::path strat_log_dir)
        : strategy_config_path(std::move(strat_path))
        , strategy_log_dir(std::move(strat_log_dir)) {
        validate_paths_not_empty(strategy_config_path, strategy_log_dir);
    }

    // Printable form with the secrets masked.
    [[nodiscard]] std::string sanitized_dump() const {
        nlohmann::json dump = {{"strategy_config_path", strategy_config_path.string()},
                               {"strategy_log_dir", strategy_log_dir.string()},
                               {"market_ws_uri", market_ws_uri},
                               {"ws_retry_limit", ws_retry_limit},
                               {"settlement_endpoint", settlement.endpoint},
                               {"settlement_api_key", settlement.api_key.empty() ? "" : "***"},
                               {"settlement_api_secret", settlement.api_secret.empty() ? "" : "***"}};
        return dump.dump();
    }

private:
    static void validate_paths_not_empty(const fs::path& strat_path, const fs::path& strat_log_dir) {
        if(strat_path.empty() && strat_log_dir.empty()) {
            throw std::invalid_argument("Both strategy_config_path and strategy_log_dir cannot be empty");
        }
        if(strat_path.empty()) {
            throw std::invalid_argument("strategy_config_path cannot be empty");
        }
        if(strat_log_dir.empty()) {
            throw std::invalid_argument("strategy_log_dir cannot be empty");
        }
    }
};

class InfraConfigManager {
public:
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    explicit InfraConfigManager(const fs::path& config_path)
        : config_path_(config_path)
        , config_(load_config(config_path_)) {}

    InfraConfigManager(const InfraConfigManager&) = delete;
    InfraConfigManager& operator=(const InfraConfigManager&) = delete;

    [[nodiscard]] const InfraConfig& get_config() const { return config_; }
    [[nodiscard]] const fs::path& get_config_path() const { return config_path_; }

private:
    const fs::path config_path_;
    InfraConfig config_;

    static InfraConfig load_config(const fs::path& config_path) {
        std::ifstream config_file(config_path);
        if(!config_file) {
            throw ConfigError("Failed to open config file: " + config_path.string());
        }

        try {
            nlohmann::json config_json;
            config_file >> config_json;

            // Relative paths are resolved against the infra config's directory.
            const fs::path base = config_path.parent_path();
            fs::path strategy_config_path = config_json.value("strategy_config_path", "");
            fs::path strategy_log_dir = config_json.value("strategy_log_dir", "");
            if(!strategy_config_path.empty() && strategy_config_path.is_relative()) {
                strategy_config_path = fs::absolute(base / strategy_config_path);
            }
            if(!strategy_log_dir.empty() && strategy_log_dir.is_relative()) {
                strategy_log_dir = fs::absolute(base / strategy_log_dir);
            }

            InfraConfig config(std::move(strategy_config_path), std::move(strategy_log_dir));
            config.market_ws_uri = config_json.value("market_ws_uri", config.market_ws_uri);
            config.ws_retry_limit = config_json.value("ws_retry_limit", config.ws_retry_limit);
            config.settlement.endpoint = config_json.value("settlement_endpoint", "");
            config.settlement.api_key = config_json.value("settlement_api_key", "");
            config.settlement.api_secret = config_json.value("settlement_api_secret", "");

            validate(config);
            return config;

        } catch(const nlohmann::json::exception& e) {
            throw ConfigError(std::string("JSON parsing error: ") + e.what());
        } catch(const std::invalid_argument& e) {
            throw ConfigError(std::string("Missing required fields in config file: ") + e.what());
        }
    }

    static void validate(const InfraConfig& config) {
        if(!fs::exists(config.strategy_config_path)) {
            throw ConfigError("Strategy config file not found: " + config.strategy_config_path.string());
        }
        if(!fs::is_regular_file(config.strategy_config_path)) {
            throw ConfigError("Strategy config is not a file: " + config.strategy_config_path.string());
        }
        if(config.market_ws_uri.rfind("wss://", 0) != 0) {
            throw ConfigError("market_ws_uri must be a wss:// uri: " + config.market_ws_uri);
        }
        if(config.settlement.enabled() && config.settlement.api_secret.empty()) {
            throw ConfigError("settlement_endpoint requires settlement_api_secret");
        }
    }
};
