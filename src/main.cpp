#include "../utils/logger.hpp"
#include "ArgumentParser.h"
#include "Configuration.h"
#include "InfraConfigManager.h"
#include "OmsConfigLoader.h"
#include "PaperSession.h"
#include "Signal.h"
#include <curl/curl.h>
#include <iostream>
#include <string>

namespace {

OmsConfig load_oms_config(const fs::path& config_path) {
    LoggerSingleton::get().infra().info("reading configuration file from path: " + config_path.string());

    const Configuration config = Configuration::from_file(config_path.string());
    LoggerSingleton::get().infra().info("configuration content: " + config.dump_compact());

    return OmsConfigLoader::from_configuration(config);
}

void setup_signal_handler(Signal& signal) {
    if(!signal.setupSignalHandlers()) {
        throw std::runtime_error("failed to set up signal handlers");
    }
    signal.start();
}

void report_error(const std::string& kind, const std::string& what) {
    if(LoggerSingleton::is_initialized()) {
        LoggerSingleton::get().infra().error(kind + ": " + what);
    }
    std::cerr << kind << ": " << what << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        ArgumentParser parser(argc, argv);
        InfraConfigManager config_manager(parser.get_config_path());
        const auto& infra = config_manager.get_config();
        LoggerSingleton::initialize(infra.strategy_log_dir.generic_string(), infra.strategy_config_path.generic_string());
        LoggerSingleton::get().infra().info("infra configuration: " + infra.sanitized_dump());

        OmsConfig oms_config = load_oms_config(infra.strategy_config_path);
        if(!oms_config.market.valid()) {
            throw std::invalid_argument("market section needs slug, yes_asset_id and no_asset_id");
        }
        if(parser.check_only()) {
            std::cout << "configuration ok: market=" << oms_config.market.slug
                      << " mode=" << to_string(oms_config.execution.mode)
                      << " decisions=" << oms_config.paper_decisions.size() << std::endl;
            curl_global_cleanup();
            return 0;
        }

        Signal signal;
        setup_signal_handler(signal);

        PaperSession session(infra, std::move(oms_config));
        signal.run(session, std::chrono::seconds(30));
        LoggerSingleton::get().infra().info("shutting down signal=" + std::to_string(signal.last_signal.load()));
    } catch(const ArgumentParserError& e) {
        report_error("Argument Error", e.what());
        rc = 1;
    } catch(const InfraConfigManager::ConfigError& e) {
        report_error("Configuration Error", e.what());
        rc = 1;
    } catch(const std::invalid_argument& e) {
        report_error("Configuration Error", e.what());
        rc = 1;
    } catch(const std::exception& e) {
        report_error("Unexpected Error", e.what());
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
