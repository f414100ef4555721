// EN: sheet-consolidator entry point. Loads configuration, then polls sources forever (or once).
// FR: Point d'entrée de sheet-consolidator. Charge la configuration puis interroge les sources indéfiniment (ou une fois).

#include <exception>
#include <iostream>
#include <string>

#include "consolidation/consolidation_cycle.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/consolidator_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/sleeper.hpp"
#include "orchestrator/poll_scheduler.hpp"
#include "sheets/google_sheets_client.hpp"

namespace {

constexpr const char* MODULE = "main";
constexpr const char* DEFAULT_CONFIG = "config/consolidator.yaml";

void printUsage() {
    std::cout << "Usage: sheet-consolidator [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE   YAML configuration (default: " << DEFAULT_CONFIG << ")" << std::endl;
    std::cout << "  --once          Run a single consolidation cycle and exit" << std::endl;
    std::cout << "  --help, -h      Show this help" << std::endl;
}

// EN: Apply logging.level and logging.file. Returns false on an unusable value.
// FR: Applique logging.level et logging.file. Retourne false pour une valeur inutilisable.
bool configureLogging(const SHC::ConfigManager& config) {
    auto& logger = SHC::Logger::getInstance();

    const auto level_name = config.get("logging", "level").asOrDefault<std::string>("INFO");
    auto level = SHC::parseLogLevel(level_name);
    if (!level) {
        std::cerr << "Invalid logging.level: " << level_name << std::endl;
        return false;
    }
    logger.setLogLevel(*level);

    const auto file = config.get("logging", "file").asOrDefault<std::string>("");
    if (!file.empty() && !logger.setOutputFile(file)) {
        std::cerr << "Cannot open log file: " << file << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = DEFAULT_CONFIG;
    bool run_once = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (arg == "--once") {
            run_once = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    auto& manager = SHC::ConfigManager::getInstance();
    if (!manager.loadFromFile(config_path)) {
        std::cerr << "Failed to load configuration from " << config_path << std::endl;
        return 1;
    }
    manager.loadEnvironmentOverrides();

    if (!configureLogging(manager)) {
        return 1;
    }

    SHC::ConsolidatorConfig config;
    try {
        config = SHC::ConsolidatorConfig::fromConfigManager(manager);
    } catch (const SHC::ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        for (const auto& problem : e.problems()) {
            std::cerr << "  - " << problem << std::endl;
        }
        return 1;
    }

    LOG_INFO_META(MODULE, "sheet-consolidator starting", (SHC::Logger::Metadata{
        {"config", config_path},
        {"master", config.master_spreadsheet_id},
        {"destination", config.destination_spreadsheet_id + "/" + config.destination_tab_name},
        {"ledger", config.ledger_path},
        {"mode", run_once ? "once" : "poll"}}));

    SHC::Sheets::GoogleSheetsClient client(config.api_base_url, config.access_token,
                                           config.connect_timeout_ms, config.read_timeout_ms);
    SHC::ThreadSleeper sleeper;
    SHC::Consolidation::ConsolidationCycle cycle(config, client, sleeper);

    SHC::Orchestrator::PollScheduler scheduler(config, [&cycle]() { return cycle.run(); }, sleeper);

    if (run_once) {
        scheduler.runOnce();
        SHC::Logger::getInstance().flush();
        return 0;
    }

    try {
        scheduler.run();
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, std::string("Fatal error: ") + e.what());
        SHC::Logger::getInstance().flush();
        return 1;
    }
}
