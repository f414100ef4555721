// EN: Mapping from YAML sections to the typed ConsolidatorConfig.
// FR: Correspondance entre sections YAML et ConsolidatorConfig typée.

#include "infrastructure/config/consolidator_config.hpp"
#include "infrastructure/logging/logger.hpp"

#include <regex>

namespace SHC {

namespace {

std::string stringOr(const ConfigManager& manager, const std::string& section,
                     const std::string& key, const std::string& fallback) {
    return manager.get(section, key).asOrDefault<std::string>(fallback);
}

int intOr(const ConfigManager& manager, const std::string& section,
          const std::string& key, int fallback) {
    return manager.get(section, key).asOrDefault<int>(fallback);
}

bool isColumnLetters(const std::string& value) {
    static const std::regex letters("^[A-Z]{1,3}$");
    return std::regex_match(value, letters);
}

} // namespace

std::vector<ConfigManager::ValidationRule> ConsolidatorConfig::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    auto required_string = [&rules](const std::string& key, const std::string& description) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "string";
        rule.required = true;
        rule.description = description;
        rules.push_back(rule);
    };
    auto optional_int = [&rules](const std::string& key, double min_value) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "int";
        rule.min_value = min_value;
        rules.push_back(rule);
    };

    required_string("master.spreadsheet_id", "Spreadsheet holding the source catalog");
    required_string("destination.spreadsheet_id", "Spreadsheet receiving consolidated rows");
    required_string("sheets.access_token", "OAuth bearer token for the Sheets API");

    optional_int("batching.flush_every_sources", 1);
    optional_int("schedule.inter_source_pause_ms", 0);
    optional_int("schedule.idle_interval_s", 1);
    optional_int("schedule.empty_catalog_retry_s", 1);
    optional_int("sheets.connect_timeout_ms", 1);
    optional_int("sheets.read_timeout_ms", 1);

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR", "debug", "info", "warn", "error"};
    rules.push_back(level);

    return rules;
}

ConsolidatorConfig ConsolidatorConfig::fromConfigManager(ConfigManager& manager) {
    manager.addValidationRules(validationRules());

    std::vector<std::string> problems;
    manager.validate(problems);

    ConsolidatorConfig config;
    config.master_spreadsheet_id = stringOr(manager, "master", "spreadsheet_id", "");
    config.master_tab_name = stringOr(manager, "master", "tab_name", config.master_tab_name);
    config.company_column = stringOr(manager, "master", "company_column", config.company_column);
    config.url_column = stringOr(manager, "master", "url_column", config.url_column);
    config.master_column_bound = stringOr(manager, "master", "column_bound", config.master_column_bound);

    config.destination_spreadsheet_id = stringOr(manager, "destination", "spreadsheet_id", "");
    config.destination_tab_name = stringOr(manager, "destination", "tab_name", config.destination_tab_name);
    config.company_name_column = stringOr(manager, "destination", "company_name_column",
                                          config.company_name_column);

    config.source_column_bound = stringOr(manager, "sources", "column_bound", config.source_column_bound);
    config.ledger_path = stringOr(manager, "ledger", "path", config.ledger_path);

    config.flush_every_sources = static_cast<size_t>(
        intOr(manager, "batching", "flush_every_sources", static_cast<int>(config.flush_every_sources)));
    config.inter_source_pause = std::chrono::milliseconds(
        intOr(manager, "schedule", "inter_source_pause_ms", static_cast<int>(config.inter_source_pause.count())));
    config.idle_interval = std::chrono::seconds(
        intOr(manager, "schedule", "idle_interval_s", static_cast<int>(config.idle_interval.count())));
    config.empty_catalog_retry = std::chrono::seconds(
        intOr(manager, "schedule", "empty_catalog_retry_s", static_cast<int>(config.empty_catalog_retry.count())));

    config.access_token = stringOr(manager, "sheets", "access_token", "");
    config.api_base_url = stringOr(manager, "sheets", "api_base_url", config.api_base_url);
    config.connect_timeout_ms = intOr(manager, "sheets", "connect_timeout_ms", config.connect_timeout_ms);
    config.read_timeout_ms = intOr(manager, "sheets", "read_timeout_ms", config.read_timeout_ms);

    if (!isColumnLetters(config.source_column_bound)) {
        problems.push_back("Configuration sources.column_bound must be column letters (e.g. Q)");
    }
    if (!isColumnLetters(config.master_column_bound)) {
        problems.push_back("Configuration master.column_bound must be column letters (e.g. ZZ)");
    }
    if (config.destination_tab_name.empty()) {
        problems.push_back("Configuration destination.tab_name must not be empty");
    }
    if (config.ledger_path.empty()) {
        problems.push_back("Configuration ledger.path must not be empty");
    }

    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG_ERROR("config", problem);
        }
        throw ConfigurationError("Invalid configuration (" + std::to_string(problems.size()) + " problem(s))",
                                 problems);
    }

    return config;
}

} // namespace SHC
