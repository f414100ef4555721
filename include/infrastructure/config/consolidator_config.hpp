// EN: Immutable, typed configuration handed to the consolidation engine at construction.
// FR: Configuration typée et immuable transmise au moteur de consolidation à la construction.

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace SHC {

// EN: Raised when the configuration cannot start the service (fatal, before the poll loop).
// FR: Levée quand la configuration ne permet pas de démarrer le service (fatale, avant la boucle).
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message,
                                std::vector<std::string> problems = {})
        : std::runtime_error(message), problems_(std::move(problems)) {}

    const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;
};

struct ConsolidatorConfig {
    // EN: Master catalog listing every source spreadsheet
    // FR: Catalogue maître listant toutes les feuilles sources
    std::string master_spreadsheet_id;
    std::string master_tab_name{"Active Clients"};
    std::string company_column{"Company"};
    std::string url_column{"Appointment Spreadsheet:"};
    std::string master_column_bound{"ZZ"};

    // EN: Destination receiving the consolidated rows
    // FR: Destination recevant les lignes consolidées
    std::string destination_spreadsheet_id;
    std::string destination_tab_name{"Sheet1"};
    std::string company_name_column{"Company Name"};

    // EN: Sources are read from column A up to this column (inclusive)
    // FR: Les sources sont lues de la colonne A jusqu'à cette colonne (incluse)
    std::string source_column_bound{"Q"};

    std::string ledger_path{"processed_rows.json"};

    size_t flush_every_sources{25};
    std::chrono::milliseconds inter_source_pause{3000};
    std::chrono::seconds idle_interval{4 * 60 * 60};
    std::chrono::seconds empty_catalog_retry{4 * 60 * 60};

    // EN: Google Sheets transport
    // FR: Transport Google Sheets
    std::string access_token;
    std::string api_base_url{"https://sheets.googleapis.com/v4"};
    int connect_timeout_ms{10000};
    int read_timeout_ms{60000};

    // EN: Build from the loaded ConfigManager. Throws ConfigurationError listing every problem.
    // FR: Construit depuis le ConfigManager chargé. Lance ConfigurationError listant chaque problème.
    static ConsolidatorConfig fromConfigManager(ConfigManager& manager);

    // EN: Validation rules registered by fromConfigManager.
    // FR: Règles de validation enregistrées par fromConfigManager.
    static std::vector<ConfigManager::ValidationRule> validationRules();
};

} // namespace SHC
