// EN: Master catalog reader: locates the company and URL columns and lists the sources to poll.
// FR: Lecteur du catalogue maître : localise les colonnes société et URL et liste les sources à interroger.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "consolidation/address_resolver.hpp"
#include "infrastructure/config/consolidator_config.hpp"
#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Consolidation {

// EN: Column mapping resolved from the master header row (0-based indices).
// FR: Correspondance de colonnes résolue depuis l'en-tête maître (indices base 0).
struct CatalogSchema {
    size_t company_column{0};
    size_t url_column{0};

    // EN: A data row must hold at least this many cells to be considered.
    // FR: Une ligne de données doit contenir au moins ce nombre de cellules pour être prise en compte.
    size_t requiredWidth() const {
        return (company_column > url_column ? company_column : url_column) + 1;
    }
};

// EN: Exact match on trimmed header text; if a name appears twice the last occurrence wins.
// FR: Correspondance exacte sur le texte d'en-tête épuré ; en cas de doublon la dernière occurrence l'emporte.
std::optional<CatalogSchema> resolveSchema(const Sheets::Row& header,
                                           const std::string& company_header,
                                           const std::string& url_header);

// EN: The trimmed cell when it looks like a spreadsheet URL, else the first http(s) URL in the text.
// FR: La cellule épurée si elle ressemble à une URL de tableur, sinon la première URL http(s) du texte.
std::optional<std::string> extractSourceUrl(const std::string& cell);

// EN: Ordered seeds, de-duplicated by URL (first occurrence kept).
// FR: Graines ordonnées, dédoublonnées par URL (première occurrence conservée).
std::vector<SourceSeed> buildCatalog(const CatalogSchema& schema, const Sheets::Rows& data_rows);

std::string trim(const std::string& text);

class SourceCatalog {
public:
    SourceCatalog(const ConsolidatorConfig& config, Sheets::SheetsService& service);

    // EN: Read the master tab. Any failure (read error, missing column) is logged and yields
    //     an empty list.
    // FR: Lit l'onglet maître. Tout échec (erreur de lecture, colonne absente) est journalisé et
    //     donne une liste vide.
    std::vector<SourceSeed> load();

private:
    const ConsolidatorConfig& config_;
    Sheets::SheetsService& service_;
};

} // namespace Consolidation
} // namespace SHC
