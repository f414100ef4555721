// EN: Narrow capability interface over a remote spreadsheet service.
// FR: Interface de capacités restreinte au-dessus d'un service de tableur distant.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "sheets/a1_notation.hpp"

namespace SHC {
namespace Sheets {

// EN: One spreadsheet row as displayed text, in column order.
// FR: Une ligne de tableur sous forme de texte affiché, dans l'ordre des colonnes.
using Row = std::vector<std::string>;
using Rows = std::vector<Row>;

// EN: Tab (sheet) metadata: numeric id ("gid") and title.
// FR: Métadonnées d'onglet : id numérique ("gid") et titre.
struct TabInfo {
    int64_t id{0};
    std::string title;
};

// EN: Any failed remote call. status is the HTTP status, or 0 for transport/parse failures.
// FR: Tout appel distant échoué. status est le statut HTTP, ou 0 pour un échec de transport/parsing.
class SheetsError : public std::runtime_error {
public:
    explicit SheetsError(const std::string& message, long status = 0)
        : std::runtime_error(message), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

// EN: Every operation is blocking and throws SheetsError on failure.
// FR: Chaque opération est bloquante et lance SheetsError en cas d'échec.
class SheetsService {
public:
    virtual ~SheetsService() = default;

    // EN: Read the values in range. Trailing empty rows and cells are omitted, as the service does.
    // FR: Lit les valeurs de la plage. Les lignes et cellules vides finales sont omises, comme le fait le service.
    virtual Rows fetchRange(const std::string& spreadsheet_id, const CellRange& range) = 0;

    // EN: List the tabs of a spreadsheet in display order.
    // FR: Liste les onglets d'un tableur dans l'ordre d'affichage.
    virtual std::vector<TabInfo> fetchTabs(const std::string& spreadsheet_id) = 0;

    // EN: Write rows starting at the anchor cell, values stored as-is (no formula parsing).
    // FR: Écrit les lignes à partir de la cellule d'ancrage, valeurs stockées telles quelles.
    virtual void writeRange(const std::string& spreadsheet_id, const CellRange& anchor,
                            const Rows& rows) = 0;

    // EN: Insert count blank rows before the 0-based row start_index of the tab.
    // FR: Insère count lignes vides avant la ligne start_index (base 0) de l'onglet.
    virtual void insertRows(const std::string& spreadsheet_id, int64_t tab_id,
                            size_t start_index, size_t count) = 0;

    virtual void createTab(const std::string& spreadsheet_id, const std::string& title,
                           size_t row_count, size_t column_count) = 0;
};

} // namespace Sheets
} // namespace SHC
