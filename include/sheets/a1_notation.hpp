// EN: Typed cell ranges and A1 notation helpers for spreadsheet tabs.
// FR: Plages de cellules typées et utilitaires de notation A1 pour les onglets de tableur.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace SHC {
namespace Sheets {

// EN: Rectangular range on a named tab. Rows are 1-based, columns 0-based (A = 0).
//     A missing last_row/last_column leaves that side open-ended.
// FR: Plage rectangulaire sur un onglet nommé. Lignes en base 1, colonnes en base 0 (A = 0).
//     Un last_row/last_column absent laisse ce côté ouvert.
struct CellRange {
    std::string tab;
    size_t first_row{1};
    size_t first_column{0};
    std::optional<size_t> last_row;
    std::optional<size_t> last_column;

    // EN: Whole rows [first, last], e.g. "'Tab'!1:1".
    // FR: Lignes entières [first, last], ex. "'Tab'!1:1".
    static CellRange rows(const std::string& tab, size_t first, size_t last);

    // EN: Columns [first, last] from first_row downwards, e.g. "'Tab'!A:Q" or "'Tab'!A2:ZZ".
    // FR: Colonnes [first, last] depuis first_row vers le bas, ex. "'Tab'!A:Q" ou "'Tab'!A2:ZZ".
    static CellRange columns(const std::string& tab, size_t first_column, size_t last_column,
                             size_t first_row = 1);

    // EN: A single cell, used as a write anchor or a one-cell read, e.g. "'Tab'!A2".
    // FR: Une seule cellule, utilisée comme ancre d'écriture ou lecture unitaire, ex. "'Tab'!A2".
    static CellRange cell(const std::string& tab, size_t row, size_t column = 0);

    // EN: Same cell as a closed 1x1 range, e.g. "'Tab'!A1:A1".
    // FR: Même cellule sous forme de plage fermée 1x1, ex. "'Tab'!A1:A1".
    static CellRange singleCell(const std::string& tab, size_t row, size_t column = 0);

    std::string toA1() const;

    bool operator==(const CellRange& other) const;
};

// EN: 0 -> "A", 25 -> "Z", 26 -> "AA", 701 -> "ZZ".
// FR: 0 -> "A", 25 -> "Z", 26 -> "AA", 701 -> "ZZ".
std::string columnLetters(size_t index);

// EN: Inverse of columnLetters. Returns nullopt for anything but letters A-Z (case-insensitive).
// FR: Inverse de columnLetters. Retourne nullopt pour tout sauf des lettres A-Z (insensible à la casse).
std::optional<size_t> columnIndex(const std::string& letters);

// EN: Quote a tab title for A1 notation: Sheet 1 -> 'Sheet 1', O'Neil -> 'O''Neil'.
// FR: Cite un titre d'onglet pour la notation A1 : Sheet 1 -> 'Sheet 1', O'Neil -> 'O''Neil'.
std::string quoteTabName(const std::string& tab);

} // namespace Sheets
} // namespace SHC
