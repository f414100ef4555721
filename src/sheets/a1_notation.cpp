// EN: A1 notation rendering for CellRange.
// FR: Rendu en notation A1 pour CellRange.

#include "sheets/a1_notation.hpp"

#include <algorithm>
#include <cctype>

namespace SHC {
namespace Sheets {

CellRange CellRange::rows(const std::string& tab, size_t first, size_t last) {
    CellRange range;
    range.tab = tab;
    range.first_row = first;
    range.last_row = last;
    return range;
}

CellRange CellRange::columns(const std::string& tab, size_t first_column, size_t last_column,
                             size_t first_row) {
    CellRange range;
    range.tab = tab;
    range.first_row = first_row;
    range.first_column = first_column;
    range.last_column = last_column;
    return range;
}

CellRange CellRange::cell(const std::string& tab, size_t row, size_t column) {
    CellRange range;
    range.tab = tab;
    range.first_row = row;
    range.first_column = column;
    return range;
}

CellRange CellRange::singleCell(const std::string& tab, size_t row, size_t column) {
    CellRange range = cell(tab, row, column);
    range.last_row = row;
    range.last_column = column;
    return range;
}

std::string CellRange::toA1() const {
    const std::string prefix = quoteTabName(tab) + "!";

    if (last_row && last_column) {
        return prefix + columnLetters(first_column) + std::to_string(first_row) + ":" +
               columnLetters(*last_column) + std::to_string(*last_row);
    }
    if (last_row) {
        // EN: Whole-row form only exists starting at column A.
        // FR: La forme ligne entière n'existe qu'à partir de la colonne A.
        if (first_column == 0) {
            return prefix + std::to_string(first_row) + ":" + std::to_string(*last_row);
        }
        return prefix + columnLetters(first_column) + std::to_string(first_row) + ":" +
               std::to_string(*last_row);
    }
    if (last_column) {
        if (first_row == 1) {
            return prefix + columnLetters(first_column) + ":" + columnLetters(*last_column);
        }
        return prefix + columnLetters(first_column) + std::to_string(first_row) + ":" +
               columnLetters(*last_column);
    }
    return prefix + columnLetters(first_column) + std::to_string(first_row);
}

bool CellRange::operator==(const CellRange& other) const {
    return tab == other.tab && first_row == other.first_row && first_column == other.first_column &&
           last_row == other.last_row && last_column == other.last_column;
}

std::string columnLetters(size_t index) {
    std::string letters;
    size_t n = index + 1;
    while (n > 0) {
        const size_t remainder = (n - 1) % 26;
        letters.push_back(static_cast<char>('A' + remainder));
        n = (n - 1) / 26;
    }
    std::reverse(letters.begin(), letters.end());
    return letters;
}

std::optional<size_t> columnIndex(const std::string& letters) {
    if (letters.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    for (char c : letters) {
        const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (upper < 'A' || upper > 'Z') {
            return std::nullopt;
        }
        value = value * 26 + static_cast<size_t>(upper - 'A' + 1);
    }
    return value - 1;
}

std::string quoteTabName(const std::string& tab) {
    std::string quoted = "'";
    for (char c : tab) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace Sheets
} // namespace SHC
