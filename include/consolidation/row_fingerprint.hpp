// EN: Row fingerprints: lowercase hex SHA-256 of the row's cells concatenated in order.
// FR: Empreintes de ligne : SHA-256 hexadécimal minuscule des cellules concaténées dans l'ordre.

#pragma once

#include <string>

#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Consolidation {

// EN: Cells are joined without separator, so ledgers written by earlier tooling stay valid.
//     Throws std::runtime_error if the digest backend fails.
// FR: Les cellules sont jointes sans séparateur, pour rester compatible avec les registres existants.
//     Lance std::runtime_error si le backend de hachage échoue.
std::string fingerprintRow(const Sheets::Row& row);

// EN: SHA-256 of arbitrary bytes, lowercase hex.
// FR: SHA-256 d'octets arbitraires, hexadécimal minuscule.
std::string sha256Hex(const std::string& data);

} // namespace Consolidation
} // namespace SHC
