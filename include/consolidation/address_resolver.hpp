// EN: Source addressing: spreadsheet URL -> (spreadsheet id, tab id) -> tab title.
// FR: Adressage des sources : URL de tableur -> (id de tableur, id d'onglet) -> titre d'onglet.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Consolidation {

struct SheetAddress {
    std::string spreadsheet_id;
    int64_t tab_id{0};
};

// EN: A source as listed in the master catalog, before resolution.
// FR: Une source telle que listée dans le catalogue maître, avant résolution.
struct SourceSeed {
    std::string url;
    std::string display_name;

    bool operator==(const SourceSeed& other) const {
        return url == other.url && display_name == other.display_name;
    }
};

// EN: Fully resolved source. Rebuilt every cycle, never persisted.
// FR: Source entièrement résolue. Reconstruite à chaque cycle, jamais persistée.
struct SourceDescriptor {
    std::string url;
    std::string display_name;
    std::string spreadsheet_id;
    int64_t tab_id{0};
    std::string tab_name;

    // EN: Ledger identity "<spreadsheetId>_<tabId>".
    // FR: Identité dans le registre "<spreadsheetId>_<tabId>".
    std::string key() const { return sourceKey(spreadsheet_id, tab_id); }

    static std::string sourceKey(const std::string& spreadsheet_id, int64_t tab_id) {
        return spreadsheet_id + "_" + std::to_string(tab_id);
    }
};

// EN: Canonical "/spreadsheets/d/<id>" first, then legacy "id=<id>". The tab id comes from
//     "gid=<n>" and defaults to 0. Returns nullopt when no spreadsheet id is found.
// FR: "/spreadsheets/d/<id>" canonique d'abord, puis "id=<id>" historique. L'id d'onglet vient de
//     "gid=<n>" et vaut 0 par défaut. Retourne nullopt si aucun id de tableur n'est trouvé.
std::optional<SheetAddress> parseSheetUrl(const std::string& url);

class AddressResolver {
public:
    explicit AddressResolver(Sheets::SheetsService& service);

    // EN: Parse the URL and look up the tab title. The tab with the matching id wins, otherwise the
    //     first tab. nullopt on unparsable URL, metadata failure, or a spreadsheet without tabs.
    // FR: Analyse l'URL et recherche le titre d'onglet. L'onglet d'id correspondant l'emporte, sinon
    //     le premier. nullopt si URL illisible, échec des métadonnées ou tableur sans onglet.
    std::optional<SourceDescriptor> resolve(const SourceSeed& seed);

private:
    Sheets::SheetsService& service_;
};

} // namespace Consolidation
} // namespace SHC
