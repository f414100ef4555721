// EN: Google Sheets v4 REST implementation of SheetsService (libcurl transport, nlohmann::json payloads).
// FR: Implémentation REST Google Sheets v4 de SheetsService (transport libcurl, charges nlohmann::json).

#pragma once

#include <string>
#include <vector>

#include "http/http_client.hpp"
#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Sheets {

class GoogleSheetsClient : public SheetsService {
public:
    // EN: access_token is sent as "Authorization: Bearer <token>". Obtaining it is the caller's concern.
    // FR: access_token est envoyé en "Authorization: Bearer <token>". Son obtention relève de l'appelant.
    GoogleSheetsClient(std::string api_base_url, std::string access_token,
                       int connect_timeout_ms, int read_timeout_ms);

    Rows fetchRange(const std::string& spreadsheet_id, const CellRange& range) override;
    std::vector<TabInfo> fetchTabs(const std::string& spreadsheet_id) override;
    void writeRange(const std::string& spreadsheet_id, const CellRange& anchor,
                    const Rows& rows) override;
    void insertRows(const std::string& spreadsheet_id, int64_t tab_id,
                    size_t start_index, size_t count) override;
    void createTab(const std::string& spreadsheet_id, const std::string& title,
                   size_t row_count, size_t column_count) override;

    // EN: Request/response codecs, exposed for unit testing.
    // FR: Codecs requête/réponse, exposés pour les tests unitaires.
    static Rows parseValueRange(const std::string& body);
    static std::vector<TabInfo> parseTabs(const std::string& body);
    static std::string buildValueRangeBody(const CellRange& anchor, const Rows& rows);
    static std::string buildInsertRowsBody(int64_t tab_id, size_t start_index, size_t count);
    static std::string buildAddTabBody(const std::string& title, size_t row_count, size_t column_count);
    static std::string describeError(long status, const std::string& body);

    std::string valuesUrl(const std::string& spreadsheet_id, const CellRange& range) const;

private:
    Http::HttpResponse send(const std::string& method, const std::string& url,
                            const std::string& body, const std::string& what);

    std::string api_base_url_;
    std::string access_token_;
    Http::HttpClient http_;
};

} // namespace Sheets
} // namespace SHC
