// EN: Google Sheets v4 REST client. Maps each SheetsService call to one HTTP request.
// FR: Client REST Google Sheets v4. Associe chaque appel SheetsService à une requête HTTP.

#include "sheets/google_sheets_client.hpp"
#include "infrastructure/logging/logger.hpp"

#include <map>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace SHC {
namespace Sheets {

namespace {

constexpr const char* MODULE = "sheets";

// EN: FORMATTED_VALUE responses are strings; other JSON types are rendered the way the UI shows them.
// FR: Les réponses FORMATTED_VALUE sont des chaînes ; les autres types JSON sont rendus comme l'UI les affiche.
std::string cellText(const nlohmann::json& cell) {
    if (cell.is_string()) {
        return cell.get<std::string>();
    }
    if (cell.is_boolean()) {
        return cell.get<bool>() ? "TRUE" : "FALSE";
    }
    if (cell.is_null()) {
        return "";
    }
    return cell.dump();
}

} // namespace

GoogleSheetsClient::GoogleSheetsClient(std::string api_base_url, std::string access_token,
                                       int connect_timeout_ms, int read_timeout_ms)
    : api_base_url_(std::move(api_base_url)),
      access_token_(std::move(access_token)),
      http_(connect_timeout_ms, read_timeout_ms) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
}

std::string GoogleSheetsClient::valuesUrl(const std::string& spreadsheet_id, const CellRange& range) const {
    return api_base_url_ + "/spreadsheets/" + Http::HttpClient::urlEncode(spreadsheet_id) +
           "/values/" + Http::HttpClient::urlEncode(range.toA1());
}

Rows GoogleSheetsClient::fetchRange(const std::string& spreadsheet_id, const CellRange& range) {
    const std::string url = valuesUrl(spreadsheet_id, range) + "?majorDimension=ROWS";
    auto response = send("GET", url, "", "read " + range.toA1());
    return parseValueRange(response.body);
}

std::vector<TabInfo> GoogleSheetsClient::fetchTabs(const std::string& spreadsheet_id) {
    const std::string url = api_base_url_ + "/spreadsheets/" + Http::HttpClient::urlEncode(spreadsheet_id) +
                            "?fields=" + Http::HttpClient::urlEncode("sheets.properties(sheetId,title)");
    auto response = send("GET", url, "", "metadata of " + spreadsheet_id);
    return parseTabs(response.body);
}

void GoogleSheetsClient::writeRange(const std::string& spreadsheet_id, const CellRange& anchor,
                                    const Rows& rows) {
    const std::string url = valuesUrl(spreadsheet_id, anchor) + "?valueInputOption=RAW";
    send("PUT", url, buildValueRangeBody(anchor, rows), "write " + anchor.toA1());
}

void GoogleSheetsClient::insertRows(const std::string& spreadsheet_id, int64_t tab_id,
                                    size_t start_index, size_t count) {
    const std::string url = api_base_url_ + "/spreadsheets/" +
                            Http::HttpClient::urlEncode(spreadsheet_id) + ":batchUpdate";
    send("POST", url, buildInsertRowsBody(tab_id, start_index, count),
         "insert " + std::to_string(count) + " rows");
}

void GoogleSheetsClient::createTab(const std::string& spreadsheet_id, const std::string& title,
                                   size_t row_count, size_t column_count) {
    const std::string url = api_base_url_ + "/spreadsheets/" +
                            Http::HttpClient::urlEncode(spreadsheet_id) + ":batchUpdate";
    send("POST", url, buildAddTabBody(title, row_count, column_count), "create tab " + title);
}

Http::HttpResponse GoogleSheetsClient::send(const std::string& method, const std::string& url,
                                            const std::string& body, const std::string& what) {
    std::map<std::string, std::string> headers = {
        {"Authorization", "Bearer " + access_token_},
        {"Accept", "application/json"},
    };
    if (method != "GET") {
        headers["Content-Type"] = "application/json; charset=utf-8";
    }

    Http::HttpResponse response;
    try {
        if (method == "GET") {
            response = http_.get(url, headers);
        } else if (method == "PUT") {
            response = http_.put(url, headers, body);
        } else {
            response = http_.post(url, headers, body);
        }
    } catch (const std::runtime_error& e) {
        throw SheetsError("Sheets " + what + " failed: " + e.what());
    }

    LOG_DEBUG_META(MODULE, "Sheets request completed", (Logger::Metadata{
        {"method", method},
        {"operation", what},
        {"status", std::to_string(response.status)},
        {"elapsed_ms", std::to_string(response.elapsed_ms)}}));

    if (!response.ok()) {
        throw SheetsError("Sheets " + what + " failed: " + describeError(response.status, response.body),
                          response.status);
    }
    return response;
}

Rows GoogleSheetsClient::parseValueRange(const std::string& body) {
    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw SheetsError("Malformed value range response");
    }

    Rows rows;
    auto values = document.find("values");
    if (values == document.end()) {
        return rows;
    }
    if (!values->is_array()) {
        throw SheetsError("Malformed value range response: 'values' is not an array");
    }

    rows.reserve(values->size());
    for (const auto& json_row : *values) {
        Row row;
        if (json_row.is_array()) {
            row.reserve(json_row.size());
            for (const auto& cell : json_row) {
                row.push_back(cellText(cell));
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<TabInfo> GoogleSheetsClient::parseTabs(const std::string& body) {
    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw SheetsError("Malformed spreadsheet metadata response");
    }

    std::vector<TabInfo> tabs;
    auto sheets = document.find("sheets");
    if (sheets == document.end() || !sheets->is_array()) {
        return tabs;
    }

    for (const auto& sheet : *sheets) {
        const auto properties = sheet.find("properties");
        if (properties == sheet.end() || !properties->is_object()) {
            continue;
        }
        TabInfo tab;
        // EN: sheetId 0 is omitted from responses because it is the proto default.
        // FR: sheetId 0 est omis des réponses car c'est la valeur par défaut du proto.
        tab.id = properties->value("sheetId", static_cast<int64_t>(0));
        tab.title = properties->value("title", std::string());
        tabs.push_back(std::move(tab));
    }
    return tabs;
}

std::string GoogleSheetsClient::buildValueRangeBody(const CellRange& anchor, const Rows& rows) {
    nlohmann::json body;
    body["range"] = anchor.toA1();
    body["majorDimension"] = "ROWS";
    body["values"] = rows;
    return body.dump();
}

std::string GoogleSheetsClient::buildInsertRowsBody(int64_t tab_id, size_t start_index, size_t count) {
    nlohmann::json request;
    request["insertDimension"]["range"] = {
        {"sheetId", tab_id},
        {"dimension", "ROWS"},
        {"startIndex", start_index},
        {"endIndex", start_index + count},
    };
    request["insertDimension"]["inheritFromBefore"] = false;

    nlohmann::json body;
    body["requests"] = nlohmann::json::array({request});
    return body.dump();
}

std::string GoogleSheetsClient::buildAddTabBody(const std::string& title, size_t row_count,
                                                size_t column_count) {
    nlohmann::json request;
    request["addSheet"]["properties"] = {
        {"title", title},
        {"gridProperties", {{"rowCount", row_count}, {"columnCount", column_count}}},
    };

    nlohmann::json body;
    body["requests"] = nlohmann::json::array({request});
    return body.dump();
}

std::string GoogleSheetsClient::describeError(long status, const std::string& body) {
    std::string description = "HTTP " + std::to_string(status);

    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (!document.is_discarded() && document.is_object()) {
        auto error = document.find("error");
        if (error != document.end() && error->is_object()) {
            const std::string state = error->value("status", std::string());
            const std::string message = error->value("message", std::string());
            if (!state.empty()) description += " " + state;
            if (!message.empty()) description += ": " + message;
        }
    }
    return description;
}

} // namespace Sheets
} // namespace SHC
