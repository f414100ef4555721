// EN: Source catalog resolution from the master spreadsheet.
// FR: Résolution du catalogue de sources depuis le tableur maître.

#include "consolidation/source_catalog.hpp"
#include "infrastructure/logging/logger.hpp"

#include <regex>
#include <unordered_set>

namespace SHC {
namespace Consolidation {

namespace {

constexpr const char* MODULE = "catalog";

const std::regex& embeddedUrlPattern() {
    static const std::regex pattern(R"(https?://\S+)");
    return pattern;
}

} // namespace

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::optional<CatalogSchema> resolveSchema(const Sheets::Row& header,
                                           const std::string& company_header,
                                           const std::string& url_header) {
    std::optional<size_t> company;
    std::optional<size_t> url;

    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = trim(header[i]);
        if (name == company_header) company = i;
        if (name == url_header) url = i;
    }

    if (!company || !url) {
        return std::nullopt;
    }
    return CatalogSchema{*company, *url};
}

std::optional<std::string> extractSourceUrl(const std::string& cell) {
    if (cell.find("http") != std::string::npos && cell.find("spreadsheets") != std::string::npos) {
        std::string url = trim(cell);
        if (!url.empty()) return url;
        return std::nullopt;
    }

    std::smatch match;
    if (std::regex_search(cell, match, embeddedUrlPattern())) {
        return match[0].str();
    }
    return std::nullopt;
}

std::vector<SourceSeed> buildCatalog(const CatalogSchema& schema, const Sheets::Rows& data_rows) {
    std::vector<SourceSeed> seeds;
    std::unordered_set<std::string> seen_urls;

    for (const auto& row : data_rows) {
        if (row.empty() || row.size() < schema.requiredWidth()) {
            continue;
        }

        const std::string company = trim(row[schema.company_column]);
        const std::string& url_cell = row[schema.url_column];
        if (company.empty() || trim(url_cell).empty()) {
            continue;
        }

        auto url = extractSourceUrl(url_cell);
        if (!url) {
            continue;
        }
        if (seen_urls.insert(*url).second) {
            seeds.push_back(SourceSeed{*url, company});
        }
    }
    return seeds;
}

SourceCatalog::SourceCatalog(const ConsolidatorConfig& config, Sheets::SheetsService& service)
    : config_(config), service_(service) {}

std::vector<SourceSeed> SourceCatalog::load() {
    const std::string& tab = config_.master_tab_name;

    Sheets::Rows header_rows;
    try {
        header_rows = service_.fetchRange(config_.master_spreadsheet_id, Sheets::CellRange::rows(tab, 1, 1));
    } catch (const Sheets::SheetsError& e) {
        LOG_ERROR_META(MODULE, "Failed to read master header", (Logger::Metadata{
            {"tab", tab}, {"error", e.what()}}));
        return {};
    }

    const Sheets::Row header = header_rows.empty() ? Sheets::Row{} : header_rows.front();
    auto schema = resolveSchema(header, config_.company_column, config_.url_column);
    if (!schema) {
        LOG_ERROR_META(MODULE, "Catalog columns not found in master header", (Logger::Metadata{
            {"tab", tab},
            {"company_column", config_.company_column},
            {"url_column", config_.url_column}}));
        return {};
    }

    LOG_INFO_META(MODULE, "Catalog columns located", (Logger::Metadata{
        {"company_column", config_.company_column + " -> " + Sheets::columnLetters(schema->company_column)},
        {"url_column", config_.url_column + " -> " + Sheets::columnLetters(schema->url_column)}}));

    // EN: The bound was validated at configuration time.
    // FR: La borne a été validée lors de la configuration.
    const size_t last_column = Sheets::columnIndex(config_.master_column_bound).value_or(0);

    Sheets::Rows data_rows;
    try {
        data_rows = service_.fetchRange(config_.master_spreadsheet_id,
                                        Sheets::CellRange::columns(tab, 0, last_column, 2));
    } catch (const Sheets::SheetsError& e) {
        LOG_ERROR_META(MODULE, "Failed to read master rows", (Logger::Metadata{
            {"tab", tab}, {"error", e.what()}}));
        return {};
    }

    auto seeds = buildCatalog(*schema, data_rows);
    LOG_INFO_META(MODULE, "Source catalog loaded", (Logger::Metadata{
        {"rows", std::to_string(data_rows.size())},
        {"sources", std::to_string(seeds.size())}}));
    return seeds;
}

} // namespace Consolidation
} // namespace SHC
