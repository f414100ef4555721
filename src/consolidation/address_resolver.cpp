// EN: Address resolution for source spreadsheets.
// FR: Résolution d'adresse des tableurs sources.

#include "consolidation/address_resolver.hpp"
#include "infrastructure/logging/logger.hpp"

#include <regex>
#include <stdexcept>
#include <vector>

namespace SHC {
namespace Consolidation {

namespace {

constexpr const char* MODULE = "resolver";

const std::regex& canonicalIdPattern() {
    static const std::regex pattern(R"(/spreadsheets/d/([A-Za-z0-9_-]+))");
    return pattern;
}

const std::regex& legacyIdPattern() {
    static const std::regex pattern(R"(id=([A-Za-z0-9_-]+))");
    return pattern;
}

const std::regex& tabIdPattern() {
    static const std::regex pattern(R"(gid=([0-9]+))");
    return pattern;
}

} // namespace

std::optional<SheetAddress> parseSheetUrl(const std::string& url) {
    SheetAddress address;
    std::smatch match;

    if (std::regex_search(url, match, canonicalIdPattern()) ||
        std::regex_search(url, match, legacyIdPattern())) {
        address.spreadsheet_id = match[1].str();
    } else {
        return std::nullopt;
    }

    if (std::regex_search(url, match, tabIdPattern())) {
        try {
            address.tab_id = std::stoll(match[1].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return address;
}

AddressResolver::AddressResolver(Sheets::SheetsService& service) : service_(service) {}

std::optional<SourceDescriptor> AddressResolver::resolve(const SourceSeed& seed) {
    auto address = parseSheetUrl(seed.url);
    if (!address) {
        LOG_WARN_META(MODULE, "No spreadsheet id in source URL", (Logger::Metadata{
            {"company", seed.display_name}, {"url", seed.url}}));
        return std::nullopt;
    }

    std::vector<Sheets::TabInfo> tabs;
    try {
        tabs = service_.fetchTabs(address->spreadsheet_id);
    } catch (const Sheets::SheetsError& e) {
        LOG_WARN_META(MODULE, "Metadata lookup failed", (Logger::Metadata{
            {"company", seed.display_name},
            {"spreadsheet_id", address->spreadsheet_id},
            {"error", e.what()}}));
        return std::nullopt;
    }

    if (tabs.empty()) {
        LOG_WARN_META(MODULE, "Spreadsheet has no tabs", (Logger::Metadata{
            {"company", seed.display_name}, {"spreadsheet_id", address->spreadsheet_id}}));
        return std::nullopt;
    }

    const Sheets::TabInfo* chosen = &tabs.front();
    for (const auto& tab : tabs) {
        if (tab.id == address->tab_id) {
            chosen = &tab;
            break;
        }
    }

    SourceDescriptor descriptor;
    descriptor.url = seed.url;
    descriptor.display_name = seed.display_name;
    descriptor.spreadsheet_id = address->spreadsheet_id;
    descriptor.tab_id = address->tab_id;
    descriptor.tab_name = chosen->title;
    return descriptor;
}

} // namespace Consolidation
} // namespace SHC
