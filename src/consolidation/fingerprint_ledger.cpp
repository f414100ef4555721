// EN: FingerprintLedger persistence with nlohmann::json and atomic file replacement.
// FR: Persistance du FingerprintLedger avec nlohmann::json et remplacement atomique du fichier.

#include "consolidation/fingerprint_ledger.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace SHC {
namespace Consolidation {

namespace {
constexpr const char* MODULE = "ledger";
constexpr const char* TEMP_SUFFIX = ".tmp";
}

FingerprintLedger::FingerprintLedger(std::string path) : path_(std::move(path)) {}

FingerprintLedger FingerprintLedger::load(const std::string& path) {
    FingerprintLedger ledger(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_INFO(MODULE, "No ledger at " + path + ", starting empty");
        return ledger;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN(MODULE, "Cannot open ledger " + path + ", starting empty");
        return ledger;
    }

    const auto document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        LOG_WARN(MODULE, "Ledger " + path + " is empty or corrupt, starting empty");
        return ledger;
    }

    size_t fingerprints = 0;
    for (const auto& [key, value] : document.items()) {
        if (!value.is_array()) {
            LOG_WARN(MODULE, "Ignoring ledger entry with non-array value: " + key);
            continue;
        }
        std::vector<std::string> entry;
        entry.reserve(value.size());
        size_t dropped = 0;
        for (const auto& item : value) {
            if (item.is_string()) {
                entry.push_back(item.get<std::string>());
            } else {
                ++dropped;
            }
        }
        if (dropped > 0) {
            LOG_WARN_META(MODULE, "Ignoring non-string fingerprints in ledger entry", (Logger::Metadata{
                {"source", key},
                {"dropped", std::to_string(dropped)}}));
        }
        ledger.registerSource(key);
        ledger.merge(key, entry);
        fingerprints += ledger.fingerprintCount(key);
    }

    LOG_INFO_META(MODULE, "Ledger loaded", (Logger::Metadata{
        {"path", path},
        {"sources", std::to_string(ledger.sourceCount())},
        {"fingerprints", std::to_string(fingerprints)}}));
    return ledger;
}

bool FingerprintLedger::contains(const std::string& source_key, const std::string& fingerprint) const {
    auto it = entries_.find(source_key);
    return it != entries_.end() && it->second.index.count(fingerprint) > 0;
}

void FingerprintLedger::registerSource(const std::string& source_key) {
    entries_.try_emplace(source_key);
}

bool FingerprintLedger::hasSource(const std::string& source_key) const {
    return entries_.find(source_key) != entries_.end();
}

bool FingerprintLedger::commit(const std::string& source_key, const std::vector<std::string>& fingerprints) {
    return commit(PendingFingerprints{{source_key, fingerprints}});
}

bool FingerprintLedger::commit(const PendingFingerprints& batch) {
    for (const auto& [source_key, fingerprints] : batch) {
        if (!fingerprints.empty()) {
            merge(source_key, fingerprints);
        }
    }
    return save();
}

size_t FingerprintLedger::fingerprintCount(const std::string& source_key) const {
    auto it = entries_.find(source_key);
    return it == entries_.end() ? 0 : it->second.ordered.size();
}

void FingerprintLedger::merge(const std::string& source_key, const std::vector<std::string>& fingerprints) {
    SourceEntry& entry = entries_[source_key];
    for (const auto& fingerprint : fingerprints) {
        if (entry.index.insert(fingerprint).second) {
            entry.ordered.push_back(fingerprint);
        }
    }
}

bool FingerprintLedger::save() const {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [source_key, entry] : entries_) {
        document[source_key] = entry.ordered;
    }

    const std::string temp_path = path_ + TEMP_SUFFIX;
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR(MODULE, "Cannot open " + temp_path + " for writing");
            return false;
        }
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
            LOG_ERROR(MODULE, "Failed writing ledger to " + temp_path);
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        LOG_ERROR(MODULE, "Failed replacing ledger " + path_ + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

} // namespace Consolidation
} // namespace SHC
