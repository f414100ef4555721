// EN: Consolidation cycle: catalog -> resolve -> fetch -> classify -> stage -> flush.
// FR: Cycle de consolidation : catalogue -> résolution -> lecture -> classement -> file -> flush.

#include "consolidation/consolidation_cycle.hpp"
#include "consolidation/row_fingerprint.hpp"
#include "consolidation/source_catalog.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>
#include <unordered_set>
#include <vector>

namespace SHC {
namespace Consolidation {

namespace {
constexpr const char* MODULE = "cycle";
}

ConsolidationCycle::ConsolidationCycle(const ConsolidatorConfig& config, Sheets::SheetsService& service,
                                       Sleeper& sleeper)
    : config_(config), service_(service), sleeper_(sleeper) {}

CycleReport ConsolidationCycle::run() {
    auto& logger = Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    const auto started = std::chrono::steady_clock::now();
    LOG_INFO(MODULE, "Consolidation cycle started");

    CycleReport report;
    FingerprintLedger ledger = FingerprintLedger::load(config_.ledger_path);

    SourceCatalog catalog(config_, service_);
    const auto seeds = catalog.load();
    report.sources_listed = seeds.size();
    if (seeds.empty()) {
        report.catalog_empty = true;
        LOG_WARN(MODULE, "No sources to process in this cycle");
        return report;
    }

    AddressResolver resolver(service_);
    BatchWriter writer(config_, service_, ledger);

    for (size_t i = 0; i < seeds.size(); ++i) {
        const size_t position = i + 1;
        if (!processSource(seeds[i], position, seeds.size(), resolver, writer, ledger, report)) {
            ++report.sources_skipped;
        }

        // EN: Evaluated after every source, skipped ones included, so the last batch always lands.
        // FR: Évalué après chaque source, ignorées comprises, pour que le dernier batch soit écrit.
        if (writer.shouldFlush(position, seeds.size())) {
            const auto result = writer.flush();
            Logger::Metadata flush_meta{
                {"position", std::to_string(position) + "/" + std::to_string(seeds.size())},
                {"result", flushResultToString(result)}};
            if (result == FlushResult::SUCCESS) {
                LOG_INFO_META(MODULE, "Flush completed", flush_meta);
            } else {
                LOG_WARN_META(MODULE, "Flush failed", flush_meta);
            }
        }
    }

    const auto& statistics = writer.statistics();
    report.rows_written = statistics.rows_written;
    report.flushes = statistics.flushes;
    report.failed_flushes = statistics.failed_flushes;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO_META(MODULE, "Consolidation cycle complete", (Logger::Metadata{
        {"sources", std::to_string(report.sources_listed)},
        {"skipped", std::to_string(report.sources_skipped)},
        {"rows_seen", std::to_string(report.rows_seen)},
        {"new_rows", std::to_string(report.new_rows)},
        {"rows_written", std::to_string(report.rows_written)},
        {"flushes", std::to_string(report.flushes)},
        {"failed_flushes", std::to_string(report.failed_flushes)},
        {"elapsed_ms", std::to_string(elapsed.count())}}));
    return report;
}

bool ConsolidationCycle::processSource(const SourceSeed& seed, size_t position, size_t total,
                                       AddressResolver& resolver, BatchWriter& writer,
                                       FingerprintLedger& ledger, CycleReport& report) {
    LOG_INFO_META(MODULE, "Checking source", (Logger::Metadata{
        {"position", std::to_string(position) + "/" + std::to_string(total)},
        {"company", seed.display_name},
        {"url", seed.url}}));

    auto source = resolver.resolve(seed);
    if (!source) {
        return false;
    }

    // EN: Bound validated at configuration time.
    // FR: Borne validée lors de la configuration.
    const size_t last_column = Sheets::columnIndex(config_.source_column_bound).value_or(0);

    Sheets::Rows rows;
    try {
        rows = service_.fetchRange(source->spreadsheet_id,
                                   Sheets::CellRange::columns(source->tab_name, 0, last_column));
    } catch (const Sheets::SheetsError& e) {
        LOG_WARN_META(MODULE, "Source read failed, skipping", (Logger::Metadata{
            {"company", source->display_name},
            {"tab", source->tab_name},
            {"error", e.what()}}));
        return false;
    }

    if (rows.size() <= 1) {
        LOG_INFO_META(MODULE, "No data in source", (Logger::Metadata{
            {"company", source->display_name}, {"tab", source->tab_name}}));
        return false;
    }

    const std::string key = source->key();
    ledger.registerSource(key);

    const Sheets::Row& header = rows.front();
    Sheets::Rows new_rows;
    std::vector<std::string> new_fingerprints;
    std::unordered_set<std::string> seen_in_fetch;

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto fingerprint = fingerprintRow(rows[r]);
        if (ledger.contains(key, fingerprint) || writer.isPending(key, fingerprint) ||
            !seen_in_fetch.insert(fingerprint).second) {
            continue;
        }
        new_rows.push_back(rows[r]);
        new_fingerprints.push_back(fingerprint);
    }
    report.rows_seen += rows.size() - 1;

    if (new_rows.empty()) {
        LOG_INFO_META(MODULE, "No new rows", (Logger::Metadata{{"company", source->display_name}}));
        pause();
        return true;
    }

    LOG_INFO_META(MODULE, "New rows found", (Logger::Metadata{
        {"company", source->display_name},
        {"source_key", key},
        {"new_rows", std::to_string(new_rows.size())}}));

    writer.captureHeader(header);
    writer.stage(key, new_rows, new_fingerprints, source->display_name);
    report.new_rows += new_rows.size();

    pause();
    return true;
}

void ConsolidationCycle::pause() {
    sleeper_.sleepFor(config_.inter_source_pause);
}

} // namespace Consolidation
} // namespace SHC
