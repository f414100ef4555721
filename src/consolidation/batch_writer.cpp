// EN: BatchWriter implementation: destination preparation, prepend write, ledger commit.
// FR: Implémentation du BatchWriter : préparation de la destination, écriture en tête, commit du registre.

#include "consolidation/batch_writer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>
#include <utility>

namespace SHC {
namespace Consolidation {

namespace {

constexpr const char* MODULE = "batch_writer";

// EN: Grid size of a destination tab created from scratch
// FR: Taille de grille d'un onglet de destination créé de zéro
constexpr size_t NEW_TAB_ROWS = 1000;
constexpr size_t NEW_TAB_COLUMNS = 26;

bool isBlank(const Sheets::Rows& rows) {
    return rows.empty() || rows.front().empty() || rows.front().front().empty();
}

} // namespace

std::string flushResultToString(FlushResult result) {
    switch (result) {
        case FlushResult::SUCCESS: return "SUCCESS";
        case FlushResult::NOTHING_TO_FLUSH: return "NOTHING_TO_FLUSH";
        case FlushResult::DESTINATION_ERROR: return "DESTINATION_ERROR";
        case FlushResult::LEDGER_ERROR: return "LEDGER_ERROR";
    }
    return "UNKNOWN";
}

BatchWriter::BatchWriter(const ConsolidatorConfig& config, Sheets::SheetsService& service,
                         FingerprintLedger& ledger)
    : config_(config), service_(service), ledger_(ledger) {}

void BatchWriter::captureHeader(const Sheets::Row& source_header) {
    if (header_) {
        return;
    }
    Sheets::Row header = source_header;
    header.push_back(config_.company_name_column);
    header_ = std::move(header);

    LOG_INFO_META(MODULE, "Destination header captured", (Logger::Metadata{
        {"columns", std::to_string(header_->size())}}));
}

const Sheets::Row& BatchWriter::header() const {
    if (!header_) {
        throw std::logic_error("BatchWriter::header() called before captureHeader()");
    }
    return *header_;
}

size_t BatchWriter::headerWidth() const {
    return header_ ? header_->size() - 1 : 0;
}

Sheets::Row BatchWriter::padRow(const Sheets::Row& row, size_t width) {
    Sheets::Row padded = row;
    if (padded.size() < width) {
        padded.resize(width);
    }
    return padded;
}

void BatchWriter::stage(const std::string& source_key, const Sheets::Rows& rows,
                        const std::vector<std::string>& fingerprints, const std::string& company_name) {
    if (rows.size() != fingerprints.size()) {
        throw std::invalid_argument("BatchWriter::stage: rows and fingerprints differ in length");
    }

    const size_t width = headerWidth();
    auto& pending = pending_fingerprints_[source_key];
    auto& index = pending_index_[source_key];

    for (size_t i = 0; i < rows.size(); ++i) {
        Sheets::Row labelled = padRow(rows[i], width);
        labelled.push_back(company_name);
        pending_rows_.push_back(std::move(labelled));

        if (index.insert(fingerprints[i]).second) {
            pending.push_back(fingerprints[i]);
        }
    }
    statistics_.rows_staged += rows.size();
}

bool BatchWriter::isPending(const std::string& source_key, const std::string& fingerprint) const {
    auto it = pending_index_.find(source_key);
    return it != pending_index_.end() && it->second.count(fingerprint) > 0;
}

bool BatchWriter::shouldFlush(size_t position, size_t total) const {
    if (pending_rows_.empty() || position == 0) {
        return false;
    }
    return position % config_.flush_every_sources == 0 || position >= total;
}

FlushResult BatchWriter::flush() {
    if (pending_rows_.empty()) {
        return FlushResult::NOTHING_TO_FLUSH;
    }

    const size_t batch_size = pending_rows_.size();
    LOG_INFO_META(MODULE, "Flushing batch to destination", (Logger::Metadata{
        {"rows", std::to_string(batch_size)},
        {"tab", config_.destination_tab_name}}));

    try {
        if (!destination_prepared_ && header_) {
            prepareDestination();
            destination_prepared_ = true;
        }
        writePendingRows();
    } catch (const Sheets::SheetsError& e) {
        // EN: Fingerprints stay out of the ledger, so these rows are rediscovered next cycle.
        // FR: Les empreintes restent hors du registre, ces lignes seront retrouvées au prochain cycle.
        LOG_ERROR_META(MODULE, "Destination write failed, batch abandoned", (Logger::Metadata{
            {"rows", std::to_string(batch_size)},
            {"status", std::to_string(e.status())},
            {"error", e.what()}}));
        ++statistics_.failed_flushes;
        resetPending();
        return FlushResult::DESTINATION_ERROR;
    }

    statistics_.rows_written += batch_size;
    ++statistics_.flushes;

    const bool persisted = ledger_.commit(pending_fingerprints_);
    resetPending();

    if (!persisted) {
        LOG_ERROR_META(MODULE, "Rows written but ledger not persisted, duplicates possible next cycle",
                       (Logger::Metadata{{"ledger", ledger_.path()}, {"rows", std::to_string(batch_size)}}));
        return FlushResult::LEDGER_ERROR;
    }

    LOG_INFO_META(MODULE, "Batch written and ledger updated", (Logger::Metadata{
        {"rows", std::to_string(batch_size)}}));
    return FlushResult::SUCCESS;
}

void BatchWriter::prepareDestination() {
    const std::string& spreadsheet_id = config_.destination_spreadsheet_id;
    const std::string& tab = config_.destination_tab_name;

    bool tab_exists = false;
    for (const auto& info : service_.fetchTabs(spreadsheet_id)) {
        if (info.title == tab) {
            tab_exists = true;
            break;
        }
    }
    if (!tab_exists) {
        service_.createTab(spreadsheet_id, tab, NEW_TAB_ROWS, NEW_TAB_COLUMNS);
        LOG_INFO(MODULE, "Created destination tab " + tab);
    }

    const auto first_cell = service_.fetchRange(spreadsheet_id, Sheets::CellRange::singleCell(tab, 1));
    if (isBlank(first_cell)) {
        service_.writeRange(spreadsheet_id, Sheets::CellRange::cell(tab, 1), Sheets::Rows{*header_});
        LOG_INFO(MODULE, "Destination was empty, header written");
    } else {
        LOG_INFO(MODULE, "Destination already has data, header left as is");
    }
}

void BatchWriter::writePendingRows() {
    const std::string& spreadsheet_id = config_.destination_spreadsheet_id;
    const std::string& tab = config_.destination_tab_name;
    const auto data_anchor = Sheets::CellRange::cell(tab, 2);

    const auto first_column = service_.fetchRange(spreadsheet_id, Sheets::CellRange::columns(tab, 0, 0));
    if (first_column.empty()) {
        service_.writeRange(spreadsheet_id, data_anchor, pending_rows_);
        return;
    }

    // EN: Row index 1 (0-based) is the first row under the header.
    // FR: La ligne d'index 1 (base 0) est la première sous l'en-tête.
    service_.insertRows(spreadsheet_id, destinationTabId(), 1, pending_rows_.size());
    service_.writeRange(spreadsheet_id, data_anchor, pending_rows_);
}

int64_t BatchWriter::destinationTabId() {
    for (const auto& info : service_.fetchTabs(config_.destination_spreadsheet_id)) {
        if (info.title == config_.destination_tab_name) {
            return info.id;
        }
    }
    throw Sheets::SheetsError("Destination tab '" + config_.destination_tab_name + "' not found");
}

void BatchWriter::resetPending() {
    pending_rows_.clear();
    pending_fingerprints_.clear();
    pending_index_.clear();
}

} // namespace Consolidation
} // namespace SHC
