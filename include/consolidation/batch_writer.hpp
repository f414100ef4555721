// EN: Batched prepend writer for the destination spreadsheet, with write-then-persist ledger commits.
// FR: Writer batch en tête pour le tableur de destination, avec commit du registre après écriture.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "consolidation/fingerprint_ledger.hpp"
#include "infrastructure/config/consolidator_config.hpp"
#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Consolidation {

// EN: Outcome of a flush attempt
// FR: Résultat d'une tentative de flush
enum class FlushResult {
    SUCCESS,            // EN: Rows written and ledger persisted / FR: Lignes écrites et registre persisté
    NOTHING_TO_FLUSH,   // EN: Pending batch was empty / FR: Le batch en attente était vide
    DESTINATION_ERROR,  // EN: Destination write failed, batch discarded / FR: Écriture échouée, batch abandonné
    LEDGER_ERROR        // EN: Rows written but ledger not persisted / FR: Lignes écrites mais registre non persisté
};

std::string flushResultToString(FlushResult result);

// EN: Counters kept across the lifetime of one writer (one cycle).
// FR: Compteurs conservés pendant la durée de vie d'un writer (un cycle).
struct BatchStatistics {
    size_t rows_staged{0};
    size_t rows_written{0};
    size_t flushes{0};
    size_t failed_flushes{0};
};

class BatchWriter {
public:
    BatchWriter(const ConsolidatorConfig& config, Sheets::SheetsService& service,
                FingerprintLedger& ledger);

    // EN: Capture the destination header from a source header. Only the first call has an effect.
    // FR: Capture l'en-tête de destination depuis un en-tête source. Seul le premier appel compte.
    void captureHeader(const Sheets::Row& source_header);
    bool hasHeader() const { return header_.has_value(); }

    // EN: Destination header: first source header plus the company name column.
    // FR: En-tête de destination : premier en-tête source plus la colonne du nom de société.
    const Sheets::Row& header() const;

    // EN: Number of source columns every staged row is padded to (header without company column).
    // FR: Nombre de colonnes source auquel chaque ligne est complétée (en-tête sans colonne société).
    size_t headerWidth() const;

    // EN: Pad rows, append the company name and queue them with their fingerprints.
    //     rows and fingerprints are parallel sequences.
    // FR: Complète les lignes, ajoute le nom de société et les met en file avec leurs empreintes.
    //     rows et fingerprints sont des séquences parallèles.
    void stage(const std::string& source_key, const Sheets::Rows& rows,
               const std::vector<std::string>& fingerprints, const std::string& company_name);

    // EN: True if the fingerprint was staged in the current flush window.
    // FR: Vrai si l'empreinte a été mise en file dans la fenêtre de flush courante.
    bool isPending(const std::string& source_key, const std::string& fingerprint) const;

    // EN: position is the 1-based index of the source just processed, total the catalog size.
    // FR: position est l'index (base 1) de la source traitée, total la taille du catalogue.
    bool shouldFlush(size_t position, size_t total) const;

    FlushResult flush();

    size_t pendingRows() const { return pending_rows_.size(); }
    const Sheets::Rows& pendingBatch() const { return pending_rows_; }
    const BatchStatistics& statistics() const { return statistics_; }

    // EN: Right-pad with empty cells up to width. Longer rows are returned unchanged.
    // FR: Complète à droite avec des cellules vides jusqu'à width. Les lignes plus longues sont inchangées.
    static Sheets::Row padRow(const Sheets::Row& row, size_t width);

private:
    void prepareDestination();
    void writePendingRows();
    int64_t destinationTabId();
    void resetPending();

    const ConsolidatorConfig& config_;
    Sheets::SheetsService& service_;
    FingerprintLedger& ledger_;

    std::optional<Sheets::Row> header_;
    bool destination_prepared_{false};

    Sheets::Rows pending_rows_;
    PendingFingerprints pending_fingerprints_;
    std::unordered_map<std::string, std::unordered_set<std::string>> pending_index_;

    BatchStatistics statistics_;
};

} // namespace Consolidation
} // namespace SHC
