// EN: One consolidation pass over every source listed in the master catalog.
// FR: Un passage de consolidation sur toutes les sources listées dans le catalogue maître.

#pragma once

#include <cstddef>
#include <string>

#include "consolidation/address_resolver.hpp"
#include "consolidation/batch_writer.hpp"
#include "infrastructure/config/consolidator_config.hpp"
#include "infrastructure/system/sleeper.hpp"
#include "sheets/sheets_service.hpp"

namespace SHC {
namespace Consolidation {

// EN: Summary of one cycle, logged at the end and used by the scheduler
// FR: Résumé d'un cycle, journalisé à la fin et utilisé par l'ordonnanceur
struct CycleReport {
    size_t sources_listed{0};
    size_t sources_skipped{0};
    size_t rows_seen{0};
    size_t new_rows{0};
    size_t rows_written{0};
    size_t flushes{0};
    size_t failed_flushes{0};
    bool catalog_empty{false};
};

class ConsolidationCycle {
public:
    ConsolidationCycle(const ConsolidatorConfig& config, Sheets::SheetsService& service,
                       Sleeper& sleeper);

    // EN: Load the ledger and catalog, then process sources in catalog order.
    //     Source and flush failures are logged and never escape.
    // FR: Charge le registre et le catalogue, puis traite les sources dans l'ordre du catalogue.
    //     Les échecs de source et de flush sont journalisés et ne remontent jamais.
    CycleReport run();

private:
    // EN: Returns false when the source was skipped.
    // FR: Retourne false quand la source a été ignorée.
    bool processSource(const SourceSeed& seed, size_t position, size_t total,
                       AddressResolver& resolver, BatchWriter& writer,
                       FingerprintLedger& ledger, CycleReport& report);

    void pause();

    const ConsolidatorConfig& config_;
    Sheets::SheetsService& service_;
    Sleeper& sleeper_;
};

} // namespace Consolidation
} // namespace SHC
