// EN: Durable per-source record of row fingerprints already delivered to the destination.
// FR: Registre durable, par source, des empreintes de lignes déjà livrées à la destination.

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace SHC {
namespace Consolidation {

// EN: Fingerprints discovered during a flush window, by source key, in discovery order.
// FR: Empreintes découvertes pendant une fenêtre de flush, par clé de source, dans l'ordre de découverte.
using PendingFingerprints = std::map<std::string, std::vector<std::string>>;

// EN: JSON document { "<spreadsheetId>_<tabId>": ["<sha256>", ...] } kept on disk.
//     commit() is the only way fingerprints enter the ledger, and it persists immediately.
// FR: Document JSON { "<spreadsheetId>_<tabId>": ["<sha256>", ...] } conservé sur disque.
//     commit() est la seule entrée des empreintes dans le registre, et persiste immédiatement.
class FingerprintLedger {
public:
    explicit FingerprintLedger(std::string path);

    // EN: Load from path. A missing, unreadable or corrupt file yields an empty ledger (logged).
    // FR: Charge depuis path. Un fichier absent, illisible ou corrompu donne un registre vide (journalisé).
    static FingerprintLedger load(const std::string& path);

    const std::string& path() const { return path_; }

    bool contains(const std::string& source_key, const std::string& fingerprint) const;

    // EN: Create an empty entry for a source on first encounter. No effect if it exists.
    // FR: Crée une entrée vide pour une source à la première rencontre. Sans effet si elle existe.
    void registerSource(const std::string& source_key);

    bool hasSource(const std::string& source_key) const;

    // EN: Merge fingerprints and persist the whole ledger atomically. The in-memory merge is kept
    //     even when persistence fails; the return value reports persistence.
    // FR: Fusionne les empreintes et persiste tout le registre de façon atomique. La fusion en mémoire
    //     est conservée même si la persistance échoue ; la valeur de retour indique la persistance.
    bool commit(const std::string& source_key, const std::vector<std::string>& fingerprints);
    bool commit(const PendingFingerprints& batch);

    size_t fingerprintCount(const std::string& source_key) const;
    size_t sourceCount() const { return entries_.size(); }

    // EN: Write to "<path>.tmp" then rename over path.
    // FR: Écrit dans "<path>.tmp" puis renomme par-dessus path.
    bool save() const;

private:
    struct SourceEntry {
        std::vector<std::string> ordered;
        std::unordered_set<std::string> index;
    };

    void merge(const std::string& source_key, const std::vector<std::string>& fingerprints);

    std::string path_;
    std::map<std::string, SourceEntry> entries_;
};

} // namespace Consolidation
} // namespace SHC
