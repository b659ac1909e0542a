// EN: Key-based deduplication and reconciliation of repeated statement uploads.
// FR: Déduplication par clé et réconciliation des imports répétés de relevés.

#pragma once

#include "model/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Ingest {

struct MergeResult {
    std::vector<Transaction> merged;
    size_t duplicates_removed{0};
    size_t new_transactions{0};
    // EN: Intersection of the two inputs' date ranges, informational only.
    // FR: Intersection des plages de dates des deux entrées, à titre informatif.
    std::vector<DateRange> overlapping_periods;
};

// EN: Composite key is (calendar day, bank reference). First-seen wins and input order is kept.
//     None of these operations fail.
// FR: La clé composite est (jour, référence bancaire). La première occurrence gagne et l'ordre
//     d'entrée est conservé. Aucune de ces opérations n'échoue.
class TransactionMerger {
public:
    static std::string compositeKey(const Transaction& txn);

    static bool areDuplicates(const Transaction& a, const Transaction& b);
    static std::vector<Transaction> deduplicate(const std::vector<Transaction>& transactions);
    static MergeResult merge(const std::vector<Transaction>& existing, const std::vector<Transaction>& incoming);

    // EN: Groups of two or more transactions sharing a composite key, in first-seen order.
    // FR: Groupes d'au moins deux transactions partageant une clé composite, dans l'ordre d'apparition.
    static std::vector<std::vector<Transaction>> findDuplicateGroups(const std::vector<Transaction>& transactions);

    static std::vector<Transaction> sortByDateDescending(const std::vector<Transaction>& transactions);
    static std::optional<DateRange> dateRange(const std::vector<Transaction>& transactions);
};

} // namespace Ingest
} // namespace FIN
