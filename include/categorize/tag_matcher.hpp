// EN: Keyword-based tag assignment. Manually overridden transactions are never re-tagged.
// FR: Attribution de tags par mots-clés. Les transactions modifiées manuellement ne sont jamais retaguées.

#pragma once

#include "model/transaction.hpp"

#include <string>
#include <vector>

namespace FIN {
namespace Categorize {

struct TagMatch {
    std::string tag_id;
    std::string keyword;
    size_t match_position{0};
};

struct CategorizationResult {
    std::string transaction_id;
    std::vector<TagMatch> matched_tags;
    bool is_manual_override{false};
};

// EN: Narrative containment, first matching keyword per tag, tags in catalogue order.
// FR: Inclusion dans le libellé, premier mot-clé trouvé par tag, tags dans l'ordre du catalogue.
CategorizationResult categorizeTransaction(const Transaction& txn, const std::vector<Tag>& tags);

// EN: Keyword-bag matching; a bag entry and a tag keyword match when either contains the other.
//     match_position is the index in the bag.
// FR: Appariement sur le sac de mots-clés ; correspondance si l'un contient l'autre.
//     match_position est l'index dans le sac.
std::vector<TagMatch> matchKeywordsToTags(const std::vector<std::string>& keywords, const std::vector<Tag>& tags);

// EN: Re-derive tag_ids from scratch for every transaction without manual override.
// FR: Recalcule tag_ids depuis zéro pour chaque transaction sans forçage manuel.
std::vector<Transaction> recategorizeTransactions(const std::vector<Transaction>& transactions,
                                                  const std::vector<Tag>& tags);

std::vector<Transaction> findTransactionsByTag(const std::vector<Transaction>& transactions,
                                               const std::string& tag_id);
std::vector<Transaction> findTransactionsByTags(const std::vector<Transaction>& transactions,
                                                const std::vector<std::string>& tag_ids);
std::vector<Transaction> findUntaggedTransactions(const std::vector<Transaction>& transactions);

} // namespace Categorize
} // namespace FIN
