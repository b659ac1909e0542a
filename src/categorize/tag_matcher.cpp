#include "categorize/tag_matcher.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace FIN {
namespace Categorize {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool hasTag(const Transaction& txn, const std::string& tag_id) {
    return std::find(txn.tag_ids.begin(), txn.tag_ids.end(), tag_id) != txn.tag_ids.end();
}

} // namespace

CategorizationResult categorizeTransaction(const Transaction& txn, const std::vector<Tag>& tags) {
    CategorizationResult result;
    result.transaction_id = txn.id;
    result.is_manual_override = txn.manual_tag_override;

    const std::string details = toLower(txn.narrative);

    for (const auto& tag : tags) {
        for (const auto& keyword : tag.keywords) {
            std::string needle = toLower(keyword);
            if (needle.empty()) {
                continue;
            }
            size_t position = details.find(needle);
            if (position != std::string::npos) {
                result.matched_tags.push_back(TagMatch{tag.id, keyword, position});
                break;
            }
        }
    }
    return result;
}

std::vector<TagMatch> matchKeywordsToTags(const std::vector<std::string>& keywords, const std::vector<Tag>& tags) {
    std::vector<std::string> lowered;
    lowered.reserve(keywords.size());
    for (const auto& keyword : keywords) {
        lowered.push_back(toLower(keyword));
    }

    std::vector<TagMatch> matches;
    for (const auto& tag : tags) {
        bool matched = false;
        for (const auto& tag_keyword : tag.keywords) {
            std::string needle = toLower(tag_keyword);
            if (needle.empty()) {
                continue;
            }
            for (size_t i = 0; i < lowered.size(); ++i) {
                if (lowered[i].empty()) {
                    continue;
                }
                if (lowered[i].find(needle) != std::string::npos || needle.find(lowered[i]) != std::string::npos) {
                    matches.push_back(TagMatch{tag.id, tag_keyword, i});
                    matched = true;
                    break;
                }
            }
            if (matched) {
                break;
            }
        }
    }
    return matches;
}

std::vector<Transaction> recategorizeTransactions(const std::vector<Transaction>& transactions,
                                                  const std::vector<Tag>& tags) {
    std::vector<Transaction> result;
    result.reserve(transactions.size());
    size_t tagged = 0;
    size_t preserved = 0;

    for (const auto& txn : transactions) {
        if (txn.manual_tag_override) {
            result.push_back(txn);
            ++preserved;
            continue;
        }

        Transaction updated = txn;
        updated.tag_ids.clear();
        std::unordered_set<std::string> seen;
        for (const auto& match : categorizeTransaction(txn, tags).matched_tags) {
            if (seen.insert(match.tag_id).second) {
                updated.tag_ids.push_back(match.tag_id);
            }
        }
        if (!updated.tag_ids.empty()) {
            ++tagged;
        }
        result.push_back(std::move(updated));
    }

    LOG_DEBUG("categorize", "Recategorized " + std::to_string(transactions.size()) + " transactions: " +
              std::to_string(tagged) + " tagged, " + std::to_string(preserved) + " manual overrides kept");
    return result;
}

std::vector<Transaction> findTransactionsByTag(const std::vector<Transaction>& transactions,
                                               const std::string& tag_id) {
    std::vector<Transaction> result;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(result),
                 [&tag_id](const Transaction& txn) { return hasTag(txn, tag_id); });
    return result;
}

std::vector<Transaction> findTransactionsByTags(const std::vector<Transaction>& transactions,
                                                const std::vector<std::string>& tag_ids) {
    std::unordered_set<std::string> wanted(tag_ids.begin(), tag_ids.end());
    std::vector<Transaction> result;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(result),
                 [&wanted](const Transaction& txn) {
                     return std::any_of(txn.tag_ids.begin(), txn.tag_ids.end(),
                                        [&wanted](const std::string& id) { return wanted.count(id) > 0; });
                 });
    return result;
}

std::vector<Transaction> findUntaggedTransactions(const std::vector<Transaction>& transactions) {
    std::vector<Transaction> result;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(result),
                 [](const Transaction& txn) { return !txn.manual_tag_override && txn.tag_ids.empty(); });
    return result;
}

} // namespace Categorize
} // namespace FIN
