#include "ingest/transaction_merger.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace FIN {
namespace Ingest {

std::string TransactionMerger::compositeKey(const Transaction& txn) {
    std::ostringstream key_stream;
    key_stream << txn.date.toIsoString() << "|" << txn.reference;
    return key_stream.str();
}

bool TransactionMerger::areDuplicates(const Transaction& a, const Transaction& b) {
    return a.date == b.date && a.reference == b.reference;
}

std::vector<Transaction> TransactionMerger::deduplicate(const std::vector<Transaction>& transactions) {
    std::unordered_set<std::string> seen;
    std::vector<Transaction> unique;
    unique.reserve(transactions.size());

    for (const auto& txn : transactions) {
        if (seen.insert(compositeKey(txn)).second) {
            unique.push_back(txn);
        }
    }
    return unique;
}

MergeResult TransactionMerger::merge(const std::vector<Transaction>& existing,
                                     const std::vector<Transaction>& incoming) {
    std::vector<Transaction> combined;
    combined.reserve(existing.size() + incoming.size());
    combined.insert(combined.end(), existing.begin(), existing.end());
    combined.insert(combined.end(), incoming.begin(), incoming.end());

    MergeResult result;
    result.merged = deduplicate(combined);
    result.duplicates_removed = combined.size() - result.merged.size();
    result.new_transactions = result.merged.size() >= existing.size() ?
        result.merged.size() - existing.size() : 0;

    auto existing_range = dateRange(existing);
    auto incoming_range = dateRange(incoming);
    if (existing_range && incoming_range) {
        CalendarDate start = std::max(existing_range->start, incoming_range->start);
        CalendarDate end = std::min(existing_range->end, incoming_range->end);
        if (start <= end) {
            result.overlapping_periods.push_back(DateRange{start, end});
        }
    }

    LOG_DEBUG_META("merger", "Merged transaction sets", (Logger::Metadata{
        {"existing", std::to_string(existing.size())},
        {"incoming", std::to_string(incoming.size())},
        {"duplicates_removed", std::to_string(result.duplicates_removed)},
        {"new_transactions", std::to_string(result.new_transactions)}
    }));
    return result;
}

std::vector<std::vector<Transaction>> TransactionMerger::findDuplicateGroups(
    const std::vector<Transaction>& transactions) {
    std::unordered_map<std::string, size_t> key_to_group;
    std::vector<std::vector<Transaction>> groups;

    for (const auto& txn : transactions) {
        std::string key = compositeKey(txn);
        auto it = key_to_group.find(key);
        if (it == key_to_group.end()) {
            key_to_group.emplace(key, groups.size());
            groups.push_back({txn});
        } else {
            groups[it->second].push_back(txn);
        }
    }

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const std::vector<Transaction>& g) { return g.size() < 2; }),
                 groups.end());
    return groups;
}

std::vector<Transaction> TransactionMerger::sortByDateDescending(const std::vector<Transaction>& transactions) {
    std::vector<Transaction> sorted = transactions;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Transaction& a, const Transaction& b) { return b.date < a.date; });
    return sorted;
}

std::optional<DateRange> TransactionMerger::dateRange(const std::vector<Transaction>& transactions) {
    if (transactions.empty()) {
        return std::nullopt;
    }
    DateRange range{transactions.front().date, transactions.front().date};
    for (const auto& txn : transactions) {
        range.start = std::min(range.start, txn.date);
        range.end = std::max(range.end, txn.date);
    }
    return range;
}

} // namespace Ingest
} // namespace FIN
