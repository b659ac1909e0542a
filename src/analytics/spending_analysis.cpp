#include "analytics/spending_analysis.hpp"
#include "categorize/merchant_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace FIN {
namespace Analytics {

namespace {

constexpr const char* kUnknownMerchant = "Unknown Merchant";

bool inWindow(const Transaction& txn, const std::optional<DateRange>& range) {
    return txn.isDebit() && (!range || range->contains(txn.date));
}

} // namespace

SpendingBreakdown calculateSpendingBreakdown(const std::vector<Transaction>& transactions,
                                             const std::vector<Tag>& tags,
                                             const std::optional<DateRange>& range) {
    std::vector<Transaction> debits;
    for (const auto& txn : transactions) {
        if (inWindow(txn, range)) {
            debits.push_back(txn);
        }
    }

    SpendingBreakdown breakdown;
    breakdown.by_tag = spendingByTag(debits, tags);
    breakdown.by_merchant = spendingByMerchant(debits);
    breakdown.by_channel = spendingByChannel(debits);
    breakdown.by_day_of_week = spendingByDayOfWeek(debits);
    breakdown.by_time_of_month = spendingByTimeOfMonth(debits);
    return breakdown;
}

std::map<std::string, double> spendingByTag(const std::vector<Transaction>& transactions,
                                            const std::vector<Tag>& tags) {
    std::map<std::string, double> spending;
    for (const auto& tag : tags) {
        spending[tag.id] = 0.0;
    }
    for (const auto& txn : transactions) {
        if (!txn.isDebit()) {
            continue;
        }
        for (const auto& tag_id : txn.tag_ids) {
            spending[tag_id] += txn.amount;
        }
    }
    return spending;
}

std::vector<MerchantSpend> spendingByMerchant(const std::vector<Transaction>& transactions) {
    // EN: Entries keep first-seen order so the stable sort breaks ties by it.
    // FR: Les entrées gardent l'ordre d'apparition, le tri stable départage ainsi les égalités.
    std::vector<MerchantSpend> merchants;
    std::unordered_map<std::string, size_t> index;

    for (const auto& txn : transactions) {
        if (!txn.isDebit()) {
            continue;
        }
        std::string name = Categorize::extractMerchantName(txn.narrative).value_or(kUnknownMerchant);
        auto it = index.find(name);
        if (it == index.end()) {
            index.emplace(name, merchants.size());
            merchants.push_back(MerchantSpend{name, txn.amount, 1, txn.amount, txn.date});
            continue;
        }
        MerchantSpend& entry = merchants[it->second];
        entry.total_amount += txn.amount;
        entry.transaction_count++;
        entry.average_amount = entry.total_amount / static_cast<double>(entry.transaction_count);
        entry.last_transaction = std::max(entry.last_transaction, txn.date);
    }

    std::stable_sort(merchants.begin(), merchants.end(), [](const MerchantSpend& a, const MerchantSpend& b) {
        return a.total_amount > b.total_amount;
    });
    return merchants;
}

std::vector<MerchantSpend> topMerchants(const std::vector<Transaction>& transactions, size_t limit) {
    std::vector<MerchantSpend> merchants = spendingByMerchant(transactions);
    if (merchants.size() > limit) {
        merchants.resize(limit);
    }
    return merchants;
}

std::map<PaymentChannel, double> spendingByChannel(const std::vector<Transaction>& transactions) {
    std::map<PaymentChannel, double> spending;
    for (const auto& txn : transactions) {
        if (txn.isDebit()) {
            spending[txn.channel] += txn.amount;
        }
    }
    return spending;
}

std::array<double, 7> spendingByDayOfWeek(const std::vector<Transaction>& transactions) {
    std::array<double, 7> spending{};
    for (const auto& txn : transactions) {
        if (txn.isDebit()) {
            spending[static_cast<size_t>(txn.date.dayOfWeek())] += txn.amount;
        }
    }
    return spending;
}

TimeOfMonthSpend spendingByTimeOfMonth(const std::vector<Transaction>& transactions) {
    TimeOfMonthSpend spending;
    for (const auto& txn : transactions) {
        if (!txn.isDebit()) {
            continue;
        }
        if (txn.date.day <= 10) {
            spending.early += txn.amount;
        } else if (txn.date.day <= 20) {
            spending.mid += txn.amount;
        } else {
            spending.late += txn.amount;
        }
    }
    return spending;
}

std::map<std::string, double> spendingPercentages(const std::map<std::string, double>& by_tag) {
    double total = 0.0;
    for (const auto& [_, amount] : by_tag) {
        total += amount;
    }
    std::map<std::string, double> percentages;
    if (total == 0.0) {
        return percentages;
    }
    for (const auto& [tag_id, amount] : by_tag) {
        percentages[tag_id] = amount / total * 100.0;
    }
    return percentages;
}

double spendingDiversity(const std::map<std::string, double>& by_tag) {
    // EN: Normalised Shannon entropy over the non-zero tags.
    // FR: Entropie de Shannon normalisée sur les tags non nuls.
    std::vector<double> amounts;
    double total = 0.0;
    for (const auto& [_, amount] : by_tag) {
        if (amount > 0.0) {
            amounts.push_back(amount);
            total += amount;
        }
    }
    if (amounts.size() <= 1 || total == 0.0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (double amount : amounts) {
        double share = amount / total;
        entropy -= share * std::log2(share);
    }
    return entropy / std::log2(static_cast<double>(amounts.size())) * 100.0;
}

std::string dayOfWeekName(int day) {
    static const char* const kNames[] = {"Sunday", "Monday", "Tuesday", "Wednesday",
                                         "Thursday", "Friday", "Saturday"};
    return (day >= 0 && day < 7) ? kNames[day] : "";
}

DaySpend highestSpendingDay(const std::vector<Transaction>& transactions) {
    std::array<double, 7> spending = spendingByDayOfWeek(transactions);
    // EN: First maximum wins, Sunday first.
    // FR: Le premier maximum l'emporte, dimanche en tête.
    auto best = std::max_element(spending.begin(), spending.end());
    return DaySpend{dayOfWeekName(static_cast<int>(best - spending.begin())), *best};
}

std::vector<MonthlyAmount> categorySpendingTrend(const std::vector<Transaction>& transactions,
                                                 const std::string& tag_id) {
    std::map<std::string, double> monthly;
    for (const auto& txn : transactions) {
        if (txn.isDebit() && std::find(txn.tag_ids.begin(), txn.tag_ids.end(), tag_id) != txn.tag_ids.end()) {
            monthly[txn.date.toMonthString()] += txn.amount;
        }
    }

    std::vector<MonthlyAmount> trend;
    trend.reserve(monthly.size());
    for (const auto& [month, amount] : monthly) {
        trend.push_back(MonthlyAmount{month, amount});
    }
    return trend;
}

} // namespace Analytics
} // namespace FIN
