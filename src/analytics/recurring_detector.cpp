#include "analytics/recurring_detector.hpp"
#include "categorize/merchant_extractor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <map>

namespace FIN {
namespace Analytics {

namespace {

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double debitAmount(const Transaction& txn) {
    return txn.debit ? std::fabs(*txn.debit) : txn.amount;
}

std::optional<RecurringPayment> analyzeGroup(const std::string& merchant, std::vector<Transaction> members,
                                             const RecurringSettings& settings) {
    std::stable_sort(members.begin(), members.end(),
                     [](const Transaction& a, const Transaction& b) { return a.date < b.date; });

    double sum = 0.0;
    for (const auto& txn : members) {
        sum += debitAmount(txn);
    }
    double mean = sum / static_cast<double>(members.size());
    if (mean == 0.0) {
        return std::nullopt;
    }

    // EN: Drop members too far from the group mean.
    // FR: Écarte les membres trop éloignés de la moyenne du groupe.
    std::vector<const Transaction*> survivors;
    for (const auto& txn : members) {
        if (std::fabs(debitAmount(txn) - mean) / mean <= settings.amount_tolerance) {
            survivors.push_back(&txn);
        }
    }
    size_t required = static_cast<size_t>(std::max(2, settings.min_occurrences));
    if (survivors.size() < required) {
        return std::nullopt;
    }

    // EN: Gaps between consecutive survivors decide the frequency.
    // FR: Les écarts entre survivants consécutifs décident de la fréquence.
    std::vector<int64_t> gaps;
    double gap_sum = 0.0;
    double survivor_sum = 0.0;
    for (size_t i = 0; i < survivors.size(); ++i) {
        survivor_sum += debitAmount(*survivors[i]);
        if (i > 0) {
            int64_t gap = survivors[i - 1]->date.daysUntil(survivors[i]->date);
            gaps.push_back(gap);
            gap_sum += static_cast<double>(gap);
        }
    }

    std::optional<Frequency> frequency = classifyInterval(gap_sum / static_cast<double>(gaps.size()));
    if (!frequency) {
        return std::nullopt;
    }

    RecurringPayment payment;
    payment.merchant = merchant;
    payment.amount = survivor_sum / static_cast<double>(survivors.size());
    payment.frequency = *frequency;
    payment.next_expected_date = survivors.back()->date.addDays(frequencyIdealDays(*frequency));
    payment.category = classifyRecurringCategory(merchant, payment.amount);
    payment.confidence = intervalConfidence(gaps, *frequency);
    return payment;
}

} // namespace

std::optional<Frequency> classifyInterval(double mean_gap_days) {
    if (mean_gap_days >= 4 && mean_gap_days <= 10) return Frequency::WEEKLY;
    if (mean_gap_days >= 23 && mean_gap_days <= 37) return Frequency::MONTHLY;
    if (mean_gap_days >= 75 && mean_gap_days <= 105) return Frequency::QUARTERLY;
    if (mean_gap_days >= 335 && mean_gap_days <= 395) return Frequency::YEARLY;
    return std::nullopt;
}

int intervalConfidence(const std::vector<int64_t>& gaps, Frequency frequency) {
    if (gaps.empty()) {
        return 0;
    }
    const double ideal = frequencyIdealDays(frequency);
    double deviation = 0.0;
    for (int64_t gap : gaps) {
        deviation += std::fabs(static_cast<double>(gap) - ideal);
    }
    deviation /= static_cast<double>(gaps.size());

    double confidence = 100.0 - deviation / (0.3 * ideal) * 100.0;
    return static_cast<int>(std::lround(std::clamp(confidence, 0.0, 100.0)));
}

RecurringCategory classifyRecurringCategory(const std::string& merchant, double amount) {
    std::string lower = merchant;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (containsAny(lower, {"netflix", "spotify", "prime", "subscription", "membership"})) {
        return RecurringCategory::SUBSCRIPTION;
    }
    if (containsAny(lower, {"emi", "loan", "finance", "bajaj"}) || amount > 5000.0) {
        return RecurringCategory::INSTALLMENT;
    }
    if (containsAny(lower, {"electric", "water", "gas", "internet", "mobile", "broadband", "utility"})) {
        return RecurringCategory::UTILITY;
    }
    return RecurringCategory::OTHER;
}

std::vector<RecurringPayment> detectRecurringPayments(const std::vector<Transaction>& transactions,
                                                      const RecurringSettings& settings) {
    // EN: Debits grouped by merchant identifier, ordered by key.
    // FR: Débits groupés par identifiant de marchand, triés par clé.
    std::map<std::string, std::vector<Transaction>> groups;
    size_t debit_count = 0;
    for (const auto& txn : transactions) {
        if (txn.isDebit()) {
            groups[Categorize::merchantIdentifier(txn.narrative)].push_back(txn);
            ++debit_count;
        }
    }

    std::vector<RecurringPayment> result;
    if (debit_count < 2) {
        return result;
    }

    for (auto& [merchant, members] : groups) {
        if (members.size() < 2) {
            continue;
        }
        if (auto payment = analyzeGroup(merchant, std::move(members), settings)) {
            result.push_back(std::move(*payment));
        }
    }

    LOG_DEBUG("recurring", "Detected " + std::to_string(result.size()) + " recurring payments across " +
              std::to_string(groups.size()) + " merchants");
    return result;
}

} // namespace Analytics
} // namespace FIN
