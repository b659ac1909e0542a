#include "analytics/anomaly_detector.hpp"
#include "categorize/merchant_extractor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <unordered_map>
#include <utility>

namespace FIN {
namespace Analytics {

namespace {

std::string formatAmount(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

std::string formatRatio(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

std::vector<Transaction> debitsOf(const std::vector<Transaction>& transactions) {
    std::vector<Transaction> debits;
    for (const auto& txn : transactions) {
        if (txn.isDebit()) {
            debits.push_back(txn);
        }
    }
    return debits;
}

} // namespace

AnomalyDetector::AnomalyDetector(AnomalySettings settings) : settings_(std::move(settings)) {}

Severity AnomalyDetector::severityForRatio(double ratio) {
    if (ratio > 5.0) return Severity::HIGH;
    if (ratio > 3.0) return Severity::MEDIUM;
    return Severity::LOW;
}

std::vector<Anomaly> AnomalyDetector::detect(const std::vector<Transaction>& transactions) const {
    // EN: Three independent passes, concatenated in a fixed order.
    // FR: Trois passes indépendantes, concaténées dans un ordre fixe.
    std::vector<Anomaly> anomalies = detectHighAmounts(transactions);
    std::vector<Anomaly> duplicates = detectDuplicates(transactions);
    std::vector<Anomaly> spikes = detectSpendingSpikes(transactions);

    anomalies.insert(anomalies.end(), duplicates.begin(), duplicates.end());
    anomalies.insert(anomalies.end(), spikes.begin(), spikes.end());

    LOG_DEBUG_META("anomaly", "Anomaly detection finished", (Logger::Metadata{
        {"high_amount", std::to_string(anomalies.size() - duplicates.size() - spikes.size())},
        {"duplicate", std::to_string(duplicates.size())},
        {"spending_spike", std::to_string(spikes.size())}
    }));
    return anomalies;
}

std::vector<Anomaly> AnomalyDetector::detectHighAmounts(const std::vector<Transaction>& transactions) const {
    std::vector<Transaction> debits = debitsOf(transactions);

    struct GroupStats {
        size_t count{0};
        double total{0.0};
    };
    // EN: Mean debit per merchant identifier.
    // FR: Débit moyen par identifiant de marchand.
    std::vector<std::string> merchants;
    merchants.reserve(debits.size());
    std::unordered_map<std::string, GroupStats> stats;
    for (const auto& txn : debits) {
        merchants.push_back(Categorize::merchantIdentifier(txn.narrative));
        GroupStats& group = stats[merchants.back()];
        group.count++;
        group.total += txn.amount;
    }

    // EN: A lone payment has no baseline to compare against.
    // FR: Un paiement isolé n'a pas de référence de comparaison.
    std::vector<Anomaly> anomalies;
    for (size_t i = 0; i < debits.size(); ++i) {
        const GroupStats& group = stats[merchants[i]];
        if (group.count < 2) {
            continue;
        }
        double mean = group.total / static_cast<double>(group.count);
        if (mean <= 0.0) {
            continue;
        }
        const Transaction& txn = debits[i];
        if (txn.amount > settings_.high_amount_multiplier * mean) {
            double ratio = txn.amount / mean;
            anomalies.push_back(Anomaly{
                txn, AnomalyType::HIGH_AMOUNT, severityForRatio(ratio),
                "Unusually high amount of " + formatAmount(txn.amount) + " at " + merchants[i] + " (" +
                    formatRatio(ratio) + "x the usual " + formatAmount(mean) + ")"});
        }
    }
    return anomalies;
}

std::vector<std::vector<Transaction>> AnomalyDetector::findDuplicateGroups(
    const std::vector<Transaction>& transactions) const {
    const int decimals = std::max(0, settings_.duplicate_amount_decimals);

    std::unordered_map<std::string, size_t> key_to_group;
    std::vector<std::vector<Transaction>> groups;

    // EN: Group debits by rounded amount, merchant and day, keeping first-seen order.
    // FR: Regroupe les débits par montant arrondi, marchand et jour, dans l'ordre d'apparition.
    for (const auto& txn : transactions) {
        if (!txn.isDebit()) {
            continue;
        }
        char amount[64];
        std::snprintf(amount, sizeof(amount), "%.*f", decimals, txn.amount);
        std::string key = std::string(amount) + "|" + Categorize::merchantIdentifier(txn.narrative) + "|" +
                          txn.date.toIsoString();

        auto it = key_to_group.find(key);
        if (it == key_to_group.end()) {
            key_to_group.emplace(key, groups.size());
            groups.push_back({txn});
        } else {
            groups[it->second].push_back(txn);
        }
    }

    std::vector<std::vector<Transaction>> duplicates;
    for (auto& group : groups) {
        if (group.size() >= 2) {
            duplicates.push_back(std::move(group));
        }
    }
    return duplicates;
}

std::vector<Anomaly> AnomalyDetector::detectDuplicates(const std::vector<Transaction>& transactions) const {
    std::vector<Anomaly> anomalies;
    for (const auto& group : findDuplicateGroups(transactions)) {
        for (const auto& txn : group) {
            anomalies.push_back(Anomaly{
                txn, AnomalyType::DUPLICATE, Severity::MEDIUM,
                "Possible duplicate: " + std::to_string(group.size()) + " payments of " +
                    formatAmount(txn.amount) + " on " + txn.date.toIsoString()});
        }
    }
    return anomalies;
}

std::vector<Anomaly> AnomalyDetector::detectSpendingSpikes(const std::vector<Transaction>& transactions) const {
    std::vector<Transaction> debits = debitsOf(transactions);

    // EN: Days without debits do not count toward the average.
    // FR: Les jours sans débit ne comptent pas dans la moyenne.
    std::map<int64_t, double> daily_totals;
    for (const auto& txn : debits) {
        daily_totals[txn.date.toDayNumber()] += txn.amount;
    }
    std::vector<Anomaly> anomalies;
    if (daily_totals.empty()) {
        return anomalies;
    }

    double sum = 0.0;
    for (const auto& [_, total] : daily_totals) {
        sum += total;
    }
    double average = sum / static_cast<double>(daily_totals.size());
    if (average <= 0.0) {
        return anomalies;
    }

    // EN: Every debit of a spiking day is reported.
    // FR: Chaque débit d'un jour en pic est signalé.
    for (const auto& txn : debits) {
        double day_total = daily_totals[txn.date.toDayNumber()];
        if (day_total > settings_.spike_multiplier * average) {
            double ratio = day_total / average;
            anomalies.push_back(Anomaly{
                txn, AnomalyType::SPENDING_SPIKE, severityForRatio(ratio),
                "Spending spike on " + txn.date.toIsoString() + ": " + formatAmount(day_total) +
                    " spent (" + formatRatio(ratio) + "x the daily average of " + formatAmount(average) + ")"});
        }
    }
    return anomalies;
}

} // namespace Analytics
} // namespace FIN
