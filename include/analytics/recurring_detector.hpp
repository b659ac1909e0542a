// EN: Recurring payment detection: merchant grouping, amount band filtering and interval classification.
// FR: Détection des paiements récurrents : regroupement par marchand, filtrage des montants et
//     classification des intervalles.

#pragma once

#include "infrastructure/config/analysis_settings.hpp"
#include "model/analytics_types.hpp"

#include <optional>
#include <vector>

namespace FIN {
namespace Analytics {

// EN: Frequency whose band contains the mean gap (weekly 4-10, monthly 23-37, quarterly 75-105,
//     yearly 335-395 days).
// FR: Fréquence dont la bande contient l'écart moyen.
std::optional<Frequency> classifyInterval(double mean_gap_days);

// EN: round(clamp(100 - mean(|gap - ideal|) / (0.3 * ideal) * 100, 0, 100)).
// FR: round(clamp(100 - moyenne(|écart - idéal|) / (0.3 * idéal) * 100, 0, 100)).
int intervalConfidence(const std::vector<int64_t>& gaps, Frequency frequency);

RecurringCategory classifyRecurringCategory(const std::string& merchant, double amount);

// EN: Debits only. Output ordered by merchant. Recomputed from scratch on every call.
// FR: Débits uniquement. Résultat trié par marchand. Recalculé entièrement à chaque appel.
std::vector<RecurringPayment> detectRecurringPayments(const std::vector<Transaction>& transactions,
                                                      const RecurringSettings& settings = RecurringSettings());

} // namespace Analytics
} // namespace FIN
