// EN: Anomaly detection over debits: high amounts per merchant, same-day duplicates and spending spikes.
// FR: Détection d'anomalies sur les débits : montants élevés par marchand, doublons du jour et pics de dépenses.

#pragma once

#include "infrastructure/config/analysis_settings.hpp"
#include "model/analytics_types.hpp"

#include <vector>

namespace FIN {
namespace Analytics {

class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalySettings settings = AnomalySettings());

    // EN: High-amount, duplicate and spike passes concatenated in that order. A transaction may
    //     appear under several types.
    // FR: Passes montant élevé, doublon et pic concaténées dans cet ordre. Une transaction peut
    //     apparaître sous plusieurs types.
    std::vector<Anomaly> detect(const std::vector<Transaction>& transactions) const;

    std::vector<Anomaly> detectHighAmounts(const std::vector<Transaction>& transactions) const;
    std::vector<Anomaly> detectDuplicates(const std::vector<Transaction>& transactions) const;
    std::vector<Anomaly> detectSpendingSpikes(const std::vector<Transaction>& transactions) const;

    // EN: Debits sharing (amount at the configured precision, merchant, day); groups of two or more.
    // FR: Débits partageant (montant à la précision configurée, marchand, jour) ; groupes d'au moins deux.
    std::vector<std::vector<Transaction>> findDuplicateGroups(const std::vector<Transaction>& transactions) const;

    // EN: > 5 high, > 3 medium, otherwise low.
    // FR: > 5 élevé, > 3 moyen, sinon faible.
    static Severity severityForRatio(double ratio);

private:
    AnomalySettings settings_;
};

} // namespace Analytics
} // namespace FIN
