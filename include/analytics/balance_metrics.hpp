// EN: Balance statistics derived from running balances on statement rows.
// FR: Statistiques de solde dérivées des soldes courants des lignes du relevé.

#pragma once

#include "model/analytics_types.hpp"

#include <optional>
#include <vector>

namespace FIN {
namespace Analytics {

// EN: Empty input (after the optional range filter) yields all zeros and no period.
// FR: Une entrée vide (après filtrage optionnel) donne des zéros et aucune période.
BalanceMetrics calculateBalanceMetrics(const std::vector<Transaction>& transactions,
                                       const std::optional<DateRange>& range = std::nullopt);

// EN: Balance of the latest-dated transaction; the last one in input order wins among equal dates.
// FR: Solde de la transaction la plus récente ; la dernière dans l'ordre d'entrée l'emporte à date égale.
double currentBalance(const std::vector<Transaction>& transactions);

std::optional<double> balanceAt(const std::vector<Transaction>& transactions, const CalendarDate& date);
BalanceChange balanceChange(const std::vector<Transaction>& transactions, const DateRange& range);
std::vector<BalancePoint> balanceHistory(const std::vector<Transaction>& transactions,
                                         const std::optional<DateRange>& range = std::nullopt);

// EN: Days whose closing balance (last transaction of the day in input order) is below threshold.
// FR: Jours dont le solde de clôture (dernière transaction du jour) est sous le seuil.
size_t countDaysBelow(const std::vector<Transaction>& transactions, double threshold,
                      const std::optional<DateRange>& range = std::nullopt);

} // namespace Analytics
} // namespace FIN
