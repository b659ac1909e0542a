// EN: Inflow / outflow totals, daily averages and surplus / deficit day counts.
// FR: Totaux d'entrées / sorties, moyennes journalières et nombre de jours excédentaires / déficitaires.

#pragma once

#include "model/analytics_types.hpp"

#include <optional>
#include <vector>

namespace FIN {
namespace Analytics {

// EN: Daily averages divide by the number of distinct days carrying a transaction (at least 1).
// FR: Les moyennes journalières divisent par le nombre de jours distincts ayant une transaction (au moins 1).
CashFlowMetrics calculateCashFlow(const std::vector<Transaction>& transactions,
                                  const std::optional<DateRange>& range = std::nullopt);

// EN: net / inflow * 100, 0 when there is no inflow.
// FR: net / entrées * 100, 0 s'il n'y a pas d'entrée.
double savingsRate(const CashFlowMetrics& metrics);

} // namespace Analytics
} // namespace FIN
