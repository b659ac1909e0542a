// EN: 0-100 financial health score from savings rate, budget adherence, spending diversity and emergency fund.
// FR: Score de santé financière 0-100 : taux d'épargne, respect des budgets, diversité des dépenses, épargne de précaution.

#pragma once

#include "model/analytics_types.hpp"

#include <vector>

namespace FIN {
namespace Analytics {

// EN: Component weights: savings 0.30, budgets 0.25, diversity 0.25, emergency fund 0.20.
//     Budgets are evaluated over their period containing as_of. Empty input scores 0.
// FR: Poids : épargne 0,30, budgets 0,25, diversité 0,25, précaution 0,20.
//     Les budgets sont évalués sur leur période contenant as_of. Une entrée vide vaut 0.
HealthScore calculateHealthScore(const std::vector<Transaction>& transactions, const std::vector<Budget>& budgets,
                                 const CalendarDate& as_of);

HealthScoreComponent savingsRateComponent(const std::vector<Transaction>& transactions);
HealthScoreComponent budgetAdherenceComponent(const std::vector<Transaction>& transactions,
                                              const std::vector<Budget>& budgets, const CalendarDate& as_of);
HealthScoreComponent spendingDiversityComponent(const std::vector<Transaction>& transactions);
HealthScoreComponent emergencyFundComponent(const std::vector<Transaction>& transactions);

HealthTrend trendForScore(int score);

} // namespace Analytics
} // namespace FIN
