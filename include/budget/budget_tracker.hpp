// EN: Per-tag budgets: spend against the limit of the period containing a reference date, and limit suggestions.
// FR: Budgets par tag : dépense face à la limite de la période contenant une date de référence, et suggestions.

#pragma once

#include "model/transaction.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace FIN {
namespace Budgeting {

enum class BudgetState {
    ON_TRACK,
    WARNING,  // EN: at least 80% used / FR: au moins 80% consommés
    EXCEEDED  // EN: at least 100% used / FR: au moins 100% consommés
};

std::string budgetStateToString(BudgetState state);

struct BudgetStatus {
    Budget budget;
    DateRange window;
    double current_spend{0.0};
    double percent_used{0.0};
    double remaining{0.0};
    double projected_spend{0.0};
    BudgetState state{BudgetState::ON_TRACK};
};

// EN: Throws std::invalid_argument for an empty tag id or a non-positive limit.
// FR: Lève std::invalid_argument si le tag est vide ou la limite non positive.
Budget createBudget(const std::string& tag_id, double limit, BudgetPeriod period,
                    Timestamp now = std::chrono::system_clock::now());

// EN: Calendar month (monthly) or calendar year (yearly) containing as_of.
// FR: Mois civil (mensuel) ou année civile (annuel) contenant as_of.
DateRange budgetWindow(const Budget& budget, const CalendarDate& as_of);

// EN: Spend is the sum of tagged debits from the window start through as_of. The projection
//     extrapolates the elapsed-day pace to the whole window.
// FR: La dépense cumule les débits tagués du début de la fenêtre jusqu'à as_of. La projection
//     extrapole le rythme des jours écoulés à toute la fenêtre.
BudgetStatus budgetStatus(const Budget& budget, const std::vector<Transaction>& transactions,
                          const CalendarDate& as_of);

std::vector<BudgetStatus> budgetStatuses(const std::vector<Budget>& budgets,
                                         const std::vector<Transaction>& transactions,
                                         const CalendarDate& as_of);

// EN: Mean of the non-zero monthly spends for tag_id over the `months` calendar months ending with as_of's month.
// FR: Moyenne des dépenses mensuelles non nulles du tag sur les `months` mois se terminant au mois d'as_of.
double averageMonthlySpending(const std::string& tag_id, const std::vector<Transaction>& transactions,
                              const CalendarDate& as_of, int months = 3);

// EN: One monthly budget per tag that has none yet and averages more than 100 a month:
//     the average plus 10%, rounded up to the next hundred.
// FR: Un budget mensuel par tag qui n'en a pas et dépasse 100 par mois en moyenne :
//     la moyenne plus 10%, arrondie à la centaine supérieure.
std::vector<Budget> suggestBudgets(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                                   const std::vector<Budget>& existing, const CalendarDate& as_of,
                                   Timestamp now = std::chrono::system_clock::now());

void to_json(nlohmann::json& j, const BudgetStatus& status);

} // namespace Budgeting
} // namespace FIN
