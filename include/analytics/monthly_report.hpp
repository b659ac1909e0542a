// EN: One calendar month summarised: totals, balance, cash flow, spending, budgets, health and anomalies.
// FR: Un mois civil résumé : totaux, solde, trésorerie, dépenses, budgets, santé et anomalies.

#pragma once

#include "budget/budget_tracker.hpp"
#include "infrastructure/config/analysis_settings.hpp"
#include "model/analytics_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace FIN {
namespace Analytics {

struct MonthlySummary {
    double total_income{0.0};
    double total_expenses{0.0};
    double net_savings{0.0};
    double savings_rate{0.0};
};

struct MonthlyReport {
    std::string period; // YYYY-MM
    Timestamp generated_at{};
    MonthlySummary summary;
    BalanceMetrics balance;
    CashFlowMetrics cash_flow;
    std::map<std::string, double> spending_by_tag;
    std::vector<MerchantSpend> top_merchants;
    std::vector<Budgeting::BudgetStatus> budget_performance;
    HealthScore health;
    std::vector<Anomaly> anomalies;
    std::vector<std::string> recommendations;
};

// EN: Metrics use the month's transactions only. Budgets are evaluated at the last day of the month
//     against the whole history, so yearly budgets see the year to date.
// FR: Les métriques n'utilisent que les transactions du mois. Les budgets sont évalués au dernier jour
//     du mois sur tout l'historique, les budgets annuels voient donc l'année en cours.
MonthlyReport generateMonthlyReport(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                                    const std::vector<Budget>& budgets, int year, int month,
                                    const AnomalySettings& anomaly_settings = AnomalySettings(),
                                    Timestamp now = std::chrono::system_clock::now());

// EN: Distinct YYYY-MM months holding at least one transaction, oldest first.
// FR: Mois YYYY-MM distincts ayant au moins une transaction, du plus ancien au plus récent.
std::vector<std::string> availableMonths(const std::vector<Transaction>& transactions);

void to_json(nlohmann::json& j, const MonthlyReport& report);

} // namespace Analytics
} // namespace FIN
