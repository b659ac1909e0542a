// EN: Runs every detector over one immutable snapshot and gathers the results into a single report.
// FR: Exécute tous les détecteurs sur un instantané immuable et rassemble les résultats dans un rapport.

#pragma once

#include "budget/budget_tracker.hpp"
#include "infrastructure/config/analysis_settings.hpp"
#include "model/analytics_types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace FIN {
namespace Analytics {

struct InsightReport {
    CalendarDate as_of;
    size_t transaction_count{0};
    std::vector<RecurringPayment> recurring;
    std::vector<Anomaly> anomalies;
    BalanceMetrics balance;
    CashFlowMetrics cash_flow;
    double savings_rate{0.0};
    size_t low_balance_days{0};
    BalanceForecast forecast;
    std::vector<CashFlowProjection> projections;
    std::vector<ForecastWarning> warnings;
    SpendingBreakdown spending;
    std::vector<Budgeting::BudgetStatus> budgets;
    HealthScore health;
};

class InsightRunner {
public:
    explicit InsightRunner(AnalysisSettings settings);

    // EN: Recurring, anomaly, balance, cash-flow, spending and health passes run concurrently with std::async;
    //     the forecast then consumes the recurring result. Inputs are never mutated.
    // FR: Les passes récurrence, anomalie, solde, trésorerie, dépenses et santé tournent en parallèle via std::async ;
    //     la prévision consomme ensuite le résultat des récurrences. Les entrées ne sont jamais modifiées.
    InsightReport run(const std::vector<Transaction>& transactions, const CalendarDate& as_of) const;

    // EN: Same as run() but with an explicit projection horizon (days).
    // FR: Identique à run() avec un horizon de projection explicite (jours).
    InsightReport run(const std::vector<Transaction>& transactions, const CalendarDate& as_of,
                      int horizon_days) const;

    // EN: Full run: tags feed the spending breakdown, budgets feed the budget statuses and the health score.
    // FR: Exécution complète : les tags alimentent la ventilation, les budgets les statuts et le score de santé.
    InsightReport run(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                      const std::vector<Budget>& budgets, const CalendarDate& as_of, int horizon_days) const;

private:
    AnalysisSettings settings_;
};

void to_json(nlohmann::json& j, const InsightReport& report);

} // namespace Analytics
} // namespace FIN
