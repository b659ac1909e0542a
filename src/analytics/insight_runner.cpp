#include "analytics/insight_runner.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/balance_metrics.hpp"
#include "analytics/cashflow_metrics.hpp"
#include "analytics/health_score.hpp"
#include "analytics/recurring_detector.hpp"
#include "analytics/spending_analysis.hpp"
#include "forecast/forecast_engine.hpp"
#include "infrastructure/logging/logger.hpp"
#include "model/json_codec.hpp"

#include <future>
#include <utility>

namespace FIN {
namespace Analytics {

InsightRunner::InsightRunner(AnalysisSettings settings) : settings_(std::move(settings)) {}

InsightReport InsightRunner::run(const std::vector<Transaction>& transactions, const CalendarDate& as_of) const {
    return run(transactions, as_of, settings_.forecast.horizon_days);
}

InsightReport InsightRunner::run(const std::vector<Transaction>& transactions, const CalendarDate& as_of,
                                 int horizon_days) const {
    return run(transactions, {}, {}, as_of, horizon_days);
}

InsightReport InsightRunner::run(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                                 const std::vector<Budget>& budgets, const CalendarDate& as_of,
                                 int horizon_days) const {
    const RecurringSettings recurring_settings = settings_.recurring;
    const AnomalyDetector anomaly_detector(settings_.anomaly);
    const double floor = settings_.forecast.low_balance_floor;

    auto recurring_future = std::async(std::launch::async, [&transactions, recurring_settings]() {
        return detectRecurringPayments(transactions, recurring_settings);
    });
    auto anomaly_future = std::async(std::launch::async, [&transactions, &anomaly_detector]() {
        return anomaly_detector.detect(transactions);
    });
    auto balance_future = std::async(std::launch::async, [&transactions]() {
        return calculateBalanceMetrics(transactions);
    });
    auto cash_flow_future = std::async(std::launch::async, [&transactions]() {
        return calculateCashFlow(transactions);
    });
    auto spending_future = std::async(std::launch::async, [&transactions, &tags]() {
        return calculateSpendingBreakdown(transactions, tags);
    });
    auto health_future = std::async(std::launch::async, [&transactions, &budgets, &as_of]() {
        return calculateHealthScore(transactions, budgets, as_of);
    });

    InsightReport report;
    report.as_of = as_of;
    report.transaction_count = transactions.size();
    // EN: get() rethrows anything a pass threw.
    // FR: get() relance toute exception levée par une passe.
    report.recurring = recurring_future.get();
    report.anomalies = anomaly_future.get();
    report.balance = balance_future.get();
    report.cash_flow = cash_flow_future.get();
    report.spending = spending_future.get();
    report.health = health_future.get();
    report.budgets = Budgeting::budgetStatuses(budgets, transactions, as_of);
    report.savings_rate = savingsRate(report.cash_flow);
    report.low_balance_days = countDaysBelow(transactions, floor);

    // EN: The forecast needs the recurring payments, so it runs after the joins.
    // FR: La prévision a besoin des paiements récurrents, elle s'exécute donc après les jointures.
    Forecast::ForecastEngine engine(settings_.forecast);
    report.forecast = engine.forecastEndOfMonth(transactions, report.recurring, as_of);
    report.projections = engine.projectCashFlow(transactions, report.recurring, horizon_days, as_of);
    report.warnings = engine.generateWarnings({report.forecast});

    LOG_INFO_META("insights", "Insight report generated", (Logger::Metadata{
        {"as_of", as_of.toIsoString()},
        {"transactions", std::to_string(report.transaction_count)},
        {"recurring", std::to_string(report.recurring.size())},
        {"anomalies", std::to_string(report.anomalies.size())},
        {"health", std::to_string(report.health.score)},
        {"warnings", std::to_string(report.warnings.size())}
    }));
    return report;
}

void to_json(nlohmann::json& j, const InsightReport& report) {
    j = nlohmann::json{
        {"asOf", report.as_of},
        {"transactionCount", report.transaction_count},
        {"recurringPayments", report.recurring},
        {"anomalies", report.anomalies},
        {"balance", report.balance},
        {"cashFlow", report.cash_flow},
        {"savingsRate", report.savings_rate},
        {"lowBalanceDays", report.low_balance_days},
        {"forecast", report.forecast},
        {"projections", report.projections},
        {"warnings", report.warnings},
        {"spending", report.spending},
        {"budgets", report.budgets},
        {"healthScore", report.health}
    };
}

} // namespace Analytics
} // namespace FIN
