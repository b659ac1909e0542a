#include "analytics/monthly_report.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/balance_metrics.hpp"
#include "analytics/cashflow_metrics.hpp"
#include "analytics/health_score.hpp"
#include "analytics/spending_analysis.hpp"
#include "infrastructure/logging/logger.hpp"
#include "model/json_codec.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace FIN {
namespace Analytics {

namespace {

constexpr size_t kTopMerchants = 10;

std::vector<std::string> recommendationsFor(const MonthlyReport& report) {
    std::vector<std::string> out;

    if (report.cash_flow.net_cash_flow < 0.0) {
        out.push_back("Your expenses exceeded income this month. Consider reviewing your spending patterns.");
    }

    size_t exceeded = 0;
    for (const auto& status : report.budget_performance) {
        if (status.state == Budgeting::BudgetState::EXCEEDED) {
            exceeded++;
        }
    }
    if (exceeded > 0) {
        out.push_back("You exceeded " + std::to_string(exceeded) +
                      " budget(s) this month. Review these categories to stay on track.");
    }

    if (report.health.score < 60) {
        out.push_back("Your financial health score is below average. "
                      "Focus on increasing savings and reducing unnecessary expenses.");
    }

    size_t high = 0;
    for (const auto& anomaly : report.anomalies) {
        if (anomaly.severity == Severity::HIGH) {
            high++;
        }
    }
    if (high > 0) {
        out.push_back(std::to_string(high) + " unusual transaction(s) detected. Review these for accuracy.");
    }

    out.insert(out.end(), report.health.recommendations.begin(), report.health.recommendations.end());
    return out;
}

} // namespace

MonthlyReport generateMonthlyReport(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                                    const std::vector<Budget>& budgets, int year, int month,
                                    const AnomalySettings& anomaly_settings, Timestamp now) {
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month must be between 1 and 12, got " + std::to_string(month));
    }

    const CalendarDate first(year, month, 1);
    const DateRange window{first, first.endOfMonth()};

    // EN: Keep only the transactions of the requested month.
    // FR: Ne garde que les transactions du mois demandé.
    std::vector<Transaction> in_month;
    for (const auto& txn : transactions) {
        if (window.contains(txn.date)) {
            in_month.push_back(txn);
        }
    }

    MonthlyReport report;
    report.period = first.toMonthString();
    report.generated_at = now;
    report.balance = calculateBalanceMetrics(in_month, window);
    report.cash_flow = calculateCashFlow(in_month, window);

    report.summary.total_income = report.cash_flow.total_inflow;
    report.summary.total_expenses = report.cash_flow.total_outflow;
    report.summary.net_savings = report.summary.total_income - report.summary.total_expenses;
    report.summary.savings_rate = savingsRate(report.cash_flow);

    SpendingBreakdown spending = calculateSpendingBreakdown(in_month, tags);
    report.spending_by_tag = std::move(spending.by_tag);
    report.top_merchants = std::move(spending.by_merchant);
    if (report.top_merchants.size() > kTopMerchants) {
        report.top_merchants.resize(kTopMerchants);
    }

    // EN: Budgets see the whole history; health only sees the month.
    // FR: Les budgets voient tout l'historique ; la santé ne voit que le mois.
    report.budget_performance = Budgeting::budgetStatuses(budgets, transactions, window.end);
    report.health = calculateHealthScore(in_month, budgets, window.end);
    report.anomalies = AnomalyDetector(anomaly_settings).detect(in_month);
    report.recommendations = recommendationsFor(report);

    LOG_INFO_META("report", "Monthly report generated", (Logger::Metadata{
        {"period", report.period},
        {"transactions", std::to_string(in_month.size())},
        {"health", std::to_string(report.health.score)}
    }));
    return report;
}

std::vector<std::string> availableMonths(const std::vector<Transaction>& transactions) {
    std::set<std::string> months;
    for (const auto& txn : transactions) {
        months.insert(txn.date.toMonthString());
    }
    return std::vector<std::string>(months.begin(), months.end());
}

void to_json(nlohmann::json& j, const MonthlyReport& report) {
    j = nlohmann::json{
        {"period", report.period},
        {"generatedAt", formatTimestamp(report.generated_at)},
        {"summary", {{"totalIncome", report.summary.total_income},
                     {"totalExpenses", report.summary.total_expenses},
                     {"netSavings", report.summary.net_savings},
                     {"savingsRate", report.summary.savings_rate}}},
        {"balanceMetrics", report.balance},
        {"cashFlow", report.cash_flow},
        {"spendingByTag", report.spending_by_tag},
        {"topMerchants", report.top_merchants},
        {"budgetPerformance", report.budget_performance},
        {"healthScore", report.health},
        {"anomalies", report.anomalies},
        {"recommendations", report.recommendations}
    };
}

} // namespace Analytics
} // namespace FIN
