#include "forecast/forecast_engine.hpp"
#include "analytics/balance_metrics.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <utility>

namespace FIN {
namespace Forecast {

namespace {

std::string money(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "\xE2\x82\xB9%.2f", value);
    return buf;
}

} // namespace

ForecastEngine::ForecastEngine(ForecastSettings settings) : settings_(std::move(settings)) {}

DailyAverages ForecastEngine::dailyAverages(const std::vector<Transaction>& transactions) {
    DailyAverages averages;
    if (transactions.empty()) {
        return averages;
    }

    CalendarDate first = transactions.front().date;
    CalendarDate last = transactions.front().date;
    double income = 0.0;
    double expense = 0.0;
    for (const auto& txn : transactions) {
        first = std::min(first, txn.date);
        last = std::max(last, txn.date);
        income += txn.credit.value_or(0.0);
        expense += txn.debit.value_or(0.0);
    }

    // EN: Averages spread over the covered span, at least one day.
    // FR: Moyennes étalées sur la période couverte, au moins un jour.
    double days = static_cast<double>(std::max<int64_t>(1, first.daysUntil(last)));
    averages.income = income / days;
    averages.expense = expense / days;
    return averages;
}

double ForecastEngine::dailyNetFlowStdDev(const std::vector<Transaction>& transactions) {
    if (transactions.size() < 2) {
        return 0.0;
    }

    // EN: Population standard deviation of the per-day net flow.
    // FR: Écart type de population du flux net journalier.
    std::map<int64_t, double> daily;
    for (const auto& txn : transactions) {
        daily[txn.date.toDayNumber()] += txn.credit.value_or(0.0) - txn.debit.value_or(0.0);
    }

    double mean = 0.0;
    for (const auto& entry : daily) {
        mean += entry.second;
    }
    mean /= static_cast<double>(daily.size());

    double variance = 0.0;
    for (const auto& entry : daily) {
        variance += (entry.second - mean) * (entry.second - mean);
    }
    variance /= static_cast<double>(daily.size());
    return std::sqrt(variance);
}

double ForecastEngine::recurringDue(const std::vector<RecurringPayment>& recurring, const DateRange& window) {
    double total = 0.0;
    for (const auto& payment : recurring) {
        if (window.contains(payment.next_expected_date)) {
            total += payment.amount;
        }
    }
    return total;
}

BalanceForecast ForecastEngine::forecastEndOfMonth(const std::vector<Transaction>& transactions,
                                                   const std::vector<RecurringPayment>& recurring,
                                                   const CalendarDate& as_of) const {
    BalanceForecast forecast;
    forecast.date = as_of.endOfMonth();

    if (transactions.empty()) {
        forecast.assumptions.push_back("No transaction history available");
        return forecast;
    }

    double current = Analytics::currentBalance(transactions);
    int64_t days_remaining = as_of.daysUntil(forecast.date);

    if (days_remaining <= 0) {
        forecast.predicted_balance = current;
        forecast.confidence_interval = ConfidenceInterval{current, current};
        forecast.assumptions.push_back("Already at end of month");
        return forecast;
    }

    // EN: Linear extrapolation minus recurring payments due before month end.
    // FR: Extrapolation linéaire moins les paiements récurrents dus avant la fin du mois.
    DailyAverages averages = dailyAverages(transactions);
    double days = static_cast<double>(days_remaining);
    double due = recurringDue(recurring, DateRange{as_of, forecast.date});

    forecast.predicted_balance = current + averages.income * days - averages.expense * days - due;
    // EN: The band widens with the number of remaining days.
    // FR: La bande s'élargit avec le nombre de jours restants.
    double margin = dailyNetFlowStdDev(transactions) * days;
    forecast.confidence_interval = ConfidenceInterval{forecast.predicted_balance - margin,
                                                      forecast.predicted_balance + margin};

    forecast.assumptions = {
        "Based on " + std::to_string(transactions.size()) + " historical transactions",
        "Average daily income: " + money(averages.income),
        "Average daily expenses: " + money(averages.expense),
        std::to_string(recurring.size()) + " recurring payments detected",
        "Recurring payments due: " + money(due),
        std::to_string(days_remaining) + " days remaining in month"
    };

    LOG_DEBUG_META("forecast", "End-of-month forecast computed", (Logger::Metadata{
        {"as_of", as_of.toIsoString()},
        {"predicted", money(forecast.predicted_balance)},
        {"margin", money(margin)}
    }));
    return forecast;
}

std::vector<CashFlowProjection> ForecastEngine::projectCashFlow(const std::vector<Transaction>& transactions,
                                                                const std::vector<RecurringPayment>& recurring,
                                                                int horizon_days,
                                                                const CalendarDate& as_of) const {
    std::vector<CashFlowProjection> projections;
    DailyAverages averages = dailyAverages(transactions);

    for (int period : settings_.projection_periods) {
        // EN: Periods beyond the horizon are skipped.
        // FR: Les périodes au-delà de l'horizon sont ignorées.
        if (period <= 0 || period > horizon_days) {
            continue;
        }

        DateRange window{as_of, as_of.addDays(period)};
        CashFlowProjection projection;
        projection.period = std::to_string(period) + " days";
        projection.horizon_days = period;
        for (const auto& payment : recurring) {
            if (window.contains(payment.next_expected_date)) {
                projection.recurring_payments.push_back(payment);
            }
        }

        projection.expected_inflow = averages.income * period;
        projection.expected_outflow = averages.expense * period + recurringDue(recurring, window);
        projection.net_flow = projection.expected_inflow - projection.expected_outflow;
        projections.push_back(std::move(projection));
    }
    return projections;
}

std::vector<ForecastWarning> ForecastEngine::generateWarnings(const std::vector<BalanceForecast>& forecasts) const {
    std::vector<ForecastWarning> warnings;

    for (const auto& forecast : forecasts) {
        std::string by = " by " + forecast.date.toIsoString();
        // EN: Only the most severe warning applies per forecast.
        // FR: Seul l'avertissement le plus grave s'applique par prévision.
        if (forecast.predicted_balance < 0.0) {
            warnings.push_back(ForecastWarning{WarningType::NEGATIVE_BALANCE, forecast.date,
                "Account balance is predicted to go negative (" + money(forecast.predicted_balance) + ")" + by,
                WarningSeverity::CRITICAL});
        } else if (forecast.predicted_balance < settings_.low_balance_floor) {
            warnings.push_back(ForecastWarning{WarningType::LOW_BALANCE, forecast.date,
                "Account balance is predicted to fall below threshold (" + money(forecast.predicted_balance) + ")" + by,
                WarningSeverity::WARNING});
        } else if (forecast.confidence_interval.low < 0.0) {
            warnings.push_back(ForecastWarning{WarningType::NEGATIVE_BALANCE, forecast.date,
                "There is a risk of negative balance (worst case: " + money(forecast.confidence_interval.low) + ")" + by,
                WarningSeverity::WARNING});
        }
    }
    return warnings;
}

} // namespace Forecast
} // namespace FIN
