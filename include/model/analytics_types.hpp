// EN: Derived results produced by the detectors and the forecast engine. Recomputed on every run.
// FR: Résultats dérivés produits par les détecteurs et le moteur de prévision. Recalculés à chaque exécution.

#pragma once

#include "model/transaction.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace FIN {

enum class Frequency {
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    YEARLY
};

enum class RecurringCategory {
    SUBSCRIPTION,
    INSTALLMENT,
    UTILITY,
    OTHER
};

struct RecurringPayment {
    std::string merchant;
    double amount{0.0};
    Frequency frequency{Frequency::MONTHLY};
    CalendarDate next_expected_date;
    RecurringCategory category{RecurringCategory::OTHER};
    int confidence{0}; // EN: 0-100 / FR: 0-100
};

enum class AnomalyType {
    HIGH_AMOUNT,
    DUPLICATE,
    UNUSUAL_MERCHANT,
    SPENDING_SPIKE
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

struct Anomaly {
    Transaction transaction;
    AnomalyType type{AnomalyType::HIGH_AMOUNT};
    Severity severity{Severity::LOW};
    std::string description;
};

struct BalanceMetrics {
    double current{0.0};
    double highest{0.0};
    double lowest{0.0};
    double average{0.0};
    std::optional<DateRange> period;
};

// EN: change and percent_change are empty when either end has no balance on record.
// FR: change et percent_change sont vides si l'une des bornes n'a pas de solde connu.
struct BalanceChange {
    std::optional<double> start_balance;
    std::optional<double> end_balance;
    std::optional<double> change;
    std::optional<double> percent_change;
};

struct BalancePoint {
    CalendarDate date;
    double balance{0.0};
};

struct CashFlowMetrics {
    double total_inflow{0.0};
    double total_outflow{0.0};
    double net_cash_flow{0.0};
    double average_daily_inflow{0.0};
    double average_daily_outflow{0.0};
    int surplus_days{0};
    int deficit_days{0};
};

struct ConfidenceInterval {
    double low{0.0};
    double high{0.0};
};

struct BalanceForecast {
    CalendarDate date;
    double predicted_balance{0.0};
    ConfidenceInterval confidence_interval;
    std::vector<std::string> assumptions;
};

struct CashFlowProjection {
    std::string period;
    int horizon_days{0};
    double expected_inflow{0.0};
    double expected_outflow{0.0};
    double net_flow{0.0};
    std::vector<RecurringPayment> recurring_payments;
};

enum class WarningType {
    LOW_BALANCE,
    NEGATIVE_BALANCE
};

enum class WarningSeverity {
    INFO,
    WARNING,
    CRITICAL
};

struct ForecastWarning {
    WarningType type{WarningType::LOW_BALANCE};
    CalendarDate date;
    std::string message;
    WarningSeverity severity{WarningSeverity::INFO};
};

struct MerchantSpend {
    std::string merchant;
    double total_amount{0.0};
    size_t transaction_count{0};
    double average_amount{0.0};
    CalendarDate last_transaction;
};

// EN: Days 1-10, 11-20 and 21 onwards.
// FR: Jours 1-10, 11-20 et 21 et au-delà.
struct TimeOfMonthSpend {
    double early{0.0};
    double mid{0.0};
    double late{0.0};
};

struct SpendingBreakdown {
    std::map<std::string, double> by_tag;
    std::vector<MerchantSpend> by_merchant; // EN: total descending / FR: total décroissant
    std::map<PaymentChannel, double> by_channel;
    std::array<double, 7> by_day_of_week{}; // EN: Sunday first / FR: dimanche en premier
    TimeOfMonthSpend by_time_of_month;
};

struct MonthlyAmount {
    std::string month; // YYYY-MM
    double amount{0.0};
};

struct HealthScoreComponent {
    int score{0};        // EN: 0-100 / FR: 0-100
    double weight{0.0};
    double value{0.0};
};

enum class HealthTrend {
    IMPROVING,
    STABLE,
    DECLINING
};

struct HealthScore {
    int score{0};
    HealthScoreComponent savings_rate;
    HealthScoreComponent budget_adherence;
    HealthScoreComponent spending_diversity;
    HealthScoreComponent emergency_fund;
    std::vector<std::string> recommendations;
    HealthTrend trend{HealthTrend::STABLE};
};

std::string frequencyToString(Frequency frequency);
int frequencyIdealDays(Frequency frequency);
std::string recurringCategoryToString(RecurringCategory category);
std::string anomalyTypeToString(AnomalyType type);
std::string severityToString(Severity severity);
std::string warningTypeToString(WarningType type);
std::string warningSeverityToString(WarningSeverity severity);
std::string healthTrendToString(HealthTrend trend);

} // namespace FIN
