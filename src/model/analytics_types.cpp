#include "model/analytics_types.hpp"

namespace FIN {

std::string frequencyToString(Frequency frequency) {
    switch (frequency) {
        case Frequency::WEEKLY: return "weekly";
        case Frequency::MONTHLY: return "monthly";
        case Frequency::QUARTERLY: return "quarterly";
        case Frequency::YEARLY: return "yearly";
    }
    return "monthly";
}

int frequencyIdealDays(Frequency frequency) {
    switch (frequency) {
        case Frequency::WEEKLY: return 7;
        case Frequency::MONTHLY: return 30;
        case Frequency::QUARTERLY: return 90;
        case Frequency::YEARLY: return 365;
    }
    return 30;
}

std::string recurringCategoryToString(RecurringCategory category) {
    switch (category) {
        case RecurringCategory::SUBSCRIPTION: return "subscription";
        case RecurringCategory::INSTALLMENT: return "emi";
        case RecurringCategory::UTILITY: return "utility";
        case RecurringCategory::OTHER: return "other";
    }
    return "other";
}

std::string anomalyTypeToString(AnomalyType type) {
    switch (type) {
        case AnomalyType::HIGH_AMOUNT: return "high_amount";
        case AnomalyType::DUPLICATE: return "duplicate";
        case AnomalyType::UNUSUAL_MERCHANT: return "unusual_merchant";
        case AnomalyType::SPENDING_SPIKE: return "spending_spike";
    }
    return "high_amount";
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
    }
    return "low";
}

std::string warningTypeToString(WarningType type) {
    return type == WarningType::LOW_BALANCE ? "low_balance" : "negative_balance";
}

std::string warningSeverityToString(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::INFO: return "info";
        case WarningSeverity::WARNING: return "warning";
        case WarningSeverity::CRITICAL: return "critical";
    }
    return "info";
}

std::string healthTrendToString(HealthTrend trend) {
    switch (trend) {
        case HealthTrend::IMPROVING: return "improving";
        case HealthTrend::STABLE: return "stable";
        case HealthTrend::DECLINING: return "declining";
    }
    return "stable";
}

} // namespace FIN
