#include "model/json_codec.hpp"

#include <stdexcept>

namespace FIN {

namespace {

Timestamp timestampFromJson(const nlohmann::json& j, const char* key) {
    std::string text = j.at(key).get<std::string>();
    auto ts = parseTimestamp(text);
    if (!ts) {
        throw std::invalid_argument(std::string("Invalid timestamp for ") + key + ": " + text);
    }
    return *ts;
}

template<typename T>
void optionalToJson(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template<typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

} // namespace

void to_json(nlohmann::json& j, const CalendarDate& date) {
    j = date.toIsoString();
}

void from_json(const nlohmann::json& j, CalendarDate& date) {
    std::string text = j.get<std::string>();
    auto parsed = CalendarDate::parseIso(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    date = *parsed;
}

void to_json(nlohmann::json& j, const DateRange& range) {
    j = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

void from_json(const nlohmann::json& j, DateRange& range) {
    range.start = j.at("start").get<CalendarDate>();
    range.end = j.at("end").get<CalendarDate>();
}

void to_json(nlohmann::json& j, const Transaction& txn) {
    j = nlohmann::json{
        {"id", txn.id},
        {"date", txn.date},
        {"details", txn.narrative},
        {"refNo", txn.reference},
        {"balance", txn.balance},
        {"amount", txn.amount},
        {"type", transactionTypeToString(txn.type)},
        {"transactionType", paymentChannelToString(txn.channel)},
        {"tagIds", txn.tag_ids},
        {"manualTagOverride", txn.manual_tag_override},
        {"customTags", txn.custom_tags},
        {"isReviewed", txn.is_reviewed},
        {"sourceFile", txn.source_file},
        {"importedAt", formatTimestamp(txn.imported_at)}
    };
    optionalToJson(j, "debit", txn.debit);
    optionalToJson(j, "credit", txn.credit);
    optionalToJson(j, "notes", txn.notes);
}

void from_json(const nlohmann::json& j, Transaction& txn) {
    txn.id = j.at("id").get<std::string>();
    txn.date = j.at("date").get<CalendarDate>();
    txn.narrative = j.at("details").get<std::string>();
    txn.reference = j.at("refNo").get<std::string>();
    txn.debit = optionalFromJson<double>(j, "debit");
    txn.credit = optionalFromJson<double>(j, "credit");
    txn.balance = j.at("balance").get<double>();
    txn.amount = j.at("amount").get<double>();

    std::string type = j.at("type").get<std::string>();
    auto parsed_type = transactionTypeFromString(type);
    if (!parsed_type) {
        throw std::invalid_argument("Invalid transaction type: " + type);
    }
    txn.type = *parsed_type;

    std::string channel = j.at("transactionType").get<std::string>();
    auto parsed_channel = paymentChannelFromString(channel);
    if (!parsed_channel) {
        throw std::invalid_argument("Invalid payment channel: " + channel);
    }
    txn.channel = *parsed_channel;

    txn.tag_ids = j.at("tagIds").get<std::vector<std::string>>();
    txn.manual_tag_override = j.at("manualTagOverride").get<bool>();
    txn.notes = optionalFromJson<std::string>(j, "notes");
    txn.custom_tags = j.at("customTags").get<std::vector<std::string>>();
    txn.is_reviewed = j.at("isReviewed").get<bool>();
    txn.source_file = j.at("sourceFile").get<std::string>();
    txn.imported_at = timestampFromJson(j, "importedAt");
}

void to_json(nlohmann::json& j, const Tag& tag) {
    j = nlohmann::json{
        {"id", tag.id},
        {"name", tag.name},
        {"keywords", tag.keywords},
        {"color", tag.color},
        {"isDefault", tag.is_default},
        {"createdAt", formatTimestamp(tag.created_at)},
        {"updatedAt", formatTimestamp(tag.updated_at)}
    };
    optionalToJson(j, "icon", tag.icon);
    optionalToJson(j, "parentTagId", tag.parent_tag_id);
}

void from_json(const nlohmann::json& j, Tag& tag) {
    tag.id = j.at("id").get<std::string>();
    tag.name = j.at("name").get<std::string>();
    tag.keywords = j.at("keywords").get<std::vector<std::string>>();
    tag.color = j.at("color").get<std::string>();
    tag.icon = optionalFromJson<std::string>(j, "icon");
    tag.is_default = j.at("isDefault").get<bool>();
    tag.parent_tag_id = optionalFromJson<std::string>(j, "parentTagId");
    tag.created_at = timestampFromJson(j, "createdAt");
    tag.updated_at = timestampFromJson(j, "updatedAt");
}

void to_json(nlohmann::json& j, const Budget& budget) {
    j = nlohmann::json{
        {"id", budget.id},
        {"tagId", budget.tag_id},
        {"limit", budget.limit},
        {"period", budgetPeriodToString(budget.period)},
        {"createdAt", formatTimestamp(budget.created_at)}
    };
}

void from_json(const nlohmann::json& j, Budget& budget) {
    budget.id = j.at("id").get<std::string>();
    budget.tag_id = j.at("tagId").get<std::string>();
    budget.limit = j.at("limit").get<double>();
    std::string period = j.at("period").get<std::string>();
    auto parsed = budgetPeriodFromString(period);
    if (!parsed) {
        throw std::invalid_argument("Invalid budget period: " + period);
    }
    budget.period = *parsed;
    budget.created_at = timestampFromJson(j, "createdAt");
}

void to_json(nlohmann::json& j, const UploadedFileRecord& record) {
    j = nlohmann::json{
        {"fileName", record.file_name},
        {"uploadedAt", formatTimestamp(record.uploaded_at)},
        {"transactionCount", record.transaction_count},
        {"checksum", record.checksum}
    };
    optionalToJson(j, "dateRange", record.date_range);
}

void from_json(const nlohmann::json& j, UploadedFileRecord& record) {
    record.file_name = j.at("fileName").get<std::string>();
    record.uploaded_at = timestampFromJson(j, "uploadedAt");
    record.transaction_count = j.at("transactionCount").get<size_t>();
    record.date_range = optionalFromJson<DateRange>(j, "dateRange");
    record.checksum = j.at("checksum").get<std::string>();
}

void to_json(nlohmann::json& j, const RecurringPayment& payment) {
    j = nlohmann::json{
        {"merchant", payment.merchant},
        {"amount", payment.amount},
        {"frequency", frequencyToString(payment.frequency)},
        {"nextExpectedDate", payment.next_expected_date},
        {"category", recurringCategoryToString(payment.category)},
        {"confidence", payment.confidence}
    };
}

void to_json(nlohmann::json& j, const Anomaly& anomaly) {
    j = nlohmann::json{
        {"transactionId", anomaly.transaction.id},
        {"date", anomaly.transaction.date},
        {"details", anomaly.transaction.narrative},
        {"amount", anomaly.transaction.amount},
        {"type", anomalyTypeToString(anomaly.type)},
        {"severity", severityToString(anomaly.severity)},
        {"description", anomaly.description}
    };
}

void to_json(nlohmann::json& j, const BalanceMetrics& metrics) {
    j = nlohmann::json{
        {"current", metrics.current},
        {"highest", metrics.highest},
        {"lowest", metrics.lowest},
        {"average", metrics.average}
    };
    optionalToJson(j, "period", metrics.period);
}

void to_json(nlohmann::json& j, const CashFlowMetrics& metrics) {
    j = nlohmann::json{
        {"totalInflow", metrics.total_inflow},
        {"totalOutflow", metrics.total_outflow},
        {"netCashFlow", metrics.net_cash_flow},
        {"averageDailyInflow", metrics.average_daily_inflow},
        {"averageDailyOutflow", metrics.average_daily_outflow},
        {"surplusDays", metrics.surplus_days},
        {"deficitDays", metrics.deficit_days}
    };
}

void to_json(nlohmann::json& j, const BalanceForecast& forecast) {
    j = nlohmann::json{
        {"date", forecast.date},
        {"predictedBalance", forecast.predicted_balance},
        {"confidenceInterval", {{"low", forecast.confidence_interval.low},
                                {"high", forecast.confidence_interval.high}}},
        {"assumptions", forecast.assumptions}
    };
}

void to_json(nlohmann::json& j, const CashFlowProjection& projection) {
    j = nlohmann::json{
        {"period", projection.period},
        {"horizonDays", projection.horizon_days},
        {"expectedInflow", projection.expected_inflow},
        {"expectedOutflow", projection.expected_outflow},
        {"netFlow", projection.net_flow},
        {"recurringPayments", projection.recurring_payments}
    };
}

void to_json(nlohmann::json& j, const ForecastWarning& warning) {
    j = nlohmann::json{
        {"type", warningTypeToString(warning.type)},
        {"date", warning.date},
        {"message", warning.message},
        {"severity", warningSeverityToString(warning.severity)}
    };
}

void to_json(nlohmann::json& j, const MerchantSpend& spend) {
    j = nlohmann::json{
        {"merchant", spend.merchant},
        {"totalAmount", spend.total_amount},
        {"transactionCount", spend.transaction_count},
        {"averageAmount", spend.average_amount},
        {"lastTransaction", spend.last_transaction}
    };
}

void to_json(nlohmann::json& j, const SpendingBreakdown& breakdown) {
    // EN: Channels are keyed by their wire name.
    // FR: Les canaux sont indexés par leur nom sérialisé.
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& [channel, amount] : breakdown.by_channel) {
        channels[paymentChannelToString(channel)] = amount;
    }
    j = nlohmann::json{
        {"byTag", breakdown.by_tag},
        {"byMerchant", breakdown.by_merchant},
        {"byPaymentMethod", channels},
        {"byDayOfWeek", breakdown.by_day_of_week},
        {"byTimeOfMonth", {{"early", breakdown.by_time_of_month.early},
                           {"mid", breakdown.by_time_of_month.mid},
                           {"late", breakdown.by_time_of_month.late}}}
    };
}

void to_json(nlohmann::json& j, const HealthScoreComponent& component) {
    j = nlohmann::json{
        {"score", component.score},
        {"weight", component.weight},
        {"value", component.value}
    };
}

void to_json(nlohmann::json& j, const HealthScore& health) {
    j = nlohmann::json{
        {"score", health.score},
        {"components", {{"savingsRate", health.savings_rate},
                        {"budgetAdherence", health.budget_adherence},
                        {"spendingDiversity", health.spending_diversity},
                        {"emergencyFund", health.emergency_fund}}},
        {"recommendations", health.recommendations},
        {"trend", healthTrendToString(health.trend)}
    };
}

} // namespace FIN
