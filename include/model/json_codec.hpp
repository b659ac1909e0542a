// EN: nlohmann::json conversions for model records (store documents and CLI reports).
// FR: Conversions nlohmann::json des enregistrements du modèle (documents du store et rapports CLI).

#pragma once

#include "model/analytics_types.hpp"
#include "model/transaction.hpp"

#include <nlohmann/json.hpp>

namespace FIN {

// EN: from_json functions throw nlohmann::json::exception on missing keys or wrong types and
//     std::invalid_argument on malformed dates or enum names.
// FR: Les from_json lèvent nlohmann::json::exception (clé manquante, mauvais type) et
//     std::invalid_argument (date ou nom d'énumération malformé).

void to_json(nlohmann::json& j, const CalendarDate& date);
void from_json(const nlohmann::json& j, CalendarDate& date);

void to_json(nlohmann::json& j, const DateRange& range);
void from_json(const nlohmann::json& j, DateRange& range);

void to_json(nlohmann::json& j, const Transaction& txn);
void from_json(const nlohmann::json& j, Transaction& txn);

void to_json(nlohmann::json& j, const Tag& tag);
void from_json(const nlohmann::json& j, Tag& tag);

void to_json(nlohmann::json& j, const Budget& budget);
void from_json(const nlohmann::json& j, Budget& budget);

void to_json(nlohmann::json& j, const UploadedFileRecord& record);
void from_json(const nlohmann::json& j, UploadedFileRecord& record);

// EN: Report-only encoders.
// FR: Encodeurs pour les rapports uniquement.
void to_json(nlohmann::json& j, const RecurringPayment& payment);
void to_json(nlohmann::json& j, const Anomaly& anomaly);
void to_json(nlohmann::json& j, const BalanceMetrics& metrics);
void to_json(nlohmann::json& j, const CashFlowMetrics& metrics);
void to_json(nlohmann::json& j, const BalanceForecast& forecast);
void to_json(nlohmann::json& j, const CashFlowProjection& projection);
void to_json(nlohmann::json& j, const ForecastWarning& warning);
void to_json(nlohmann::json& j, const MerchantSpend& spend);
void to_json(nlohmann::json& j, const SpendingBreakdown& breakdown);
void to_json(nlohmann::json& j, const HealthScoreComponent& component);
void to_json(nlohmann::json& j, const HealthScore& health);

} // namespace FIN
