// EN: Daily, monthly, per-tag and per-merchant spending caps checked against debits up to a reference date.
// FR: Plafonds de dépense journaliers, mensuels, par tag et par marchand, vérifiés jusqu'à une date de référence.

#pragma once

#include "model/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Budgeting {

enum class LimitType {
    DAILY,
    MONTHLY,
    CATEGORY, // EN: target is a tag id / FR: la cible est un id de tag
    MERCHANT  // EN: target is a merchant key / FR: la cible est une clé marchand
};

std::string limitTypeToString(LimitType type);
std::optional<LimitType> limitTypeFromString(const std::string& text);

struct SpendingLimit {
    std::string id;
    LimitType type{LimitType::MONTHLY};
    std::optional<std::string> target_id;
    std::string target_name;
    double limit{0.0};
    bool is_active{true};
    Timestamp created_at{};
};

struct LimitStatus {
    SpendingLimit limit;
    double current_spend{0.0};
    double percent_used{0.0};
    double remaining{0.0};
};

// EN: target_name defaults to a label derived from the type. Throws std::invalid_argument for a
//     non-positive amount, or a category / merchant limit without target.
// FR: target_name prend par défaut un libellé dérivé du type. Lève std::invalid_argument pour un
//     montant non positif, ou une limite catégorie / marchand sans cible.
SpendingLimit createSpendingLimit(LimitType type, double limit,
                                  const std::optional<std::string>& target_id = std::nullopt,
                                  const std::optional<std::string>& target_name = std::nullopt,
                                  Timestamp now = std::chrono::system_clock::now());

std::string defaultLimitName(LimitType type);

// EN: First whitespace- or slash-separated token of a narrative, lower-cased.
// FR: Premier jeton d'un libellé séparé par espace ou barre oblique, en minuscules.
std::string limitMerchantKey(const std::string& narrative);

// EN: Debits counted by the limit: as_of's day (daily) or as_of's month up to as_of (others).
//     A category or merchant limit without target counts nothing.
// FR: Débits comptés par la limite : le jour d'as_of (journalière) ou son mois jusqu'à as_of (autres).
//     Une limite catégorie ou marchand sans cible ne compte rien.
double currentSpending(const SpendingLimit& limit, const std::vector<Transaction>& transactions,
                       const CalendarDate& as_of);

// EN: Active limits the candidate debit would push over their cap. Credits never trip a limit.
// FR: Limites actives que le débit candidat ferait dépasser. Un crédit ne déclenche jamais de limite.
std::vector<SpendingLimit> checkSpendingLimits(const Transaction& candidate, const std::vector<SpendingLimit>& limits,
                                               const std::vector<Transaction>& transactions,
                                               const CalendarDate& as_of);

std::vector<LimitStatus> limitStatuses(const std::vector<SpendingLimit>& limits,
                                       const std::vector<Transaction>& transactions, const CalendarDate& as_of);

// EN: Active limits between 80% (inclusive) and 100% (exclusive) used.
// FR: Limites actives consommées entre 80% (inclus) et 100% (exclu).
std::vector<SpendingLimit> warningLimits(const std::vector<SpendingLimit>& limits,
                                         const std::vector<Transaction>& transactions, const CalendarDate& as_of);

// EN: Active limits whose spend is strictly above the cap.
// FR: Limites actives dont la dépense dépasse strictement le plafond.
std::vector<SpendingLimit> exceededLimits(const std::vector<SpendingLimit>& limits,
                                          const std::vector<Transaction>& transactions, const CalendarDate& as_of);

} // namespace Budgeting
} // namespace FIN
