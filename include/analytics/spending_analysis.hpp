// EN: Where the money goes: debit totals by tag, merchant, payment channel, weekday and part of the month.
// FR: Où part l'argent : totaux des débits par tag, marchand, canal, jour de semaine et période du mois.

#pragma once

#include "model/analytics_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Analytics {

// EN: Credits are ignored by every function below.
// FR: Les crédits sont ignorés par toutes les fonctions ci-dessous.
SpendingBreakdown calculateSpendingBreakdown(const std::vector<Transaction>& transactions,
                                             const std::vector<Tag>& tags,
                                             const std::optional<DateRange>& range = std::nullopt);

// EN: Every known tag starts at 0. A debit carrying several tags counts toward each of them.
// FR: Chaque tag connu démarre à 0. Un débit portant plusieurs tags compte pour chacun.
std::map<std::string, double> spendingByTag(const std::vector<Transaction>& transactions,
                                            const std::vector<Tag>& tags);

// EN: Grouped by extracted merchant name ("Unknown Merchant" when none), total descending,
//     first-seen order among equal totals.
// FR: Groupés par nom de marchand extrait ("Unknown Merchant" sinon), total décroissant,
//     ordre d'apparition à total égal.
std::vector<MerchantSpend> spendingByMerchant(const std::vector<Transaction>& transactions);
std::vector<MerchantSpend> topMerchants(const std::vector<Transaction>& transactions, size_t limit = 10);

std::map<PaymentChannel, double> spendingByChannel(const std::vector<Transaction>& transactions);
std::array<double, 7> spendingByDayOfWeek(const std::vector<Transaction>& transactions);
TimeOfMonthSpend spendingByTimeOfMonth(const std::vector<Transaction>& transactions);

// EN: Share of each tag in percent; empty when nothing was spent.
// FR: Part de chaque tag en pourcentage ; vide si rien n'a été dépensé.
std::map<std::string, double> spendingPercentages(const std::map<std::string, double>& by_tag);

// EN: Normalised Shannon entropy of the non-zero tag totals, 0-100. Fewer than two categories gives 0.
// FR: Entropie de Shannon normalisée des totaux non nuls, 0-100. Moins de deux catégories donne 0.
double spendingDiversity(const std::map<std::string, double>& by_tag);

struct DaySpend {
    std::string day;
    double amount{0.0};
};

// EN: First weekday (from Sunday) holding the maximum.
// FR: Premier jour (depuis dimanche) portant le maximum.
DaySpend highestSpendingDay(const std::vector<Transaction>& transactions);

// EN: Monthly debit totals for one tag, oldest month first.
// FR: Totaux mensuels des débits d'un tag, du plus ancien au plus récent.
std::vector<MonthlyAmount> categorySpendingTrend(const std::vector<Transaction>& transactions,
                                                 const std::string& tag_id);

std::string dayOfWeekName(int day);

} // namespace Analytics
} // namespace FIN
