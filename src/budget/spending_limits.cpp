#include "budget/spending_limits.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace FIN {
namespace Budgeting {

namespace {

double percentOf(double spend, double cap) {
    return cap > 0.0 ? spend / cap * 100.0 : 0.0;
}

bool countedBy(const SpendingLimit& limit, const Transaction& txn) {
    switch (limit.type) {
        case LimitType::DAILY:
        case LimitType::MONTHLY:
            return true;
        case LimitType::CATEGORY:
            return limit.target_id &&
                   std::find(txn.tag_ids.begin(), txn.tag_ids.end(), *limit.target_id) != txn.tag_ids.end();
        case LimitType::MERCHANT: {
            if (!limit.target_id) {
                return false;
            }
            std::string target = *limit.target_id;
            std::transform(target.begin(), target.end(), target.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return limitMerchantKey(txn.narrative) == target;
        }
    }
    return false;
}

} // namespace

std::string limitTypeToString(LimitType type) {
    switch (type) {
        case LimitType::DAILY: return "daily";
        case LimitType::MONTHLY: return "monthly";
        case LimitType::CATEGORY: return "category";
        case LimitType::MERCHANT: return "merchant";
    }
    return "monthly";
}

std::optional<LimitType> limitTypeFromString(const std::string& text) {
    if (text == "daily") return LimitType::DAILY;
    if (text == "monthly") return LimitType::MONTHLY;
    if (text == "category") return LimitType::CATEGORY;
    if (text == "merchant") return LimitType::MERCHANT;
    return std::nullopt;
}

std::string defaultLimitName(LimitType type) {
    switch (type) {
        case LimitType::DAILY: return "Daily Spending";
        case LimitType::MONTHLY: return "Monthly Spending";
        case LimitType::CATEGORY: return "Category Spending";
        case LimitType::MERCHANT: return "Merchant Spending";
    }
    return "Monthly Spending";
}

SpendingLimit createSpendingLimit(LimitType type, double limit, const std::optional<std::string>& target_id,
                                  const std::optional<std::string>& target_name, Timestamp now) {
    if (!(limit > 0.0)) {
        throw std::invalid_argument("Spending limit must be positive");
    }
    bool needs_target = type == LimitType::CATEGORY || type == LimitType::MERCHANT;
    if (needs_target && (!target_id || target_id->empty())) {
        throw std::invalid_argument("A " + limitTypeToString(type) + " limit needs a target");
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    SpendingLimit result;
    result.id = "limit-" + std::to_string(millis) + "-" + limitTypeToString(type);
    result.type = type;
    result.target_id = target_id;
    result.target_name = target_name.value_or(defaultLimitName(type));
    result.limit = limit;
    result.created_at = now;
    return result;
}

std::string limitMerchantKey(const std::string& narrative) {
    auto separator = [](unsigned char c) { return std::isspace(c) || c == '/'; };
    auto begin = std::find_if_not(narrative.begin(), narrative.end(), separator);
    auto end = std::find_if(begin, narrative.end(), separator);

    std::string key(begin, end);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

double currentSpending(const SpendingLimit& limit, const std::vector<Transaction>& transactions,
                       const CalendarDate& as_of) {
    // EN: Daily limits look at as_of alone, the others at the month so far.
    // FR: Les limites journalières ne voient que as_of, les autres le mois jusqu'à as_of.
    DateRange window{limit.type == LimitType::DAILY ? as_of : as_of.startOfMonth(), as_of};

    double total = 0.0;
    for (const auto& txn : transactions) {
        if (txn.isDebit() && window.contains(txn.date) && countedBy(limit, txn)) {
            total += txn.amount;
        }
    }
    return total;
}

std::vector<SpendingLimit> checkSpendingLimits(const Transaction& candidate, const std::vector<SpendingLimit>& limits,
                                               const std::vector<Transaction>& transactions,
                                               const CalendarDate& as_of) {
    std::vector<SpendingLimit> tripped;
    if (!candidate.isDebit()) {
        return tripped;
    }
    for (const auto& limit : limits) {
        if (!limit.is_active) {
            continue;
        }
        if (currentSpending(limit, transactions, as_of) + candidate.amount > limit.limit) {
            tripped.push_back(limit);
        }
    }
    return tripped;
}

std::vector<LimitStatus> limitStatuses(const std::vector<SpendingLimit>& limits,
                                       const std::vector<Transaction>& transactions, const CalendarDate& as_of) {
    std::vector<LimitStatus> statuses;
    statuses.reserve(limits.size());
    for (const auto& limit : limits) {
        double spend = currentSpending(limit, transactions, as_of);
        statuses.push_back(LimitStatus{limit, spend, percentOf(spend, limit.limit), limit.limit - spend});
    }
    return statuses;
}

std::vector<SpendingLimit> warningLimits(const std::vector<SpendingLimit>& limits,
                                         const std::vector<Transaction>& transactions, const CalendarDate& as_of) {
    std::vector<SpendingLimit> result;
    for (const auto& limit : limits) {
        if (!limit.is_active) {
            continue;
        }
        double percent = percentOf(currentSpending(limit, transactions, as_of), limit.limit);
        if (percent >= 80.0 && percent < 100.0) {
            result.push_back(limit);
        }
    }
    return result;
}

std::vector<SpendingLimit> exceededLimits(const std::vector<SpendingLimit>& limits,
                                          const std::vector<Transaction>& transactions, const CalendarDate& as_of) {
    std::vector<SpendingLimit> result;
    for (const auto& limit : limits) {
        if (limit.is_active && currentSpending(limit, transactions, as_of) > limit.limit) {
            result.push_back(limit);
        }
    }
    return result;
}

} // namespace Budgeting
} // namespace FIN
