#include "budget/budget_tracker.hpp"
#include "infrastructure/logging/logger.hpp"
#include "model/json_codec.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

namespace FIN {
namespace Budgeting {

namespace {

constexpr double kWarningPercent = 80.0;
constexpr double kExceededPercent = 100.0;
constexpr double kSuggestionFloor = 100.0;

bool hasTag(const Transaction& txn, const std::string& tag_id) {
    return std::find(txn.tag_ids.begin(), txn.tag_ids.end(), tag_id) != txn.tag_ids.end();
}

double taggedSpend(const std::string& tag_id, const std::vector<Transaction>& transactions,
                   const DateRange& range) {
    double total = 0.0;
    for (const auto& txn : transactions) {
        if (txn.isDebit() && range.contains(txn.date) && hasTag(txn, tag_id)) {
            total += txn.amount;
        }
    }
    return total;
}

// EN: Month n steps before date's month, day 1.
// FR: Le mois situé n pas avant celui de date, au jour 1.
CalendarDate monthsBefore(const CalendarDate& date, int n) {
    int index = date.year * 12 + (date.month - 1) - n;
    return CalendarDate(index / 12, index % 12 + 1, 1);
}

} // namespace

std::string budgetStateToString(BudgetState state) {
    switch (state) {
        case BudgetState::ON_TRACK: return "on_track";
        case BudgetState::WARNING: return "warning";
        case BudgetState::EXCEEDED: return "exceeded";
    }
    return "on_track";
}

Budget createBudget(const std::string& tag_id, double limit, BudgetPeriod period, Timestamp now) {
    if (tag_id.empty()) {
        throw std::invalid_argument("A budget needs a tag");
    }
    if (!(limit > 0.0)) {
        throw std::invalid_argument("Budget limit must be positive");
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    Budget budget;
    budget.id = "budget-" + std::to_string(millis) + "-" + tag_id;
    budget.tag_id = tag_id;
    budget.limit = limit;
    budget.period = period;
    budget.created_at = now;
    return budget;
}

DateRange budgetWindow(const Budget& budget, const CalendarDate& as_of) {
    if (budget.period == BudgetPeriod::YEARLY) {
        return DateRange{CalendarDate(as_of.year, 1, 1), CalendarDate(as_of.year, 12, 31)};
    }
    return DateRange{as_of.startOfMonth(), as_of.endOfMonth()};
}

BudgetStatus budgetStatus(const Budget& budget, const std::vector<Transaction>& transactions,
                          const CalendarDate& as_of) {
    BudgetStatus status;
    status.budget = budget;
    status.window = budgetWindow(budget, as_of);
    status.current_spend = taggedSpend(budget.tag_id, transactions, DateRange{status.window.start, as_of});
    status.percent_used = budget.limit > 0.0 ? status.current_spend / budget.limit * 100.0 : 0.0;
    status.remaining = budget.limit - status.current_spend;

    // EN: Pace so far times the window length.
    // FR: Rythme observé multiplié par la longueur de la fenêtre.
    double elapsed = static_cast<double>(status.window.start.daysUntil(as_of) + 1);
    double length = static_cast<double>(status.window.spanDays() + 1);
    status.projected_spend = status.current_spend / elapsed * length;

    if (status.percent_used >= kExceededPercent) {
        status.state = BudgetState::EXCEEDED;
    } else if (status.percent_used >= kWarningPercent) {
        status.state = BudgetState::WARNING;
    }
    return status;
}

std::vector<BudgetStatus> budgetStatuses(const std::vector<Budget>& budgets,
                                         const std::vector<Transaction>& transactions,
                                         const CalendarDate& as_of) {
    std::vector<BudgetStatus> statuses;
    statuses.reserve(budgets.size());
    for (const auto& budget : budgets) {
        statuses.push_back(budgetStatus(budget, transactions, as_of));
    }
    return statuses;
}

double averageMonthlySpending(const std::string& tag_id, const std::vector<Transaction>& transactions,
                              const CalendarDate& as_of, int months) {
    if (months <= 0) {
        return 0.0;
    }
    DateRange range{monthsBefore(as_of, months - 1), as_of.endOfMonth()};

    std::map<std::string, double> monthly;
    for (const auto& txn : transactions) {
        if (txn.isDebit() && range.contains(txn.date) && hasTag(txn, tag_id)) {
            monthly[txn.date.toMonthString()] += txn.amount;
        }
    }

    double total = 0.0;
    size_t active = 0;
    for (const auto& [_, amount] : monthly) {
        if (amount > 0.0) {
            total += amount;
            active++;
        }
    }
    return active == 0 ? 0.0 : total / static_cast<double>(active);
}

std::vector<Budget> suggestBudgets(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags,
                                   const std::vector<Budget>& existing, const CalendarDate& as_of,
                                   Timestamp now) {
    std::set<std::string> budgeted;
    for (const auto& budget : existing) {
        if (budget.period == BudgetPeriod::MONTHLY) {
            budgeted.insert(budget.tag_id);
        }
    }

    std::vector<Budget> suggestions;
    for (const auto& tag : tags) {
        if (budgeted.count(tag.id) > 0) {
            continue;
        }
        double average = averageMonthlySpending(tag.id, transactions, as_of);
        if (average <= kSuggestionFloor) {
            continue;
        }
        double limit = std::ceil(average * 1.1 / 100.0) * 100.0;
        suggestions.push_back(createBudget(tag.id, limit, BudgetPeriod::MONTHLY, now));
    }

    LOG_DEBUG_META("budget", "Budget suggestions computed", (Logger::Metadata{
        {"tags", std::to_string(tags.size())},
        {"suggested", std::to_string(suggestions.size())}
    }));
    return suggestions;
}

void to_json(nlohmann::json& j, const BudgetStatus& status) {
    j = nlohmann::json{
        {"budget", status.budget},
        {"window", status.window},
        {"currentSpend", status.current_spend},
        {"percentUsed", status.percent_used},
        {"remaining", status.remaining},
        {"projectedSpend", status.projected_spend},
        {"status", budgetStateToString(status.state)}
    };
}

} // namespace Budgeting
} // namespace FIN
