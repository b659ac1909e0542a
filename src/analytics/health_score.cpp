#include "analytics/health_score.hpp"
#include "analytics/balance_metrics.hpp"
#include "budget/budget_tracker.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace FIN {
namespace Analytics {

namespace {

constexpr double kSavingsWeight = 0.30;
constexpr double kBudgetWeight = 0.25;
constexpr double kDiversityWeight = 0.25;
constexpr double kEmergencyWeight = 0.20;

// EN: Halves round toward +infinity.
// FR: Les moitiés s'arrondissent vers +infini.
double roundHalfUp(double value) {
    return std::floor(value + 0.5);
}

int clampScore(double value) {
    return static_cast<int>(std::clamp(roundHalfUp(value), 0.0, 100.0));
}

double oneDecimal(double value) {
    return roundHalfUp(value * 10.0) / 10.0;
}

std::vector<std::string> recommendationsFor(const HealthScore& health) {
    std::vector<std::string> out;

    if (health.savings_rate.score < 40) {
        out.push_back("Your savings rate is low. Try to save at least 10-20% of your income.");
    } else if (health.savings_rate.score < 70) {
        out.push_back("Good savings rate! Aim for 20-30% to build wealth faster.");
    } else {
        out.push_back("Excellent savings rate! Keep up the great work.");
    }

    if (health.budget_adherence.score < 50) {
        out.push_back("You're exceeding your budgets. Review your spending categories and adjust limits.");
    } else if (health.budget_adherence.score < 80) {
        out.push_back("Budget adherence needs improvement. Track your spending more closely.");
    }

    if (health.spending_diversity.score < 40) {
        out.push_back("Your spending is concentrated in few categories. Consider diversifying to reduce risk.");
    }

    if (health.emergency_fund.score < 30) {
        out.push_back("Build an emergency fund covering at least 3-6 months of expenses.");
    } else if (health.emergency_fund.score < 60) {
        out.push_back("Your emergency fund is growing. Aim for 3-6 months of expenses.");
    } else if (health.emergency_fund.score < 90) {
        out.push_back("Good emergency fund! Consider reaching 6 months of expenses for better security.");
    }

    if (out.size() == 1) {
        out.push_back("Continue monitoring your finances regularly to maintain good health.");
    }
    return out;
}

} // namespace

HealthScoreComponent savingsRateComponent(const std::vector<Transaction>& transactions) {
    double income = 0.0;
    double expenses = 0.0;
    for (const auto& txn : transactions) {
        (txn.isCredit() ? income : expenses) += txn.amount;
    }
    if (income == 0.0) {
        return HealthScoreComponent{0, kSavingsWeight, 0.0};
    }

    // EN: Piecewise linear: 0-10% -> 0-40, 10-20% -> 40-70, 20-30% -> 70-90, then one point per percent up to 100.
    // FR: Linéaire par morceaux : 0-10% -> 0-40, 10-20% -> 40-70, 20-30% -> 70-90, puis un point par pourcent jusqu'à 100.
    double rate = (income - expenses) / income * 100.0;
    double score = 0.0;
    if (rate < 0.0) {
        score = 0.0;
    } else if (rate < 10.0) {
        score = rate * 4.0;
    } else if (rate < 20.0) {
        score = 40.0 + (rate - 10.0) * 3.0;
    } else if (rate < 30.0) {
        score = 70.0 + (rate - 20.0) * 2.0;
    } else {
        score = std::min(100.0, 90.0 + (rate - 30.0));
    }
    return HealthScoreComponent{clampScore(score), kSavingsWeight, oneDecimal(rate)};
}

HealthScoreComponent budgetAdherenceComponent(const std::vector<Transaction>& transactions,
                                              const std::vector<Budget>& budgets, const CalendarDate& as_of) {
    if (budgets.empty()) {
        return HealthScoreComponent{50, kBudgetWeight, 0.0};
    }

    double sum = 0.0;
    for (const auto& status : Budgeting::budgetStatuses(budgets, transactions, as_of)) {
        double used = status.percent_used;
        if (used <= 80.0) {
            sum += 100.0;
        } else if (used <= 100.0) {
            sum += 100.0 - (used - 80.0) * 1.5;
        } else {
            sum += std::max(0.0, 70.0 - (used - 100.0) * 0.7);
        }
    }
    double average = roundHalfUp(sum / static_cast<double>(budgets.size()));
    return HealthScoreComponent{static_cast<int>(average), kBudgetWeight, average};
}

HealthScoreComponent spendingDiversityComponent(const std::vector<Transaction>& transactions) {
    std::map<std::string, double> by_tag;
    double total = 0.0;
    size_t debits = 0;
    for (const auto& txn : transactions) {
        if (!txn.isDebit()) {
            continue;
        }
        debits++;
        total += txn.amount;
        for (const auto& tag_id : txn.tag_ids) {
            by_tag[tag_id] += txn.amount;
        }
    }
    if (debits == 0) {
        return HealthScoreComponent{50, kDiversityWeight, 0.0};
    }

    // EN: Herfindahl concentration mapped so that an even split scores 100 and a single tag 0.
    // FR: Concentration de Herfindahl ramenée à 100 pour une répartition égale et 0 pour un seul tag.
    const size_t categories = by_tag.size();
    if (categories <= 1 || total <= 0.0) {
        return HealthScoreComponent{50, kDiversityWeight, static_cast<double>(categories)};
    }
    double concentration = 0.0;
    for (const auto& [_, amount] : by_tag) {
        double share = amount / total;
        concentration += share * share;
    }
    double even = 1.0 / static_cast<double>(categories);
    double score = (1.0 - concentration) / (1.0 - even) * 100.0;
    return HealthScoreComponent{clampScore(score), kDiversityWeight, static_cast<double>(categories)};
}

HealthScoreComponent emergencyFundComponent(const std::vector<Transaction>& transactions) {
    if (transactions.empty()) {
        return HealthScoreComponent{0, kEmergencyWeight, 0.0};
    }

    double expenses = 0.0;
    CalendarDate first = transactions.front().date;
    CalendarDate last = transactions.front().date;
    for (const auto& txn : transactions) {
        if (txn.isDebit()) {
            expenses += txn.amount;
        }
        first = std::min(first, txn.date);
        last = std::max(last, txn.date);
    }

    // EN: Calendar months touched by the data, both ends included.
    // FR: Mois civils couverts par les données, bornes incluses.
    int months = (last.year - first.year) * 12 + (last.month - first.month) + 1;
    double monthly = expenses / static_cast<double>(months);
    if (monthly == 0.0) {
        return HealthScoreComponent{50, kEmergencyWeight, 0.0};
    }

    double covered = currentBalance(transactions) / monthly;
    double score = 0.0;
    if (covered < 1.0) {
        score = covered * 30.0;
    } else if (covered < 3.0) {
        score = 30.0 + (covered - 1.0) * 15.0;
    } else if (covered < 6.0) {
        score = 60.0 + (covered - 3.0) * 10.0;
    } else {
        score = std::min(100.0, 90.0 + (covered - 6.0) * 2.0);
    }
    return HealthScoreComponent{clampScore(score), kEmergencyWeight, oneDecimal(covered)};
}

HealthTrend trendForScore(int score) {
    if (score >= 70) return HealthTrend::IMPROVING;
    if (score >= 40) return HealthTrend::STABLE;
    return HealthTrend::DECLINING;
}

HealthScore calculateHealthScore(const std::vector<Transaction>& transactions, const std::vector<Budget>& budgets,
                                 const CalendarDate& as_of) {
    HealthScore health;
    if (transactions.empty()) {
        health.savings_rate = HealthScoreComponent{0, kSavingsWeight, 0.0};
        health.budget_adherence = HealthScoreComponent{0, kBudgetWeight, 0.0};
        health.spending_diversity = HealthScoreComponent{0, kDiversityWeight, 0.0};
        health.emergency_fund = HealthScoreComponent{0, kEmergencyWeight, 0.0};
        health.recommendations = {"Upload transaction data to calculate health score"};
        health.trend = HealthTrend::STABLE;
        return health;
    }

    health.savings_rate = savingsRateComponent(transactions);
    health.budget_adherence = budgetAdherenceComponent(transactions, budgets, as_of);
    health.spending_diversity = spendingDiversityComponent(transactions);
    health.emergency_fund = emergencyFundComponent(transactions);

    double weighted = 0.0;
    for (const HealthScoreComponent* c : {&health.savings_rate, &health.budget_adherence,
                                          &health.spending_diversity, &health.emergency_fund}) {
        weighted += c->score * c->weight;
    }
    health.score = clampScore(weighted);
    health.trend = trendForScore(health.score);
    health.recommendations = recommendationsFor(health);

    LOG_DEBUG_META("health", "Health score computed", (Logger::Metadata{
        {"score", std::to_string(health.score)},
        {"trend", healthTrendToString(health.trend)}
    }));
    return health;
}

} // namespace Analytics
} // namespace FIN
