#include "analytics/balance_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace FIN {
namespace Analytics {

namespace {

std::vector<const Transaction*> inRange(const std::vector<Transaction>& transactions,
                                        const std::optional<DateRange>& range) {
    std::vector<const Transaction*> result;
    for (const auto& txn : transactions) {
        if (!range || range->contains(txn.date)) {
            result.push_back(&txn);
        }
    }
    return result;
}

const Transaction* latest(const std::vector<const Transaction*>& transactions) {
    const Transaction* best = nullptr;
    for (const Transaction* txn : transactions) {
        if (!best || best->date <= txn->date) {
            best = txn;
        }
    }
    return best;
}

} // namespace

BalanceMetrics calculateBalanceMetrics(const std::vector<Transaction>& transactions,
                                       const std::optional<DateRange>& range) {
    BalanceMetrics metrics;
    std::vector<const Transaction*> filtered = inRange(transactions, range);
    if (filtered.empty()) {
        return metrics;
    }

    metrics.current = latest(filtered)->balance;
    metrics.highest = filtered.front()->balance;
    metrics.lowest = filtered.front()->balance;
    double sum = 0.0;
    DateRange period{filtered.front()->date, filtered.front()->date};

    for (const Transaction* txn : filtered) {
        metrics.highest = std::max(metrics.highest, txn->balance);
        metrics.lowest = std::min(metrics.lowest, txn->balance);
        sum += txn->balance;
        period.start = std::min(period.start, txn->date);
        period.end = std::max(period.end, txn->date);
    }

    // EN: Clamp guards against rounding pushing the mean outside [lowest, highest].
    // FR: Le clamp évite que l'arrondi sorte la moyenne de [lowest, highest].
    metrics.average = std::clamp(sum / static_cast<double>(filtered.size()), metrics.lowest, metrics.highest);
    metrics.period = period;
    return metrics;
}

double currentBalance(const std::vector<Transaction>& transactions) {
    const Transaction* txn = latest(inRange(transactions, std::nullopt));
    return txn ? txn->balance : 0.0;
}

std::optional<double> balanceAt(const std::vector<Transaction>& transactions, const CalendarDate& date) {
    std::vector<const Transaction*> before;
    for (const auto& txn : transactions) {
        if (txn.date <= date) {
            before.push_back(&txn);
        }
    }
    const Transaction* txn = latest(before);
    if (!txn) {
        return std::nullopt;
    }
    return txn->balance;
}

BalanceChange balanceChange(const std::vector<Transaction>& transactions, const DateRange& range) {
    BalanceChange result;
    result.start_balance = balanceAt(transactions, range.start);
    result.end_balance = balanceAt(transactions, range.end);
    if (!result.start_balance || !result.end_balance) {
        return result;
    }

    double change = *result.end_balance - *result.start_balance;
    result.change = change;
    result.percent_change = *result.start_balance != 0.0 ? change / std::fabs(*result.start_balance) * 100.0 : 0.0;
    return result;
}

std::vector<BalancePoint> balanceHistory(const std::vector<Transaction>& transactions,
                                         const std::optional<DateRange>& range) {
    std::vector<BalancePoint> history;
    for (const Transaction* txn : inRange(transactions, range)) {
        history.push_back(BalancePoint{txn->date, txn->balance});
    }
    std::stable_sort(history.begin(), history.end(),
                     [](const BalancePoint& a, const BalancePoint& b) { return a.date < b.date; });
    return history;
}

size_t countDaysBelow(const std::vector<Transaction>& transactions, double threshold,
                      const std::optional<DateRange>& range) {
    std::map<int64_t, double> closing;
    for (const Transaction* txn : inRange(transactions, range)) {
        closing[txn->date.toDayNumber()] = txn->balance;
    }
    return static_cast<size_t>(std::count_if(closing.begin(), closing.end(),
        [threshold](const std::pair<const int64_t, double>& day) { return day.second < threshold; }));
}

} // namespace Analytics
} // namespace FIN
