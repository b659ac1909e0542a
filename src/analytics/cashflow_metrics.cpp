#include "analytics/cashflow_metrics.hpp"

#include <algorithm>
#include <map>

namespace FIN {
namespace Analytics {

CashFlowMetrics calculateCashFlow(const std::vector<Transaction>& transactions,
                                  const std::optional<DateRange>& range) {
    CashFlowMetrics metrics;
    std::map<int64_t, double> daily_net;

    // EN: Sum each side and the per-day net flow inside the range.
    // FR: Cumule chaque sens et le flux net par jour dans la plage.
    for (const auto& txn : transactions) {
        if (range && !range->contains(txn.date)) {
            continue;
        }
        if (txn.isCredit()) {
            metrics.total_inflow += txn.amount;
            daily_net[txn.date.toDayNumber()] += txn.amount;
        } else {
            metrics.total_outflow += txn.amount;
            daily_net[txn.date.toDayNumber()] -= txn.amount;
        }
    }

    if (daily_net.empty()) {
        return metrics;
    }

    // EN: Averages are taken over the days that carry a transaction.
    // FR: Les moyennes portent sur les jours ayant une transaction.
    metrics.net_cash_flow = metrics.total_inflow - metrics.total_outflow;
    double days = static_cast<double>(std::max<std::size_t>(1, daily_net.size()));
    metrics.average_daily_inflow = metrics.total_inflow / days;
    metrics.average_daily_outflow = metrics.total_outflow / days;

    // EN: A day counts as surplus or deficit by the sign of its net flow.
    // FR: Un jour est excedentaire ou deficitaire selon le signe de son flux net.
    for (const auto& [_, net] : daily_net) {
        if (net > 0.0) {
            metrics.surplus_days++;
        } else if (net < 0.0) {
            metrics.deficit_days++;
        }
    }
    return metrics;
}

double savingsRate(const CashFlowMetrics& metrics) {
    if (metrics.total_inflow <= 0.0) {
        return 0.0;
    }
    return metrics.net_cash_flow / metrics.total_inflow * 100.0;
}

} // namespace Analytics
} // namespace FIN
