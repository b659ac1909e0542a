#include <gtest/gtest.h>

#include "analytics/cashflow_metrics.hpp"

using namespace FIN;
using namespace FIN::Analytics;

namespace {

Transaction flow(const CalendarDate& date, double amount, TransactionType type) {
    Transaction t;
    t.date = date;
    t.amount = amount;
    t.type = type;
    if (type == TransactionType::DEBIT) {
        t.debit = amount;
    } else {
        t.credit = amount;
    }
    return t;
}

} // namespace

TEST(CashFlowMetricsTest, TotalsAndDailyAverages) {
    std::vector<Transaction> txns = {
        flow(CalendarDate(2024, 1, 1), 50000.0, TransactionType::CREDIT),
        flow(CalendarDate(2024, 1, 1), 2000.0, TransactionType::DEBIT),
        flow(CalendarDate(2024, 1, 5), 3000.0, TransactionType::DEBIT),
        flow(CalendarDate(2024, 1, 10), 1000.0, TransactionType::DEBIT),
        flow(CalendarDate(2024, 1, 10), 1000.0, TransactionType::CREDIT),
    };

    CashFlowMetrics metrics = calculateCashFlow(txns);

    EXPECT_DOUBLE_EQ(metrics.total_inflow, 51000.0);
    EXPECT_DOUBLE_EQ(metrics.total_outflow, 6000.0);
    EXPECT_DOUBLE_EQ(metrics.net_cash_flow, 45000.0);
    EXPECT_DOUBLE_EQ(metrics.average_daily_inflow, 17000.0);
    EXPECT_DOUBLE_EQ(metrics.average_daily_outflow, 2000.0);
    EXPECT_EQ(metrics.surplus_days, 1);
    EXPECT_EQ(metrics.deficit_days, 1);

    EXPECT_NEAR(savingsRate(metrics), 88.235, 0.001);
}

TEST(CashFlowMetricsTest, RangeFilter) {
    std::vector<Transaction> txns = {
        flow(CalendarDate(2024, 1, 1), 100.0, TransactionType::CREDIT),
        flow(CalendarDate(2024, 2, 1), 40.0, TransactionType::DEBIT),
    };

    CashFlowMetrics metrics = calculateCashFlow(txns, DateRange{CalendarDate(2024, 2, 1), CalendarDate(2024, 2, 29)});

    EXPECT_DOUBLE_EQ(metrics.total_inflow, 0.0);
    EXPECT_DOUBLE_EQ(metrics.total_outflow, 40.0);
    EXPECT_DOUBLE_EQ(metrics.average_daily_outflow, 40.0);
    EXPECT_EQ(metrics.deficit_days, 1);
    EXPECT_DOUBLE_EQ(savingsRate(metrics), 0.0);
}

TEST(CashFlowMetricsTest, EmptyInput) {
    CashFlowMetrics metrics = calculateCashFlow({});
    EXPECT_DOUBLE_EQ(metrics.total_inflow, 0.0);
    EXPECT_DOUBLE_EQ(metrics.average_daily_outflow, 0.0);
    EXPECT_EQ(metrics.surplus_days, 0);
}
