#include <gtest/gtest.h>

#include "analytics/insight_runner.hpp"

using namespace FIN;
using namespace FIN::Analytics;

// Test fixture with three months of salary and subscription activity
// Fixture de test avec trois mois de salaire et d'abonnement
class InsightRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        double balance = 0.0;
        for (int month = 0; month < 3; ++month) {
            CalendarDate pay_day = CalendarDate(2024, 1, 1).addDays(30 * month);
            balance += 40000.0;
            txns_.push_back(make(pay_day, "NEFT-ACME PAYROLL-" + std::to_string(month), 40000.0,
                                 TransactionType::CREDIT, balance));
            balance -= 649.0;
            txns_.push_back(make(pay_day.addDays(4), "UPI/DR/" + std::to_string(month) + "/Netflix/x", 649.0,
                                 TransactionType::DEBIT, balance));
        }
    }

    static Transaction make(const CalendarDate& date, const std::string& narrative, double amount,
                            TransactionType type, double balance) {
        Transaction t;
        t.date = date;
        t.narrative = narrative;
        t.reference = narrative;
        t.amount = amount;
        t.type = type;
        t.balance = balance;
        if (type == TransactionType::DEBIT) {
            t.debit = amount;
        } else {
            t.credit = amount;
        }
        t.id = makeTransactionId(date, t.reference, amount);
        return t;
    }

    std::vector<Transaction> txns_;
};

TEST_F(InsightRunnerTest, GathersEveryPass) {
    const std::vector<Transaction> snapshot = txns_;
    InsightRunner runner{AnalysisSettings()};

    InsightReport report = runner.run(txns_, CalendarDate(2024, 3, 10));

    EXPECT_EQ(txns_, snapshot);
    EXPECT_EQ(report.transaction_count, 6u);
    EXPECT_EQ(report.as_of, CalendarDate(2024, 3, 10));

    ASSERT_EQ(report.recurring.size(), 1u);
    EXPECT_EQ(report.recurring[0].merchant, "Netflix");
    EXPECT_EQ(report.recurring[0].frequency, Frequency::MONTHLY);

    EXPECT_DOUBLE_EQ(report.balance.current, 120000.0 - 3 * 649.0);
    EXPECT_DOUBLE_EQ(report.cash_flow.total_inflow, 120000.0);
    EXPECT_DOUBLE_EQ(report.cash_flow.total_outflow, 3 * 649.0);
    EXPECT_GT(report.savings_rate, 98.0);
    EXPECT_EQ(report.low_balance_days, 0u);

    EXPECT_EQ(report.forecast.date, CalendarDate(2024, 3, 31));
    EXPECT_GE(report.forecast.predicted_balance, report.forecast.confidence_interval.low);
    EXPECT_LE(report.forecast.predicted_balance, report.forecast.confidence_interval.high);
    EXPECT_EQ(report.projections.size(), 3u);
}

TEST_F(InsightRunnerTest, HorizonOverrideAndSettings) {
    AnalysisSettings settings;
    settings.forecast.projection_periods = {7, 14, 30};
    InsightRunner runner(settings);

    InsightReport report = runner.run(txns_, CalendarDate(2024, 3, 10), 14);

    ASSERT_EQ(report.projections.size(), 2u);
    EXPECT_EQ(report.projections[1].period, "14 days");
}

TEST_F(InsightRunnerTest, EmptySnapshot) {
    InsightRunner runner{AnalysisSettings()};
    InsightReport report = runner.run({}, CalendarDate(2024, 3, 10));

    EXPECT_EQ(report.transaction_count, 0u);
    EXPECT_TRUE(report.recurring.empty());
    EXPECT_TRUE(report.anomalies.empty());
    EXPECT_EQ(report.forecast.assumptions, std::vector<std::string>{"No transaction history available"});
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].type, WarningType::LOW_BALANCE);
}

TEST_F(InsightRunnerTest, JsonReportKeys) {
    InsightRunner runner{AnalysisSettings()};
    nlohmann::json j = runner.run(txns_, CalendarDate(2024, 3, 10));

    for (const char* key : {"asOf", "transactionCount", "recurringPayments", "anomalies", "balance", "cashFlow",
                            "savingsRate", "lowBalanceDays", "forecast", "projections", "warnings"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["asOf"], "2024-03-10");
    EXPECT_EQ(j["recurringPayments"][0]["merchant"], "Netflix");
    EXPECT_EQ(j["projections"][0]["period"], "30 days");
}

TEST_F(InsightRunnerTest, TagsAndBudgetsFeedSpendingAndHealth) {
    for (auto& txn : txns_) {
        if (txn.isDebit()) {
            txn.tag_ids = {"tag-1"};
        }
    }
    Tag tag;
    tag.id = "tag-1";
    tag.name = "Streaming";
    tag.keywords = {"netflix"};
    Budget budget;
    budget.id = "budget-tag-1";
    budget.tag_id = "tag-1";
    budget.limit = 1000.0;
    budget.period = BudgetPeriod::MONTHLY;

    InsightRunner runner{AnalysisSettings()};
    InsightReport report = runner.run(txns_, {tag}, {budget}, CalendarDate(2024, 3, 10), 30);

    EXPECT_DOUBLE_EQ(report.spending.by_tag["tag-1"], 3 * 649.0);
    ASSERT_EQ(report.spending.by_merchant.size(), 1u);
    EXPECT_EQ(report.spending.by_merchant[0].merchant, "Netflix");

    // March holds one Netflix debit on the 5th
    // Mars contient un débit Netflix le 5
    ASSERT_EQ(report.budgets.size(), 1u);
    EXPECT_DOUBLE_EQ(report.budgets[0].current_spend, 649.0);
    EXPECT_EQ(report.budgets[0].state, Budgeting::BudgetState::ON_TRACK);

    EXPECT_GT(report.health.score, 0);
    EXPECT_FALSE(report.health.recommendations.empty());

    nlohmann::json j = report;
    for (const char* key : {"spending", "budgets", "healthScore"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["budgets"][0]["status"], "on_track");
}
