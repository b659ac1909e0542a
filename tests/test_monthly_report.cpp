#include <gtest/gtest.h>

#include "analytics/monthly_report.hpp"

#include <stdexcept>

using namespace FIN;
using namespace FIN::Analytics;

// Test fixture with a healthy January followed by an overspent February
// Fixture de test avec un janvier sain suivi d'un février dépensier
class MonthlyReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        txns_ = {
            make(CalendarDate(2024, 1, 1), "NEFT-ACME PAYROLL-N1", 10000.0, TransactionType::CREDIT, 10000.0, {}),
            make(CalendarDate(2024, 1, 5), "UPI/DR/1/Swiggy/x", 3750.0, TransactionType::DEBIT, 6250.0, {"tag-1"}),
            make(CalendarDate(2024, 1, 10), "POS 4321 AMAZON", 3750.0, TransactionType::DEBIT, 2500.0, {"tag-2"}),
            make(CalendarDate(2024, 2, 3), "UPI/DR/2/Swiggy/x", 5000.0, TransactionType::DEBIT, -2500.0, {"tag-1"}),
        };
        for (const char* id : {"tag-1", "tag-2"}) {
            Tag tag;
            tag.id = id;
            tag.name = id;
            tag.keywords = {id};
            tags_.push_back(tag);
        }
        Budget budget;
        budget.id = "budget-tag-1";
        budget.tag_id = "tag-1";
        budget.limit = 10000.0;
        budget.period = BudgetPeriod::MONTHLY;
        budgets_.push_back(budget);
    }

    static Transaction make(const CalendarDate& date, const std::string& narrative, double amount,
                            TransactionType type, double balance, std::vector<std::string> tag_ids) {
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
        t.tag_ids = std::move(tag_ids);
        t.id = makeTransactionId(date, t.reference, amount);
        return t;
    }

    std::vector<Transaction> txns_;
    std::vector<Tag> tags_;
    std::vector<Budget> budgets_;
    const Timestamp now_{std::chrono::milliseconds(1709251200000LL)};
};

TEST_F(MonthlyReportTest, JanuarySummary) {
    MonthlyReport report = generateMonthlyReport(txns_, tags_, budgets_, 2024, 1, AnomalySettings(), now_);

    EXPECT_EQ(report.period, "2024-01");
    EXPECT_EQ(report.generated_at, now_);
    EXPECT_DOUBLE_EQ(report.summary.total_income, 10000.0);
    EXPECT_DOUBLE_EQ(report.summary.total_expenses, 7500.0);
    EXPECT_DOUBLE_EQ(report.summary.net_savings, 2500.0);
    EXPECT_DOUBLE_EQ(report.summary.savings_rate, 25.0);

    EXPECT_DOUBLE_EQ(report.spending_by_tag["tag-1"], 3750.0);
    EXPECT_DOUBLE_EQ(report.spending_by_tag["tag-2"], 3750.0);
    EXPECT_EQ(report.top_merchants.size(), 2u);

    ASSERT_EQ(report.budget_performance.size(), 1u);
    EXPECT_DOUBLE_EQ(report.budget_performance[0].current_spend, 3750.0);
    EXPECT_EQ(report.budget_performance[0].state, Budgeting::BudgetState::ON_TRACK);

    EXPECT_EQ(report.health.score, 76);
    EXPECT_TRUE(report.anomalies.empty());
    EXPECT_EQ(report.recommendations, report.health.recommendations);
}

TEST_F(MonthlyReportTest, OverspentMonthLeadsWithWarnings) {
    MonthlyReport report = generateMonthlyReport(txns_, tags_, budgets_, 2024, 2, AnomalySettings(), now_);

    EXPECT_DOUBLE_EQ(report.summary.total_income, 0.0);
    EXPECT_DOUBLE_EQ(report.summary.net_savings, -5000.0);
    EXPECT_EQ(report.health.score, 38);

    ASSERT_GE(report.recommendations.size(), 2u);
    EXPECT_EQ(report.recommendations[0],
              "Your expenses exceeded income this month. Consider reviewing your spending patterns.");
    EXPECT_EQ(report.recommendations[1],
              "Your financial health score is below average. "
              "Focus on increasing savings and reducing unnecessary expenses.");
}

TEST_F(MonthlyReportTest, ExceededBudgetIsCounted) {
    budgets_[0].limit = 3000.0;
    MonthlyReport report = generateMonthlyReport(txns_, tags_, budgets_, 2024, 1, AnomalySettings(), now_);

    ASSERT_EQ(report.budget_performance.size(), 1u);
    EXPECT_EQ(report.budget_performance[0].state, Budgeting::BudgetState::EXCEEDED);
    EXPECT_EQ(report.recommendations[0],
              "You exceeded 1 budget(s) this month. Review these categories to stay on track.");
}

TEST_F(MonthlyReportTest, MonthOutOfRangeThrows) {
    EXPECT_THROW(generateMonthlyReport(txns_, tags_, budgets_, 2024, 13), std::invalid_argument);
    EXPECT_THROW(generateMonthlyReport(txns_, tags_, budgets_, 2024, 0), std::invalid_argument);
}

TEST_F(MonthlyReportTest, AvailableMonthsAreSortedAndDistinct) {
    EXPECT_EQ(availableMonths(txns_), (std::vector<std::string>{"2024-01", "2024-02"}));
    EXPECT_TRUE(availableMonths({}).empty());
}

TEST_F(MonthlyReportTest, JsonReportKeys) {
    nlohmann::json j = generateMonthlyReport(txns_, tags_, budgets_, 2024, 1, AnomalySettings(), now_);

    for (const char* key : {"period", "generatedAt", "summary", "balanceMetrics", "cashFlow", "spendingByTag",
                            "topMerchants", "budgetPerformance", "healthScore", "anomalies", "recommendations"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["period"], "2024-01");
    EXPECT_DOUBLE_EQ(j["summary"]["netSavings"].get<double>(), 2500.0);
    EXPECT_EQ(j["healthScore"]["score"], 76);
}
