#include <gtest/gtest.h>

#include "analytics/recurring_detector.hpp"

using namespace FIN;
using namespace FIN::Analytics;

// Test fixture producing debit and credit transactions
// Fixture de test produisant des transactions de débit et de crédit
class RecurringDetectorTest : public ::testing::Test {
protected:
    static Transaction debit(const CalendarDate& date, const std::string& narrative, double amount) {
        Transaction t;
        t.date = date;
        t.narrative = narrative;
        t.debit = amount;
        t.amount = amount;
        t.type = TransactionType::DEBIT;
        return t;
    }

    static Transaction credit(const CalendarDate& date, const std::string& narrative, double amount) {
        Transaction t = debit(date, narrative, amount);
        t.debit.reset();
        t.credit = amount;
        t.type = TransactionType::CREDIT;
        return t;
    }
};

TEST_F(RecurringDetectorTest, MonthlySubscription) {
    CalendarDate start(2024, 1, 5);
    std::vector<Transaction> txns = {
        debit(start, "UPI/DR/1/Netflix/x", 649.0),
        debit(start.addDays(30), "UPI/DR/2/Netflix/x", 649.0),
        debit(start.addDays(60), "UPI/DR/3/Netflix/x", 649.0),
        debit(start.addDays(10), "UPI/DR/4/Swiggy/x", 320.0),
    };

    auto payments = detectRecurringPayments(txns);

    ASSERT_EQ(payments.size(), 1u);
    const RecurringPayment& p = payments[0];
    EXPECT_EQ(p.merchant, "Netflix");
    EXPECT_DOUBLE_EQ(p.amount, 649.0);
    EXPECT_EQ(p.frequency, Frequency::MONTHLY);
    EXPECT_EQ(p.next_expected_date, start.addDays(90));
    EXPECT_EQ(p.category, RecurringCategory::SUBSCRIPTION);
    EXPECT_EQ(p.confidence, 100);
}

TEST_F(RecurringDetectorTest, AmountsInsideBandAreAveraged) {
    CalendarDate start(2024, 1, 1);
    std::vector<Transaction> txns = {
        debit(start.addDays(14), "NEFT-AIRTEL BROADBAND-1", 660.0),
        debit(start, "NEFT-AIRTEL BROADBAND-2", 640.0),
        debit(start.addDays(7), "NEFT-AIRTEL BROADBAND-3", 650.0),
    };

    auto payments = detectRecurringPayments(txns);

    ASSERT_EQ(payments.size(), 1u);
    EXPECT_EQ(payments[0].merchant, "Airtel Broadband");
    EXPECT_DOUBLE_EQ(payments[0].amount, 650.0);
    EXPECT_EQ(payments[0].frequency, Frequency::WEEKLY);
    EXPECT_EQ(payments[0].next_expected_date, start.addDays(21));
    EXPECT_EQ(payments[0].category, RecurringCategory::UTILITY);
}

TEST_F(RecurringDetectorTest, IrregularOrScatteredGroupsAreIgnored) {
    CalendarDate start(2024, 1, 1);
    std::vector<Transaction> irregular = {
        debit(start, "UPI/DR/1/Gym/x", 500.0),
        debit(start.addDays(15), "UPI/DR/2/Gym/x", 500.0),
        debit(start.addDays(30), "UPI/DR/3/Gym/x", 500.0),
    };
    EXPECT_TRUE(detectRecurringPayments(irregular).empty());

    std::vector<Transaction> scattered = {
        debit(start, "UPI/DR/1/Store/x", 100.0),
        debit(start.addDays(30), "UPI/DR/2/Store/x", 900.0),
    };
    EXPECT_TRUE(detectRecurringPayments(scattered).empty());
}

TEST_F(RecurringDetectorTest, CreditsAreIgnored) {
    CalendarDate start(2024, 1, 1);
    std::vector<Transaction> txns = {
        credit(start, "NEFT-ACME PAYROLL-1", 50000.0),
        credit(start.addDays(30), "NEFT-ACME PAYROLL-2", 50000.0),
        credit(start.addDays(60), "NEFT-ACME PAYROLL-3", 50000.0),
    };
    EXPECT_TRUE(detectRecurringPayments(txns).empty());
}

TEST_F(RecurringDetectorTest, ToleranceAndMinimumAreConfigurable) {
    CalendarDate start(2024, 1, 1);
    std::vector<Transaction> txns = {
        debit(start, "UPI/DR/1/Cloud/x", 100.0),
        debit(start.addDays(30), "UPI/DR/2/Cloud/x", 112.0),
    };

    EXPECT_TRUE(detectRecurringPayments(txns).empty());

    RecurringSettings wide;
    wide.amount_tolerance = 0.10;
    EXPECT_EQ(detectRecurringPayments(txns, wide).size(), 1u);

    wide.min_occurrences = 3;
    EXPECT_TRUE(detectRecurringPayments(txns, wide).empty());
}

TEST(RecurringHelpersTest, IntervalBands) {
    EXPECT_EQ(classifyInterval(7.0), Frequency::WEEKLY);
    EXPECT_EQ(classifyInterval(23.0), Frequency::MONTHLY);
    EXPECT_EQ(classifyInterval(37.0), Frequency::MONTHLY);
    EXPECT_EQ(classifyInterval(90.0), Frequency::QUARTERLY);
    EXPECT_EQ(classifyInterval(365.0), Frequency::YEARLY);
    EXPECT_FALSE(classifyInterval(15.0).has_value());
    EXPECT_FALSE(classifyInterval(200.0).has_value());
}

TEST(RecurringHelpersTest, ConfidenceAndCategory) {
    EXPECT_EQ(intervalConfidence({30, 30}, Frequency::MONTHLY), 100);
    EXPECT_EQ(intervalConfidence({33, 27}, Frequency::MONTHLY), 67);
    EXPECT_EQ(intervalConfidence({39}, Frequency::MONTHLY), 0);
    EXPECT_EQ(intervalConfidence({}, Frequency::MONTHLY), 0);

    EXPECT_EQ(classifyRecurringCategory("Spotify India", 119.0), RecurringCategory::SUBSCRIPTION);
    EXPECT_EQ(classifyRecurringCategory("Home Loan", 100.0), RecurringCategory::INSTALLMENT);
    EXPECT_EQ(classifyRecurringCategory("Landlord", 15000.0), RecurringCategory::INSTALLMENT);
    EXPECT_EQ(classifyRecurringCategory("Water Board", 300.0), RecurringCategory::UTILITY);
    EXPECT_EQ(classifyRecurringCategory("Gym", 1500.0), RecurringCategory::OTHER);
}
