#include <gtest/gtest.h>

#include "budget/spending_limits.hpp"

#include <stdexcept>

using namespace FIN;
using namespace FIN::Budgeting;

// Test fixture with a month of debits around a fixed reference day
// Fixture de test avec un mois de débits autour d'un jour de référence fixe
class SpendingLimitsTest : public ::testing::Test {
protected:
    void SetUp() override {
        txns_ = {
            make(CalendarDate(2024, 2, 28), "SWIGGY ORDER", 1000.0, {"tag-1"}),
            make(CalendarDate(2024, 3, 2), "SWIGGY ORDER", 500.0, {"tag-1"}),
            make(CalendarDate(2024, 3, 10), "SWIGGY/ORDER", 200.0, {"tag-1"}),
            make(CalendarDate(2024, 3, 10), "ZOMATO ORDER", 100.0, {}),
            make(CalendarDate(2024, 3, 11), "SWIGGY ORDER", 50.0, {"tag-1"}),
            make(CalendarDate(2024, 3, 10), "NEFT-REFUND", 900.0, {}, TransactionType::CREDIT),
        };
    }

    static Transaction make(const CalendarDate& date, const std::string& narrative, double amount,
                            std::vector<std::string> tag_ids, TransactionType type = TransactionType::DEBIT) {
        Transaction t;
        t.date = date;
        t.narrative = narrative;
        t.reference = narrative + date.toCompactString();
        t.amount = amount;
        t.type = type;
        if (type == TransactionType::DEBIT) {
            t.debit = amount;
        } else {
            t.credit = amount;
        }
        t.tag_ids = std::move(tag_ids);
        return t;
    }

    SpendingLimit limit(LimitType type, double cap, const std::optional<std::string>& target = std::nullopt) const {
        return createSpendingLimit(type, cap, target, std::nullopt, now_);
    }

    const CalendarDate as_of_{2024, 3, 10};
    const Timestamp now_{std::chrono::milliseconds(1710028800000LL)};
    std::vector<Transaction> txns_;
};

TEST_F(SpendingLimitsTest, CreateFillsDefaultsAndValidates) {
    SpendingLimit daily = limit(LimitType::DAILY, 500.0);
    EXPECT_EQ(daily.target_name, "Daily Spending");
    EXPECT_TRUE(daily.is_active);
    EXPECT_FALSE(daily.target_id.has_value());
    EXPECT_EQ(daily.id, "limit-1710028800000-daily");

    SpendingLimit named = createSpendingLimit(LimitType::CATEGORY, 900.0, std::string("tag-1"),
                                              std::string("Food"), now_);
    EXPECT_EQ(named.target_name, "Food");

    EXPECT_THROW(limit(LimitType::MONTHLY, 0.0), std::invalid_argument);
    EXPECT_THROW(limit(LimitType::CATEGORY, 100.0), std::invalid_argument);
    EXPECT_THROW(limit(LimitType::MERCHANT, 100.0, std::string("")), std::invalid_argument);

    EXPECT_EQ(limitTypeFromString("merchant"), LimitType::MERCHANT);
    EXPECT_FALSE(limitTypeFromString("weekly").has_value());
}

TEST_F(SpendingLimitsTest, MerchantKeyIsFirstToken) {
    EXPECT_EQ(limitMerchantKey("  UPI/DR/1/Swiggy"), "upi");
    EXPECT_EQ(limitMerchantKey("Swiggy Order 12"), "swiggy");
    EXPECT_EQ(limitMerchantKey("   "), "");
}

TEST_F(SpendingLimitsTest, CurrentSpendingPerType) {
    EXPECT_DOUBLE_EQ(currentSpending(limit(LimitType::DAILY, 500.0), txns_, as_of_), 300.0);
    EXPECT_DOUBLE_EQ(currentSpending(limit(LimitType::MONTHLY, 2000.0), txns_, as_of_), 800.0);
    EXPECT_DOUBLE_EQ(currentSpending(limit(LimitType::CATEGORY, 900.0, std::string("tag-1")), txns_, as_of_),
                     700.0);
    EXPECT_DOUBLE_EQ(currentSpending(limit(LimitType::MERCHANT, 900.0, std::string("Swiggy")), txns_, as_of_),
                     700.0);

    // A category limit stored without target counts nothing
    // Une limite catégorie stockée sans cible ne compte rien
    SpendingLimit untargeted = limit(LimitType::MONTHLY, 100.0);
    untargeted.type = LimitType::CATEGORY;
    EXPECT_DOUBLE_EQ(currentSpending(untargeted, txns_, as_of_), 0.0);
}

TEST_F(SpendingLimitsTest, CheckReportsLimitsTheCandidateWouldBreach) {
    SpendingLimit daily = limit(LimitType::DAILY, 500.0);
    SpendingLimit monthly = limit(LimitType::MONTHLY, 2000.0);
    SpendingLimit category = limit(LimitType::CATEGORY, 900.0, std::string("tag-1"));
    SpendingLimit inactive = limit(LimitType::DAILY, 100.0);
    inactive.is_active = false;

    Transaction candidate = make(as_of_, "SWIGGY ORDER", 250.0, {"tag-1"});
    auto tripped = checkSpendingLimits(candidate, {daily, monthly, category, inactive}, txns_, as_of_);

    ASSERT_EQ(tripped.size(), 2u);
    EXPECT_EQ(tripped[0].type, LimitType::DAILY);
    EXPECT_EQ(tripped[1].type, LimitType::CATEGORY);

    Transaction refund = make(as_of_, "REFUND", 5000.0, {}, TransactionType::CREDIT);
    EXPECT_TRUE(checkSpendingLimits(refund, {daily}, txns_, as_of_).empty());
}

TEST_F(SpendingLimitsTest, StatusWarningAndExceeded) {
    SpendingLimit monthly = limit(LimitType::MONTHLY, 1000.0);
    SpendingLimit daily_at_cap = limit(LimitType::DAILY, 300.0);
    SpendingLimit daily_over = limit(LimitType::DAILY, 250.0);

    auto statuses = limitStatuses({monthly}, txns_, as_of_);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_DOUBLE_EQ(statuses[0].current_spend, 800.0);
    EXPECT_DOUBLE_EQ(statuses[0].percent_used, 80.0);
    EXPECT_DOUBLE_EQ(statuses[0].remaining, 200.0);

    auto warnings = warningLimits({monthly, daily_at_cap, daily_over}, txns_, as_of_);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].type, LimitType::MONTHLY);

    auto exceeded = exceededLimits({monthly, daily_at_cap, daily_over}, txns_, as_of_);
    ASSERT_EQ(exceeded.size(), 1u);
    EXPECT_DOUBLE_EQ(exceeded[0].limit, 250.0);
}
