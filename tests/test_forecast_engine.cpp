#include <gtest/gtest.h>

#include "forecast/forecast_engine.hpp"

using namespace FIN;
using namespace FIN::Forecast;

// Test fixture with a salary credit, one debit and two known recurring payments
// Fixture de test avec un salaire, un débit et deux paiements récurrents connus
class ForecastEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Transaction salary;
        salary.date = CalendarDate(2024, 1, 1);
        salary.credit = 10000.0;
        salary.amount = 10000.0;
        salary.balance = 10000.0;
        salary.type = TransactionType::CREDIT;

        Transaction rent;
        rent.date = CalendarDate(2024, 1, 11);
        rent.debit = 2000.0;
        rent.amount = 2000.0;
        rent.balance = 8000.0;
        rent.type = TransactionType::DEBIT;

        txns_ = {salary, rent};

        RecurringPayment gym;
        gym.merchant = "Gym";
        gym.amount = 500.0;
        gym.next_expected_date = CalendarDate(2024, 1, 25);

        RecurringPayment insurance;
        insurance.merchant = "Insurance";
        insurance.amount = 300.0;
        insurance.next_expected_date = CalendarDate(2024, 2, 15);

        recurring_ = {gym, insurance};
    }

    static BalanceForecast forecastOf(double predicted, double low, double high) {
        BalanceForecast forecast;
        forecast.date = CalendarDate(2024, 1, 31);
        forecast.predicted_balance = predicted;
        forecast.confidence_interval = ConfidenceInterval{low, high};
        return forecast;
    }

    ForecastEngine engine_;
    std::vector<Transaction> txns_;
    std::vector<RecurringPayment> recurring_;
};

TEST_F(ForecastEngineTest, DailyStatistics) {
    DailyAverages averages = ForecastEngine::dailyAverages(txns_);
    EXPECT_DOUBLE_EQ(averages.income, 1000.0);
    EXPECT_DOUBLE_EQ(averages.expense, 200.0);

    EXPECT_DOUBLE_EQ(ForecastEngine::dailyNetFlowStdDev(txns_), 6000.0);
    EXPECT_DOUBLE_EQ(ForecastEngine::dailyNetFlowStdDev({txns_[0]}), 0.0);

    EXPECT_DOUBLE_EQ(ForecastEngine::recurringDue(recurring_, DateRange{CalendarDate(2024, 1, 21), CalendarDate(2024, 1, 31)}),
                     500.0);
}

TEST_F(ForecastEngineTest, EndOfMonthForecast) {
    BalanceForecast forecast = engine_.forecastEndOfMonth(txns_, recurring_, CalendarDate(2024, 1, 21));

    EXPECT_EQ(forecast.date, CalendarDate(2024, 1, 31));
    EXPECT_DOUBLE_EQ(forecast.predicted_balance, 15500.0);
    EXPECT_DOUBLE_EQ(forecast.confidence_interval.low, -44500.0);
    EXPECT_DOUBLE_EQ(forecast.confidence_interval.high, 75500.0);
    EXPECT_GE(forecast.predicted_balance, forecast.confidence_interval.low);
    EXPECT_LE(forecast.predicted_balance, forecast.confidence_interval.high);

    std::vector<std::string> expected = {
        "Based on 2 historical transactions",
        "Average daily income: \xE2\x82\xB9" "1000.00",
        "Average daily expenses: \xE2\x82\xB9" "200.00",
        "2 recurring payments detected",
        "Recurring payments due: \xE2\x82\xB9" "500.00",
        "10 days remaining in month"
    };
    EXPECT_EQ(forecast.assumptions, expected);
}

TEST_F(ForecastEngineTest, EmptyHistory) {
    BalanceForecast forecast = engine_.forecastEndOfMonth({}, recurring_, CalendarDate(2024, 2, 10));

    EXPECT_EQ(forecast.date, CalendarDate(2024, 2, 29));
    EXPECT_DOUBLE_EQ(forecast.predicted_balance, 0.0);
    ASSERT_EQ(forecast.assumptions.size(), 1u);
    EXPECT_EQ(forecast.assumptions[0], "No transaction history available");
}

TEST_F(ForecastEngineTest, AlreadyAtEndOfMonth) {
    BalanceForecast forecast = engine_.forecastEndOfMonth(txns_, recurring_, CalendarDate(2024, 1, 31));

    EXPECT_DOUBLE_EQ(forecast.predicted_balance, 8000.0);
    EXPECT_DOUBLE_EQ(forecast.confidence_interval.low, 8000.0);
    EXPECT_DOUBLE_EQ(forecast.confidence_interval.high, 8000.0);
    EXPECT_EQ(forecast.assumptions, std::vector<std::string>{"Already at end of month"});
}

TEST_F(ForecastEngineTest, ProjectionsRespectHorizon) {
    auto projections = engine_.projectCashFlow(txns_, recurring_, 60, CalendarDate(2024, 1, 21));

    ASSERT_EQ(projections.size(), 2u);
    EXPECT_EQ(projections[0].period, "30 days");
    EXPECT_EQ(projections[0].horizon_days, 30);
    EXPECT_DOUBLE_EQ(projections[0].expected_inflow, 30000.0);
    EXPECT_DOUBLE_EQ(projections[0].expected_outflow, 6800.0);
    EXPECT_DOUBLE_EQ(projections[0].net_flow, 23200.0);
    EXPECT_EQ(projections[0].recurring_payments.size(), 2u);
    EXPECT_EQ(projections[1].period, "60 days");

    EXPECT_EQ(engine_.projectCashFlow(txns_, recurring_, 30, CalendarDate(2024, 1, 21)).size(), 1u);
    EXPECT_TRUE(engine_.projectCashFlow(txns_, recurring_, 10, CalendarDate(2024, 1, 21)).empty());
}

TEST_F(ForecastEngineTest, Warnings) {
    auto warnings = engine_.generateWarnings({
        forecastOf(-100.0, -200.0, 0.0),
        forecastOf(500.0, 0.0, 1000.0),
        forecastOf(5000.0, -10.0, 10000.0),
        forecastOf(5000.0, 100.0, 10000.0),
    });

    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings[0].type, WarningType::NEGATIVE_BALANCE);
    EXPECT_EQ(warnings[0].severity, WarningSeverity::CRITICAL);
    EXPECT_EQ(warnings[0].message,
              "Account balance is predicted to go negative (\xE2\x82\xB9-100.00) by 2024-01-31");
    EXPECT_EQ(warnings[1].type, WarningType::LOW_BALANCE);
    EXPECT_EQ(warnings[1].severity, WarningSeverity::WARNING);
    EXPECT_EQ(warnings[2].type, WarningType::NEGATIVE_BALANCE);
    EXPECT_EQ(warnings[2].severity, WarningSeverity::WARNING);
    EXPECT_EQ(warnings[2].message,
              "There is a risk of negative balance (worst case: \xE2\x82\xB9-10.00) by 2024-01-31");
}

TEST_F(ForecastEngineTest, FloorIsConfigurable) {
    ForecastSettings settings;
    settings.low_balance_floor = 100.0;
    ForecastEngine engine(settings);

    EXPECT_TRUE(engine.generateWarnings({forecastOf(500.0, 0.0, 1000.0)}).empty());
}
