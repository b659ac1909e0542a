#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "infrastructure/config/config_manager.hpp"

using namespace FIN;

namespace {

const char* kSampleYaml = R"(
ingest:
  header_scan_rows: 25
  bank_label: "HDFC Bank"

recurring:
  amount_tolerance: 0.1
  min_occurrences: 3

forecast:
  low_balance_floor: 2500
  projection_periods: [15, 30]

logging:
  level: debug
  file: ${FINSIGHT_TEST_LOG_DIR}/finsight.log
)";

} // namespace

// Test fixture for ConfigManager tests
// Fixture de test pour les tests ConfigManager
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "finsight_config_test";
        std::filesystem::create_directories(test_dir);
        setenv("FINSIGHT_TEST_LOG_DIR", "/var/tmp", 1);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        unsetenv("FINSIGHT_TEST_LOG_DIR");
        unsetenv("FINSIGHT_FORECAST_LOW_BALANCE_FLOOR");
        unsetenv("FINSIGHT_FORECAST_PROJECTION_PERIODS");
        unsetenv("FINSIGHT_INGEST_BANK_LABEL");
    }

    std::filesystem::path test_dir;
    ConfigManager config;
};

TEST(ConfigValueTest, TypedAccess) {
    ConfigValue flag(true);
    ConfigValue count(42);
    ConfigValue ratio(0.05);
    ConfigValue label("SBI");
    ConfigValue periods(std::vector<std::string>{"30", "60"});

    EXPECT_TRUE(flag.as<bool>());
    EXPECT_EQ(count.as<int>(), 42);
    EXPECT_DOUBLE_EQ(ratio.as<double>(), 0.05);
    EXPECT_EQ(label.as<std::string>(), "SBI");
    EXPECT_EQ(periods.as<std::vector<std::string>>().size(), 2u);

    EXPECT_THROW(count.as<std::string>(), std::runtime_error);
    EXPECT_THROW(ConfigValue().as<int>(), std::runtime_error);
    EXPECT_FALSE(count.tryAs<bool>().has_value());
    EXPECT_EQ(count.asOrDefault<std::string>("fallback"), "fallback");
}

TEST(ConfigValueTest, NumericViewAcceptsIntAndDouble) {
    EXPECT_DOUBLE_EQ(*ConfigValue(3).asNumber(), 3.0);
    EXPECT_DOUBLE_EQ(*ConfigValue(2.5).asNumber(), 2.5);
    EXPECT_FALSE(ConfigValue("3").asNumber().has_value());
}

TEST(ConfigValueTest, ToString) {
    EXPECT_EQ(ConfigValue(false).toString(), "false");
    EXPECT_EQ(ConfigValue(7).toString(), "7");
    EXPECT_EQ(ConfigValue(std::vector<std::string>{"a", "b"}).toString(), "[a, b]");
    EXPECT_EQ(ConfigValue().toString(), "<empty>");
}

TEST_F(ConfigManagerTest, LoadsTypedValuesFromYaml) {
    ASSERT_TRUE(config.loadFromString(kSampleYaml));

    EXPECT_EQ(config.get("ingest", "header_scan_rows").as<int>(), 25);
    EXPECT_EQ(config.get("ingest", "bank_label").as<std::string>(), "HDFC Bank");
    EXPECT_DOUBLE_EQ(config.get("recurring", "amount_tolerance").as<double>(), 0.1);
    EXPECT_EQ(config.get("forecast", "low_balance_floor").as<int>(), 2500);
    auto periods = config.get("forecast", "projection_periods").as<std::vector<std::string>>();
    ASSERT_EQ(periods.size(), 2u);
    EXPECT_EQ(periods[0], "15");
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariables) {
    ASSERT_TRUE(config.loadFromString(kSampleYaml));
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/var/tmp/finsight.log");
}

TEST_F(ConfigManagerTest, RejectsNonMappingRootAndBadYaml) {
    EXPECT_FALSE(config.loadFromString("- a\n- b\n"));
    EXPECT_FALSE(config.loadFromString("ingest: [unclosed"));
    EXPECT_FALSE(config.loadFromFile((test_dir / "missing.yaml").string()));
}

TEST_F(ConfigManagerTest, EffectiveYamlReloads) {
    ASSERT_TRUE(config.loadFromString(kSampleYaml));
    std::string yaml = config.toYaml();
    EXPECT_LT(yaml.find("forecast:"), yaml.find("ingest:"));

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromString(yaml));
    EXPECT_EQ(reloaded.get("ingest", "header_scan_rows").as<int>(), 25);
    EXPECT_EQ(reloaded.get("ingest", "bank_label").as<std::string>(), "HDFC Bank");
    EXPECT_EQ(reloaded.get("forecast", "projection_periods").as<std::vector<std::string>>(),
              (std::vector<std::string>{"15", "30"}));
    EXPECT_EQ(reloaded.sectionNames(), config.sectionNames());
}

TEST_F(ConfigManagerTest, SetAndHas) {
    config.set("anomaly", "spike_multiplier", ConfigValue(2.0));
    EXPECT_TRUE(config.has("anomaly", "spike_multiplier"));
    EXPECT_FALSE(config.has("anomaly", "high_amount_multiplier"));
    EXPECT_FALSE(config.get("nowhere", "nothing").isValid());
    EXPECT_EQ(config.sectionNames(), std::vector<std::string>{"anomaly"});

    ConfigSection section;
    section.set("b", ConfigValue(1));
    section.set("a", ConfigValue(2));
    EXPECT_EQ(section.keys(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ConfigManagerTest, ValidationRules) {
    ConfigManager::ValidationRule tolerance;
    tolerance.key = "recurring.amount_tolerance";
    tolerance.type = "number";
    tolerance.min_value = 0.0;
    tolerance.max_value = 1.0;

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info"};

    ConfigManager::ValidationRule required;
    required.key = "ingest.bank_label";
    required.type = "string";
    required.required = true;

    config.addValidationRules({tolerance, level, required});

    config.set("recurring", "amount_tolerance", ConfigValue(1.5));
    config.set("logging", "level", ConfigValue("trace"));

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 3u);

    config.set("recurring", "amount_tolerance", ConfigValue(1));
    config.set("logging", "level", ConfigValue("info"));
    config.set("ingest", "bank_label", ConfigValue("SBI"));
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFollowRuleKeys) {
    ConfigManager::ValidationRule floor;
    floor.key = "forecast.low_balance_floor";
    floor.type = "number";
    ConfigManager::ValidationRule periods;
    periods.key = "forecast.projection_periods";
    periods.type = "array";
    ConfigManager::ValidationRule label;
    label.key = "ingest.bank_label";
    label.type = "string";
    config.addValidationRules({floor, periods, label});

    setenv("FINSIGHT_FORECAST_LOW_BALANCE_FLOOR", "750.5", 1);
    setenv("FINSIGHT_FORECAST_PROJECTION_PERIODS", "7,14", 1);
    setenv("FINSIGHT_INGEST_BANK_LABEL", "12345", 1);

    EXPECT_EQ(config.loadEnvironmentOverrides("FINSIGHT_"), 3u);
    EXPECT_DOUBLE_EQ(config.get("forecast", "low_balance_floor").as<double>(), 750.5);
    EXPECT_EQ(config.get("forecast", "projection_periods").as<std::vector<std::string>>(),
              (std::vector<std::string>{"7", "14"}));
    // String-typed keys are never re-typed
    // Les clés de type chaîne ne sont jamais re-typées
    EXPECT_EQ(config.get("ingest", "bank_label").as<std::string>(), "12345");
}
