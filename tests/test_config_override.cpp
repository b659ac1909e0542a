#include <gtest/gtest.h>

#include "infrastructure/cli/config_override.hpp"

using namespace FIN;
using namespace FIN::CLI;

// Test fixture with a small finsightctl-like option set
// Fixture de test avec un jeu d'options proche de finsightctl
class ConfigOverrideParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        CliOptionDefinition store;
        store.long_name = "store";
        store.config_path = "_store";
        store.default_value = "./finsight-data";

        CliOptionDefinition level;
        level.long_name = "log-level";
        level.config_path = "logging.level";
        level.constraint = CliOptionConstraint::ENUM_VALUES;
        level.enum_values = {"debug", "info", "warn", "error"};

        CliOptionDefinition horizon;
        horizon.long_name = "horizon";
        horizon.type = CliOptionType::INTEGER;
        horizon.config_path = "forecast.horizon_days";
        horizon.constraint = CliOptionConstraint::POSITIVE;

        CliOptionDefinition verbose;
        verbose.long_name = "verbose";
        verbose.short_name = 'v';
        verbose.type = CliOptionType::BOOLEAN;
        verbose.config_path = "_verbose";

        parser.addOptions({store, level, horizon, verbose});
    }

    ConfigOverrideParser parser{"finsightctl", "1.0.0"};
};

TEST_F(ConfigOverrideParserTest, CollectsPositionalsAndOptions) {
    auto result = parser.parse(std::vector<std::string>{"import", "stmt.xlsx", "--horizon", "30", "-v"});

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.positionals, (std::vector<std::string>{"import", "stmt.xlsx"}));
    EXPECT_EQ(result.value("horizon"), std::optional<std::string>("30"));
    EXPECT_TRUE(result.has("verbose"));
    EXPECT_EQ(result.overrides.at("forecast.horizon_days").as<int>(), 30);
}

TEST_F(ConfigOverrideParserTest, AcceptsInlineValuesAndDefaults) {
    auto result = parser.parse(std::vector<std::string>{"--log-level=debug", "analyze"});

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value("log-level"), std::optional<std::string>("debug"));
    EXPECT_EQ(result.value("store"), std::optional<std::string>("./finsight-data"));
    EXPECT_FALSE(result.value("horizon").has_value());
}

TEST_F(ConfigOverrideParserTest, DoubleDashEndsOptions) {
    auto result = parser.parse(std::vector<std::string>{"import", "--", "--odd-name.xlsx"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.positionals.back(), "--odd-name.xlsx");
}

TEST_F(ConfigOverrideParserTest, ReportsErrors) {
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--bogus"}).status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--horizon"}).status, CliParseStatus::MISSING_VALUE);
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--horizon", "-3"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--horizon", "ten"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser.parse(std::vector<std::string>{"--log-level", "loud"}).status, CliParseStatus::INVALID_VALUE);
}

TEST_F(ConfigOverrideParserTest, HelpAndVersion) {
    EXPECT_EQ(parser.parse(std::vector<std::string>{"analyze", "--help"}).status, CliParseStatus::HELP_REQUESTED);
    EXPECT_EQ(parser.parse(std::vector<std::string>{"-V"}).status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_NE(parser.generateHelpText().find("--horizon <integer>"), std::string::npos);
    EXPECT_EQ(parser.generateVersionText(), "finsightctl 1.0.0\n");
}

TEST_F(ConfigOverrideParserTest, DuplicateDefinitionsThrow) {
    CliOptionDefinition dup;
    dup.long_name = "store";
    EXPECT_THROW(parser.addOption(dup), std::invalid_argument);
    CliOptionDefinition unnamed;
    EXPECT_THROW(parser.addOption(unnamed), std::invalid_argument);
}

TEST_F(ConfigOverrideParserTest, AppliesOnlySectionOverrides) {
    auto result = parser.parse(std::vector<std::string>{"--horizon", "60", "--store", "/tmp/x", "--log-level", "warn"});
    ASSERT_TRUE(result.ok());

    ConfigManager config;
    EXPECT_EQ(ConfigOverrideParser::applyOverrides(result, config), 2u);
    EXPECT_EQ(config.get("forecast", "horizon_days").as<int>(), 60);
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "warn");
    EXPECT_FALSE(config.has("_store", ""));
}

TEST(ConfigOverrideUtilsTest, ValueParsing) {
    using namespace ConfigOverrideUtils;
    EXPECT_TRUE(parseCliValue("yes", CliOptionType::BOOLEAN).as<bool>());
    EXPECT_EQ(parseCliValue("food, travel ,", CliOptionType::STRING_LIST).as<std::vector<std::string>>(),
              (std::vector<std::string>{"food", "travel"}));
    EXPECT_TRUE(isLongOption("--store"));
    EXPECT_TRUE(isShortOption("-v"));
    EXPECT_FALSE(isShortOption("-5"));
    EXPECT_EQ(extractOptionName("--as-of"), "as-of");
}
