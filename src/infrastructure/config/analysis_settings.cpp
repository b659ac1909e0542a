#include "infrastructure/config/analysis_settings.hpp"
#include "infrastructure/logging/logger.hpp"

#include <string>

namespace FIN {

namespace {

double readNumber(const ConfigManager& config, const std::string& section,
                  const std::string& key, double fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto number = value.asNumber()) {
        return *number;
    }
    LOG_WARN("config", section + "." + key + " is not numeric, using default");
    return fallback;
}

int readInt(const ConfigManager& config, const std::string& section,
            const std::string& key, int fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto number = value.tryAs<int>()) {
        return *number;
    }
    LOG_WARN("config", section + "." + key + " is not an integer, using default");
    return fallback;
}

std::string readString(const ConfigManager& config, const std::string& section,
                       const std::string& key, const std::string& fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto text = value.tryAs<std::string>()) {
        return *text;
    }
    // EN: A scalar such as "warn" or 42 may have been typed; keep its textual form.
    // FR: Un scalaire a pu être typé ; on garde sa forme textuelle.
    return value.toString();
}

std::vector<int> readIntList(const ConfigManager& config, const std::string& section,
                             const std::string& key, const std::vector<int>& fallback) {
    ConfigValue value = config.get(section, key);
    auto items = value.tryAs<std::vector<std::string>>();
    if (!items) {
        return fallback;
    }
    std::vector<int> result;
    for (const auto& item : *items) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(item, &consumed);
            if (consumed != item.size() || parsed <= 0) {
                throw std::invalid_argument(item);
            }
            result.push_back(parsed);
        } catch (const std::exception&) {
            LOG_WARN("config", section + "." + key + " contains invalid entry '" + item + "', using default");
            return fallback;
        }
    }
    return result.empty() ? fallback : result;
}

} // namespace

AnalysisSettings AnalysisSettings::fromConfig(const ConfigManager& config) {
    AnalysisSettings s;

    s.ingest.header_scan_rows = readInt(config, "ingest", "header_scan_rows", s.ingest.header_scan_rows);
    s.ingest.bank_label = readString(config, "ingest", "bank_label", s.ingest.bank_label);

    s.recurring.amount_tolerance = readNumber(config, "recurring", "amount_tolerance", s.recurring.amount_tolerance);
    s.recurring.min_occurrences = readInt(config, "recurring", "min_occurrences", s.recurring.min_occurrences);

    s.anomaly.high_amount_multiplier =
        readNumber(config, "anomaly", "high_amount_multiplier", s.anomaly.high_amount_multiplier);
    s.anomaly.spike_multiplier = readNumber(config, "anomaly", "spike_multiplier", s.anomaly.spike_multiplier);
    s.anomaly.duplicate_amount_decimals =
        readInt(config, "anomaly", "duplicate_amount_decimals", s.anomaly.duplicate_amount_decimals);

    s.forecast.low_balance_floor = readNumber(config, "forecast", "low_balance_floor", s.forecast.low_balance_floor);
    s.forecast.projection_periods =
        readIntList(config, "forecast", "projection_periods", s.forecast.projection_periods);
    s.forecast.horizon_days = readInt(config, "forecast", "horizon_days", s.forecast.horizon_days);

    s.logging.level = readString(config, "logging", "level", s.logging.level);
    s.logging.file = readString(config, "logging", "file", s.logging.file);

    return s;
}

void AnalysisSettings::writeDefaults(ConfigManager& config) {
    const AnalysisSettings d;
    config.set("ingest", "header_scan_rows", ConfigValue(d.ingest.header_scan_rows));
    config.set("ingest", "bank_label", ConfigValue(d.ingest.bank_label));
    config.set("recurring", "amount_tolerance", ConfigValue(d.recurring.amount_tolerance));
    config.set("recurring", "min_occurrences", ConfigValue(d.recurring.min_occurrences));
    config.set("anomaly", "high_amount_multiplier", ConfigValue(d.anomaly.high_amount_multiplier));
    config.set("anomaly", "spike_multiplier", ConfigValue(d.anomaly.spike_multiplier));
    config.set("anomaly", "duplicate_amount_decimals", ConfigValue(d.anomaly.duplicate_amount_decimals));
    config.set("forecast", "low_balance_floor", ConfigValue(d.forecast.low_balance_floor));

    std::vector<std::string> periods;
    for (int p : d.forecast.projection_periods) {
        periods.push_back(std::to_string(p));
    }
    config.set("forecast", "projection_periods", ConfigValue(periods));
    config.set("forecast", "horizon_days", ConfigValue(d.forecast.horizon_days));
    config.set("logging", "level", ConfigValue(d.logging.level));
    config.set("logging", "file", ConfigValue(d.logging.file));
}

std::vector<ConfigManager::ValidationRule> AnalysisSettings::validationRules() {
    using Rule = ConfigManager::ValidationRule;
    std::vector<Rule> rules;

    auto add = [&rules](const std::string& key, const std::string& type,
                        std::optional<double> min_value, std::optional<double> max_value,
                        const std::string& description) {
        Rule rule;
        rule.key = key;
        rule.type = type;
        rule.min_value = min_value;
        rule.max_value = max_value;
        rule.description = description;
        rules.push_back(rule);
    };

    add("ingest.header_scan_rows", "int", 1.0, 1000.0, "Rows scanned for the header");
    add("ingest.bank_label", "string", std::nullopt, std::nullopt, "Bank label stored in parse metadata");
    add("recurring.amount_tolerance", "number", 0.0, 1.0, "Relative amount band for recurring members");
    add("recurring.min_occurrences", "int", 2.0, std::nullopt, "Minimum members of a recurring group");
    add("anomaly.high_amount_multiplier", "number", 1.0, std::nullopt, "Multiple of merchant mean flagged as high");
    add("anomaly.spike_multiplier", "number", 1.0, std::nullopt, "Multiple of daily average flagged as spike");
    add("anomaly.duplicate_amount_decimals", "int", 0.0, 6.0, "Decimals compared by duplicate detection");
    add("forecast.low_balance_floor", "number", std::nullopt, std::nullopt, "Low balance warning threshold");
    add("forecast.projection_periods", "array", std::nullopt, std::nullopt, "Cash-flow projection periods in days");
    add("forecast.horizon_days", "int", 1.0, 3650.0, "Default cash-flow horizon");

    Rule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "warning", "error", "DEBUG", "INFO", "WARN", "ERROR"};
    level.description = "Minimum log level";
    rules.push_back(level);

    add("logging.file", "string", std::nullopt, std::nullopt, "Log file path, empty for stderr");
    return rules;
}

} // namespace FIN
