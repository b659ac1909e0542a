// EN: Typed settings for ingestion, detectors and forecasting, read from a ConfigManager.
// FR: Paramètres typés pour l'ingestion, les détecteurs et la prévision, lus depuis un ConfigManager.

#pragma once

#include "infrastructure/config/config_manager.hpp"

#include <string>
#include <vector>

namespace FIN {

struct IngestSettings {
    int header_scan_rows{40};
    std::string bank_label{"State Bank of India"};
};

struct RecurringSettings {
    double amount_tolerance{0.05}; // EN: relative band around the group mean / FR: bande relative autour de la moyenne
    int min_occurrences{2};
};

struct AnomalySettings {
    double high_amount_multiplier{3.0};
    double spike_multiplier{2.0};
    int duplicate_amount_decimals{2};
};

struct ForecastSettings {
    double low_balance_floor{1000.0};
    std::vector<int> projection_periods{30, 60, 90};
    int horizon_days{90};
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;
};

struct AnalysisSettings {
    IngestSettings ingest;
    RecurringSettings recurring;
    AnomalySettings anomaly;
    ForecastSettings forecast;
    LoggingSettings logging;

    // EN: Read every known key, keeping the default for missing or mistyped values.
    // FR: Lit chaque clé connue en gardant la valeur par défaut si absente ou mal typée.
    static AnalysisSettings fromConfig(const ConfigManager& config);

    // EN: Write the defaults into a config (used to seed a sample file).
    // FR: Écrit les valeurs par défaut dans une config (pour générer un fichier d'exemple).
    static void writeDefaults(ConfigManager& config);

    // EN: Validation rules for every key above; also drives FINSIGHT_* environment overrides.
    // FR: Règles de validation pour chaque clé ; pilote aussi les surcharges FINSIGHT_*.
    static std::vector<ConfigManager::ValidationRule> validationRules();
};

} // namespace FIN
