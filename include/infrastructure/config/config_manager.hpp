// EN: YAML-backed configuration for detector thresholds, ingestion and logging settings.
// FR: Configuration basée sur YAML pour les seuils des détecteurs, l'ingestion et le logging.

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace FIN {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws std::runtime_error on empty value or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance std::runtime_error si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    // EN: Numeric view accepting both int and double payloads (YAML "3" parses as int).
    // FR: Vue numérique acceptant int et double (YAML "3" est parsé comme int).
    std::optional<double> asNumber() const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;

    // EN: Keys in sorted order so the emitted YAML is stable.
    // FR: Clés triées pour que le YAML émis soit stable.
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, environment overrides and validation rules.
//     One instance is built by the CLI and handed to AnalysisSettings::fromConfig.
// FR: Gestionnaire de configuration avec parsing YAML, surcharges d'environnement et règles de
//     validation. Une instance est construite par la CLI et passée à AnalysisSettings::fromConfig.
class ConfigManager {
public:
    // EN: Validation rule for a "section.key" entry.
    // FR: Règle de validation pour une entrée "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "number", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Effective configuration as YAML, sections and keys sorted (printed by "finsightctl config").
    // FR: Configuration effective en YAML, sections et clés triées (affichée par "finsightctl config").
    std::string toYaml() const;

    // EN: Apply PREFIX_SECTION_KEY environment variables for every key named by a validation rule.
    // FR: Applique les variables PREFIX_SECTION_CLE pour chaque clé nommée par une règle de validation.
    size_t loadEnvironmentOverrides(const std::string& prefix = "FINSIGHT_");

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    std::vector<std::string> sectionNames() const;

private:
    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;
    bool parseDocument(const YAML::Node& yaml);
    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    ConfigValue parseScalar(const std::string& raw) const;
    std::string expandVariables(const std::string& value) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace FIN
