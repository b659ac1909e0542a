// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, environment
//     overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing de configuration YAML, les
//     surcharges d'environnement et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <regex>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace FIN {

std::optional<double> ConfigValue::asNumber() const {
    if (auto d = tryAs<double>()) {
        return *d;
    }
    if (auto i = tryAs<int>()) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation

bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!parseDocument(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping: " + filename);
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!parseDocument(yaml)) {
            LOG_ERROR("config", "Configuration root must be a mapping");
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

// EN: Convert the YAML document into sections. Caller holds the mutex.
// FR: Convertit le document YAML en sections. L'appelant détient le mutex.
bool ConfigManager::parseDocument(const YAML::Node& yaml) {
    if (yaml.IsNull()) {
        sections_.clear();
        return true;
    }
    if (!yaml.IsMap()) {
        return false;
    }

    sections_.clear();
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        sections_[section_name] = config_section;
    }
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(item.as<std::string>());
        }
        return ConfigValue(array_value);
    }
    if (node.IsScalar()) {
        return parseScalar(node.Scalar());
    }
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }
    // EN: Nested maps are not part of the schema; keep their YAML text.
    // FR: Les maps imbriquées ne font pas partie du schéma ; on garde leur texte YAML.
    YAML::Emitter emitter;
    emitter << node;
    return ConfigValue(std::string(emitter.c_str()));
}

// EN: Scalars are typed bool, then int, then double, falling back to string.
// FR: Les scalaires sont typés bool, puis int, puis double, sinon chaîne.
ConfigValue ConfigManager::parseScalar(const std::string& raw) const {
    if (raw == "true" || raw == "false") {
        return ConfigValue(raw == "true");
    }

    static const std::regex int_regex(R"(^[+-]?\d+$)");
    static const std::regex double_regex(R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)");

    if (std::regex_match(raw, int_regex)) {
        try {
            return ConfigValue(std::stoi(raw));
        } catch (const std::out_of_range&) {
            return ConfigValue(std::stod(raw));
        }
    }
    if (std::regex_match(raw, double_regex)) {
        return ConfigValue(std::stod(raw));
    }
    return ConfigValue(expandVariables(raw));
}

// EN: Emits one YAML node per ConfigValue alternative.
// FR: Émet un nœud YAML par alternative de ConfigValue.
static void emitValue(YAML::Emitter& emitter, const ConfigValue& value) {
    if (auto flag = value.tryAs<bool>()) {
        emitter << *flag;
    } else if (auto count = value.tryAs<int>()) {
        emitter << *count;
    } else if (auto number = value.tryAs<double>()) {
        emitter << *number;
    } else if (auto list = value.tryAs<std::vector<std::string>>()) {
        emitter << YAML::Flow << *list;
    } else {
        emitter << value.asOrDefault<std::string>("");
    }
}

std::string ConfigManager::toYaml() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, const ConfigSection*> ordered;
    for (const auto& [name, section] : sections_) {
        ordered.emplace(name, &section);
    }

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    for (const auto& [name, section] : ordered) {
        emitter << YAML::Key << name << YAML::Value << YAML::BeginMap;
        for (const std::string& key : section->keys()) {
            emitter << YAML::Key << key << YAML::Value;
            emitValue(emitter, section->get(key));
        }
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndMap;
    return std::string(emitter.c_str()) + "\n";
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::vector<ValidationRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = validation_rules_;
    }

    size_t applied = 0;
    for (const auto& rule : rules) {
        size_t dot_pos = rule.key.find('.');
        if (dot_pos == std::string::npos) {
            continue;
        }
        std::string section = rule.key.substr(0, dot_pos);
        std::string key = rule.key.substr(dot_pos + 1);

        // EN: forecast.low_balance_floor -> FINSIGHT_FORECAST_LOW_BALANCE_FLOOR
        // FR: forecast.low_balance_floor -> FINSIGHT_FORECAST_LOW_BALANCE_FLOOR
        std::string env_name = prefix + section + "_" + key;
        std::transform(env_name.begin(), env_name.end(), env_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        const char* env_value = std::getenv(env_name.c_str());
        if (!env_value) {
            continue;
        }

        ConfigValue value;
        if (rule.type == "array") {
            std::vector<std::string> items;
            std::stringstream ss(env_value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) items.push_back(item);
            }
            value = ConfigValue(items);
        } else if (rule.type == "string") {
            value = ConfigValue(std::string(env_value));
        } else {
            value = parseScalar(env_value);
        }

        set(section, key, value);
        ++applied;
        LOG_INFO("config", "Environment override applied: " + rule.key);
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = getUnlocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

std::vector<std::string> ConfigManager::sectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if ((rule.type == "double" || rule.type == "number") && !value.asNumber()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if (rule.min_value || rule.max_value) {
        if (auto numeric_value = value.asNumber()) {
            if (rule.min_value && *numeric_value < *rule.min_value) {
                error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
                return false;
            }
            if (rule.max_value && *numeric_value > *rule.max_value) {
                error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
                return false;
            }
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();

    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        // EN: Unknown variables are left as-is.
        // FR: Les variables inconnues sont laissées telles quelles.
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace FIN
