// EN: Command-line parsing for finsightctl: option definitions, positional arguments and config overrides.
// FR: Analyse de la ligne de commande de finsightctl : définitions d'options, arguments positionnels
//     et surcharges de configuration.

#pragma once

#include "infrastructure/config/config_manager.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace FIN {
namespace CLI {

enum class CliOptionType {
    BOOLEAN,        // EN: Flag, takes no value / FR: Drapeau, sans valeur
    INTEGER,
    DOUBLE,
    STRING,
    STRING_LIST     // EN: Comma-separated list / FR: Liste séparée par des virgules
};

enum class CliOptionConstraint {
    NONE,
    POSITIVE,
    NON_NEGATIVE,
    ENUM_VALUES
};

enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,
    MISSING_VALUE,
    INVALID_VALUE
};

// EN: One option. A config_path of the form "section.key" turns the value into a config override;
//     a path starting with '_' is CLI-only and never reaches the ConfigManager.
// FR: Une option. Un config_path "section.clé" transforme la valeur en surcharge de configuration ;
//     un chemin commençant par '_' reste propre à la CLI.
struct CliOptionDefinition {
    std::string long_name;
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;
    std::optional<std::string> default_value;
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;
    std::string category = "General";
};

struct CliOptionValue {
    std::string option_name;
    CliOptionType type = CliOptionType::STRING;
    std::string raw_value;
    ConfigValue config_value;
    std::string config_path;
};

struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<std::string> positionals;
    std::map<std::string, CliOptionValue> options;                // EN: by long name / FR: par nom long
    std::unordered_map<std::string, ConfigValue> overrides;       // EN: by config path / FR: par chemin de config
    std::vector<std::string> errors;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& long_name) const { return options.count(long_name) > 0; }
    std::optional<std::string> value(const std::string& long_name) const;
};

// EN: Options may appear before or after positionals; "--" ends option parsing. "--name=value"
//     and "--name value" are both accepted.
// FR: Les options peuvent précéder ou suivre les positionnels ; "--" arrête l'analyse des options.
//     "--nom=valeur" et "--nom valeur" sont acceptés.
class ConfigOverrideParser {
public:
    ConfigOverrideParser(std::string program_name, std::string version);

    // EN: Throws std::invalid_argument on an empty or duplicate name.
    // FR: Lance std::invalid_argument pour un nom vide ou en double.
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);
    bool hasOption(const std::string& long_name) const;

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    void setUsage(const std::string& usage) { usage_ = usage; }
    std::string generateHelpText() const;
    std::string generateVersionText() const;

    // EN: Copy every "section.key" override into config. Returns the number applied.
    // FR: Copie chaque surcharge "section.clé" dans la config. Retourne le nombre appliqué.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    const CliOptionDefinition* find(const std::string& arg) const;

    std::string program_name_;
    std::string version_;
    std::string usage_;
    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, size_t> by_long_name_;
    std::unordered_map<char, size_t> by_short_name_;
};

namespace ConfigOverrideUtils {

std::string cliOptionTypeToString(CliOptionType type);
std::string cliParseStatusToString(CliParseStatus status);

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);
bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message);

std::string formatOptionHelp(const CliOptionDefinition& option);

bool isShortOption(const std::string& arg);
bool isLongOption(const std::string& arg);
std::string extractOptionName(const std::string& arg);

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace FIN
