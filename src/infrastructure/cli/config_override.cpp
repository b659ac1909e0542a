#include "infrastructure/cli/config_override.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace FIN {
namespace CLI {

std::optional<std::string> CliParseResult::value(const std::string& long_name) const {
    auto it = options.find(long_name);
    if (it == options.end()) {
        return std::nullopt;
    }
    return it->second.raw_value;
}

ConfigOverrideParser::ConfigOverrideParser(std::string program_name, std::string version)
    : program_name_(std::move(program_name)),
      version_(std::move(version)),
      usage_("Usage: " + program_name_ + " [OPTIONS] COMMAND [ARGS]") {}

void ConfigOverrideParser::addOption(const CliOptionDefinition& option_def) {
    if (option_def.long_name.empty()) {
        throw std::invalid_argument("Option long name cannot be empty");
    }
    if (by_long_name_.count(option_def.long_name)) {
        throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
    }
    if (option_def.short_name && by_short_name_.count(*option_def.short_name)) {
        throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) +
                                    "' already exists");
    }

    option_definitions_.push_back(option_def);
    by_long_name_[option_def.long_name] = option_definitions_.size() - 1;
    if (option_def.short_name) {
        by_short_name_[*option_def.short_name] = option_definitions_.size() - 1;
    }
}

void ConfigOverrideParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        addOption(option_def);
    }
}

bool ConfigOverrideParser::hasOption(const std::string& long_name) const {
    return by_long_name_.count(long_name) > 0;
}

const CliOptionDefinition* ConfigOverrideParser::find(const std::string& arg) const {
    std::string name = ConfigOverrideUtils::extractOptionName(arg);
    if (ConfigOverrideUtils::isLongOption(arg)) {
        auto it = by_long_name_.find(name);
        return it == by_long_name_.end() ? nullptr : &option_definitions_[it->second];
    }
    if (ConfigOverrideUtils::isShortOption(arg) && name.size() == 1) {
        auto it = by_short_name_.find(name[0]);
        return it == by_short_name_.end() ? nullptr : &option_definitions_[it->second];
    }
    return nullptr;
}

CliParseResult ConfigOverrideParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) { // EN: Skip program name / FR: Ignorer le nom du programme
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult ConfigOverrideParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;
    bool options_done = false;

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (options_done) {
            result.positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            return result;
        }
        if (arg == "--version" || arg == "-V") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            return result;
        }
        if (!ConfigOverrideUtils::isLongOption(arg) && !ConfigOverrideUtils::isShortOption(arg)) {
            result.positionals.push_back(arg);
            continue;
        }

        // EN: Split "--name=value".
        // FR: Découpe "--nom=valeur".
        std::string option_arg = arg;
        std::optional<std::string> inline_value;
        size_t eq = arg.find('=');
        if (ConfigOverrideUtils::isLongOption(arg) && eq != std::string::npos) {
            option_arg = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const CliOptionDefinition* def = find(option_arg);
        if (!def) {
            result.errors.push_back("Unknown option: " + option_arg);
            result.status = CliParseStatus::INVALID_OPTION;
            continue;
        }

        CliOptionValue value;
        value.option_name = def->long_name;
        value.type = def->type;
        value.config_path = def->config_path;

        if (def->type == CliOptionType::BOOLEAN && !inline_value) {
            value.raw_value = "true";
        } else if (inline_value) {
            value.raw_value = *inline_value;
        } else if (i + 1 < arguments.size()) {
            value.raw_value = arguments[++i];
        } else {
            result.errors.push_back("Option " + option_arg + " requires a value");
            result.status = CliParseStatus::MISSING_VALUE;
            continue;
        }

        std::string error;
        if (!ConfigOverrideUtils::validateCliValue(value.raw_value, *def, error)) {
            result.errors.push_back("Invalid value for option " + option_arg + ": " + error);
            result.status = CliParseStatus::INVALID_VALUE;
            continue;
        }

        value.config_value = ConfigOverrideUtils::parseCliValue(value.raw_value, def->type);
        if (!value.config_path.empty()) {
            result.overrides[value.config_path] = value.config_value;
        }
        result.options[def->long_name] = std::move(value);
    }

    // EN: Fill defaults for options that were not given.
    // FR: Complète les valeurs par défaut des options absentes.
    for (const auto& def : option_definitions_) {
        if (def.default_value && !result.options.count(def.long_name)) {
            CliOptionValue value;
            value.option_name = def.long_name;
            value.type = def.type;
            value.raw_value = *def.default_value;
            value.config_value = ConfigOverrideUtils::parseCliValue(*def.default_value, def.type);
            value.config_path = def.config_path;
            result.options[def.long_name] = std::move(value);
        }
    }

    return result;
}

std::string ConfigOverrideParser::generateHelpText() const {
    std::ostringstream help;
    help << usage_ << "\n\n";

    std::map<std::string, std::vector<const CliOptionDefinition*>> by_category;
    for (const auto& opt : option_definitions_) {
        by_category[opt.category].push_back(&opt);
    }
    for (const auto& [category, options] : by_category) {
        help << category << " Options:\n";
        for (const CliOptionDefinition* opt : options) {
            help << ConfigOverrideUtils::formatOptionHelp(*opt) << "\n";
        }
        help << "\n";
    }
    help << "  -h, --help                  Show this help message\n";
    help << "  -V, --version               Show version information\n";
    return help.str();
}

std::string ConfigOverrideParser::generateVersionText() const {
    return program_name_ + " " + version_ + "\n";
}

size_t ConfigOverrideParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        // EN: Skip internal CLI options (prefixed with _)
        // FR: Ignorer les options CLI internes (préfixées par _)
        if (path.empty() || path[0] == '_') {
            continue;
        }
        size_t dot = path.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        config.set(path.substr(0, dot), path.substr(dot + 1), value);
        applied++;
    }
    return applied;
}

namespace ConfigOverrideUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "BOOLEAN";
        case CliOptionType::INTEGER: return "INTEGER";
        case CliOptionType::DOUBLE: return "DOUBLE";
        case CliOptionType::STRING: return "STRING";
        case CliOptionType::STRING_LIST: return "STRING_LIST";
    }
    return "UNKNOWN";
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
    }
    return "UNKNOWN";
}

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> splitList(const std::string& raw_value) {
    std::vector<std::string> values;
    std::stringstream ss(raw_value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        // EN: Trim whitespace
        // FR: Supprimer les espaces
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            values.push_back(item);
        }
    }
    return values;
}

bool parseWhole(const std::string& text, double& out, bool integral) {
    if (text.empty()) {
        return false;
    }
    size_t consumed = 0;
    try {
        out = integral ? static_cast<double>(std::stoi(text, &consumed)) : std::stod(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size();
}

} // namespace

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = toLower(raw_value);
            return ConfigValue(lower == "true" || lower == "1" || lower == "yes" || lower == "on");
        }
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::DOUBLE:
            return ConfigValue(std::stod(raw_value));
        case CliOptionType::STRING:
            return ConfigValue(raw_value);
        case CliOptionType::STRING_LIST:
            return ConfigValue(splitList(raw_value));
    }
    throw std::invalid_argument("Unknown CliOptionType");
}

bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message) {
    switch (definition.type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = toLower(raw_value);
            if (lower != "true" && lower != "false" && lower != "1" && lower != "0" &&
                lower != "yes" && lower != "no" && lower != "on" && lower != "off") {
                error_message = "Boolean value must be true/false, 1/0, yes/no, or on/off";
                return false;
            }
            return true;
        }
        case CliOptionType::INTEGER:
        case CliOptionType::DOUBLE: {
            double value = 0.0;
            if (!parseWhole(raw_value, value, definition.type == CliOptionType::INTEGER)) {
                error_message = "Invalid format: expected " + toLower(cliOptionTypeToString(definition.type));
                return false;
            }
            if (definition.constraint == CliOptionConstraint::POSITIVE && value <= 0.0) {
                error_message = "Value must be positive";
                return false;
            }
            if (definition.constraint == CliOptionConstraint::NON_NEGATIVE && value < 0.0) {
                error_message = "Value must be non-negative";
                return false;
            }
            return true;
        }
        case CliOptionType::STRING: {
            if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
                definition.enum_values.find(toLower(raw_value)) == definition.enum_values.end()) {
                error_message = "Value must be one of: ";
                bool first = true;
                for (const auto& valid_value : definition.enum_values) {
                    if (!first) error_message += ", ";
                    error_message += valid_value;
                    first = false;
                }
                return false;
            }
            return true;
        }
        case CliOptionType::STRING_LIST:
            if (splitList(raw_value).empty()) {
                error_message = "String list cannot be empty";
                return false;
            }
            return true;
    }
    return false;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    }
    option_names += "--" + option.long_name;
    if (option.type != CliOptionType::BOOLEAN) {
        option_names += " <" + toLower(cliOptionTypeToString(option.type)) + ">";
    }

    const size_t name_width = 30;
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }
    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }
    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2);
    }
    if (isShortOption(arg)) {
        return arg.substr(1, 1);
    }
    return "";
}

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace FIN
