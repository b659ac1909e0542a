// EN: finsightctl: import bank statements into a local store, manage tags and print analytics reports.
// FR: finsightctl : importe des relevés bancaires dans un store local, gère les tags et affiche des rapports.

#include "analytics/insight_runner.hpp"
#include "analytics/monthly_report.hpp"
#include "budget/budget_tracker.hpp"
#include "categorize/tag_catalogue.hpp"
#include "categorize/tag_matcher.hpp"
#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/analysis_settings.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "ingest/statement_parser.hpp"
#include "ingest/transaction_merger.hpp"
#include "ingest/xlsx_grid_decoder.hpp"
#include "model/json_codec.hpp"
#include "storage/checksum.hpp"
#include "storage/json_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

using namespace FIN;

namespace {

constexpr const char* kVersion = "1.0.0";
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;
using CLI::CliOptionDefinition;
using CLI::CliOptionType;

std::vector<CliOptionDefinition> optionDefinitions() {
    std::vector<CliOptionDefinition> options;

    auto add = [&options](const std::string& name, CliOptionType type, const std::string& description,
                          const std::string& config_path, const std::string& category) {
        CliOptionDefinition def;
        def.long_name = name;
        def.type = type;
        def.description = description;
        def.config_path = config_path;
        def.category = category;
        options.push_back(def);
        return options.size() - 1;
    };

    size_t store = add("store", CliOptionType::STRING, "Store directory", "_store", "General");
    options[store].default_value = "./finsight-data";
    add("config", CliOptionType::STRING, "YAML configuration file", "_config", "General");

    size_t level = add("log-level", CliOptionType::STRING, "Log level (debug, info, warn, error)",
                       "logging.level", "Logging");
    options[level].constraint = CLI::CliOptionConstraint::ENUM_VALUES;
    options[level].enum_values = {"debug", "info", "warn", "error"};
    add("log-file", CliOptionType::STRING, "Write NDJSON logs to this file instead of stderr",
        "logging.file", "Logging");

    add("password", CliOptionType::STRING, "Password of an encrypted statement", "_password", "Import");
    add("bank", CliOptionType::STRING, "Bank label recorded in the parse metadata", "ingest.bank_label",
        "Import");

    add("as-of", CliOptionType::STRING, "Reference date YYYY-MM-DD (default: today)", "_as_of", "Analyze");
    size_t horizon = add("horizon", CliOptionType::INTEGER, "Projection horizon in days", "forecast.horizon_days",
                         "Analyze");
    options[horizon].constraint = CLI::CliOptionConstraint::POSITIVE;

    add("color", CliOptionType::STRING, "Tag colour", "_color", "Tags");

    size_t period = add("period", CliOptionType::STRING, "Budget period (monthly, yearly)", "_period", "Budgets");
    options[period].constraint = CLI::CliOptionConstraint::ENUM_VALUES;
    options[period].enum_values = {"monthly", "yearly"};
    options[period].default_value = "monthly";
    return options;
}

std::string usage() {
    return "Usage: finsightctl [OPTIONS] COMMAND [ARGS]\n\n"
           "Commands:\n"
           "  import <file>                 Parse a statement and merge it into the store\n"
           "  analyze                       Print the insight report as JSON\n"
           "  recategorize                  Re-derive tags for every non-overridden transaction\n"
           "  tags list                     List tags\n"
           "  tags add <name> <kw1,kw2,...> Create a custom tag\n"
           "  files                         List imported files\n"
           "  budgets list                  Budget status at the --as-of date\n"
           "  budgets add <tag-id> <limit>  Create a budget (--period monthly|yearly)\n"
           "  budgets remove <id>           Delete a budget\n"
           "  budgets suggest               Propose monthly budgets from recent spending\n"
           "  report <YYYY-MM>              Print the monthly report as JSON\n"
           "  config                        Print the effective configuration as YAML";
}

bool readFile(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool failed(Storage::StoreError error, const std::string& what) {
    if (error == Storage::StoreError::NONE) {
        return false;
    }
    std::cerr << "error: " << what << ": " << Storage::storeErrorToString(error) << std::endl;
    return true;
}

// EN: Stored tags, seeded with the default catalogue on first use.
// FR: Tags stockés, initialisés avec le catalogue par défaut à la première utilisation.
bool loadTags(Storage::TransactionStore& store, std::vector<Tag>& tags) {
    if (failed(store.loadTags(tags), "loading tags")) {
        return false;
    }
    if (tags.empty()) {
        tags = Categorize::defaultTags();
        if (failed(store.saveTags(tags), "saving default tags")) {
            return false;
        }
        LOG_INFO("cli", "Seeded " + std::to_string(tags.size()) + " default tags");
    }
    return true;
}

int runImport(Storage::TransactionStore& store, const CLI::CliParseResult& args, const AnalysisSettings& settings) {
    if (args.positionals.size() != 2) {
        std::cerr << "error: import takes exactly one file\n" << usage() << std::endl;
        return kExitUsage;
    }

    const std::string path = args.positionals[1];
    std::vector<uint8_t> bytes;
    if (!readFile(path, bytes)) {
        std::cerr << "error: cannot read " << path << std::endl;
        return kExitFailure;
    }

    Ingest::ParseOptions options;
    options.file_name = std::filesystem::path(path).filename().string();
    options.password = args.value("password");
    options.bank_label = settings.ingest.bank_label;
    options.header_scan_rows = static_cast<size_t>(settings.ingest.header_scan_rows);

    Ingest::StatementParser parser(std::make_shared<Ingest::XlsxGridDecoder>());
    Ingest::ParseResult parsed = parser.parse(bytes, options);

    for (const auto& diagnostic : parsed.diagnostics) {
        std::cerr << Ingest::diagnosticSeverityToString(diagnostic.severity) << ": row " << diagnostic.row;
        if (diagnostic.column) {
            std::cerr << " [" << *diagnostic.column << "]";
        }
        std::cerr << ": " << diagnostic.message << std::endl;
    }
    if (!parsed.success) {
        return kExitFailure;
    }

    std::vector<Transaction> existing;
    std::vector<Tag> tags;
    std::vector<UploadedFileRecord> files;
    if (failed(store.loadTransactions(existing), "loading transactions") || !loadTags(store, tags) ||
        failed(store.loadFiles(files), "loading file records")) {
        return kExitFailure;
    }

    const std::string checksum = Storage::crc32Hex(bytes);
    for (const auto& record : files) {
        if (record.checksum == checksum) {
            LOG_WARN_META("cli", "File was already imported", (Logger::Metadata{
                {"file", options.file_name},
                {"previous_file", record.file_name},
                {"checksum", checksum}
            }));
            std::cerr << "warning: identical content was already imported as " << record.file_name << std::endl;
            break;
        }
    }

    Ingest::MergeResult merged = Ingest::TransactionMerger::merge(existing, parsed.transactions);
    std::vector<Transaction> categorized = Categorize::recategorizeTransactions(merged.merged, tags);

    UploadedFileRecord record;
    record.file_name = options.file_name;
    record.uploaded_at = parsed.metadata.parsed_at;
    record.transaction_count = parsed.transactions.size();
    record.date_range = parsed.date_range;
    record.checksum = checksum;
    files.push_back(record);

    if (failed(store.saveTransactions(categorized), "saving transactions") ||
        failed(store.saveFiles(files), "saving file records")) {
        return kExitFailure;
    }

    nlohmann::json summary = {
        {"file", options.file_name},
        {"parsed", parsed.transactions.size()},
        {"new", merged.new_transactions},
        {"duplicatesRemoved", merged.duplicates_removed},
        {"total", categorized.size()},
        {"warnings", parsed.warningCount()},
        {"checksum", checksum}
    };
    if (parsed.date_range) {
        summary["dateRange"] = *parsed.date_range;
    }
    std::cout << summary.dump(2) << std::endl;
    return kExitOk;
}

// EN: --as-of, today when absent. Prints the error and returns false on a malformed date.
// FR: --as-of, aujourd'hui si absent. Affiche l'erreur et retourne false si la date est malformée.
bool resolveAsOf(const CLI::CliParseResult& args, CalendarDate& as_of) {
    as_of = CalendarDate::today();
    if (auto text = args.value("as-of")) {
        auto parsed = CalendarDate::parseIso(*text);
        if (!parsed) {
            std::cerr << "error: --as-of expects YYYY-MM-DD, got '" << *text << "'" << std::endl;
            return false;
        }
        as_of = *parsed;
    }
    return true;
}

int runAnalyze(Storage::TransactionStore& store, const CLI::CliParseResult& args, const AnalysisSettings& settings) {
    CalendarDate as_of;
    if (!resolveAsOf(args, as_of)) {
        return kExitUsage;
    }

    std::vector<Transaction> transactions;
    std::vector<Tag> tags;
    std::vector<Budget> budgets;
    if (failed(store.loadTransactions(transactions), "loading transactions") || !loadTags(store, tags) ||
        failed(store.loadBudgets(budgets), "loading budgets")) {
        return kExitFailure;
    }

    Analytics::InsightRunner runner(settings);
    nlohmann::json report = runner.run(transactions, tags, budgets, as_of, settings.forecast.horizon_days);
    std::cout << report.dump(2) << std::endl;
    return kExitOk;
}

int runBudgets(Storage::TransactionStore& store, const CLI::CliParseResult& args) {
    const auto& pos = args.positionals;
    CalendarDate as_of;
    if (!resolveAsOf(args, as_of)) {
        return kExitUsage;
    }

    std::vector<Budget> budgets;
    if (failed(store.loadBudgets(budgets), "loading budgets")) {
        return kExitFailure;
    }

    if (pos.size() == 2 && (pos[1] == "list" || pos[1] == "suggest")) {
        std::vector<Transaction> transactions;
        if (failed(store.loadTransactions(transactions), "loading transactions")) {
            return kExitFailure;
        }
        if (pos[1] == "list") {
            std::cout << nlohmann::json(Budgeting::budgetStatuses(budgets, transactions, as_of)).dump(2) << std::endl;
            return kExitOk;
        }
        std::vector<Tag> tags;
        if (!loadTags(store, tags)) {
            return kExitFailure;
        }
        std::cout << nlohmann::json(Budgeting::suggestBudgets(transactions, tags, budgets, as_of)).dump(2)
                  << std::endl;
        return kExitOk;
    }

    if (pos.size() == 4 && pos[1] == "add") {
        Budget budget;
        try {
            auto period = budgetPeriodFromString(args.value("period").value_or("monthly"));
            budget = Budgeting::createBudget(pos[2], std::stod(pos[3]), period.value_or(BudgetPeriod::MONTHLY));
        } catch (const std::invalid_argument& e) {
            std::cerr << "error: invalid budget: " << e.what() << std::endl;
            return kExitUsage;
        } catch (const std::out_of_range&) {
            std::cerr << "error: budget limit out of range: " << pos[3] << std::endl;
            return kExitUsage;
        }
        budgets.push_back(budget);
        if (failed(store.saveBudgets(budgets), "saving budgets")) {
            return kExitFailure;
        }
        LOG_INFO_META("cli", "Budget created", (Logger::Metadata{{"id", budget.id}, {"tag", budget.tag_id}}));
        std::cout << nlohmann::json(budget).dump(2) << std::endl;
        return kExitOk;
    }

    if (pos.size() == 3 && pos[1] == "remove") {
        if (failed(store.deleteBudget(pos[2]), "deleting budget")) {
            return kExitFailure;
        }
        return kExitOk;
    }

    std::cerr << "error: expected 'budgets list', 'budgets suggest', 'budgets add <tag-id> <limit>' "
                 "or 'budgets remove <id>'" << std::endl;
    return kExitUsage;
}

int runReport(Storage::TransactionStore& store, const CLI::CliParseResult& args, const AnalysisSettings& settings) {
    static const std::regex month_regex(R"(^(\d{4})-(\d{2})$)");
    std::smatch match;
    if (args.positionals.size() != 2 || !std::regex_match(args.positionals[1], match, month_regex)) {
        std::cerr << "error: report expects a month as YYYY-MM\n" << usage() << std::endl;
        return kExitUsage;
    }
    int year = std::stoi(match[1].str());
    int month = std::stoi(match[2].str());
    if (month < 1 || month > 12) {
        std::cerr << "error: month out of range: " << args.positionals[1] << std::endl;
        return kExitUsage;
    }

    std::vector<Transaction> transactions;
    std::vector<Tag> tags;
    std::vector<Budget> budgets;
    if (failed(store.loadTransactions(transactions), "loading transactions") || !loadTags(store, tags) ||
        failed(store.loadBudgets(budgets), "loading budgets")) {
        return kExitFailure;
    }

    nlohmann::json report = Analytics::generateMonthlyReport(transactions, tags, budgets, year, month,
                                                             settings.anomaly);
    std::cout << report.dump(2) << std::endl;
    return kExitOk;
}

int runRecategorize(Storage::TransactionStore& store) {
    std::vector<Transaction> transactions;
    std::vector<Tag> tags;
    if (failed(store.loadTransactions(transactions), "loading transactions") || !loadTags(store, tags)) {
        return kExitFailure;
    }

    std::vector<Transaction> categorized = Categorize::recategorizeTransactions(transactions, tags);
    if (failed(store.saveTransactions(categorized), "saving transactions")) {
        return kExitFailure;
    }

    size_t untagged = Categorize::findUntaggedTransactions(categorized).size();
    std::cout << nlohmann::json{{"transactions", categorized.size()}, {"untagged", untagged}}.dump(2) << std::endl;
    return kExitOk;
}

int runTags(Storage::TransactionStore& store, const CLI::CliParseResult& args) {
    const auto& pos = args.positionals;
    std::vector<Tag> tags;

    if (pos.size() == 2 && pos[1] == "list") {
        if (!loadTags(store, tags)) {
            return kExitFailure;
        }
        std::cout << nlohmann::json(tags).dump(2) << std::endl;
        return kExitOk;
    }

    if (pos.size() == 4 && pos[1] == "add") {
        std::vector<std::string> keywords =
            CLI::ConfigOverrideUtils::parseCliValue(pos[3], CliOptionType::STRING_LIST).as<std::vector<std::string>>();
        Tag tag;
        try {
            tag = Categorize::createCustomTag(pos[2], keywords, args.value("color").value_or("#6B7280"));
        } catch (const std::invalid_argument& e) {
            std::cerr << "error: " << e.what() << std::endl;
            return kExitUsage;
        }

        if (!loadTags(store, tags)) {
            return kExitFailure;
        }
        tags.push_back(tag);
        if (failed(store.saveTags(tags), "saving tags")) {
            return kExitFailure;
        }
        LOG_INFO_META("cli", "Custom tag created", (Logger::Metadata{{"id", tag.id}, {"name", tag.name}}));
        std::cout << nlohmann::json(tag).dump(2) << std::endl;
        return kExitOk;
    }

    std::cerr << "error: expected 'tags list' or 'tags add <name> <kw1,kw2,...>'" << std::endl;
    return kExitUsage;
}

int runFiles(Storage::TransactionStore& store) {
    std::vector<UploadedFileRecord> files;
    if (failed(store.loadFiles(files), "loading file records")) {
        return kExitFailure;
    }
    std::cout << nlohmann::json(files).dump(2) << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::ConfigOverrideParser cli("finsightctl", kVersion);
    cli.addOptions(optionDefinitions());
    cli.setUsage(usage());

    CLI::CliParseResult args = cli.parse(argc, argv);
    if (args.status == CLI::CliParseStatus::HELP_REQUESTED) {
        std::cout << cli.generateHelpText();
        return kExitOk;
    }
    if (args.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        std::cout << cli.generateVersionText();
        return kExitOk;
    }
    if (!args.ok()) {
        for (const auto& error : args.errors) {
            std::cerr << "error: " << error << std::endl;
        }
        return kExitUsage;
    }
    if (args.positionals.empty()) {
        std::cerr << usage() << std::endl;
        return kExitUsage;
    }

    Logger& logger = Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    // EN: Precedence: defaults < config file < FINSIGHT_* environment < command line.
    // FR: Priorité : défauts < fichier de config < environnement FINSIGHT_* < ligne de commande.
    ConfigManager config;
    AnalysisSettings::writeDefaults(config);
    config.addValidationRules(AnalysisSettings::validationRules());
    if (auto path = args.value("config")) {
        if (!config.loadFromFile(*path)) {
            std::cerr << "error: cannot load configuration " << *path << std::endl;
            return kExitUsage;
        }
    }
    config.loadEnvironmentOverrides("FINSIGHT_");
    CLI::ConfigOverrideParser::applyOverrides(args, config);

    std::vector<std::string> config_errors;
    if (!config.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "error: " << error << std::endl;
        }
        return kExitUsage;
    }
    AnalysisSettings settings = AnalysisSettings::fromConfig(config);

    if (auto level = parseLogLevel(settings.logging.level)) {
        logger.setLogLevel(*level);
    }
    if (!settings.logging.file.empty() && !logger.setOutputFile(settings.logging.file)) {
        std::cerr << "warning: cannot open log file " << settings.logging.file << ", logging to stderr" << std::endl;
    }

    if (args.positionals[0] == "config") {
        std::cout << config.toYaml();
        return kExitOk;
    }

    Storage::JsonStore store(args.value("store").value_or("./finsight-data"));
    if (failed(store.open(), "opening store " + store.directory())) {
        return kExitFailure;
    }

    const std::string& command = args.positionals[0];
    LOG_DEBUG("cli", "Running command " + command);

    if (command == "import") return runImport(store, args, settings);
    if (command == "analyze") return runAnalyze(store, args, settings);
    if (command == "recategorize") return runRecategorize(store);
    if (command == "tags") return runTags(store, args);
    if (command == "files") return runFiles(store);
    if (command == "budgets") return runBudgets(store, args);
    if (command == "report") return runReport(store, args, settings);

    std::cerr << "error: unknown command '" << command << "'\n" << usage() << std::endl;
    return kExitUsage;
}
