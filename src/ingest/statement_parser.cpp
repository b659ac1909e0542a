#include "ingest/statement_parser.hpp"
#include "ingest/column_mapper.hpp"
#include "ingest/format_validator.hpp"
#include "ingest/header_locator.hpp"
#include "ingest/row_normalizer.hpp"
#include "ingest/transaction_merger.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace FIN {
namespace Ingest {

std::string diagnosticSeverityToString(DiagnosticSeverity severity) {
    return severity == DiagnosticSeverity::WARNING ? "warning" : "error";
}

size_t ParseResult::errorCount() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const ParseDiagnostic& d) { return d.severity == DiagnosticSeverity::ERROR; }));
}

size_t ParseResult::warningCount() const {
    return diagnostics.size() - errorCount();
}

StatementParser::StatementParser(std::shared_ptr<const GridDecoder> decoder)
    : decoder_(std::move(decoder)) {
    if (!decoder_) {
        throw std::invalid_argument("StatementParser requires a decoder");
    }
}

Timestamp StatementParser::now(const ParseOptions& options) {
    return options.clock ? options.clock() : std::chrono::system_clock::now();
}

ParseResult StatementParser::failure(const ParseOptions& options, Timestamp now, size_t row,
                                     const std::string& message) {
    ParseResult result;
    result.success = false;
    result.diagnostics.push_back(ParseDiagnostic{row, std::nullopt, message, DiagnosticSeverity::ERROR});
    result.metadata.file_name = options.file_name;
    result.metadata.bank_name = "Unknown";
    result.metadata.parsed_at = now;

    LOG_ERROR_META("parser", message, (Logger::Metadata{{"file", options.file_name},
                                                        {"row", std::to_string(row)}}));
    return result;
}

ParseResult StatementParser::parse(const std::vector<uint8_t>& bytes, const ParseOptions& options) const {
    const Timestamp started = now(options);

    if (bytes.empty()) {
        return failure(options, started, 0, "File is empty or could not be read");
    }

    // EN: Container checks run before any decoding.
    // FR: Les contrôles du conteneur précèdent tout décodage.
    FormatValidation format = validateFormat(bytes);
    if (!format.is_valid) {
        return failure(options, started, 0, "Failed to read Excel file. File may be corrupted or invalid.");
    }
    if (format.requires_password && (!options.password || options.password->empty())) {
        return failure(options, started, 0, "This file is password protected. Please provide the password.");
    }

    LOG_DEBUG("parser", "Container " + containerFormatToString(format.format) + " for " + options.file_name);

    CellGrid grid;
    try {
        grid = decoder_->decode(bytes, options.password);
    } catch (const DecodeError& e) {
        return failure(options, started, 0, e.what());
    } catch (const std::exception& e) {
        return failure(options, started, 0, std::string("Failed to decode workbook: ") + e.what());
    }

    return parseGrid(grid, options);
}

ParseResult StatementParser::parseGrid(const CellGrid& grid, const ParseOptions& options) const {
    const Timestamp parsed_at = now(options);

    if (grid.empty()) {
        return failure(options, parsed_at, 0, "No data found in the sheet");
    }

    // EN: Locate the header row, then map it to the canonical fields.
    // FR: Localise la ligne d'en-tête puis la relie aux champs canoniques.
    std::optional<size_t> header_index = locateHeaderRow(grid, options.header_scan_rows);
    if (!header_index) {
        return failure(options, parsed_at, 0,
                       "Could not find transaction header row. Expected columns: Date, Details, Debit, Credit, Balance");
    }
    LOG_INFO("parser", "Header row found at spreadsheet row " + std::to_string(*header_index + 1));

    if (*header_index + 1 >= grid.size()) {
        return failure(options, parsed_at, 0, "No transaction data found after header row");
    }

    ColumnMappingResult mapping = mapColumns(grid[*header_index]);
    if (!mapping.isComplete()) {
        std::string missing;
        for (CanonicalField field : mapping.unresolved) {
            if (!missing.empty()) missing += ", ";
            missing += canonicalFieldToString(field);
        }
        return failure(options, parsed_at, *header_index + 1,
                       "Could not detect required columns. Missing: " + missing);
    }

    Logger::Metadata mapping_meta;
    for (size_t i = 0; i < kCanonicalFieldCount; ++i) {
        auto field = static_cast<CanonicalField>(i);
        mapping_meta[canonicalFieldToString(field)] = mapping.mapping->headerName(field);
    }
    LOG_DEBUG_META("parser", "Column mapping resolved", mapping_meta);

    ParseResult result;
    RowNormalizer normalizer(*mapping.mapping, options.file_name, parsed_at);
    std::vector<Transaction> accepted;
    size_t skipped = 0;

    // EN: Every row after the header is normalised; rejected rows become diagnostics.
    // FR: Chaque ligne après l'en-tête est normalisée ; les lignes rejetées deviennent des diagnostics.
    for (size_t i = *header_index + 1; i < grid.size(); ++i) {
        RowOutcome outcome = normalizer.normalize(grid[i], i);
        switch (outcome.disposition) {
            case RowDisposition::ACCEPTED:
                accepted.push_back(std::move(*outcome.transaction));
                break;
            case RowDisposition::REJECTED:
                LOG_WARN("parser", "Row " + std::to_string(outcome.diagnostic->row) + ": " +
                         outcome.diagnostic->message);
                result.diagnostics.push_back(std::move(*outcome.diagnostic));
                break;
            case RowDisposition::SKIPPED:
                ++skipped;
                break;
        }
    }

    // EN: Duplicates are collapsed before the date range is computed.
    // FR: Les doublons sont fusionnés avant le calcul de la plage de dates.
    result.transactions = TransactionMerger::deduplicate(accepted);
    result.date_range = TransactionMerger::dateRange(result.transactions);
    result.success = result.errorCount() == 0;

    result.metadata.file_name = options.file_name;
    result.metadata.bank_name = options.bank_label;
    result.metadata.statement_period = result.date_range;
    result.metadata.transaction_count = result.transactions.size();
    result.metadata.parsed_at = parsed_at;

    LOG_INFO_META("parser", "Statement parsed", (Logger::Metadata{
        {"file", options.file_name},
        {"transactions", std::to_string(result.transactions.size())},
        {"duplicates", std::to_string(accepted.size() - result.transactions.size())},
        {"warnings", std::to_string(result.warningCount())},
        {"skipped", std::to_string(skipped)}
    }));
    return result;
}

} // namespace Ingest
} // namespace FIN
