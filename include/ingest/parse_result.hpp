// EN: Output of statement ingestion: transactions plus row and file diagnostics.
// FR: Résultat de l'ingestion d'un relevé : transactions et diagnostics de ligne ou de fichier.

#pragma once

#include "model/transaction.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Ingest {

enum class DiagnosticSeverity {
    WARNING,
    ERROR
};

std::string diagnosticSeverityToString(DiagnosticSeverity severity);

struct ParseDiagnostic {
    size_t row{0}; // EN: 1-based spreadsheet row, 0 for file-level / FR: ligne 1-based, 0 pour le fichier
    std::optional<std::string> column;
    std::string message;
    DiagnosticSeverity severity{DiagnosticSeverity::ERROR};
};

struct ParseMetadata {
    std::string file_name;
    std::string bank_name;
    std::optional<DateRange> statement_period;
    size_t transaction_count{0};
    Timestamp parsed_at{};
};

struct ParseResult {
    bool success{false};
    std::vector<Transaction> transactions;
    std::optional<DateRange> date_range;
    std::vector<ParseDiagnostic> diagnostics;
    ParseMetadata metadata;

    size_t errorCount() const;
    size_t warningCount() const;
};

using Clock = std::function<Timestamp()>;

struct ParseOptions {
    std::string file_name;
    std::optional<std::string> password;
    std::string bank_label{"State Bank of India"};
    size_t header_scan_rows{40};
    // EN: Source of importedAt / parsedAt. Defaults to the system clock when empty.
    // FR: Source de importedAt / parsedAt. Horloge système si vide.
    Clock clock;
};

} // namespace Ingest
} // namespace FIN
