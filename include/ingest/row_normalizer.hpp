// EN: Converts one statement row into a canonical Transaction, or a skip / warning outcome.
// FR: Convertit une ligne de relevé en Transaction canonique, ou en résultat ignoré / avertissement.

#pragma once

#include "ingest/column_mapper.hpp"
#include "ingest/grid_decoder.hpp"
#include "ingest/parse_result.hpp"
#include "model/transaction.hpp"

#include <optional>
#include <string>

namespace FIN {
namespace Ingest {

// EN: Date cell: spreadsheet serial, "DD MMM YYYY", "DD-MMM-YYYY", "DD/MM/YYYY" or ISO "YYYY-MM-DD".
// FR: Cellule date : numéro de série tableur, "DD MMM YYYY", "DD-MMM-YYYY", "DD/MM/YYYY" ou ISO.
std::optional<CalendarDate> parseDateCell(const Cell& cell);
std::optional<CalendarDate> parseDateText(const std::string& text);
std::optional<CalendarDate> dateFromSerial(double serial);

// EN: Amount cell. Blank or "-" is absent, never zero.
// FR: Cellule montant. Vide ou "-" signifie absent, jamais zéro.
std::optional<double> parseAmountCell(const Cell& cell);
std::optional<double> parseAmountText(const std::string& text);

PaymentChannel detectPaymentChannel(const std::string& narrative);

// EN: Footer rows ("statement summary", "brought forward", "please do not share").
// FR: Lignes de pied ("statement summary", "brought forward", "please do not share").
bool isFooterRow(const CellRow& row);

enum class RowDisposition {
    ACCEPTED,
    SKIPPED,  // EN: silently dropped / FR: ignorée silencieusement
    REJECTED  // EN: dropped with a warning diagnostic / FR: ignorée avec un avertissement
};

struct RowOutcome {
    RowDisposition disposition{RowDisposition::SKIPPED};
    std::optional<Transaction> transaction;
    std::optional<ParseDiagnostic> diagnostic;
};

class RowNormalizer {
public:
    RowNormalizer(ColumnMapping mapping, std::string source_file, Timestamp imported_at);

    RowOutcome normalize(const CellRow& row, size_t grid_index) const;

private:
    const Cell& cellAt(const CellRow& row, CanonicalField field) const;

    ColumnMapping mapping_;
    std::string source_file_;
    Timestamp imported_at_;
};

} // namespace Ingest
} // namespace FIN
