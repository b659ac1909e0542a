#include "ingest/column_mapper.hpp"
#include "ingest/header_locator.hpp"

namespace FIN {
namespace Ingest {

namespace {

constexpr CanonicalField kAllFields[] = {
    CanonicalField::DATE, CanonicalField::NARRATIVE, CanonicalField::REFERENCE,
    CanonicalField::DEBIT, CanonicalField::CREDIT, CanonicalField::BALANCE
};

std::optional<size_t> findAlias(const std::vector<std::string>& normalized_headers,
                                const std::vector<std::string>& aliases) {
    for (const auto& alias : aliases) {
        std::string wanted = normalizeHeaderText(alias);
        for (size_t i = 0; i < normalized_headers.size(); ++i) {
            if (!normalized_headers[i].empty() && normalized_headers[i] == wanted) {
                return i;
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::string canonicalFieldToString(CanonicalField field) {
    switch (field) {
        case CanonicalField::DATE: return "date";
        case CanonicalField::NARRATIVE: return "details";
        case CanonicalField::REFERENCE: return "refNo";
        case CanonicalField::DEBIT: return "debit";
        case CanonicalField::CREDIT: return "credit";
        case CanonicalField::BALANCE: return "balance";
    }
    return "unknown";
}

const std::vector<std::string>& aliasesFor(CanonicalField field) {
    static const std::array<std::vector<std::string>, kCanonicalFieldCount> kAliases = {{
        {"Date", "Txn Date", "Transaction Date", "Value Date"},
        {"Details", "Description", "Narration", "Particulars"},
        {"Ref No/Cheque No", "Ref No./Cheque No.", "Ref No", "Reference No", "Cheque No", "Transaction ID"},
        {"Debit", "Withdrawal", "Dr"},
        {"Credit", "Deposit", "Cr"},
        {"Balance", "Closing Balance", "Available Balance"}
    }};
    return kAliases[static_cast<size_t>(field)];
}

ColumnMappingResult mapColumns(const std::vector<std::string>& headers) {
    std::vector<std::string> normalized;
    normalized.reserve(headers.size());
    for (const auto& header : headers) {
        normalized.push_back(normalizeHeaderText(header));
    }

    ColumnMapping mapping;
    ColumnMappingResult result;

    for (CanonicalField field : kAllFields) {
        std::optional<size_t> column = findAlias(normalized, aliasesFor(field));

        if (!column && field == CanonicalField::REFERENCE) {
            for (size_t i = 0; i < normalized.size(); ++i) {
                if (normalized[i].find("ref") != std::string::npos ||
                    normalized[i].find("cheque") != std::string::npos) {
                    column = i;
                    break;
                }
            }
        }

        if (!column) {
            result.unresolved.push_back(field);
            continue;
        }
        size_t slot = static_cast<size_t>(field);
        mapping.columns[slot] = *column;
        mapping.header_names[slot] = headers[*column];
    }

    if (result.unresolved.empty()) {
        result.mapping = mapping;
    }
    return result;
}

ColumnMappingResult mapColumns(const CellRow& header_row) {
    std::vector<std::string> headers;
    headers.reserve(header_row.size());
    for (const auto& cell : header_row) {
        headers.push_back(cellToString(cell));
    }
    return mapColumns(headers);
}

} // namespace Ingest
} // namespace FIN
