// EN: Resolves statement header text to canonical fields through ordered alias lists.
// FR: Résout le texte des en-têtes du relevé vers les champs canoniques via des listes d'alias ordonnées.

#pragma once

#include "ingest/grid_decoder.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Ingest {

enum class CanonicalField {
    DATE,
    NARRATIVE,
    REFERENCE,
    DEBIT,
    CREDIT,
    BALANCE
};

constexpr size_t kCanonicalFieldCount = 6;

std::string canonicalFieldToString(CanonicalField field);
const std::vector<std::string>& aliasesFor(CanonicalField field);

// EN: Complete field -> column mapping. Only built once every field is resolved.
// FR: Correspondance complète champ -> colonne. Construite seulement quand tous les champs sont résolus.
struct ColumnMapping {
    std::array<size_t, kCanonicalFieldCount> columns{};
    std::array<std::string, kCanonicalFieldCount> header_names;

    size_t column(CanonicalField field) const { return columns[static_cast<size_t>(field)]; }
    const std::string& headerName(CanonicalField field) const { return header_names[static_cast<size_t>(field)]; }
};

struct ColumnMappingResult {
    std::optional<ColumnMapping> mapping;
    std::vector<CanonicalField> unresolved;

    bool isComplete() const { return mapping.has_value(); }
};

// EN: Exact alias match after normalization, first alias first. The reference field falls back
//     to the first header containing "ref" or "cheque".
// FR: Correspondance exacte après normalisation, dans l'ordre des alias. Le champ référence se
//     rabat sur le premier en-tête contenant "ref" ou "cheque".
ColumnMappingResult mapColumns(const std::vector<std::string>& headers);
ColumnMappingResult mapColumns(const CellRow& header_row);

} // namespace Ingest
} // namespace FIN
