// EN: Finds the column header row of a statement grid, skipping account-info rows above it.
// FR: Trouve la ligne d'en-tête d'une grille de relevé, en ignorant les lignes d'informations de compte.

#pragma once

#include "ingest/grid_decoder.hpp"

#include <optional>
#include <string>

namespace FIN {
namespace Ingest {

constexpr size_t kDefaultHeaderScanRows = 40;

// EN: Lowercase, trim and collapse inner whitespace.
// FR: Minuscules, suppression des espaces de bord et réduction des espaces internes.
std::string normalizeHeaderText(const std::string& text);

// EN: True when the normalized cells contain a date, narrative, debit, credit and balance label.
// FR: Vrai si les cellules normalisées contiennent une date, un libellé, un débit, un crédit et un solde.
bool looksLikeHeaderRow(const CellRow& row);

// EN: Index of the first header-like row among the first max_rows rows, rows with fewer than 4
//     cells being ignored.
// FR: Index de la première ligne ressemblant à un en-tête parmi les max_rows premières, les lignes de
//     moins de 4 cellules étant ignorées.
std::optional<size_t> locateHeaderRow(const CellGrid& grid, size_t max_rows = kDefaultHeaderScanRows);

} // namespace Ingest
} // namespace FIN
