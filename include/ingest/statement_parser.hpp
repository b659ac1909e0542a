// EN: Ingestion pipeline: format check, decode, header location, column mapping, row
//     normalization and deduplication, assembled into one ParseResult.
// FR: Pipeline d'ingestion : contrôle de format, décodage, localisation de l'en-tête,
//     correspondance des colonnes, normalisation des lignes et déduplication.

#pragma once

#include "ingest/grid_decoder.hpp"
#include "ingest/parse_result.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace FIN {
namespace Ingest {

class StatementParser {
public:
    explicit StatementParser(std::shared_ptr<const GridDecoder> decoder);

    // EN: Never throws. Fatal problems yield zero transactions and one error diagnostic.
    // FR: Ne lance jamais. Les problèmes fatals donnent zéro transaction et un diagnostic d'erreur.
    ParseResult parse(const std::vector<uint8_t>& bytes, const ParseOptions& options) const;

    // EN: Parse an already decoded grid (used after decode and by tests).
    // FR: Parse une grille déjà décodée (utilisé après décodage et par les tests).
    ParseResult parseGrid(const CellGrid& grid, const ParseOptions& options) const;

private:
    static ParseResult failure(const ParseOptions& options, Timestamp now, size_t row, const std::string& message);
    static Timestamp now(const ParseOptions& options);

    std::shared_ptr<const GridDecoder> decoder_;
};

} // namespace Ingest
} // namespace FIN
