// EN: Decoded spreadsheet grid and the decoder seam that produces it.
// FR: Grille de tableur décodée et l'interface de décodage qui la produit.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace FIN {
namespace Ingest {

// EN: Typed cell: empty, number, text or boolean.
// FR: Cellule typée : vide, nombre, texte ou booléen.
using Cell = std::variant<std::monostate, double, std::string, bool>;
using CellRow = std::vector<Cell>;
using CellGrid = std::vector<CellRow>;

// EN: Text rendering of a cell. Numbers use the shortest form ("1500", "12.5").
// FR: Rendu texte d'une cellule. Les nombres utilisent la forme la plus courte.
std::string cellToString(const Cell& cell);

// EN: True for empty cells and whitespace-only text.
// FR: Vrai pour les cellules vides et le texte composé d'espaces.
bool isBlankCell(const Cell& cell);
bool isBlankRow(const CellRow& row);

enum class DecodeErrorCode {
    WRONG_PASSWORD,
    PASSWORD_REQUIRED,
    CORRUPT_CONTAINER,
    UNSUPPORTED_FORMAT
};

std::string decodeErrorCodeToString(DecodeErrorCode code);

class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    DecodeErrorCode code() const { return code_; }

private:
    DecodeErrorCode code_;
};

// EN: Turns workbook bytes into the cells of its first sheet. Throws DecodeError on failure.
// FR: Transforme les octets d'un classeur en cellules de sa première feuille. Lance DecodeError en cas d'échec.
class GridDecoder {
public:
    virtual ~GridDecoder() = default;

    virtual CellGrid decode(const std::vector<uint8_t>& bytes,
                            const std::optional<std::string>& password) const = 0;
};

} // namespace Ingest
} // namespace FIN
