#include "ingest/grid_decoder.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

namespace FIN {
namespace Ingest {

std::string cellToString(const Cell& cell) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::floor(v) == v && std::fabs(v) < 1e15) {
                return std::to_string(static_cast<long long>(v));
            }
            std::ostringstream oss;
            oss.precision(15);
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "TRUE" : "FALSE";
        } else {
            return v;
        }
    }, cell);
}

bool isBlankCell(const Cell& cell) {
    if (std::holds_alternative<std::monostate>(cell)) {
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        for (unsigned char c : *text) {
            if (!std::isspace(c)) {
                return false;
            }
        }
        return true;
    }
    return false;
}

bool isBlankRow(const CellRow& row) {
    for (const auto& cell : row) {
        if (!isBlankCell(cell)) {
            return false;
        }
    }
    return true;
}

std::string decodeErrorCodeToString(DecodeErrorCode code) {
    switch (code) {
        case DecodeErrorCode::WRONG_PASSWORD: return "WRONG_PASSWORD";
        case DecodeErrorCode::PASSWORD_REQUIRED: return "PASSWORD_REQUIRED";
        case DecodeErrorCode::CORRUPT_CONTAINER: return "CORRUPT_CONTAINER";
        case DecodeErrorCode::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
    }
    return "UNKNOWN";
}

} // namespace Ingest
} // namespace FIN
