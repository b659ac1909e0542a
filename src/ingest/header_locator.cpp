#include "ingest/header_locator.hpp"

#include <algorithm>
#include <cctype>

namespace FIN {
namespace Ingest {

std::string normalizeHeaderText(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;

    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

bool looksLikeHeaderRow(const CellRow& row) {
    bool has_date = false;
    bool has_details = false;
    bool has_debit = false;
    bool has_credit = false;
    bool has_balance = false;

    auto contains = [](const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    };

    for (const auto& cell : row) {
        std::string text = normalizeHeaderText(cellToString(cell));
        if (text.empty()) {
            continue;
        }
        has_date = has_date || contains(text, "date");
        has_details = has_details || contains(text, "details") || contains(text, "particulars") ||
                      contains(text, "description") || contains(text, "narration");
        has_debit = has_debit || contains(text, "debit") || text == "dr";
        has_credit = has_credit || contains(text, "credit") || text == "cr";
        has_balance = has_balance || contains(text, "balance");
    }

    return has_date && has_details && has_debit && has_credit && has_balance;
}

std::optional<size_t> locateHeaderRow(const CellGrid& grid, size_t max_rows) {
    size_t limit = std::min(grid.size(), max_rows);
    for (size_t i = 0; i < limit; ++i) {
        if (grid[i].size() < 4) {
            continue;
        }
        if (looksLikeHeaderRow(grid[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace Ingest
} // namespace FIN
