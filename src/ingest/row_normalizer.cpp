#include "ingest/row_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <utility>

namespace FIN {
namespace Ingest {

namespace {

std::string trim(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    return text.substr(first, last - first);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::optional<CalendarDate> makeDate(int year, int month, int day) {
    if (!CalendarDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

int monthFromAbbreviation(const std::string& abbreviation) {
    static const char* kMonths[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string lower = toLower(abbreviation);
    for (int i = 0; i < 12; ++i) {
        if (lower == kMonths[i]) {
            return i + 1;
        }
    }
    return 0;
}

const Cell& emptyCell() {
    static const Cell kEmpty;
    return kEmpty;
}

} // namespace

std::optional<CalendarDate> dateFromSerial(double serial) {
    if (!std::isfinite(serial) || serial < 1.0) {
        return std::nullopt;
    }
    // EN: Day 1900-01-01 plus serial minus 2 absorbs the 1900 leap-year quirk.
    // FR: Le 1900-01-01 plus le numéro moins 2 absorbe l'anomalie de l'année bissextile 1900.
    static const int64_t kEpoch = CalendarDate(1900, 1, 1).toDayNumber();
    return CalendarDate::fromDayNumber(kEpoch + static_cast<int64_t>(std::floor(serial)) - 2);
}

std::optional<CalendarDate> parseDateText(const std::string& raw) {
    std::string text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }

    static const std::regex iso_regex(R"(^(\d{4})-(\d{2})-(\d{2}))");
    static const std::regex month_name_regex(R"(^(\d{1,2})[ \-]([A-Za-z]{3})[ \-](\d{4}))");
    static const std::regex dmy_regex(R"(^(\d{1,2})/(\d{1,2})/(\d{4}))");

    std::smatch match;
    if (std::regex_search(text, match, iso_regex)) {
        return makeDate(std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str()));
    }
    if (std::regex_search(text, match, month_name_regex)) {
        int month = monthFromAbbreviation(match[2].str());
        if (month == 0) {
            return std::nullopt;
        }
        return makeDate(std::stoi(match[3].str()), month, std::stoi(match[1].str()));
    }
    if (std::regex_search(text, match, dmy_regex)) {
        return makeDate(std::stoi(match[3].str()), std::stoi(match[2].str()), std::stoi(match[1].str()));
    }
    return std::nullopt;
}

std::optional<CalendarDate> parseDateCell(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return dateFromSerial(*number);
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return parseDateText(*text);
    }
    return std::nullopt;
}

std::optional<double> parseAmountText(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        if (c != ',') cleaned += c;
    }
    cleaned = trim(cleaned);
    if (cleaned.empty() || cleaned == "-") {
        return std::nullopt;
    }

    // EN: Longest numeric prefix, so "1500.00 CR" reads as 1500.
    // FR: Plus long préfixe numérique, "1500.00 CR" donne 1500.
    static const std::regex number_prefix(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?)");
    std::smatch match;
    if (!std::regex_search(cleaned, match, number_prefix)) {
        return std::nullopt;
    }
    double value = std::strtod(match.str().c_str(), nullptr);
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseAmountCell(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        if (!std::isfinite(*number)) {
            return std::nullopt;
        }
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return parseAmountText(*text);
    }
    return std::nullopt;
}

PaymentChannel detectPaymentChannel(const std::string& narrative) {
    static const std::vector<std::pair<PaymentChannel, std::regex>> kRules = [] {
        std::vector<std::pair<PaymentChannel, std::regex>> rules;
        rules.emplace_back(PaymentChannel::INSTANT_TRANSFER, std::regex("UPI|UNIFIED PAYMENT"));
        rules.emplace_back(PaymentChannel::WIRE, std::regex("NEFT|NATIONAL ELECTRONIC"));
        rules.emplace_back(PaymentChannel::IMMEDIATE_TRANSFER, std::regex("IMPS|IMMEDIATE PAYMENT"));
        rules.emplace_back(PaymentChannel::ATM, std::regex(R"(ATM|CASH WITHDRAWAL|\bCWD\b)"));
        rules.emplace_back(PaymentChannel::POINT_OF_SALE, std::regex("POS|POINT OF SALE|CARD PURCHASE"));
        rules.emplace_back(PaymentChannel::CHEQUE, std::regex(R"(CHEQUE|\bCHQ\b|CHECK|CLEARING|\bCLG\b)"));
        return rules;
    }();

    if (narrative.empty()) {
        return PaymentChannel::OTHER;
    }
    std::string upper = toUpper(narrative);
    for (const auto& [channel, pattern] : kRules) {
        if (std::regex_search(upper, pattern)) {
            return channel;
        }
    }
    return PaymentChannel::OTHER;
}

bool isFooterRow(const CellRow& row) {
    if (row.empty()) {
        return false;
    }
    std::string first = toLower(cellToString(row.front()));
    return first.find("statement summary") != std::string::npos ||
           first.find("brought forward") != std::string::npos ||
           first.find("please do not share") != std::string::npos;
}

RowNormalizer::RowNormalizer(ColumnMapping mapping, std::string source_file, Timestamp imported_at)
    : mapping_(std::move(mapping)), source_file_(std::move(source_file)), imported_at_(imported_at) {}

const Cell& RowNormalizer::cellAt(const CellRow& row, CanonicalField field) const {
    size_t column = mapping_.column(field);
    return column < row.size() ? row[column] : emptyCell();
}

RowOutcome RowNormalizer::normalize(const CellRow& row, size_t grid_index) const {
    RowOutcome outcome;
    const size_t row_number = grid_index + 1;

    if (isBlankRow(row) || isFooterRow(row)) {
        return outcome;
    }

    const Cell& date_cell = cellAt(row, CanonicalField::DATE);
    std::optional<CalendarDate> date = parseDateCell(date_cell);
    if (!date) {
        outcome.disposition = RowDisposition::REJECTED;
        outcome.diagnostic = ParseDiagnostic{row_number, mapping_.headerName(CanonicalField::DATE),
                                             "Invalid date: " + cellToString(date_cell),
                                             DiagnosticSeverity::WARNING};
        return outcome;
    }

    const Cell& balance_cell = cellAt(row, CanonicalField::BALANCE);
    std::optional<double> balance = parseAmountCell(balance_cell);
    if (!balance) {
        outcome.disposition = RowDisposition::REJECTED;
        outcome.diagnostic = ParseDiagnostic{row_number, mapping_.headerName(CanonicalField::BALANCE),
                                             "Invalid balance: " + cellToString(balance_cell),
                                             DiagnosticSeverity::WARNING};
        return outcome;
    }

    std::optional<double> debit = parseAmountCell(cellAt(row, CanonicalField::DEBIT));
    std::optional<double> credit = parseAmountCell(cellAt(row, CanonicalField::CREDIT));
    // EN: Neither side filled: an opening-balance or memo line, skipped silently.
    // FR: Aucun côté rempli : ligne de solde d'ouverture ou de mémo, ignorée silencieusement.
    if (!debit && !credit) {
        return outcome;
    }
    // EN: Exactly one side survives; the debit wins when a bank fills both.
    // FR: Un seul côté est conservé ; le débit l'emporte quand la banque remplit les deux.
    if (debit && credit) {
        credit.reset();
    }

    Transaction txn;
    txn.date = *date;
    txn.narrative = trim(cellToString(cellAt(row, CanonicalField::NARRATIVE)));
    txn.reference = trim(cellToString(cellAt(row, CanonicalField::REFERENCE)));
    txn.debit = debit;
    txn.credit = credit;
    txn.balance = *balance;
    txn.type = debit ? TransactionType::DEBIT : TransactionType::CREDIT;
    txn.amount = std::fabs(debit ? *debit : *credit);
    txn.channel = detectPaymentChannel(txn.narrative);
    txn.source_file = source_file_;
    txn.imported_at = imported_at_;
    txn.id = makeTransactionId(txn.date, txn.reference, txn.amount);

    outcome.disposition = RowDisposition::ACCEPTED;
    outcome.transaction = std::move(txn);
    return outcome;
}

} // namespace Ingest
} // namespace FIN
