// EN: Canonical records shared by ingestion, categorization, analytics and storage.
// FR: Enregistrements canoniques partagés par l'ingestion, la catégorisation, l'analytique et le stockage.

#pragma once

#include "model/calendar_date.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FIN {

enum class TransactionType {
    DEBIT,
    CREDIT
};

// EN: Closed set of transfer mechanisms recognised in narratives.
// FR: Ensemble fermé des mécanismes de transfert reconnus dans les libellés.
enum class PaymentChannel {
    INSTANT_TRANSFER,   // EN: UPI / FR: UPI
    WIRE,               // EN: NEFT / FR: NEFT
    IMMEDIATE_TRANSFER, // EN: IMPS / FR: IMPS
    ATM,
    POINT_OF_SALE,
    CHEQUE,
    OTHER
};

std::string transactionTypeToString(TransactionType type);
std::optional<TransactionType> transactionTypeFromString(const std::string& text);
std::string paymentChannelToString(PaymentChannel channel);
std::optional<PaymentChannel> paymentChannelFromString(const std::string& text);

struct Transaction {
    std::string id;
    CalendarDate date;
    std::string narrative;
    std::string reference;
    std::optional<double> debit;
    std::optional<double> credit;
    double balance{0.0};
    double amount{0.0};
    TransactionType type{TransactionType::DEBIT};
    PaymentChannel channel{PaymentChannel::OTHER};

    std::vector<std::string> tag_ids;
    bool manual_tag_override{false};
    std::optional<std::string> notes;
    std::vector<std::string> custom_tags;
    bool is_reviewed{false};

    std::string source_file;
    Timestamp imported_at{};

    bool isDebit() const { return type == TransactionType::DEBIT; }
    bool isCredit() const { return type == TransactionType::CREDIT; }

    bool operator==(const Transaction& o) const;
    bool operator!=(const Transaction& o) const { return !(*this == o); }
};

// EN: Stable id: YYYYMMDD-<reference>-<amount with 2 decimals>.
// FR: Id stable : YYYYMMDD-<référence>-<montant à 2 décimales>.
std::string makeTransactionId(const CalendarDate& date, const std::string& reference, double amount);

struct Tag {
    std::string id;
    std::string name;
    std::vector<std::string> keywords;
    std::string color;
    std::optional<std::string> icon;
    bool is_default{false};
    std::optional<std::string> parent_tag_id;
    Timestamp created_at{};
    Timestamp updated_at{};
};

enum class BudgetPeriod {
    MONTHLY,
    YEARLY
};

std::string budgetPeriodToString(BudgetPeriod period);
std::optional<BudgetPeriod> budgetPeriodFromString(const std::string& text);

struct Budget {
    std::string id;
    std::string tag_id;
    double limit{0.0};
    BudgetPeriod period{BudgetPeriod::MONTHLY};
    Timestamp created_at{};
};

struct UploadedFileRecord {
    std::string file_name;
    Timestamp uploaded_at{};
    size_t transaction_count{0};
    std::optional<DateRange> date_range;
    std::string checksum; // EN: CRC-32, 8 lowercase hex digits / FR: CRC-32, 8 chiffres hexa minuscules
};

} // namespace FIN
