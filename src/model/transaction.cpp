#include "model/transaction.hpp"

#include <cstdio>

namespace FIN {

std::string transactionTypeToString(TransactionType type) {
    return type == TransactionType::DEBIT ? "debit" : "credit";
}

std::optional<TransactionType> transactionTypeFromString(const std::string& text) {
    if (text == "debit") return TransactionType::DEBIT;
    if (text == "credit") return TransactionType::CREDIT;
    return std::nullopt;
}

std::string paymentChannelToString(PaymentChannel channel) {
    switch (channel) {
        case PaymentChannel::INSTANT_TRANSFER: return "UPI";
        case PaymentChannel::WIRE: return "NEFT";
        case PaymentChannel::IMMEDIATE_TRANSFER: return "IMPS";
        case PaymentChannel::ATM: return "ATM";
        case PaymentChannel::POINT_OF_SALE: return "POS";
        case PaymentChannel::CHEQUE: return "CHEQUE";
        case PaymentChannel::OTHER: return "OTHER";
    }
    return "OTHER";
}

std::optional<PaymentChannel> paymentChannelFromString(const std::string& text) {
    static const PaymentChannel kAll[] = {
        PaymentChannel::INSTANT_TRANSFER, PaymentChannel::WIRE, PaymentChannel::IMMEDIATE_TRANSFER,
        PaymentChannel::ATM, PaymentChannel::POINT_OF_SALE, PaymentChannel::CHEQUE, PaymentChannel::OTHER
    };
    for (PaymentChannel channel : kAll) {
        if (paymentChannelToString(channel) == text) {
            return channel;
        }
    }
    return std::nullopt;
}

std::string budgetPeriodToString(BudgetPeriod period) {
    return period == BudgetPeriod::MONTHLY ? "monthly" : "yearly";
}

std::optional<BudgetPeriod> budgetPeriodFromString(const std::string& text) {
    if (text == "monthly") return BudgetPeriod::MONTHLY;
    if (text == "yearly") return BudgetPeriod::YEARLY;
    return std::nullopt;
}

std::string makeTransactionId(const CalendarDate& date, const std::string& reference, double amount) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", amount);
    return date.toCompactString() + "-" + reference + "-" + buf;
}

bool Transaction::operator==(const Transaction& o) const {
    return id == o.id && date == o.date && narrative == o.narrative && reference == o.reference &&
           debit == o.debit && credit == o.credit && balance == o.balance && amount == o.amount &&
           type == o.type && channel == o.channel && tag_ids == o.tag_ids &&
           manual_tag_override == o.manual_tag_override && notes == o.notes &&
           custom_tags == o.custom_tags && is_reviewed == o.is_reviewed &&
           source_file == o.source_file && imported_at == o.imported_at;
}

} // namespace FIN
