#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "categorize/merchant_extractor.hpp"
#include "ingest/statement_parser.hpp"

using namespace FIN;
using namespace FIN::Ingest;
using namespace testing;

namespace {

class MockGridDecoder : public GridDecoder {
public:
    MOCK_METHOD(CellGrid, decode, (const std::vector<uint8_t>&, const std::optional<std::string>&),
                (const, override));
};

CellRow textRow(const std::vector<std::string>& values) {
    CellRow row;
    for (const auto& value : values) {
        row.emplace_back(value);
    }
    return row;
}

const std::vector<uint8_t> kZipBytes = {0x50, 0x4B, 0x03, 0x04, 0x00, 0x00};
const std::vector<uint8_t> kEncryptedBytes = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1};

} // namespace

// Test fixture wiring a mock decoder and a fixed clock
// Fixture de test reliant un décodeur simulé et une horloge fixe
class StatementParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        decoder_ = std::make_shared<StrictMock<MockGridDecoder>>();
        parser_ = std::make_unique<StatementParser>(decoder_);

        fixed_now_ = Timestamp(std::chrono::milliseconds(1706700000000LL));
        options_.file_name = "statement.xlsx";
        Timestamp fixed = fixed_now_;
        options_.clock = [fixed]() { return fixed; };
    }

    CellGrid sampleGrid() const {
        return CellGrid{
            textRow({"Account Name", "MR SAMPLE"}),
            CellRow{},
            textRow({"Date", "Details", "Ref No./Cheque No.", "Debit", "Credit", "Balance"}),
            textRow({"01 Jan 2024", "UPI/DR/123/Acme/x", "REF1", "", "500.00", "1500.00"}),
            textRow({"02 Jan 2024", "UPI/DR/124/Acme/x", "REF2", "200.00", "", "1300.00"}),
        };
    }

    std::shared_ptr<StrictMock<MockGridDecoder>> decoder_;
    std::unique_ptr<StatementParser> parser_;
    ParseOptions options_;
    Timestamp fixed_now_;
};

TEST_F(StatementParserTest, ParsesCreditThenDebit) {
    EXPECT_CALL(*decoder_, decode(_, _)).WillOnce(Return(sampleGrid()));

    ParseResult result = parser_->parse(kZipBytes, options_);

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.transactions.size(), 2u);
    EXPECT_TRUE(result.diagnostics.empty());

    const Transaction& first = result.transactions[0];
    EXPECT_EQ(first.type, TransactionType::CREDIT);
    EXPECT_DOUBLE_EQ(first.amount, 500.0);
    EXPECT_DOUBLE_EQ(first.balance, 1500.0);
    EXPECT_EQ(first.channel, PaymentChannel::INSTANT_TRANSFER);
    EXPECT_EQ(first.imported_at, fixed_now_);

    const Transaction& second = result.transactions[1];
    EXPECT_EQ(second.type, TransactionType::DEBIT);
    EXPECT_DOUBLE_EQ(second.amount, 200.0);
    EXPECT_DOUBLE_EQ(second.balance, 1300.0);
    EXPECT_EQ(second.channel, PaymentChannel::INSTANT_TRANSFER);

    EXPECT_EQ(Categorize::extractMerchantName(first.narrative), std::optional<std::string>("Acme"));
    EXPECT_EQ(Categorize::extractMerchantName(second.narrative), std::optional<std::string>("Acme"));

    ASSERT_TRUE(result.date_range.has_value());
    EXPECT_EQ(result.date_range->start, CalendarDate(2024, 1, 1));
    EXPECT_EQ(result.date_range->end, CalendarDate(2024, 1, 2));
    EXPECT_EQ(result.metadata.bank_name, "State Bank of India");
    EXPECT_EQ(result.metadata.transaction_count, 2u);
    EXPECT_EQ(result.metadata.parsed_at, fixed_now_);
}

TEST_F(StatementParserTest, SameInputSameClockIsDeterministic) {
    EXPECT_CALL(*decoder_, decode(_, _)).Times(2).WillRepeatedly(Return(sampleGrid()));

    ParseResult a = parser_->parse(kZipBytes, options_);
    ParseResult b = parser_->parse(kZipBytes, options_);

    EXPECT_EQ(a.transactions, b.transactions);
    EXPECT_EQ(a.metadata.parsed_at, b.metadata.parsed_at);
}

TEST_F(StatementParserTest, DuplicateRowsCollapse) {
    CellGrid grid = sampleGrid();
    grid.push_back(textRow({"01 Jan 2024", "UPI/DR/123/Acme/x", "REF1", "", "500.00", "1500.00"}));

    ParseResult result = parser_->parseGrid(grid, options_);
    EXPECT_EQ(result.transactions.size(), 2u);
}

TEST_F(StatementParserTest, RowWarningsKeepSuccess) {
    CellGrid grid = sampleGrid();
    grid.push_back(textRow({"not a date", "x", "REF9", "1.00", "", "10.00"}));
    grid.push_back(textRow({"Statement Summary", "", "", "", "", ""}));

    ParseResult result = parser_->parseGrid(grid, options_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transactions.size(), 2u);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].row, 6u);
    EXPECT_EQ(result.warningCount(), 1u);
    EXPECT_EQ(result.errorCount(), 0u);
}

TEST_F(StatementParserTest, EmptyInputFailsWithoutDecoding) {
    ParseResult result = parser_->parse({}, options_);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.transactions.empty());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].row, 0u);
    EXPECT_EQ(result.diagnostics[0].severity, DiagnosticSeverity::ERROR);
    EXPECT_EQ(result.metadata.bank_name, "Unknown");
}

TEST_F(StatementParserTest, UnknownFormatFails) {
    ParseResult result = parser_->parse({'a', 'b', 'c', 'd'}, options_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.diagnostics[0].message, "Failed to read Excel file. File may be corrupted or invalid.");
}

TEST_F(StatementParserTest, EncryptedWithoutPasswordFails) {
    ParseResult result = parser_->parse(kEncryptedBytes, options_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.diagnostics[0].message, "This file is password protected. Please provide the password.");
}

TEST_F(StatementParserTest, DecodeErrorBecomesDiagnostic) {
    options_.password = "secret";
    EXPECT_CALL(*decoder_, decode(_, Eq(std::optional<std::string>("secret"))))
        .WillOnce(Throw(DecodeError(DecodeErrorCode::WRONG_PASSWORD, "Incorrect password")));

    ParseResult result = parser_->parse(kEncryptedBytes, options_);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].message, "Incorrect password");
}

TEST_F(StatementParserTest, MissingHeaderFails) {
    CellGrid grid = {textRow({"a", "b", "c", "d"}), textRow({"1", "2", "3", "4"})};
    ParseResult result = parser_->parseGrid(grid, options_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.diagnostics[0].row, 0u);
    EXPECT_NE(result.diagnostics[0].message.find("Could not find transaction header row"), std::string::npos);
}

TEST_F(StatementParserTest, HeaderWithoutDataFails) {
    CellGrid grid = sampleGrid();
    grid.resize(3);
    ParseResult result = parser_->parseGrid(grid, options_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.diagnostics[0].message, "No transaction data found after header row");
}

TEST_F(StatementParserTest, UnresolvedColumnsFail) {
    CellGrid grid = {
        textRow({"Date", "Details", "Debit", "Credit", "Balance Due"}),
        textRow({"01 Jan 2024", "x", "", "1", "1"}),
    };
    ParseResult result = parser_->parseGrid(grid, options_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.diagnostics[0].row, 1u);
    EXPECT_EQ(result.diagnostics[0].message, "Could not detect required columns. Missing: refNo, balance");
}

TEST(StatementParserConstructionTest, RequiresDecoder) {
    EXPECT_THROW(StatementParser(nullptr), std::invalid_argument);
}
