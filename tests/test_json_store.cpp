#include <gtest/gtest.h>

#include "model/json_codec.hpp"
#include "storage/checksum.hpp"
#include "storage/json_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace FIN;
using namespace FIN::Storage;

// Test fixture giving each test its own store directory
// Fixture de test donnant à chaque test son propre répertoire de store
class JsonStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("finsight_store_") + info->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void writeRaw(const std::string& file_name, const std::string& content) {
        std::filesystem::create_directories(dir_);
        std::ofstream file(dir_ / file_name);
        file << content;
    }

    nlohmann::json readRaw(const std::string& file_name) const {
        std::ifstream file(dir_ / file_name);
        return nlohmann::json::parse(file);
    }

    static Transaction sample(const std::string& reference) {
        Transaction txn;
        txn.date = CalendarDate(2024, 1, 2);
        txn.narrative = "UPI/DR/124/Acme/x";
        txn.reference = reference;
        txn.debit = 200.0;
        txn.amount = 200.0;
        txn.balance = 1300.0;
        txn.id = makeTransactionId(txn.date, reference, txn.amount);
        txn.source_file = "jan.xlsx";
        txn.imported_at = Timestamp(std::chrono::milliseconds(1704110400000LL));
        return txn;
    }

    std::filesystem::path dir_;
};

TEST_F(JsonStoreTest, FreshStoreIsCreatedAtCurrentVersion) {
    JsonStore store(dir_.string());
    EXPECT_FALSE(store.isOpen());

    ASSERT_EQ(store.open(), StoreError::NONE);
    EXPECT_TRUE(store.isOpen());
    EXPECT_EQ(store.schemaVersion(), JsonStore::kCurrentSchemaVersion);
    EXPECT_EQ(readRaw(JsonStore::kMetaFile)["schema_version"], 2);

    std::vector<Transaction> txns;
    EXPECT_EQ(store.loadTransactions(txns), StoreError::NONE);
    EXPECT_TRUE(txns.empty());
    EXPECT_TRUE(std::filesystem::exists(dir_ / JsonStore::kFilesFile));
}

TEST_F(JsonStoreTest, SaveReplacesCollectionAtomically) {
    JsonStore store(dir_.string());
    ASSERT_EQ(store.open(), StoreError::NONE);

    ASSERT_EQ(store.saveTransactions({sample("R1"), sample("R2")}), StoreError::NONE);
    ASSERT_EQ(store.saveTransactions({sample("R3")}), StoreError::NONE);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "transactions.json.tmp"));

    std::vector<Transaction> loaded;
    ASSERT_EQ(store.loadTransactions(loaded), StoreError::NONE);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0], sample("R3"));
}

TEST_F(JsonStoreTest, DeleteByKey) {
    JsonStore store(dir_.string());
    ASSERT_EQ(store.open(), StoreError::NONE);
    ASSERT_EQ(store.saveTransactions({sample("R1"), sample("R2")}), StoreError::NONE);

    EXPECT_EQ(store.deleteTransaction(sample("R1").id), StoreError::NONE);
    EXPECT_EQ(store.deleteTransaction(sample("R1").id), StoreError::NOT_FOUND);

    UploadedFileRecord record;
    record.file_name = "jan.xlsx";
    record.checksum = "cbf43926";
    ASSERT_EQ(store.saveFiles({record}), StoreError::NONE);
    EXPECT_EQ(store.deleteFile("feb.xlsx"), StoreError::NOT_FOUND);
    EXPECT_EQ(store.deleteFile("jan.xlsx"), StoreError::NONE);

    std::vector<Transaction> left;
    ASSERT_EQ(store.loadTransactions(left), StoreError::NONE);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].reference, "R2");
}

TEST_F(JsonStoreTest, TagsAndBudgetsRoundTrip) {
    JsonStore store(dir_.string());
    ASSERT_EQ(store.open(), StoreError::NONE);

    Tag tag;
    tag.id = "tag-1";
    tag.name = "Food";
    tag.keywords = {"swiggy"};
    tag.color = "#ef4444";
    Budget budget;
    budget.id = "budget-1";
    budget.tag_id = "tag-1";
    budget.limit = 4000.0;

    ASSERT_EQ(store.saveTags({tag}), StoreError::NONE);
    ASSERT_EQ(store.saveBudgets({budget}), StoreError::NONE);

    std::vector<Tag> tags;
    std::vector<Budget> budgets;
    ASSERT_EQ(store.loadTags(tags), StoreError::NONE);
    ASSERT_EQ(store.loadBudgets(budgets), StoreError::NONE);
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].keywords, tag.keywords);
    ASSERT_EQ(budgets.size(), 1u);
    EXPECT_DOUBLE_EQ(budgets[0].limit, 4000.0);

    EXPECT_EQ(store.deleteBudget("budget-1"), StoreError::NONE);
    EXPECT_EQ(store.deleteTag("tag-2"), StoreError::NOT_FOUND);
}

TEST_F(JsonStoreTest, MigratesVersionOneDocuments) {
    nlohmann::json legacy = sample("R1");
    legacy.erase("customTags");
    legacy.erase("isReviewed");
    legacy.erase("notes");

    nlohmann::json legacy_tag = {
        {"id", "tag-1"}, {"name", "Food"}, {"keywords", {"swiggy"}}, {"color", "#ef4444"},
        {"icon", nullptr}, {"isDefault", true},
        {"createdAt", "2024-01-01T00:00:00.000Z"}, {"updatedAt", "2024-01-01T00:00:00.000Z"}
    };

    writeRaw(JsonStore::kMetaFile, R"({"schema_version": 1})");
    writeRaw(JsonStore::kTransactionsFile, nlohmann::json::array({legacy}).dump());
    writeRaw(JsonStore::kTagsFile, nlohmann::json::array({legacy_tag}).dump());
    writeRaw(JsonStore::kBudgetsFile, "[]");
    writeRaw(JsonStore::kFilesFile, "[]");

    JsonStore store(dir_.string());
    ASSERT_EQ(store.open(), StoreError::NONE);
    EXPECT_EQ(store.schemaVersion(), 2);

    nlohmann::json migrated = readRaw(JsonStore::kTransactionsFile);
    EXPECT_EQ(migrated[0]["customTags"], nlohmann::json::array());
    EXPECT_EQ(migrated[0]["isReviewed"], false);
    EXPECT_TRUE(migrated[0]["notes"].is_null());
    EXPECT_TRUE(readRaw(JsonStore::kTagsFile)[0]["parentTagId"].is_null());

    std::vector<Transaction> loaded;
    ASSERT_EQ(store.loadTransactions(loaded), StoreError::NONE);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_FALSE(loaded[0].is_reviewed);
    EXPECT_TRUE(loaded[0].custom_tags.empty());
}

TEST_F(JsonStoreTest, RejectsNewerSchema) {
    writeRaw(JsonStore::kMetaFile, R"({"schema_version": 99})");

    JsonStore store(dir_.string());
    EXPECT_EQ(store.open(), StoreError::SCHEMA_ERROR);
    EXPECT_FALSE(store.isOpen());
}

TEST_F(JsonStoreTest, ReportsMalformedDocuments) {
    JsonStore store(dir_.string());
    ASSERT_EQ(store.open(), StoreError::NONE);

    writeRaw(JsonStore::kTransactionsFile, "[{not json");
    std::vector<Transaction> txns;
    EXPECT_EQ(store.loadTransactions(txns), StoreError::PARSE_ERROR);

    writeRaw(JsonStore::kTransactionsFile, R"([{"id": "x"}])");
    EXPECT_EQ(store.loadTransactions(txns), StoreError::SCHEMA_ERROR);

    writeRaw(JsonStore::kTagsFile, R"({"id": "x"})");
    std::vector<Tag> tags;
    EXPECT_EQ(store.loadTags(tags), StoreError::SCHEMA_ERROR);
}

TEST_F(JsonStoreTest, OperationsRequireOpen) {
    JsonStore store(dir_.string());
    std::vector<Transaction> txns;

    EXPECT_EQ(store.loadTransactions(txns), StoreError::NOT_OPEN);
    EXPECT_EQ(store.saveTransactions(txns), StoreError::NOT_OPEN);
    EXPECT_EQ(store.deleteTransaction("x"), StoreError::NOT_OPEN);
    EXPECT_EQ(storeErrorToString(StoreError::NOT_OPEN), "not_open");
}

TEST(ChecksumTest, Crc32CheckValue) {
    std::string text = "123456789";
    std::vector<uint8_t> bytes(text.begin(), text.end());

    EXPECT_EQ(crc32Of(bytes), 0xCBF43926u);
    EXPECT_EQ(crc32Hex(bytes), "cbf43926");
    EXPECT_EQ(crc32Hex({}), "00000000");
}
