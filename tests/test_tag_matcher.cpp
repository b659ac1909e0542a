#include <gtest/gtest.h>

#include "categorize/tag_matcher.hpp"

using namespace FIN;
using namespace FIN::Categorize;

// Test fixture with two small tags
// Fixture de test avec deux petits tags
class TagMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        food_.id = "tag-1";
        food_.name = "Food";
        food_.keywords = {"swiggy", "zomato", "food"};

        travel_.id = "tag-2";
        travel_.name = "Travel";
        travel_.keywords = {"uber", "ola"};

        tags_ = {food_, travel_};
    }

    static Transaction txn(const std::string& id, const std::string& narrative, double amount = 100.0) {
        Transaction t;
        t.id = id;
        t.narrative = narrative;
        t.amount = amount;
        return t;
    }

    Tag food_;
    Tag travel_;
    std::vector<Tag> tags_;
};

TEST_F(TagMatcherTest, FirstKeywordPerTag) {
    CategorizationResult result = categorizeTransaction(txn("t1", "UPI/DR/1/Swiggy Food Court/x"), tags_);

    EXPECT_EQ(result.transaction_id, "t1");
    ASSERT_EQ(result.matched_tags.size(), 1u);
    EXPECT_EQ(result.matched_tags[0].tag_id, "tag-1");
    EXPECT_EQ(result.matched_tags[0].keyword, "swiggy");
    EXPECT_EQ(result.matched_tags[0].match_position, 9u);
}

TEST_F(TagMatcherTest, MultipleTagsInCatalogueOrder) {
    CategorizationResult result = categorizeTransaction(txn("t2", "UBER EATS zomato"), tags_);

    ASSERT_EQ(result.matched_tags.size(), 2u);
    EXPECT_EQ(result.matched_tags[0].tag_id, "tag-1");
    EXPECT_EQ(result.matched_tags[1].tag_id, "tag-2");
}

TEST_F(TagMatcherTest, KeywordBagMatchesEitherWay) {
    auto matches = matchKeywordsToTags({"Acme", "Olacabs", "Swig"}, tags_);

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].tag_id, "tag-1");
    EXPECT_EQ(matches[0].keyword, "swiggy");
    EXPECT_EQ(matches[0].match_position, 2u);
    EXPECT_EQ(matches[1].tag_id, "tag-2");
    EXPECT_EQ(matches[1].match_position, 1u);
}

TEST_F(TagMatcherTest, RecategorizePreservesManualOverride) {
    Transaction manual = txn("t1", "swiggy order");
    manual.manual_tag_override = true;
    manual.tag_ids = {"tag-custom"};

    Transaction stale = txn("t2", "uber ride");
    stale.tag_ids = {"tag-1"};

    Transaction plain = txn("t3", "rent");

    auto result = recategorizeTransactions({manual, stale, plain}, tags_);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], manual);
    EXPECT_EQ(result[1].tag_ids, std::vector<std::string>{"tag-2"});
    EXPECT_TRUE(result[2].tag_ids.empty());
}

TEST_F(TagMatcherTest, Queries) {
    Transaction a = txn("a", "x");
    a.tag_ids = {"tag-1"};
    Transaction b = txn("b", "y");
    b.tag_ids = {"tag-2", "tag-1"};
    Transaction c = txn("c", "z");
    Transaction d = txn("d", "w");
    d.manual_tag_override = true;

    std::vector<Transaction> all = {a, b, c, d};

    EXPECT_EQ(findTransactionsByTag(all, "tag-1").size(), 2u);
    EXPECT_EQ(findTransactionsByTags(all, {"tag-2", "tag-9"}).size(), 1u);

    auto untagged = findUntaggedTransactions(all);
    ASSERT_EQ(untagged.size(), 1u);
    EXPECT_EQ(untagged[0].id, "c");
}
