#include <gtest/gtest.h>

#include "categorize/tag_catalogue.hpp"

#include <regex>

using namespace FIN;
using namespace FIN::Categorize;

namespace {

const Timestamp kNow{std::chrono::milliseconds(1704067200000LL)};

} // namespace

TEST(TagCatalogueTest, DefaultTagsAreNumberedFromOne) {
    auto tags = defaultTags(kNow);

    ASSERT_EQ(tags.size(), defaultTagTemplates().size());
    EXPECT_EQ(tags.size(), 11u);
    EXPECT_EQ(tags.front().id, "tag-1");
    EXPECT_EQ(tags.front().name, "Food & Delivery");
    EXPECT_EQ(tags.back().id, "tag-11");
    for (const auto& tag : tags) {
        EXPECT_TRUE(tag.is_default);
        EXPECT_EQ(tag.created_at, kNow);
        EXPECT_FALSE(tag.keywords.empty());
    }
}

TEST(TagCatalogueTest, ValidationMessages) {
    EXPECT_EQ(validateTagData("  ", {"a"}), std::optional<std::string>("Tag name is required"));
    EXPECT_EQ(validateTagData(std::string(51, 'x'), {"a"}),
              std::optional<std::string>("Tag name must be 50 characters or less"));
    EXPECT_EQ(validateTagData("Pets", {}), std::optional<std::string>("At least one keyword is required"));
    EXPECT_EQ(validateTagData("Pets", {"vet", " "}), std::optional<std::string>("Keywords cannot be empty"));
    EXPECT_FALSE(validateTagData(std::string(50, 'x'), {"vet"}).has_value());
}

TEST(TagCatalogueTest, CustomTagIdentity) {
    Tag tag = createCustomTag("Pets", {"vet", "petco"}, "#123456", std::nullopt, kNow);

    EXPECT_TRUE(std::regex_match(tag.id, std::regex("tag-1704067200000-[0-9a-z]{9}")));
    EXPECT_FALSE(tag.is_default);
    EXPECT_EQ(tag.color, "#123456");
    EXPECT_EQ(tag.updated_at, kNow);

    Tag other = createCustomTag("Pets", {"vet"}, "#123456", std::nullopt, kNow);
    EXPECT_NE(tag.id, other.id);

    EXPECT_THROW(createCustomTag("", {"vet"}, "#000000"), std::invalid_argument);
}

TEST(TagCatalogueTest, MergeSkipsDefaultsShadowedByName) {
    Tag mine = createCustomTag("shopping", {"etsy"}, "#000000", std::nullopt, kNow);
    auto merged = mergeWithDefaultTags({mine}, kNow);

    EXPECT_EQ(merged.size(), 11u);
    EXPECT_EQ(merged.back().id, mine.id);
    for (size_t i = 0; i + 1 < merged.size(); ++i) {
        EXPECT_NE(merged[i].name, "Shopping");
    }
}

TEST(TagCatalogueTest, StatisticsAndSuggestions) {
    std::vector<Tag> tags = defaultTags(kNow);

    auto make = [](const std::string& narrative, double amount, std::vector<std::string> tag_ids) {
        Transaction t;
        t.narrative = narrative;
        t.amount = amount;
        t.tag_ids = std::move(tag_ids);
        return t;
    };
    std::vector<Transaction> txns = {
        make("UPI/Swiggy/Order Bangalore", 300.0, {"tag-1"}),
        make("UPI/Swiggy/Order Mumbai", 200.0, {"tag-1"}),
        make("Zomato order", 150.0, {"tag-1", "tag-9"}),
        make("Netflix", 649.0, {"tag-9"}),
    };

    auto stats = tagStatistics(txns, tags);
    ASSERT_EQ(stats.size(), tags.size());
    EXPECT_EQ(stats[0].count, 3u);
    EXPECT_DOUBLE_EQ(stats[0].total_amount, 650.0);
    EXPECT_EQ(stats[8].count, 2u);
    EXPECT_EQ(stats[1].count, 0u);

    auto suggestions = suggestKeywordsForTag(txns, "tag-1");
    ASSERT_EQ(suggestions.size(), 3u);
    EXPECT_EQ(suggestions[0], "order");
    EXPECT_EQ(suggestions[1], "swiggy");
    EXPECT_EQ(suggestions[2], "upi");
}
