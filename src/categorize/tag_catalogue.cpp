#include "categorize/tag_catalogue.hpp"
#include "categorize/tag_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace FIN {
namespace Categorize {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string randomSuffix(size_t length) {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string suffix;
    suffix.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        suffix += kAlphabet[pick(generator)];
    }
    return suffix;
}

} // namespace

const std::vector<TagTemplate>& defaultTagTemplates() {
    static const std::vector<TagTemplate> kTemplates = {
        {"Food & Delivery",
         {"swiggy", "zomato", "uber eats", "dominos", "pizza", "mcdonald", "kfc", "burger", "restaurant",
          "food", "cafe", "coffee", "starbucks"},
         "#ef4444", "\xF0\x9F\x8D\x94"},
        {"Shopping",
         {"amazon", "flipkart", "myntra", "ajio", "meesho", "shopping", "retail", "store", "mall",
          "supermarket", "grocery", "bigbasket", "blinkit", "zepto"},
         "#8b5cf6", "\xF0\x9F\x9B\x92"},
        {"Utilities",
         {"electricity", "water", "gas", "internet", "broadband", "mobile", "recharge", "bill", "utility",
          "airtel", "jio", "vodafone", "bsnl"},
         "#3b82f6", "\xF0\x9F\x92\xA1"},
        {"Investments",
         {"mutual fund", "sip", "stock", "zerodha", "groww", "upstox", "investment", "trading", "equity",
          "gold", "bond", "fd", "fixed deposit"},
         "#10b981", "\xF0\x9F\x93\x88"},
        {"EMI & Loans",
         {"emi", "loan", "credit card", "installment", "repayment", "hdfc", "icici", "sbi", "axis", "kotak",
          "mortgage", "personal loan", "home loan"},
         "#f59e0b", "\xF0\x9F\x92\xB3"},
        {"ATM Withdrawals",
         {"atm", "cash withdrawal", "cwd", "withdrawal", "cash"},
         "#6366f1", "\xF0\x9F\x8F\xA7"},
        {"Refunds",
         {"refund", "reversal", "cashback", "return", "credit", "reimbursement"},
         "#14b8a6", "\xE2\x86\xA9\xEF\xB8\x8F"},
        {"Insurance",
         {"insurance", "premium", "policy", "lic", "health insurance", "life insurance", "car insurance",
          "term insurance"},
         "#ec4899", "\xF0\x9F\x9B\xA1\xEF\xB8\x8F"},
        {"Entertainment",
         {"netflix", "prime video", "hotstar", "spotify", "youtube", "movie", "cinema", "pvr", "inox",
          "entertainment", "subscription", "gaming"},
         "#f97316", "\xF0\x9F\x8E\xAC"},
        {"Transportation",
         {"uber", "ola", "rapido", "metro", "bus", "train", "taxi", "fuel", "petrol", "diesel", "parking",
          "toll"},
         "#06b6d4", "\xF0\x9F\x9A\x97"},
        {"Healthcare",
         {"hospital", "doctor", "pharmacy", "medicine", "medical", "health", "clinic", "apollo", "fortis",
          "max", "diagnostic", "lab"},
         "#dc2626", "\xF0\x9F\x8F\xA5"}
    };
    return kTemplates;
}

std::vector<Tag> createTagsFromTemplates(const std::vector<TagTemplate>& templates, int start_id, Timestamp now) {
    std::vector<Tag> tags;
    tags.reserve(templates.size());
    for (size_t i = 0; i < templates.size(); ++i) {
        Tag tag;
        tag.id = "tag-" + std::to_string(start_id + static_cast<int>(i));
        tag.name = templates[i].name;
        tag.keywords = templates[i].keywords;
        tag.color = templates[i].color;
        tag.icon = templates[i].icon;
        tag.is_default = true;
        tag.created_at = now;
        tag.updated_at = now;
        tags.push_back(std::move(tag));
    }
    return tags;
}

std::vector<Tag> defaultTags(Timestamp now) {
    return createTagsFromTemplates(defaultTagTemplates(), 1, now);
}

std::optional<std::string> validateTagData(const std::string& name, const std::vector<std::string>& keywords) {
    if (isBlank(name)) {
        return std::string("Tag name is required");
    }
    if (name.size() > 50) {
        return std::string("Tag name must be 50 characters or less");
    }
    if (keywords.empty()) {
        return std::string("At least one keyword is required");
    }
    if (std::any_of(keywords.begin(), keywords.end(), isBlank)) {
        return std::string("Keywords cannot be empty");
    }
    return std::nullopt;
}

Tag createCustomTag(const std::string& name, const std::vector<std::string>& keywords, const std::string& color,
                    const std::optional<std::string>& icon, Timestamp now) {
    if (auto error = validateTagData(name, keywords)) {
        throw std::invalid_argument(*error);
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    Tag tag;
    tag.id = "tag-" + std::to_string(millis) + "-" + randomSuffix(9);
    tag.name = name;
    tag.keywords = keywords;
    tag.color = color;
    tag.icon = icon;
    tag.is_default = false;
    tag.created_at = now;
    tag.updated_at = now;
    return tag;
}

std::vector<Tag> mergeWithDefaultTags(const std::vector<Tag>& user_tags, Timestamp now) {
    std::unordered_set<std::string> user_names;
    for (const auto& tag : user_tags) {
        user_names.insert(toLower(tag.name));
    }

    std::vector<Tag> merged;
    for (auto& tag : defaultTags(now)) {
        if (user_names.count(toLower(tag.name)) == 0) {
            merged.push_back(std::move(tag));
        }
    }
    merged.insert(merged.end(), user_tags.begin(), user_tags.end());
    return merged;
}

std::vector<TagStatistic> tagStatistics(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags) {
    std::vector<TagStatistic> stats;
    std::unordered_map<std::string, size_t> index;
    for (const auto& tag : tags) {
        index.emplace(tag.id, stats.size());
        stats.push_back(TagStatistic{tag, 0, 0.0});
    }

    for (const auto& txn : transactions) {
        for (const auto& tag_id : txn.tag_ids) {
            auto it = index.find(tag_id);
            if (it != index.end()) {
                stats[it->second].count++;
                stats[it->second].total_amount += txn.amount;
            }
        }
    }
    return stats;
}

std::vector<std::string> suggestKeywordsForTag(const std::vector<Transaction>& transactions,
                                               const std::string& tag_id, size_t min_frequency) {
    std::map<std::string, size_t> frequency;

    for (const auto& txn : findTransactionsByTag(transactions, tag_id)) {
        std::string text = toLower(txn.narrative);
        for (char& c : text) {
            unsigned char u = static_cast<unsigned char>(c);
            if (!(std::isalnum(u) || std::isspace(u))) {
                c = ' ';
            }
        }
        std::istringstream stream(text);
        std::string word;
        while (stream >> word) {
            if (word.size() > 2) {
                frequency[word]++;
            }
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked;
    for (const auto& [word, count] : frequency) {
        if (count >= min_frequency) {
            ranked.emplace_back(word, count);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> suggestions;
    suggestions.reserve(ranked.size());
    for (const auto& entry : ranked) {
        suggestions.push_back(entry.first);
    }
    return suggestions;
}

} // namespace Categorize
} // namespace FIN
