#include "categorize/merchant_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace FIN {
namespace Categorize {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// EN: Keep letters, digits and whitespace (and hyphens when asked); everything else becomes a space.
// FR: Garde lettres, chiffres et espaces (et tirets si demandé) ; le reste devient un espace.
std::string replacePunctuation(const std::string& text, bool keep_hyphen) {
    std::string out = text;
    for (char& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        bool keep = std::isalnum(u) || std::isspace(u) || (keep_hyphen && c == '-');
        if (!keep) {
            c = ' ';
        }
    }
    return out;
}

// EN: The first pattern that captures decides; a capture that cleans to nothing yields no merchant.
// FR: Le premier motif qui capture decide ; une capture vide apres nettoyage ne donne aucun marchand.
std::optional<std::string> firstCapture(const std::string& text, const std::vector<std::regex>& patterns) {
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(text, match, pattern) && match[1].matched && match[1].length() > 0) {
            std::string cleaned = cleanMerchantName(match[1].str());
            if (cleaned.empty()) {
                return std::nullopt;
            }
            return cleaned;
        }
    }
    return std::nullopt;
}

const std::vector<std::regex>& instantTransferPatterns() {
    static const std::vector<std::regex> kPatterns = {
        std::regex(R"(UPI/(?:DR|CR)/[^/]+/([^/]+)/[^/]+)", std::regex::icase),
        std::regex(R"(UPI-([^-]+)-\d+)", std::regex::icase),
        std::regex(R"(UPI/([^/]+)/[^/]+)", std::regex::icase),
        std::regex(R"(UPI\s+([A-Z][A-Z0-9\s]+?)\s+\d+)", std::regex::icase)
    };
    return kPatterns;
}

const std::vector<std::regex>& wireTransferPatterns() {
    static const std::vector<std::regex> kPatterns = {
        std::regex(R"((?:NEFT|IMPS)-([^-]+)-[^-]+)", std::regex::icase),
        std::regex(R"((?:NEFT|IMPS)/[^/]+/([^/]+))", std::regex::icase)
    };
    return kPatterns;
}

// EN: Words longer than two characters that are not stop-words, punctuation stripped.
// FR: Mots de plus de deux caractères hors mots vides, ponctuation retirée.
std::vector<std::string> significantWords(const std::string& narrative) {
    std::vector<std::string> result;
    for (const auto& word : splitWhitespace(replacePunctuation(narrative, false))) {
        if (word.size() > 2 && !isStopWord(word)) {
            result.push_back(word);
        }
    }
    return result;
}

} // namespace

bool isStopWord(const std::string& word) {
    static const std::unordered_set<std::string> kStopWords = {
        "UPI", "NEFT", "IMPS", "ATM", "POS", "PAYMENT", "TRANSFER", "TO", "FROM", "REF",
        "REFERENCE", "NO", "NUMBER", "DR", "CR", "DEBIT", "CREDIT", "TRANSACTION", "TXN", "ID"
    };
    return kStopWords.count(toUpper(word)) > 0;
}

std::string titleCase(const std::string& word) {
    std::string out = word;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return out;
}

std::string cleanMerchantName(const std::string& raw) {
    std::string result;
    for (const auto& word : splitWhitespace(replacePunctuation(raw, true))) {
        if (isStopWord(word)) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += titleCase(word);
    }
    return result;
}

std::optional<std::string> extractStructuredMerchant(const std::string& narrative) {
    std::string upper = toUpper(narrative);

    if (upper.find("UPI") != std::string::npos) {
        if (auto merchant = firstCapture(narrative, instantTransferPatterns())) {
            return merchant;
        }
    }
    if (upper.find("NEFT") != std::string::npos || upper.find("IMPS") != std::string::npos) {
        if (auto merchant = firstCapture(narrative, wireTransferPatterns())) {
            return merchant;
        }
    }
    return std::nullopt;
}

std::optional<std::string> extractMerchantName(const std::string& narrative) {
    if (splitWhitespace(narrative).empty()) {
        return std::nullopt;
    }
    if (auto merchant = extractStructuredMerchant(narrative)) {
        return merchant;
    }

    std::vector<std::string> words = significantWords(narrative);
    if (words.empty()) {
        return std::nullopt;
    }
    std::string name;
    for (size_t i = 0; i < words.size() && i < 3; ++i) {
        if (i > 0) name += ' ';
        name += titleCase(words[i]);
    }
    return name;
}

std::vector<std::string> extractMerchantKeywords(const std::string& narrative) {
    std::vector<std::string> keywords;
    if (splitWhitespace(narrative).empty()) {
        return keywords;
    }

    std::unordered_set<std::string> seen;
    auto push = [&keywords, &seen](const std::string& keyword) {
        if (!keyword.empty() && seen.insert(keyword).second) {
            keywords.push_back(keyword);
        }
    };

    if (auto merchant = extractStructuredMerchant(narrative)) {
        push(*merchant);
        for (const auto& word : splitWhitespace(*merchant)) {
            if (word.size() > 2) {
                push(word);
            }
        }
    }

    for (const auto& word : significantWords(narrative)) {
        push(titleCase(word));
    }
    return keywords;
}

std::string merchantIdentifier(const std::string& narrative) {
    std::vector<std::string> keywords = extractMerchantKeywords(narrative);
    if (!keywords.empty()) {
        return keywords.front();
    }

    std::string spaced = narrative;
    std::replace(spaced.begin(), spaced.end(), '/', ' ');
    for (const auto& word : splitWhitespace(spaced)) {
        if (word.size() > 3) {
            return word;
        }
    }
    return narrative.substr(0, 20);
}

} // namespace Categorize
} // namespace FIN
