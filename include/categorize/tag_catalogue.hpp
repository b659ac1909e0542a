// EN: Default tag templates, tag validation, custom tags and per-tag statistics.
// FR: Modèles de tags par défaut, validation, tags personnalisés et statistiques par tag.

#pragma once

#include "model/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Categorize {

struct TagTemplate {
    std::string name;
    std::vector<std::string> keywords;
    std::string color;
    std::string icon;
};

const std::vector<TagTemplate>& defaultTagTemplates();

// EN: Tags tag-<start_id>... built from templates, flagged as defaults.
// FR: Tags tag-<start_id>... construits depuis les modèles, marqués par défaut.
std::vector<Tag> createTagsFromTemplates(const std::vector<TagTemplate>& templates, int start_id, Timestamp now);
std::vector<Tag> defaultTags(Timestamp now = std::chrono::system_clock::now());

// EN: Error message for an invalid name/keyword set, nullopt when valid.
// FR: Message d'erreur pour un nom ou des mots-clés invalides, nullopt si valide.
std::optional<std::string> validateTagData(const std::string& name, const std::vector<std::string>& keywords);

// EN: New user tag with id tag-<millis>-<9 base36 chars>. Throws std::invalid_argument when
//     validateTagData rejects the input.
// FR: Nouveau tag utilisateur d'id tag-<millis>-<9 caractères base36>. Lance std::invalid_argument
//     si validateTagData rejette l'entrée.
Tag createCustomTag(const std::string& name, const std::vector<std::string>& keywords, const std::string& color,
                    const std::optional<std::string>& icon = std::nullopt,
                    Timestamp now = std::chrono::system_clock::now());

// EN: Defaults first (minus those whose name the user already has, case-insensitive), then user tags.
// FR: Les défauts d'abord (sauf ceux dont l'utilisateur a déjà le nom), puis les tags utilisateur.
std::vector<Tag> mergeWithDefaultTags(const std::vector<Tag>& user_tags, Timestamp now = std::chrono::system_clock::now());

struct TagStatistic {
    Tag tag;
    size_t count{0};
    double total_amount{0.0};
};

std::vector<TagStatistic> tagStatistics(const std::vector<Transaction>& transactions, const std::vector<Tag>& tags);

// EN: Words (>2 chars) seen at least min_frequency times in the tag's transactions, most frequent
//     first, ties alphabetical.
// FR: Mots (>2 caractères) vus au moins min_frequency fois dans les transactions du tag, les plus
//     fréquents d'abord, égalités par ordre alphabétique.
std::vector<std::string> suggestKeywordsForTag(const std::vector<Transaction>& transactions,
                                               const std::string& tag_id, size_t min_frequency = 2);

} // namespace Categorize
} // namespace FIN
