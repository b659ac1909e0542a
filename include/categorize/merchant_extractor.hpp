// EN: Merchant and keyword extraction from transaction narratives through ordered pattern rules.
// FR: Extraction du marchand et des mots-clés depuis les libellés via des règles ordonnées.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace FIN {
namespace Categorize {

// EN: True for transfer boilerplate such as UPI, NEFT, REF or TXN (case-insensitive).
// FR: Vrai pour les mots techniques comme UPI, NEFT, REF ou TXN (insensible à la casse).
bool isStopWord(const std::string& word);

std::string titleCase(const std::string& word);

// EN: Punctuation to spaces, stop-words removed, title-cased. May return an empty string.
// FR: Ponctuation en espaces, mots vides retirés, casse de titre. Peut retourner une chaîne vide.
std::string cleanMerchantName(const std::string& raw);

// EN: Merchant captured by the UPI / NEFT / IMPS rules only.
// FR: Marchand capturé uniquement par les règles UPI / NEFT / IMPS.
std::optional<std::string> extractStructuredMerchant(const std::string& narrative);

// EN: Structured merchant, else the first three significant words.
// FR: Marchand structuré, sinon les trois premiers mots significatifs.
std::optional<std::string> extractMerchantName(const std::string& narrative);

// EN: Ordered, de-duplicated keyword bag used for tag matching and merchant grouping.
// FR: Sac de mots-clés ordonné et dédoublonné pour l'appariement des tags et le regroupement.
std::vector<std::string> extractMerchantKeywords(const std::string& narrative);

// EN: Grouping key used by the detectors. Never empty for a non-empty narrative.
// FR: Clé de regroupement utilisée par les détecteurs. Jamais vide pour un libellé non vide.
std::string merchantIdentifier(const std::string& narrative);

} // namespace Categorize
} // namespace FIN
