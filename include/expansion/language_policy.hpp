#pragma once

#include <string>
#include <vector>

namespace kgx {

class DomainCatalog;

/**
 * @brief Heuristic script-membership checks for generated labels
 *
 * This is not a language detector. A label is judged only by which Unicode
 * blocks its code points fall into, so transliterated loanwords and
 * mixed-script proper nouns can be misclassified.
 */
namespace language_policy {

/**
 * @brief Decode UTF-8 into code points; invalid bytes decode as U+FFFD
 */
std::vector<char32_t> decode_utf8(const std::string& text);

/**
 * @brief True if any code point is kana (U+3040-U+30FF) or a CJK ideograph
 *        (U+3400-U+9FFF)
 */
bool contains_japanese(const std::string& text);

/**
 * @brief True if the text is non-empty and every byte is 7-bit ASCII
 */
bool is_ascii_only(const std::string& text);

/**
 * @brief Node label rule
 *
 * Proper-noun kinds pass unconditionally. Other labels pass if they contain
 * Japanese, fail if they are entirely ASCII, and pass otherwise.
 */
bool accepts_node_label(const DomainCatalog& catalog, const std::string& kind, const std::string& label);

/**
 * @brief Edge label rule: keep the label unless it is ASCII-only or empty,
 *        in which case the catalog's relation label for the target kind is used
 */
std::string normalize_edge_label(
    const DomainCatalog& catalog,
    const std::string& target_kind,
    const std::string& label
);

} // namespace language_policy

} // namespace kgx
