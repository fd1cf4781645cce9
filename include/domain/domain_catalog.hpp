#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

namespace kgx {

/**
 * @brief Descriptor of the single root node of a domain graph
 */
struct RootDescriptor {
    std::string id;
    std::string label;
    std::string kind = "root";
};

/**
 * @brief Closed vocabulary and presentation tables for one knowledge domain
 *
 * The catalog answers three questions for the core:
 * - which node kinds are allowed (and which one unknown kinds fall back to)
 * - whether a kind names proper nouns, exempt from the Japanese-label rule
 * - which relation label an edge into a node of a given kind should carry
 */
class DomainCatalog {
public:
    static constexpr const char* kGenericRelationLabel = "関連";

    DomainCatalog() = default;

    /**
     * @brief Build a generic catalog from a bare kind list
     *
     * No kind is exempt and every relation label is the generic one.
     */
    static DomainCatalog from_allowed_kinds(const std::vector<std::string>& allowed_kinds);

    /**
     * @brief Pick the built-in catalog matching a kind list, else a generic one
     *
     * Signature kinds: producer/grape/appellation for wine,
     * brand/note/perfumer for perfume.
     */
    static DomainCatalog infer(const std::vector<std::string>& allowed_kinds);

    static DomainCatalog perfume();
    static DomainCatalog wine();

    /**
     * @brief Look up a built-in catalog by key
     * @throws std::invalid_argument for an unknown key
     */
    static DomainCatalog builtin(const std::string& key);

    static std::vector<std::string> builtin_keys();

    // ==========================================
    // Vocabulary
    // ==========================================

    const std::string& key() const { return key_; }
    const std::string& title() const { return title_; }
    const std::string& description() const { return description_; }
    const RootDescriptor& root() const { return root_; }
    const std::vector<std::string>& allowed_kinds() const { return allowed_kinds_; }

    bool is_allowed_kind(const std::string& kind) const;

    /**
     * @brief Kind that unknown kinds are coerced to: the last non-root kind
     */
    std::string fallback_kind() const;

    /**
     * @brief Kind used for "generating..." placeholder nodes
     */
    std::string pending_kind() const;

    // ==========================================
    // Language Policy
    // ==========================================

    /**
     * @brief True if labels of this kind are proper nouns (any script allowed)
     */
    bool is_proper_noun_kind(const std::string& kind) const;

    /**
     * @brief True if labels of this kind must be written in Japanese
     */
    bool requires_japanese_label(const std::string& kind) const;

    /**
     * @brief Default relation label for an edge whose target has this kind
     */
    std::string relation_label(const std::string& target_kind) const;

    // ==========================================
    // Presentation
    // ==========================================

    std::string kind_icon(const std::string& kind) const;

    /**
     * @brief "<icon>\n<label>" when the kind has an icon, else the label
     */
    std::string decorate_label(const std::string& kind, const std::string& label) const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @throws std::runtime_error if the root descriptor or the kind list is missing
     */
    static DomainCatalog from_json(const nlohmann::json& j);

    static DomainCatalog load_from_json(const std::string& filename);
    void export_to_json(const std::string& filename) const;

private:
    std::string key_ = "generic";
    std::string title_;
    std::string description_;
    RootDescriptor root_;
    std::vector<std::string> allowed_kinds_;
    std::set<std::string> proper_noun_kinds_;
    std::map<std::string, std::string> relation_labels_;
    std::map<std::string, std::string> kind_icons_;
};

} // namespace kgx
