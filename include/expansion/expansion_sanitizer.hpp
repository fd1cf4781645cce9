#pragma once

#include "graph/knowledge_graph.hpp"
#include "domain/domain_catalog.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgx {

/**
 * @brief Counters describing what one sanitization pass repaired
 */
struct SanitizeReport {
    size_t nodes_proposed = 0;          ///< Candidate entries in the payload
    size_t nodes_malformed = 0;         ///< Entries without a usable string id
    size_t kinds_coerced = 0;           ///< Unknown kinds replaced by the fallback
    size_t ids_renamed = 0;             ///< Node/edge ids that needed a suffix
    size_t nodes_truncated = 0;         ///< Dropped by the cardinality cap
    size_t labels_rejected = 0;         ///< Dropped by the language filter

    size_t edges_proposed = 0;
    size_t edges_dropped = 0;           ///< Null endpoints, foreign source or dangling target
    size_t edge_labels_replaced = 0;
    size_t edges_synthesized = 0;       ///< Connectivity completion
    bool forced_edge = false;           ///< Final guard fired

    nlohmann::json to_json() const;
};

/**
 * @brief Validates and repairs an untrusted expansion payload
 *
 * sanitize() is a total function over arbitrary JSON: it never throws for
 * bad content and always returns a batch that satisfies the graph
 * invariants. Only a focus depth outside [0, kMaxNodeDepth] is rejected,
 * with std::invalid_argument. The invariants:
 * - every node has depth focus_depth + 1
 * - every edge has source == focus_id and targets a node of the batch
 * - no id collides with the used identifiers or with another batch id
 * - every node is the target of at least one edge
 * - at most kMaxNodesPerExpansion nodes, whatever the payload holds
 *
 * Stages run in this order: node normalization, id collision resolution,
 * cardinality cap, language filter, edge enforcement, connectivity
 * completion, final guard.
 */
class ExpansionSanitizer {
public:
    static constexpr size_t kMaxNodesPerExpansion = 3;

    explicit ExpansionSanitizer(DomainCatalog catalog);

    ExpansionBatch sanitize(
        const std::string& focus_id,
        int focus_depth,
        const std::vector<std::string>& used_identifiers,
        const nlohmann::json& raw_payload,
        SanitizeReport* report = nullptr
    ) const;

    const DomainCatalog& catalog() const { return catalog_; }

private:
    DomainCatalog catalog_;
};

/**
 * @brief Sanitize against a bare kind vocabulary
 *
 * The language policy and relation labels come from the built-in catalog
 * inferred from the kinds (DomainCatalog::infer).
 */
ExpansionBatch sanitize_expansion(
    const std::string& focus_id,
    int focus_depth,
    const std::vector<std::string>& used_identifiers,
    const std::vector<std::string>& allowed_kinds,
    const nlohmann::json& raw_payload
);

} // namespace kgx
