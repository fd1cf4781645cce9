#pragma once

#include "graph/knowledge_graph.hpp"
#include "domain/domain_catalog.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>

namespace kgx {

// ============================================================================
// Renderer Interface
// ============================================================================

/**
 * @brief Observer of graph mutations made by an expansion session
 *
 * Calls arrive in mutation order. Placeholder elements carry their pending
 * batch key; real elements carry an empty one.
 */
class GraphRenderer {
public:
    virtual ~GraphRenderer() = default;

    virtual void on_elements_added(
        const std::vector<Node>& nodes,
        const std::vector<Edge>& edges,
        const std::string& pending_key
    ) = 0;

    virtual void on_elements_removed(const std::vector<std::string>& element_ids) = 0;

    virtual void on_positions_assigned(const std::map<std::string, Position>& positions) = 0;

    virtual void on_node_expanded(const std::string& node_id) = 0;
};

// Journal renderer - records every notification as a JSON entry
class JournalRenderer : public GraphRenderer {
public:
    void on_elements_added(
        const std::vector<Node>& nodes,
        const std::vector<Edge>& edges,
        const std::string& pending_key
    ) override;

    void on_elements_removed(const std::vector<std::string>& element_ids) override;

    void on_positions_assigned(const std::map<std::string, Position>& positions) override;

    void on_node_expanded(const std::string& node_id) override;

    const std::vector<nlohmann::json>& entries() const { return entries_; }
    void clear() { entries_.clear(); }

    /**
     * @brief Write the journal as JSON lines, one entry per line
     */
    void save_to_jsonl(const std::string& path) const;

private:
    std::vector<nlohmann::json> entries_;
};

// ============================================================================
// Element Export
// ============================================================================

/**
 * @brief Cytoscape-style element list with preset positions
 *
 * Node labels are decorated with the kind icon. Pending placeholders are
 * included and flagged so a viewer can style them.
 */
nlohmann::json to_cytoscape_elements(const KnowledgeGraph& graph, const DomainCatalog& catalog);

/**
 * @brief Write the element list to a JSON file
 */
void export_elements_json(
    const std::string& filename,
    const KnowledgeGraph& graph,
    const DomainCatalog& catalog
);

/**
 * @brief Write a standalone Cytoscape.js page using the preset layout
 */
void export_html(
    const std::string& filename,
    const std::string& title,
    const KnowledgeGraph& graph,
    const DomainCatalog& catalog
);

} // namespace kgx
