#pragma once

#include "graph/knowledge_graph.hpp"
#include "domain/domain_catalog.hpp"
#include "expansion/expansion_generator.hpp"
#include "expansion/expansion_sanitizer.hpp"
#include "expansion/expansion_service.hpp"
#include "layout/incremental_layout.hpp"
#include "render/graph_renderer.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgx {

// ============================================================================
// Outcome Types
// ============================================================================

enum class ExpansionStatus {
    Expanded,           ///< Batch merged and laid out, focus marked expanded
    AlreadyExpanded,    ///< No-op, the generator was not called
    Busy,               ///< Another expansion is in flight; ignored, not queued
    UnknownNode,        ///< No such (non-placeholder) node
    GeneratorFailed     ///< Transport or parse error; graph unchanged
};

std::string expansion_status_to_string(ExpansionStatus status);

/**
 * @brief What one expand() call did
 */
struct ExpansionOutcome {
    ExpansionStatus status = ExpansionStatus::UnknownNode;
    std::string focus_id;
    std::vector<std::string> new_node_ids;      ///< Nodes actually merged
    size_t edges_added = 0;
    SanitizeReport report;
    PlacementStrategy strategy = PlacementStrategy::Ring;
    int nudges = 0;
    std::string error_message;

    bool success() const { return status == ExpansionStatus::Expanded; }

    nlohmann::json to_json() const;
};

struct SessionOptions {
    bool show_placeholders = true;      ///< Insert "generating" nodes while waiting
    size_t placeholder_count = 3;
    bool verbose = false;
};

// ============================================================================
// Pending Batch Guard
// ============================================================================

/**
 * @brief Scoped speculative batch
 *
 * Elements added through the guard carry its batch key. The destructor
 * retracts every element with that key, so placeholders never outlive the
 * expansion that created them, whichever way it exits.
 */
class PendingBatchGuard {
public:
    PendingBatchGuard(KnowledgeGraph& graph, std::string key, GraphRenderer* renderer = nullptr);
    ~PendingBatchGuard();

    PendingBatchGuard(const PendingBatchGuard&) = delete;
    PendingBatchGuard& operator=(const PendingBatchGuard&) = delete;

    const std::string& key() const { return key_; }

    bool add_node(const Node& node);
    bool add_edge(const Edge& edge);

    /**
     * @brief Remove the batch now; later calls and the destructor do nothing
     * @return ids of the removed elements
     */
    std::vector<std::string> retract();

    bool active() const { return active_; }

private:
    KnowledgeGraph& graph_;
    std::string key_;
    GraphRenderer* renderer_;
    bool active_ = true;
};

// ============================================================================
// Expansion Session
// ============================================================================

/**
 * @brief Owns the graph and drives expansions one at a time
 *
 * One expansion: busy/expanded checks, placeholder batch inserted and laid
 * out, generator call, placeholders retracted, sanitize against every id in
 * the graph, merge, layout of the merged children, focus marked expanded.
 * Single-threaded; the in-flight flag only rejects re-entrant calls.
 */
class ExpansionSession {
public:
    ExpansionSession(
        DomainCatalog catalog,
        ExpansionGenerator& generator,
        IncrementalLayout layout = IncrementalLayout(),
        SessionOptions options = SessionOptions()
    );

    /**
     * @brief Replace the graph with a loaded snapshot
     * @throws std::logic_error while an expansion is in flight
     */
    void set_graph(KnowledgeGraph graph);

    /**
     * @brief Create the catalog's root if missing, then expand it
     */
    ExpansionOutcome start();

    ExpansionOutcome expand(const std::string& node_id);

    /**
     * @brief Expand unexpanded nodes breadth-first (by depth, then id)
     *
     * Stops after max_steps expansions or at the first generator failure.
     */
    std::vector<ExpansionOutcome> expand_frontier(size_t max_steps);

    /**
     * @brief Nodes not yet expanded, ordered by depth then id
     */
    std::vector<std::string> unexpanded_nodes() const;

    bool busy() const { return in_flight_; }

    const KnowledgeGraph& graph() const { return graph_; }
    const DomainCatalog& catalog() const { return catalog_; }
    const IncrementalLayout& layout() const { return layout_; }

    void set_renderer(GraphRenderer* renderer) { renderer_ = renderer; }

private:
    void insert_placeholders(PendingBatchGuard& guard, const Node& focus);
    void notify_positions(const PlacementResult& placement);
    std::string next_pending_key(const std::string& focus_id);

    DomainCatalog catalog_;
    ExpansionService service_;
    IncrementalLayout layout_;
    SessionOptions options_;
    KnowledgeGraph graph_;
    GraphRenderer* renderer_ = nullptr;

    bool in_flight_ = false;
    size_t pending_sequence_ = 0;
};

} // namespace kgx
