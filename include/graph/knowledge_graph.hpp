#ifndef KGX_KNOWLEDGE_GRAPH_HPP
#define KGX_KNOWLEDGE_GRAPH_HPP

#include <limits>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace kgx {

/**
 * @brief 2-D coordinate assigned by the layout engine
 */
struct Position {
    double x = 0.0;
    double y = 0.0;

    nlohmann::json to_json() const;
    static Position from_json(const nlohmann::json& j);
};

/// Deepest level a node may sit at; one more would overflow int
constexpr int kMaxNodeDepth = std::numeric_limits<int>::max() - 1;

/**
 * @brief Read a node depth from untrusted JSON
 *
 * Null reads as 0. Anything else must be an integer, or an integral float,
 * in [0, kMaxNodeDepth]; otherwise std::invalid_argument is thrown.
 */
int depth_from_json(const nlohmann::json& value);

/**
 * @brief A concept in the knowledge graph
 *
 * Depth is the hop distance from the root. Nodes produced by an expansion
 * of a focus always sit one level below it.
 */
struct Node {
    std::string id;                         // Unique within the graph, immutable
    std::string label;                      // Human-readable label
    std::string kind;                       // Member of the domain vocabulary
    int depth = 0;                          // Hops from the root

    nlohmann::json to_json() const;
    static Node from_json(const nlohmann::json& j);
};

/**
 * @brief A directed, labelled relation between two nodes
 */
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    std::string label;

    nlohmann::json to_json() const;
    static Edge from_json(const nlohmann::json& j);
};

/**
 * @brief Result of one sanitization pass, folded into the graph right away
 */
struct ExpansionBatch {
    std::vector<Node> nodes;
    std::vector<Edge> edges;

    bool empty() const { return nodes.empty() && edges.empty(); }

    nlohmann::json to_json() const;
    static ExpansionBatch from_json(const nlohmann::json& j);
};

/**
 * @brief Owned graph aggregate shared by the sanitizer and the layout engine
 *
 * Nodes and edges live in one identifier namespace. The graph only grows,
 * except for elements tagged with a pending batch key, which are retracted
 * as a whole by remove_pending_batch().
 */
class KnowledgeGraph {
public:
    KnowledgeGraph() = default;

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Create the root node at depth 0, centred on the origin
     * @throws std::logic_error if the graph already has a root
     */
    void initialize_root(const std::string& id, const std::string& label, const std::string& kind);

    bool has_root() const { return !root_id_.empty(); }
    const std::string& root_id() const { return root_id_; }

    // ==========================================
    // Element Management
    // ==========================================

    /**
     * @brief Insert a node
     * @return false if the id is already taken by a node or an edge
     */
    bool add_node(const Node& node, const std::string& pending_key = "");

    /**
     * @brief Insert an edge; both endpoints must already exist
     * @return false if the id is taken or an endpoint is missing
     */
    bool add_edge(const Edge& edge, const std::string& pending_key = "");

    /**
     * @brief Merge a sanitized batch, skipping ids that already exist
     * @return ids of the nodes actually inserted, in batch order
     */
    std::vector<std::string> merge_batch(const ExpansionBatch& batch);

    /**
     * @brief Remove every element tagged with the given pending key
     * @return ids of the removed elements, edges first
     */
    std::vector<std::string> remove_pending_batch(const std::string& pending_key);

    const Node* get_node(const std::string& node_id) const;
    const Edge* get_edge(const std::string& edge_id) const;

    bool has_node(const std::string& node_id) const;
    bool has_edge(const std::string& edge_id) const;
    bool has_element(const std::string& element_id) const;

    bool is_pending(const std::string& element_id) const;

    std::vector<Node> get_all_nodes() const;
    std::vector<Edge> get_all_edges() const;

    /**
     * @brief Every node id and edge id currently in the graph
     */
    std::vector<std::string> element_ids() const;

    /**
     * @brief Edges whose target is the given node
     */
    std::vector<Edge> get_incoming_edges(const std::string& node_id) const;

    /**
     * @brief Edges whose source is the given node
     */
    std::vector<Edge> get_outgoing_edges(const std::string& node_id) const;

    // ==========================================
    // Expansion State
    // ==========================================

    bool is_expanded(const std::string& node_id) const;

    /**
     * @brief Mark a node as expanded; idempotent
     * @throws std::out_of_range if the node does not exist
     */
    void mark_expanded(const std::string& node_id);

    // ==========================================
    // Positions
    // ==========================================

    std::optional<Position> get_position(const std::string& node_id) const;

    /**
     * @brief Position of a node, or the origin if it was never placed
     */
    Position position_or_origin(const std::string& node_id) const;

    /**
     * @throws std::out_of_range if the node does not exist
     */
    void set_position(const std::string& node_id, const Position& position);

    const std::map<std::string, Position>& positions() const { return positions_; }

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    static KnowledgeGraph from_json(const nlohmann::json& j);

    void export_to_json(const std::string& filename) const;
    static KnowledgeGraph load_from_json(const std::string& filename);

    /**
     * @brief Export to Graphviz DOT with pinned positions (neato -n)
     */
    void export_to_dot(const std::string& filename) const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty() && edges_.empty(); }

private:
    std::map<std::string, Node> nodes_;
    std::map<std::string, Edge> edges_;
    std::map<std::string, Position> positions_;
    std::set<std::string> expanded_;
    std::map<std::string, std::string> pending_keys_;   // element id -> batch key

    std::string root_id_;
};

} // namespace kgx

#endif // KGX_KNOWLEDGE_GRAPH_HPP
