#pragma once

#include "graph/knowledge_graph.hpp"
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace kgx {

/**
 * @brief Tunables for the incremental layout
 */
struct LayoutConfig {
    double ring_gap = 170.0;            ///< Radius step between depth rings
    double forward_step = 190.0;        ///< Distance from focus to the fan centre
    double side_gap = 120.0;            ///< Lateral spacing between fan children
    double lateral_forward_bias = 0.25; ///< Extra forward distance per unit of lateral offset
    double min_separation = 90.0;       ///< Collision threshold against other nodes
    double nudge_step = 60.0;           ///< Forward push per collision retry
    int max_nudges = 8;                 ///< Retries before a position is accepted as is

    nlohmann::json to_json() const;
    static LayoutConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

/**
 * @brief Which strategy a placement used
 */
enum class PlacementStrategy {
    Ring,
    ForwardFan
};

std::string placement_strategy_to_string(PlacementStrategy strategy);

/**
 * @brief Result of one placement pass
 */
struct PlacementResult {
    PlacementStrategy strategy = PlacementStrategy::Ring;
    std::map<std::string, Position> assigned;   ///< Every position written by the pass
    int nudges = 0;                             ///< Collision retries spent (fan only)
};

/**
 * @brief Deterministic incremental layout
 *
 * Expanding the root places every non-root node on concentric rings, one
 * ring per depth. Expanding any other node fans its new children out along
 * the parent -> focus direction, with a bounded forward push away from
 * nodes that are too close. Nodes are ordered by id, so the output depends
 * only on graph state and the set of child ids.
 */
class IncrementalLayout {
public:
    explicit IncrementalLayout(const LayoutConfig& config = LayoutConfig());

    /**
     * @brief Position the new children of a focus node
     *
     * Dispatches to place_on_rings() when the focus is the graph root and
     * to place_forward() otherwise.
     *
     * @throws std::out_of_range if the focus node does not exist
     */
    PlacementResult place(
        KnowledgeGraph& graph,
        const std::string& focus_id,
        const std::vector<std::string>& new_child_ids
    ) const;

    /**
     * @brief Ring placement around the root for every depth > 0
     */
    PlacementResult place_on_rings(KnowledgeGraph& graph) const;

    /**
     * @brief Forward fan-out placement of the given children
     */
    PlacementResult place_forward(
        KnowledgeGraph& graph,
        const std::string& focus_id,
        const std::vector<std::string>& new_child_ids
    ) const;

    /**
     * @brief Unit vector from the focus's parent to the focus, or (1, 0)
     */
    Position forward_direction(const KnowledgeGraph& graph, const std::string& focus_id) const;

    const LayoutConfig& config() const { return config_; }

private:
    LayoutConfig config_;
};

} // namespace kgx
