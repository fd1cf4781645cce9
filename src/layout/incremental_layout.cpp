#include "layout/incremental_layout.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace kgx {

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

double distance(const Position& a, const Position& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

} // anonymous namespace

// ============================================================================
// LayoutConfig
// ============================================================================

nlohmann::json LayoutConfig::to_json() const {
    nlohmann::json j;
    j["ring_gap"] = ring_gap;
    j["forward_step"] = forward_step;
    j["side_gap"] = side_gap;
    j["lateral_forward_bias"] = lateral_forward_bias;
    j["min_separation"] = min_separation;
    j["nudge_step"] = nudge_step;
    j["max_nudges"] = max_nudges;
    return j;
}

LayoutConfig LayoutConfig::from_json(const nlohmann::json& j) {
    LayoutConfig config;
    if (j.contains("ring_gap")) config.ring_gap = j["ring_gap"];
    if (j.contains("forward_step")) config.forward_step = j["forward_step"];
    if (j.contains("side_gap")) config.side_gap = j["side_gap"];
    if (j.contains("lateral_forward_bias")) config.lateral_forward_bias = j["lateral_forward_bias"];
    if (j.contains("min_separation")) config.min_separation = j["min_separation"];
    if (j.contains("nudge_step")) config.nudge_step = j["nudge_step"];
    if (j.contains("max_nudges")) config.max_nudges = j["max_nudges"];
    return config;
}

bool LayoutConfig::validate(std::string& error_message) const {
    if (ring_gap <= 0.0 || forward_step <= 0.0 || side_gap <= 0.0) {
        error_message = "Layout gaps must be positive";
        return false;
    }
    if (lateral_forward_bias < 0.0 || min_separation < 0.0) {
        error_message = "Layout bias and separation must not be negative";
        return false;
    }
    if (nudge_step <= 0.0 || max_nudges < 0) {
        error_message = "Collision nudge step must be positive and retries not negative";
        return false;
    }
    return true;
}

std::string placement_strategy_to_string(PlacementStrategy strategy) {
    switch (strategy) {
        case PlacementStrategy::Ring: return "ring";
        case PlacementStrategy::ForwardFan: return "forward_fan";
        default: return "unknown";
    }
}

// ============================================================================
// IncrementalLayout
// ============================================================================

IncrementalLayout::IncrementalLayout(const LayoutConfig& config)
    : config_(config) {}

PlacementResult IncrementalLayout::place(
    KnowledgeGraph& graph,
    const std::string& focus_id,
    const std::vector<std::string>& new_child_ids
) const {
    if (!graph.has_node(focus_id)) {
        throw std::out_of_range("Unknown focus node: " + focus_id);
    }

    if (focus_id == graph.root_id()) {
        return place_on_rings(graph);
    }
    return place_forward(graph, focus_id, new_child_ids);
}

PlacementResult IncrementalLayout::place_on_rings(KnowledgeGraph& graph) const {
    PlacementResult result;
    result.strategy = PlacementStrategy::Ring;

    if (!graph.has_root()) {
        return result;
    }

    const Position center = graph.position_or_origin(graph.root_id());

    std::map<int, std::vector<std::string>> by_depth;
    for (const auto& node : graph.get_all_nodes()) {
        if (node.depth > 0) {
            by_depth[node.depth].push_back(node.id);
        }
    }

    for (auto& [depth, ids] : by_depth) {
        std::sort(ids.begin(), ids.end());

        const double radius = config_.ring_gap * depth;
        const double n = static_cast<double>(ids.size());

        for (size_t i = 0; i < ids.size(); ++i) {
            const double theta = kTwoPi * static_cast<double>(i) / n;
            Position pos{center.x + radius * std::cos(theta), center.y + radius * std::sin(theta)};
            graph.set_position(ids[i], pos);
            result.assigned[ids[i]] = pos;
        }
    }

    return result;
}

Position IncrementalLayout::forward_direction(
    const KnowledgeGraph& graph,
    const std::string& focus_id
) const {
    const Position fallback{1.0, 0.0};

    auto incoming = graph.get_incoming_edges(focus_id);
    if (incoming.empty()) {
        return fallback;
    }

    // Well-formed graphs have exactly one inbound edge; edges come back ordered by id
    const std::string& parent_id = incoming.front().source;
    if (!graph.has_node(parent_id)) {
        return fallback;
    }

    const Position focus = graph.position_or_origin(focus_id);
    const Position parent = graph.position_or_origin(parent_id);

    const double vx = focus.x - parent.x;
    const double vy = focus.y - parent.y;
    const double length = std::hypot(vx, vy);
    if (length < 1e-9) {
        return fallback;
    }

    return Position{vx / length, vy / length};
}

PlacementResult IncrementalLayout::place_forward(
    KnowledgeGraph& graph,
    const std::string& focus_id,
    const std::vector<std::string>& new_child_ids
) const {
    PlacementResult result;
    result.strategy = PlacementStrategy::ForwardFan;

    std::set<std::string> child_set;
    for (const auto& id : new_child_ids) {
        if (graph.has_node(id) && id != focus_id) {
            child_set.insert(id);
        }
    }
    if (child_set.empty()) {
        return result;
    }

    // Sorted by id; input order must not matter
    const std::vector<std::string> children(child_set.begin(), child_set.end());

    const Position focus = graph.position_or_origin(focus_id);
    const Position dir = forward_direction(graph, focus_id);
    const Position side{-dir.y, dir.x};

    // Obstacles exclude the children themselves so a repeated pass sees the same field
    std::vector<Position> obstacles;
    for (const auto& [id, pos] : graph.positions()) {
        if (!child_set.count(id)) {
            obstacles.push_back(pos);
        }
    }

    auto collides = [&](const Position& candidate) {
        for (const auto& obstacle : obstacles) {
            if (distance(candidate, obstacle) < config_.min_separation) {
                return true;
            }
        }
        return false;
    };

    const double k = static_cast<double>(children.size());
    for (size_t i = 0; i < children.size(); ++i) {
        const double t = static_cast<double>(i) - (k - 1.0) / 2.0;
        const double lateral = t * config_.side_gap;
        const double forward = config_.forward_step + std::abs(lateral) * config_.lateral_forward_bias;

        Position candidate{
            focus.x + dir.x * forward + side.x * lateral,
            focus.y + dir.y * forward + side.y * lateral
        };

        int attempts = 0;
        while (attempts < config_.max_nudges && collides(candidate)) {
            candidate.x += dir.x * config_.nudge_step;
            candidate.y += dir.y * config_.nudge_step;
            ++attempts;
        }
        result.nudges += attempts;

        graph.set_position(children[i], candidate);
        result.assigned[children[i]] = candidate;
        obstacles.push_back(candidate);
    }

    return result;
}

} // namespace kgx
