#include "graph/knowledge_graph.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace kgx {

// ==========================================
// Element Serialization
// ==========================================

nlohmann::json Position::to_json() const {
    return {{"x", x}, {"y", y}};
}

Position Position::from_json(const nlohmann::json& j) {
    Position p;
    p.x = j.value("x", 0.0);
    p.y = j.value("y", 0.0);
    return p;
}

nlohmann::json Node::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["kind"] = kind;
    j["depth"] = depth;
    return j;
}

int depth_from_json(const nlohmann::json& value) {
    if (value.is_null()) {
        return 0;
    }
    if (value.is_number_unsigned()) {
        std::uint64_t depth = value.get<std::uint64_t>();
        if (depth <= static_cast<std::uint64_t>(kMaxNodeDepth)) {
            return static_cast<int>(depth);
        }
    } else if (value.is_number_integer()) {
        std::int64_t depth = value.get<std::int64_t>();
        if (depth >= 0 && depth <= kMaxNodeDepth) {
            return static_cast<int>(depth);
        }
    } else if (value.is_number_float()) {
        double depth = value.get<double>();
        if (std::isfinite(depth) && std::floor(depth) == depth &&
            depth >= 0.0 && depth <= static_cast<double>(kMaxNodeDepth)) {
            return static_cast<int>(depth);
        }
    }
    throw std::invalid_argument("depth must be an integer in [0, " +
                                std::to_string(kMaxNodeDepth) + "], got " + value.dump());
}

Node Node::from_json(const nlohmann::json& j) {
    Node node;
    node.id = j.at("id").get<std::string>();
    node.label = j.value("label", node.id);
    node.kind = j.value("kind", std::string());
    node.depth = j.contains("depth") ? depth_from_json(j.at("depth")) : 0;
    return node;
}

nlohmann::json Edge::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    j["label"] = label;
    return j;
}

Edge Edge::from_json(const nlohmann::json& j) {
    Edge edge;
    edge.id = j.at("id").get<std::string>();
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.label = j.value("label", std::string());
    return edge;
}

nlohmann::json ExpansionBatch::to_json() const {
    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }

    return {{"nodes", nodes_json}, {"edges", edges_json}};
}

ExpansionBatch ExpansionBatch::from_json(const nlohmann::json& j) {
    ExpansionBatch batch;
    if (j.contains("nodes")) {
        for (const auto& n : j["nodes"]) {
            batch.nodes.push_back(Node::from_json(n));
        }
    }
    if (j.contains("edges")) {
        for (const auto& e : j["edges"]) {
            batch.edges.push_back(Edge::from_json(e));
        }
    }
    return batch;
}

// ==========================================
// KnowledgeGraph Implementation
// ==========================================

void KnowledgeGraph::initialize_root(
    const std::string& id,
    const std::string& label,
    const std::string& kind
) {
    if (has_root()) {
        throw std::logic_error("Graph already has a root: " + root_id_);
    }

    Node root;
    root.id = id;
    root.label = label;
    root.kind = kind;
    root.depth = 0;

    if (!add_node(root)) {
        throw std::invalid_argument("Root id already in use: " + id);
    }

    root_id_ = id;
    positions_[id] = Position{};
}

bool KnowledgeGraph::add_node(const Node& node, const std::string& pending_key) {
    if (node.id.empty() || has_element(node.id)) {
        return false;
    }

    nodes_[node.id] = node;
    if (!pending_key.empty()) {
        pending_keys_[node.id] = pending_key;
    }
    return true;
}

bool KnowledgeGraph::add_edge(const Edge& edge, const std::string& pending_key) {
    if (edge.id.empty() || has_element(edge.id)) {
        return false;
    }
    if (!has_node(edge.source) || !has_node(edge.target)) {
        return false;
    }

    edges_[edge.id] = edge;
    if (!pending_key.empty()) {
        pending_keys_[edge.id] = pending_key;
    }
    return true;
}

std::vector<std::string> KnowledgeGraph::merge_batch(const ExpansionBatch& batch) {
    std::vector<std::string> inserted;

    for (const auto& node : batch.nodes) {
        if (add_node(node)) {
            inserted.push_back(node.id);
        }
    }

    // Edges into nodes that were skipped still land if both endpoints exist
    for (const auto& edge : batch.edges) {
        add_edge(edge);
    }

    return inserted;
}

std::vector<std::string> KnowledgeGraph::remove_pending_batch(const std::string& pending_key) {
    std::vector<std::string> removed;
    if (pending_key.empty()) {
        return removed;
    }

    std::vector<std::string> doomed;
    for (const auto& [element_id, key] : pending_keys_) {
        if (key == pending_key) {
            doomed.push_back(element_id);
        }
    }

    // Edges first so no edge is ever left pointing at a removed node
    for (const auto& element_id : doomed) {
        if (edges_.erase(element_id) > 0) {
            pending_keys_.erase(element_id);
            removed.push_back(element_id);
        }
    }
    for (const auto& element_id : doomed) {
        if (nodes_.erase(element_id) > 0) {
            positions_.erase(element_id);
            expanded_.erase(element_id);
            pending_keys_.erase(element_id);
            removed.push_back(element_id);
        }
    }

    return removed;
}

const Node* KnowledgeGraph::get_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Edge* KnowledgeGraph::get_edge(const std::string& edge_id) const {
    auto it = edges_.find(edge_id);
    return it != edges_.end() ? &it->second : nullptr;
}

bool KnowledgeGraph::has_node(const std::string& node_id) const {
    return nodes_.find(node_id) != nodes_.end();
}

bool KnowledgeGraph::has_edge(const std::string& edge_id) const {
    return edges_.find(edge_id) != edges_.end();
}

bool KnowledgeGraph::has_element(const std::string& element_id) const {
    return has_node(element_id) || has_edge(element_id);
}

bool KnowledgeGraph::is_pending(const std::string& element_id) const {
    return pending_keys_.find(element_id) != pending_keys_.end();
}

std::vector<Node> KnowledgeGraph::get_all_nodes() const {
    std::vector<Node> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }
    return result;
}

std::vector<Edge> KnowledgeGraph::get_all_edges() const {
    std::vector<Edge> result;
    result.reserve(edges_.size());
    for (const auto& [id, edge] : edges_) {
        result.push_back(edge);
    }
    return result;
}

std::vector<std::string> KnowledgeGraph::element_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size() + edges_.size());
    for (const auto& [id, node] : nodes_) {
        ids.push_back(id);
    }
    for (const auto& [id, edge] : edges_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<Edge> KnowledgeGraph::get_incoming_edges(const std::string& node_id) const {
    std::vector<Edge> result;
    for (const auto& [id, edge] : edges_) {
        if (edge.target == node_id) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<Edge> KnowledgeGraph::get_outgoing_edges(const std::string& node_id) const {
    std::vector<Edge> result;
    for (const auto& [id, edge] : edges_) {
        if (edge.source == node_id) {
            result.push_back(edge);
        }
    }
    return result;
}

bool KnowledgeGraph::is_expanded(const std::string& node_id) const {
    return expanded_.count(node_id) > 0;
}

void KnowledgeGraph::mark_expanded(const std::string& node_id) {
    if (!has_node(node_id)) {
        throw std::out_of_range("Unknown node: " + node_id);
    }
    expanded_.insert(node_id);
}

std::optional<Position> KnowledgeGraph::get_position(const std::string& node_id) const {
    auto it = positions_.find(node_id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Position KnowledgeGraph::position_or_origin(const std::string& node_id) const {
    auto it = positions_.find(node_id);
    return it != positions_.end() ? it->second : Position{};
}

void KnowledgeGraph::set_position(const std::string& node_id, const Position& position) {
    if (!has_node(node_id)) {
        throw std::out_of_range("Unknown node: " + node_id);
    }
    positions_[node_id] = position;
}

// ==========================================
// Import/Export
// ==========================================

nlohmann::json KnowledgeGraph::to_json() const {
    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        if (is_pending(id)) continue;

        auto node_json = node.to_json();
        node_json["expanded"] = is_expanded(id);
        auto pos = positions_.find(id);
        if (pos != positions_.end()) {
            node_json["position"] = pos->second.to_json();
        }
        nodes_json.push_back(node_json);
    }

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& [id, edge] : edges_) {
        if (is_pending(id)) continue;
        edges_json.push_back(edge.to_json());
    }

    nlohmann::json j;
    j["root"] = root_id_;
    j["nodes"] = nodes_json;
    j["edges"] = edges_json;
    j["metadata"] = {
        {"num_nodes", nodes_json.size()},
        {"num_edges", edges_json.size()},
        {"num_expanded", expanded_.size()}
    };
    return j;
}

KnowledgeGraph KnowledgeGraph::from_json(const nlohmann::json& j) {
    KnowledgeGraph graph;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            Node node = Node::from_json(node_json);
            if (!graph.add_node(node)) {
                throw std::runtime_error("Duplicate element id in snapshot: " + node.id);
            }
            if (node_json.contains("position")) {
                graph.positions_[node.id] = Position::from_json(node_json["position"]);
            }
            if (node_json.value("expanded", false)) {
                graph.expanded_.insert(node.id);
            }
        }
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            Edge edge = Edge::from_json(edge_json);
            if (!graph.add_edge(edge)) {
                throw std::runtime_error("Invalid edge in snapshot: " + edge.id);
            }
        }
    }

    std::string root = j.value("root", std::string());
    if (!root.empty()) {
        if (!graph.has_node(root)) {
            throw std::runtime_error("Snapshot root not found: " + root);
        }
        graph.root_id_ = root;
    }

    return graph;
}

void KnowledgeGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
}

KnowledgeGraph KnowledgeGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

void KnowledgeGraph::export_to_dot(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    auto quote = [](const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') out += '\\';
            if (c == '\n') {
                out += "\\n";
                continue;
            }
            out += c;
        }
        return out + "\"";
    };

    file << "digraph KnowledgeGraph {\n";
    file << "  node [shape=ellipse, style=filled, color=lightblue];\n\n";

    for (const auto& [id, node] : nodes_) {
        if (is_pending(id)) continue;

        file << "  " << quote(id) << " [label=" << quote(node.label);
        auto pos = positions_.find(id);
        if (pos != positions_.end()) {
            // DOT's y axis points up
            file << ", pos=\"" << pos->second.x << "," << -pos->second.y << "!\"";
        }
        file << "];\n";
    }

    file << "\n";

    for (const auto& [id, edge] : edges_) {
        if (is_pending(id)) continue;
        file << "  " << quote(edge.source) << " -> " << quote(edge.target)
             << " [label=" << quote(edge.label) << "];\n";
    }

    file << "}\n";
}

} // namespace kgx
