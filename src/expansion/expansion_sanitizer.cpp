#include "expansion/expansion_sanitizer.hpp"
#include "expansion/identifier_pool.hpp"
#include "expansion/language_policy.hpp"
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace kgx {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Strings pass through, numbers and booleans are rendered; anything else is absent
std::optional<std::string> scalar_text(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number() || j.is_boolean()) return j.dump();
    return std::nullopt;
}

std::optional<std::string> field_text(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    return scalar_text(*it);
}

const json& array_field(const json& payload, const char* key) {
    static const json empty = json::array();
    if (!payload.is_object()) return empty;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_array()) return empty;
    return *it;
}

} // anonymous namespace

// ============================================================================
// SanitizeReport
// ============================================================================

json SanitizeReport::to_json() const {
    json j;
    j["nodes_proposed"] = nodes_proposed;
    j["nodes_malformed"] = nodes_malformed;
    j["kinds_coerced"] = kinds_coerced;
    j["ids_renamed"] = ids_renamed;
    j["nodes_truncated"] = nodes_truncated;
    j["labels_rejected"] = labels_rejected;
    j["edges_proposed"] = edges_proposed;
    j["edges_dropped"] = edges_dropped;
    j["edge_labels_replaced"] = edge_labels_replaced;
    j["edges_synthesized"] = edges_synthesized;
    j["forced_edge"] = forced_edge;
    return j;
}

// ============================================================================
// ExpansionSanitizer
// ============================================================================

ExpansionSanitizer::ExpansionSanitizer(DomainCatalog catalog)
    : catalog_(std::move(catalog)) {}

ExpansionBatch ExpansionSanitizer::sanitize(
    const std::string& focus_id,
    int focus_depth,
    const std::vector<std::string>& used_identifiers,
    const json& raw_payload,
    SanitizeReport* report
) const {
    if (focus_depth < 0 || focus_depth > kMaxNodeDepth) {
        throw std::invalid_argument("focus depth out of range: " + std::to_string(focus_depth));
    }

    SanitizeReport local;
    SanitizeReport& stats = report ? *report : local;
    stats = SanitizeReport{};

    ExpansionBatch batch;
    const std::string fallback_kind = catalog_.fallback_kind();

    // 1. Node extraction & normalization
    const json& raw_nodes = array_field(raw_payload, "nodes");
    stats.nodes_proposed = raw_nodes.size();

    std::vector<Node> candidates;
    for (const auto& entry : raw_nodes) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            stats.nodes_malformed++;
            continue;
        }

        Node node;
        node.id = trim(entry["id"].get<std::string>());
        if (node.id.empty()) {
            stats.nodes_malformed++;
            continue;
        }

        auto label = field_text(entry, "label");
        node.label = label ? trim(*label) : node.id;
        if (node.label.empty()) {
            node.label = node.id;
        }

        auto kind = field_text(entry, "kind");
        if (kind && catalog_.is_allowed_kind(*kind)) {
            node.kind = *kind;
        } else {
            node.kind = fallback_kind;
            stats.kinds_coerced++;
        }

        node.depth = focus_depth + 1;
        candidates.push_back(std::move(node));
    }

    // 2. Identifier collision resolution; one pool for nodes and edges
    IdentifierPool pool(used_identifiers);
    for (auto& node : candidates) {
        std::string resolved = pool.claim(node.id);
        if (resolved != node.id) {
            stats.ids_renamed++;
            node.id = resolved;
        }
    }

    // 3. Cardinality cap
    if (candidates.size() > kMaxNodesPerExpansion) {
        stats.nodes_truncated = candidates.size() - kMaxNodesPerExpansion;
        candidates.resize(kMaxNodesPerExpansion);
    }

    // 4. Language-policy filter
    for (auto& node : candidates) {
        if (language_policy::accepts_node_label(catalog_, node.kind, node.label)) {
            batch.nodes.push_back(std::move(node));
        } else {
            stats.labels_rejected++;
        }
    }

    std::map<std::string, std::string> kind_by_id;
    for (const auto& node : batch.nodes) {
        kind_by_id[node.id] = node.kind;
    }

    // 5. Edge extraction & enforcement
    const json& raw_edges = array_field(raw_payload, "edges");
    stats.edges_proposed = raw_edges.size();

    std::set<std::string> connected;
    size_t kept_index = 0;
    for (const auto& entry : raw_edges) {
        if (!entry.is_object()) {
            stats.edges_dropped++;
            continue;
        }

        auto source = field_text(entry, "source");
        auto target = field_text(entry, "target");
        if (!source || !target || *source != focus_id) {
            stats.edges_dropped++;
            continue;
        }

        auto target_kind = kind_by_id.find(*target);
        if (target_kind == kind_by_id.end()) {
            stats.edges_dropped++;
            continue;
        }

        auto proposed_id = field_text(entry, "id");
        std::string base = (proposed_id && !proposed_id->empty())
            ? *proposed_id
            : focus_id + "--" + *target + "--" + std::to_string(kept_index);
        kept_index++;

        Edge edge;
        edge.id = pool.claim(base);
        if (edge.id != base) {
            stats.ids_renamed++;
        }
        edge.source = focus_id;
        edge.target = *target;

        std::string label = field_text(entry, "label").value_or("");
        edge.label = language_policy::normalize_edge_label(catalog_, target_kind->second, label);
        if (edge.label != label) {
            stats.edge_labels_replaced++;
        }

        connected.insert(edge.target);
        batch.edges.push_back(std::move(edge));
    }

    // 6. Connectivity completion
    for (const auto& node : batch.nodes) {
        if (connected.count(node.id)) continue;

        Edge edge;
        edge.id = pool.claim(focus_id + "--" + node.id + "--auto");
        edge.source = focus_id;
        edge.target = node.id;
        edge.label = catalog_.relation_label(node.kind);
        batch.edges.push_back(std::move(edge));
        stats.edges_synthesized++;
    }

    // 7. Final guard; unreachable while stage 6 holds
    if (!batch.nodes.empty() && batch.edges.empty()) {
        const Node& first = batch.nodes.front();

        Edge edge;
        edge.id = pool.claim(focus_id + "--" + first.id + "--forced");
        edge.source = focus_id;
        edge.target = first.id;
        edge.label = catalog_.relation_label(first.kind);
        batch.edges.push_back(std::move(edge));
        stats.forced_edge = true;
    }

    return batch;
}

ExpansionBatch sanitize_expansion(
    const std::string& focus_id,
    int focus_depth,
    const std::vector<std::string>& used_identifiers,
    const std::vector<std::string>& allowed_kinds,
    const json& raw_payload
) {
    ExpansionSanitizer sanitizer(DomainCatalog::infer(allowed_kinds));
    return sanitizer.sanitize(focus_id, focus_depth, used_identifiers, raw_payload);
}

} // namespace kgx
