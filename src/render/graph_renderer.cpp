#include "render/graph_renderer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kgx {

namespace {

std::string escape_html_text(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

} // anonymous namespace

// ============================================================================
// JournalRenderer
// ============================================================================

void JournalRenderer::on_elements_added(
    const std::vector<Node>& nodes,
    const std::vector<Edge>& edges,
    const std::string& pending_key
) {
    json nodes_json = json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }
    json edges_json = json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }

    json entry;
    entry["op"] = "add";
    entry["nodes"] = nodes_json;
    entry["edges"] = edges_json;
    if (!pending_key.empty()) {
        entry["pending"] = pending_key;
    }
    entries_.push_back(entry);
}

void JournalRenderer::on_elements_removed(const std::vector<std::string>& element_ids) {
    entries_.push_back({{"op", "remove"}, {"ids", element_ids}});
}

void JournalRenderer::on_positions_assigned(const std::map<std::string, Position>& positions) {
    json positions_json = json::object();
    for (const auto& [id, pos] : positions) {
        positions_json[id] = pos.to_json();
    }
    entries_.push_back({{"op", "position"}, {"positions", positions_json}});
}

void JournalRenderer::on_node_expanded(const std::string& node_id) {
    entries_.push_back({{"op", "expanded"}, {"id", node_id}});
}

void JournalRenderer::save_to_jsonl(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    for (const auto& entry : entries_) {
        file << entry.dump() << "\n";
    }
}

// ============================================================================
// Element Export
// ============================================================================

json to_cytoscape_elements(const KnowledgeGraph& graph, const DomainCatalog& catalog) {
    json elements = json::array();

    for (const auto& node : graph.get_all_nodes()) {
        json data;
        data["id"] = node.id;
        data["label"] = catalog.decorate_label(node.kind, node.label);
        data["kind"] = node.kind;
        data["depth"] = node.depth;
        data["expanded"] = graph.is_expanded(node.id);
        if (graph.is_pending(node.id)) {
            data["pending"] = true;
        }

        json element;
        element["group"] = "nodes";
        element["data"] = data;
        element["position"] = graph.position_or_origin(node.id).to_json();
        elements.push_back(element);
    }

    for (const auto& edge : graph.get_all_edges()) {
        json data = edge.to_json();
        if (graph.is_pending(edge.id)) {
            data["pending"] = true;
        }
        elements.push_back({{"group", "edges"}, {"data", data}});
    }

    return elements;
}

void export_elements_json(
    const std::string& filename,
    const KnowledgeGraph& graph,
    const DomainCatalog& catalog
) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << to_cytoscape_elements(graph, catalog).dump(2);
}

void export_html(
    const std::string& filename,
    const std::string& title,
    const KnowledgeGraph& graph,
    const DomainCatalog& catalog
) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    const std::string safe_title = escape_html_text(title);

    // Keep "</script>" inside labels from closing the data block
    std::string elements = to_cytoscape_elements(graph, catalog).dump();
    std::string escaped;
    escaped.reserve(elements.size());
    for (char c : elements) {
        if (c == '<') {
            escaped += "\\u003c";
        } else {
            escaped += c;
        }
    }

    file << R"(<!DOCTYPE html>
<html lang="ja">
<head>
    <meta charset="utf-8">
    <title>)" << safe_title << R"(</title>
    <script src="https://unpkg.com/cytoscape@3.28.1/dist/cytoscape.min.js"></script>
    <style>
        body { margin: 0; font-family: sans-serif; background: #fafafa; }
        #header { padding: 8px 16px; border-bottom: 1px solid #ddd; }
        #cy { position: absolute; top: 48px; bottom: 0; left: 0; right: 0; }
    </style>
</head>
<body>
    <div id="header">
        <strong>)" << safe_title << R"(</strong> |
        Nodes: )" << graph.num_nodes() << R"( |
        Edges: )" << graph.num_edges() << R"(
    </div>
    <div id="cy"></div>
    <script>
        const elements = )" << escaped << R"(;
        cytoscape({
            container: document.getElementById('cy'),
            elements: elements,
            layout: { name: 'preset' },
            style: [
                { selector: 'node', style: {
                    'label': 'data(label)', 'text-wrap': 'wrap',
                    'text-valign': 'center', 'font-size': 11,
                    'width': 64, 'height': 64, 'background-color': '#cfe3ff' } },
                { selector: 'node[?expanded]', style: { 'border-width': 2, 'border-color': '#3a6fd8' } },
                { selector: 'node[?pending]', style: { 'opacity': 0.5 } },
                { selector: 'edge', style: {
                    'label': 'data(label)', 'font-size': 9,
                    'curve-style': 'bezier', 'target-arrow-shape': 'triangle' } },
                { selector: 'edge[?pending]', style: { 'line-style': 'dashed' } }
            ]
        });
    </script>
</body>
</html>
)";
}

} // namespace kgx
