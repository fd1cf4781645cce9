#include "domain/domain_catalog.hpp"
#include "expansion/expansion_generator.hpp"
#include "graph/knowledge_graph.hpp"
#include "layout/incremental_layout.hpp"
#include "render/graph_renderer.hpp"
#include "session/expansion_session.hpp"
#include <iomanip>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

using namespace kgx;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Replays canned model answers keyed by focus id; unknown foci get an empty batch
class ScriptedGenerator : public ExpansionGenerator {
public:
    void script(const std::string& focus_id, const std::string& text) {
        answers_[focus_id] = text;
    }

    GenerationResult generate(const ExpansionRequest& request, const DomainCatalog&) override {
        GenerationResult result;
        result.success = true;
        auto it = answers_.find(request.focus_node.id);
        result.text = it != answers_.end() ? it->second : "{\"nodes\":[],\"edges\":[]}";
        return result;
    }

    std::string get_name() const override { return "scripted"; }

private:
    std::map<std::string, std::string> answers_;
};

void print_graph(const KnowledgeGraph& graph) {
    for (const auto& node : graph.get_all_nodes()) {
        Position pos = graph.position_or_origin(node.id);
        std::cout << "  " << std::left << std::setw(28) << node.id
                  << " d=" << node.depth
                  << " (" << std::right << std::fixed << std::setprecision(1)
                  << std::setw(7) << pos.x << ", " << std::setw(7) << pos.y << ")  "
                  << node.label << (graph.is_expanded(node.id) ? "  *" : "") << "\n";
    }
    for (const auto& edge : graph.get_all_edges()) {
        std::cout << "  " << edge.source << " --" << edge.label << "--> " << edge.target << "\n";
    }
}

int main() {
    print_separator("Scripted Expansion Example");

    ScriptedGenerator generator;

    // Root expansion: one id collides with the root, one kind is unknown,
    // and the model forgot an edge
    generator.script("perfume_root", R"({
        "nodes": [
            {"id": "perfume_root", "label": "シトラス", "kind": "family"},
            {"id": "woody", "label": "ウッディ", "kind": "family"},
            {"id": "chanel", "label": "Chanel", "kind": "brand"},
            {"id": "mystery", "label": "謎の香り", "kind": "unicorn"}
        ],
        "edges": [
            {"source": "perfume_root", "target": "woody", "label": "family"},
            {"source": "perfume_root", "target": "chanel", "label": "ブランド"}
        ]
    })");

    // Second level, wrapped in a code fence with an English label to reject
    generator.script("woody", "```json\n" R"({
        "nodes": [
            {"id": "cedar", "label": "シダー", "kind": "note"},
            {"id": "vetiver", "label": "Vetiver", "kind": "note"},
            {"id": "sandal", "label": "サンダルウッド", "kind": "note"}
        ],
        "edges": [
            {"id": "e1", "source": "woody", "target": "cedar", "label": "note"},
            {"id": "e2", "source": "somewhere_else", "target": "sandal", "label": "ノート"}
        ]
    })" "\n```");

    SessionOptions options;
    options.verbose = true;

    ExpansionSession session(DomainCatalog::perfume(), generator, IncrementalLayout(), options);

    JournalRenderer journal;
    session.set_renderer(&journal);

    // =========================================================================
    // Example 1: Root expansion (ring placement)
    // =========================================================================

    print_separator("Example 1: Root expansion");

    ExpansionOutcome root = session.start();
    std::cout << root.to_json().dump(2) << "\n\n";
    print_graph(session.graph());

    // =========================================================================
    // Example 2: Child expansion (forward fan-out)
    // =========================================================================

    print_separator("Example 2: Child expansion");

    ExpansionOutcome child = session.expand("woody");
    std::cout << child.to_json().dump(2) << "\n\n";
    print_graph(session.graph());

    // =========================================================================
    // Example 3: No-op expansions
    // =========================================================================

    print_separator("Example 3: Repeated and unknown expansions");

    std::cout << "woody again:  " << expansion_status_to_string(session.expand("woody").status) << "\n";
    std::cout << "missing node: " << expansion_status_to_string(session.expand("nope").status) << "\n";

    // =========================================================================
    // Example 4: Render journal and exports
    // =========================================================================

    print_separator("Example 4: Render journal and exports");

    for (const auto& entry : journal.entries()) {
        std::cout << "  " << entry.dump() << "\n";
    }

    session.graph().export_to_json("scripted_graph.json");
    session.graph().export_to_dot("scripted_graph.dot");
    export_html("scripted_graph.html", "Perfume Explorer", session.graph(), session.catalog());
    std::cout << "\nSaved scripted_graph.json, scripted_graph.dot and scripted_graph.html\n";

    return 0;
}
