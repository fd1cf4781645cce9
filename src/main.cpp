#include "cli/cli.hpp"
#include "config/explorer_config.hpp"
#include "domain/domain_catalog.hpp"
#include "expansion/expansion_generator.hpp"
#include "expansion/expansion_sanitizer.hpp"
#include "expansion/expansion_service.hpp"
#include "graph/knowledge_graph.hpp"
#include "layout/incremental_layout.hpp"
#include "llm/llm_provider.hpp"
#include "render/graph_renderer.hpp"
#include "session/expansion_session.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace kgx;

// ============== Helper Functions ==============

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }
    return nlohmann::json::parse(file);
}

void write_text_file(const std::string& path, const std::string& text) {
    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << text;
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Config file if given, else environment; command-line overrides win
ExplorerConfig load_explorer_config(const Args& args) {
    std::string config_path = args.get("config", "").value;
    ExplorerConfig config = config_path.empty()
        ? ExplorerConfig::from_environment()
        : ExplorerConfig::from_json_file(config_path);

    if (args.has("domain")) config.domain = args.get("domain").value;
    if (args.has("catalog")) config.catalog_file = args.get("catalog").value;
    if (args.has("verbose")) config.verbose = true;
    return config;
}

// Catalog from --catalog file, else --domain
DomainCatalog load_catalog_arg(const Args& args) {
    if (args.has("catalog")) {
        return DomainCatalog::load_from_json(args.get("catalog").value);
    }
    return DomainCatalog::builtin(args.get("domain", "perfume").value);
}

std::unique_ptr<ExpansionGenerator> make_generator(const ExplorerConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    auto provider = LLMProviderFactory::create(config.llm_provider, config.to_llm_config());
    return std::make_unique<LLMExpansionGenerator>(std::move(provider));
}

void print_outcome(const ExpansionOutcome& outcome, const KnowledgeGraph& graph) {
    std::cout << "  [" << expansion_status_to_string(outcome.status) << "] " << outcome.focus_id;
    if (outcome.success()) {
        std::cout << " -> " << outcome.new_node_ids.size() << " nodes, "
                  << outcome.edges_added << " edges ("
                  << placement_strategy_to_string(outcome.strategy) << ")\n";
        for (const auto& id : outcome.new_node_ids) {
            const Node* node = graph.get_node(id);
            if (node) {
                std::cout << "      " << node->label << " [" << node->kind << "]\n";
            }
        }
    } else {
        if (!outcome.error_message.empty()) {
            std::cout << ": " << outcome.error_message;
        }
        std::cout << "\n";
    }
}

// ============== kgx domains ==============
int cmd_domains(const Args& args) {
    std::string show = args.get("show", "").value;
    std::string export_path = args.get("export", "").value;

    if (show.empty()) {
        std::cout << "Built-in domains:\n";
        for (const auto& key : DomainCatalog::builtin_keys()) {
            DomainCatalog catalog = DomainCatalog::builtin(key);
            std::cout << "  " << key;
            for (size_t i = key.length(); i < 12; ++i) std::cout << " ";
            std::cout << catalog.title() << " (root: " << catalog.root().id << ", "
                      << catalog.allowed_kinds().size() << " kinds)\n";
        }
        return 0;
    }

    DomainCatalog catalog = DomainCatalog::builtin(show);
    if (!export_path.empty()) {
        catalog.export_to_json(export_path);
        std::cout << "Saved catalog to: " << export_path << "\n";
        return 0;
    }

    std::cout << catalog.to_json().dump(2) << "\n";
    return 0;
}

// ============== kgx sanitize ==============
int cmd_sanitize(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.get("output", "").value;
    std::string snapshot_path = args.get("snapshot", "").value;

    DomainCatalog catalog = args.has("kinds")
        ? DomainCatalog::infer(args.get("kinds").as_list())
        : load_catalog_arg(args);

    std::string focus_id = args.require("focus");
    int focus_depth = args.get("depth", "0").as_int();
    std::vector<std::string> used = args.get("used", "").as_list();

    if (!snapshot_path.empty()) {
        KnowledgeGraph graph = KnowledgeGraph::load_from_json(snapshot_path);
        const Node* focus = graph.get_node(focus_id);
        if (!focus) {
            throw std::runtime_error("Focus node not in snapshot: " + focus_id);
        }
        focus_depth = focus->depth;
        used = graph.element_ids();
    }

    std::string parse_error;
    std::ifstream file(input_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + input_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto payload = parse_model_json(buffer.str(), parse_error);
    if (!payload) {
        std::cerr << "Error: invalid json: " << parse_error << "\n";
        return 1;
    }

    ExpansionSanitizer sanitizer(catalog);
    SanitizeReport report;
    ExpansionBatch batch = sanitizer.sanitize(focus_id, focus_depth, used, *payload, &report);

    std::string batch_text = batch.to_json().dump(2);
    if (output_path.empty()) {
        std::cout << batch_text << "\n";
    } else {
        write_text_file(output_path, batch_text);
        std::cout << "Saved sanitized batch to: " << output_path << "\n";
    }

    if (args.has("report")) {
        std::cerr << "Sanitize report: " << report.to_json().dump(2) << "\n";
    }
    return 0;
}

// ============== kgx expand ==============
int cmd_expand(const Args& args) {
    std::string snapshot_path = args.get("snapshot", "").value;
    std::string output_path = args.get("output", "graph.json").value;
    std::string node_id = args.get("node", "").value;
    std::string journal_path = args.get("journal", "").value;
    size_t steps = args.get("steps", "1").as_size();

    ExplorerConfig config = load_explorer_config(args);
    if (args.has("no-placeholders")) config.show_placeholders = false;

    auto generator = make_generator(config);
    DomainCatalog catalog = config.load_catalog();

    std::cout << "Domain: " << catalog.key() << " (" << catalog.title() << ")\n";
    std::cout << "Generator: " << generator->get_name() << "\n";

    ExpansionSession session(catalog, *generator, IncrementalLayout(config.layout),
                             config.to_session_options());

    JournalRenderer journal;
    if (!journal_path.empty()) {
        session.set_renderer(&journal);
    }

    if (!snapshot_path.empty()) {
        std::cout << "Loading graph from: " << snapshot_path << "\n";
        session.set_graph(KnowledgeGraph::load_from_json(snapshot_path));
    }

    auto start_time = std::chrono::steady_clock::now();
    std::vector<ExpansionOutcome> outcomes;

    if (!node_id.empty()) {
        outcomes.push_back(session.expand(node_id));
    } else {
        if (!session.graph().has_root() || !session.graph().is_expanded(session.graph().root_id())) {
            outcomes.push_back(session.start());
            if (steps > 0) --steps;
        }
        if (outcomes.empty() || outcomes.back().success()) {
            auto more = session.expand_frontier(steps);
            outcomes.insert(outcomes.end(), more.begin(), more.end());
        }
    }

    std::cout << "\nExpansions:\n";
    bool failed = false;
    for (const auto& outcome : outcomes) {
        print_outcome(outcome, session.graph());
        failed = failed || outcome.status == ExpansionStatus::GeneratorFailed
                        || outcome.status == ExpansionStatus::UnknownNode;
    }

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    session.graph().export_to_json(output_path);
    std::cout << "\nSaved graph (" << session.graph().num_nodes() << " nodes, "
              << session.graph().num_edges() << " edges) to: " << output_path << "\n";

    if (!journal_path.empty()) {
        journal.save_to_jsonl(journal_path);
        std::cout << "Saved render journal to: " << journal_path << "\n";
    }

    std::cout << "Time: " << format_duration(std::chrono::steady_clock::now() - start_time) << "\n";
    return failed ? 1 : 0;
}

// ============== kgx handle ==============
int cmd_handle(const Args& args) {
    std::string request_path = args.require("request");
    std::string domain = args.get("domain", "perfume").value;
    std::string output_path = args.get("output", "").value;

    ExplorerConfig config = load_explorer_config(args);
    auto generator = make_generator(config);
    ExpansionService service(*generator, config.verbose);

    ServiceResponse response = service.handle(domain, read_json_file(request_path));

    std::cout << "Status: " << response.status << "\n";
    if (output_path.empty()) {
        std::cout << response.body.dump(2) << "\n";
    } else {
        write_text_file(output_path, response.body.dump(2));
        std::cout << "Saved response body to: " << output_path << "\n";
    }
    return response.status == 200 ? 0 : 1;
}

// ============== kgx layout ==============
int cmd_layout(const Args& args) {
    std::string input_path = args.require("input");
    std::string focus_id = args.require("focus");
    std::string output_path = args.get("output", input_path).value;

    LayoutConfig layout_config;
    if (args.has("config")) {
        layout_config = ExplorerConfig::from_json_file(args.get("config").value).layout;
    }

    KnowledgeGraph graph = KnowledgeGraph::load_from_json(input_path);
    const Node* focus = graph.get_node(focus_id);
    if (!focus) {
        throw std::runtime_error("Unknown focus node: " + focus_id);
    }

    std::vector<std::string> children;
    for (const auto& edge : graph.get_outgoing_edges(focus_id)) {
        const Node* child = graph.get_node(edge.target);
        if (child && child->depth == focus->depth + 1) {
            children.push_back(child->id);
        }
    }

    IncrementalLayout layout(layout_config);
    PlacementResult placement = layout.place(graph, focus_id, children);

    std::cout << "Placed " << placement.assigned.size() << " nodes around " << focus_id
              << " (" << placement_strategy_to_string(placement.strategy)
              << ", " << placement.nudges << " nudges)\n";
    for (const auto& [id, pos] : placement.assigned) {
        std::cout << "  " << id << ": (" << std::fixed << std::setprecision(1)
                  << pos.x << ", " << pos.y << ")\n";
    }

    graph.export_to_json(output_path);
    std::cout << "Saved graph to: " << output_path << "\n";
    return 0;
}

// ============== kgx export ==============
int cmd_export(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");
    std::string format = args.get("format", "json").value;
    std::string title = args.get("title", "Knowledge Graph").value;

    KnowledgeGraph graph = KnowledgeGraph::load_from_json(input_path);
    DomainCatalog catalog = load_catalog_arg(args);

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    if (format == "json") {
        graph.export_to_json(output_path);
    } else if (format == "dot") {
        graph.export_to_dot(output_path);
    } else if (format == "elements") {
        export_elements_json(output_path, graph, catalog);
    } else {
        export_html(output_path, title, graph, catalog);
    }

    std::cout << "Exported " << graph.num_nodes() << " nodes and " << graph.num_edges()
              << " edges as " << format << " to: " << output_path << "\n";
    return 0;
}

// ============== kgx stats ==============
int cmd_stats(const Args& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading graph from: " << input_path << "\n";
    KnowledgeGraph graph = KnowledgeGraph::load_from_json(input_path);

    std::map<int, int> by_depth;
    std::map<std::string, int> by_kind;
    int expanded = 0;
    for (const auto& node : graph.get_all_nodes()) {
        by_depth[node.depth]++;
        by_kind[node.kind]++;
        if (graph.is_expanded(node.id)) ++expanded;
    }

    std::cout << "\nGraph Statistics:\n";
    std::cout << "  Root: " << (graph.has_root() ? graph.root_id() : "(none)") << "\n";
    std::cout << "  Nodes: " << graph.num_nodes() << "\n";
    std::cout << "  Edges: " << graph.num_edges() << "\n";
    std::cout << "  Expanded: " << expanded << "\n";

    std::cout << "\nNodes by depth:\n";
    for (const auto& [depth, count] : by_depth) {
        std::cout << "  " << depth << ": " << count << "\n";
    }

    std::cout << "\nNodes by kind:\n";
    for (const auto& [kind, count] : by_kind) {
        std::cout << "  " << kind << ": " << count << "\n";
    }

    return 0;
}

// ============== kgx init-config ==============
int cmd_init_config(const Args& args) {
    std::string output_path = args.get("output", "kgx_config.json").value;

    ExplorerConfig config = ExplorerConfig::from_environment();
    if (args.has("domain")) config.domain = args.get("domain").value;

    config.to_json_file(output_path);
    std::cout << "Saved configuration template to: " << output_path << "\n";
    std::cout << "Set llm_api_key (or OPENAI_API_KEY / GEMINI_API_KEY) before running 'kgx expand'.\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kgx", "1.0.0");

    // kgx domains
    cli.register_command({
        "domains",
        "List built-in domain catalogs",
        {
            {"show", "s", "Print one catalog as JSON", "", false, false, {"perfume", "wine"}},
            {"export", "e", "Write the shown catalog to a JSON file", "", false, false}
        },
        cmd_domains
    });

    // kgx sanitize
    cli.register_command({
        "sanitize",
        "Sanitize a raw expansion payload offline",
        {
            {"input", "i", "Raw payload JSON (model output)", "", true, false},
            {"focus", "f", "Focus node id", "", true, false},
            {"depth", "d", "Focus node depth", "0", false, false},
            {"used", "u", "Comma-separated identifiers already in use", "", false, false},
            {"snapshot", "g", "Graph snapshot providing depth and used ids", "", false, false},
            {"domain", "D", "Built-in domain", "perfume", false, false, {"perfume", "wine"}},
            {"catalog", "c", "Custom catalog JSON file", "", false, false},
            {"kinds", "k", "Comma-separated allowed kinds (infers the catalog)", "", false, false},
            {"output", "o", "Output path for the sanitized batch", "", false, false},
            {"report", "r", "Print the repair report to stderr", "", false, true}
        },
        cmd_sanitize
    });

    // kgx expand
    cli.register_command({
        "expand",
        "Expand a graph with the configured LLM",
        {
            {"config", "c", "Explorer config JSON (default: environment)", "", false, false},
            {"domain", "D", "Built-in domain", "", false, false, {"perfume", "wine"}},
            {"catalog", "C", "Custom catalog JSON file", "", false, false},
            {"snapshot", "g", "Existing graph to continue from", "", false, false},
            {"node", "n", "Expand this node only", "", false, false},
            {"steps", "s", "Number of breadth-first expansions", "1", false, false},
            {"output", "o", "Output graph JSON", "graph.json", false, false},
            {"journal", "j", "Write renderer notifications as JSON lines", "", false, false},
            {"no-placeholders", "P", "Do not insert placeholder nodes", "", false, true},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_expand
    });

    // kgx handle
    cli.register_command({
        "handle",
        "Answer one expansion request as the expansion service would",
        {
            {"request", "r", "Request JSON {focusNode, existingElementIds}", "", true, false},
            {"domain", "D", "Domain name", "perfume", false, false},
            {"config", "c", "Explorer config JSON (default: environment)", "", false, false},
            {"output", "o", "Output path for the response body", "", false, false},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_handle
    });

    // kgx layout
    cli.register_command({
        "layout",
        "Re-place the children of a node in a graph snapshot",
        {
            {"input", "i", "Graph snapshot JSON", "", true, false},
            {"focus", "f", "Focus node id", "", true, false},
            {"config", "c", "Explorer config JSON providing layout parameters", "", false, false},
            {"output", "o", "Output graph JSON (default: overwrite input)", "", false, false}
        },
        cmd_layout
    });

    // kgx export
    cli.register_command({
        "export",
        "Export a graph snapshot",
        {
            {"input", "i", "Graph snapshot JSON", "", true, false},
            {"output", "o", "Output file", "", true, false},
            {"format", "f", "Output format", "json", false, false, {"json", "dot", "elements", "html"}},
            {"domain", "D", "Domain used for icons", "perfume", false, false, {"perfume", "wine"}},
            {"catalog", "c", "Custom catalog JSON file", "", false, false},
            {"title", "t", "Title for HTML output", "Knowledge Graph", false, false}
        },
        cmd_export
    });

    // kgx stats
    cli.register_command({
        "stats",
        "Print statistics about a graph snapshot",
        {
            {"input", "i", "Graph snapshot JSON", "", true, false}
        },
        cmd_stats
    });

    // kgx init-config
    cli.register_command({
        "init-config",
        "Write a configuration template",
        {
            {"output", "o", "Output path", "kgx_config.json", false, false},
            {"domain", "D", "Built-in domain", "", false, false, {"perfume", "wine"}}
        },
        cmd_init_config
    });

    return cli.run(argc, argv);
}
