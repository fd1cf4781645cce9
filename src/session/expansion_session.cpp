#include "session/expansion_session.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace kgx {

namespace {

const char* kPlaceholderNodeLabel = "生成中…";
const char* kPlaceholderEdgeLabel = "生成中";

// Clears the in-flight flag on every exit path
class InFlightScope {
public:
    explicit InFlightScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~InFlightScope() { flag_ = false; }

    InFlightScope(const InFlightScope&) = delete;
    InFlightScope& operator=(const InFlightScope&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

// ============================================================================
// ExpansionOutcome
// ============================================================================

std::string expansion_status_to_string(ExpansionStatus status) {
    switch (status) {
        case ExpansionStatus::Expanded: return "expanded";
        case ExpansionStatus::AlreadyExpanded: return "already_expanded";
        case ExpansionStatus::Busy: return "busy";
        case ExpansionStatus::UnknownNode: return "unknown_node";
        case ExpansionStatus::GeneratorFailed: return "generator_failed";
        default: return "unknown";
    }
}

json ExpansionOutcome::to_json() const {
    json j;
    j["status"] = expansion_status_to_string(status);
    j["focus"] = focus_id;
    j["new_nodes"] = new_node_ids;
    j["edges_added"] = edges_added;
    if (status == ExpansionStatus::Expanded) {
        j["strategy"] = placement_strategy_to_string(strategy);
        j["nudges"] = nudges;
        j["report"] = report.to_json();
    }
    if (!error_message.empty()) {
        j["error"] = error_message;
    }
    return j;
}

// ============================================================================
// PendingBatchGuard
// ============================================================================

PendingBatchGuard::PendingBatchGuard(KnowledgeGraph& graph, std::string key, GraphRenderer* renderer)
    : graph_(graph), key_(std::move(key)), renderer_(renderer) {}

PendingBatchGuard::~PendingBatchGuard() {
    try {
        retract();
    } catch (const std::exception& e) {
        std::cerr << "Failed to retract pending batch " << key_ << ": " << e.what() << std::endl;
    }
}

bool PendingBatchGuard::add_node(const Node& node) {
    return active_ && graph_.add_node(node, key_);
}

bool PendingBatchGuard::add_edge(const Edge& edge) {
    return active_ && graph_.add_edge(edge, key_);
}

std::vector<std::string> PendingBatchGuard::retract() {
    if (!active_) {
        return {};
    }
    active_ = false;

    std::vector<std::string> removed = graph_.remove_pending_batch(key_);
    if (renderer_ && !removed.empty()) {
        renderer_->on_elements_removed(removed);
    }
    return removed;
}

// ============================================================================
// ExpansionSession
// ============================================================================

ExpansionSession::ExpansionSession(
    DomainCatalog catalog,
    ExpansionGenerator& generator,
    IncrementalLayout layout,
    SessionOptions options
)
    : catalog_(std::move(catalog)),
      service_(generator, options.verbose),
      layout_(std::move(layout)),
      options_(options) {}

void ExpansionSession::set_graph(KnowledgeGraph graph) {
    if (in_flight_) {
        throw std::logic_error("Cannot replace the graph during an expansion");
    }
    graph_ = std::move(graph);
}

ExpansionOutcome ExpansionSession::start() {
    if (!graph_.has_root()) {
        const RootDescriptor& root = catalog_.root();
        graph_.initialize_root(root.id, root.label, root.kind);

        if (options_.verbose) {
            std::cout << "Initialized " << catalog_.key() << " graph at root " << root.id << std::endl;
        }
        if (renderer_) {
            std::map<std::string, Position> root_position;
            root_position[root.id] = graph_.position_or_origin(root.id);
            renderer_->on_elements_added({*graph_.get_node(root.id)}, {}, "");
            renderer_->on_positions_assigned(root_position);
        }
    }
    return expand(graph_.root_id());
}

std::string ExpansionSession::next_pending_key(const std::string& focus_id) {
    return focus_id + "__pending__" + std::to_string(++pending_sequence_);
}

void ExpansionSession::notify_positions(const PlacementResult& placement) {
    if (renderer_ && !placement.assigned.empty()) {
        renderer_->on_positions_assigned(placement.assigned);
    }
}

void ExpansionSession::insert_placeholders(PendingBatchGuard& guard, const Node& focus) {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::vector<std::string> node_ids;
    const std::string kind = catalog_.pending_kind();

    for (size_t i = 1; i <= options_.placeholder_count; ++i) {
        Node node;
        node.id = guard.key() + "__n" + std::to_string(i);
        node.label = kPlaceholderNodeLabel;
        node.kind = kind;
        node.depth = focus.depth + 1;
        if (!guard.add_node(node)) continue;

        Edge edge;
        edge.id = guard.key() + "__e" + std::to_string(i);
        edge.source = focus.id;
        edge.target = node.id;
        edge.label = kPlaceholderEdgeLabel;
        if (guard.add_edge(edge)) {
            edges.push_back(edge);
        }

        nodes.push_back(node);
        node_ids.push_back(node.id);
    }

    if (nodes.empty()) {
        return;
    }
    if (renderer_) {
        renderer_->on_elements_added(nodes, edges, guard.key());
    }
    notify_positions(layout_.place(graph_, focus.id, node_ids));
}

ExpansionOutcome ExpansionSession::expand(const std::string& node_id) {
    ExpansionOutcome outcome;
    outcome.focus_id = node_id;

    if (in_flight_) {
        outcome.status = ExpansionStatus::Busy;
        return outcome;
    }

    const Node* focus_ptr = graph_.get_node(node_id);
    if (!focus_ptr || graph_.is_pending(node_id)) {
        outcome.status = ExpansionStatus::UnknownNode;
        outcome.error_message = "Unknown node: " + node_id;
        return outcome;
    }

    if (graph_.is_expanded(node_id)) {
        outcome.status = ExpansionStatus::AlreadyExpanded;
        return outcome;
    }

    InFlightScope in_flight(in_flight_);
    const Node focus = *focus_ptr;

    // Ids are captured before any placeholder exists
    const ExpansionRequest request = ExpansionRequest::for_node(graph_, node_id);

    if (options_.verbose) {
        std::cout << "Expanding " << focus.id << " (" << focus.label << ", depth "
                  << focus.depth << ")" << std::endl;
    }

    // Ring placement of placeholders may move existing nodes; restored on failure
    const std::map<std::string, Position> positions_before = graph_.positions();

    ServiceResult result;
    {
        PendingBatchGuard placeholders(graph_, next_pending_key(node_id), renderer_);
        if (options_.show_placeholders) {
            insert_placeholders(placeholders, focus);
        }

        result = service_.expand(catalog_, request);
    }

    if (!result.success) {
        outcome.status = ExpansionStatus::GeneratorFailed;
        outcome.error_message = result.error_message;

        std::map<std::string, Position> restored;
        for (const auto& [id, pos] : positions_before) {
            const auto current = graph_.get_position(id);
            if (graph_.has_node(id) && (!current || current->x != pos.x || current->y != pos.y)) {
                graph_.set_position(id, pos);
                restored[id] = pos;
            }
        }
        if (renderer_ && !restored.empty()) {
            renderer_->on_positions_assigned(restored);
        }

        if (options_.verbose) {
            std::cerr << "Expansion of " << node_id << " failed: " << result.error_message << std::endl;
        }
        return outcome;
    }

    outcome.report = result.report;

    std::set<std::string> fresh_edges;
    for (const auto& edge : result.batch.edges) {
        if (!graph_.has_element(edge.id)) {
            fresh_edges.insert(edge.id);
        }
    }

    outcome.new_node_ids = graph_.merge_batch(result.batch);

    std::vector<Edge> added_edges;
    for (const auto& edge : result.batch.edges) {
        if (fresh_edges.count(edge.id) && graph_.has_edge(edge.id)) {
            added_edges.push_back(edge);
        }
    }
    outcome.edges_added = added_edges.size();

    if (renderer_ && (!outcome.new_node_ids.empty() || !added_edges.empty())) {
        std::vector<Node> added_nodes;
        for (const auto& id : outcome.new_node_ids) {
            added_nodes.push_back(*graph_.get_node(id));
        }
        renderer_->on_elements_added(added_nodes, added_edges, "");
    }

    PlacementResult placement = layout_.place(graph_, node_id, outcome.new_node_ids);
    outcome.strategy = placement.strategy;
    outcome.nudges = placement.nudges;
    notify_positions(placement);

    graph_.mark_expanded(node_id);
    if (renderer_) {
        renderer_->on_node_expanded(node_id);
    }

    outcome.status = ExpansionStatus::Expanded;

    if (options_.verbose) {
        std::cout << "  Merged " << outcome.new_node_ids.size() << " nodes, "
                  << outcome.edges_added << " edges ("
                  << placement_strategy_to_string(placement.strategy) << ")" << std::endl;
    }

    return outcome;
}

std::vector<std::string> ExpansionSession::unexpanded_nodes() const {
    std::vector<Node> candidates;
    for (const auto& node : graph_.get_all_nodes()) {
        if (!graph_.is_expanded(node.id) && !graph_.is_pending(node.id)) {
            candidates.push_back(node);
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Node& a, const Node& b) {
        if (a.depth != b.depth) return a.depth < b.depth;
        return a.id < b.id;
    });

    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& node : candidates) {
        ids.push_back(node.id);
    }
    return ids;
}

std::vector<ExpansionOutcome> ExpansionSession::expand_frontier(size_t max_steps) {
    std::vector<ExpansionOutcome> outcomes;

    while (outcomes.size() < max_steps) {
        auto frontier = unexpanded_nodes();
        if (frontier.empty()) {
            break;
        }

        ExpansionOutcome outcome = expand(frontier.front());
        outcomes.push_back(outcome);
        if (outcome.status != ExpansionStatus::Expanded) {
            break;
        }
    }

    return outcomes;
}

} // namespace kgx
