#include <gtest/gtest.h>
#include "session/expansion_session.hpp"
#include <cmath>
#include <functional>
#include <map>
#include <stdexcept>

using namespace kgx;
using json = nlohmann::json;

namespace {

// Answers from a per-focus script; unscripted focuses get an empty batch
class ScriptedGenerator : public ExpansionGenerator {
public:
    std::map<std::string, std::string> replies;
    std::map<std::string, std::string> failures;
    std::function<void(const ExpansionRequest&)> on_generate;
    std::vector<ExpansionRequest> requests;

    GenerationResult generate(const ExpansionRequest& request, const DomainCatalog&) override {
        requests.push_back(request);
        if (on_generate) {
            on_generate(request);
        }

        GenerationResult result;
        auto failure = failures.find(request.focus_node.id);
        if (failure != failures.end()) {
            result.success = false;
            result.error_message = failure->second;
            return result;
        }

        auto reply = replies.find(request.focus_node.id);
        result.success = true;
        result.text = reply != replies.end() ? reply->second : "{}";
        return result;
    }

    std::string get_name() const override { return "scripted"; }
};

const char* kRootReply = R"({
  "nodes": [
    {"id": "woody", "label": "ウッディ", "kind": "style"},
    {"id": "citrus", "label": "シトラス", "kind": "accord"},
    {"id": "guerlain", "label": "Guerlain", "kind": "brand"}
  ],
  "edges": [
    {"id": "e1", "source": "perfume_root", "target": "guerlain", "label": "brand"}
  ]
})";

std::vector<std::string> journal_ops(const JournalRenderer& journal) {
    std::vector<std::string> ops;
    for (const auto& entry : journal.entries()) {
        ops.push_back(entry["op"].get<std::string>());
    }
    return ops;
}

size_t count_pending(const KnowledgeGraph& graph) {
    size_t pending = 0;
    for (const auto& id : graph.element_ids()) {
        if (graph.is_pending(id)) pending++;
    }
    return pending;
}

} // anonymous namespace

class ExpansionSessionTest : public ::testing::Test {
protected:
    ScriptedGenerator generator;
    ExpansionSession session{DomainCatalog::perfume(), generator};

    void SetUp() override {
        generator.replies["perfume_root"] = kRootReply;
    }
};

// ==========================================
// Root Expansion Tests
// ==========================================

TEST_F(ExpansionSessionTest, StartCreatesRootAndExpandsIt) {
    ExpansionOutcome outcome = session.start();

    ASSERT_EQ(outcome.status, ExpansionStatus::Expanded);
    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.focus_id, "perfume_root");
    EXPECT_EQ(outcome.new_node_ids.size(), 3u);
    EXPECT_EQ(outcome.edges_added, 3u);
    EXPECT_EQ(outcome.strategy, PlacementStrategy::Ring);

    const KnowledgeGraph& graph = session.graph();
    EXPECT_EQ(graph.num_nodes(), 4u);
    EXPECT_EQ(graph.num_edges(), 3u);
    EXPECT_TRUE(graph.is_expanded("perfume_root"));
    EXPECT_EQ(count_pending(graph), 0u);
    EXPECT_EQ(graph.get_edge("e1")->label, "ブランド");
    EXPECT_TRUE(graph.has_edge("perfume_root--woody--auto"));

    for (const std::string id : {"woody", "citrus", "guerlain"}) {
        auto pos = graph.get_position(id);
        ASSERT_TRUE(pos.has_value()) << id;
        EXPECT_NEAR(std::hypot(pos->x, pos->y), 170.0, 1e-9) << id;
        EXPECT_EQ(graph.get_node(id)->depth, 1) << id;
    }
}

TEST_F(ExpansionSessionTest, RequestIsCapturedBeforePlaceholders) {
    size_t elements_during_call = 0;
    size_t pending_during_call = 0;
    generator.on_generate = [&](const ExpansionRequest&) {
        elements_during_call = session.graph().element_ids().size();
        pending_during_call = count_pending(session.graph());
    };

    session.start();

    ASSERT_EQ(generator.requests.size(), 1u);
    EXPECT_EQ(generator.requests[0].existing_element_ids, std::vector<std::string>{"perfume_root"});
    EXPECT_EQ(pending_during_call, 6u);
    EXPECT_EQ(elements_during_call, 7u);
}

TEST_F(ExpansionSessionTest, PlaceholdersCarryPendingLabels) {
    std::vector<Node> placeholders;
    generator.on_generate = [&](const ExpansionRequest&) {
        for (const auto& node : session.graph().get_all_nodes()) {
            if (session.graph().is_pending(node.id)) placeholders.push_back(node);
        }
    };

    session.start();

    ASSERT_EQ(placeholders.size(), 3u);
    EXPECT_EQ(placeholders[0].id, "perfume_root__pending__1__n1");
    EXPECT_EQ(placeholders[0].label, "生成中…");
    EXPECT_EQ(placeholders[0].kind, "style");
    EXPECT_EQ(placeholders[0].depth, 1);
}

// ==========================================
// Child Expansion Tests
// ==========================================

TEST_F(ExpansionSessionTest, ChildExpansionFansForward) {
    generator.replies["woody"] = R"({"nodes":[
        {"id":"cedar","label":"シダー","kind":"note"},
        {"id":"vetiver","label":"ベチバー","kind":"note"}
    ]})";
    session.start();

    ExpansionOutcome outcome = session.expand("woody");

    ASSERT_TRUE(outcome.success());
    EXPECT_EQ(outcome.strategy, PlacementStrategy::ForwardFan);
    EXPECT_EQ(outcome.new_node_ids.size(), 2u);
    EXPECT_EQ(session.graph().get_node("cedar")->depth, 2);
    EXPECT_EQ(session.graph().get_incoming_edges("cedar").front().label, "ノート");
    EXPECT_TRUE(session.graph().get_position("vetiver").has_value());
}

TEST_F(ExpansionSessionTest, ChildExpansionKeepsPlacedNodesInPlace) {
    generator.replies["woody"] = R"({"nodes":[
        {"id":"cedar","label":"シダー","kind":"note"},
        {"id":"vetiver","label":"ベチバー","kind":"note"}
    ]})";
    generator.replies["citrus"] = R"({"nodes":[{"id":"bergamot","label":"ベルガモット","kind":"note"}]})";
    session.start();

    auto snapshot = [&](const std::vector<std::string>& ids) {
        std::map<std::string, Position> positions;
        for (const auto& id : ids) {
            positions[id] = *session.graph().get_position(id);
        }
        return positions;
    };
    auto expect_unmoved = [&](const std::map<std::string, Position>& before) {
        for (const auto& [id, pos] : before) {
            Position now = *session.graph().get_position(id);
            EXPECT_EQ(now.x, pos.x) << id;
            EXPECT_EQ(now.y, pos.y) << id;
        }
    };

    auto placed = snapshot({"perfume_root", "woody", "citrus", "guerlain"});
    generator.on_generate = [&](const ExpansionRequest&) { expect_unmoved(placed); };

    ASSERT_TRUE(session.expand("woody").success());
    expect_unmoved(placed);

    placed = snapshot({"perfume_root", "woody", "citrus", "guerlain", "cedar", "vetiver"});
    ASSERT_TRUE(session.expand("citrus").success());
    expect_unmoved(placed);
}

TEST_F(ExpansionSessionTest, CollidingIdsAreRenamedAgainstWholeGraph) {
    generator.replies["woody"] = R"({"nodes":[{"id":"woody","label":"ウッディ系","kind":"style"}]})";
    session.start();

    ExpansionOutcome outcome = session.expand("woody");

    ASSERT_EQ(outcome.new_node_ids.size(), 1u);
    EXPECT_EQ(outcome.new_node_ids[0], "woody__1");
    EXPECT_TRUE(session.graph().has_edge("woody--woody__1--auto"));
}

TEST_F(ExpansionSessionTest, EmptyBatchStillMarksExpanded) {
    session.start();

    ExpansionOutcome outcome = session.expand("citrus");

    EXPECT_EQ(outcome.status, ExpansionStatus::Expanded);
    EXPECT_TRUE(outcome.new_node_ids.empty());
    EXPECT_EQ(outcome.edges_added, 0u);
    EXPECT_TRUE(session.graph().is_expanded("citrus"));
    EXPECT_EQ(count_pending(session.graph()), 0u);
}

// ==========================================
// Guard Condition Tests
// ==========================================

TEST_F(ExpansionSessionTest, SecondExpandIsANoOp) {
    session.start();
    size_t calls = generator.requests.size();

    ExpansionOutcome outcome = session.expand("perfume_root");

    EXPECT_EQ(outcome.status, ExpansionStatus::AlreadyExpanded);
    EXPECT_EQ(generator.requests.size(), calls);
}

TEST_F(ExpansionSessionTest, UnknownNodeIsReported) {
    session.start();

    ExpansionOutcome outcome = session.expand("ghost");

    EXPECT_EQ(outcome.status, ExpansionStatus::UnknownNode);
    EXPECT_FALSE(outcome.error_message.empty());
}

TEST_F(ExpansionSessionTest, ReentrantExpandIsBusy) {
    ExpansionStatus nested = ExpansionStatus::Expanded;
    bool busy_during_call = false;
    generator.on_generate = [&](const ExpansionRequest&) {
        busy_during_call = session.busy();
        nested = session.expand("perfume_root").status;
        EXPECT_THROW(session.set_graph(KnowledgeGraph()), std::logic_error);
    };

    ExpansionOutcome outcome = session.start();

    EXPECT_TRUE(busy_during_call);
    EXPECT_EQ(nested, ExpansionStatus::Busy);
    EXPECT_EQ(outcome.status, ExpansionStatus::Expanded);
    EXPECT_FALSE(session.busy());
    EXPECT_EQ(generator.requests.size(), 1u);
}

// ==========================================
// Failure Tests
// ==========================================

TEST_F(ExpansionSessionTest, GeneratorFailureLeavesGraphUnchanged) {
    session.start();
    generator.failures["woody"] = "upstream 503";
    json before = session.graph().to_json();

    ExpansionOutcome outcome = session.expand("woody");

    EXPECT_EQ(outcome.status, ExpansionStatus::GeneratorFailed);
    EXPECT_EQ(outcome.error_message, "upstream 503");
    EXPECT_EQ(session.graph().to_json(), before);
    EXPECT_FALSE(session.graph().is_expanded("woody"));
    EXPECT_FALSE(session.busy());

    // The failure is not sticky
    generator.failures.clear();
    EXPECT_TRUE(session.expand("woody").success());
}

TEST_F(ExpansionSessionTest, InvalidModelJsonLeavesGraphUnchanged) {
    session.start();
    generator.replies["citrus"] = "シトラス系の香りには次のものがあります";
    json before = session.graph().to_json();

    ExpansionOutcome outcome = session.expand("citrus");

    EXPECT_EQ(outcome.status, ExpansionStatus::GeneratorFailed);
    EXPECT_EQ(outcome.error_message, "invalid json from model");
    EXPECT_EQ(session.graph().to_json(), before);
}

TEST_F(ExpansionSessionTest, FailedRootExpansionRestoresRingPositions) {
    KnowledgeGraph snapshot;
    snapshot.initialize_root("perfume_root", "香水", "root");
    snapshot.add_node({"amber", "アンバー", "accord", 1});
    snapshot.add_edge({"perfume_root--amber--auto", "perfume_root", "amber", "アコード"});
    snapshot.set_position("amber", {10.0, 20.0});
    session.set_graph(snapshot);

    JournalRenderer journal;
    session.set_renderer(&journal);
    generator.failures["perfume_root"] = "timeout";

    ExpansionOutcome outcome = session.expand("perfume_root");

    EXPECT_EQ(outcome.status, ExpansionStatus::GeneratorFailed);
    Position amber = *session.graph().get_position("amber");
    EXPECT_DOUBLE_EQ(amber.x, 10.0);
    EXPECT_DOUBLE_EQ(amber.y, 20.0);

    // Ring placement of the placeholders moved amber; the last entry puts it back
    ASSERT_FALSE(journal.entries().empty());
    const json& last = journal.entries().back();
    EXPECT_EQ(last["op"], "position");
    EXPECT_DOUBLE_EQ(last["positions"]["amber"]["x"].get<double>(), 10.0);
}

// ==========================================
// Renderer Notification Tests
// ==========================================

TEST_F(ExpansionSessionTest, JournalRecordsMutationOrder) {
    JournalRenderer journal;
    session.set_renderer(&journal);

    session.start();

    std::vector<std::string> expected = {
        "add", "position",              // root
        "add", "position", "remove",    // placeholders
        "add", "position", "expanded"   // merged batch
    };
    EXPECT_EQ(journal_ops(journal), expected);
    EXPECT_EQ(journal.entries()[2]["pending"], "perfume_root__pending__1");
    EXPECT_EQ(journal.entries()[4]["ids"].size(), 6u);
    EXPECT_FALSE(journal.entries()[5].contains("pending"));
    EXPECT_EQ(journal.entries()[7]["id"], "perfume_root");
}

TEST_F(ExpansionSessionTest, PlaceholdersCanBeDisabled) {
    SessionOptions options;
    options.show_placeholders = false;
    ExpansionSession quiet(DomainCatalog::perfume(), generator, IncrementalLayout(), options);

    JournalRenderer journal;
    quiet.set_renderer(&journal);
    size_t pending_during_call = 1;
    generator.on_generate = [&](const ExpansionRequest&) {
        pending_during_call = count_pending(quiet.graph());
    };

    quiet.start();

    std::vector<std::string> expected = {"add", "position", "add", "position", "expanded"};
    EXPECT_EQ(journal_ops(journal), expected);
    EXPECT_EQ(pending_during_call, 0u);
}

TEST_F(ExpansionSessionTest, PendingKeysAreUniquePerExpansion) {
    JournalRenderer journal;
    session.set_renderer(&journal);
    generator.failures["perfume_root"] = "timeout";

    session.start();
    generator.failures.clear();
    session.expand("perfume_root");

    std::vector<std::string> keys;
    for (const auto& entry : journal.entries()) {
        if (entry.contains("pending")) keys.push_back(entry["pending"].get<std::string>());
    }
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_NE(keys[0], keys[1]);
}

// ==========================================
// Frontier Tests
// ==========================================

TEST_F(ExpansionSessionTest, ExpandFrontierIsBreadthFirst) {
    session.start();

    EXPECT_EQ(session.unexpanded_nodes(), (std::vector<std::string>{"citrus", "guerlain", "woody"}));

    auto outcomes = session.expand_frontier(2);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].focus_id, "citrus");
    EXPECT_EQ(outcomes[1].focus_id, "guerlain");

    auto rest = session.expand_frontier(10);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_TRUE(session.unexpanded_nodes().empty());
}

TEST_F(ExpansionSessionTest, ExpandFrontierStopsAtFirstFailure) {
    session.start();
    generator.failures["guerlain"] = "quota exceeded";

    auto outcomes = session.expand_frontier(10);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].success());
    EXPECT_EQ(outcomes[1].status, ExpansionStatus::GeneratorFailed);
    EXPECT_FALSE(session.graph().is_expanded("woody"));
}

// ==========================================
// PendingBatchGuard Tests
// ==========================================

TEST(PendingBatchGuardTest, DestructorRetractsBatch) {
    KnowledgeGraph graph;
    graph.initialize_root("root", "ルート", "root");
    JournalRenderer journal;

    {
        PendingBatchGuard guard(graph, "k", &journal);
        EXPECT_TRUE(guard.add_node({"k__n1", "生成中…", "style", 1}));
        EXPECT_TRUE(guard.add_edge({"k__e1", "root", "k__n1", "生成中"}));
        EXPECT_TRUE(graph.is_pending("k__n1"));
    }

    EXPECT_EQ(graph.num_nodes(), 1u);
    EXPECT_EQ(graph.num_edges(), 0u);
    ASSERT_EQ(journal.entries().size(), 1u);
    EXPECT_EQ(journal.entries()[0]["op"], "remove");
}

TEST(PendingBatchGuardTest, RetractIsIdempotent) {
    KnowledgeGraph graph;
    graph.initialize_root("root", "ルート", "root");

    PendingBatchGuard guard(graph, "k");
    guard.add_node({"k__n1", "生成中…", "style", 1});

    EXPECT_EQ(guard.retract().size(), 1u);
    EXPECT_FALSE(guard.active());
    EXPECT_TRUE(guard.retract().empty());
    EXPECT_FALSE(guard.add_node({"k__n2", "生成中…", "style", 1}));
    EXPECT_FALSE(graph.has_node("k__n2"));
}

// ==========================================
// Outcome Serialization Tests
// ==========================================

TEST_F(ExpansionSessionTest, OutcomeJson) {
    json expanded = session.start().to_json();
    EXPECT_EQ(expanded["status"], "expanded");
    EXPECT_EQ(expanded["strategy"], "ring");
    EXPECT_TRUE(expanded.contains("report"));

    json repeated = session.expand("perfume_root").to_json();
    EXPECT_EQ(repeated["status"], "already_expanded");
    EXPECT_FALSE(repeated.contains("strategy"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
