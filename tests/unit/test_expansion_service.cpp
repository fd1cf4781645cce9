#include <gtest/gtest.h>
#include "expansion/expansion_service.hpp"
#include <stdexcept>
#include <string>

using namespace kgx;
using json = nlohmann::json;

namespace {

// Answers every request with a fixed text, a failure, or an exception
class CannedGenerator : public ExpansionGenerator {
public:
    std::string text;
    bool succeed = true;
    bool throw_on_call = false;
    int calls = 0;
    ExpansionRequest last_request;

    GenerationResult generate(const ExpansionRequest& request, const DomainCatalog&) override {
        ++calls;
        last_request = request;
        if (throw_on_call) {
            throw std::runtime_error("connection reset");
        }

        GenerationResult result;
        result.success = succeed;
        result.text = text;
        if (!succeed) {
            result.error_message = "upstream 503";
        }
        return result;
    }

    std::string get_name() const override { return "canned"; }
};

} // anonymous namespace

class ExpansionServiceTest : public ::testing::Test {
protected:
    CannedGenerator generator;
    ExpansionService service{generator};
    DomainCatalog perfume = DomainCatalog::perfume();

    json request_body() const {
        return {
            {"focusNode", {{"id", "perfume_root"}, {"label", "香水"}, {"kind", "root"}, {"depth", 0}}},
            {"existingElementIds", json::array({"perfume_root"})}
        };
    }
};

// ==========================================
// expand() Tests
// ==========================================

TEST_F(ExpansionServiceTest, SanitizesGeneratorOutput) {
    generator.text = R"({"nodes":[{"id":"woody","label":"ウッディ","kind":"style"}],"edges":[]})";

    ExpansionRequest request = ExpansionRequest::from_json(request_body());
    ServiceResult result = service.expand(perfume, request);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.error_kind, ExpansionErrorKind::None);
    ASSERT_EQ(result.batch.nodes.size(), 1u);
    EXPECT_EQ(result.batch.nodes[0].depth, 1);
    ASSERT_EQ(result.batch.edges.size(), 1u);
    EXPECT_EQ(result.batch.edges[0].id, "perfume_root--woody--auto");
    EXPECT_EQ(result.report.edges_synthesized, 1u);
}

TEST_F(ExpansionServiceTest, FencedOutputIsAccepted) {
    generator.text = "```json\n{\"nodes\":[{\"id\":\"citrus\",\"label\":\"シトラス\",\"kind\":\"accord\"}]}\n```";

    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(request_body()));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.batch.nodes.size(), 1u);
}

TEST_F(ExpansionServiceTest, GeneratorFailureIsReported) {
    generator.succeed = false;

    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(request_body()));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ExpansionErrorKind::GeneratorFailed);
    EXPECT_EQ(result.error_message, "upstream 503");
    EXPECT_TRUE(result.batch.empty());
}

TEST_F(ExpansionServiceTest, GeneratorExceptionIsReported) {
    generator.throw_on_call = true;

    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(request_body()));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ExpansionErrorKind::GeneratorFailed);
    EXPECT_EQ(result.error_message, "connection reset");
}

TEST_F(ExpansionServiceTest, NonJsonTextIsInvalidModelJson) {
    generator.text = "Here are three related notes: vanilla, amber, musk.";

    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(request_body()));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ExpansionErrorKind::InvalidModelJson);
    EXPECT_EQ(result.error_message, "invalid json from model");
    EXPECT_EQ(expansion_error_kind_to_string(result.error_kind), "invalid_model_json");
}

TEST_F(ExpansionServiceTest, LegacyNodeIdsSeedTheIdentifierPool) {
    generator.text = R"({"nodes":[{"id":"woody","label":"ウッディ","kind":"style"}]})";

    json body = {
        {"focusNode", {{"id", "perfume_root"}, {"depth", 0}}},
        {"existingNodeIds", {"perfume_root", "woody"}}
    };
    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(body));

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.batch.nodes.size(), 1u);
    EXPECT_EQ(result.batch.nodes[0].id, "woody__1");
}

TEST_F(ExpansionServiceTest, NeverReturnsMoreThanThreeNodes) {
    json nodes = json::array();
    for (int i = 0; i < 6; ++i) {
        nodes.push_back({{"id", "note" + std::to_string(i)}, {"label", "ノート"}, {"kind", "note"}});
    }
    generator.text = json{{"nodes", nodes}}.dump();

    ServiceResult result = service.expand(perfume, ExpansionRequest::from_json(request_body()));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.batch.nodes.size(), ExpansionSanitizer::kMaxNodesPerExpansion);
    EXPECT_EQ(result.report.nodes_truncated, 3u);
}

// ==========================================
// handle() Tests
// ==========================================

TEST_F(ExpansionServiceTest, HandleReturnsSanitizedBatch) {
    generator.text = R"({"nodes":[{"id":"woody","label":"ウッディ","kind":"style"}],"edges":[]})";

    ServiceResponse response = service.handle("perfume", request_body());

    EXPECT_EQ(response.status, 200);
    ASSERT_TRUE(response.body.contains("nodes"));
    EXPECT_EQ(response.body["nodes"].size(), 1u);
    EXPECT_EQ(response.body["edges"].size(), 1u);
    EXPECT_EQ(response.body["edges"][0]["label"], "スタイル");
}

TEST_F(ExpansionServiceTest, HandleRejectsUnknownDomain) {
    ServiceResponse response = service.handle("sake", request_body());

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["error"], "unknown domain: sake");
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(ExpansionServiceTest, HandleRejectsMissingFocus) {
    ServiceResponse response = service.handle("wine", json{{"existingElementIds", json::array()}});

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["error"], "focusNode is required");
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(ExpansionServiceTest, HandleRejectsOutOfRangeDepth) {
    json body = request_body();
    body["focusNode"]["depth"] = 1e300;

    ServiceResponse response = service.handle("perfume", body);

    EXPECT_EQ(response.status, 400);
    EXPECT_NE(response.body["error"].get<std::string>().find("depth"), std::string::npos);
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(ExpansionServiceTest, HandleReportsModelFaults) {
    generator.text = "not json";
    ServiceResponse invalid = service.handle("perfume", request_body());
    EXPECT_EQ(invalid.status, 500);
    EXPECT_EQ(invalid.body["error"], "invalid json from model");

    generator.succeed = false;
    ServiceResponse failed = service.handle("perfume", request_body());
    EXPECT_EQ(failed.status, 500);
    EXPECT_EQ(failed.body["error"], "upstream 503");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
