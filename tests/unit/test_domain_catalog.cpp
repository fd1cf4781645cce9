#include <gtest/gtest.h>
#include "domain/domain_catalog.hpp"
#include <cstdio>
#include <stdexcept>

using namespace kgx;

class DomainCatalogTest : public ::testing::Test {
protected:
    DomainCatalog perfume = DomainCatalog::perfume();
    DomainCatalog wine = DomainCatalog::wine();
};

// ==========================================
// Built-in Catalog Tests
// ==========================================

TEST_F(DomainCatalogTest, PerfumeRootAndKinds) {
    EXPECT_EQ(perfume.key(), "perfume");
    EXPECT_EQ(perfume.root().id, "perfume_root");
    EXPECT_EQ(perfume.root().label, "香水");
    EXPECT_EQ(perfume.root().kind, "root");
    EXPECT_TRUE(perfume.is_allowed_kind("accord"));
    EXPECT_FALSE(perfume.is_allowed_kind("grape"));
}

TEST_F(DomainCatalogTest, WineRootAndKinds) {
    EXPECT_EQ(wine.root().id, "wine_root");
    EXPECT_EQ(wine.root().label, "ワイン");
    EXPECT_TRUE(wine.is_allowed_kind("appellation"));
    EXPECT_FALSE(wine.is_allowed_kind("brand"));
}

TEST_F(DomainCatalogTest, BuiltinLookup) {
    EXPECT_EQ(DomainCatalog::builtin("wine").key(), "wine");
    EXPECT_EQ(DomainCatalog::builtin("Perfume").key(), "perfume");
    EXPECT_THROW(DomainCatalog::builtin("sake"), std::invalid_argument);

    auto keys = DomainCatalog::builtin_keys();
    ASSERT_EQ(keys.size(), 2u);
}

// ==========================================
// Vocabulary Tests
// ==========================================

TEST_F(DomainCatalogTest, FallbackKindIsLastNonRootKind) {
    EXPECT_EQ(perfume.fallback_kind(), "category");
    EXPECT_EQ(wine.fallback_kind(), "style");
    EXPECT_EQ(DomainCatalog::from_allowed_kinds({"root", "concept"}).fallback_kind(), "concept");
    EXPECT_EQ(DomainCatalog::from_allowed_kinds({"concept", "root"}).fallback_kind(), "concept");
    EXPECT_EQ(DomainCatalog::from_allowed_kinds({}).fallback_kind(), "node");
}

TEST_F(DomainCatalogTest, PendingKindPrefersStyle) {
    EXPECT_EQ(perfume.pending_kind(), "style");
    EXPECT_EQ(wine.pending_kind(), "style");
    EXPECT_EQ(DomainCatalog::from_allowed_kinds({"root", "concept", "topic"}).pending_kind(), "concept");
}

TEST_F(DomainCatalogTest, ProperNounKinds) {
    EXPECT_TRUE(perfume.is_proper_noun_kind("brand"));
    EXPECT_TRUE(perfume.is_proper_noun_kind("perfumer"));
    EXPECT_FALSE(perfume.is_proper_noun_kind("note"));
    EXPECT_TRUE(wine.is_proper_noun_kind("grape"));
    EXPECT_FALSE(wine.is_proper_noun_kind("region"));
    EXPECT_TRUE(wine.requires_japanese_label("region"));
}

TEST_F(DomainCatalogTest, RelationLabels) {
    EXPECT_EQ(perfume.relation_label("note"), "ノート");
    EXPECT_EQ(perfume.relation_label("perfumer"), "調香師");
    EXPECT_EQ(wine.relation_label("appellation"), "呼称");
    EXPECT_EQ(wine.relation_label("unknown"), DomainCatalog::kGenericRelationLabel);
}

TEST_F(DomainCatalogTest, InferPicksCatalogFromSignatureKinds) {
    DomainCatalog inferred_wine = DomainCatalog::infer({"root", "producer", "style"});
    EXPECT_EQ(inferred_wine.key(), "wine");
    EXPECT_EQ(inferred_wine.allowed_kinds().size(), 3u);
    EXPECT_TRUE(inferred_wine.is_proper_noun_kind("producer"));

    EXPECT_EQ(DomainCatalog::infer({"root", "note"}).key(), "perfume");
    EXPECT_EQ(DomainCatalog::infer({"root", "concept"}).key(), "generic");
}

// ==========================================
// Presentation Tests
// ==========================================

TEST_F(DomainCatalogTest, DecorateLabel) {
    EXPECT_EQ(wine.decorate_label("wine", "Opus One"), "🍷\nOpus One");
    EXPECT_EQ(wine.decorate_label("nothing", "ラベル"), "ラベル");
}

// ==========================================
// Import/Export Tests
// ==========================================

TEST_F(DomainCatalogTest, JsonRoundTripPreservesPolicy) {
    DomainCatalog restored = DomainCatalog::from_json(wine.to_json());

    EXPECT_EQ(restored.key(), "wine");
    EXPECT_EQ(restored.root().id, "wine_root");
    EXPECT_EQ(restored.allowed_kinds(), wine.allowed_kinds());
    EXPECT_TRUE(restored.is_proper_noun_kind("vintage"));
    EXPECT_EQ(restored.relation_label("grape"), "品種");
    EXPECT_EQ(restored.kind_icon("grape"), "🍇");
}

TEST_F(DomainCatalogTest, FromJsonRequiresRootAndKinds) {
    nlohmann::json no_root = {{"allowed_kinds", {"root", "tea"}}};
    nlohmann::json no_kinds = {{"root", {{"id", "tea_root"}}}};

    EXPECT_THROW(DomainCatalog::from_json(no_root), std::runtime_error);
    EXPECT_THROW(DomainCatalog::from_json(no_kinds), std::runtime_error);
}

TEST_F(DomainCatalogTest, CustomCatalogDefaults) {
    nlohmann::json j = {
        {"root", {{"id", "tea_root"}, {"label", "お茶"}}},
        {"allowed_kinds", {"root", "tea", "region"}},
        {"proper_noun_kinds", nlohmann::json::array({"tea"})}
    };

    DomainCatalog tea = DomainCatalog::from_json(j);
    EXPECT_EQ(tea.key(), "custom");
    EXPECT_EQ(tea.root().kind, "root");
    EXPECT_EQ(tea.fallback_kind(), "region");
    EXPECT_TRUE(tea.is_proper_noun_kind("tea"));
    EXPECT_EQ(tea.relation_label("tea"), DomainCatalog::kGenericRelationLabel);
}

TEST_F(DomainCatalogTest, FileRoundTrip) {
    const std::string path = "test_domain_catalog_perfume.json";
    perfume.export_to_json(path);

    DomainCatalog loaded = DomainCatalog::load_from_json(path);
    EXPECT_EQ(loaded.root().label, "香水");
    EXPECT_EQ(loaded.relation_label("accord"), "アコード");

    std::remove(path.c_str());
    EXPECT_THROW(DomainCatalog::load_from_json(path), std::runtime_error);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
