#include "domain/domain_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace kgx {

// ============================================================================
// Built-in Catalogs
// ============================================================================

DomainCatalog DomainCatalog::perfume() {
    DomainCatalog c;
    c.key_ = "perfume";
    c.title_ = "Perfume Knowledge Graph";
    c.description_ = "ブランド・香水・ノート・調香師などの関係をクリックで深掘りします。";
    c.root_ = {"perfume_root", "香水", "root"};
    c.allowed_kinds_ = {"root", "brand", "perfume", "note", "accord", "perfumer", "style", "category"};
    c.proper_noun_kinds_ = {"brand", "perfume", "perfumer"};
    c.relation_labels_ = {
        {"brand", "ブランド"},
        {"perfume", "香水"},
        {"note", "ノート"},
        {"accord", "アコード"},
        {"perfumer", "調香師"},
        {"style", "スタイル"},
        {"category", "カテゴリ"},
        {"root", "関連"}
    };
    c.kind_icons_ = {
        {"root", "✨"},
        {"brand", "🏷️"},
        {"perfume", "🧴"},
        {"note", "🌿"},
        {"accord", "🧪"},
        {"perfumer", "👤"},
        {"style", "🎛️"},
        {"category", "📦"}
    };
    return c;
}

DomainCatalog DomainCatalog::wine() {
    DomainCatalog c;
    c.key_ = "wine";
    c.title_ = "Wine Knowledge Graph";
    c.description_ = "生産者・産地・AOC/AVA・品種・キュヴェ・ヴィンテージなどを辿って探索します。";
    c.root_ = {"wine_root", "ワイン", "root"};
    c.allowed_kinds_ = {"root", "producer", "wine", "region", "appellation", "grape", "vintage", "style"};
    c.proper_noun_kinds_ = {"producer", "wine", "grape", "vintage", "appellation"};
    c.relation_labels_ = {
        {"producer", "生産者"},
        {"wine", "ワイン"},
        {"region", "地域"},
        {"appellation", "呼称"},
        {"grape", "品種"},
        {"vintage", "ヴィンテージ"},
        {"style", "スタイル"},
        {"root", "関連"}
    };
    c.kind_icons_ = {
        {"root", "✨"},
        {"producer", "🏰"},
        {"wine", "🍷"},
        {"region", "🗺️"},
        {"appellation", "📍"},
        {"grape", "🍇"},
        {"vintage", "🗓️"},
        {"style", "🎛️"}
    };
    return c;
}

DomainCatalog DomainCatalog::from_allowed_kinds(const std::vector<std::string>& allowed_kinds) {
    DomainCatalog c;
    c.key_ = "generic";
    c.title_ = "Knowledge Graph";
    c.allowed_kinds_ = allowed_kinds;
    c.root_ = {"root", "root", "root"};
    return c;
}

DomainCatalog DomainCatalog::infer(const std::vector<std::string>& allowed_kinds) {
    std::set<std::string> kinds(allowed_kinds.begin(), allowed_kinds.end());

    if (kinds.count("producer") || kinds.count("grape") || kinds.count("appellation")) {
        DomainCatalog c = wine();
        c.allowed_kinds_ = allowed_kinds;
        return c;
    }
    if (kinds.count("brand") || kinds.count("note") || kinds.count("perfumer")) {
        DomainCatalog c = perfume();
        c.allowed_kinds_ = allowed_kinds;
        return c;
    }
    return from_allowed_kinds(allowed_kinds);
}

DomainCatalog DomainCatalog::builtin(const std::string& key) {
    std::string key_lower = key;
    std::transform(key_lower.begin(), key_lower.end(), key_lower.begin(), ::tolower);

    if (key_lower == "perfume") {
        return perfume();
    } else if (key_lower == "wine") {
        return wine();
    }
    throw std::invalid_argument("Unknown domain: " + key);
}

std::vector<std::string> DomainCatalog::builtin_keys() {
    return {"perfume", "wine"};
}

// ============================================================================
// Vocabulary
// ============================================================================

bool DomainCatalog::is_allowed_kind(const std::string& kind) const {
    return std::find(allowed_kinds_.begin(), allowed_kinds_.end(), kind) != allowed_kinds_.end();
}

std::string DomainCatalog::fallback_kind() const {
    for (auto it = allowed_kinds_.rbegin(); it != allowed_kinds_.rend(); ++it) {
        if (*it != root_.kind) {
            return *it;
        }
    }
    return allowed_kinds_.empty() ? "node" : allowed_kinds_.back();
}

std::string DomainCatalog::pending_kind() const {
    if (is_allowed_kind("style")) {
        return "style";
    }
    for (const auto& kind : allowed_kinds_) {
        if (kind != root_.kind) {
            return kind;
        }
    }
    return root_.kind;
}

// ============================================================================
// Language Policy
// ============================================================================

bool DomainCatalog::is_proper_noun_kind(const std::string& kind) const {
    return proper_noun_kinds_.count(kind) > 0;
}

bool DomainCatalog::requires_japanese_label(const std::string& kind) const {
    return !is_proper_noun_kind(kind);
}

std::string DomainCatalog::relation_label(const std::string& target_kind) const {
    auto it = relation_labels_.find(target_kind);
    return it != relation_labels_.end() ? it->second : kGenericRelationLabel;
}

// ============================================================================
// Presentation
// ============================================================================

std::string DomainCatalog::kind_icon(const std::string& kind) const {
    auto it = kind_icons_.find(kind);
    return it != kind_icons_.end() ? it->second : std::string();
}

std::string DomainCatalog::decorate_label(const std::string& kind, const std::string& label) const {
    std::string icon = kind_icon(kind);
    return icon.empty() ? label : icon + "\n" + label;
}

// ============================================================================
// Import/Export
// ============================================================================

nlohmann::json DomainCatalog::to_json() const {
    nlohmann::json j;
    j["key"] = key_;
    j["title"] = title_;
    j["description"] = description_;
    j["root"] = {{"id", root_.id}, {"label", root_.label}, {"kind", root_.kind}};
    j["allowed_kinds"] = allowed_kinds_;
    j["proper_noun_kinds"] = proper_noun_kinds_;
    j["relation_labels"] = relation_labels_;
    j["kind_icons"] = kind_icons_;
    return j;
}

DomainCatalog DomainCatalog::from_json(const nlohmann::json& j) {
    if (!j.contains("root") || !j["root"].contains("id")) {
        throw std::runtime_error("Domain catalog is missing a root descriptor");
    }
    if (!j.contains("allowed_kinds") || !j["allowed_kinds"].is_array() || j["allowed_kinds"].empty()) {
        throw std::runtime_error("Domain catalog is missing allowed_kinds");
    }

    DomainCatalog c;
    c.key_ = j.value("key", std::string("custom"));
    c.title_ = j.value("title", std::string());
    c.description_ = j.value("description", std::string());

    const auto& root = j["root"];
    c.root_.id = root["id"].get<std::string>();
    c.root_.label = root.value("label", c.root_.id);
    c.root_.kind = root.value("kind", std::string("root"));

    c.allowed_kinds_ = j["allowed_kinds"].get<std::vector<std::string>>();

    if (j.contains("proper_noun_kinds")) {
        c.proper_noun_kinds_ = j["proper_noun_kinds"].get<std::set<std::string>>();
    }
    if (j.contains("relation_labels")) {
        c.relation_labels_ = j["relation_labels"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("kind_icons")) {
        c.kind_icons_ = j["kind_icons"].get<std::map<std::string, std::string>>();
    }

    return c;
}

DomainCatalog DomainCatalog::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open catalog file: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

void DomainCatalog::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

} // namespace kgx
