#include "expansion/expansion_generator.hpp"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kgx {

namespace {

std::vector<std::string> string_items(const json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// ExpansionRequest
// ============================================================================

const std::vector<std::string>& ExpansionRequest::used_identifiers() const {
    return existing_element_ids.empty() ? existing_node_ids : existing_element_ids;
}

json ExpansionRequest::to_json() const {
    json j;
    j["focusNode"] = focus_node.to_json();
    j["existingElementIds"] = existing_element_ids;
    if (!existing_node_ids.empty()) {
        j["existingNodeIds"] = existing_node_ids;
    }
    return j;
}

ExpansionRequest ExpansionRequest::from_json(const json& j) {
    if (!j.is_object() || !j.contains("focusNode") || !j["focusNode"].is_object()) {
        throw std::invalid_argument("focusNode is required");
    }

    const json& focus = j["focusNode"];
    if (!focus.contains("id") || !focus["id"].is_string() || focus["id"].get<std::string>().empty()) {
        throw std::invalid_argument("focusNode is required");
    }

    ExpansionRequest request;
    request.focus_node.id = focus["id"].get<std::string>();
    request.focus_node.label = focus.contains("label") && focus["label"].is_string()
        ? focus["label"].get<std::string>()
        : request.focus_node.id;
    request.focus_node.kind = focus.contains("kind") && focus["kind"].is_string()
        ? focus["kind"].get<std::string>()
        : std::string();
    request.focus_node.depth = focus.contains("depth") ? depth_from_json(focus["depth"]) : 0;

    if (j.contains("existingElementIds")) {
        request.existing_element_ids = string_items(j["existingElementIds"]);
    }
    if (j.contains("existingNodeIds")) {
        request.existing_node_ids = string_items(j["existingNodeIds"]);
    }

    return request;
}

ExpansionRequest ExpansionRequest::for_node(const KnowledgeGraph& graph, const std::string& node_id) {
    const Node* node = graph.get_node(node_id);
    if (!node) {
        throw std::out_of_range("Unknown node: " + node_id);
    }

    ExpansionRequest request;
    request.focus_node = *node;
    request.existing_element_ids = graph.element_ids();
    return request;
}

// ============================================================================
// LLMExpansionGenerator
// ============================================================================

LLMExpansionGenerator::LLMExpansionGenerator(std::unique_ptr<LLMProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("LLMExpansionGenerator requires a provider");
    }
}

std::string LLMExpansionGenerator::get_name() const {
    return provider_->get_provider_name() + ":" + provider_->get_model();
}

GenerationResult LLMExpansionGenerator::generate(
    const ExpansionRequest& request,
    const DomainCatalog& catalog
) {
    std::vector<Message> messages = {
        Message(Message::Role::System, ExpansionPrompts::system_prompt(catalog)),
        Message(Message::Role::User, ExpansionPrompts::user_prompt(request))
    };

    LLMResponse response = provider_->chat(messages);

    GenerationResult result;
    result.success = response.success;
    result.text = response.content;
    result.error_message = response.error_message;
    result.latency_ms = response.latency_ms;
    result.total_tokens = response.total_tokens;
    return result;
}

// ============================================================================
// Prompt Templates
// ============================================================================

std::string ExpansionPrompts::system_prompt(const DomainCatalog& catalog) {
    const std::string kinds = join(catalog.allowed_kinds(), ", ");

    std::string subject;
    std::string proper_nouns;
    std::string relation_examples;
    if (catalog.key() == "perfume") {
        subject = "香水ナレッジグラフ";
        proper_nouns = "ブランド名・商品名・調香師名";
        relation_examples = "\"ブランド\", \"ノート\", \"アコード\", \"調香師\", \"カテゴリ\", \"スタイル\"";
    } else if (catalog.key() == "wine") {
        subject = "ワインナレッジグラフ";
        proper_nouns = "生産者名・キュヴェ名・品種名";
        relation_examples = "\"生産者\", \"品種\", \"地域\", \"呼称\", \"ヴィンテージ\", \"スタイル\"";
    } else {
        subject = "ナレッジグラフ";
        proper_nouns = "固有名詞";
        relation_examples = "\"関連\"";
    }

    std::ostringstream ss;
    ss << "あなたは「" << subject << "」を1ホップだけ拡張する生成器です。\n"
       << "必ず JSON だけを返してください（Markdown、説明文、コードフェンス禁止）。\n\n"
       << "出力スキーマ:\n"
       << "{\n"
       << "  \"nodes\":[{\"id\":\"string\",\"label\":\"string\",\"kind\":\"string\",\"depth\":number}],\n"
       << "  \"edges\":[{\"id\":\"string\",\"source\":\"string\",\"target\":\"string\",\"label\":\"string\"}]\n"
       << "}\n\n"
       << "ルール:\n"
       << "- focusNode の直接の子ノード（1ホップ）だけを生成する\n"
       << "- 新規ノードは 3 個\n"
       << "- node.id はユニークで、existingElementIds のどれとも衝突しない\n"
       << "- すべての edge は source = focusNode.id、target = 新規ノードのいずれか\n"
       << "- node.kind は次のいずれか: " << kinds << "\n"
       << "- node.depth は focusNode.depth + 1\n"
       << "- nodes を返すなら edges も必ず返す\n"
       << "- ノードとエッジの label は日本語。例外として" << proper_nouns << "は原語表記でもよい\n"
       << "- エッジ label は日本語の関係ラベル（例: " << relation_examples << "）\n"
       << "- JSON 以外のテキストを出力しない";
    return ss.str();
}

std::string ExpansionPrompts::user_prompt(const ExpansionRequest& request) {
    std::ostringstream ss;
    ss << "入力:\n"
       << "focusNode = " << request.focus_node.to_json().dump() << "\n"
       << "existingElementIds = " << json(request.used_identifiers()).dump() << "\n"
       << "注意: 返すのはJSONのみ。スキーマ厳守。";
    return ss.str();
}

// ============================================================================
// Utility Functions
// ============================================================================

std::optional<json> parse_model_json(const std::string& text, std::string& error_message) {
    const char* ws = " \t\n\r";
    std::string clean = text;

    size_t first = clean.find_first_not_of(ws);
    if (first == std::string::npos) {
        error_message = "empty response from model";
        return std::nullopt;
    }
    clean = clean.substr(first);

    // Tolerate ```json ... ``` wrappers despite the prompt
    bool fenced = false;
    if (clean.compare(0, 7, "```json") == 0) {
        clean = clean.substr(7);
        fenced = true;
    } else if (clean.compare(0, 3, "```") == 0) {
        clean = clean.substr(3);
        fenced = true;
    }
    if (fenced) {
        size_t fence = clean.rfind("```");
        if (fence != std::string::npos) {
            clean = clean.substr(0, fence);
        }
    }

    try {
        return json::parse(clean);
    } catch (const json::parse_error& e) {
        error_message = e.what();
        return std::nullopt;
    }
}

} // namespace kgx
