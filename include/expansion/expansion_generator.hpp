#pragma once

#include "graph/knowledge_graph.hpp"
#include "domain/domain_catalog.hpp"
#include "llm/llm_provider.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgx {

// ============================================================================
// Wire Types
// ============================================================================

/**
 * @brief Request sent to the generator for one expansion
 *
 * Wire shape: { "focusNode": {id,label,kind,depth}, "existingElementIds": [...] }.
 * Older clients send "existingNodeIds" instead; that shape is still accepted.
 */
struct ExpansionRequest {
    Node focus_node;
    std::vector<std::string> existing_element_ids;  ///< Every node and edge id
    std::vector<std::string> existing_node_ids;     ///< Legacy: node ids only

    /**
     * @brief Identifiers the batch must avoid
     *
     * existing_element_ids when non-empty, else the legacy node ids. With
     * node ids only, edge id collisions are checked against nodes alone.
     */
    const std::vector<std::string>& used_identifiers() const;

    nlohmann::json to_json() const;

    /**
     * @throws std::invalid_argument if focusNode.id is missing
     */
    static ExpansionRequest from_json(const nlohmann::json& j);

    static ExpansionRequest for_node(const KnowledgeGraph& graph, const std::string& node_id);
};

/**
 * @brief Raw generator output; text is untrusted and may not be JSON
 */
struct GenerationResult {
    std::string text;
    bool success = false;
    std::string error_message;
    double latency_ms = 0.0;
    int total_tokens = 0;
};

// ============================================================================
// Generator Interface
// ============================================================================

/**
 * @brief Source of candidate expansions for a focus node
 */
class ExpansionGenerator {
public:
    virtual ~ExpansionGenerator() = default;

    virtual GenerationResult generate(
        const ExpansionRequest& request,
        const DomainCatalog& catalog
    ) = 0;

    virtual std::string get_name() const = 0;
};

/**
 * @brief Generator backed by a chat-completion LLM
 */
class LLMExpansionGenerator : public ExpansionGenerator {
public:
    explicit LLMExpansionGenerator(std::unique_ptr<LLMProvider> provider);

    GenerationResult generate(
        const ExpansionRequest& request,
        const DomainCatalog& catalog
    ) override;

    std::string get_name() const override;

    LLMProvider& provider() { return *provider_; }

private:
    std::unique_ptr<LLMProvider> provider_;
};

// ============================================================================
// Prompt Templates
// ============================================================================

class ExpansionPrompts {
public:
    /**
     * @brief System prompt: JSON-only one-hop expansion rules for the domain
     */
    static std::string system_prompt(const DomainCatalog& catalog);

    /**
     * @brief User prompt carrying the focus node and the ids in use
     */
    static std::string user_prompt(const ExpansionRequest& request);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Parse model output as JSON after stripping code fences
 *
 * @param text Raw model text
 * @param error_message Set when parsing fails
 * @return Parsed document, or nullopt if the text is not JSON
 */
std::optional<nlohmann::json> parse_model_json(const std::string& text, std::string& error_message);

} // namespace kgx
