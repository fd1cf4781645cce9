#pragma once

#include "domain/domain_catalog.hpp"
#include "layout/incremental_layout.hpp"
#include "llm/llm_provider.hpp"
#include "session/expansion_session.hpp"
#include <string>

namespace kgx {

// ============================================================================
// Explorer Configuration
// ============================================================================

/**
 * @brief Configuration for an exploration run
 */
struct ExplorerConfig {
    // LLM Configuration
    std::string llm_provider = "openai";    ///< "openai" or "gemini"
    std::string llm_api_key;                ///< API key
    std::string llm_model;                  ///< Empty selects the provider default
    double llm_temperature = 0.9;
    int llm_max_tokens = 700;
    int llm_max_retries = 3;
    int llm_timeout_seconds = 60;

    // Domain Configuration
    std::string domain = "perfume";         ///< Built-in catalog key
    std::string catalog_file;               ///< Custom catalog JSON (overrides domain)

    // Expansion Configuration
    bool show_placeholders = true;
    int placeholder_count = 3;

    LayoutConfig layout;

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     *
     * Accepts both the full keys (llm_provider, llm_api_key, llm_model) and
     * the short ones (provider, api_key, model).
     */
    static ExplorerConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file; the API key is redacted
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     */
    static ExplorerConfig from_environment();

    bool validate(std::string& error_message) const;

    LLMConfig to_llm_config() const;

    SessionOptions to_session_options() const;

    /**
     * @brief The custom catalog file if set, else the built-in domain
     * @throws std::invalid_argument for an unknown domain
     */
    DomainCatalog load_catalog() const;
};

} // namespace kgx
