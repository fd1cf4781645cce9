#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>

namespace kgx {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for an LLM provider
 *
 * Defaults match the expansion generator: a fairly creative model
 * with a low max_tokens limit.
 */
struct LLMConfig {
    std::string api_key;                    ///< API key for authentication
    std::string model;                      ///< Model name/ID
    std::string api_base_url;               ///< Base URL override (optional)
    double temperature = 0.9;               ///< Sampling temperature
    int max_tokens = 700;                   ///< Maximum tokens in response
    int timeout_seconds = 60;               ///< Request timeout
    int max_retries = 3;                    ///< Attempts before giving up
    bool verbose = false;                   ///< Log requests and usage
};

/**
 * @brief Message in a conversation
 */
struct Message {
    enum class Role {
        System,
        User,
        Assistant
    };

    Role role;
    std::string content;

    Message(Role r, const std::string& c) : role(r), content(c) {}

    std::string role_string() const {
        switch (role) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            default: return "user";
        }
    }
};

/**
 * @brief Response from an LLM call; failures are reported, not thrown
 */
struct LLMResponse {
    std::string content;                    ///< Generated text
    std::string model;                      ///< Model that answered
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;
    double latency_ms = 0.0;
    bool success = false;
    std::string error_message;              ///< Set when success is false
};

// ============================================================================
// LLM Provider Interface
// ============================================================================

/**
 * @brief Abstract chat-completion backend
 */
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    /**
     * @brief Chat completion with message history
     */
    virtual LLMResponse chat(const std::vector<Message>& messages) = 0;

    virtual std::string get_provider_name() const = 0;

    std::string get_model() const { return config_.model; }
    bool is_configured() const { return !config_.api_key.empty(); }
    LLMConfig get_config() const { return config_; }

protected:
    LLMConfig config_;

    /**
     * @brief Run an API call, retrying with exponential backoff
     *
     * Exceptions thrown by the call are caught and counted as failed
     * attempts; the last one is reported in the returned response.
     */
    template<typename Func>
    LLMResponse retry_call(Func&& func, const std::string& operation_name);
};

// ============================================================================
// OpenAI Provider
// ============================================================================

/**
 * @brief OpenAI chat completions API
 */
class OpenAIProvider : public LLMProvider {
public:
    explicit OpenAIProvider(const LLMConfig& config);

    LLMResponse chat(const std::vector<Message>& messages) override;
    std::string get_provider_name() const override { return "OpenAI"; }

    std::string build_chat_payload(const std::vector<Message>& messages) const;
    LLMResponse parse_response(const std::string& response_json) const;
};

// ============================================================================
// Gemini Provider
// ============================================================================

/**
 * @brief Google Gemini generateContent API
 */
class GeminiProvider : public LLMProvider {
public:
    explicit GeminiProvider(const LLMConfig& config);

    LLMResponse chat(const std::vector<Message>& messages) override;
    std::string get_provider_name() const override { return "Gemini"; }

    /**
     * @brief Gemini has no system role; system text is prepended to the first user turn
     */
    std::string build_gemini_payload(const std::vector<Message>& messages) const;
    LLMResponse parse_response(const std::string& response_json) const;
};

// ============================================================================
// LLM Provider Factory
// ============================================================================

class LLMProviderFactory {
public:
    /**
     * @brief Create a provider from its name ("openai" or "gemini")
     * @throws std::invalid_argument for an unknown name
     */
    static std::unique_ptr<LLMProvider> create(
        const std::string& provider_name,
        const LLMConfig& config
    );

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - KGX_LLM_PROVIDER (openai/gemini, default openai)
     * - OPENAI_API_KEY or KGX_OPENAI_API_KEY
     * - GEMINI_API_KEY or KGX_GEMINI_API_KEY
     * - KGX_LLM_MODEL or OPENAI_MODEL (optional)
     *
     * @return Provider, or nullptr if no API key is set
     */
    static std::unique_ptr<LLMProvider> create_from_env();

    static std::string default_model(const std::string& provider_name);
};

/**
 * @brief Read an environment variable, empty if unset
 */
std::string get_env_var(const std::string& name);

} // namespace kgx
