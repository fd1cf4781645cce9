#include "config/explorer_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kgx {

ExplorerConfig ExplorerConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    ExplorerConfig config;

    // LLM config - full (llm_*) or short keys
    if (j.contains("llm_provider")) {
        config.llm_provider = j["llm_provider"].get<std::string>();
    } else if (j.contains("provider")) {
        config.llm_provider = j["provider"].get<std::string>();
    }

    if (j.contains("llm_api_key")) {
        config.llm_api_key = j["llm_api_key"].get<std::string>();
    } else if (j.contains("api_key")) {
        config.llm_api_key = j["api_key"].get<std::string>();
    }

    if (j.contains("llm_model")) {
        config.llm_model = j["llm_model"].get<std::string>();
    } else if (j.contains("model")) {
        config.llm_model = j["model"].get<std::string>();
    }

    if (j.contains("llm_temperature")) {
        config.llm_temperature = j["llm_temperature"];
    } else if (j.contains("temperature")) {
        config.llm_temperature = j["temperature"];
    }

    if (j.contains("llm_max_tokens")) {
        config.llm_max_tokens = j["llm_max_tokens"];
    } else if (j.contains("max_tokens")) {
        config.llm_max_tokens = j["max_tokens"];
    }

    if (j.contains("llm_max_retries")) config.llm_max_retries = j["llm_max_retries"];
    if (j.contains("llm_timeout_seconds")) config.llm_timeout_seconds = j["llm_timeout_seconds"];

    // Domain config
    if (j.contains("domain")) config.domain = j["domain"].get<std::string>();
    if (j.contains("catalog_file")) config.catalog_file = j["catalog_file"].get<std::string>();

    // Expansion config
    if (j.contains("show_placeholders")) config.show_placeholders = j["show_placeholders"];
    if (j.contains("placeholder_count")) config.placeholder_count = j["placeholder_count"];

    if (j.contains("layout")) config.layout = LayoutConfig::from_json(j["layout"]);

    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

void ExplorerConfig::to_json_file(const std::string& path) const {
    json j;

    j["llm_provider"] = llm_provider;
    j["llm_api_key"] = "***REDACTED***";
    j["llm_model"] = llm_model;
    j["llm_temperature"] = llm_temperature;
    j["llm_max_tokens"] = llm_max_tokens;
    j["llm_max_retries"] = llm_max_retries;
    j["llm_timeout_seconds"] = llm_timeout_seconds;

    j["domain"] = domain;
    if (!catalog_file.empty()) {
        j["catalog_file"] = catalog_file;
    }

    j["show_placeholders"] = show_placeholders;
    j["placeholder_count"] = placeholder_count;
    j["layout"] = layout.to_json();
    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << j.dump(2);
}

ExplorerConfig ExplorerConfig::from_environment() {
    ExplorerConfig config;

    const char* provider = std::getenv("KGX_LLM_PROVIDER");
    if (provider) config.llm_provider = provider;

    const char* api_key = nullptr;
    if (config.llm_provider == "openai") {
        api_key = std::getenv("OPENAI_API_KEY");
        if (!api_key) api_key = std::getenv("KGX_OPENAI_API_KEY");
    } else if (config.llm_provider == "gemini") {
        api_key = std::getenv("GEMINI_API_KEY");
        if (!api_key) api_key = std::getenv("KGX_GEMINI_API_KEY");
    }
    if (api_key) config.llm_api_key = api_key;

    const char* model = std::getenv("KGX_LLM_MODEL");
    if (model) config.llm_model = model;

    const char* domain = std::getenv("KGX_DOMAIN");
    if (domain) config.domain = domain;

    return config;
}

bool ExplorerConfig::validate(std::string& error_message) const {
    if (llm_provider != "openai" && llm_provider != "gemini") {
        error_message = "LLM provider must be 'openai' or 'gemini'";
        return false;
    }

    if (llm_api_key.empty()) {
        error_message = "LLM API key is required";
        return false;
    }

    if (catalog_file.empty()) {
        auto keys = DomainCatalog::builtin_keys();
        if (std::find(keys.begin(), keys.end(), domain) == keys.end()) {
            error_message = "Unknown domain: " + domain;
            return false;
        }
    }

    if (placeholder_count < 0) {
        error_message = "placeholder_count must not be negative";
        return false;
    }

    return layout.validate(error_message);
}

LLMConfig ExplorerConfig::to_llm_config() const {
    LLMConfig config;
    config.api_key = llm_api_key;
    config.model = llm_model;
    config.temperature = llm_temperature;
    config.max_tokens = llm_max_tokens;
    config.max_retries = llm_max_retries;
    config.timeout_seconds = llm_timeout_seconds;
    config.verbose = verbose;
    return config;
}

SessionOptions ExplorerConfig::to_session_options() const {
    SessionOptions options;
    options.show_placeholders = show_placeholders;
    options.placeholder_count = static_cast<size_t>(std::max(0, placeholder_count));
    options.verbose = verbose;
    return options;
}

DomainCatalog ExplorerConfig::load_catalog() const {
    if (!catalog_file.empty()) {
        return DomainCatalog::load_from_json(catalog_file);
    }
    return DomainCatalog::builtin(domain);
}

} // namespace kgx
