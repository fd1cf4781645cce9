#include "llm/llm_provider.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace kgx {

// ============================================================================
// HTTP Transport
// ============================================================================

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// POST a JSON body; throws on transport errors and non-2xx status codes
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) + ": " + response
        );
    }

    return response;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start
    ).count();
}

} // anonymous namespace

// ============================================================================
// LLMProvider Base Class
// ============================================================================

template<typename Func>
LLMResponse LLMProvider::retry_call(Func&& func, const std::string& operation_name) {
    const int max_attempts = std::max(1, config_.max_retries);
    std::string last_error = "Max retries exceeded";

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            return func();
        } catch (const std::exception& e) {
            last_error = e.what();
            if (attempt == max_attempts) {
                break;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempt << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempt - 1)))
            );
        }
    }

    LLMResponse error_response;
    error_response.success = false;
    error_response.error_message = "Failed after " + std::to_string(max_attempts) +
        " attempts: " + last_error;
    return error_response;
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIProvider::OpenAIProvider(const LLMConfig& config) {
    config_ = config;
    if (config_.model.empty()) {
        config_.model = LLMProviderFactory::default_model("openai");
    }
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://api.openai.com/v1";
    }
}

std::string OpenAIProvider::build_chat_payload(const std::vector<Message>& messages) const {
    json j;
    j["model"] = config_.model;
    j["temperature"] = config_.temperature;
    j["max_tokens"] = config_.max_tokens;

    json messages_array = json::array();
    for (const auto& msg : messages) {
        messages_array.push_back({
            {"role", msg.role_string()},
            {"content", msg.content}
        });
    }
    j["messages"] = messages_array;

    return j.dump();
}

LLMResponse OpenAIProvider::parse_response(const std::string& response_json) const {
    LLMResponse response;

    try {
        json j = json::parse(response_json);

        if (j.contains("error")) {
            response.error_message = j["error"].value("message", std::string("unknown API error"));
            return response;
        }

        const auto& message = j.at("choices").at(0).at("message");
        response.content = message.value("content", std::string());
        response.model = j.value("model", config_.model);

        if (j.contains("usage")) {
            response.prompt_tokens = j["usage"].value("prompt_tokens", 0);
            response.completion_tokens = j["usage"].value("completion_tokens", 0);
            response.total_tokens = j["usage"].value("total_tokens", 0);
        }

        response.success = true;
    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = std::string("Failed to parse response: ") + e.what();
    }

    return response;
}

LLMResponse OpenAIProvider::chat(const std::vector<Message>& messages) {
    auto start_time = std::chrono::steady_clock::now();

    auto call_api = [&]() -> LLMResponse {
        if (config_.verbose) {
            std::cout << "OpenAI API Request to " << config_.model << std::endl;
        }

        std::string response_str = http_post(
            config_.api_base_url + "/chat/completions",
            build_chat_payload(messages),
            {"Content-Type: application/json", "Authorization: Bearer " + config_.api_key},
            config_.timeout_seconds
        );

        LLMResponse response = parse_response(response_str);
        response.latency_ms = elapsed_ms(start_time);

        if (config_.verbose && response.success) {
            std::cout << "  Tokens: " << response.total_tokens
                      << " (prompt: " << response.prompt_tokens
                      << ", completion: " << response.completion_tokens << ")" << std::endl;
            std::cout << "  Latency: " << response.latency_ms << " ms" << std::endl;
        }

        return response;
    };

    return retry_call(call_api, "OpenAI chat");
}

// ============================================================================
// Gemini Provider
// ============================================================================

GeminiProvider::GeminiProvider(const LLMConfig& config) {
    config_ = config;
    if (config_.model.empty()) {
        config_.model = LLMProviderFactory::default_model("gemini");
    }
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://generativelanguage.googleapis.com/v1";
    }
}

std::string GeminiProvider::build_gemini_payload(const std::vector<Message>& messages) const {
    std::string system_text;
    json contents = json::array();

    for (const auto& msg : messages) {
        if (msg.role == Message::Role::System) {
            if (!system_text.empty()) system_text += "\n\n";
            system_text += msg.content;
            continue;
        }

        std::string role = (msg.role == Message::Role::User) ? "user" : "model";
        contents.push_back({
            {"role", role},
            {"parts", json::array({{{"text", msg.content}}})}
        });
    }

    if (!system_text.empty()) {
        if (contents.empty()) {
            contents.push_back({
                {"role", "user"},
                {"parts", json::array({{{"text", system_text}}})}
            });
        } else {
            std::string combined = system_text + "\n\n" +
                contents[0]["parts"][0]["text"].get<std::string>();
            contents[0]["parts"][0]["text"] = combined;
        }
    }

    json j;
    j["contents"] = contents;
    j["generationConfig"] = {
        {"temperature", config_.temperature},
        {"maxOutputTokens", config_.max_tokens}
    };

    return j.dump();
}

LLMResponse GeminiProvider::parse_response(const std::string& response_json) const {
    LLMResponse response;

    try {
        json j = json::parse(response_json);

        if (j.contains("error")) {
            response.error_message = j["error"].value("message", std::string("unknown API error"));
            return response;
        }

        if (j.contains("candidates") && !j["candidates"].empty()) {
            response.content = j["candidates"][0]["content"]["parts"][0]["text"].get<std::string>();
        }

        response.model = config_.model;

        if (j.contains("usageMetadata")) {
            response.prompt_tokens = j["usageMetadata"].value("promptTokenCount", 0);
            response.completion_tokens = j["usageMetadata"].value("candidatesTokenCount", 0);
            response.total_tokens = j["usageMetadata"].value("totalTokenCount", 0);
        }

        response.success = true;
    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = std::string("Failed to parse response: ") + e.what();
    }

    return response;
}

LLMResponse GeminiProvider::chat(const std::vector<Message>& messages) {
    auto start_time = std::chrono::steady_clock::now();

    auto call_api = [&]() -> LLMResponse {
        if (config_.verbose) {
            std::cout << "Gemini API Request to " << config_.model << std::endl;
        }

        std::string url = config_.api_base_url + "/models/" + config_.model +
            ":generateContent?key=" + config_.api_key;
        std::string response_str = http_post(
            url,
            build_gemini_payload(messages),
            {"Content-Type: application/json"},
            config_.timeout_seconds
        );

        LLMResponse response = parse_response(response_str);
        response.latency_ms = elapsed_ms(start_time);

        if (config_.verbose && response.success) {
            std::cout << "  Tokens: " << response.total_tokens
                      << " (prompt: " << response.prompt_tokens
                      << ", completion: " << response.completion_tokens << ")" << std::endl;
            std::cout << "  Latency: " << response.latency_ms << " ms" << std::endl;
        }

        return response;
    };

    return retry_call(call_api, "Gemini chat");
}

// ============================================================================
// LLM Provider Factory
// ============================================================================

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    const std::string& provider_name,
    const LLMConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "openai") {
        return std::make_unique<OpenAIProvider>(config);
    } else if (name_lower == "gemini") {
        return std::make_unique<GeminiProvider>(config);
    }
    throw std::invalid_argument("Unknown provider name: " + provider_name);
}

std::string LLMProviderFactory::default_model(const std::string& provider_name) {
    if (provider_name == "gemini") {
        return "gemini-1.5-flash";
    }
    return "gpt-4o-mini";
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create_from_env() {
    std::string provider = get_env_var("KGX_LLM_PROVIDER");
    if (provider.empty()) {
        provider = "openai";
    }

    LLMConfig config;
    if (provider == "gemini") {
        config.api_key = get_env_var("GEMINI_API_KEY");
        if (config.api_key.empty()) config.api_key = get_env_var("KGX_GEMINI_API_KEY");
    } else {
        config.api_key = get_env_var("OPENAI_API_KEY");
        if (config.api_key.empty()) config.api_key = get_env_var("KGX_OPENAI_API_KEY");
    }

    config.model = get_env_var("KGX_LLM_MODEL");
    if (config.model.empty() && provider == "openai") {
        config.model = get_env_var("OPENAI_MODEL");
    }

    if (config.api_key.empty()) {
        return nullptr;
    }

    return create(provider, config);
}

std::string get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace kgx
