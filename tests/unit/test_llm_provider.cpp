#include <gtest/gtest.h>
#include "llm/llm_provider.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace kgx;
using json = nlohmann::json;

class LLMProviderTest : public ::testing::Test {
protected:
    LLMConfig config;
    std::vector<Message> messages;

    void SetUp() override {
        config.api_key = "test-key";
        config.temperature = 0.5;
        config.max_tokens = 256;

        messages.emplace_back(Message::Role::System, "JSONだけを返す");
        messages.emplace_back(Message::Role::User, "focusNode = {\"id\":\"woody\"}");
    }
};

// ==========================================
// OpenAI Tests
// ==========================================

TEST_F(LLMProviderTest, OpenAIDefaults) {
    OpenAIProvider provider(config);
    EXPECT_EQ(provider.get_provider_name(), "OpenAI");
    EXPECT_EQ(provider.get_model(), "gpt-4o-mini");
    EXPECT_EQ(provider.get_config().api_base_url, "https://api.openai.com/v1");
    EXPECT_TRUE(provider.is_configured());
}

TEST_F(LLMProviderTest, OpenAIPayload) {
    config.model = "gpt-4o";
    OpenAIProvider provider(config);

    json payload = json::parse(provider.build_chat_payload(messages));

    EXPECT_EQ(payload["model"], "gpt-4o");
    EXPECT_DOUBLE_EQ(payload["temperature"].get<double>(), 0.5);
    EXPECT_EQ(payload["max_tokens"], 256);
    ASSERT_EQ(payload["messages"].size(), 2u);
    EXPECT_EQ(payload["messages"][0]["role"], "system");
    EXPECT_EQ(payload["messages"][1]["role"], "user");
    EXPECT_EQ(payload["messages"][0]["content"], "JSONだけを返す");
}

TEST_F(LLMProviderTest, OpenAIParsesCompletion) {
    OpenAIProvider provider(config);

    json body = {
        {"model", "gpt-4o-mini-2024"},
        {"choices", {{{"message", {{"role", "assistant"}, {"content", "{\"nodes\":[]}"}}}}}},
        {"usage", {{"prompt_tokens", 120}, {"completion_tokens", 30}, {"total_tokens", 150}}}
    };
    LLMResponse response = provider.parse_response(body.dump());

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.content, "{\"nodes\":[]}");
    EXPECT_EQ(response.model, "gpt-4o-mini-2024");
    EXPECT_EQ(response.total_tokens, 150);
}

TEST_F(LLMProviderTest, OpenAIReportsApiErrors) {
    OpenAIProvider provider(config);

    LLMResponse api_error = provider.parse_response(R"({"error":{"message":"Invalid API key"}})");
    EXPECT_FALSE(api_error.success);
    EXPECT_EQ(api_error.error_message, "Invalid API key");

    LLMResponse garbage = provider.parse_response("<html>bad gateway</html>");
    EXPECT_FALSE(garbage.success);
    EXPECT_NE(garbage.error_message.find("Failed to parse response"), std::string::npos);

    LLMResponse no_choices = provider.parse_response(R"({"choices":[]})");
    EXPECT_FALSE(no_choices.success);
}

// ==========================================
// Gemini Tests
// ==========================================

TEST_F(LLMProviderTest, GeminiPrependsSystemText) {
    GeminiProvider provider(config);
    EXPECT_EQ(provider.get_model(), "gemini-1.5-flash");

    json payload = json::parse(provider.build_gemini_payload(messages));

    ASSERT_EQ(payload["contents"].size(), 1u);
    EXPECT_EQ(payload["contents"][0]["role"], "user");
    std::string text = payload["contents"][0]["parts"][0]["text"].get<std::string>();
    EXPECT_EQ(text.find("JSONだけを返す\n\nfocusNode"), 0u);
    EXPECT_EQ(payload["generationConfig"]["maxOutputTokens"], 256);
}

TEST_F(LLMProviderTest, GeminiSystemOnlyConversation) {
    GeminiProvider provider(config);
    std::vector<Message> system_only = {Message(Message::Role::System, "ルール")};

    json payload = json::parse(provider.build_gemini_payload(system_only));

    ASSERT_EQ(payload["contents"].size(), 1u);
    EXPECT_EQ(payload["contents"][0]["parts"][0]["text"], "ルール");
}

TEST_F(LLMProviderTest, GeminiParsesCandidates) {
    GeminiProvider provider(config);

    json body = {
        {"candidates", {{{"content", {{"parts", {{{"text", "{\"edges\":[]}"}}}}}}}}},
        {"usageMetadata", {{"promptTokenCount", 80}, {"candidatesTokenCount", 20}, {"totalTokenCount", 100}}}
    };
    LLMResponse response = provider.parse_response(body.dump());

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.content, "{\"edges\":[]}");
    EXPECT_EQ(response.total_tokens, 100);
    EXPECT_EQ(response.model, "gemini-1.5-flash");
}

// ==========================================
// Factory Tests
// ==========================================

TEST_F(LLMProviderTest, FactoryCreatesByName) {
    auto openai = LLMProviderFactory::create("OpenAI", config);
    ASSERT_TRUE(openai != nullptr);
    EXPECT_EQ(openai->get_provider_name(), "OpenAI");

    auto gemini = LLMProviderFactory::create("gemini", config);
    EXPECT_EQ(gemini->get_provider_name(), "Gemini");

    EXPECT_THROW(LLMProviderFactory::create("claude", config), std::invalid_argument);
}

TEST_F(LLMProviderTest, DefaultModels) {
    EXPECT_EQ(LLMProviderFactory::default_model("openai"), "gpt-4o-mini");
    EXPECT_EQ(LLMProviderFactory::default_model("gemini"), "gemini-1.5-flash");
}

TEST_F(LLMProviderTest, FactoryFromEnvWithoutKeyReturnsNull) {
    unsetenv("KGX_LLM_PROVIDER");
    unsetenv("OPENAI_API_KEY");
    unsetenv("KGX_OPENAI_API_KEY");

    EXPECT_TRUE(LLMProviderFactory::create_from_env() == nullptr);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
