#include "analysis/chat_completion_client.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace livenotes;
using namespace livenotes::analysis;
using json = nlohmann::json;

TEST(ChatCompletionClientTest, BuildsRequestBody) {
    utils::CompletionSettings settings;
    settings.model = "gpt-test";
    settings.temperature = 0.5;
    settings.maxTokens = 128;
    ChatCompletionClient client(settings, "key");

    json body = json::parse(client.buildRequestBody("system text", "user text"));

    EXPECT_EQ(body["model"], "gpt-test");
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.5);
    EXPECT_EQ(body["max_tokens"], 128);
    EXPECT_EQ(body["response_format"]["type"], "json_object");
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][0]["content"], "system text");
    EXPECT_EQ(body["messages"][1]["role"], "user");
    EXPECT_EQ(body["messages"][1]["content"], "user text");
    EXPECT_EQ(client.getName(), "chat-completion:gpt-test");
}

TEST(ChatCompletionClientTest, RequestBodyToleratesInvalidUtf8) {
    ChatCompletionClient client(utils::CompletionSettings(), "key");

    std::string body;
    ASSERT_NO_THROW(body = client.buildRequestBody("system text", "Hello caf\xE9 budget review"));
    EXPECT_EQ(json::parse(body)["messages"][1]["content"], "Hello caf\xEF\xBF\xBD budget review");
}

TEST(ChatCompletionClientTest, ExtractsFirstChoiceContent) {
    std::string response = R"({
        "choices": [
            {"message": {"role": "assistant", "content": "{\"summary\": \"ok\"}"}},
            {"message": {"role": "assistant", "content": "ignored"}}
        ]
    })";
    EXPECT_EQ(ChatCompletionClient::extractContent(response), "{\"summary\": \"ok\"}");
}

TEST(ChatCompletionClientTest, RejectsMalformedResponses) {
    EXPECT_THROW(ChatCompletionClient::extractContent("not json"), utils::AnalysisException);
    EXPECT_THROW(ChatCompletionClient::extractContent(R"({"choices": []})"), utils::AnalysisException);
    EXPECT_THROW(ChatCompletionClient::extractContent(R"({"choices": [{"message": {}}]})"),
                 utils::AnalysisException);
    EXPECT_THROW(ChatCompletionClient::extractContent(R"({"error": {"message": "quota exceeded"}})"),
                 utils::AnalysisException);
}
