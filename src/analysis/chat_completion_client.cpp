#include "analysis/chat_completion_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>

namespace livenotes {
namespace analysis {

using json = nlohmann::json;

ChatCompletionClient::ChatCompletionClient(const utils::CompletionSettings& settings, std::string api_key)
    : settings_(settings), api_key_(std::move(api_key)), http_(settings.timeoutMs) {
}

std::string ChatCompletionClient::buildRequestBody(const std::string& system_prompt,
                                                   const std::string& user_prompt) const {
    json payload = {
        {"model", settings_.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        })},
        {"temperature", settings_.temperature},
        {"max_tokens", settings_.maxTokens},
        {"response_format", {{"type", "json_object"}}}
    };
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ChatCompletionClient::complete(const std::string& system_prompt, const std::string& user_prompt) {
    utils::HttpResponse response;
    try {
        response = http_.postJson(settings_.endpoint, buildRequestBody(system_prompt, user_prompt),
                                  {"Authorization: Bearer " + api_key_});
    } catch (const utils::HttpException& e) {
        throw utils::AnalysisException(std::string("Completion request failed: ") + e.what(), getName());
    }
    return extractContent(response.body);
}

std::string ChatCompletionClient::extractContent(const std::string& response_body) {
    json response = json::parse(response_body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw utils::AnalysisException("Completion response is not a JSON object");
    }

    if (response.contains("error")) {
        const auto& error = response["error"];
        std::string message = error.is_object() ? error.value("message", "unknown error") : error.dump();
        throw utils::AnalysisException("Completion API error: " + message);
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw utils::AnalysisException("Completion response has no choices");
    }

    const auto& choice = response["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content") || !choice["message"]["content"].is_string()) {
        throw utils::AnalysisException("Completion response has no message content");
    }

    return choice["message"]["content"].get<std::string>();
}

} // namespace analysis
} // namespace livenotes
