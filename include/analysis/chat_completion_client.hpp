#pragma once

#include "analysis/completion_interface.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace livenotes {
namespace analysis {

/**
 * Chat completion over the OpenAI-compatible /v1/chat/completions endpoint.
 */
class ChatCompletionClient : public CompletionService {
public:
    ChatCompletionClient(const utils::CompletionSettings& settings, std::string api_key);

    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;
    std::string getName() const override { return "chat-completion:" + settings_.model; }

    std::string buildRequestBody(const std::string& system_prompt, const std::string& user_prompt) const;

    // Content of the first choice. Throws AnalysisException on API errors or a malformed body.
    static std::string extractContent(const std::string& response_body);

private:
    utils::CompletionSettings settings_;
    std::string api_key_;
    utils::HttpClient http_;
};

} // namespace analysis
} // namespace livenotes
