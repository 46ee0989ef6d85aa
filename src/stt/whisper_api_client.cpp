#include "stt/whisper_api_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace stt {

WhisperApiClient::WhisperApiClient(const utils::SttSettings& settings, std::string api_key)
    : settings_(settings), api_key_(std::move(api_key)), http_(settings.timeoutMs) {
}

std::string WhisperApiClient::transcribe(const std::vector<uint8_t>& container, const std::string& prompt) {
    std::vector<utils::MultipartField> fields;
    fields.push_back({"file", std::string(container.begin(), container.end()), "audio.webm", "audio/webm"});
    fields.push_back({"model", settings_.model, "", ""});
    fields.push_back({"response_format", "text", "", ""});
    if (!settings_.language.empty()) {
        fields.push_back({"language", settings_.language, "", ""});
    }
    if (!prompt.empty()) {
        fields.push_back({"prompt", prompt, "", ""});
    }

    utils::HttpResponse response;
    try {
        response = http_.postMultipart(settings_.endpoint, fields, {"Authorization: Bearer " + api_key_});
    } catch (const utils::HttpException& e) {
        throw utils::STTException(std::string("Transcription request failed: ") + e.what(), getName());
    }

    const std::string& body = response.body;
    size_t start = body.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = body.find_last_not_of(" \t\r\n");
    return body.substr(start, end - start + 1);
}

} // namespace stt
} // namespace livenotes
