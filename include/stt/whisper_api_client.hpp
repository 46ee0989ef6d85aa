#pragma once

#include "stt/stt_interface.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace livenotes {
namespace stt {

/**
 * Whisper transcription over the OpenAI-compatible
 * /v1/audio/transcriptions endpoint, requesting plain-text output.
 */
class WhisperApiClient : public SpeechToTextService {
public:
    WhisperApiClient(const utils::SttSettings& settings, std::string api_key);

    std::string transcribe(const std::vector<uint8_t>& container, const std::string& prompt) override;
    std::string getName() const override { return "whisper-api:" + settings_.model; }

private:
    utils::SttSettings settings_;
    std::string api_key_;
    utils::HttpClient http_;
};

} // namespace stt
} // namespace livenotes
