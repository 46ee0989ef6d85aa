#include "stt/transcription_adapter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace stt {

TranscriptionAdapter::TranscriptionAdapter(std::shared_ptr<SpeechToTextService> service,
                                           size_t min_container_bytes, std::string prompt)
    : service_(std::move(service)), min_container_bytes_(min_container_bytes), prompt_(std::move(prompt)) {
}

std::string TranscriptionAdapter::transcribe(const std::vector<uint8_t>& container, const std::string& session_id) {
    if (container.size() < min_container_bytes_) {
        utils::Logger::debug("Session " + session_id + ": audio too small for transcription (" +
                             std::to_string(container.size()) + " bytes)");
        return "";
    }

    if (!service_) {
        utils::Logger::warn("Session " + session_id + ": speech-to-text service not configured");
        return "";
    }

    utils::Logger::info("Session " + session_id + ": attempting transcription with " +
                        std::to_string(container.size()) + " bytes");

    try {
        return service_->transcribe(container, prompt_);
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "transcription", session_id);
        return "";
    }
}

} // namespace stt
} // namespace livenotes
