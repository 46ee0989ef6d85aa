#pragma once

#include "stt/stt_interface.hpp"
#include <memory>
#include <string>
#include <vector>

namespace livenotes {
namespace stt {

/**
 * Gatekeeper between a session's reconstructed container and the
 * speech-to-text service.
 *
 * Containers below the minimum size never reach the service. Service
 * failures are reported and turned into an empty result.
 */
class TranscriptionAdapter {
public:
    TranscriptionAdapter(std::shared_ptr<SpeechToTextService> service,
                         size_t min_container_bytes, std::string prompt);

    // Raw service text, or "" when skipped or failed
    std::string transcribe(const std::vector<uint8_t>& container, const std::string& session_id);

    bool isEnabled() const { return service_ != nullptr; }
    size_t getMinContainerBytes() const { return min_container_bytes_; }

private:
    std::shared_ptr<SpeechToTextService> service_;
    size_t min_container_bytes_;
    std::string prompt_;
};

} // namespace stt
} // namespace livenotes
