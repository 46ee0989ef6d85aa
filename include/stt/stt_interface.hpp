#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace livenotes {
namespace stt {

// Abstract interface for an external speech-to-text service
class SpeechToTextService {
public:
    virtual ~SpeechToTextService() = default;

    /**
     * Transcribe a complete audio container. The prompt is a free-text hint
     * about the recording. Throws on any failure.
     */
    virtual std::string transcribe(const std::vector<uint8_t>& container, const std::string& prompt) = 0;

    virtual std::string getName() const = 0;
};

} // namespace stt
} // namespace livenotes
