#pragma once

#include <string>
#include <vector>

namespace livenotes {
namespace stt {

/**
 * Normalizes raw speech-to-text output before it is accepted into a session.
 *
 * clean() strips vendor attribution artifacts, collapses consecutive
 * duplicate words (case-insensitive), collapses whitespace and trims stray
 * punctuation from both ends (a closing period survives), repeating until the
 * text stops changing. Text
 * that is then blacklisted or shorter than the minimum length becomes "".
 * clean(clean(s)) == clean(s) for every s.
 */
class TranscriptCleaner {
public:
    static constexpr size_t kMinimumLength = 5;

    static std::string clean(const std::string& raw);

    // True when the normalized text carries no usable speech
    static bool isMeaningless(const std::string& normalized);

    static const std::vector<std::string>& artifacts();
    static const std::vector<std::string>& blacklist();

private:
    static std::string normalizeOnce(const std::string& text);
    static std::string removeArtifacts(const std::string& text);
    static std::string collapseDuplicateWords(const std::string& text);
    static std::string trimEdges(const std::string& text);
};

} // namespace stt
} // namespace livenotes
