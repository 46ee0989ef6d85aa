#include "stt/transcript_cleaner.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace livenotes {
namespace stt {

namespace {

// A trailing period is kept as the sentence terminator
const char* const kLeadingEdgeCharacters = " .,;:";
const char* const kTrailingEdgeCharacters = " ,;:";

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

const std::vector<std::string>& TranscriptCleaner::artifacts() {
    // Longest first so the short "otter.ai" does not break up the longer phrases
    static const std::vector<std::string> list = {
        "Transcribed by https://otter.ai",
        "Transcribed by otter.ai",
        "Powered by otter.ai",
        "Created by otter.ai",
        "Generated by otter.ai",
        "www.otter.ai",
        "otter.ai"
    };
    return list;
}

const std::vector<std::string>& TranscriptCleaner::blacklist() {
    static const std::vector<std::string> list = {
        "", "you", "thank you.", ".", " ", "[music]", "[silence]",
        "you.", "hmm.", "uh.", "um.", "ah.", "[inaudible]", "[applause]",
        "scratch", "scratch.", "test", "testing"
    };
    return list;
}

std::string TranscriptCleaner::clean(const std::string& raw) {
    std::string current = raw;
    while (true) {
        std::string next = normalizeOnce(current);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }

    if (isMeaningless(current)) {
        return "";
    }
    return current;
}

bool TranscriptCleaner::isMeaningless(const std::string& normalized) {
    if (normalized.size() < kMinimumLength) {
        return true;
    }

    std::string lower = toLower(normalized);
    const auto& list = blacklist();
    return std::find(list.begin(), list.end(), lower) != list.end();
}

std::string TranscriptCleaner::normalizeOnce(const std::string& text) {
    return trimEdges(collapseDuplicateWords(removeArtifacts(text)));
}

std::string TranscriptCleaner::removeArtifacts(const std::string& text) {
    std::string cleaned = text;
    for (const auto& artifact : artifacts()) {
        size_t pos = 0;
        while ((pos = cleaned.find(artifact, pos)) != std::string::npos) {
            cleaned.erase(pos, artifact.size());
        }
    }
    return cleaned;
}

std::string TranscriptCleaner::collapseDuplicateWords(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    std::string previous_lower;
    std::string result;

    // Splitting on whitespace also collapses runs of spaces, tabs and newlines
    while (stream >> word) {
        std::string lower = toLower(word);
        if (!result.empty() && lower == previous_lower) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += word;
        previous_lower = std::move(lower);
    }
    return result;
}

std::string TranscriptCleaner::trimEdges(const std::string& text) {
    size_t start = text.find_first_not_of(kLeadingEdgeCharacters);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(kTrailingEdgeCharacters);
    return text.substr(start, end - start + 1);
}

} // namespace stt
} // namespace livenotes
