#pragma once

#include "analysis/completion_interface.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace livenotes {
namespace analysis {

struct MeetingInsights {
    std::vector<std::string> action_items;
    std::vector<std::string> recommendations;
    std::string summary;
};

/**
 * Typed result of reading a model reply. Anything that does not match the
 * expected object shape is a PARSE_FAILURE and sends the caller down the
 * keyword fallback.
 */
struct InsightParseResult {
    enum class Status {
        OK,
        PARSE_FAILURE
    };

    Status status = Status::PARSE_FAILURE;
    MeetingInsights insights;
    std::string error;

    bool ok() const { return status == Status::OK; }
};

struct AnalysisOutcome {
    enum class Source {
        MODEL,
        FALLBACK
    };

    Source source = Source::FALLBACK;
    MeetingInsights insights;
};

/**
 * Everything a session has already told its client. Items only ever grow.
 */
struct AnalysisState {
    std::vector<std::string> action_items;
    std::vector<std::string> recommendations;
    std::unordered_set<std::string> emitted_action_items;
    std::unordered_set<std::string> emitted_recommendations;
    std::string current_summary;
    size_t passes = 0;
};

// What one pass adds on top of AnalysisState
struct InsightDelta {
    std::vector<std::string> new_action_items;
    std::vector<std::string> new_recommendations;
    std::string summary;
};

/**
 * Extracts action items, recommendations and a running summary from the
 * accumulated transcript. Never throws: an unavailable service or an
 * unreadable reply falls back to a keyword heuristic.
 */
class IncrementalAnalyzer {
public:
    static constexpr const char* kFallbackActionItem = "Follow up on discussed items";
    static constexpr const char* kFallbackRecommendation = "Consider the improvements discussed";

    explicit IncrementalAnalyzer(std::shared_ptr<CompletionService> service);

    AnalysisOutcome analyze(const std::vector<std::string>& segments, const std::string& session_id);

    // Deduplicates against state, records the new items and replaces the summary
    static InsightDelta apply(const MeetingInsights& insights, AnalysisState& state);

    static InsightParseResult parseInsights(const std::string& reply);
    static MeetingInsights fallbackInsights(const std::string& transcript, size_t segment_count);
    static std::string buildPrompt(const std::string& transcript);
    static std::string joinSegments(const std::vector<std::string>& segments);

    bool isEnabled() const { return service_ != nullptr; }

private:
    std::shared_ptr<CompletionService> service_;
};

} // namespace analysis
} // namespace livenotes
