#include "analysis/incremental_analyzer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace livenotes {
namespace analysis {

using json = nlohmann::json;

namespace {

const char* const kSystemPrompt = "You are a helpful assistant that analyzes meeting transcripts.";

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool readStringList(const json& root, const char* key, std::vector<std::string>& out, std::string& error) {
    if (!root.contains(key) || root[key].is_null()) {
        return true;
    }
    const auto& list = root[key];
    if (!list.is_array()) {
        error = std::string(key) + " is not an array";
        return false;
    }
    for (const auto& entry : list) {
        if (!entry.is_string()) {
            error = std::string(key) + " contains a non-string entry";
            return false;
        }
        std::string value = entry.get<std::string>();
        if (!value.empty()) {
            out.push_back(std::move(value));
        }
    }
    return true;
}

} // namespace

constexpr const char* IncrementalAnalyzer::kFallbackActionItem;
constexpr const char* IncrementalAnalyzer::kFallbackRecommendation;

IncrementalAnalyzer::IncrementalAnalyzer(std::shared_ptr<CompletionService> service)
    : service_(std::move(service)) {
}

std::string IncrementalAnalyzer::joinSegments(const std::vector<std::string>& segments) {
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += segment;
    }
    return joined;
}

std::string IncrementalAnalyzer::buildPrompt(const std::string& transcript) {
    return "Analyze this meeting transcript and extract:\n"
           "1. Action items (specific tasks that need to be done)\n"
           "2. Key recommendations or decisions\n"
           "3. Brief summary of the discussion\n"
           "\n"
           "Transcript:\n" + transcript + "\n"
           "\n"
           "Return as JSON with keys: action_items (list of strings), "
           "recommendations (list of strings), summary (string)";
}

AnalysisOutcome IncrementalAnalyzer::analyze(const std::vector<std::string>& segments,
                                             const std::string& session_id) {
    std::string transcript = joinSegments(segments);
    AnalysisOutcome outcome;

    if (service_) {
        try {
            std::string reply = service_->complete(kSystemPrompt, buildPrompt(transcript));
            InsightParseResult parsed = parseInsights(reply);
            if (parsed.ok()) {
                outcome.source = AnalysisOutcome::Source::MODEL;
                outcome.insights = std::move(parsed.insights);
                return outcome;
            }
            utils::ErrorHandler::getInstance().reportError(
                utils::ErrorInfo(utils::ErrorCategory::ANALYSIS, utils::ErrorSeverity::WARNING,
                                 "Failed to parse analysis reply", parsed.error, "analysis", session_id));
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "analysis", session_id);
        }
    }

    utils::Logger::info("Session " + session_id + ": using keyword analysis fallback");
    outcome.source = AnalysisOutcome::Source::FALLBACK;
    outcome.insights = fallbackInsights(transcript, segments.size());
    return outcome;
}

InsightParseResult IncrementalAnalyzer::parseInsights(const std::string& reply) {
    InsightParseResult result;

    // Models like to wrap JSON in a code fence; read the outermost object
    size_t open = reply.find('{');
    size_t close = reply.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        result.error = "reply contains no JSON object";
        return result;
    }

    json root = json::parse(reply.substr(open, close - open + 1), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        result.error = "reply is not valid JSON";
        return result;
    }

    if (!root.contains("summary") || !root["summary"].is_string()) {
        result.error = "summary missing or not a string";
        return result;
    }

    MeetingInsights insights;
    insights.summary = root["summary"].get<std::string>();
    if (!readStringList(root, "action_items", insights.action_items, result.error) ||
        !readStringList(root, "recommendations", insights.recommendations, result.error)) {
        return result;
    }

    result.status = InsightParseResult::Status::OK;
    result.insights = std::move(insights);
    return result;
}

MeetingInsights IncrementalAnalyzer::fallbackInsights(const std::string& transcript, size_t segment_count) {
    MeetingInsights insights;
    std::string lower = toLower(transcript);

    if (lower.find("follow up") != std::string::npos || lower.find("todo") != std::string::npos) {
        insights.action_items.push_back(kFallbackActionItem);
    }
    if (lower.find("improve") != std::string::npos || lower.find("consider") != std::string::npos) {
        insights.recommendations.push_back(kFallbackRecommendation);
    }

    insights.summary = "Meeting transcript with " + std::to_string(segment_count) + " segments recorded.";
    return insights;
}

InsightDelta IncrementalAnalyzer::apply(const MeetingInsights& insights, AnalysisState& state) {
    InsightDelta delta;

    for (const auto& item : insights.action_items) {
        if (state.emitted_action_items.insert(item).second) {
            state.action_items.push_back(item);
            delta.new_action_items.push_back(item);
        }
    }

    for (const auto& recommendation : insights.recommendations) {
        if (state.emitted_recommendations.insert(recommendation).second) {
            state.recommendations.push_back(recommendation);
            delta.new_recommendations.push_back(recommendation);
        }
    }

    state.current_summary = insights.summary;
    state.passes++;
    delta.summary = insights.summary;
    return delta;
}

} // namespace analysis
} // namespace livenotes
