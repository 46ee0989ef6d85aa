#include "core/transcription_session.hpp"
#include "core/message_protocol.hpp"
#include "stt/transcript_cleaner.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace core {

TranscriptionSession::TranscriptionSession(const std::string& sessionId,
                                           const utils::TriggerSettings& settings,
                                           std::shared_ptr<stt::TranscriptionAdapter> transcriber,
                                           std::shared_ptr<analysis::IncrementalAnalyzer> analyzer,
                                           std::shared_ptr<EventEmitter> emitter)
    : sessionId_(sessionId),
      state_(SessionState::OPEN),
      settings_(settings),
      accumulator_(settings),
      transcriber_(std::move(transcriber)),
      analyzer_(std::move(analyzer)),
      emitter_(std::move(emitter)),
      configured_(false),
      transcriptionAttempts_(0) {
    utils::Logger::info("Created session: " + sessionId_);
}

TranscriptionSession::~TranscriptionSession() {
    utils::Logger::debug("Destroyed session: " + sessionId_);
}

void TranscriptionSession::handleMessage(const std::string& message) {
    if (!isOpen()) {
        utils::Logger::warn("Received message for closing session: " + sessionId_);
        return;
    }

    auto parsedMessage = MessageProtocol::parseMessage(message);
    if (!parsedMessage) {
        utils::ErrorHandler::getInstance().reportError(
            utils::ErrorInfo(utils::ErrorCategory::WEBSOCKET, utils::ErrorSeverity::WARNING,
                             "Ignoring malformed control message", message.substr(0, 200),
                             "control message", sessionId_));
        return;
    }

    switch (parsedMessage->getType()) {
        case MessageType::CONFIG:
            processConfigMessage(static_cast<ConfigMessage*>(parsedMessage.get()));
            break;
        default:
            utils::Logger::warn("Unexpected message type from session " + sessionId_);
            break;
    }
}

void TranscriptionSession::processConfigMessage(const ConfigMessage* message) {
    if (configured_) {
        utils::Logger::warn("Session " + sessionId_ + " received another config message, overwriting client context");
    }

    clientId_ = message->hasClientId() ? message->getClientId() : std::string();
    clientContext_ = message->getContext();
    configured_ = true;

    utils::Logger::info("Session " + sessionId_ + " configured" +
                        (clientId_.empty() ? std::string() : " for client " + clientId_));
}

void TranscriptionSession::handleBinaryMessage(std::string_view data, Clock::time_point receivedAt) {
    if (!isOpen()) {
        utils::Logger::warn("Received audio for closing session: " + sessionId_);
        return;
    }

    accumulator_.ingest(data);

    if (accumulator_.shouldAttempt(receivedAt)) {
        attemptTranscription();
        accumulator_.markAttempt(receivedAt);
    }
}

bool TranscriptionSession::attemptTranscription() {
    utils::ErrorContext context("transcription", sessionId_);
    transcriptionAttempts_++;

    if (accumulator_.getBufferedFragments() == 0 || !accumulator_.hasHeader()) {
        utils::Logger::warn("Session " + sessionId_ + ": no audio or container header available for transcription");
        return false;
    }

    std::string raw = transcriber_ ? transcriber_->transcribe(accumulator_.buildContainer(), sessionId_) : "";
    std::string text = stt::TranscriptCleaner::clean(raw);

    if (text.empty()) {
        if (!raw.empty()) {
            utils::Logger::debug("Session " + sessionId_ + ": filtered out transcript '" + raw + "'");
        }
        accumulator_.recordSilentAttempt();
        return false;
    }

    std::string payload = TranscriptMessage(text, MessageProtocol::currentTimestamp(), true).serialize();
    transcriptSegments_.push_back(text);
    send(payload);
    utils::Logger::info("Session " + sessionId_ + ": transcribed " + text.substr(0, 100));

    accumulator_.recordTranscript();

    if (transcriptSegments_.size() % settings_.analysisInterval == 0) {
        runAnalysis();
    }
    return true;
}

void TranscriptionSession::runAnalysis() {
    if (transcriptSegments_.empty()) {
        return;
    }

    analysis::AnalysisOutcome outcome;
    if (analyzer_) {
        outcome = analyzer_->analyze(transcriptSegments_, sessionId_);
    } else {
        outcome.insights = analysis::IncrementalAnalyzer::fallbackInsights(
            analysis::IncrementalAnalyzer::joinSegments(transcriptSegments_), transcriptSegments_.size());
    }

    analysis::InsightDelta delta = analysis::IncrementalAnalyzer::apply(outcome.insights, analysisState_);

    for (const auto& item : delta.new_action_items) {
        emit(ActionItemMessage(item));
    }
    for (const auto& recommendation : delta.new_recommendations) {
        emit(RecommendationMessage(recommendation));
    }
    emit(SummaryUpdateMessage(delta.summary));

    utils::Logger::info("Session " + sessionId_ + ": analysis pass " + std::to_string(analysisState_.passes) +
                        " (" + std::to_string(delta.new_action_items.size()) + " new action items, " +
                        std::to_string(delta.new_recommendations.size()) + " new recommendations)");
}

SessionTranscript TranscriptionSession::close() {
    if (state_ != SessionState::OPEN) {
        return snapshot();
    }

    state_ = SessionState::CLOSING;
    utils::Logger::info("Closing session " + sessionId_);

    try {
        if (accumulator_.getBufferedFragments() > 0) {
            utils::Logger::info("Session " + sessionId_ + ": flushing " +
                                std::to_string(accumulator_.getBufferedFragments()) + " fragments (" +
                                std::to_string(accumulator_.getTotalBufferedBytes()) + " bytes)");
            attemptTranscription();
        }
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "forced flush", sessionId_);
    }

    try {
        if (!transcriptSegments_.empty()) {
            runAnalysis();
        }
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "final analysis", sessionId_);
    }

    state_ = SessionState::CLOSED;
    return snapshot();
}

SessionTranscript TranscriptionSession::snapshot() const {
    SessionTranscript result;
    result.session_id = sessionId_;
    result.client_id = clientId_;
    result.context = clientContext_;
    result.transcript = analysis::IncrementalAnalyzer::joinSegments(transcriptSegments_);
    result.segment_count = transcriptSegments_.size();
    result.chunk_count = accumulator_.getChunkCount();
    result.action_items = analysisState_.action_items;
    result.recommendations = analysisState_.recommendations;
    result.summary = analysisState_.current_summary;
    return result;
}

void TranscriptionSession::emit(const EventMessage& message) {
    send(message.serialize());
}

void TranscriptionSession::send(const std::string& payload) {
    if (emitter_) {
        emitter_->emit(sessionId_, payload);
    }
}

} // namespace core
} // namespace livenotes
