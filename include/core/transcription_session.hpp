#pragma once

#include "analysis/incremental_analyzer.hpp"
#include "audio/audio_accumulator.hpp"
#include "core/event_emitter.hpp"
#include "stt/transcription_adapter.hpp"
#include "utils/config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace livenotes {
namespace core {

class EventMessage;
class ConfigMessage;

enum class SessionState {
    OPEN,
    CLOSING,
    CLOSED
};

// Snapshot handed over once a session is closed
struct SessionTranscript {
    std::string session_id;
    std::string client_id;
    nlohmann::json context;
    std::string transcript;
    size_t segment_count = 0;
    size_t chunk_count = 0;
    std::vector<std::string> action_items;
    std::vector<std::string> recommendations;
    std::string summary;
};

/**
 * One live transcription connection.
 *
 * Fragments flow into the AudioAccumulator; when the trigger policy fires the
 * rebuilt container is transcribed, cleaned and emitted, and every Nth
 * accepted transcript drives an analysis pass. close() performs the forced
 * flush and final analysis.
 *
 * Not thread-safe. All calls for one session must be serialized by the
 * caller (the server runs them on the session's strand).
 */
class TranscriptionSession {
public:
    using Clock = audio::AudioAccumulator::Clock;

    TranscriptionSession(const std::string& sessionId,
                         const utils::TriggerSettings& settings,
                         std::shared_ptr<stt::TranscriptionAdapter> transcriber,
                         std::shared_ptr<analysis::IncrementalAnalyzer> analyzer,
                         std::shared_ptr<EventEmitter> emitter);
    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    const std::string& getSessionId() const { return sessionId_; }
    SessionState getState() const { return state_; }
    bool isOpen() const { return state_ == SessionState::OPEN; }

    // Control frames (JSON text)
    void handleMessage(const std::string& message);

    // Audio fragments; receivedAt feeds the idle part of the trigger policy
    void handleBinaryMessage(std::string_view data, Clock::time_point receivedAt = Clock::now());

    /**
     * Rebuild, transcribe and clean the buffered audio. Returns true when a
     * transcript was accepted and emitted.
     */
    bool attemptTranscription();

    void runAnalysis();

    /**
     * Open -> Closing -> Closed. Flushes the buffer, runs the final analysis
     * when any transcript exists and returns the session snapshot. Failures
     * along the way are reported, never thrown.
     */
    SessionTranscript close();

    SessionTranscript snapshot() const;

    const audio::AudioAccumulator& getAccumulator() const { return accumulator_; }
    const std::vector<std::string>& getTranscriptSegments() const { return transcriptSegments_; }
    const analysis::AnalysisState& getAnalysisState() const { return analysisState_; }
    const std::string& getClientId() const { return clientId_; }
    const nlohmann::json& getClientContext() const { return clientContext_; }
    size_t getTranscriptionAttempts() const { return transcriptionAttempts_; }

private:
    void processConfigMessage(const ConfigMessage* message);
    void emit(const EventMessage& message);
    void send(const std::string& payload);

    std::string sessionId_;
    SessionState state_;
    utils::TriggerSettings settings_;

    audio::AudioAccumulator accumulator_;
    std::shared_ptr<stt::TranscriptionAdapter> transcriber_;
    std::shared_ptr<analysis::IncrementalAnalyzer> analyzer_;
    std::shared_ptr<EventEmitter> emitter_;

    std::vector<std::string> transcriptSegments_;
    analysis::AnalysisState analysisState_;

    std::string clientId_;
    nlohmann::json clientContext_;
    bool configured_;

    size_t transcriptionAttempts_;
};

} // namespace core
} // namespace livenotes
