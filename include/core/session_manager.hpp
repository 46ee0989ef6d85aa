#pragma once

#include "core/event_emitter.hpp"
#include "core/session_registry.hpp"
#include "core/session_strand.hpp"
#include "core/task_queue.hpp"
#include "core/transcription_session.hpp"
#include <functional>
#include <memory>
#include <string>

namespace livenotes {
namespace core {

/**
 * Connection lifecycle glue between the transport and the sessions.
 *
 * Each connection gets a TranscriptionSession and a SessionStrand; every
 * inbound frame becomes a strand job, so one session's slow external call
 * only delays that session. Closing posts the flush as the last strand job
 * and removes the session from the registry afterwards, whatever the flush
 * did.
 *
 * Pending strand jobs reference the manager's registry, so the worker pool
 * must be stopped before the manager is destroyed.
 */
class SessionManager {
public:
    using SessionCompleteCallback = std::function<void(const SessionTranscript&)>;

    SessionManager(const utils::TriggerSettings& settings,
                   std::shared_ptr<stt::TranscriptionAdapter> transcriber,
                   std::shared_ptr<analysis::IncrementalAnalyzer> analyzer,
                   std::shared_ptr<TaskQueue> taskQueue);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void setEventEmitter(std::shared_ptr<EventEmitter> emitter) { emitter_ = std::move(emitter); }
    void setSessionCompleteCallback(SessionCompleteCallback callback) { completeCallback_ = std::move(callback); }

    bool openSession(const std::string& sessionId);
    void handleText(const std::string& sessionId, std::string message);
    void handleBinary(const std::string& sessionId, std::string data);
    void closeSession(const std::string& sessionId);

    SessionRegistry& getRegistry() { return registry_; }
    const SessionRegistry& getRegistry() const { return registry_; }

    // Connections not yet handed to closeSession()
    size_t getOpenConnections() const { return registry_.openCount(); }

private:
    // Entry for a connection that still accepts frames
    bool findOpen(const std::string& sessionId, RegisteredSession& entry) const;

    utils::TriggerSettings settings_;
    std::shared_ptr<stt::TranscriptionAdapter> transcriber_;
    std::shared_ptr<analysis::IncrementalAnalyzer> analyzer_;
    std::shared_ptr<TaskQueue> taskQueue_;
    std::shared_ptr<EventEmitter> emitter_;
    SessionCompleteCallback completeCallback_;

    SessionRegistry registry_;
};

} // namespace core
} // namespace livenotes
