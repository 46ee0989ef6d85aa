#include "core/session_manager.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace core {

SessionManager::SessionManager(const utils::TriggerSettings& settings,
                               std::shared_ptr<stt::TranscriptionAdapter> transcriber,
                               std::shared_ptr<analysis::IncrementalAnalyzer> analyzer,
                               std::shared_ptr<TaskQueue> taskQueue)
    : settings_(settings),
      transcriber_(std::move(transcriber)),
      analyzer_(std::move(analyzer)),
      taskQueue_(std::move(taskQueue)) {
}

bool SessionManager::openSession(const std::string& sessionId) {
    auto session = std::make_shared<TranscriptionSession>(sessionId, settings_, transcriber_, analyzer_, emitter_);
    auto strand = std::make_shared<SessionStrand>(taskQueue_, sessionId);

    if (!registry_.add(std::move(session), std::move(strand))) {
        return false;
    }

    utils::Logger::info("Session opened: " + sessionId + ". Active sessions: " +
                        std::to_string(registry_.size()));
    return true;
}

void SessionManager::handleText(const std::string& sessionId, std::string message) {
    RegisteredSession connection;
    if (!findOpen(sessionId, connection)) {
        utils::Logger::warn("Message from unknown session: " + sessionId);
        return;
    }

    auto session = connection.session;
    connection.strand->post([session, message = std::move(message)]() {
        session->handleMessage(message);
    });
}

void SessionManager::handleBinary(const std::string& sessionId, std::string data) {
    RegisteredSession connection;
    if (!findOpen(sessionId, connection)) {
        utils::Logger::warn("Binary message from unknown session: " + sessionId);
        return;
    }

    auto session = connection.session;
    auto receivedAt = TranscriptionSession::Clock::now();
    connection.strand->post([session, data = std::move(data), receivedAt]() {
        session->handleBinaryMessage(data, receivedAt);
    });
}

void SessionManager::closeSession(const std::string& sessionId) {
    RegisteredSession connection;
    if (!registry_.markClosing(sessionId, connection)) {
        utils::Logger::warn("Close for unknown or closing session: " + sessionId);
        return;
    }

    auto session = connection.session;
    auto callback = completeCallback_;
    SessionRegistry* registry = &registry_;

    connection.strand->post([session, callback, registry]() {
        SessionTranscript transcript;
        try {
            transcript = session->close();
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "session close", session->getSessionId());
        }

        registry->remove(session->getSessionId());
        utils::Logger::info("Session removed: " + session->getSessionId() + ". Remaining active sessions: " +
                            std::to_string(registry->size()));

        if (callback) {
            try {
                callback(transcript);
            } catch (const std::exception& e) {
                utils::ErrorHandler::getInstance().reportError(e, "session complete callback",
                                                               session->getSessionId());
            }
        }
    });
}

bool SessionManager::findOpen(const std::string& sessionId, RegisteredSession& entry) const {
    return registry_.find(sessionId, entry) && !entry.closing;
}

} // namespace core
} // namespace livenotes
