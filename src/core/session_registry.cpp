#include "core/session_registry.hpp"
#include "core/session_strand.hpp"
#include "core/transcription_session.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace core {

bool SessionRegistry::add(std::shared_ptr<TranscriptionSession> session, std::shared_ptr<SessionStrand> strand) {
    if (!session || !strand) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = session->getSessionId();
    RegisteredSession entry;
    entry.session = std::move(session);
    entry.strand = std::move(strand);
    bool inserted = sessions_.emplace(id, std::move(entry)).second;
    if (!inserted) {
        utils::Logger::warn("Session already registered: " + id);
    }
    return inserted;
}

bool SessionRegistry::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(sessionId) > 0;
}

bool SessionRegistry::find(const std::string& sessionId, RegisteredSession& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return false;
    }
    entry = it->second;
    return true;
}

bool SessionRegistry::markClosing(const std::string& sessionId, RegisteredSession& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || it->second.closing) {
        return false;
    }
    it->second.closing = true;
    entry = it->second;
    return true;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionRegistry::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : sessions_) {
        if (!entry.second.closing) {
            count++;
        }
    }
    return count;
}

bool SessionRegistry::contains(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(sessionId) > 0;
}

std::vector<std::string> SessionRegistry::getSessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace core
} // namespace livenotes
