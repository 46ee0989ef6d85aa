#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace livenotes {
namespace core {

class SessionStrand;
class TranscriptionSession;

struct RegisteredSession {
    std::shared_ptr<TranscriptionSession> session;
    std::shared_ptr<SessionStrand> strand;
    // Set once the connection has been handed to close; no more frames are routed
    bool closing = false;
};

/**
 * Process-wide table of live sessions keyed by session id.
 *
 * Only the table itself is synchronized; the sessions it holds are owned by
 * their connection's strand.
 */
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // False when a session with the same id is already registered
    bool add(std::shared_ptr<TranscriptionSession> session, std::shared_ptr<SessionStrand> strand);
    bool remove(const std::string& sessionId);

    // Copies the entry out; false for unknown ids
    bool find(const std::string& sessionId, RegisteredSession& entry) const;

    // Flags the entry as closing and copies it out. False when the id is
    // unknown or the entry was already closing.
    bool markClosing(const std::string& sessionId, RegisteredSession& entry);

    size_t size() const;
    size_t openCount() const;
    bool contains(const std::string& sessionId) const;
    std::vector<std::string> getSessionIds() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RegisteredSession> sessions_;
};

} // namespace core
} // namespace livenotes
