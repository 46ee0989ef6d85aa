#pragma once

#include <string>

namespace livenotes {
namespace core {

/**
 * Outbound channel towards a session's client. Implementations must deliver
 * payloads for one session in the order emit() was called.
 */
class EventEmitter {
public:
    virtual ~EventEmitter() = default;
    virtual void emit(const std::string& session_id, const std::string& payload) = 0;
};

} // namespace core
} // namespace livenotes
