#pragma once

#include "core/event_emitter.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward declarations for uWS types
struct us_listen_socket_t;

namespace uWS {
    template<bool SSL> struct TemplatedApp;
    template<bool SSL, bool isServer, typename USERDATA> struct WebSocket;
    struct Loop;
    using App = TemplatedApp<false>;
}

namespace livenotes {
namespace core {

class SessionManager;

// Per-socket data structure
struct PerSocketData {
    std::string sessionId;
};

using ServerWebSocket = uWS::WebSocket<false, true, PerSocketData>;

/**
 * uWebSockets front end. Runs on the event-loop thread; inbound frames are
 * handed to the SessionManager and outbound events come back through emit(),
 * which may be called from any thread.
 */
class WebSocketServer : public EventEmitter, public std::enable_shared_from_this<WebSocketServer> {
public:
    WebSocketServer(int port, std::string path, std::shared_ptr<SessionManager> sessions);
    ~WebSocketServer() override;

    void start();
    void run();
    void stop();

    // Closes the listen socket and every connection so run() returns. Any thread.
    void shutdown();

    void emit(const std::string& sessionId, const std::string& payload) override;

private:
    int port_;
    std::string path_;
    bool running_;
    std::unique_ptr<uWS::App> app_;
    uWS::Loop* loop_;
    us_listen_socket_t* listenSocket_;
    std::shared_ptr<SessionManager> sessions_;

    // Event-loop thread only
    std::unordered_map<std::string, ServerWebSocket*> websockets_;

    std::string generateSessionId();
    void handleNewConnection(ServerWebSocket* ws);
    void handleMessage(const std::string& sessionId, std::string_view message);
    void handleBinaryMessage(const std::string& sessionId, std::string_view data);
    void handleDisconnection(const std::string& sessionId, int code);
    void deliver(const std::string& sessionId, const std::string& payload);
    void closeAll();
};

} // namespace core
} // namespace livenotes
