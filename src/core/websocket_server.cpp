#include "core/websocket_server.hpp"
#include "core/session_manager.hpp"
#include "utils/logging.hpp"
#include <App.h>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <vector>

namespace livenotes {
namespace core {

namespace {

constexpr unsigned int kMaxPayloadLength = 16 * 1024 * 1024;
constexpr unsigned short kIdleTimeoutSeconds = 120;

} // namespace

WebSocketServer::WebSocketServer(int port, std::string path, std::shared_ptr<SessionManager> sessions)
    : port_(port), path_(std::move(path)), running_(false), app_(nullptr), loop_(nullptr), listenSocket_(nullptr),
      sessions_(std::move(sessions)) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

std::string WebSocketServer::generateSessionId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << '-';
        }
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

void WebSocketServer::start() {
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_) + ", path " + path_);
    running_ = true;

    app_ = std::make_unique<uWS::App>();
    loop_ = uWS::Loop::get();

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.compression = uWS::DISABLED;
    behavior.maxPayloadLength = kMaxPayloadLength;
    behavior.idleTimeout = kIdleTimeoutSeconds;

    behavior.open = [this](ServerWebSocket* ws) {
        handleNewConnection(ws);
    };

    behavior.message = [this](ServerWebSocket* ws, std::string_view message, uWS::OpCode opCode) {
        auto* data = ws->getUserData();
        if (opCode == uWS::OpCode::TEXT) {
            handleMessage(data->sessionId, message);
        } else if (opCode == uWS::OpCode::BINARY) {
            handleBinaryMessage(data->sessionId, message);
        }
    };

    behavior.close = [this](ServerWebSocket* ws, int code, std::string_view /*message*/) {
        handleDisconnection(ws->getUserData()->sessionId, code);
    };

    app_->ws<PerSocketData>(path_, std::move(behavior));

    app_->get("/health", [this](auto* res, auto* /*req*/) {
        nlohmann::json body = {
            {"status", "ok"},
            {"activeSessions", sessions_->getRegistry().size()}
        };
        res->writeStatus("200 OK")
           ->writeHeader("Content-Type", "application/json")
           ->writeHeader("Cache-Control", "no-cache")
           ->end(body.dump());
    });
}

void WebSocketServer::run() {
    if (!app_) {
        utils::Logger::error("Server not started. Call start() first.");
        return;
    }

    app_->listen(port_, [this](auto* listen_socket) {
        listenSocket_ = listen_socket;
        if (listen_socket) {
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(port_));
            running_ = false;
        }
    });

    if (running_) {
        utils::Logger::info("Server started successfully. Press Ctrl+C to stop.");
        app_->run();
    }
}

void WebSocketServer::shutdown() {
    if (!loop_) {
        return;
    }

    std::weak_ptr<WebSocketServer> weak = weak_from_this();
    loop_->defer([weak]() {
        if (auto self = weak.lock()) {
            self->closeAll();
        }
    });
}

void WebSocketServer::closeAll() {
    if (listenSocket_) {
        us_listen_socket_close(0, listenSocket_);
        listenSocket_ = nullptr;
        utils::Logger::info("Stopped accepting connections on port " + std::to_string(port_));
    }

    // end() runs the close handler, which erases from websockets_
    std::vector<ServerWebSocket*> open;
    open.reserve(websockets_.size());
    for (const auto& entry : websockets_) {
        open.push_back(entry.second);
    }
    for (auto* ws : open) {
        ws->end(1001, "server shutting down");
    }
}

void WebSocketServer::stop() {
    if (running_) {
        utils::Logger::info("Stopping WebSocket server");
        running_ = false;
        websockets_.clear();
        app_.reset();
    }
}

void WebSocketServer::emit(const std::string& sessionId, const std::string& payload) {
    if (!loop_) {
        utils::Logger::warn("Dropping event for session " + sessionId + ": event loop not running");
        return;
    }

    std::weak_ptr<WebSocketServer> weak = weak_from_this();
    loop_->defer([weak, sessionId, payload]() {
        if (auto self = weak.lock()) {
            self->deliver(sessionId, payload);
        }
    });
}

void WebSocketServer::deliver(const std::string& sessionId, const std::string& payload) {
    auto wsIt = websockets_.find(sessionId);
    if (wsIt == websockets_.end()) {
        utils::Logger::debug("Dropping event for closed session " + sessionId + ": " + payload);
        return;
    }

    auto status = wsIt->second->send(payload, uWS::OpCode::TEXT);
    if (status == ServerWebSocket::SendStatus::DROPPED) {
        utils::Logger::warn("Event dropped by backpressure limit for session " + sessionId);
    } else {
        utils::Logger::debug("Sent JSON message to " + sessionId + ": " + payload);
    }
}

void WebSocketServer::handleNewConnection(ServerWebSocket* ws) {
    auto* data = ws->getUserData();
    data->sessionId = generateSessionId();
    utils::Logger::info("New client connection: " + data->sessionId);

    if (!sessions_->openSession(data->sessionId)) {
        utils::Logger::error("Could not register session " + data->sessionId + ", closing connection");
        ws->end(1011, "session registration failed");
        return;
    }
    websockets_[data->sessionId] = ws;
}

void WebSocketServer::handleMessage(const std::string& sessionId, std::string_view message) {
    utils::Logger::debug("JSON message from " + sessionId + ": " + std::string(message));
    sessions_->handleText(sessionId, std::string(message));
}

void WebSocketServer::handleBinaryMessage(const std::string& sessionId, std::string_view data) {
    utils::Logger::debug("Binary message from " + sessionId + ", size: " + std::to_string(data.size()));
    sessions_->handleBinary(sessionId, std::string(data));
}

void WebSocketServer::handleDisconnection(const std::string& sessionId, int code) {
    utils::Logger::info("Client disconnected: " + sessionId + " (code " + std::to_string(code) + ")");

    websockets_.erase(sessionId);
    sessions_->closeSession(sessionId);
}

} // namespace core
} // namespace livenotes
