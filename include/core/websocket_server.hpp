#pragma once

#include "core/client_session.hpp"
#include "core/http_api.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Forward declarations for uWS types
namespace uWS {
    template<bool SSL> struct TemplatedApp;
    template<bool SSL, bool isServer, typename USERDATA> struct WebSocket;
    template<bool SSL> struct HttpResponse;
    struct HttpRequest;
    struct Loop;
    using App = TemplatedApp<false>;
}
struct us_listen_socket_t;

namespace livetranslate {

namespace mt {
class EngineRegistry;
}

namespace core {

// Per-socket data structure
struct PerSocketData {
    std::string sessionId;
};

using ServerWebSocket = uWS::WebSocket<false, true, PerSocketData>;

/**
 * uWebSockets front end: the /ws/translate socket plus the HTTP API.
 *
 * Everything touching sockets runs on the event loop thread; sessions and
 * worker tasks hand their output back through Loop::defer.
 */
class WebSocketServer {
public:
    WebSocketServer(const utils::Config& config, SessionServices services,
                    std::shared_ptr<mt::EngineRegistry> registry);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Must be called on the thread that will call run()
    void start();
    void run();

    // Safe to call from any thread
    void stop();

    size_t getActiveSessionCount() const { return activeSessions_; }

    // Queue a text frame for a session; callable from any thread
    void sendMessage(const std::string& sessionId, const std::string& message);

private:
    utils::Config config_;
    SessionServices services_;
    std::shared_ptr<mt::EngineRegistry> registry_;
    HttpApi api_;

    std::unique_ptr<uWS::App> app_;
    us_listen_socket_t* listenSocket_;

    // Guards loop_ and running_ for cross-thread deferral
    std::mutex loopMutex_;
    uWS::Loop* loop_;
    bool running_;

    // Loop thread only
    std::unordered_map<std::string, std::shared_ptr<ClientSession>> sessions_;
    std::unordered_map<std::string, ServerWebSocket*> websockets_;
    std::atomic<size_t> activeSessions_;

    // Disconnected sessions whose generation is still winding down
    std::vector<std::shared_ptr<ClientSession>> closingSessions_;

    std::string generateSessionId();
    bool defer(std::function<void()> task);

    void handleNewConnection(ServerWebSocket* ws);
    void handleMessage(const std::string& sessionId, const std::string& message);
    void handleBinaryMessage(const std::string& sessionId, std::string_view data);
    void handleDisconnection(const std::string& sessionId);

    // HTTP endpoint handlers
    void handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);
    void handleDetectLanguage(uWS::HttpResponse<false>* res, const std::string& body);
    void handleTranslate(uWS::HttpResponse<false>* res, const std::string& body,
                         std::shared_ptr<std::atomic<bool>> aborted);
    void readBody(uWS::HttpResponse<false>* res,
                  std::function<void(uWS::HttpResponse<false>*, const std::string&,
                                     std::shared_ptr<std::atomic<bool>>)> handler);
};

} // namespace core
} // namespace livetranslate
