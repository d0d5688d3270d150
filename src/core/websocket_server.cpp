#include "core/websocket_server.hpp"
#include "core/task_queue.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <App.h>
#include <algorithm>
#include <random>
#include <sstream>
#include <vector>

namespace livetranslate {
namespace core {

namespace {

void writeReply(uWS::HttpResponse<false>* res, const HttpReply& reply) {
    res->writeStatus(reply.status)
       ->writeHeader("Content-Type", "application/json")
       ->writeHeader("Cache-Control", "no-cache")
       ->end(reply.serializeBody());
}

} // namespace

WebSocketServer::WebSocketServer(const utils::Config& config, SessionServices services,
                                 std::shared_ptr<mt::EngineRegistry> registry)
    : config_(config)
    , services_(std::move(services))
    , registry_(std::move(registry))
    , api_(config_, services_, registry_)
    , listenSocket_(nullptr)
    , loop_(nullptr)
    , running_(false)
    , activeSessions_(0) {
}

WebSocketServer::~WebSocketServer() {
    stop();

    // Sessions hold the sink back into this server; let their pumps finish first
    for (auto& entry : sessions_) {
        entry.second->close();
        closingSessions_.push_back(entry.second);
    }
    sessions_.clear();
    for (auto& session : closingSessions_) {
        session->waitForGeneration();
    }
    closingSessions_.clear();
}

std::string WebSocketServer::generateSessionId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
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
    utils::Logger::info("Starting WebSocket server on " + config_.getHost() + ":" +
                        std::to_string(config_.getPort()));

    app_ = std::make_unique<uWS::App>();

    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        loop_ = uWS::Loop::get();
        running_ = true;
    }

    app_->ws<PerSocketData>("/ws/translate", {
        .compression = uWS::DISABLED,
        .maxPayloadLength = static_cast<unsigned int>(config_.getMaxPayloadBytes()),
        .idleTimeout = static_cast<unsigned short>(config_.getIdleTimeoutSeconds()),
        .maxBackpressure = 1024 * 1024,
        .open = [this](auto* ws) {
            handleNewConnection(ws);
        },
        .message = [this](auto* ws, std::string_view message, uWS::OpCode opCode) {
            const std::string sessionId = ws->getUserData()->sessionId;
            if (opCode == uWS::OpCode::TEXT) {
                handleMessage(sessionId, std::string(message));
            } else if (opCode == uWS::OpCode::BINARY) {
                handleBinaryMessage(sessionId, message);
            }
        },
        .close = [this](auto* ws, int /*code*/, std::string_view /*message*/) {
            handleDisconnection(ws->getUserData()->sessionId);
        }
    });

    app_->get("/api/health", [this](auto* res, auto* req) {
        handleHealthCheck(res, req);
    });

    app_->post("/api/detect-language", [this](auto* res, auto* /*req*/) {
        readBody(res, [this](uWS::HttpResponse<false>* response, const std::string& body,
                             std::shared_ptr<std::atomic<bool>> /*aborted*/) {
            handleDetectLanguage(response, body);
        });
    });

    app_->post("/api/translate", [this](auto* res, auto* /*req*/) {
        readBody(res, [this](uWS::HttpResponse<false>* response, const std::string& body,
                             std::shared_ptr<std::atomic<bool>> aborted) {
            handleTranslate(response, body, aborted);
        });
    });
}

void WebSocketServer::run() {
    if (!app_) {
        utils::Logger::error("Server not started. Call start() first.");
        return;
    }

    app_->listen(config_.getHost(), config_.getPort(), [this](us_listen_socket_t* listenSocket) {
        if (listenSocket) {
            listenSocket_ = listenSocket;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(config_.getPort()));
        } else {
            utils::ErrorHandler::getInstance().reportError(
                utils::WebSocketException("Failed to listen on " + config_.getHost() + ":" +
                                          std::to_string(config_.getPort())),
                "WebSocketServer::run");
        }
    });

    if (listenSocket_ == nullptr) {
        std::lock_guard<std::mutex> lock(loopMutex_);
        running_ = false;
        return;
    }

    app_->run();

    {
        std::lock_guard<std::mutex> lock(loopMutex_);
        running_ = false;
    }
    utils::Logger::info("Event loop exited");
}

void WebSocketServer::stop() {
    std::lock_guard<std::mutex> lock(loopMutex_);
    if (!running_ || loop_ == nullptr) {
        return;
    }

    utils::Logger::info("Stopping WebSocket server");
    running_ = false;

    // Closing the listen socket and every connection lets run() return
    loop_->defer([this]() {
        if (listenSocket_) {
            us_listen_socket_close(0, listenSocket_);
            listenSocket_ = nullptr;
        }
        std::vector<ServerWebSocket*> open;
        for (const auto& entry : websockets_) {
            open.push_back(entry.second);
        }
        for (auto* ws : open) {
            ws->end(1001, "Server shutting down");
        }
    });
}

bool WebSocketServer::defer(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(loopMutex_);
    if (!running_ || loop_ == nullptr) {
        return false;
    }
    loop_->defer(std::move(task));
    return true;
}

void WebSocketServer::sendMessage(const std::string& sessionId, const std::string& message) {
    bool queued = defer([this, sessionId, message]() {
        auto wsIt = websockets_.find(sessionId);
        if (wsIt != websockets_.end()) {
            auto status = wsIt->second->send(message, uWS::OpCode::TEXT);
            if (status == ServerWebSocket::DROPPED) {
                utils::ErrorHandler::getInstance().reportError(
                    utils::WebSocketException("Outbound message dropped under backpressure", sessionId),
                    "WebSocketServer::sendMessage");
            }
        } else {
            utils::Logger::debug("Dropping message for closed session: " + sessionId);
        }
    });
    if (!queued) {
        utils::Logger::debug("Server stopped, dropping message for session " + sessionId);
    }
}

void WebSocketServer::handleNewConnection(ServerWebSocket* ws) {
    std::string sessionId = generateSessionId();
    ws->getUserData()->sessionId = sessionId;

    auto session = std::make_shared<ClientSession>(sessionId, services_);
    session->setEventSink([this, sessionId](const std::string& payload) {
        sendMessage(sessionId, payload);
    });

    sessions_[sessionId] = session;
    websockets_[sessionId] = ws;
    activeSessions_ = sessions_.size();

    utils::Logger::info("New client connection: " + sessionId + ". Total active sessions: " +
                        std::to_string(sessions_.size()));
}

void WebSocketServer::handleMessage(const std::string& sessionId, const std::string& message) {
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
        it->second->handleMessage(message);
    } else {
        utils::Logger::warn("Message from unknown session: " + sessionId);
    }
}

void WebSocketServer::handleBinaryMessage(const std::string& sessionId, std::string_view data) {
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
        it->second->handleBinaryMessage(data);
    } else {
        utils::Logger::warn("Binary message from unknown session: " + sessionId);
    }
}

void WebSocketServer::handleDisconnection(const std::string& sessionId) {
    utils::Logger::info("Client disconnected: " + sessionId);

    closingSessions_.erase(std::remove_if(closingSessions_.begin(), closingSessions_.end(),
                                          [](const std::shared_ptr<ClientSession>& session) {
                                              return !session->isGenerating();
                                          }),
                           closingSessions_.end());

    auto sessionIt = sessions_.find(sessionId);
    if (sessionIt != sessions_.end()) {
        sessionIt->second->close();
        if (sessionIt->second->isGenerating()) {
            closingSessions_.push_back(sessionIt->second);
        }
        sessions_.erase(sessionIt);
    }
    websockets_.erase(sessionId);
    activeSessions_ = sessions_.size();

    utils::Logger::info("Session removed. Remaining active sessions: " + std::to_string(sessions_.size()));
}

void WebSocketServer::readBody(uWS::HttpResponse<false>* res,
                               std::function<void(uWS::HttpResponse<false>*, const std::string&,
                                                  std::shared_ptr<std::atomic<bool>>)> handler) {
    auto body = std::make_shared<std::string>();
    auto aborted = std::make_shared<std::atomic<bool>>(false);
    const size_t limit = config_.getMaxPayloadBytes();

    res->onAborted([aborted]() {
        *aborted = true;
    });

    res->onData([res, body, aborted, limit, handler](std::string_view chunk, bool isLast) {
        if (*aborted) {
            return;
        }
        if (body->size() + chunk.size() > limit) {
            *aborted = true;
            writeReply(res, HttpApi::errorReply("413 Payload Too Large", "Request body too large"));
            return;
        }
        body->append(chunk.data(), chunk.size());
        if (isLast) {
            handler(res, *body, aborted);
        }
    });
}

void WebSocketServer::handleHealthCheck(uWS::HttpResponse<false>* res, uWS::HttpRequest* /*req*/) {
    writeReply(res, api_.health(sessions_.size()));
}

void WebSocketServer::handleDetectLanguage(uWS::HttpResponse<false>* res, const std::string& body) {
    writeReply(res, api_.detectLanguage(body));
}

void WebSocketServer::handleTranslate(uWS::HttpResponse<false>* res, const std::string& body,
                                      std::shared_ptr<std::atomic<bool>> aborted) {
    TranslateRequest request;
    HttpReply rejected;
    if (!api_.parseTranslateRequest(body, request, rejected)) {
        writeReply(res, rejected);
        return;
    }
    if (!services_.taskQueue) {
        writeReply(res, HttpApi::errorReply("503 Service Unavailable", "Translation service is not available"));
        return;
    }

    // Generation runs on a worker; the reply is written back on the loop thread
    bool queued = services_.taskQueue->enqueue([this, res, aborted, request]() {
        HttpReply reply = api_.translate(request);
        bool deferred = defer([res, aborted, reply]() {
            if (*aborted) {
                return;
            }
            res->cork([res, &reply]() {
                writeReply(res, reply);
            });
        });
        if (!deferred) {
            utils::Logger::warn("Server stopped before translation response could be sent");
        }
    }, TaskPriority::NORMAL);

    if (!queued) {
        writeReply(res, HttpApi::errorReply("503 Service Unavailable", "Server is shutting down"));
    }
}

} // namespace core
} // namespace livetranslate
