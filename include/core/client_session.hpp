#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace livetranslate {

namespace mt {
class LanguageClassifier;
class GenerationBridge;
class ChunkStream;
}

namespace core {

// Forward declarations
class OutboundMessage;
class TaskQueue;
class DetectMessage;
class TranslateMessage;

/**
 * Shared collaborators handed to every session
 */
struct SessionServices {
    std::shared_ptr<mt::LanguageClassifier> classifier;
    std::shared_ptr<mt::GenerationBridge> bridge;
    std::shared_ptr<TaskQueue> taskQueue;  // one-shot HTTP work; sessions pump on their own threads
};

/**
 * One duplex connection.
 *
 * Idle until a translate request arrives; while a generation is running a
 * second translate request is rejected with an error event. Detection is
 * answered in any state. All outbound events go through a single writer,
 * so the order in which they reach the sink is the order they were produced.
 */
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    // Receives serialized outbound JSON events
    using EventSink = std::function<void(const std::string&)>;

    ClientSession(const std::string& sessionId, SessionServices services);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    void setEventSink(EventSink sink);

    const std::string& getSessionId() const { return sessionId_; }
    bool isConnected() const { return connected_; }
    bool isGenerating() const { return generating_; }

    // Message handling
    void handleMessage(const std::string& message);
    void handleBinaryMessage(std::string_view data);

    // Message sending
    void sendMessage(const OutboundMessage& message);
    void sendError(const std::string& message);

    /**
     * Transport went away: drop further output and cancel the active
     * generation without waiting for it.
     */
    void close();

    /**
     * Block until the pump thread of the last generation has exited.
     * Must not be called from a session event sink.
     */
    void waitForGeneration();

private:
    std::string sessionId_;
    SessionServices services_;

    std::atomic<bool> connected_;
    std::atomic<bool> generating_;

    std::mutex sendMutex_;
    EventSink sink_;

    std::mutex streamMutex_;
    std::shared_ptr<mt::ChunkStream> activeStream_;

    // Guards pumpThread_; never taken by the pump thread itself
    std::mutex pumpMutex_;
    std::thread pumpThread_;

    // Message processing
    void processDetectMessage(const DetectMessage* message);
    void processTranslateMessage(const TranslateMessage* message);

    // Runs on the generation's own thread until the stream terminates
    void pumpGeneration(std::shared_ptr<mt::ChunkStream> stream);
    void finishGeneration();
    void failToStart(const std::string& reason);

    void sendEvent(const std::string& payload);
};

} // namespace core
} // namespace livetranslate
