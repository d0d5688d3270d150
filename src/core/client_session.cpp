#include "core/client_session.hpp"
#include "core/message_protocol.hpp"
#include "mt/generation_bridge.hpp"
#include "mt/language_classifier.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <system_error>

namespace livetranslate {
namespace core {

ClientSession::ClientSession(const std::string& sessionId, SessionServices services)
    : sessionId_(sessionId)
    , services_(std::move(services))
    , connected_(true)
    , generating_(false) {
    utils::Logger::info("Created session: " + sessionId_);
}

ClientSession::~ClientSession() {
    connected_ = false;
    if (pumpThread_.joinable()) {
        // The pump thread drops the last reference when nothing else holds the session
        if (pumpThread_.get_id() == std::this_thread::get_id()) {
            pumpThread_.detach();
        } else {
            pumpThread_.join();
        }
    }
    utils::Logger::info("Destroyed session: " + sessionId_);
}

void ClientSession::setEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    sink_ = std::move(sink);
}

void ClientSession::handleMessage(const std::string& message) {
    utils::Logger::debug("Session " + sessionId_ + " received JSON: " + message);

    if (!connected_) {
        utils::Logger::warn("Received message for disconnected session: " + sessionId_);
        return;
    }

    std::unique_ptr<Message> parsedMessage;
    try {
        parsedMessage = MessageProtocol::parseMessage(message);
    } catch (const utils::InputException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "ClientSession::handleMessage", sessionId_);
        sendError(e.what());
        return;
    }

    switch (parsedMessage->getType()) {
        case MessageType::DETECT:
            processDetectMessage(static_cast<const DetectMessage*>(parsedMessage.get()));
            break;
        case MessageType::TRANSLATE:
            processTranslateMessage(static_cast<const TranslateMessage*>(parsedMessage.get()));
            break;
        default:
            sendError("Unknown message type: " + MessageProtocol::messageTypeToString(parsedMessage->getType()));
            break;
    }
}

void ClientSession::handleBinaryMessage(std::string_view data) {
    utils::Logger::debug("Session " + sessionId_ + " received binary data: " +
                         std::to_string(data.size()) + " bytes");

    if (!connected_) {
        return;
    }

    sendError("Binary messages are not supported");
}

void ClientSession::processDetectMessage(const DetectMessage* message) {
    if (!services_.classifier) {
        sendError("Language detection is not available");
        return;
    }

    mt::DetectionResult result = services_.classifier->classify(message->getText());
    utils::Logger::debug("Session " + sessionId_ + " detection via " + result.method +
                         ": confidence " + std::to_string(result.confidence));

    sendMessage(DetectionResultMessage(message->getText(), result.isTargetLanguage, result.confidence));
}

void ClientSession::processTranslateMessage(const TranslateMessage* message) {
    bool expected = false;
    if (!generating_.compare_exchange_strong(expected, true)) {
        utils::ErrorHandler::getInstance().reportError(
            utils::ProtocolException("Translate request while a generation is active", sessionId_));
        sendError("Translation already in progress");
        return;
    }

    std::lock_guard<std::mutex> pumpLock(pumpMutex_);

    // The previous pump has returned the session to idle and may still be
    // writing its final event
    if (pumpThread_.joinable()) {
        pumpThread_.join();
    }

    sendMessage(TranslationStartMessage(message->getText()));

    if (!services_.bridge) {
        sendError("Translation failed: translation service is not available");
        generating_ = false;
        return;
    }

    std::shared_ptr<mt::ChunkStream> stream;
    try {
        stream = services_.bridge->generate(message->getText());
    } catch (const std::exception& e) {
        failToStart(e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(streamMutex_);
        activeStream_ = stream;
        // close() may have run between the flag check and here
        if (!connected_) {
            activeStream_->cancel();
        }
    }

    auto self = shared_from_this();
    try {
        pumpThread_ = std::thread([self, stream = std::move(stream)]() mutable {
            self->pumpGeneration(std::move(stream));
        });
    } catch (const std::system_error& e) {
        finishGeneration();
        failToStart(e.what());
    }
}

void ClientSession::failToStart(const std::string& reason) {
    utils::ErrorHandler::getInstance().reportError(
        utils::GenerationException(reason, "ClientSession::processTranslateMessage"),
        "ClientSession::processTranslateMessage", sessionId_);
    generating_ = false;
    sendError("Translation failed: " + reason);
}

void ClientSession::pumpGeneration(std::shared_ptr<mt::ChunkStream> stream) {
    std::unique_ptr<OutboundMessage> terminal;
    try {
        std::string chunk;
        while (stream->next(chunk)) {
            sendMessage(TranslationChunkMessage(chunk));
        }
        terminal = std::make_unique<TranslationEndMessage>(stream->getFullText());
    } catch (const std::exception& e) {
        if (connected_) {
            utils::ErrorHandler::getInstance().reportError(e, "ClientSession::pumpGeneration", sessionId_);
            terminal = std::make_unique<ErrorMessage>("Translation failed: " + std::string(e.what()));
        } else {
            utils::Logger::debug("Session " + sessionId_ + " generation ended after disconnect: " + e.what());
        }
    }

    // A finished producer has already pushed its last item, so the join is
    // immediate and the session is idle by the time the client sees the result
    bool producerDone = stream->isFinished();
    stream.reset();

    if (producerDone) {
        finishGeneration();
        if (terminal) {
            sendMessage(*terminal);
        }
    } else {
        // Timed out or cancelled: busy until the engine call has returned
        if (terminal) {
            sendMessage(*terminal);
        }
        finishGeneration();
    }
}

void ClientSession::finishGeneration() {
    std::shared_ptr<mt::ChunkStream> stream;
    {
        std::lock_guard<std::mutex> lock(streamMutex_);
        stream.swap(activeStream_);
    }
    if (stream) {
        stream->cancel();
    }
    // Last reference: joins the producer thread
    stream.reset();
    generating_ = false;
}

void ClientSession::waitForGeneration() {
    std::lock_guard<std::mutex> lock(pumpMutex_);
    if (pumpThread_.joinable()) {
        pumpThread_.join();
    }
}

void ClientSession::close() {
    if (!connected_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        sink_ = nullptr;
    }

    std::lock_guard<std::mutex> lock(streamMutex_);
    if (activeStream_) {
        utils::Logger::info("Session " + sessionId_ + " closed during generation, cancelling");
        activeStream_->cancel();
    }
}

void ClientSession::sendMessage(const OutboundMessage& message) {
    sendEvent(message.serialize());
}

void ClientSession::sendError(const std::string& message) {
    sendMessage(ErrorMessage(message));
}

void ClientSession::sendEvent(const std::string& payload) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!connected_ || !sink_) {
        utils::Logger::debug("Dropping event for disconnected session " + sessionId_);
        return;
    }
    utils::Logger::debug("Session " + sessionId_ + " sending JSON: " + payload);
    sink_(payload);
}

} // namespace core
} // namespace livetranslate
