#pragma once

#include <string>
#include <memory>
#include "utils/json_utils.hpp"

namespace livetranslate {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    DETECT,
    TRANSLATE,
    // Server to Client
    TRANSLATION_START,
    TRANSLATION_CHUNK,
    TRANSLATION_END,
    DETECTION_RESULT,
    ERROR
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }

protected:
    MessageType type_;
};

// Client to Server Messages

// Both inbound messages carry a single trimmed, non-empty text
class TextMessage : public Message {
public:
    TextMessage(MessageType type, const std::string& text) : Message(type), text_(text) {}

    const std::string& getText() const { return text_; }

private:
    std::string text_;
};

class DetectMessage : public TextMessage {
public:
    explicit DetectMessage(const std::string& text = "") : TextMessage(MessageType::DETECT, text) {}
};

class TranslateMessage : public TextMessage {
public:
    explicit TranslateMessage(const std::string& text = "") : TextMessage(MessageType::TRANSLATE, text) {}
};

// Server to Client Messages

// Anything the server writes to the socket
class OutboundMessage : public Message {
public:
    explicit OutboundMessage(MessageType type) : Message(type) {}

    virtual std::string serialize() const = 0;
};

class TranslationStartMessage : public OutboundMessage {
public:
    explicit TranslationStartMessage(const std::string& original)
        : OutboundMessage(MessageType::TRANSLATION_START), original_(original) {}

    const std::string& getOriginal() const { return original_; }
    std::string serialize() const override;

private:
    std::string original_;
};

class TranslationChunkMessage : public OutboundMessage {
public:
    explicit TranslationChunkMessage(const std::string& chunk)
        : OutboundMessage(MessageType::TRANSLATION_CHUNK), chunk_(chunk) {}

    const std::string& getChunk() const { return chunk_; }
    std::string serialize() const override;

private:
    std::string chunk_;
};

class TranslationEndMessage : public OutboundMessage {
public:
    explicit TranslationEndMessage(const std::string& fullTranslation)
        : OutboundMessage(MessageType::TRANSLATION_END), fullTranslation_(fullTranslation) {}

    const std::string& getFullTranslation() const { return fullTranslation_; }
    std::string serialize() const override;

private:
    std::string fullTranslation_;
};

class DetectionResultMessage : public OutboundMessage {
public:
    DetectionResultMessage(const std::string& text, bool isFrench, double confidence)
        : OutboundMessage(MessageType::DETECTION_RESULT), text_(text), isFrench_(isFrench), confidence_(confidence) {}

    const std::string& getText() const { return text_; }
    bool isFrench() const { return isFrench_; }
    double getConfidence() const { return confidence_; }

    std::string serialize() const override;

private:
    std::string text_;
    bool isFrench_;
    double confidence_;
};

class ErrorMessage : public OutboundMessage {
public:
    explicit ErrorMessage(const std::string& message)
        : OutboundMessage(MessageType::ERROR), message_(message) {}

    const std::string& getMessage() const { return message_; }
    std::string serialize() const override;

private:
    std::string message_;
};

// Message factory and parser
class MessageProtocol {
public:
    /**
     * Decode one inbound text frame into a DetectMessage or TranslateMessage.
     * Empty text is rejected before the type is looked at.
     * @throws utils::InputException describing the problem; its message is
     *         meant to be sent back to the client as-is
     */
    static std::unique_ptr<Message> parseMessage(const std::string& json);

    static MessageType getMessageType(const std::string& json);
    static bool validateMessage(const std::string& json);

    static std::string messageTypeToString(MessageType type);
    static MessageType stringToMessageType(const std::string& typeStr);
};

} // namespace core
} // namespace livetranslate
