#include "core/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

namespace livetranslate {
namespace core {

namespace {

utils::JsonValue makeEnvelope(MessageType type) {
    utils::JsonValue root;
    root.setObject();
    root.setObjectProperty("type", utils::JsonValue(MessageProtocol::messageTypeToString(type)));
    return root;
}

} // namespace

std::string TranslationStartMessage::serialize() const {
    utils::JsonValue root = makeEnvelope(type_);
    root.setObjectProperty("original", utils::JsonValue(original_));
    return utils::JsonParser::stringify(root);
}

std::string TranslationChunkMessage::serialize() const {
    utils::JsonValue root = makeEnvelope(type_);
    root.setObjectProperty("chunk", utils::JsonValue(chunk_));
    return utils::JsonParser::stringify(root);
}

std::string TranslationEndMessage::serialize() const {
    utils::JsonValue root = makeEnvelope(type_);
    root.setObjectProperty("full_translation", utils::JsonValue(fullTranslation_));
    return utils::JsonParser::stringify(root);
}

std::string DetectionResultMessage::serialize() const {
    utils::JsonValue root = makeEnvelope(type_);
    root.setObjectProperty("text", utils::JsonValue(text_));
    root.setObjectProperty("is_french", utils::JsonValue(isFrench_));
    root.setObjectProperty("confidence", utils::JsonValue(confidence_));
    return utils::JsonParser::stringify(root);
}

std::string ErrorMessage::serialize() const {
    utils::JsonValue root = makeEnvelope(type_);
    root.setObjectProperty("message", utils::JsonValue(message_));
    return utils::JsonParser::stringify(root);
}

// MessageProtocol implementation
std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& json) {
    utils::JsonValue root;
    try {
        root = utils::JsonParser::parse(json);
    } catch (const std::exception& e) {
        utils::Logger::debug("Failed to parse message: " + std::string(e.what()));
        throw utils::InputException("Invalid JSON message");
    }

    if (!root.isObject()) {
        throw utils::InputException("Invalid message format");
    }

    std::string text;
    if (root.hasProperty("text")) {
        const utils::JsonValue& textValue = root.getProperty("text");
        if (textValue.isString()) {
            text = utils::trim(textValue.asString());
        } else if (!textValue.isNull()) {
            throw utils::InputException("Invalid message format: 'text' must be a string");
        }
    }

    if (text.empty()) {
        throw utils::InputException("Empty text received");
    }

    std::string typeStr = "null";
    if (root.hasProperty("type")) {
        const utils::JsonValue& typeValue = root.getProperty("type");
        typeStr = typeValue.isString() ? typeValue.asString() : utils::JsonParser::stringify(typeValue);
    }

    switch (stringToMessageType(typeStr)) {
        case MessageType::DETECT:
            return std::make_unique<DetectMessage>(text);
        case MessageType::TRANSLATE:
            return std::make_unique<TranslateMessage>(text);
        default:
            throw utils::InputException("Unknown message type: " + typeStr);
    }
}

MessageType MessageProtocol::getMessageType(const std::string& json) {
    try {
        utils::JsonValue root = utils::JsonParser::parse(json);

        if (!root.isObject() || !root.hasProperty("type") || !root.getProperty("type").isString()) {
            return MessageType::UNKNOWN;
        }

        return stringToMessageType(root.getProperty("type").asString());

    } catch (const std::exception& e) {
        utils::Logger::debug("Failed to get message type: " + std::string(e.what()));
        return MessageType::UNKNOWN;
    }
}

bool MessageProtocol::validateMessage(const std::string& json) {
    try {
        return parseMessage(json) != nullptr;
    } catch (const utils::InputException&) {
        return false;
    }
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "detect") return MessageType::DETECT;
    if (typeStr == "translate") return MessageType::TRANSLATE;
    if (typeStr == "translation_start") return MessageType::TRANSLATION_START;
    if (typeStr == "translation_chunk") return MessageType::TRANSLATION_CHUNK;
    if (typeStr == "translation_end") return MessageType::TRANSLATION_END;
    if (typeStr == "detection_result") return MessageType::DETECTION_RESULT;
    if (typeStr == "error") return MessageType::ERROR;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::DETECT: return "detect";
        case MessageType::TRANSLATE: return "translate";
        case MessageType::TRANSLATION_START: return "translation_start";
        case MessageType::TRANSLATION_CHUNK: return "translation_chunk";
        case MessageType::TRANSLATION_END: return "translation_end";
        case MessageType::DETECTION_RESULT: return "detection_result";
        case MessageType::ERROR: return "error";
        default: return "unknown";
    }
}

} // namespace core
} // namespace livetranslate
