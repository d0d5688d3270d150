#include "core/http_api.hpp"
#include "mt/engine_registry.hpp"
#include "mt/generation_bridge.hpp"
#include "mt/language_classifier.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

namespace livetranslate {
namespace core {

namespace {

// Parses a request body into an object; throws InputException on bad input
utils::JsonValue parseRequestBody(const std::string& body) {
    utils::JsonValue root;
    try {
        root = utils::JsonParser::parse(body);
    } catch (const std::exception& e) {
        utils::Logger::debug("Rejected HTTP body: " + std::string(e.what()));
        throw utils::InputException("Invalid JSON body");
    }
    if (!root.isObject()) {
        throw utils::InputException("Request body must be a JSON object");
    }
    if (root.hasProperty("text") && !root.getProperty("text").isString()) {
        throw utils::InputException("Field 'text' must be a string");
    }
    return root;
}

} // namespace

HttpApi::HttpApi(const utils::Config& config, SessionServices services,
                 std::shared_ptr<mt::EngineRegistry> registry)
    : config_(config)
    , services_(std::move(services))
    , registry_(std::move(registry)) {
}

HttpReply HttpApi::errorReply(const std::string& status, const std::string& detail) {
    utils::JsonValue body;
    body.setObject();
    body.setObjectProperty("detail", utils::JsonValue(detail));
    return HttpReply(status, body);
}

HttpReply HttpApi::health(size_t activeSessions) const {
    utils::JsonValue body;
    body.setObject();
    body.setObjectProperty("status", utils::JsonValue("healthy"));
    body.setObjectProperty("mock_mode", utils::JsonValue(config_.useMock()));
    body.setObjectProperty("model_loaded", utils::JsonValue(registry_ != nullptr && registry_->isLoaded()));
    body.setObjectProperty("active_sessions", utils::JsonValue(static_cast<double>(activeSessions)));
    return HttpReply("200 OK", body);
}

HttpReply HttpApi::detectLanguage(const std::string& body) const {
    utils::JsonValue request;
    try {
        request = parseRequestBody(body);
    } catch (const utils::InputException& e) {
        return errorReply("400 Bad Request", e.what());
    }

    std::string text = request.getString("text", "");
    if (utils::trim(text).empty()) {
        return errorReply("400 Bad Request", "Text cannot be empty");
    }
    if (!services_.classifier) {
        return errorReply("503 Service Unavailable", "Language detection is not available");
    }

    mt::DetectionResult result = services_.classifier->classify(text);
    std::string detected = result.detectedLanguage;
    if (detected.empty()) {
        detected = result.isTargetLanguage ? services_.classifier->getTargetLanguage() : "unknown";
    }

    utils::JsonValue response;
    response.setObject();
    response.setObjectProperty("text", utils::JsonValue(text));
    response.setObjectProperty("detected_language", utils::JsonValue(detected));
    response.setObjectProperty("confidence", utils::JsonValue(static_cast<double>(result.confidence)));
    response.setObjectProperty("is_french", utils::JsonValue(result.isTargetLanguage));
    return HttpReply("200 OK", response);
}

bool HttpApi::parseTranslateRequest(const std::string& body, TranslateRequest& request, HttpReply& error) const {
    utils::JsonValue root;
    try {
        root = parseRequestBody(body);
    } catch (const utils::InputException& e) {
        error = errorReply("400 Bad Request", e.what());
        return false;
    }

    request.text = root.getString("text", "");
    if (utils::trim(request.text).empty()) {
        error = errorReply("400 Bad Request", "Text cannot be empty");
        return false;
    }
    if (!services_.bridge) {
        error = errorReply("503 Service Unavailable", "Translation service is not available");
        return false;
    }

    request.sourceLang = root.getString("source_lang", config_.getSourceLang());
    request.targetLang = root.getString("target_lang", config_.getTargetLang());
    return true;
}

HttpReply HttpApi::translate(const TranslateRequest& request) const {
    if (!services_.bridge) {
        return errorReply("503 Service Unavailable", "Translation service is not available");
    }

    try {
        std::string translation = services_.bridge->generateFull(request.text);

        utils::JsonValue response;
        response.setObject();
        response.setObjectProperty("original", utils::JsonValue(request.text));
        response.setObjectProperty("translation", utils::JsonValue(translation));
        response.setObjectProperty("source_lang", utils::JsonValue(request.sourceLang));
        response.setObjectProperty("target_lang", utils::JsonValue(request.targetLang));
        return HttpReply("200 OK", response);

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "POST /api/translate");
        return errorReply("500 Internal Server Error", e.what());
    }
}

} // namespace core
} // namespace livetranslate
