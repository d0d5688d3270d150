#pragma once

#include "core/client_session.hpp"
#include "utils/config.hpp"
#include "utils/json_utils.hpp"
#include <memory>
#include <string>

namespace livetranslate {

namespace mt {
class EngineRegistry;
}

namespace core {

/**
 * Status line plus JSON body of one HTTP response
 */
struct HttpReply {
    std::string status;
    utils::JsonValue body;

    HttpReply() = default;
    HttpReply(std::string s, utils::JsonValue b) : status(std::move(s)), body(std::move(b)) {}

    std::string serializeBody() const { return utils::JsonParser::stringify(body); }
};

struct TranslateRequest {
    std::string text;
    std::string sourceLang;
    std::string targetLang;
};

/**
 * Request handling behind the HTTP routes, independent of the socket layer.
 * Error replies carry {"detail": "..."}.
 */
class HttpApi {
public:
    HttpApi(const utils::Config& config, SessionServices services,
            std::shared_ptr<mt::EngineRegistry> registry);

    // GET /api/health
    HttpReply health(size_t activeSessions) const;

    // POST /api/detect-language
    HttpReply detectLanguage(const std::string& body) const;

    /**
     * Validate a POST /api/translate body.
     * @return false with `error` filled when the request is rejected
     */
    bool parseTranslateRequest(const std::string& body, TranslateRequest& request, HttpReply& error) const;

    // Runs the whole generation on the calling thread
    HttpReply translate(const TranslateRequest& request) const;

    static HttpReply errorReply(const std::string& status, const std::string& detail);

private:
    utils::Config config_;
    SessionServices services_;
    std::shared_ptr<mt::EngineRegistry> registry_;
};

} // namespace core
} // namespace livetranslate
