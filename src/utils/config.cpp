#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace livetranslate {
namespace utils {

namespace {

bool parseBoolFlag(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "true" || lower == "1" || lower == "yes";
}

} // namespace

Config Config::load(const std::string& configPath) {
    Config config;

    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + configPath + ", using defaults");
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        config.applyJson(JsonParser::parse(buffer.str()));
        Logger::info("Loaded configuration from " + configPath);
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().reportError(ConfigurationException(e.what(), configPath), "Config::load");
        Logger::warn("Using default configuration");
        return Config();
    }

    return config;
}

Config Config::fromJson(const std::string& jsonContent) {
    Config config;
    config.applyJson(JsonParser::parse(jsonContent));
    return config;
}

void Config::applyJson(const JsonValue& root) {
    if (!root.isObject()) {
        throw ConfigurationException("configuration root must be an object");
    }

    host_ = root.getString("host", host_);
    port_ = static_cast<int>(root.getNumber("port", port_));
    logLevel_ = root.getString("log_level", logLevel_);
    useMock_ = root.getBool("use_mock", useMock_);
    sourceLang_ = root.getString("source_lang", sourceLang_);
    targetLang_ = root.getString("target_lang", targetLang_);
    modelPath_ = root.getString("model_path", modelPath_);
    maxNewTokens_ = static_cast<int>(root.getNumber("max_new_tokens", maxNewTokens_));
    contextSize_ = static_cast<int>(root.getNumber("context_size", contextSize_));
    gpuLayers_ = static_cast<int>(root.getNumber("gpu_layers", gpuLayers_));
    threads_ = static_cast<int>(root.getNumber("threads", threads_));
    workerThreads_ = static_cast<size_t>(std::max(1.0, root.getNumber("worker_threads", static_cast<double>(workerThreads_))));
    queueCapacity_ = static_cast<size_t>(std::max(1.0, root.getNumber("queue_capacity", static_cast<double>(queueCapacity_))));
    generationTimeoutMs_ = std::max(0, static_cast<int>(root.getNumber("generation_timeout_ms", generationTimeoutMs_)));
    mockChunkDelayMs_ = std::max(0, static_cast<int>(root.getNumber("mock_chunk_delay_ms", mockChunkDelayMs_)));
    serializeGeneration_ = root.getBool("serialize_generation", serializeGeneration_);
    maxPayloadBytes_ = static_cast<size_t>(std::max(1024.0, root.getNumber("max_payload_bytes", static_cast<double>(maxPayloadBytes_))));
    idleTimeoutSeconds_ = std::max(0, static_cast<int>(root.getNumber("idle_timeout_s", idleTimeoutSeconds_)));

    if (port_ <= 0 || port_ > 65535) {
        throw ConfigurationException("port out of range", std::to_string(port_));
    }
    if (maxNewTokens_ <= 0) {
        throw ConfigurationException("max_new_tokens must be positive", std::to_string(maxNewTokens_));
    }
}

void Config::applyEnvironment() {
    if (const char* mock = std::getenv("USE_MOCK_TRANSLATOR")) {
        useMock_ = parseBoolFlag(mock);
        Logger::info(std::string("USE_MOCK_TRANSLATOR=") + mock);
    }
    if (const char* modelPath = std::getenv("LIVETRANSLATE_MODEL_PATH")) {
        if (*modelPath != '\0') {
            modelPath_ = modelPath;
        }
    }
}

} // namespace utils
} // namespace livetranslate
