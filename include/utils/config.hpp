#pragma once

#include <cstddef>
#include <string>

namespace livetranslate {
namespace utils {

class JsonValue;

class Config {
public:
    // Loads a JSON config file; a missing or malformed file yields defaults.
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& jsonContent);
    static Config defaults() { return Config(); }

    // USE_MOCK_TRANSLATOR and LIVETRANSLATE_MODEL_PATH
    void applyEnvironment();

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getLogLevel() const { return logLevel_; }
    bool useMock() const { return useMock_; }
    const std::string& getSourceLang() const { return sourceLang_; }
    const std::string& getTargetLang() const { return targetLang_; }
    const std::string& getModelPath() const { return modelPath_; }
    int getMaxNewTokens() const { return maxNewTokens_; }
    int getContextSize() const { return contextSize_; }
    int getGpuLayers() const { return gpuLayers_; }
    int getThreads() const { return threads_; }
    size_t getWorkerThreads() const { return workerThreads_; }
    size_t getQueueCapacity() const { return queueCapacity_; }
    int getGenerationTimeoutMs() const { return generationTimeoutMs_; }
    int getMockChunkDelayMs() const { return mockChunkDelayMs_; }
    bool serializeGeneration() const { return serializeGeneration_; }
    size_t getMaxPayloadBytes() const { return maxPayloadBytes_; }
    int getIdleTimeoutSeconds() const { return idleTimeoutSeconds_; }

    void setHost(const std::string& host) { host_ = host; }
    void setPort(int port) { port_ = port; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setUseMock(bool useMock) { useMock_ = useMock; }
    void setModelPath(const std::string& path) { modelPath_ = path; }
    void setGenerationTimeoutMs(int timeoutMs) { generationTimeoutMs_ = timeoutMs; }
    void setMockChunkDelayMs(int delayMs) { mockChunkDelayMs_ = delayMs; }

private:
    Config() = default;

    void applyJson(const JsonValue& root);

    std::string host_ = "0.0.0.0";
    int port_ = 8000;
    std::string logLevel_ = "INFO";
    bool useMock_ = false;
    std::string sourceLang_ = "fr";
    std::string targetLang_ = "en-US";
    std::string modelPath_ = "models/translategemma-4b-it.Q4_K_M.gguf";
    int maxNewTokens_ = 512;
    int contextSize_ = 2048;
    int gpuLayers_ = -1;
    int threads_ = 4;
    size_t workerThreads_ = 4;
    size_t queueCapacity_ = 64;
    int generationTimeoutMs_ = 120000;
    int mockChunkDelayMs_ = 100;
    bool serializeGeneration_ = true;
    size_t maxPayloadBytes_ = 64 * 1024;
    int idleTimeoutSeconds_ = 120;
};

} // namespace utils
} // namespace livetranslate
