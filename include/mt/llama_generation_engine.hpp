#pragma once

#include "mt/generation_engine.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace livetranslate {
namespace mt {

struct LlamaEngineConfig {
    std::string modelPath;
    std::string sourceLang = "fr";
    std::string targetLang = "en-US";
    int contextSize = 2048;
    int gpuLayers = -1;
    int threads = 4;
    int maxNewTokens = 512;
};

/**
 * TranslateGemma (GGUF) through llama.cpp with greedy decoding.
 *
 * One context is shared by all callers; generation calls are serialized
 * internally because a llama_context is not safe for concurrent decoding.
 */
class LlamaGenerationEngine : public GenerationEngine {
public:
    explicit LlamaGenerationEngine(LlamaEngineConfig config);
    ~LlamaGenerationEngine() override;

    LlamaGenerationEngine(const LlamaGenerationEngine&) = delete;
    LlamaGenerationEngine& operator=(const LlamaGenerationEngine&) = delete;

    bool initialize() override;
    bool isReady() const override;
    bool supportsStreaming() const override { return true; }

    std::string generate(const std::string& text) override;
    void generateStreaming(const std::string& text, const TokenCallback& onToken) override;

    std::string getName() const override { return "llama.cpp:" + config_.modelPath; }

    /**
     * Chat-formatted prompt for text, as fed to the tokenizer
     */
    std::string buildPrompt(const std::string& text) const;

private:
    std::vector<int32_t> tokenize(const std::string& text, bool addSpecial, bool parseSpecial) const;
    std::string tokenToPiece(int32_t token) const;
    void cleanup();

    LlamaEngineConfig config_;

    llama_model* model_ = nullptr;
    const llama_vocab* vocab_ = nullptr;
    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;

    mutable std::mutex mutex_;
};

} // namespace mt
} // namespace livetranslate
