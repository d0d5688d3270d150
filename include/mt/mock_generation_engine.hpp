#pragma once

#include "mt/generation_engine.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <unordered_map>

namespace livetranslate {
namespace mt {

/**
 * Deterministic word-substitution engine for tests and offline runs.
 *
 * Known French words map through a small table; anything else is passed
 * through lower-cased and wrapped in brackets.
 */
class MockGenerationEngine : public GenerationEngine {
public:
    explicit MockGenerationEngine(std::chrono::milliseconds chunkDelay = std::chrono::milliseconds(100));

    bool initialize() override;
    bool isReady() const override;
    bool supportsStreaming() const override { return true; }

    std::string generate(const std::string& text) override;
    void generateStreaming(const std::string& text, const TokenCallback& onToken) override;

    std::string getName() const override { return "mock"; }

    /**
     * The substitution itself, without delays
     */
    static std::string translate(const std::string& text);

private:
    std::chrono::milliseconds chunkDelay_;
    std::atomic<bool> ready_;

    static const std::unordered_map<std::string, std::string>& table();
};

} // namespace mt
} // namespace livetranslate
