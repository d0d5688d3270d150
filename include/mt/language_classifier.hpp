#pragma once

#include "mt/language_detector.hpp"
#include <memory>
#include <string>
#include <unordered_set>

namespace livetranslate {
namespace mt {

/**
 * Outcome of classifying one utterance against the target source language
 */
struct DetectionResult {
    std::string text;
    bool isTargetLanguage;
    float confidence;
    std::string detectedLanguage;  // top detector candidate, empty on fallback
    std::string method;            // "statistical" or "lexical_fallback"

    DetectionResult() : isTargetLanguage(false), confidence(0.0f) {}
};

/**
 * Decides whether text is written in the target language.
 *
 * The statistical detector is tried first. When it is missing, uninitialized
 * or throws, a fixed lexicon heuristic answers instead; classify() itself
 * never throws.
 */
class LanguageClassifier {
public:
    static constexpr float kFallbackThreshold = 0.3f;

    explicit LanguageClassifier(std::shared_ptr<LanguageDetector> detector,
                                const std::string& targetLanguage = "fr");

    DetectionResult classify(const std::string& text) const;

    // Deterministic lexicon score, exposed for callers that must skip the detector
    DetectionResult classifyWithFallback(const std::string& text) const;

    const std::string& getTargetLanguage() const { return targetLanguage_; }

private:
    std::shared_ptr<LanguageDetector> detector_;
    std::string targetLanguage_;

    static const std::unordered_set<std::string>& lexicon();
};

} // namespace mt
} // namespace livetranslate
