#include "mt/language_classifier.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <vector>

namespace livetranslate {
namespace mt {

LanguageClassifier::LanguageClassifier(std::shared_ptr<LanguageDetector> detector,
                                       const std::string& targetLanguage)
    : detector_(std::move(detector)), targetLanguage_(targetLanguage) {
}

const std::unordered_set<std::string>& LanguageClassifier::lexicon() {
    static const std::unordered_set<std::string> words = {
        "je", "tu", "il", "elle", "nous", "vous", "ils", "elles",
        "le", "la", "les", "un", "une", "des", "de", "du",
        "est", "sont", "suis", "es", "sommes", "etes",
        "bonjour", "merci", "oui", "non", "avec", "pour",
        "que", "qui", "quoi", "comment", "pourquoi", "ou"
    };
    return words;
}

DetectionResult LanguageClassifier::classify(const std::string& text) const {
    if (!detector_ || !detector_->isInitialized()) {
        return classifyWithFallback(text);
    }

    try {
        std::vector<LanguageCandidate> candidates = detector_->detectLanguages(text);

        DetectionResult result;
        result.text = text;
        result.method = "statistical";
        if (!candidates.empty()) {
            result.detectedLanguage = candidates.front().language;
        }

        for (const auto& candidate : candidates) {
            if (candidate.language == targetLanguage_) {
                result.isTargetLanguage = true;
                result.confidence = std::max(0.0f, std::min(1.0f, candidate.probability));
                break;
            }
        }
        return result;
    } catch (const std::exception& e) {
        utils::Logger::debug("Statistical detection unavailable, using lexicon: " + std::string(e.what()));
        return classifyWithFallback(text);
    }
}

DetectionResult LanguageClassifier::classifyWithFallback(const std::string& text) const {
    std::vector<std::string> tokens = utils::splitWords(utils::toLowerAscii(text));
    size_t total = tokens.size();
    size_t hits = 0;
    for (const auto& token : tokens) {
        if (lexicon().count(token) > 0) {
            hits++;
        }
    }

    DetectionResult result;
    result.text = text;
    result.method = "lexical_fallback";
    result.confidence = static_cast<float>(hits) / static_cast<float>(std::max<size_t>(total, 1));
    result.isTargetLanguage = result.confidence > kFallbackThreshold;
    return result;
}

} // namespace mt
} // namespace livetranslate
