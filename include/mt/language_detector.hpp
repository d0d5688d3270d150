#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <mutex>

namespace livetranslate {
namespace mt {

/**
 * One ranked guess of a statistical detector
 */
struct LanguageCandidate {
    std::string language;
    float probability;

    LanguageCandidate() : probability(0.0f) {}
    LanguageCandidate(std::string lang, float prob) : language(std::move(lang)), probability(prob) {}
};

/**
 * Statistical language detector interface.
 *
 * detectLanguages() returns candidates sorted by probability (highest first)
 * and throws utils::DetectionException when the text cannot be classified.
 */
class LanguageDetector {
public:
    virtual ~LanguageDetector() = default;

    virtual std::vector<LanguageCandidate> detectLanguages(const std::string& text) = 0;
    virtual bool isInitialized() const = 0;
};

/**
 * Text-feature detector: common-word ratio plus character n-gram coverage,
 * turned into probabilities with a softmax.
 */
class TextLanguageDetector : public LanguageDetector {
public:
    static constexpr size_t kMinTextLength = 10;
    static constexpr float kReportThreshold = 0.1f;

    TextLanguageDetector();
    ~TextLanguageDetector() override;

    bool initialize();
    void cleanup();

    std::vector<LanguageCandidate> detectLanguages(const std::string& text) override;
    bool isInitialized() const override;

    // Only languages with built-in data are kept
    void setSupportedLanguages(const std::vector<std::string>& languages);
    std::vector<std::string> getSupportedLanguages() const;

private:
    std::vector<std::string> supportedLanguages_;
    bool initialized_;
    mutable std::mutex mutex_;

    std::unordered_map<std::string, std::unordered_set<std::string>> commonWords_;
    std::unordered_map<std::string, std::unordered_set<std::string>> ngrams_;

    void loadCommonWords();
    void loadNgrams();

    float calculateCommonWordScore(const std::vector<std::string>& words, const std::string& language) const;
    float calculateNgramScore(const std::vector<std::string>& ngrams, const std::string& language) const;

    static std::string normalizeText(const std::string& text);
    static std::vector<std::string> extractWords(const std::string& normalized);
    static std::vector<std::string> extractNgrams(const std::vector<std::string>& words);
};

} // namespace mt
} // namespace livetranslate
