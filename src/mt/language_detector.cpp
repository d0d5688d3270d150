#include "mt/language_detector.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace livetranslate {
namespace mt {

namespace {

// Softmax temperature applied to the combined scores
constexpr float kSoftmaxSharpness = 12.0f;

constexpr float kWordWeight = 0.6f;
constexpr float kNgramWeight = 0.4f;

bool isWordByte(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    // Bytes of multi-byte UTF-8 sequences are kept as letters
    return uc >= 0x80 || std::isalnum(uc);
}

} // namespace

TextLanguageDetector::TextLanguageDetector()
    : initialized_(false) {
}

TextLanguageDetector::~TextLanguageDetector() {
    cleanup();
}

bool TextLanguageDetector::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return true;
    }

    if (supportedLanguages_.empty()) {
        supportedLanguages_ = {"en", "es", "fr", "de"};
    }

    loadCommonWords();
    loadNgrams();

    initialized_ = true;
    utils::Logger::info("Language detector initialized with " +
                        std::to_string(supportedLanguages_.size()) + " languages");
    return true;
}

void TextLanguageDetector::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    commonWords_.clear();
    ngrams_.clear();
    initialized_ = false;
}

bool TextLanguageDetector::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void TextLanguageDetector::setSupportedLanguages(const std::vector<std::string>& languages) {
    std::lock_guard<std::mutex> lock(mutex_);
    supportedLanguages_.clear();
    for (const auto& lang : languages) {
        if (lang == "en" || lang == "es" || lang == "fr" || lang == "de") {
            supportedLanguages_.push_back(lang);
        } else {
            utils::Logger::warn("No detection data for language '" + lang + "', ignoring");
        }
    }
}

std::vector<std::string> TextLanguageDetector::getSupportedLanguages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supportedLanguages_;
}

std::vector<LanguageCandidate> TextLanguageDetector::detectLanguages(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        throw utils::DetectionException("Language detector is not initialized");
    }

    std::string normalized = normalizeText(text);
    size_t letters = std::count_if(normalized.begin(), normalized.end(), isWordByte);
    if (normalized.length() < kMinTextLength || letters == 0) {
        throw utils::DetectionException("Text too short for statistical detection");
    }

    std::vector<std::string> words = extractWords(normalized);
    std::vector<std::string> ngrams = extractNgrams(words);

    std::vector<std::pair<std::string, float>> scores;
    float best = 0.0f;
    for (const std::string& lang : supportedLanguages_) {
        float wordScore = calculateCommonWordScore(words, lang);
        float ngramScore = calculateNgramScore(ngrams, lang);
        float combined = (wordScore * kWordWeight) + (ngramScore * kNgramWeight);
        scores.emplace_back(lang, combined);
        best = std::max(best, combined);
    }

    if (scores.empty() || best <= 0.0f) {
        throw utils::DetectionException("No language features found in text");
    }

    // Shift by the best score before exponentiating to keep exp() bounded
    float total = 0.0f;
    std::vector<float> weights;
    weights.reserve(scores.size());
    for (const auto& score : scores) {
        float w = std::exp(kSoftmaxSharpness * (score.second - best));
        weights.push_back(w);
        total += w;
    }

    std::vector<LanguageCandidate> candidates;
    for (size_t i = 0; i < scores.size(); ++i) {
        float probability = weights[i] / total;
        if (probability >= kReportThreshold) {
            candidates.emplace_back(scores[i].first, probability);
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const LanguageCandidate& a, const LanguageCandidate& b) {
                  return a.probability > b.probability;
              });

    return candidates;
}

float TextLanguageDetector::calculateCommonWordScore(const std::vector<std::string>& words,
                                                     const std::string& language) const {
    auto it = commonWords_.find(language);
    if (it == commonWords_.end() || words.empty()) {
        return 0.0f;
    }

    int matches = 0;
    for (const std::string& word : words) {
        if (it->second.count(word) > 0) {
            matches++;
        }
    }

    return static_cast<float>(matches) / words.size();
}

float TextLanguageDetector::calculateNgramScore(const std::vector<std::string>& ngrams,
                                                const std::string& language) const {
    auto it = ngrams_.find(language);
    if (it == ngrams_.end() || ngrams.empty()) {
        return 0.0f;
    }

    float score = 0.0f;
    for (const std::string& ngram : ngrams) {
        if (it->second.count(ngram) > 0) {
            // Trigrams are more telling than bigrams
            score += ngram.size() >= 3 ? 1.5f : 1.0f;
        }
    }

    return std::min(1.0f, score / ngrams.size());
}

std::string TextLanguageDetector::normalizeText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.length());

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (isWordByte(c)) {
            normalized += static_cast<char>(uc < 0x80 ? std::tolower(uc) : uc);
        } else if (std::isspace(uc) || std::ispunct(uc)) {
            normalized += ' ';
        }
    }

    // Collapse runs of spaces and trim
    std::string collapsed;
    collapsed.reserve(normalized.size());
    for (char c : normalized) {
        if (c == ' ' && (collapsed.empty() || collapsed.back() == ' ')) {
            continue;
        }
        collapsed += c;
    }
    if (!collapsed.empty() && collapsed.back() == ' ') {
        collapsed.pop_back();
    }

    return collapsed;
}

std::vector<std::string> TextLanguageDetector::extractWords(const std::string& normalized) {
    std::vector<std::string> words;
    std::istringstream iss(normalized);
    std::string word;

    while (iss >> word) {
        words.push_back(word);
    }

    return words;
}

std::vector<std::string> TextLanguageDetector::extractNgrams(const std::vector<std::string>& words) {
    std::vector<std::string> ngrams;

    for (const std::string& word : words) {
        for (size_t n = 2; n <= 3; ++n) {
            if (word.length() < n) {
                continue;
            }
            for (size_t i = 0; i + n <= word.length(); ++i) {
                ngrams.push_back(word.substr(i, n));
            }
        }
    }

    return ngrams;
}

void TextLanguageDetector::loadCommonWords() {
    commonWords_["en"] = {
        "the", "be", "to", "of", "and", "a", "in", "that", "have", "i",
        "it", "for", "not", "on", "with", "he", "as", "you", "do", "at",
        "this", "but", "his", "by", "from", "they", "we", "say", "her", "she",
        "or", "an", "will", "my", "one", "all", "would", "there", "their",
        "is", "are", "was", "were", "am", "what", "how", "very", "hello", "thank"
    };

    commonWords_["es"] = {
        "el", "la", "de", "que", "y", "a", "en", "un", "ser", "se",
        "no", "te", "lo", "le", "da", "su", "por", "son", "con", "para",
        "al", "una", "del", "las", "los", "me", "ya", "muy", "mi",
        "sin", "sobre", "este", "año", "cuando", "él", "más", "estado", "si",
        "es", "está", "yo", "pero", "como", "hola", "gracias"
    };

    commonWords_["fr"] = {
        "le", "la", "les", "de", "des", "du", "et", "à", "un", "une",
        "il", "elle", "je", "tu", "nous", "vous", "ils", "elles", "être", "avoir",
        "que", "qui", "pour", "dans", "ce", "cette", "son", "sur", "avec", "ne",
        "se", "pas", "tout", "plus", "par", "au", "aux", "bien", "très", "mais",
        "ou", "où", "lui", "comme", "est", "sont", "suis", "oui", "non", "merci", "bonjour"
    };

    commonWords_["de"] = {
        "der", "die", "und", "in", "den", "von", "zu", "das", "mit", "sich",
        "des", "auf", "für", "ist", "im", "dem", "nicht", "ein", "eine", "als",
        "auch", "es", "an", "werden", "aus", "er", "hat", "dass", "sie", "nach",
        "wird", "bei", "einer", "um", "am", "sind", "noch", "wie", "einem",
        "ich", "du", "wir", "bin", "hallo", "danke"
    };
}

void TextLanguageDetector::loadNgrams() {
    ngrams_["en"] = {
        "th", "he", "in", "er", "an", "ed", "nd", "to", "en", "ti",
        "the", "and", "ing", "ion", "tio", "her", "hat", "tha", "ere", "ith"
    };

    ngrams_["es"] = {
        "de", "la", "el", "en", "es", "ar", "er", "al", "or", "an",
        "que", "ent", "ion", "con", "ado", "los", "las", "par", "est", "nte"
    };

    ngrams_["fr"] = {
        "le", "de", "es", "en", "re", "er", "nt", "on", "te", "et",
        "ent", "les", "ion", "que", "ous", "ais", "ant", "eur", "vou", "oui"
    };

    ngrams_["de"] = {
        "en", "er", "ch", "te", "nd", "in", "ei", "ie", "st", "an",
        "der", "und", "ich", "ein", "den", "sch", "die", "cht", "ung", "gen"
    };
}

} // namespace mt
} // namespace livetranslate
