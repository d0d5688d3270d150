#include "mt/mock_generation_engine.hpp"
#include "utils/string_utils.hpp"
#include <vector>
#include <thread>

namespace livetranslate {
namespace mt {

namespace {

bool isStrippable(char c) {
    return c == '.' || c == ',' || c == '!' || c == '?';
}

std::string stripPunctuation(const std::string& word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && isStrippable(word[begin])) {
        ++begin;
    }
    while (end > begin && isStrippable(word[end - 1])) {
        --end;
    }
    return word.substr(begin, end - begin);
}

} // namespace

MockGenerationEngine::MockGenerationEngine(std::chrono::milliseconds chunkDelay)
    : chunkDelay_(chunkDelay), ready_(false) {
}

bool MockGenerationEngine::initialize() {
    ready_ = true;
    return true;
}

bool MockGenerationEngine::isReady() const {
    return ready_;
}

const std::unordered_map<std::string, std::string>& MockGenerationEngine::table() {
    // "monde" is not mapped
    static const std::unordered_map<std::string, std::string> translations = {
        {"bonjour", "hello"},
        {"comment", "how"},
        {"allez", "are"},
        {"vous", "you"},
        {"je", "I"},
        {"suis", "am"},
        {"merci", "thank you"},
        {"oui", "yes"},
        {"non", "no"},
        {"bien", "well"},
        {"tres", "very"},
        {"aujourd'hui", "today"}
    };
    return translations;
}

std::string MockGenerationEngine::translate(const std::string& text) {
    std::string result;
    for (const auto& word : utils::splitWords(utils::toLowerAscii(text))) {
        if (!result.empty()) {
            result += ' ';
        }
        auto it = table().find(stripPunctuation(word));
        if (it != table().end()) {
            result += it->second;
        } else {
            result += "[" + word + "]";
        }
    }
    return result;
}

std::string MockGenerationEngine::generate(const std::string& text) {
    return translate(text);
}

void MockGenerationEngine::generateStreaming(const std::string& text, const TokenCallback& onToken) {
    for (const auto& word : utils::splitWords(translate(text))) {
        if (!onToken(word + " ")) {
            return;
        }
        if (chunkDelay_.count() > 0) {
            std::this_thread::sleep_for(chunkDelay_);
        }
    }
}

} // namespace mt
} // namespace livetranslate
