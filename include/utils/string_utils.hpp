#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace livetranslate {
namespace utils {

/**
 * Byte length of the whitespace character starting at pos, 0 if none.
 * Besides ASCII whitespace this covers U+00A0 and U+202F, the no-break
 * spaces French typography puts before ! ? : ;
 */
inline size_t whitespaceLength(const std::string& text, size_t pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if (std::isspace(c)) {
        return 1;
    }
    if (text.compare(pos, 2, "\xC2\xA0") == 0) {
        return 2;
    }
    if (text.compare(pos, 3, "\xE2\x80\xAF") == 0) {
        return 3;
    }
    return 0;
}

// Byte length of the whitespace character ending just before end, 0 if none
inline size_t trailingWhitespaceLength(const std::string& text, size_t end) {
    if (end >= 1 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        return 1;
    }
    if (end >= 2 && text.compare(end - 2, 2, "\xC2\xA0") == 0) {
        return 2;
    }
    if (end >= 3 && text.compare(end - 3, 3, "\xE2\x80\xAF") == 0) {
        return 3;
    }
    return 0;
}

inline std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end) {
        size_t n = whitespaceLength(text, begin);
        if (n == 0) {
            break;
        }
        begin += n;
    }
    while (end > begin) {
        size_t n = trailingWhitespaceLength(text, end);
        if (n == 0) {
            break;
        }
        end -= n;
    }
    return text.substr(begin, end - begin);
}

// Words separated by runs of whitespace as understood by whitespaceLength()
inline std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t n = whitespaceLength(text, pos);
        if (n > 0) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
            pos += n;
        } else {
            current += text[pos++];
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

// ASCII only; UTF-8 continuation bytes pass through unchanged
inline std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/**
 * Length of the longest prefix of text that does not end inside a
 * multi-byte UTF-8 sequence.
 */
inline size_t utf8CompleteLength(const std::string& text) {
    size_t n = text.size();
    // A sequence is at most 4 bytes, so only the tail needs inspecting
    size_t start = n > 4 ? n - 4 : 0;
    for (size_t i = n; i > start; --i) {
        unsigned char c = static_cast<unsigned char>(text[i - 1]);
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        size_t expected = 1;
        if ((c & 0xE0) == 0xC0) {
            expected = 2;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
        }
        return (n - (i - 1) >= expected) ? n : i - 1;
    }
    return n;
}

} // namespace utils
} // namespace livetranslate
