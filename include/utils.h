#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace lingo {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase copy (ASCII only)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Number of words in a partially built chunk
 *
 * Counts spaces, so a trailing word that is still being streamed is not counted
 * until the next separator arrives.
 */
inline int count_word_breaks(const std::string& text) {
    return static_cast<int>(std::count(text.begin(), text.end(), ' '));
}

/**
 * @brief True when the text (ignoring trailing whitespace) ends in . ? or !
 */
inline bool ends_with_sentence_punct(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return false;
    char c = text[end];
    return c == '.' || c == '?' || c == '!';
}

/**
 * @brief True when any of the needles occurs in the lowercased haystack
 */
inline bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    std::string lower = normalize_copy(haystack);
    for (const auto& needle : needles) {
        if (lower.find(needle) != std::string::npos) return true;
    }
    return false;
}

/**
 * @brief Decorative glyph ranges the synthesizer cannot voice
 */
inline bool is_disallowed_codepoint(uint32_t cp) {
    return (cp >= 0x1F300 && cp <= 0x1F6FF) ||
           (cp >= 0x1F900 && cp <= 0x1F9FF) ||
           (cp >= 0x1FA70 && cp <= 0x1FAFF) ||
           (cp >= 0x2700 && cp <= 0x27BF) ||
           cp == '*';
}

/**
 * @brief Strip emoji, dingbats and '*' from UTF-8 text
 *
 * Malformed sequences are copied through byte by byte.
 */
inline std::string strip_disallowed_symbols(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        uint32_t cp = c;
        if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            cp = c & 0x07;
        } else if (c >= 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if (c >= 0xC0) {
            len = 2;
            cp = c & 0x1F;
        }
        if (len > 1) {
            bool valid = i + len <= text.size();
            for (size_t k = 1; valid && k < len; ++k) {
                unsigned char cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }
            if (!valid) {
                out.push_back(text[i]);
                ++i;
                continue;
            }
        }
        if (!is_disallowed_codepoint(cp)) {
            out.append(text, i, len);
        }
        i += len;
    }
    return out;
}

} // namespace utils

} // namespace lingo
