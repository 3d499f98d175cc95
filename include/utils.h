#pragma once

#include <string>
#include <cctype>
#include <vector>

namespace avatar_tutor {

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

/**
 * @brief Check if string is empty or contains only whitespace
 * @param str String to check
 * @return True if string is empty or whitespace-only
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

/**
 * @brief Shorten text for log lines without splitting a UTF-8 sequence
 * @param str Text to shorten
 * @param max_bytes Maximum bytes kept before the ellipsis
 */
inline std::string preview(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) return str;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut) + "...";
}

/**
 * @brief Remove retrieval citation markers like "[doc1]" or "[doc12]"
 * @param str Text as delivered by a retrieval-augmented backend
 * @return Copy of str with every marker removed (surrounding text untouched)
 */
inline std::string remove_doc_references(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        if (str.compare(i, 4, "[doc") == 0) {
            size_t j = i + 4;
            while (j < str.size() && std::isdigit(static_cast<unsigned char>(str[j]))) {
                ++j;
            }
            if (j > i + 4 && j < str.size() && str[j] == ']') {
                i = j + 1;
                continue;
            }
        }
        out += str[i];
        ++i;
    }
    return out;
}

} // namespace utils

} // namespace avatar_tutor
