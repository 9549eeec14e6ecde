/**
 * @file TextMatching.hpp
 * @brief Case-insensitive phrase helpers shared by the rule engine.
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace casefile::domain::rules {

inline std::string ToLower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

inline std::string Trim(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

/**
 * @brief True if any non-empty needle occurs in the already-lowercased haystack.
 *
 * Empty needles never match.
 */
inline bool ContainsAnyLowered(const std::string& loweredHaystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (needle.empty()) continue;
        if (loweredHaystack.find(ToLower(needle)) != std::string::npos) return true;
    }
    return false;
}

/**
 * @brief Counts sentences by terminal punctuation.
 *
 * Text without a trailing terminator counts its last fragment as a sentence.
 */
inline int CountSentences(const std::string& text) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) return 0;

    int count = 0;
    for (char c : trimmed) {
        if (c == '.' || c == '!' || c == '?') ++count;
    }
    const char last = trimmed.back();
    if (last != '.' && last != '!' && last != '?') ++count;
    return count < 1 ? 1 : count;
}

inline int CountNonSpace(const std::string& text) {
    int n = 0;
    for (unsigned char c : text) {
        if (!std::isspace(c)) ++n;
    }
    return n;
}

} // namespace casefile::domain::rules
