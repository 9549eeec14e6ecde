/**
 * @file LocationCommandParser.hpp
 * @brief Recognises navigation commands ("go to the library") in player input.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/CaseDefinition.hpp"

namespace casefile::domain::rules {

/**
 * @class LocationCommandParser
 * @brief Maps free text to a location id, tolerating small typos.
 *
 * Accepts "<verb> [to] [the] <name>" with verb in go/visit/head/travel/walk/move,
 * and falls back to a known location name preceded by a navigation keyword.
 */
class LocationCommandParser {
public:
    explicit LocationCommandParser(const std::vector<Location>& locations, double fuzzyThreshold = 0.75);

    /** @return The target location id, or nullopt when the input is not a navigation command. */
    std::optional<std::string> parse(const std::string& inputText) const;

    /** @brief Similarity 2*M/T where M counts characters in matching blocks. */
    static double similarity(const std::string& a, const std::string& b);

private:
    std::optional<std::string> fuzzyMatch(const std::string& target) const;
    static bool isCommandContext(const std::string& loweredInput, size_t position);

    std::vector<std::pair<std::string, std::string>> m_lookup; ///< lowered key -> location id
    double m_threshold;
};

} // namespace casefile::domain::rules
