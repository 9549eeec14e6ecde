/**
 * @file LocationCommandParser.cpp
 * @brief Implementation of LocationCommandParser.
 */

#include "domain/rules/LocationCommandParser.hpp"
#include "domain/rules/TextMatching.hpp"

#include <algorithm>
#include <cctype>

namespace casefile::domain::rules {

namespace {

const std::vector<std::string> kVerbs = {"go", "visit", "head", "travel", "walk", "move"};
const std::vector<std::string> kContextKeywords = {
    "go", "visit", "head", "travel", "walk", "move", "leave", "return", "back", "to"
};

std::vector<std::string> Words(const std::string& lowered) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : lowered) {
        if (std::isalnum(c) || c == '_' || c == '\'') {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

size_t MatchingCharacters(const std::string& a, size_t aLo, size_t aHi,
                          const std::string& b, size_t bLo, size_t bHi) {
    if (aLo >= aHi || bLo >= bHi) return 0;

    size_t bestLen = 0;
    size_t bestA = aLo;
    size_t bestB = bLo;
    std::vector<size_t> prev(bHi - bLo + 1, 0);
    std::vector<size_t> cur(bHi - bLo + 1, 0);
    for (size_t i = aLo; i < aHi; ++i) {
        for (size_t j = bLo; j < bHi; ++j) {
            const size_t col = j - bLo + 1;
            cur[col] = (a[i] == b[j]) ? prev[col - 1] + 1 : 0;
            if (cur[col] > bestLen) {
                bestLen = cur[col];
                bestA = i + 1 - bestLen;
                bestB = j + 1 - bestLen;
            }
        }
        std::swap(prev, cur);
        std::fill(cur.begin(), cur.end(), 0);
    }
    if (bestLen == 0) return 0;

    return bestLen +
           MatchingCharacters(a, aLo, bestA, b, bLo, bestB) +
           MatchingCharacters(a, bestA + bestLen, aHi, b, bestB + bestLen, bHi);
}

} // namespace

LocationCommandParser::LocationCommandParser(const std::vector<Location>& locations, double fuzzyThreshold)
    : m_threshold(fuzzyThreshold) {
    auto add = [this](const std::string& key, const std::string& id) {
        if (key.empty()) return;
        for (const auto& entry : m_lookup) {
            if (entry.first == key) return;
        }
        m_lookup.emplace_back(key, id);
    };

    for (const auto& loc : locations) {
        const std::string lowered = ToLower(loc.id);
        add(lowered, loc.id);
        std::string spaced = lowered;
        std::replace(spaced.begin(), spaced.end(), '_', ' ');
        add(spaced, loc.id);
        add(ToLower(Trim(loc.name)), loc.id);
    }
}

double LocationCommandParser::similarity(const std::string& a, const std::string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    const size_t matches = MatchingCharacters(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

std::optional<std::string> LocationCommandParser::parse(const std::string& inputText) const {
    const std::string lowered = ToLower(Trim(inputText));
    if (lowered.empty()) return std::nullopt;

    // Pattern 1: explicit "<verb> [to] [the] <one or two words>".
    const auto words = Words(lowered);
    for (size_t i = 0; i < words.size(); ++i) {
        if (std::find(kVerbs.begin(), kVerbs.end(), words[i]) == kVerbs.end()) continue;

        size_t t = i + 1;
        if (t < words.size() && words[t] == "to") ++t;
        if (t < words.size() && words[t] == "the") ++t;
        if (t >= words.size()) continue;

        if (t + 1 < words.size()) {
            if (auto hit = fuzzyMatch(words[t] + " " + words[t + 1])) return hit;
        }
        if (auto hit = fuzzyMatch(words[t])) return hit;
    }

    // Pattern 2: a known name mentioned after a navigation keyword.
    for (const auto& entry : m_lookup) {
        const size_t pos = lowered.find(entry.first);
        if (pos != std::string::npos && isCommandContext(lowered, pos)) {
            return entry.second;
        }
    }

    return std::nullopt;
}

std::optional<std::string> LocationCommandParser::fuzzyMatch(const std::string& target) const {
    for (const auto& entry : m_lookup) {
        if (entry.first == target) return entry.second;
    }

    std::optional<std::string> best;
    double bestRatio = 0.0;
    for (const auto& entry : m_lookup) {
        const double ratio = similarity(target, entry.first);
        if (ratio > bestRatio && ratio >= m_threshold) {
            bestRatio = ratio;
            best = entry.second;
        }
    }
    return best;
}

bool LocationCommandParser::isCommandContext(const std::string& loweredInput, size_t position) {
    if (position == 0) return false;
    const auto before = Words(loweredInput.substr(0, position));
    for (const auto& word : before) {
        if (std::find(kContextKeywords.begin(), kContextKeywords.end(), word) != kContextKeywords.end()) {
            return true;
        }
    }
    return false;
}

} // namespace casefile::domain::rules
