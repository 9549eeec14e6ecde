/**
 * @file ContradictionTracker.hpp
 * @brief Detects evidence pairs that conflict once both are collected.
 */

#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"

namespace casefile::domain::rules {

class ContradictionTracker {
public:
    static bool isDiscovered(const Contradiction& contradiction, const PlayerState& state) {
        return state.hasDiscovered(contradiction.evidenceA) && state.hasDiscovered(contradiction.evidenceB);
    }

    /** @brief Contradictions whose evidence is complete but which are not yet recorded. */
    static std::vector<std::string> findNewlyDiscovered(const std::vector<Contradiction>& contradictions,
                                                        const PlayerState& state) {
        std::vector<std::string> ids;
        const auto& known = state.discoveredContradictionIds();
        for (const auto& c : contradictions) {
            if (std::find(known.begin(), known.end(), c.id) != known.end()) continue;
            if (isDiscovered(c, state)) ids.push_back(c.id);
        }
        return ids;
    }

    /** @brief Percentage (0-100) of contradictions found; 100 when the case has none. */
    static int discoveryRate(const std::vector<Contradiction>& contradictions, const PlayerState& state) {
        if (contradictions.empty()) return 100;
        const double found = static_cast<double>(state.discoveredContradictionIds().size());
        return static_cast<int>(found * 100.0 / static_cast<double>(contradictions.size()) + 0.5);
    }
};

} // namespace casefile::domain::rules
