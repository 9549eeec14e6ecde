/**
 * @file PromptCatalog.hpp
 * @brief Central storage for narration system prompts.
 */

#pragma once

#include <string>

namespace casefile::infrastructure {

/**
 * @enum NarrationRole
 * @brief Voice the text-generation service speaks with.
 */
enum class NarrationRole {
    Mentor,   ///< Verdict feedback.
    Narrator, ///< Scene descriptions after player actions.
    Witness   ///< A witness answering the player.
};

class PromptCatalog {
public:
    /** @brief Returns the system prompt for a role. */
    static std::string GetSystemPrompt(NarrationRole role);
};

} // namespace casefile::infrastructure
