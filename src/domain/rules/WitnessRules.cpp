/**
 * @file WitnessRules.cpp
 * @brief Implementation of WitnessRules.
 */

#include "domain/rules/WitnessRules.hpp"
#include "domain/rules/TextMatching.hpp"

#include <cctype>

namespace casefile::domain::rules {

namespace {

const std::vector<std::string> kAggressiveKeywords = {
    "lie", "lying", "liar", "accuse", "guilty", "did it",
    "admit", "confess", "know you", "hiding", "suspect", "criminal"
};
const std::vector<std::string> kEmpatheticKeywords = {
    "understand", "help", "remember", "tell me", "please", "sorry",
    "difficult", "must be hard", "appreciate", "thank", "trust", "believe"
};
const std::vector<std::string> kPresentationVerbs = {"show", "present", "give", "reveal"};

const std::string kEvidenceCountPrefix = "evidence_count";
const std::string kTrustPrefix = "trust";
const std::string kEvidencePrefix = "evidence:";

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(static_cast<char>(c));
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::vector<std::string> Words(const std::string& lowered) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : lowered) {
        if (IsWordChar(c)) {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

/** "<op><digits>" with nothing after. */
bool ParseComparison(const std::string& text, Comparison& op, int& value) {
    size_t pos = 0;
    while (pos < text.size() && (text[pos] == '<' || text[pos] == '>' || text[pos] == '=' || text[pos] == '!')) {
        ++pos;
    }
    const std::string symbol = text.substr(0, pos);
    if (symbol == "<") op = Comparison::Less;
    else if (symbol == "<=") op = Comparison::LessEqual;
    else if (symbol == ">") op = Comparison::Greater;
    else if (symbol == ">=") op = Comparison::GreaterEqual;
    else if (symbol == "==") op = Comparison::Equal;
    else if (symbol == "!=") op = Comparison::NotEqual;
    else return false;

    const std::string digits = text.substr(pos);
    if (digits.empty() || digits.size() > 9) return false;
    int parsed = 0;
    for (unsigned char c : digits) {
        if (!std::isdigit(c)) return false;
        parsed = parsed * 10 + (c - '0');
    }
    value = parsed;
    return true;
}

/** One condition with whitespace already removed. */
std::optional<SecretCondition> ParseCondition(const std::string& part) {
    const std::string lowered = ToLower(part);
    SecretCondition condition;

    // evidence_count before evidence: so the prefixes do not shadow each other.
    if (StartsWith(lowered, kEvidenceCountPrefix)) {
        condition.kind = SecretCondition::Kind::EvidenceCount;
        if (!ParseComparison(lowered.substr(kEvidenceCountPrefix.size()), condition.comparison, condition.value)) {
            return std::nullopt;
        }
        return condition;
    }
    if (StartsWith(lowered, kTrustPrefix)) {
        condition.kind = SecretCondition::Kind::Trust;
        if (!ParseComparison(lowered.substr(kTrustPrefix.size()), condition.comparison, condition.value)) {
            return std::nullopt;
        }
        return condition;
    }
    if (StartsWith(lowered, kEvidencePrefix)) {
        // Ids keep their case.
        const std::string rest = part.substr(kEvidencePrefix.size());
        size_t end = 0;
        while (end < rest.size() && IsWordChar(static_cast<unsigned char>(rest[end]))) ++end;
        if (end == 0 || end != rest.size()) return std::nullopt;
        condition.kind = SecretCondition::Kind::Evidence;
        condition.evidenceId = rest;
        return condition;
    }
    return std::nullopt;
}

bool Holds(const SecretCondition& condition, int trust, const PlayerState& state) {
    switch (condition.kind) {
        case SecretCondition::Kind::Trust:
            return Compare(trust, condition.comparison, condition.value);
        case SecretCondition::Kind::Evidence:
            return state.hasDiscovered(condition.evidenceId);
        case SecretCondition::Kind::EvidenceCount:
            return Compare(static_cast<int>(state.discoveredEvidenceIds().size()), condition.comparison, condition.value);
    }
    return false;
}

} // namespace

int WitnessRules::trustDelta(const std::string& question) {
    const std::string lowered = ToLower(question);
    if (ContainsAnyLowered(lowered, kAggressiveKeywords)) return kAggressivePenalty;
    if (ContainsAnyLowered(lowered, kEmpatheticKeywords)) return kEmpatheticBonus;
    return 0;
}

SecretTrigger WitnessRules::parseTrigger(const std::string& text, std::vector<std::string>* unparsed) {
    SecretTrigger trigger;
    std::vector<SecretCondition> group;
    std::string part;

    auto closePart = [&]() {
        if (part.empty()) return;
        if (auto condition = ParseCondition(part)) {
            group.push_back(*condition);
        } else if (unparsed) {
            unparsed->push_back(part);
        }
        part.clear();
    };
    auto closeGroup = [&]() {
        closePart();
        if (!group.empty()) trigger.anyOf.push_back(group);
        group.clear();
    };

    for (const auto& token : SplitWhitespace(text)) {
        const std::string lowered = ToLower(token);
        if (lowered == "or") {
            closeGroup();
        } else if (lowered == "and") {
            closePart();
        } else {
            // "trust > 70" reads the same as "trust>70".
            part += token;
        }
    }
    closeGroup();
    return trigger;
}

std::optional<SecretCondition> WitnessRules::parseTrustCondition(const std::string& text) {
    std::string compact;
    for (unsigned char c : text) {
        if (!std::isspace(c)) compact.push_back(static_cast<char>(c));
    }
    auto condition = ParseCondition(compact);
    if (!condition || condition->kind != SecretCondition::Kind::Trust) return std::nullopt;
    return condition;
}

bool WitnessRules::evaluate(const SecretTrigger& trigger, int trust, const PlayerState& state) {
    for (const auto& group : trigger.anyOf) {
        if (group.empty()) continue;
        bool all = true;
        for (const auto& condition : group) {
            if (!Holds(condition, trust, state)) {
                all = false;
                break;
            }
        }
        if (all) return true;
    }
    return false;
}

int WitnessRules::currentTrust(const Witness& witness, const PlayerState& state) {
    return state.trustFor(witness.id, witness.baseTrust);
}

std::vector<const WitnessSecret*> WitnessRules::availableSecrets(const Witness& witness,
                                                                 int trust,
                                                                 const PlayerState& state) {
    std::vector<const WitnessSecret*> available;
    for (const auto& secret : witness.secrets) {
        if (state.hasRevealedSecret(witness.id, secret.id)) continue;
        if (evaluate(secret.trigger, trust, state)) available.push_back(&secret);
    }
    return available;
}

std::optional<WitnessLie> WitnessRules::shouldLie(const Witness& witness, const std::string& question, int trust) {
    const std::string lowered = ToLower(question);
    for (const auto& lie : witness.lies) {
        if (!Compare(trust, lie.comparison, lie.trustThreshold)) continue;
        if (ContainsAnyLowered(lowered, lie.topics)) return lie;
    }
    return std::nullopt;
}

std::optional<std::string> WitnessRules::detectEvidencePresentation(const std::string& input) {
    const std::vector<std::string> words = Words(ToLower(input));
    for (const auto& verb : kPresentationVerbs) {
        for (size_t i = 0; i < words.size(); ++i) {
            if (words[i] != verb) continue;
            size_t next = i + 1;
            if (next < words.size() && words[next] == "the" && next + 1 < words.size()) ++next;
            if (next < words.size()) return words[next];
        }
    }
    return std::nullopt;
}

} // namespace casefile::domain::rules
