/**
 * @file SnapshotCodec.cpp
 * @brief Implementation of SnapshotCodec.
 */

#include "infrastructure/SnapshotCodec.hpp"
#include "domain/Errors.hpp"

#include <cstdint>
#include <map>
#include <type_traits>

namespace casefile::infrastructure {

using json = nlohmann::json;
using namespace casefile::domain;

namespace {

// Raw clock ticks keep the round trip exact.
json EncodeTime(std::chrono::system_clock::time_point tp) {
    return static_cast<std::int64_t>(tp.time_since_epoch().count());
}

std::chrono::system_clock::time_point DecodeTime(const json& j) {
    return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(j.get<std::int64_t>()));
}

json EncodeCause(const UnlockCause& cause) {
    return std::visit([](auto&& c) -> json {
        using T = std::decay_t<decltype(c)>;
        json j = {{"type", T::Type}};
        if constexpr (std::is_same_v<T, EvidenceCause>) {
            j["evidence_id"] = c.evidenceId;
        } else if constexpr (std::is_same_v<T, ThresholdCause>) {
            j["metric"] = MetricToString(c.metric);
            j["value"] = c.value;
        }
        return j;
    }, cause);
}

UnlockCause DecodeCause(const json& j) {
    const std::string type = j.at("type").get<std::string>();
    if (type == EvidenceCause::Type) {
        return EvidenceCause{j.at("evidence_id").get<std::string>()};
    }
    if (type == ThresholdCause::Type) {
        auto metric = MetricFromString(j.at("metric").get<std::string>());
        if (!metric) throw PersistenceError("Unknown metric in unlock cause.");
        return ThresholdCause{*metric, j.at("value").get<int>()};
    }
    if (type == ManualUnlock::Type) {
        return ManualUnlock{};
    }
    throw PersistenceError("Unknown unlock cause type '" + type + "'.");
}

} // namespace

json SnapshotCodec::Encode(const PlayerState& state) {
    json events = json::array();
    for (const auto& e : state.unlockEvents()) {
        events.push_back({
            {"id", e.id},
            {"hypothesis_id", e.hypothesisId},
            {"cause", EncodeCause(e.cause)},
            {"timestamp", EncodeTime(e.timestamp)},
            {"acknowledged", e.acknowledged}
        });
    }

    json attempts = json::array();
    for (const auto& a : state.verdictAttempts()) {
        json fallacies = json::array();
        for (auto kind : a.fallacies) fallacies.push_back(FallacyToString(kind));
        attempts.push_back({
            {"accused_id", a.accusedId},
            {"reasoning", a.reasoning},
            {"cited_evidence_ids", a.citedEvidenceIds},
            {"correct", a.correct},
            {"score", a.score},
            {"fallacies", fallacies},
            {"timestamp", EncodeTime(a.timestamp)}
        });
    }

    return {
        {"version", kFormatVersion},
        {"case_id", state.caseId()},
        {"current_location", state.currentLocation()},
        {"visited_locations", state.visitedLocations()},
        {"discovered_evidence", state.discoveredEvidenceIds()},
        {"unlocked_hypotheses", state.unlockedHypothesisIds()},
        {"unlock_events", events},
        {"pending_notifications", state.pendingNotificationIds()},
        {"verdict_attempts", attempts},
        {"discovered_contradictions", state.discoveredContradictionIds()},
        {"witness_trust", state.witnessTrust()},
        {"revealed_secrets", state.revealedSecrets()},
        {"attempts_remaining", state.attemptsRemaining()},
        {"max_attempts", state.maxAttempts()},
        {"investigation_points_spent", state.investigationPointsSpent()},
        {"investigation_budget", state.investigationBudget()},
        {"case_status", CaseStatusToString(state.caseStatus())}
    };
}

std::string SnapshotCodec::EncodeToString(const PlayerState& state) {
    return Encode(state).dump(2);
}

PlayerState SnapshotCodec::Decode(const json& j) {
    try {
        if (j.at("version").get<int>() != kFormatVersion) {
            throw PersistenceError("Unsupported snapshot version " + j.at("version").dump() + ".");
        }

        const auto visited = j.at("visited_locations").get<std::vector<std::string>>();
        PlayerState state(j.at("case_id").get<std::string>(),
                          visited.empty() ? std::string() : visited.front(),
                          j.at("max_attempts").get<int>(),
                          j.at("investigation_budget").get<int>());

        for (const auto& loc : visited) state.moveTo(loc);
        state.moveTo(j.at("current_location").get<std::string>());

        for (const auto& id : j.at("discovered_evidence").get<std::vector<std::string>>()) {
            state.addEvidence(id);
        }
        state.spendInvestigationPoints(j.at("investigation_points_spent").get<int>());

        for (const auto& ej : j.at("unlock_events")) {
            UnlockEvent evt;
            evt.id = ej.at("id").get<std::string>();
            evt.hypothesisId = ej.at("hypothesis_id").get<std::string>();
            evt.cause = DecodeCause(ej.at("cause"));
            evt.timestamp = DecodeTime(ej.at("timestamp"));
            evt.acknowledged = ej.at("acknowledged").get<bool>();
            if (!state.recordUnlock(evt)) {
                throw PersistenceError("Hypothesis '" + evt.hypothesisId + "' unlocked twice.");
            }
        }

        for (const auto& aj : j.at("verdict_attempts")) {
            VerdictAttempt attempt;
            attempt.accusedId = aj.at("accused_id").get<std::string>();
            attempt.reasoning = aj.at("reasoning").get<std::string>();
            attempt.citedEvidenceIds = aj.at("cited_evidence_ids").get<std::vector<std::string>>();
            attempt.correct = aj.at("correct").get<bool>();
            attempt.score = aj.at("score").get<int>();
            for (const auto& f : aj.at("fallacies")) {
                auto kind = FallacyFromString(f.get<std::string>());
                if (!kind) throw PersistenceError("Unknown fallacy '" + f.get<std::string>() + "'.");
                attempt.fallacies.push_back(*kind);
            }
            attempt.timestamp = DecodeTime(aj.at("timestamp"));
            state.recordVerdictAttempt(attempt);
        }

        for (const auto& id : j.at("discovered_contradictions").get<std::vector<std::string>>()) {
            state.addContradiction(id);
        }
        for (const auto& [witnessId, trust] : j.at("witness_trust").get<std::map<std::string, int>>()) {
            state.adjustTrust(witnessId, trust - 50, 50);
        }
        // Absent in snapshots written before interrogation existed.
        if (j.contains("revealed_secrets")) {
            for (const auto& [witnessId, ids] : j.at("revealed_secrets").get<std::map<std::string, std::vector<std::string>>>()) {
                for (const auto& id : ids) state.revealSecret(witnessId, id);
            }
        }
        state.setCaseStatus(CaseStatusFromString(j.at("case_status").get<std::string>()));

        // Cross-check the counters the replay derived.
        if (state.attemptsRemaining() != j.at("attempts_remaining").get<int>()) {
            throw PersistenceError("attempts_remaining does not match the verdict history.");
        }
        if (state.pendingNotificationIds() != j.at("pending_notifications").get<std::vector<std::string>>()) {
            throw PersistenceError("pending_notifications does not match the unlock log.");
        }
        if (state.unlockedHypothesisIds() != j.at("unlocked_hypotheses").get<std::vector<std::string>>()) {
            throw PersistenceError("unlocked_hypotheses does not match the unlock log.");
        }
        return state;
    } catch (const json::exception& e) {
        throw PersistenceError(std::string("Corrupt snapshot: ") + e.what());
    }
}

PlayerState SnapshotCodec::DecodeFromString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw PersistenceError(std::string("Snapshot is not valid JSON: ") + e.what());
    }
    return Decode(j);
}

} // namespace casefile::infrastructure
