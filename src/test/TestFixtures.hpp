/**
 * @file TestFixtures.hpp
 * @brief In-memory case shared by the rule engine tests.
 */

#pragma once

#include <chrono>

#include "domain/CaseDefinition.hpp"
#include "domain/PlayerState.hpp"
#include "domain/rules/WitnessRules.hpp"

namespace casefile::test {

using namespace casefile::domain;

inline std::chrono::system_clock::time_point FixedTime() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
}

/**
 * The ceiling case: three locations, six evidence items, two tier-1 and
 * three tier-2 hypotheses. Culprit is "draco"; key evidence is e5 and e3.
 * Hannah keeps one secret (e3 or high trust); Draco keeps one (e5 and three
 * clues) and lies about the balcony while trust is under 40.
 */
inline CaseDefinition MakeCeilingCase() {
    CaseDefinition def;
    def.id = "ceiling";
    def.title = "The Ceiling Charm";
    def.difficulty = "beginner";
    def.investigationPoints = 12;
    def.startLocation = "study";

    Location study{"study", "Study", "A cramped study with a high vaulted ceiling.", {}};
    study.notPresent.push_back({"np-window", {"window"}, "The window is painted shut. Nobody came in that way."});
    Location library{"library", "Library", "Rows of dusty shelves.", {}};
    Location hall{"great_hall", "Great Hall", "Long tables, cold candles.", {}};
    def.locations = {study, library, hall};

    Evidence e1;
    e1.id = "e1";
    e1.locationId = "study";
    e1.name = "Torn letter";
    e1.description = "Half a letter signed with a D.";
    e1.triggers = {"desk", "letter"};
    e1.cost = 2;

    Evidence e2;
    e2.id = "e2";
    e2.locationId = "study";
    e2.name = "Muddy footprints";
    e2.description = "Prints leading to the fireplace.";
    e2.triggers = {"floor", "footprints"};
    e2.cost = 1;

    Evidence e5;
    e5.id = "e5";
    e5.locationId = "study";
    e5.name = "Scorch mark";
    e5.description = "A scorch mark on the ceiling, the shape of a disarming charm.";
    e5.triggers = {"look up", "examine ceiling"};
    e5.cost = 2;

    Evidence e3;
    e3.id = "e3";
    e3.locationId = "library";
    e3.name = "Hidden wand";
    e3.description = "A wand tucked behind a bookcase.";
    e3.triggers = {"shelf", "bookcase"};
    e3.cost = 3;

    Evidence e4;
    e4.id = "e4";
    e4.locationId = "library";
    e4.name = "Guest register";
    e4.description = "Hannah signed in at nine.";
    e4.triggers = {"register", "ledger"};
    e4.cost = 1;
    // Claims the spell (t3) came before Hannah arrived (t1); the timeline says otherwise.
    e4.impliesSequence = {{"t3", "t1"}};

    Evidence e6;
    e6.id = "e6";
    e6.locationId = "great_hall";
    e6.name = "Broken vase";
    e6.description = "Shards everywhere.";
    e6.triggers = {"vase"};
    e6.cost = 2;

    def.evidence = {e1, e2, e5, e3, e4, e6};

    Witness hannah{"hannah", "Hannah Abbott", 60, "To be believed", "Expulsion", false};
    Witness draco{"draco", "Draco Malfoy", 30, "Approval", "His father", false};
    Witness snape{"snape", "Professor Snape", 50, "", "", true};
    hannah.secrets.push_back({"s1", "I saw Draco on the balcony just before the crash.", "evidence:e3 OR trust>80",
                              rules::WitnessRules::parseTrigger("evidence:e3 OR trust>80")});
    draco.secrets.push_back({"s2", "Fine. I was on the balcony, but only to watch.", "evidence:e5 AND evidence_count>=3",
                             rules::WitnessRules::parseTrigger("evidence:e5 AND evidence_count>=3")});
    draco.lies.push_back({Comparison::Less, 40, {"balcony", "wand"}, "I was in the library all evening. Ask anyone."});
    def.witnesses = {hannah, draco, snape};

    Hypothesis h1{"h1", "Draco cast the charm", "", 1, std::nullopt};
    Hypothesis h2{"h2", "It was an accident", "", 1, std::nullopt};
    Hypothesis h3{"h3", "The spell came from above", "", 2,
                  Requirement::All({Requirement::Evidence("e5"),
                                    Requirement::Threshold(Metric::InvestigationPointsSpent, 6)})};
    // Depth 3 nesting: any_of(all_of(any_of(e3, e6), e4), evidenceCount >= 5)
    Hypothesis h4{"h4", "The wand was planted", "", 2,
                  Requirement::Any({Requirement::All({Requirement::Any({Requirement::Evidence("e3"),
                                                                        Requirement::Evidence("e6")}),
                                                      Requirement::Evidence("e4")}),
                                    Requirement::Threshold(Metric::EvidenceCount, 5)})};
    Hypothesis h5{"h5", "The letter was forged", "", 2, Requirement::Evidence("e1")};
    def.hypotheses = {h1, h2, h3, h4, h5};

    def.contradictions = {{"c1", "e1", "e4", "The letter and the register disagree about who was here."}};

    def.timeline = {{"t1", "21:00", "Hannah arrives"},
                    {"t2", "21:30", "Lights go out"},
                    {"t3", "22:00", "The charm is cast"}};

    Solution& s = def.solution;
    s.culprit = "draco";
    s.method = "Disarming charm cast from the balcony";
    s.motive = "Revenge";
    s.keyEvidence = {"e5", "e3"};
    s.commonMistakes["hannah"] = {"Hannah was in the room, but she never had her wand.",
                                  "Being present is not the same as casting the spell."};
    s.fallacyExamples["confirmation_bias"] = "You only looked at what fit your first idea.";
    s.fallacyExamples["authority_bias"] = "A title is not an alibi, and not a motive either.";
    s.correlationPairs = {{"hannah", {"e2", "e4"}, {"e3"}}};
    return def;
}

inline PlayerState NewCeilingGame(const CaseDefinition& def, int maxAttempts = 10) {
    return PlayerState(def.id, def.startLocation, maxAttempts, def.investigationPoints);
}

} // namespace casefile::test
