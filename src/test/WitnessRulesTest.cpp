#include <cassert>
#include <iostream>

#include "domain/rules/WitnessRules.hpp"
#include "TestFixtures.hpp"

using namespace casefile::domain;
using namespace casefile::domain::rules;
using namespace casefile::test;

namespace {

void TestToneAdjustsTrust() {
    std::cout << "[Test] Question tone moves trust..." << std::endl;
    assert(WitnessRules::trustDelta("You are lying to me.") == WitnessRules::kAggressivePenalty);
    assert(WitnessRules::trustDelta("Please, tell me what you saw.") == WitnessRules::kEmpatheticBonus);
    assert(WitnessRules::trustDelta("Where were you at nine?") == 0);
    // Aggressive wording wins when both appear.
    assert(WitnessRules::trustDelta("Please just ADMIT it.") == WitnessRules::kAggressivePenalty);

    const CaseDefinition def = MakeCeilingCase();
    PlayerState state = NewCeilingGame(def);
    const Witness& hannah = *def.findWitness("hannah");
    assert(WitnessRules::currentTrust(hannah, state) == 60);
    state.adjustTrust("hannah", -65, hannah.baseTrust);
    assert(WitnessRules::currentTrust(hannah, state) == 0);
    std::cout << "[PASS] Aggressive -10, empathetic +5, clamped at zero." << std::endl;
}

void TestTriggerParsing() {
    std::cout << "[Test] Secret triggers parse into OR of AND groups..." << std::endl;
    auto either = WitnessRules::parseTrigger("evidence:e3 OR trust>80");
    assert(either.anyOf.size() == 2);
    assert(either.anyOf[0].size() == 1 && either.anyOf[0][0].kind == SecretCondition::Kind::Evidence);
    assert(either.anyOf[0][0].evidenceId == "e3");
    assert(either.anyOf[1][0].kind == SecretCondition::Kind::Trust);
    assert(either.anyOf[1][0].comparison == Comparison::Greater && either.anyOf[1][0].value == 80);

    auto both = WitnessRules::parseTrigger("evidence:e5 AND evidence_count>=3");
    assert(both.anyOf.size() == 1 && both.anyOf[0].size() == 2);
    assert(both.anyOf[0][1].kind == SecretCondition::Kind::EvidenceCount);
    assert(both.anyOf[0][1].comparison == Comparison::GreaterEqual && both.anyOf[0][1].value == 3);

    // Keywords are case-insensitive, spacing is free, ids keep their case.
    auto loose = WitnessRules::parseTrigger("Trust > 70 and EVIDENCE:Frost_Pattern");
    assert(loose.anyOf.size() == 1 && loose.anyOf[0].size() == 2);
    assert(loose.anyOf[0][0].value == 70);
    assert(loose.anyOf[0][1].evidenceId == "Frost_Pattern");

    std::vector<std::string> unparsed;
    auto partial = WitnessRules::parseTrigger("mood:happy OR trust=>5 OR trust<20", &unparsed);
    assert(partial.anyOf.size() == 1);
    assert(partial.anyOf[0][0].comparison == Comparison::Less);
    assert((unparsed == std::vector<std::string>{"mood:happy", "trust=>5"}));

    assert(WitnessRules::parseTrigger("").anyOf.empty());

    assert(WitnessRules::parseTrustCondition(" trust < 40 ")->value == 40);
    assert(!WitnessRules::parseTrustCondition("evidence:e1"));
    assert(!WitnessRules::parseTrustCondition("trust"));
    std::cout << "[PASS] Triggers and lie conditions parse." << std::endl;
}

void TestTriggerEvaluation() {
    std::cout << "[Test] Secret triggers evaluate against trust and evidence..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    const Witness& hannah = *def.findWitness("hannah");
    const Witness& draco = *def.findWitness("draco");
    const SecretTrigger& s1 = hannah.secrets[0].trigger;
    const SecretTrigger& s2 = draco.secrets[0].trigger;

    PlayerState state = NewCeilingGame(def);
    assert(!WitnessRules::evaluate(s1, 60, state));
    assert(!WitnessRules::evaluate(s1, 80, state));
    assert(WitnessRules::evaluate(s1, 81, state));

    PlayerState withWand = state;
    withWand.addEvidence("e3");
    assert(WitnessRules::evaluate(s1, 0, withWand));

    PlayerState three = state;
    three.addEvidence("e1");
    three.addEvidence("e2");
    three.addEvidence("e3");
    assert(!WitnessRules::evaluate(s2, 50, three));
    three.addEvidence("e5");
    assert(WitnessRules::evaluate(s2, 50, three));
    PlayerState onlyScorch = state;
    onlyScorch.addEvidence("e5");
    assert(!WitnessRules::evaluate(s2, 50, onlyScorch));

    assert(!WitnessRules::evaluate(SecretTrigger{}, 100, three));
    std::cout << "[PASS] OR of AND groups, strict trust thresholds, empty never fires." << std::endl;

    assert(WitnessRules::availableSecrets(hannah, 60, withWand).size() == 1);
    withWand.revealSecret("hannah", "s1");
    assert(!withWand.revealSecret("hannah", "s1"));
    assert(WitnessRules::availableSecrets(hannah, 60, withWand).empty());
    std::cout << "[PASS] Revealed secrets are not offered again." << std::endl;
}

void TestLies() {
    std::cout << "[Test] Witnesses lie on topics while trust is low..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    const Witness& draco = *def.findWitness("draco");

    auto lie = WitnessRules::shouldLie(draco, "Were you on the BALCONY?", 30);
    assert(lie && lie->response == "I was in the library all evening. Ask anyone.");
    assert(WitnessRules::shouldLie(draco, "Whose wand is this?", 39));
    assert(!WitnessRules::shouldLie(draco, "Were you on the balcony?", 40));
    assert(!WitnessRules::shouldLie(draco, "What did you have for dinner?", 10));
    assert(!WitnessRules::shouldLie(*def.findWitness("hannah"), "Were you on the balcony?", 0));
    std::cout << "[PASS] Lies need both the trust condition and a topic." << std::endl;
}

void TestEvidencePresentation() {
    std::cout << "[Test] Evidence presentation is detected..." << std::endl;
    assert(*WitnessRules::detectEvidencePresentation("I show the wand to her") == "wand");
    assert(*WitnessRules::detectEvidencePresentation("Present LETTER") == "letter");
    assert(*WitnessRules::detectEvidencePresentation("reveal the register, then wait") == "register");
    // "show" is checked before "give".
    assert(*WitnessRules::detectEvidencePresentation("give the letter and show the wand") == "wand");
    assert(!WitnessRules::detectEvidencePresentation("Where were you at nine?"));
    assert(!WitnessRules::detectEvidencePresentation("show"));
    std::cout << "[PASS] Verb, optional article, then the clue word." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WitnessRules Test..." << std::endl;
    TestToneAdjustsTrust();
    TestTriggerParsing();
    TestTriggerEvaluation();
    TestLies();
    TestEvidencePresentation();
    std::cout << "[PASS] WitnessRules Test." << std::endl;
    return 0;
}
