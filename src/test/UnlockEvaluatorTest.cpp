#include <cassert>
#include <iostream>
#include <variant>

#include "domain/rules/TriggerMatcher.hpp"
#include "domain/rules/UnlockEvaluator.hpp"
#include "TestFixtures.hpp"

using namespace casefile::domain;
using namespace casefile::domain::rules;
using namespace casefile::test;

namespace {

PlayerState Discover(const CaseDefinition& def, PlayerState state, const std::string& location, const std::string& input) {
    state.moveTo(location);
    auto match = TriggerMatcher::matchAction(def, state, input);
    assert(match.outcome == MatchOutcome::Discovered);
    return TriggerMatcher::applyMatch(def, state, match);
}

void TestThresholdGate() {
    std::cout << "[Test] AllOf evidence + points threshold..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    PlayerState state = Discover(def, NewCeilingGame(def), "study", "I look up at the ceiling");
    assert(state.investigationPointsSpent() == 2);

    auto scan = UnlockEvaluator::scanUnlocks(def, state, FixedTime());
    assert(!scan.state.isUnlocked("h3"));
    assert(scan.events.empty());

    PlayerState spent = scan.state;
    spent.spendInvestigationPoints(4);
    assert(spent.investigationPointsSpent() == 6);

    auto unlock = UnlockEvaluator::scanUnlocks(def, spent, FixedTime());
    assert(unlock.events.size() == 1);
    assert(unlock.events[0].hypothesisId == "h3");
    assert(unlock.events[0].id == "ceiling-evt-1");
    assert(unlock.events[0].timestamp == FixedTime());
    assert(!unlock.events[0].acknowledged);
    assert(unlock.state.isUnlocked("h3"));
    assert(unlock.state.isPending("ceiling-evt-1"));

    // The points crossed the line last, but e5 was the most recent discovery.
    const auto* cause = std::get_if<EvidenceCause>(&unlock.events[0].cause);
    assert(cause && cause->evidenceId == "e5");

    auto again = UnlockEvaluator::scanUnlocks(def, unlock.state, FixedTime());
    assert(again.events.empty());
    assert(again.state.unlockEvents().size() == 1);
    std::cout << "[PASS] h3 unlocks exactly once at six points." << std::endl;
}

void TestDeepNesting() {
    std::cout << "[Test] Nested any_of/all_of/any_of..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    const Hypothesis* h4 = def.findHypothesis("h4");
    assert(h4 && h4->requirement);

    PlayerState state = NewCeilingGame(def);
    assert(!UnlockEvaluator::isHypothesisUnlocked(*h4, state));

    state = Discover(def, state, "library", "search the bookcase");
    assert(UnlockEvaluator::isHypothesisUnlocked(*h4, state) == UnlockEvaluator::evaluate(*h4->requirement, state));
    assert(!UnlockEvaluator::isHypothesisUnlocked(*h4, state));

    state = Discover(def, state, "library", "read the register");
    assert(UnlockEvaluator::evaluate(*h4->requirement, state));
    assert(UnlockEvaluator::isHypothesisUnlocked(*h4, state));

    // The other branch: five pieces of evidence without e4.
    PlayerState wide = NewCeilingGame(def);
    wide = Discover(def, wide, "study", "read the letter");
    wide = Discover(def, wide, "study", "check the footprints");
    wide = Discover(def, wide, "study", "look up");
    wide = Discover(def, wide, "library", "search the shelf");
    assert(!UnlockEvaluator::evaluate(*h4->requirement, wide));
    wide = Discover(def, wide, "great_hall", "pick up the vase");
    assert(UnlockEvaluator::evaluate(*h4->requirement, wide));
    std::cout << "[PASS] Depth-3 requirement agrees with isHypothesisUnlocked." << std::endl;
}

void TestEmptyCombinators() {
    std::cout << "[Test] Empty combinators and unknown metrics..." << std::endl;
    PlayerState state("x", "a", 10, 12);
    assert(UnlockEvaluator::evaluate(Requirement::All({}), state));
    assert(!UnlockEvaluator::evaluate(Requirement::Any({}), state));

    ThresholdMet unknown;
    unknown.rawMetricName = "suspicionLevel";
    unknown.threshold = 0;
    assert(!UnlockEvaluator::evaluate(Requirement{unknown}, state));
    assert(!UnlockEvaluator::evaluate(Requirement::Evidence("nope"), state));

    state.spendInvestigationPoints(3);
    assert(UnlockEvaluator::metricValue(Metric::InvestigationProgress, state) == 25);
    assert(UnlockEvaluator::evaluate(Requirement::Threshold(Metric::InvestigationProgress, 25), state));
    std::cout << "[PASS] Fail-closed leaves behave." << std::endl;
}

void TestDepthLimit() {
    std::cout << "[Test] Excessive nesting fails closed..." << std::endl;
    Requirement req = Requirement::All({});
    for (int i = 0; i < UnlockEvaluator::kMaxDepth + 2; ++i) {
        req = Requirement::All({req});
    }
    PlayerState state("x", "a", 10, 12);
    assert(!UnlockEvaluator::evaluate(req, state));
    std::cout << "[PASS] Over-deep trees evaluate false." << std::endl;
}

void TestBatchAndContradiction() {
    std::cout << "[Test] Batch unlock and contradictions..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    PlayerState state = NewCeilingGame(def);
    // Letter (h5) and register+wand (h4) found before any scan.
    state = Discover(def, state, "study", "read the letter");
    state = Discover(def, state, "library", "search the shelf");
    state = Discover(def, state, "library", "read the ledger");

    auto scan = UnlockEvaluator::scanUnlocks(def, state, FixedTime());
    assert(scan.events.size() == 2);
    // Case order, sequential ids.
    assert(scan.events[0].hypothesisId == "h4" && scan.events[0].id == "ceiling-evt-1");
    assert(scan.events[1].hypothesisId == "h5" && scan.events[1].id == "ceiling-evt-2");
    assert(scan.state.pendingNotificationIds().size() == 2);

    assert(scan.newContradictionIds.size() == 1 && scan.newContradictionIds[0] == "c1");
    auto again = UnlockEvaluator::scanUnlocks(def, scan.state, FixedTime());
    assert(again.newContradictionIds.empty());
    assert(again.state.discoveredContradictionIds().size() == 1);
    std::cout << "[PASS] Batch unlock appends all events together." << std::endl;
}

void TestForceUnlock() {
    std::cout << "[Test] Manual unlock..." << std::endl;
    const CaseDefinition def = MakeCeilingCase();
    PlayerState state = NewCeilingGame(def);

    auto forced = UnlockEvaluator::forceUnlock(def, state, "h3", FixedTime());
    assert(forced.events.size() == 1);
    assert(std::holds_alternative<ManualUnlock>(forced.events[0].cause));

    auto twice = UnlockEvaluator::forceUnlock(def, forced.state, "h3", FixedTime());
    assert(twice.events.empty());
    assert(twice.state.unlockEvents().size() == 1);

    auto tierOne = UnlockEvaluator::forceUnlock(def, state, "h1", FixedTime());
    assert(tierOne.events.empty());
    auto unknown = UnlockEvaluator::forceUnlock(def, state, "h99", FixedTime());
    assert(unknown.events.empty());
    std::cout << "[PASS] Manual unlock is single-shot." << std::endl;
}

void TestOddTiers() {
    std::cout << "[Test] Unsupported tiers stay locked..." << std::endl;
    PlayerState state("x", "a", 10, 12);
    Hypothesis noReq{"hx", "", "", 2, std::nullopt};
    Hypothesis tier3{"hy", "", "", 3, Requirement::All({})};
    assert(!UnlockEvaluator::isHypothesisUnlocked(noReq, state));
    assert(!UnlockEvaluator::isHypothesisUnlocked(tier3, state));
    assert(UnlockEvaluator::findNewlyUnlocked({noReq, tier3}, state).empty());
    std::cout << "[PASS] Malformed hypotheses never unlock." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting UnlockEvaluator Test..." << std::endl;
    TestThresholdGate();
    TestDeepNesting();
    TestEmptyCombinators();
    TestDepthLimit();
    TestBatchAndContradiction();
    TestForceUnlock();
    TestOddTiers();
    std::cout << "[PASS] UnlockEvaluator Test." << std::endl;
    return 0;
}
