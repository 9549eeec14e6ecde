#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <variant>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "domain/rules/UnlockEvaluator.hpp"
#include "infrastructure/CaseJsonParser.hpp"
#include "infrastructure/CaseValidator.hpp"
#include "infrastructure/FileCaseRepository.hpp"

using namespace casefile::domain;
using namespace casefile::infrastructure;
using json = nlohmann::json;

namespace {

json MinimalCase(const std::string& id) {
    json evidence = {{"id", "clue"}, {"name", "Clue"}, {"triggers", json::array({"look"})}, {"cost", 1}};
    json room = {{"id", "room"}, {"name", "Room"}, {"evidence", json::array({evidence})}};
    json butler = {{"id", "butler"}, {"name", "The Butler"}};
    json h1 = {{"id", "h1"}, {"label", "Butler"}, {"tier", 1}};
    return {
        {"id", id},
        {"title", "Minimal"},
        {"difficulty", "beginner"},
        {"locations", json::array({room})},
        {"witnesses", json::array({butler})},
        {"hypotheses", json::array({h1})},
        {"solution", {{"culprit", "butler"}, {"key_evidence", json::array({"clue"})}}}
    };
}

void WriteJson(const std::filesystem::path& path, const json& doc) {
    std::ofstream out(path);
    out << doc.dump(2);
}

bool ThrowsValidation(FileCaseRepository& repo, const std::string& id, size_t minErrors = 1) {
    try {
        repo.loadCase(id);
    } catch (const ValidationError& e) {
        return e.caseId() == id && e.errors().size() >= minErrors;
    }
    return false;
}

void TestShippedCase() {
    std::cout << "[Test] Loading the shipped example case..." << std::endl;
    FileCaseRepository repo(CASEFILE_CASES_DIR);
    auto def = repo.loadCase("ceiling");
    assert(def->title == "The Ceiling Charm");
    assert(def->startLocation == "study");
    assert(def->evidence.size() == 6);
    assert(def->hypotheses.size() == 5);
    assert(def->findEvidence("e5")->locationId == "study");
    assert(def->findEvidence("e4")->impliesSequence.size() == 1);
    assert(def->authorityFigures().count("snape") == 1);
    const auto* hannah = def->findWitness("hannah");
    assert(hannah->secrets.size() == 1 && hannah->secrets[0].trigger.anyOf.size() == 2);
    const auto* draco = def->findWitness("draco");
    assert(draco->lies.size() == 1 && draco->lies[0].trustThreshold == 40);
    assert(draco->lies[0].comparison == Comparison::Less);
    assert(def->solution.commonMistakes.at("hannah").whyWrong == "Being present is not the same as casting the spell.");

    const auto* h4 = def->findHypothesis("h4");
    assert(h4 && h4->requirement && std::holds_alternative<AnyOf>(h4->requirement->node));
    const auto* h3 = def->findHypothesis("h3");
    const auto& all = std::get<AllOf>(h3->requirement->node);
    const auto& threshold = std::get<ThresholdMet>(all.children[1].node);
    assert(threshold.metric && *threshold.metric == Metric::InvestigationPointsSpent);
    assert(threshold.threshold == 6);

    assert(repo.loadCase("ceiling") == def);
    const auto ids = repo.listCases();
    assert(std::find(ids.begin(), ids.end(), "ceiling") != ids.end());
    std::cout << "[PASS] Example case parses and validates." << std::endl;
}

void TestRejectedCases(const std::filesystem::path& dir) {
    std::cout << "[Test] Invalid cases are refused..." << std::endl;
    FileCaseRepository repo(dir.string());

    json broken = MinimalCase("broken");
    broken["solution"]["culprit"] = "gardener";
    broken["locations"][0]["evidence"][0]["triggers"] = json::array();
    broken["hypotheses"].push_back({{"id", "h2"}, {"tier", 2},
                                    {"requirement", {{"type", "evidence_collected"}, {"evidence_id", "ghost"}}}});
    broken["hypotheses"].push_back({{"id", "h3"}, {"tier", 2}, {"requirement", {{"type", "none_of"}}}});
    broken["hypotheses"].push_back({{"id", "h4"}, {"tier", 2}});
    WriteJson(dir / "broken.json", broken);
    assert(ThrowsValidation(repo, "broken", 5));

    std::ofstream(dir / "garbled.json") << "{ \"id\": \"garbled\", ";
    assert(ThrowsValidation(repo, "garbled"));

    assert(ThrowsValidation(repo, "missing"));
    assert(ThrowsValidation(repo, "../ceiling"));
    std::cout << "[PASS] Broken, malformed and missing cases throw ValidationError." << std::endl;
}

void TestWarningsStillLoad(const std::filesystem::path& dir) {
    std::cout << "[Test] Lint warnings do not block loading..." << std::endl;
    json doc = MinimalCase("lenient");
    doc["witnesses"][0]["wants"] = "A quiet life";
    doc["hypotheses"].push_back({{"id", "h2"}, {"label", "Suspicion"}, {"tier", 2},
                                 {"requirement", {{"type", "threshold_met"}, {"metric", "suspicionLevel"}, {"threshold", 0}}}});
    doc.erase("difficulty");
    doc.erase("start_location");

    CaseValidator validator;
    auto report = validator.Validate(doc);
    assert(report.ok());
    assert(report.warnings.size() == 2);

    WriteJson(dir / "lenient.json", doc);
    FileCaseRepository repo(dir.string(), 20);
    auto def = repo.loadCase("lenient");
    assert(def->investigationPoints == 20);
    assert(def->startLocation == "room");

    PlayerState state(def->id, def->startLocation, 10, def->investigationPoints);
    assert(!rules::UnlockEvaluator::isHypothesisUnlocked(*def->findHypothesis("h2"), state));

    // Only valid documents are listed, sorted.
    WriteJson(dir / "alpha.json", MinimalCase("alpha"));
    const auto ids = repo.listCases();
    assert((ids == std::vector<std::string>{"alpha", "lenient"}));
    std::cout << "[PASS] Warnings are reported, the case loads fail-closed." << std::endl;
}

void TestWitnessSecrets() {
    std::cout << "[Test] Witness secrets and lies are checked..." << std::endl;
    json doc = MinimalCase("secrets");
    doc["witnesses"][0]["secrets"] = json::array({
        {{"id", "s1"}, {"text", "I polished the candlestick."}, {"trigger", "evidence:clue OR mood:calm"}},
        {{"id", "s2"}, {"text", "Nobody asked."}}
    });
    doc["witnesses"][0]["lies"] = json::array({
        {{"condition", "trust<30"}, {"topics", json::array({"pantry"})}, {"response", "I was asleep."}},
        {{"condition", "whenever"}, {"topics", json::array({"cellar"})}, {"response", "What cellar?"}}
    });
    auto report = CaseValidator().Validate(doc);
    assert(report.ok());
    // Unparsed trigger part, missing trigger, unusable lie condition.
    assert(report.warnings.size() == 3);

    json ghost = doc;
    ghost["witnesses"][0]["secrets"][0]["trigger"] = "evidence:ghost AND trust>10";
    assert(!CaseValidator().Validate(ghost).ok());
    json textless = doc;
    textless["witnesses"][0]["secrets"][1].erase("text");
    assert(!CaseValidator().Validate(textless).ok());

    auto def = CaseJsonParser::Parse(doc);
    const auto* butler = def.findWitness("butler");
    assert(butler->secrets.size() == 2);
    assert(butler->secrets[0].trigger.anyOf.size() == 1);
    assert(butler->secrets[1].trigger.anyOf.empty());
    assert(butler->lies.size() == 1 && butler->lies[0].response == "I was asleep.");
    std::cout << "[PASS] Bad references fail, loose authoring warns." << std::endl;
}

void TestNestingLimit() {
    std::cout << "[Test] Validator bounds requirement depth..." << std::endl;
    json req = {{"type", "evidence_collected"}, {"evidence_id", "clue"}};
    for (int i = 0; i < rules::UnlockEvaluator::kMaxDepth + 1; ++i) {
        req = {{"type", "all_of"}, {"requirements", json::array({req})}};
    }
    json doc = MinimalCase("deep");
    doc["hypotheses"].push_back({{"id", "h2"}, {"tier", 2}, {"requirement", req}});
    assert(!CaseValidator().Validate(doc).ok());
    std::cout << "[PASS] Over-deep requirement trees are refused." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CaseRepository Test..." << std::endl;

    const std::filesystem::path testRoot = "test_cases_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    TestShippedCase();
    TestRejectedCases(testRoot);
    TestWarningsStillLoad(testRoot);
    TestWitnessSecrets();
    TestNestingLimit();

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] CaseRepository Test." << std::endl;
    return 0;
}
