#include <cassert>
#include <iostream>

#include "domain/rules/LocationCommandParser.hpp"
#include "TestFixtures.hpp"

using namespace casefile::domain::rules;
using namespace casefile::test;

int main() {
    std::cout << "[Test] Starting LocationCommandParser Test..." << std::endl;

    const auto def = MakeCeilingCase();
    LocationCommandParser parser(def.locations);

    assert(parser.parse("go to the library") == std::optional<std::string>("library"));
    assert(parser.parse("Visit Great Hall") == std::optional<std::string>("great_hall"));
    assert(parser.parse("walk to great_hall") == std::optional<std::string>("great_hall"));
    std::cout << "[PASS] Explicit navigation commands." << std::endl;

    assert(parser.parse("head to the libary") == std::optional<std::string>("library"));
    assert(!parser.parse("travel to the kitchen"));
    std::cout << "[PASS] Fuzzy matching tolerates typos, not strangers." << std::endl;

    assert(parser.parse("I want to return to the study") == std::optional<std::string>("study"));
    assert(!parser.parse("read the study notes"));
    assert(!parser.parse("I look up at the ceiling"));
    assert(!parser.parse(""));
    std::cout << "[PASS] Location names need a navigation context." << std::endl;

    assert(LocationCommandParser::similarity("library", "library") == 1.0);
    assert(LocationCommandParser::similarity("", "") == 1.0);
    assert(LocationCommandParser::similarity("abc", "xyz") == 0.0);
    assert(LocationCommandParser::similarity("libary", "library") > 0.9);
    std::cout << "[PASS] Similarity ratio." << std::endl;

    LocationCommandParser strict(def.locations, 0.99);
    assert(!strict.parse("head to the libary"));
    std::cout << "[PASS] Threshold is configurable." << std::endl;

    std::cout << "[PASS] LocationCommandParser Test." << std::endl;
    return 0;
}
