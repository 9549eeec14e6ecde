/**
 * @file FileCaseRepository.cpp
 * @brief Implementation of FileCaseRepository.
 */

#include "infrastructure/FileCaseRepository.hpp"
#include "infrastructure/CaseJsonParser.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace casefile::infrastructure {

namespace fs = std::filesystem;
using domain::CaseDefinition;
using domain::ValidationError;

FileCaseRepository::FileCaseRepository(const std::string& casesDir, int defaultInvestigationPoints)
    : m_casesDir(casesDir), m_defaultInvestigationPoints(defaultInvestigationPoints) {}

std::shared_ptr<const CaseDefinition> FileCaseRepository::loadCase(const std::string& caseId) {
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_cache.find(caseId);
        if (it != m_cache.end()) return it->second;
    }

    auto loaded = loadFromDisk(caseId);

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto inserted = m_cache.emplace(caseId, loaded);
    return inserted.first->second;
}

std::shared_ptr<const CaseDefinition> FileCaseRepository::loadFromDisk(const std::string& caseId) const {
    if (caseId.empty() || caseId.find('/') != std::string::npos || caseId.find("..") != std::string::npos) {
        throw ValidationError(caseId, {"Invalid case id."});
    }

    const fs::path path = fs::path(m_casesDir) / (caseId + ".json");
    if (!fs::exists(path)) {
        throw ValidationError(caseId, {"Case file not found: " + path.string()});
    }

    nlohmann::json doc;
    try {
        std::ifstream f(path);
        f >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(caseId, {std::string("Malformed JSON: ") + e.what()});
    }

    const auto report = m_validator.Validate(doc);
    for (const auto& warning : report.warnings) {
        std::cerr << "[CaseRepository] " << caseId << ": " << warning << std::endl;
    }
    if (!report.ok()) {
        throw ValidationError(caseId, report.errors);
    }

    CaseDefinition def;
    try {
        def = CaseJsonParser::Parse(doc, m_defaultInvestigationPoints);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(caseId, {std::string("Unexpected field type: ") + e.what()});
    }
    if (def.id != caseId) {
        std::cerr << "[CaseRepository] File " << path.filename() << " declares id '" << def.id
                  << "'; it is served as '" << caseId << "'." << std::endl;
        def.id = caseId;
    }

    std::cout << "[CaseRepository] Loaded case '" << caseId << "' (" << def.evidence.size() << " evidence, "
              << def.hypotheses.size() << " hypotheses)." << std::endl;
    return std::make_shared<const CaseDefinition>(std::move(def));
}

std::vector<std::string> FileCaseRepository::listCases() {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::exists(m_casesDir, ec)) {
        std::cerr << "[CaseRepository] Cases directory not found: " << m_casesDir << std::endl;
        return ids;
    }

    for (const auto& entry : fs::directory_iterator(m_casesDir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        const std::string caseId = entry.path().stem().string();
        try {
            loadCase(caseId);
            ids.push_back(caseId);
        } catch (const ValidationError& e) {
            std::cerr << "[CaseRepository] Skipping " << entry.path().filename() << ": " << e.what() << std::endl;
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace casefile::infrastructure
