/**
 * @file CasefileApp.cpp
 * @brief Implementation of the CasefileApp class.
 */
#include "app/CasefileApp.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "domain/Errors.hpp"
#include "infrastructure/FileCaseRepository.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace casefile::app {

namespace fs = std::filesystem;

namespace {

void PrintHelp() {
    std::cout << "Commands:\n"
              << "  <free text>                     investigate the current location\n"
              << "  /go <location>                  move to a location\n"
              << "  /spend <n>                      spend investigation points\n"
              << "  /notifications                  list new hypotheses\n"
              << "  /ack <event-id|all>             acknowledge notifications\n"
              << "  /ask <witness> <question>        question a witness\n"
              << "  /show <witness> <evidence-id>   present collected evidence to a witness\n"
              << "  /accuse <suspect> | <ev1,ev2> | <reasoning>\n"
              << "  /status                         show progress\n"
              << "  /save [slot]                    save progress (slot_1, slot_2, slot_3)\n"
              << "  /load <slot>                    restore a saved slot\n"
              << "  /saves                          list saved slots\n"
              << "  /delete <slot>                  delete a saved slot\n"
              << "  /quit                           leave (progress is saved)\n";
}

} // namespace

std::string CasefileApp::Trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::vector<std::string> CasefileApp::SplitList(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        item = Trim(item);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

bool CasefileApp::Init() {
    m_settings = infrastructure::ConfigLoader::Load(m_projectRoot);

    fs::path casesDir = m_settings.casesDir;
    if (casesDir.is_relative()) casesDir = fs::path(m_projectRoot) / casesDir;
    fs::path savesDir = m_settings.savesDir.empty() ? infrastructure::PathUtils::GetSavesDir()
                                                    : fs::path(m_settings.savesDir);

    m_services.caseRepository = std::make_shared<infrastructure::FileCaseRepository>(
        casesDir.string(), m_settings.defaultInvestigationPoints);
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.snapshotStore = std::make_shared<infrastructure::SnapshotStore>(
        savesDir.string(), m_services.persistenceService);

    if (m_settings.narration.enabled) {
        const auto& n = m_settings.narration;
        auto ollama = std::make_shared<infrastructure::OllamaAdapter>(n.host, n.port, n.model, n.timeoutSeconds);
        ollama->initialize();
        std::cout << "[CasefileApp] Narration model: " << ollama->getCurrentModel() << std::endl;
        m_services.narration = ollama;
    }

    m_services.sessionManager = std::make_unique<application::SessionManager>(
        m_services.caseRepository, m_services.snapshotStore, m_settings.maxAttempts);
    m_services.feedbackService = std::make_unique<application::MentorFeedbackService>(m_services.narration);

    try {
        m_services.sessionManager->openSession(m_caseId, m_playerId);
    } catch (const domain::ValidationError& e) {
        std::cerr << "[CasefileApp] " << e.what() << std::endl;
        for (const auto& err : e.errors()) std::cerr << "  - " << err << std::endl;
        return false;
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[CasefileApp] Could not restore saved game: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void CasefileApp::Shutdown() {
    if (m_services.sessionManager && m_services.sessionManager->hasSession(m_caseId, m_playerId)) {
        try {
            m_services.sessionManager->save(m_caseId, m_playerId);
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[CasefileApp] Save on exit failed: " << e.what() << std::endl;
        }
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
}

void CasefileApp::PrintStatus() {
    auto caseDef = m_services.sessionManager->caseDefinition(m_caseId, m_playerId);
    auto snap = m_services.sessionManager->querySnapshot(m_caseId, m_playerId);

    std::cout << "Case: " << caseDef->title << " [" << domain::CaseStatusToString(snap.caseStatus) << "]\n";
    if (const auto* loc = caseDef->findLocation(snap.currentLocation)) {
        std::cout << "Location: " << loc->name << "\n";
    }
    std::cout << "Evidence (" << snap.discoveredEvidenceIds.size() << "):";
    for (const auto& id : snap.discoveredEvidenceIds) std::cout << " " << id;
    std::cout << "\nHypotheses:";
    for (const auto& id : snap.availableHypothesisIds) {
        const auto* h = caseDef->findHypothesis(id);
        std::cout << "\n  " << id << ": " << (h ? h->label : id);
    }
    std::cout << "\nInvestigation points: " << snap.investigationPointsSpent << " spent, "
              << snap.investigationPointsRemaining << " left"
              << "\nContradictions found: " << snap.discoveredContradictionIds.size() << " ("
              << snap.contradictionDiscoveryRate << "%)"
              << "\nAttempts remaining: " << snap.attemptsRemaining << std::endl;
}

void CasefileApp::PrintNotifications() {
    auto snap = m_services.sessionManager->querySnapshot(m_caseId, m_playerId);
    if (snap.pendingNotifications.empty()) {
        std::cout << "No new notifications." << std::endl;
        return;
    }
    for (const auto& n : snap.pendingNotifications) {
        std::cout << "[" << n.eventId << "] " << n.hypothesisLabel << " (" << n.cause << ")" << std::endl;
    }
}

void CasefileApp::HandleAccuse(const std::string& args) {
    auto parts = SplitList(args, '|');
    domain::Accusation accusation;
    if (!parts.empty()) accusation.accusedId = parts[0];
    if (parts.size() >= 3) {
        accusation.citedEvidenceIds = SplitList(parts[1], ',');
        accusation.reasoning = parts[2];
    } else if (parts.size() == 2) {
        accusation.reasoning = parts[1];
    }

    auto outcome = m_services.sessionManager->submitVerdict(m_caseId, m_playerId, accusation);
    auto caseDef = m_services.sessionManager->caseDefinition(m_caseId, m_playerId);
    std::cout << m_services.feedbackService->verdictFeedback(*caseDef, outcome.state, accusation, outcome.result)
              << std::endl;
    if (outcome.result.revealedCulprit) {
        std::cout << "Case closed. The culprit was " << *outcome.result.revealedCulprit << "." << std::endl;
    }

    try {
        m_services.sessionManager->save(m_caseId, m_playerId, infrastructure::SnapshotStore::kAutosaveSlot);
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[CasefileApp] Autosave failed: " << e.what() << std::endl;
    }
}

void CasefileApp::HandleInterrogation(const std::string& command, const std::string& args) {
    const auto space = args.find(' ');
    const std::string witnessId = args.substr(0, space);
    const std::string rest = (space == std::string::npos) ? std::string() : Trim(args.substr(space + 1));
    if (witnessId.empty() || rest.empty()) {
        std::cerr << "Usage: " << command << (command == "/ask" ? " <witness> <question>" : " <witness> <evidence-id>")
                  << std::endl;
        return;
    }

    auto& sessions = *m_services.sessionManager;
    auto caseDef = sessions.caseDefinition(m_caseId, m_playerId);
    auto outcome = (command == "/ask") ? sessions.questionWitness(m_caseId, m_playerId, witnessId, rest)
                                       : sessions.presentEvidence(m_caseId, m_playerId, witnessId, rest);
    std::cout << m_services.feedbackService->describeInterrogation(*caseDef, rest, outcome) << std::endl;
}

void CasefileApp::HandleSaves(const std::string& command, const std::string& args) {
    auto& sessions = *m_services.sessionManager;
    try {
        if (command == "/save") {
            sessions.save(m_caseId, m_playerId, args.empty() ? infrastructure::SnapshotStore::kDefaultSlot : args);
        } else if (command == "/load") {
            if (!sessions.loadSlot(m_caseId, m_playerId, args)) {
                std::cout << "Slot " << args << " is empty." << std::endl;
                return;
            }
            PrintStatus();
        } else if (command == "/delete") {
            std::cout << (sessions.deleteSave(m_caseId, m_playerId, args) ? "Deleted " : "Nothing saved in ")
                      << args << "." << std::endl;
        } else {
            auto saves = sessions.listSaves(m_caseId, m_playerId);
            if (saves.empty()) std::cout << "No saved slots." << std::endl;
            for (const auto& info : saves) {
                std::cout << info.slot << ": " << info.currentLocation << ", " << info.evidenceCount
                          << " evidence, " << info.attemptsRemaining << " attempts left ["
                          << domain::CaseStatusToString(info.caseStatus) << "]" << std::endl;
            }
        }
    } catch (const domain::PersistenceError& e) {
        std::cerr << "[CasefileApp] " << e.what() << std::endl;
    }
}

bool CasefileApp::HandleLine(const std::string& rawLine) {
    const std::string line = Trim(rawLine);
    if (line.empty()) return true;

    auto& sessions = *m_services.sessionManager;
    const auto space = line.find(' ');
    const std::string command = line.substr(0, space);
    const std::string args = (space == std::string::npos) ? std::string() : Trim(line.substr(space + 1));

    if (command == "/quit" || command == "/exit") return false;

    if (command == "/help") {
        PrintHelp();
    } else if (command == "/status") {
        PrintStatus();
    } else if (command == "/notifications") {
        PrintNotifications();
    } else if (command == "/ack") {
        if (args == "all") {
            for (const auto& n : sessions.querySnapshot(m_caseId, m_playerId).pendingNotifications) {
                sessions.acknowledgeNotification(m_caseId, m_playerId, n.eventId);
            }
        } else {
            sessions.acknowledgeNotification(m_caseId, m_playerId, args);
        }
    } else if (command == "/go") {
        auto caseDef = sessions.caseDefinition(m_caseId, m_playerId);
        auto outcome = caseDef->findLocation(args)
                           ? sessions.moveTo(m_caseId, m_playerId, args)
                           : sessions.submitPlayerAction(m_caseId, m_playerId, "go to " + args);
        std::cout << m_services.feedbackService->describeAction(*caseDef, line, outcome) << std::endl;
    } else if (command == "/spend") {
        int points = 0;
        try {
            points = std::stoi(args);
        } catch (const std::exception&) {
            std::cerr << "Usage: /spend <n>" << std::endl;
            return true;
        }
        auto scan = sessions.spendInvestigationPoints(m_caseId, m_playerId, points);
        for (const auto& evt : scan.events) {
            std::cout << "New hypothesis available: " << evt.hypothesisId << std::endl;
        }
    } else if (command == "/accuse") {
        HandleAccuse(args);
    } else if (command == "/ask" || command == "/show") {
        HandleInterrogation(command, args);
    } else if (command == "/save" || command == "/load" || command == "/saves" || command == "/delete") {
        HandleSaves(command, args);
    } else if (!command.empty() && command[0] == '/') {
        std::cout << "Unknown command. Type /help." << std::endl;
    } else {
        auto caseDef = sessions.caseDefinition(m_caseId, m_playerId);
        auto outcome = sessions.submitPlayerAction(m_caseId, m_playerId, line);
        std::cout << m_services.feedbackService->describeAction(*caseDef, line, outcome) << std::endl;
    }
    return true;
}

int CasefileApp::Run(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: casefile <case-id> [player-id]" << std::endl;
        return 2;
    }
    m_caseId = argv[1];
    if (argc >= 3) m_playerId = argv[2];

    if (!Init()) {
        Shutdown();
        return 1;
    }

    auto caseDef = m_services.sessionManager->caseDefinition(m_caseId, m_playerId);
    std::cout << "=== " << caseDef->title << " ===" << std::endl;
    PrintStatus();
    PrintHelp();

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        if (!HandleLine(line)) break;
    }

    Shutdown();
    return 0;
}

} // namespace casefile::app
