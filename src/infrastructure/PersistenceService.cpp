/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace casefile::infrastructure {

namespace fs = std::filesystem;
using domain::PersistenceError;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<void> PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    SaveTask task{filename, content, std::promise<void>()};
    std::future<void> result = task.done.get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            task.done.set_exception(std::make_exception_ptr(
                PersistenceError("Persistence service stopped; not saving " + filename)));
            return result;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return result;
}

std::optional<std::string> PersistenceService::readText(const std::string& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        return std::nullopt;
    }

    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
        throw PersistenceError("Failed to open " + filename);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw PersistenceError("Read failed: " + filename);
    }
    return buffer.str();
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        try {
            performAtomicWrite(task);
            task.done.set_value();
        } catch (const PersistenceError& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
            task.done.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceService] Unexpected write failure: " << e.what() << std::endl;
            task.done.set_exception(std::make_exception_ptr(PersistenceError(e.what())));
        }
    }
}

void PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Error creating directories: ") + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw PersistenceError("Failed to open temp file: " + tempPath.string());
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw PersistenceError("Write failed during output: " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw PersistenceError("Rename failed for " + finalPath.string() + ": " + ec.message());
    }
}

} // namespace casefile::infrastructure
