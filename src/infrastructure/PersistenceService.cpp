/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace playoutplanner::infrastructure {

namespace fs = std::filesystem;

namespace {

bool ReplaceFile(const WriteRequest& request, std::size_t sequence, std::string& error) {
    const fs::path target = request.path;
    fs::path staging = target;
    staging += "." + std::to_string(sequence) + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open " + staging.string();
        return false;
    }
    out << request.content;
    out.close();
    if (out.fail()) {
        error = "short write to " + staging.string();
        fs::remove(staging, ec);
        return false;
    }

    fs::rename(staging, target, ec);
    if (ec) {
        error = "cannot rename onto " + target.string() + ": " + ec.message();
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }
    return true;
}

} // namespace

PersistenceService::PersistenceService()
    : m_worker(&PersistenceService::run, this) {}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::saveTextAsync(const std::string& path, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_accepting) {
            std::cerr << "[PersistenceService] Dropping write after stop: " << path << std::endl;
            ++m_failedWrites;
            return;
        }
        m_pending.push_back(WriteRequest{path, content});
    }
    m_wake.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_pending.empty() && !m_busy; });
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accepting = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::optional<WriteRequest> PersistenceService::nextRequest() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_wake.wait(lock, [this] { return !m_pending.empty() || !m_accepting; });
    if (m_pending.empty()) {
        return std::nullopt; // stopped and drained
    }
    WriteRequest request = std::move(m_pending.front());
    m_pending.pop_front();
    m_busy = true;
    return request;
}

void PersistenceService::finishRequest(bool written) {
    if (written) {
        ++m_completedWrites;
    } else {
        ++m_failedWrites;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy = false;
    }
    m_idle.notify_all();
}

void PersistenceService::run() {
    std::size_t sequence = 0;
    while (auto request = nextRequest()) {
        std::string error;
        const bool written = ReplaceFile(*request, ++sequence, error);
        if (!written) {
            std::cerr << "[PersistenceService] Write of " << request->path << " failed: " << error << std::endl;
        }
        finishRequest(written);
    }
}

} // namespace playoutplanner::infrastructure
