/**
 * @file JsonUsageHistoryRepository.cpp
 * @brief Implementation of JsonUsageHistoryRepository.
 */

#include "infrastructure/JsonUsageHistoryRepository.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace playoutplanner::infrastructure {

using json = nlohmann::json;

JsonUsageHistoryRepository::JsonUsageHistoryRepository(std::string stateFile,
                                                       std::shared_ptr<PersistenceService> persistence)
    : m_stateFile(std::move(stateFile)), m_persistence(std::move(persistence)) {}

domain::UsageHistory JsonUsageHistoryRepository::load() {
    domain::UsageHistory history;
    m_persistence->flush();
    std::error_code ec;
    if (!std::filesystem::exists(m_stateFile, ec)) {
        return history;
    }

    try {
        std::ifstream f(m_stateFile);
        json j;
        f >> j;
        if (j.contains("last_used") && j["last_used"].is_object()) {
            for (auto it = j["last_used"].begin(); it != j["last_used"].end(); ++it) {
                if (it.value().is_number_integer()) {
                    history.recordUse(it.key(), it.value().get<std::int64_t>());
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[UsageHistory] Ignoring unreadable state " << m_stateFile << ": " << e.what() << std::endl;
        return domain::UsageHistory{};
    }
    return history;
}

void JsonUsageHistoryRepository::save(const domain::UsageHistory& history) {
    json lastUsed = json::object();
    for (const auto& [id, timestamp] : history.entries()) {
        lastUsed[id] = timestamp;
    }
    json j = {{"last_used", lastUsed}};
    m_persistence->saveTextAsync(m_stateFile, j.dump(2));
}

} // namespace playoutplanner::infrastructure
