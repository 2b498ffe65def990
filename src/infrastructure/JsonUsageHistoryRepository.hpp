/**
 * @file JsonUsageHistoryRepository.hpp
 * @brief Rotation state kept in a JSON file between generation runs.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/PlaylistRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace playoutplanner::infrastructure {

/**
 * @class JsonUsageHistoryRepository
 * @brief Reads and writes {"last_used": {"<item id>": <epoch seconds>}}.
 */
class JsonUsageHistoryRepository : public domain::UsageHistoryRepository {
public:
    JsonUsageHistoryRepository(std::string stateFile, std::shared_ptr<PersistenceService> persistence);

    domain::UsageHistory load() override;
    void save(const domain::UsageHistory& history) override;

    const std::string& stateFile() const { return m_stateFile; }

private:
    std::string m_stateFile;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace playoutplanner::infrastructure
