/**
 * @file UsageHistory.hpp
 * @brief Per-run rotation state: when each media item was last aired.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace playoutplanner::domain {

/**
 * @class UsageHistory
 * @brief Explicit last-used bookkeeping passed into the selection policy.
 *
 * Each generation run owns its own instance; nothing here is shared between
 * concurrent runs. Persisting it between runs is the caller's business.
 */
class UsageHistory {
public:
    std::optional<std::int64_t> lastUsed(const std::string& itemId) const {
        auto it = m_lastUsed.find(itemId);
        if (it == m_lastUsed.end()) return std::nullopt;
        return it->second;
    }

    void recordUse(const std::string& itemId, std::int64_t timestamp) {
        m_lastUsed[itemId] = timestamp;
    }

    /** @brief Newest recorded timestamp, if any use was recorded. */
    std::optional<std::int64_t> latest() const {
        std::optional<std::int64_t> newest;
        for (const auto& entry : m_lastUsed) {
            if (!newest || entry.second > *newest) newest = entry.second;
        }
        return newest;
    }

    const std::map<std::string, std::int64_t>& entries() const { return m_lastUsed; }
    std::size_t size() const { return m_lastUsed.size(); }
    bool empty() const { return m_lastUsed.empty(); }

private:
    std::map<std::string, std::int64_t> m_lastUsed;
};

} // namespace playoutplanner::domain
