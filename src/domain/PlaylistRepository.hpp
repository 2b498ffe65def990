/**
 * @file PlaylistRepository.hpp
 * @brief Persistence interfaces for playlists and rotation state.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/PlaylistDate.hpp"
#include "domain/PlaylistDocument.hpp"
#include "domain/UsageHistory.hpp"

namespace playoutplanner::domain {

/**
 * @class PlaylistRepository
 * @brief Storage of finalized playlist documents.
 */
class PlaylistRepository {
public:
    virtual ~PlaylistRepository() = default;

    /**
     * @brief Persists a document for its date.
     * @return Location the document was written to.
     */
    virtual std::string save(const PlaylistDocument& document) = 0;

    /** @brief Serialized document stored for a date, if any. */
    virtual std::optional<std::string> load(const PlaylistDate& date) = 0;
};

/**
 * @class UsageHistoryRepository
 * @brief Cross-run storage of rotation state.
 */
class UsageHistoryRepository {
public:
    virtual ~UsageHistoryRepository() = default;

    /** @brief Returns an empty history when nothing usable is stored. */
    virtual UsageHistory load() = 0;

    virtual void save(const UsageHistory& history) = 0;
};

} // namespace playoutplanner::domain
