/**
 * @file JsonPlaylistRepository.hpp
 * @brief Filesystem storage of playlists in the FFPlayout JSON format.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/PlaylistRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace playoutplanner::infrastructure {

/**
 * @class JsonPlaylistRepository
 * @brief Writes <output>/YYYY/MM/YYYY-MM-DD.json through the PersistenceService.
 *
 * Document layout:
 * {"channel", "date", "program": [{"in", "out", "duration", "source", "start", "category"}],
 *  "unfillable": [{"slot", "start", "category", "reason", "code"}],
 *  "warnings": [{"slot", "message"}]}
 */
class JsonPlaylistRepository : public domain::PlaylistRepository {
public:
    JsonPlaylistRepository(std::string outputDirectory, std::shared_ptr<PersistenceService> persistence);

    /** @see domain::PlaylistRepository::save */
    std::string save(const domain::PlaylistDocument& document) override;

    /** @see domain::PlaylistRepository::load */
    std::optional<std::string> load(const domain::PlaylistDate& date) override;

    /** @brief Dated location of a playlist file. */
    std::string pathFor(const domain::PlaylistDate& date) const;

    /** @brief Serializes a document to the player's JSON contract. */
    static nlohmann::json ToJson(const domain::PlaylistDocument& document);

private:
    std::string m_outputDirectory;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace playoutplanner::infrastructure
