/**
 * @file PlaylistService.hpp
 * @brief Application service running one playlist generation request end to end.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/PlaylistAssembler.hpp"
#include "domain/MediaCatalog.hpp"
#include "domain/MediaScanner.hpp"
#include "domain/PlaylistDate.hpp"
#include "domain/PlaylistRepository.hpp"
#include "domain/ScheduleTemplate.hpp"

namespace playoutplanner::application {

/**
 * @struct GenerationResult
 * @brief Outcome of PlaylistService::generate.
 */
struct GenerationResult {
    domain::PlaylistDocument document;
    std::string playlistFile; ///< Where the document was stored.
};

/**
 * @class PlaylistService
 * @brief Scan -> catalog -> rotation state -> assemble -> persist.
 *
 * Each call builds its own catalog snapshot and usage history. The section
 * that loads, advances and saves the persisted rotation state is serialized so
 * concurrent requests cannot lose updates.
 */
class PlaylistService {
public:
    PlaylistService(std::shared_ptr<domain::MediaScanner> scanner,
                    std::shared_ptr<domain::PlaylistRepository> playlists,
                    std::shared_ptr<domain::UsageHistoryRepository> rotationState,
                    std::vector<domain::SlotSpec> defaultSlots,
                    std::string channel,
                    double durationTolerance);

    /**
     * @brief Generates and stores the playlist of a date with the configured template.
     * @throws domain::InvalidTemplate, domain::InvalidCatalog, domain::AssemblyInvariantViolation
     */
    GenerationResult generate(const domain::PlaylistDate& date);

    /** @brief Same as generate() with an ad-hoc template. */
    GenerationResult generate(const domain::PlaylistDate& date, const std::vector<domain::SlotSpec>& slots);

    /** @brief Scans storage and returns a fresh catalog snapshot. @throws domain::InvalidCatalog */
    domain::MediaCatalog buildCatalog();

    /** @brief Serialized playlist stored for a date, if any. */
    std::optional<std::string> storedPlaylist(const domain::PlaylistDate& date);

    const std::vector<domain::SlotSpec>& defaultSlots() const { return m_defaultSlots; }
    std::string videoDirectory() const { return m_scanner->rootPath(); }

private:
    std::shared_ptr<domain::MediaScanner> m_scanner;
    std::shared_ptr<domain::PlaylistRepository> m_playlists;
    std::shared_ptr<domain::UsageHistoryRepository> m_rotationState;
    std::vector<domain::SlotSpec> m_defaultSlots;
    std::string m_channel;
    double m_tolerance;

    std::mutex m_rotationMutex;
};

} // namespace playoutplanner::application
