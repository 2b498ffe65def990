/**
 * @file PlaylistService.cpp
 * @brief Implementation of PlaylistService.
 */

#include "application/PlaylistService.hpp"
#include <iostream>

namespace playoutplanner::application {

PlaylistService::PlaylistService(std::shared_ptr<domain::MediaScanner> scanner,
                                 std::shared_ptr<domain::PlaylistRepository> playlists,
                                 std::shared_ptr<domain::UsageHistoryRepository> rotationState,
                                 std::vector<domain::SlotSpec> defaultSlots,
                                 std::string channel,
                                 double durationTolerance)
    : m_scanner(std::move(scanner)),
      m_playlists(std::move(playlists)),
      m_rotationState(std::move(rotationState)),
      m_defaultSlots(std::move(defaultSlots)),
      m_channel(std::move(channel)),
      m_tolerance(durationTolerance) {}

domain::MediaCatalog PlaylistService::buildCatalog() {
    auto scan = m_scanner->scan();
    return domain::MediaCatalog::FromScan(scan.records, scan.categories);
}

std::optional<std::string> PlaylistService::storedPlaylist(const domain::PlaylistDate& date) {
    return m_playlists->load(date);
}

GenerationResult PlaylistService::generate(const domain::PlaylistDate& date) {
    return generate(date, m_defaultSlots);
}

GenerationResult PlaylistService::generate(const domain::PlaylistDate& date,
                                           const std::vector<domain::SlotSpec>& slots) {
    // Structural input problems are rejected before any storage is touched.
    auto scheduleTemplate = domain::ScheduleTemplate::FromSpecs(slots);
    auto catalog = buildCatalog();

    AssemblyOptions options;
    options.channel = m_channel;
    options.date = date.toString();
    options.dayStartEpoch = date.midnightEpochSeconds();
    options.durationTolerance = m_tolerance;
    PlaylistAssembler assembler(options);

    std::lock_guard<std::mutex> lock(m_rotationMutex);
    auto history = m_rotationState->load();
    auto document = assembler.assemble(scheduleTemplate, catalog, history);

    std::string file = m_playlists->save(document);
    m_rotationState->save(history);

    std::cout << "[PlaylistService] " << options.date << ": " << document.entries().size() << "/"
              << scheduleTemplate.size() << " slots filled, " << document.unfillable().size()
              << " unfillable, " << document.warningCount() << " warnings -> " << file << std::endl;
    for (const auto& gap : document.unfillable()) {
        std::cerr << "[PlaylistService] Slot " << gap.slotIndex << " at " << domain::FormatClock(gap.startTime)
                  << " ('" << gap.category << "'): " << gap.reason << " ("
                  << domain::UnfillableCodeToString(gap.code) << ")" << std::endl;
    }

    return GenerationResult{std::move(document), std::move(file)};
}

} // namespace playoutplanner::application
