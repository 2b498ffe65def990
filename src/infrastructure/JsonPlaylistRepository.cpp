/**
 * @file JsonPlaylistRepository.cpp
 * @brief Implementation of JsonPlaylistRepository.
 */

#include "infrastructure/JsonPlaylistRepository.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace playoutplanner::infrastructure {

using json = nlohmann::json;

JsonPlaylistRepository::JsonPlaylistRepository(std::string outputDirectory,
                                               std::shared_ptr<PersistenceService> persistence)
    : m_outputDirectory(std::move(outputDirectory)), m_persistence(std::move(persistence)) {}

std::string JsonPlaylistRepository::pathFor(const domain::PlaylistDate& date) const {
    char year[8];
    char month[8];
    std::snprintf(year, sizeof(year), "%04d", date.year);
    std::snprintf(month, sizeof(month), "%02d", date.month);
    return (fs::path(m_outputDirectory) / year / month / (date.toString() + ".json")).string();
}

json JsonPlaylistRepository::ToJson(const domain::PlaylistDocument& document) {
    json program = json::array();
    json warnings = json::array();
    for (const auto& entry : document.entries()) {
        program.push_back({
            {"in", 0.0},
            {"out", entry.actualDurationSeconds},
            {"duration", entry.actualDurationSeconds},
            {"source", entry.mediaItem.filePath},
            {"start", domain::FormatClock(entry.startTime)},
            {"category", entry.mediaItem.category}
        });
        if (entry.warning) {
            warnings.push_back({{"slot", entry.slotIndex}, {"message", *entry.warning}});
        }
    }

    json unfillable = json::array();
    for (const auto& gap : document.unfillable()) {
        unfillable.push_back({
            {"slot", gap.slotIndex},
            {"start", domain::FormatClock(gap.startTime)},
            {"category", gap.category},
            {"reason", gap.reason},
            {"code", domain::UnfillableCodeToString(gap.code)}
        });
    }

    return {
        {"channel", document.channel()},
        {"date", document.date()},
        {"program", program},
        {"unfillable", unfillable},
        {"warnings", warnings}
    };
}

std::string JsonPlaylistRepository::save(const domain::PlaylistDocument& document) {
    auto date = domain::PlaylistDate::Parse(document.date());
    if (!date) {
        throw std::invalid_argument("Playlist document has an invalid date: " + document.date());
    }
    const std::string path = pathFor(*date);
    m_persistence->saveTextAsync(path, ToJson(document).dump(2));
    return path;
}

std::optional<std::string> JsonPlaylistRepository::load(const domain::PlaylistDate& date) {
    m_persistence->flush();
    const std::string path = pathFor(date);
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace playoutplanner::infrastructure
