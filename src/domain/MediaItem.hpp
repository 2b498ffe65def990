/**
 * @file MediaItem.hpp
 * @brief Domain records for discovered video files.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace playoutplanner::domain {

/**
 * @struct ScannedMedia
 * @brief Raw record handed over by a scanner, before catalog validation.
 */
struct ScannedMedia {
    std::string filePath;         ///< Absolute path of the video file.
    std::string category;         ///< Logical category the file was classified into.
    double durationSeconds = 0.0; ///< Probed (or default) playback duration.
};

/**
 * @struct MediaItem
 * @brief A catalogued video file. Immutable once it enters the catalog.
 */
struct MediaItem {
    std::string id;               ///< Stable identity across runs (the absolute path).
    std::string filePath;
    std::string category;
    double durationSeconds = 0.0;
    std::optional<std::int64_t> lastUsedTimestamp; ///< Airtime of the last use, if known.
};

} // namespace playoutplanner::domain
