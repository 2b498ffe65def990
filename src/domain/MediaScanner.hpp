/**
 * @file MediaScanner.hpp
 * @brief Interfaces for discovering media files and their durations.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/MediaItem.hpp"

namespace playoutplanner::domain {

/**
 * @struct ScanResult
 * @brief Files found on storage plus every category folder seen, even empty ones.
 */
struct ScanResult {
    std::vector<ScannedMedia> records;
    std::vector<std::string> categories;
};

/**
 * @class MediaProbe
 * @brief Reads playback metadata from a media file.
 */
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    /** @brief Duration in seconds, or nullopt when the file cannot be probed. */
    virtual std::optional<double> probeDuration(const std::string& filePath) = 0;
};

/**
 * @class MediaScanner
 * @brief Inventories the media storage.
 */
class MediaScanner {
public:
    virtual ~MediaScanner() = default;

    virtual ScanResult scan() = 0;

    /** @brief Root the scanner walks, for display purposes. */
    virtual std::string rootPath() const = 0;
};

} // namespace playoutplanner::domain
