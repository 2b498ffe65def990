/**
 * @file FileSystemMediaScanner.hpp
 * @brief Scanner for video files stored in per-category folders.
 */

#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "domain/MediaScanner.hpp"

namespace playoutplanner::infrastructure {

/**
 * @class FileSystemMediaScanner
 * @brief Infrastructure adapter that walks the video directory.
 *
 * Each folder below the root is a category source; its name is mapped to a
 * logical category through the configured substring map. Files directly in
 * the root belong to no category and are ignored.
 */
class FileSystemMediaScanner : public domain::MediaScanner {
public:
    FileSystemMediaScanner(std::string videoDirectory,
                           std::vector<std::pair<std::string, std::string>> categoryMap,
                           std::shared_ptr<domain::MediaProbe> probe,
                           double defaultDurationSeconds);

    /**
     * @brief Scans the video directory recursively.
     * @return Files in folder then name order, with every category folder seen.
     */
    domain::ScanResult scan() override;

    std::string rootPath() const override { return m_videoDirectory; }

    /** @brief Maps a folder name to its logical category. */
    static std::string MapCategory(const std::string& folderName,
                                   const std::vector<std::pair<std::string, std::string>>& categoryMap);

    /** @brief True for the container extensions the player accepts. */
    static bool IsVideoFile(const std::string& path);

private:
    std::string m_videoDirectory;
    std::vector<std::pair<std::string, std::string>> m_categoryMap;
    std::shared_ptr<domain::MediaProbe> m_probe;
    double m_defaultDuration;
};

} // namespace playoutplanner::infrastructure
