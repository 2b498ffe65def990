/**
 * @file FileSystemMediaScanner.cpp
 * @brief Implementation of the FileSystemMediaScanner.
 */

#include "infrastructure/FileSystemMediaScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace playoutplanner::infrastructure {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

} // namespace

FileSystemMediaScanner::FileSystemMediaScanner(std::string videoDirectory,
                                               std::vector<std::pair<std::string, std::string>> categoryMap,
                                               std::shared_ptr<domain::MediaProbe> probe,
                                               double defaultDurationSeconds)
    : m_videoDirectory(std::move(videoDirectory)),
      m_categoryMap(std::move(categoryMap)),
      m_probe(std::move(probe)),
      m_defaultDuration(defaultDurationSeconds) {}

std::string FileSystemMediaScanner::MapCategory(const std::string& folderName,
                                                const std::vector<std::pair<std::string, std::string>>& categoryMap) {
    const std::string lowered = ToLower(folderName);
    for (const auto& [needle, category] : categoryMap) {
        if (!needle.empty() && lowered.find(ToLower(needle)) != std::string::npos) {
            return category;
        }
    }
    std::string category = lowered;
    std::replace(category.begin(), category.end(), ' ', '_');
    return category;
}

bool FileSystemMediaScanner::IsVideoFile(const std::string& path) {
    const std::string ext = ToLower(fs::path(path).extension().string());
    return ext == ".mp4" || ext == ".mkv" || ext == ".mov" || ext == ".avi" || ext == ".flv";
}

domain::ScanResult FileSystemMediaScanner::scan() {
    domain::ScanResult result;

    std::error_code ec;
    if (!fs::is_directory(m_videoDirectory, ec)) {
        std::cerr << "[MediaScanner] Video directory not found: " << m_videoDirectory << std::endl;
        return result;
    }

    const fs::path root = fs::absolute(m_videoDirectory).lexically_normal();

    // Ordered by folder path so the scan order is stable between runs.
    std::map<fs::path, std::vector<fs::path>> folders;
    auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(root, options, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entryEc;
        if (entry.is_directory(entryEc)) {
            folders[entry.path()];
        } else if (entry.is_regular_file(entryEc) && IsVideoFile(entry.path().string())) {
            if (entry.path().parent_path() == root) continue;
            folders[entry.path().parent_path()].push_back(entry.path());
        }
    }
    if (ec) {
        std::cerr << "[MediaScanner] Scan of " << root << " stopped early: " << ec.message() << std::endl;
    }

    for (auto& [folder, files] : folders) {
        const std::string category = MapCategory(folder.filename().string(), m_categoryMap);
        if (std::find(result.categories.begin(), result.categories.end(), category) == result.categories.end()) {
            result.categories.push_back(category);
        }

        std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
            return a.filename().string() < b.filename().string();
        });
        for (const auto& file : files) {
            domain::ScannedMedia record;
            record.filePath = file.string();
            record.category = category;

            std::optional<double> duration;
            if (m_probe) duration = m_probe->probeDuration(record.filePath);
            if (duration && *duration > 0.0) {
                record.durationSeconds = *duration;
            } else {
                std::cerr << "[MediaScanner] No duration for " << record.filePath << ", assuming "
                          << m_defaultDuration << "s" << std::endl;
                record.durationSeconds = m_defaultDuration;
            }
            result.records.push_back(std::move(record));
        }
    }

    std::cout << "[MediaScanner] " << result.records.size() << " videos in "
              << result.categories.size() << " categories under " << root << std::endl;
    return result;
}

} // namespace playoutplanner::infrastructure
