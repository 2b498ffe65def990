/**
 * @file MediaCatalog.cpp
 * @brief Implementation of MediaCatalog.
 */

#include "domain/MediaCatalog.hpp"
#include <cmath>
#include "domain/PlannerErrors.hpp"

namespace playoutplanner::domain {

MediaCatalog MediaCatalog::FromScan(const std::vector<ScannedMedia>& records,
                                    const std::vector<std::string>& declaredCategories) {
    MediaCatalog catalog;
    for (const auto& category : declaredCategories) {
        catalog.declareCategory(category);
    }
    for (const auto& record : records) {
        MediaItem item;
        item.id = record.filePath;
        item.filePath = record.filePath;
        item.category = record.category;
        item.durationSeconds = record.durationSeconds;
        catalog.add(std::move(item));
    }
    return catalog;
}

void MediaCatalog::add(MediaItem item) {
    if (item.id.empty() || item.filePath.empty()) {
        throw InvalidCatalog("Media item without id or file path in category '" + item.category + "'");
    }
    if (item.category.empty()) {
        throw InvalidCatalog("Media item without category: " + item.filePath);
    }
    if (!std::isfinite(item.durationSeconds) || item.durationSeconds <= 0.0) {
        throw InvalidCatalog("Media item with non-positive duration: " + item.filePath);
    }
    if (!m_ids.insert(item.id).second) {
        throw InvalidCatalog("Media item catalogued twice: " + item.id);
    }

    declareCategory(item.category);
    m_buckets[item.category].push_back(std::move(item));
}

void MediaCatalog::declareCategory(const std::string& category) {
    if (category.empty()) return;
    if (m_buckets.emplace(category, std::vector<MediaItem>{}).second) {
        m_categoryOrder.push_back(category);
    }
}

const std::vector<MediaItem>& MediaCatalog::itemsFor(const std::string& category) const {
    auto it = m_buckets.find(category);
    if (it == m_buckets.end()) {
        throw CategoryNotFound(category);
    }
    return it->second;
}

bool MediaCatalog::hasCategory(const std::string& category) const {
    return m_buckets.count(category) > 0;
}

bool MediaCatalog::isEmpty(const std::string& category) const {
    auto it = m_buckets.find(category);
    return it == m_buckets.end() || it->second.empty();
}

} // namespace playoutplanner::domain
