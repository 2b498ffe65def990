/**
 * @file MediaCatalog.hpp
 * @brief In-memory inventory of media items grouped by category.
 */

#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "domain/MediaItem.hpp"

namespace playoutplanner::domain {

/**
 * @class MediaCatalog
 * @brief Category buckets of MediaItem, each kept in scan order.
 *
 * Every item lives in exactly one bucket, ids are unique and durations are
 * strictly positive. The engine only reads a catalog once it is built.
 */
class MediaCatalog {
public:
    MediaCatalog() = default;

    /**
     * @brief Builds a catalog from scanner records.
     * @param records Files in scan order.
     * @param declaredCategories Categories that exist even when they hold no file.
     * @throws InvalidCatalog if a record breaks the catalog invariants.
     */
    static MediaCatalog FromScan(const std::vector<ScannedMedia>& records,
                                 const std::vector<std::string>& declaredCategories = {});

    /** @brief Appends an item to its category bucket. @throws InvalidCatalog */
    void add(MediaItem item);

    /** @brief Creates an empty bucket if the category is not known yet. */
    void declareCategory(const std::string& category);

    /**
     * @brief Items of a category in insertion order.
     * @throws CategoryNotFound if the category has no bucket.
     */
    const std::vector<MediaItem>& itemsFor(const std::string& category) const;

    bool hasCategory(const std::string& category) const;

    /** @brief True when the bucket is missing or holds no item. */
    bool isEmpty(const std::string& category) const;

    /** @brief Category names in the order they were first seen. */
    const std::vector<std::string>& categories() const { return m_categoryOrder; }

    std::size_t size() const { return m_ids.size(); }

private:
    std::map<std::string, std::vector<MediaItem>> m_buckets;
    std::vector<std::string> m_categoryOrder;
    std::set<std::string> m_ids;
};

} // namespace playoutplanner::domain
