/**
 * @file SelectionPolicy.hpp
 * @brief Chooses the catalog item that fills a slot.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "domain/MediaCatalog.hpp"
#include "domain/PlaylistDocument.hpp"
#include "domain/UsageHistory.hpp"

namespace playoutplanner::application {

constexpr double kDefaultDurationTolerance = 0.05;

/**
 * @struct SelectionResult
 * @brief Chosen item, or the reason no item could be chosen.
 */
struct SelectionResult {
    std::optional<domain::MediaItem> item;
    domain::UnfillableCode failure = domain::UnfillableCode::CategoryEmpty;

    bool found() const { return item.has_value(); }
};

/**
 * @class SelectionPolicy
 * @brief Least-recently-used rotation with duration fitting.
 *
 * Ranking: never-used items first, then ascending last-used timestamp; among
 * equal recency, items not exceeding the target by more than the tolerance
 * win, closest duration first (closest absolute match when none fits); then
 * catalog insertion order.
 */
class SelectionPolicy {
public:
    explicit SelectionPolicy(const domain::MediaCatalog& catalog,
                             double durationTolerance = kDefaultDurationTolerance);

    /**
     * @brief Picks an item for a slot and records its use.
     * @param category Category required by the slot.
     * @param targetDuration Slot target in seconds.
     * @param history Rotation state, updated exactly once on success.
     * @param timestamp Generation timestamp stored as the item's last use.
     */
    SelectionResult select(const std::string& category,
                           double targetDuration,
                           domain::UsageHistory& history,
                           std::int64_t timestamp) const;

    /** @brief True when duration is within +/- tolerance of the target. */
    bool withinTolerance(double duration, double targetDuration) const;

    /** @brief True when duration does not exceed the target by more than the tolerance. */
    bool fitsTarget(double duration, double targetDuration) const;

    double durationTolerance() const { return m_tolerance; }

private:
    const domain::MediaCatalog& m_catalog;
    double m_tolerance;
};

} // namespace playoutplanner::application
