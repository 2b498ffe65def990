/**
 * @file SelectionPolicy.cpp
 * @brief Implementation of SelectionPolicy.
 */

#include "application/SelectionPolicy.hpp"
#include <cmath>
#include <limits>
#include <tuple>
#include <vector>
#include "domain/PlannerErrors.hpp"

namespace playoutplanner::application {

namespace {

struct RankKey {
    bool used = false;
    std::int64_t lastUsed = 0;
    bool exceedsTolerance = false;
    double distance = 0.0;
    std::size_t order = 0;

    bool operator<(const RankKey& other) const {
        return std::tie(used, lastUsed, exceedsTolerance, distance, order) <
               std::tie(other.used, other.lastUsed, other.exceedsTolerance, other.distance, other.order);
    }
};

} // namespace

SelectionPolicy::SelectionPolicy(const domain::MediaCatalog& catalog, double durationTolerance)
    : m_catalog(catalog), m_tolerance(durationTolerance < 0.0 ? 0.0 : durationTolerance) {}

bool SelectionPolicy::withinTolerance(double duration, double targetDuration) const {
    return std::fabs(duration - targetDuration) <= targetDuration * m_tolerance;
}

bool SelectionPolicy::fitsTarget(double duration, double targetDuration) const {
    return duration <= targetDuration * (1.0 + m_tolerance);
}

SelectionResult SelectionPolicy::select(const std::string& category,
                                        double targetDuration,
                                        domain::UsageHistory& history,
                                        std::int64_t timestamp) const {
    SelectionResult result;

    const std::vector<domain::MediaItem>* candidates = nullptr;
    try {
        candidates = &m_catalog.itemsFor(category);
    } catch (const domain::CategoryNotFound&) {
        result.failure = domain::UnfillableCode::CategoryNotFound;
        return result;
    }
    if (candidates->empty()) {
        result.failure = domain::UnfillableCode::CategoryEmpty;
        return result;
    }

    std::size_t best = 0;
    RankKey bestKey;
    for (std::size_t i = 0; i < candidates->size(); ++i) {
        const auto& item = (*candidates)[i];
        auto lastUsed = history.lastUsed(item.id);
        if (!lastUsed) lastUsed = item.lastUsedTimestamp;

        RankKey key;
        key.used = lastUsed.has_value();
        key.lastUsed = lastUsed.value_or(std::numeric_limits<std::int64_t>::min());
        key.exceedsTolerance = !fitsTarget(item.durationSeconds, targetDuration);
        key.distance = std::fabs(item.durationSeconds - targetDuration);
        key.order = i;

        if (i == 0 || key < bestKey) {
            best = i;
            bestKey = key;
        }
    }

    result.item = (*candidates)[best];
    history.recordUse(result.item->id, timestamp);
    return result;
}

} // namespace playoutplanner::application
