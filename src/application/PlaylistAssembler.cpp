/**
 * @file PlaylistAssembler.cpp
 * @brief Implementation of PlaylistAssembler.
 */

#include "application/PlaylistAssembler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "domain/PlannerErrors.hpp"

namespace playoutplanner::application {

namespace {

std::string DurationWarning(double actual, double target, double tolerance) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << "duration " << actual << "s differs from target " << target << "s by more than "
       << std::setprecision(0) << tolerance * 100.0 << "%";
    return ss.str();
}

// Rotation timestamps of a run start at the date's midnight, or just after the
// newest use already known when that is later (regenerated or earlier dates).
std::int64_t RunBase(std::int64_t dayStart, const domain::MediaCatalog& catalog,
                     const domain::UsageHistory& history) {
    std::int64_t base = dayStart;
    if (auto newest = history.latest()) {
        base = std::max(base, *newest + 1);
    }
    for (const auto& category : catalog.categories()) {
        for (const auto& item : catalog.itemsFor(category)) {
            if (item.lastUsedTimestamp) base = std::max(base, *item.lastUsedTimestamp + 1);
        }
    }
    return base;
}

} // namespace

PlaylistAssembler::PlaylistAssembler(AssemblyOptions options)
    : m_options(std::move(options)) {}

domain::PlaylistDocument PlaylistAssembler::assemble(const domain::ScheduleTemplate& scheduleTemplate,
                                                     const domain::MediaCatalog& catalog,
                                                     domain::UsageHistory& history) const {
    domain::PlaylistDocument document(m_options.channel, m_options.date, scheduleTemplate.slots());
    SelectionPolicy policy(catalog, m_options.durationTolerance);
    const std::int64_t runBase = RunBase(m_options.dayStartEpoch, catalog, history);

    for (std::size_t i = 0; i < scheduleTemplate.size(); ++i) {
        const auto& slot = scheduleTemplate.at(i);
        const std::int64_t stamp = runBase + slot.startTime;

        auto selection = policy.select(slot.requiredCategory, slot.targetDurationSeconds, history, stamp);
        if (!selection.found()) {
            domain::UnfillableSlot gap;
            gap.slotIndex = i;
            gap.startTime = slot.startTime;
            gap.category = slot.requiredCategory;
            gap.code = selection.failure;
            document.addUnfillable(std::move(gap));
            continue;
        }

        domain::PlaylistEntry entry;
        entry.slotIndex = i;
        entry.startTime = slot.startTime;
        entry.actualDurationSeconds = selection.item->durationSeconds;
        if (!policy.withinTolerance(entry.actualDurationSeconds, slot.targetDurationSeconds)) {
            entry.warning = DurationWarning(entry.actualDurationSeconds, slot.targetDurationSeconds,
                                            policy.durationTolerance());
        }
        entry.mediaItem = std::move(*selection.item);
        document.addEntry(std::move(entry));
    }

    auto violations = document.validate();
    if (!violations.empty()) {
        throw domain::AssemblyInvariantViolation(std::move(violations));
    }
    return document;
}

} // namespace playoutplanner::application
