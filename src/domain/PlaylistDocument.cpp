/**
 * @file PlaylistDocument.cpp
 * @brief Self-validation of assembled playlists.
 */

#include "domain/PlaylistDocument.hpp"
#include <algorithm>

namespace playoutplanner::domain {

std::size_t PlaylistDocument::warningCount() const {
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [](const PlaylistEntry& e) { return e.warning.has_value(); }));
}

std::vector<std::string> PlaylistDocument::validate() const {
    std::vector<std::string> violations;
    std::vector<int> coverage(m_slots.size(), 0);

    const PlaylistEntry* prev = nullptr;
    for (const auto& entry : m_entries) {
        const std::string label = "entry for slot " + std::to_string(entry.slotIndex);
        if (entry.slotIndex >= m_slots.size()) {
            violations.push_back(label + " references a slot outside the template");
            prev = &entry;
            continue;
        }
        ++coverage[entry.slotIndex];

        const auto& slot = m_slots[entry.slotIndex];
        if (entry.startTime != slot.startTime) {
            violations.push_back(label + " starts at " + FormatClock(entry.startTime) +
                                 " instead of " + FormatClock(slot.startTime));
        }
        if (entry.mediaItem.category != slot.requiredCategory) {
            violations.push_back(label + " holds category '" + entry.mediaItem.category +
                                 "' but the slot requires '" + slot.requiredCategory + "'");
        }

        if (prev && prev->slotIndex < m_slots.size()) {
            if (entry.slotIndex <= prev->slotIndex || entry.startTime <= prev->startTime) {
                violations.push_back(label + " is out of order after slot " + std::to_string(prev->slotIndex));
            } else if (m_slots[prev->slotIndex].endTime() > slot.startTime) {
                violations.push_back(label + " overlaps the window of slot " + std::to_string(prev->slotIndex));
            }
        }
        prev = &entry;
    }

    std::size_t lastUnfillable = 0;
    bool first = true;
    for (const auto& gap : m_unfillable) {
        if (gap.slotIndex >= m_slots.size()) {
            violations.push_back("unfillable record references slot " + std::to_string(gap.slotIndex) +
                                 " outside the template");
            continue;
        }
        ++coverage[gap.slotIndex];
        if (!first && gap.slotIndex <= lastUnfillable) {
            violations.push_back("unfillable record for slot " + std::to_string(gap.slotIndex) + " is out of order");
        }
        lastUnfillable = gap.slotIndex;
        first = false;
    }

    for (std::size_t i = 0; i < coverage.size(); ++i) {
        if (coverage[i] == 0) {
            violations.push_back("slot " + std::to_string(i) + " is neither filled nor reported unfillable");
        } else if (coverage[i] > 1) {
            violations.push_back("slot " + std::to_string(i) + " is accounted for " +
                                 std::to_string(coverage[i]) + " times");
        }
    }
    return violations;
}

} // namespace playoutplanner::domain
