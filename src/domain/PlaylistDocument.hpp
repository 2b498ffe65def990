/**
 * @file PlaylistDocument.hpp
 * @brief Result of one generation run: ordered entries plus unfillable slots.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/MediaItem.hpp"
#include "domain/ScheduleTemplate.hpp"

namespace playoutplanner::domain {

/** @brief Reason text attached to every unfillable slot. */
inline const char* const kNoCandidateReason = "no candidate in category";

/**
 * @enum UnfillableCode
 * @brief Why a category had no candidate.
 */
enum class UnfillableCode {
    CategoryNotFound, ///< The catalog has no bucket for the category.
    CategoryEmpty     ///< The bucket exists but holds no item.
};

inline std::string UnfillableCodeToString(UnfillableCode code) {
    switch (code) {
        case UnfillableCode::CategoryNotFound: return "category_not_found";
        case UnfillableCode::CategoryEmpty: return "category_empty";
    }
    return "category_empty";
}

/**
 * @struct PlaylistEntry
 * @brief A filled slot.
 */
struct PlaylistEntry {
    std::size_t slotIndex = 0;
    MediaItem mediaItem;
    double actualDurationSeconds = 0.0;
    int startTime = 0;                  ///< Seconds since midnight, copied from the slot.
    std::optional<std::string> warning; ///< Soft duration-fit warning.
};

/**
 * @struct UnfillableSlot
 * @brief A slot for which no media item could be selected.
 */
struct UnfillableSlot {
    std::size_t slotIndex = 0;
    int startTime = 0;
    std::string category;
    std::string reason = kNoCandidateReason;
    UnfillableCode code = UnfillableCode::CategoryEmpty;
};

/**
 * @class PlaylistDocument
 * @brief Finalized playlist handed to the storage writer.
 *
 * Keeps a copy of the slots it was built against so it can check itself.
 */
class PlaylistDocument {
public:
    PlaylistDocument(std::string channel, std::string date, std::vector<ScheduleSlot> slots)
        : m_channel(std::move(channel)), m_date(std::move(date)), m_slots(std::move(slots)) {}

    void addEntry(PlaylistEntry entry) { m_entries.push_back(std::move(entry)); }
    void addUnfillable(UnfillableSlot slot) { m_unfillable.push_back(std::move(slot)); }

    const std::string& channel() const { return m_channel; }
    const std::string& date() const { return m_date; }
    const std::vector<ScheduleSlot>& slots() const { return m_slots; }
    const std::vector<PlaylistEntry>& entries() const { return m_entries; }
    const std::vector<UnfillableSlot>& unfillable() const { return m_unfillable; }

    bool isComplete() const { return m_unfillable.empty(); }
    std::size_t warningCount() const;

    /**
     * @brief Checks ordering, non-overlap, category match and slot coverage.
     * @return Human-readable violations; empty when the document is sound.
     */
    std::vector<std::string> validate() const;

private:
    std::string m_channel;
    std::string m_date;
    std::vector<ScheduleSlot> m_slots;
    std::vector<PlaylistEntry> m_entries;
    std::vector<UnfillableSlot> m_unfillable;
};

} // namespace playoutplanner::domain
