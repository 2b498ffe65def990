/**
 * @file ScheduleTemplate.hpp
 * @brief Daily programming template: ordered slots requiring a category each.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace playoutplanner::domain {

constexpr int kSecondsPerDay = 24 * 60 * 60;

/**
 * @struct ScheduleSlot
 * @brief A fixed time window requiring one item of a category.
 */
struct ScheduleSlot {
    int startTime = 0;                  ///< Seconds since midnight.
    std::string requiredCategory;
    double targetDurationSeconds = 0.0;

    double endTime() const { return startTime + targetDurationSeconds; }
};

/**
 * @struct SlotSpec
 * @brief Slot as written in configuration ("HH:MM:SS", category, seconds).
 */
struct SlotSpec {
    std::string start;
    std::string category;
    double targetDurationSeconds = 0.0;
};

/** @brief Parses "HH:MM" or "HH:MM:SS" into seconds since midnight. */
std::optional<int> ParseClock(const std::string& text);

/** @brief Formats seconds since midnight as "HH:MM:SS". */
std::string FormatClock(int secondsSinceMidnight);

/**
 * @class ScheduleTemplate
 * @brief Validated, read-only sequence of slots for one generation run.
 *
 * Slots are strictly ordered by start time and never overlap:
 * endTime(i) <= startTime(i + 1).
 */
class ScheduleTemplate {
public:
    /** @throws InvalidTemplate listing every problem found. */
    static ScheduleTemplate FromSlots(std::vector<ScheduleSlot> slots);

    /** @throws InvalidTemplate for unparsable clocks or invalid slot layout. */
    static ScheduleTemplate FromSpecs(const std::vector<SlotSpec>& specs);

    /** @brief Lists structural problems of a slot sequence; empty when valid. */
    static std::vector<std::string> Check(const std::vector<ScheduleSlot>& slots);

    const std::vector<ScheduleSlot>& slots() const { return m_slots; }
    const ScheduleSlot& at(std::size_t index) const { return m_slots.at(index); }
    std::size_t size() const { return m_slots.size(); }
    bool empty() const { return m_slots.empty(); }

private:
    explicit ScheduleTemplate(std::vector<ScheduleSlot> slots) : m_slots(std::move(slots)) {}

    std::vector<ScheduleSlot> m_slots;
};

} // namespace playoutplanner::domain
