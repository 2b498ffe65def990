/**
 * @file ScheduleTemplate.cpp
 * @brief Implementation of template parsing and validation.
 */

#include "domain/ScheduleTemplate.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include "domain/PlannerErrors.hpp"

namespace playoutplanner::domain {

namespace {

bool ParseField(const std::string& text, int maxValue, int& out) {
    if (text.empty() || text.size() > 2) return false;
    int value = 0;
    for (unsigned char c : text) {
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    if (value > maxValue) return false;
    out = value;
    return true;
}

std::string SlotLabel(std::size_t index, const ScheduleSlot& slot) {
    std::ostringstream ss;
    ss << "slot " << index << " (" << FormatClock(slot.startTime) << ", '" << slot.requiredCategory << "')";
    return ss.str();
}

} // namespace

std::optional<int> ParseClock(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == ':') return std::nullopt;
    if (parts.size() != 2 && parts.size() != 3) return std::nullopt;

    int hours = 0, minutes = 0, seconds = 0;
    if (!ParseField(parts[0], 23, hours)) return std::nullopt;
    if (!ParseField(parts[1], 59, minutes)) return std::nullopt;
    if (parts.size() == 3 && !ParseField(parts[2], 59, seconds)) return std::nullopt;
    return hours * 3600 + minutes * 60 + seconds;
}

std::string FormatClock(int secondsSinceMidnight) {
    const int rest = ((secondsSinceMidnight % kSecondsPerDay) + kSecondsPerDay) % kSecondsPerDay;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", rest / 3600, (rest % 3600) / 60, rest % 60);
    return buf;
}

std::vector<std::string> ScheduleTemplate::Check(const std::vector<ScheduleSlot>& slots) {
    std::vector<std::string> problems;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        const auto& slot = slots[i];
        if (slot.requiredCategory.empty()) {
            problems.push_back(SlotLabel(i, slot) + " has no category");
        }
        if (slot.startTime < 0 || slot.startTime >= kSecondsPerDay) {
            problems.push_back(SlotLabel(i, slot) + " starts outside the day");
        }
        if (!std::isfinite(slot.targetDurationSeconds) || slot.targetDurationSeconds <= 0.0) {
            problems.push_back(SlotLabel(i, slot) + " has a non-positive target duration");
        }
        if (i == 0) continue;

        const auto& prev = slots[i - 1];
        if (slot.startTime <= prev.startTime) {
            problems.push_back(SlotLabel(i, slot) + " does not start after " + SlotLabel(i - 1, prev));
        } else if (prev.endTime() > slot.startTime) {
            problems.push_back(SlotLabel(i - 1, prev) + " overlaps " + SlotLabel(i, slot));
        }
    }
    return problems;
}

ScheduleTemplate ScheduleTemplate::FromSlots(std::vector<ScheduleSlot> slots) {
    auto problems = Check(slots);
    if (!problems.empty()) {
        throw InvalidTemplate(std::move(problems));
    }
    return ScheduleTemplate(std::move(slots));
}

ScheduleTemplate ScheduleTemplate::FromSpecs(const std::vector<SlotSpec>& specs) {
    std::vector<ScheduleSlot> slots;
    std::vector<std::string> problems;
    slots.reserve(specs.size());

    for (std::size_t i = 0; i < specs.size(); ++i) {
        auto start = ParseClock(specs[i].start);
        if (!start) {
            problems.push_back("slot " + std::to_string(i) + " has an invalid start time '" + specs[i].start + "'");
            continue;
        }
        slots.push_back(ScheduleSlot{*start, specs[i].category, specs[i].targetDurationSeconds});
    }
    if (!problems.empty()) {
        throw InvalidTemplate(std::move(problems));
    }
    return FromSlots(std::move(slots));
}

} // namespace playoutplanner::domain
